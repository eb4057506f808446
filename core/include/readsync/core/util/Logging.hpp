#pragma once

#include <filesystem>
#include <memory>
#include <sstream>
#include <string>
#include <utility>

namespace readsync {

enum class LogLevel { Debug, Info, Warn, Error, Off };

class LoggerImpl;

// Small logger with "{}" placeholder formatting, stderr sink and optional
// file sinks.
class MinimalLogger {
public:
    MinimalLogger();
    ~MinimalLogger();

    MinimalLogger(const MinimalLogger&) = delete;
    MinimalLogger& operator=(const MinimalLogger&) = delete;

    template<typename... Args>
    void debug(const std::string& fmt, Args&&... args) {
        if (enabled(LogLevel::Debug))
            write_log(LogLevel::Debug, format_message(fmt, std::forward<Args>(args)...));
    }

    template<typename... Args>
    void info(const std::string& fmt, Args&&... args) {
        if (enabled(LogLevel::Info))
            write_log(LogLevel::Info, format_message(fmt, std::forward<Args>(args)...));
    }

    template<typename... Args>
    void warn(const std::string& fmt, Args&&... args) {
        if (enabled(LogLevel::Warn))
            write_log(LogLevel::Warn, format_message(fmt, std::forward<Args>(args)...));
    }

    template<typename... Args>
    void error(const std::string& fmt, Args&&... args) {
        if (enabled(LogLevel::Error))
            write_log(LogLevel::Error, format_message(fmt, std::forward<Args>(args)...));
    }

    void set_level(LogLevel level);
    [[nodiscard]] LogLevel level() const;
    void add_file(const std::filesystem::path& path);

private:
    bool enabled(LogLevel lvl) const { return lvl >= level(); }
    void write_log(LogLevel level, const std::string& msg);
    static const char* level_string(LogLevel level);

    template<typename T>
    static std::string to_string_helper(const T& value) {
        std::ostringstream oss;
        oss << value;
        return oss.str();
    }

    static std::string to_string_helper(const std::string& value) { return value; }
    static std::string to_string_helper(const char* value) { return std::string(value); }

    static std::string format_message(const std::string& fmt) { return fmt; }

    template<typename T, typename... Args>
    static std::string format_message(const std::string& fmt, T&& first, Args&&... rest) {
        size_t pos = fmt.find("{}");
        if (pos == std::string::npos) {
            return fmt;
        }
        std::string result = fmt.substr(0, pos) + to_string_helper(first);
        result += format_message(fmt.substr(pos + 2), std::forward<Args>(rest)...);
        return result;
    }

    std::unique_ptr<LoggerImpl> impl_;
};

void AddLogFile(const std::filesystem::path& path);
void SetLogLevel(const std::string& s);
auto Logger() -> std::shared_ptr<MinimalLogger>;

} // namespace readsync
