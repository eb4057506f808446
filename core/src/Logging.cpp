#include "readsync/core/util/Logging.hpp"

#include <atomic>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <vector>

namespace readsync {

// Internal implementation class
class LoggerImpl {
public:
    std::mutex mutex;
    std::atomic<LogLevel> level{LogLevel::Info};
    std::vector<std::shared_ptr<std::ofstream>> file_sinks;

    std::string get_timestamp() {
        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm{};
        localtime_r(&time_t, &tm);

        std::ostringstream oss;
        oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count();
        return oss.str();
    }
};

MinimalLogger::MinimalLogger()
    : impl_(std::make_unique<LoggerImpl>())
{
}

MinimalLogger::~MinimalLogger() = default;

const char* MinimalLogger::level_string(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO ";
        case LogLevel::Warn:  return "WARN ";
        case LogLevel::Error: return "ERROR";
        default:              return "?????";
    }
}

void MinimalLogger::write_log(LogLevel level, const std::string& msg) {
    std::lock_guard<std::mutex> lock(impl_->mutex);

    std::ostringstream oss;
    oss << "[" << impl_->get_timestamp() << "] [" << level_string(level) << "] " << msg;
    std::string formatted = oss.str();

    // stdout is reserved for document text
    std::cerr << formatted << '\n';

    for (auto& file : impl_->file_sinks) {
        if (file && file->is_open()) {
            (*file) << formatted << std::endl;
        }
    }
}

void MinimalLogger::set_level(LogLevel level) {
    impl_->level.store(level, std::memory_order_relaxed);
}

LogLevel MinimalLogger::level() const {
    return impl_->level.load(std::memory_order_relaxed);
}

void MinimalLogger::add_file(const std::filesystem::path& path) {
    std::lock_guard<std::mutex> lock(impl_->mutex);

    auto file = std::make_shared<std::ofstream>(path, std::ios::app);
    if (file->is_open()) {
        impl_->file_sinks.push_back(file);
    }
}

// Global functions
auto Logger() -> std::shared_ptr<MinimalLogger> {
    static auto logger = std::make_shared<MinimalLogger>();
    return logger;
}

void AddLogFile(const std::filesystem::path& path) {
    Logger()->add_file(path);
}

void SetLogLevel(const std::string& s) {
    LogLevel level = LogLevel::Info;

    if (s == "debug" || s == "DEBUG") {
        level = LogLevel::Debug;
    } else if (s == "info" || s == "INFO") {
        level = LogLevel::Info;
    } else if (s == "warn" || s == "WARN" || s == "warning" || s == "WARNING") {
        level = LogLevel::Warn;
    } else if (s == "error" || s == "ERROR") {
        level = LogLevel::Error;
    } else if (s == "off" || s == "OFF") {
        level = LogLevel::Off;
    }

    Logger()->set_level(level);
}

} // namespace readsync
