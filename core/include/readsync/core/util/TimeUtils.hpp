#pragma once

#include <chrono>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>

namespace readsync::util {

// Wall-clock milliseconds since the Unix epoch.
inline int64_t now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

// Internal: fill `out` with UTC broken-down time in a thread-safe way.
inline bool tm_from_utc(std::time_t tt, std::tm& out) noexcept {
    return ::gmtime_r(&tt, &out) != nullptr;
}

// ISO-8601 UTC rendering of an epoch-milliseconds timestamp, for logs and
// the CLI.
inline std::string iso8601_utc(int64_t ms) {
    const std::time_t tt = static_cast<std::time_t>(ms / 1000);
    std::tm tm{};
    if (!tm_from_utc(tt, tm)) {
        throw std::runtime_error("UTC conversion failed");
    }
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

} // namespace readsync::util
