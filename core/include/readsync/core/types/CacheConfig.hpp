#pragma once

#include <nlohmann/json_fwd.hpp>

#include <cstdint>

namespace readsync {

struct CacheConfig {
    int64_t chunkSize = 512 * 1024;
    int64_t preloadWindow = 2;
    int64_t maxCacheBytes = 10 * 1024 * 1024;

    /**
     * @brief Returns a copy with the keys present in `overrides` replaced.
     *
     * Recognized keys: "chunkSize", "preloadWindow", "maxCacheBytes". Unknown
     * keys are ignored. Throws ConfigError if the result is invalid or
     * `overrides` is not an object.
     */
    [[nodiscard]] CacheConfig merged(const nlohmann::json& overrides) const;

    // Throws ConfigError unless chunkSize > 0, preloadWindow >= 0 and
    // maxCacheBytes > 0.
    void validate() const;
};

nlohmann::json toJson(const CacheConfig& config);

/**
 * @brief Settings of the progress synchronizer's periodic driver.
 */
struct SyncConfig {
    int64_t flushIntervalMs = 30000;

    [[nodiscard]] SyncConfig merged(const nlohmann::json& overrides) const;
    void validate() const;
};

} // namespace readsync
