#include "readsync/core/types/CacheConfig.hpp"

#include "readsync/core/util/Errors.hpp"
#include "readsync/core/util/LoadJson.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace readsync {

CacheConfig CacheConfig::merged(const nlohmann::json& overrides) const
{
    if (!overrides.is_object()) {
        throw ConfigError("cache config overrides must be a JSON object");
    }
    CacheConfig out = *this;
    out.chunkSize = json::integer_or(&overrides, "chunkSize", chunkSize);
    out.preloadWindow = json::integer_or(&overrides, "preloadWindow", preloadWindow);
    out.maxCacheBytes = json::integer_or(&overrides, "maxCacheBytes", maxCacheBytes);
    out.validate();
    return out;
}

void CacheConfig::validate() const
{
    if (chunkSize <= 0) {
        throw ConfigError("chunkSize must be positive, got " + std::to_string(chunkSize));
    }
    if (preloadWindow < 0) {
        throw ConfigError("preloadWindow must not be negative, got " + std::to_string(preloadWindow));
    }
    if (maxCacheBytes <= 0) {
        throw ConfigError("maxCacheBytes must be positive, got " + std::to_string(maxCacheBytes));
    }
}

nlohmann::json toJson(const CacheConfig& config)
{
    return {
        {"chunkSize", config.chunkSize},
        {"preloadWindow", config.preloadWindow},
        {"maxCacheBytes", config.maxCacheBytes},
    };
}

SyncConfig SyncConfig::merged(const nlohmann::json& overrides) const
{
    if (!overrides.is_object()) {
        throw ConfigError("sync config overrides must be a JSON object");
    }
    SyncConfig out = *this;
    out.flushIntervalMs = json::integer_or(&overrides, "flushIntervalMs", flushIntervalMs);
    out.validate();
    return out;
}

void SyncConfig::validate() const
{
    if (flushIntervalMs <= 0) {
        throw ConfigError("flushIntervalMs must be positive, got " + std::to_string(flushIntervalMs));
    }
}

} // namespace readsync
