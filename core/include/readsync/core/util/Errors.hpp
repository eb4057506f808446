#pragma once

#include <stdexcept>
#include <string>

namespace readsync {

// The chunk store has not been opened; call ChunkCache::initialize() first.
class CacheUninitializedError : public std::runtime_error {
public:
    explicit CacheUninitializedError(const std::string& what)
        : std::runtime_error(what) {}
};

// Reading a document range or a progress record from the remote failed.
class RemoteFetchError : public std::runtime_error {
public:
    explicit RemoteFetchError(const std::string& what)
        : std::runtime_error(what) {}
};

// Writing a progress record to the remote failed.
class RemoteWriteError : public std::runtime_error {
public:
    explicit RemoteWriteError(const std::string& what)
        : std::runtime_error(what) {}
};

// Rejected configuration value.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what)
        : std::runtime_error(what) {}
};

} // namespace readsync
