#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace readsync {

// Remote side: byte-range reads of documents plus one small JSON record per
// document.
class IRemoteObjectStore {
public:
    virtual ~IRemoteObjectStore() = default;

    // Bytes [startInclusive, endInclusive] of `objectId`.
    // Throws RemoteFetchError on failure.
    virtual std::string fetchRange(const std::string& objectId, int64_t startInclusive, int64_t endInclusive) = 0;

    // The record stored for `objectId`, or nullopt if there is none.
    // Throws RemoteFetchError only on transport failure.
    virtual std::optional<nlohmann::json> readRecord(const std::string& objectId) = 0;

    // Upsert. Throws RemoteWriteError on failure.
    virtual void writeRecord(const std::string& objectId, const nlohmann::json& record) = 0;
};

} // namespace readsync
