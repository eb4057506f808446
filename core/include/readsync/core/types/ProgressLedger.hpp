#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>

#include <nlohmann/json_fwd.hpp>

#include "readsync/core/types/IKeyValueStore.hpp"
#include "readsync/core/types/ReadingProgress.hpp"

namespace readsync {

// Durable documentId -> ReadingProgress map kept as one JSON object under a
// single key of an IKeyValueStore.
class ProgressLedger
{
public:
    static constexpr const char* kDefaultStorageKey = "readsync_progress";

    explicit ProgressLedger(IKeyValueStore& store, std::string storageKey = kDefaultStorageKey);

    [[nodiscard]] std::optional<ReadingProgress> get(const std::string& documentId) const;
    void put(const ReadingProgress& progress);
    // put() unless the stored record for the same document has a
    // lastUpdated >= progress.lastUpdated. Returns whether it wrote.
    bool putIfNewer(const ReadingProgress& progress);
    void remove(const std::string& documentId);
    void clear();

    [[nodiscard]] std::map<std::string, ReadingProgress> all() const;

private:
    IKeyValueStore& _store;
    std::string _storageKey;
    mutable std::mutex _mutex;

    // Stored object, or {} if missing or malformed. Caller holds _mutex.
    nlohmann::json loadAll() const;
};

} // namespace readsync
