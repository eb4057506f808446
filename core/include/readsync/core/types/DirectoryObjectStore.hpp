#pragma once

#include <cstdint>
#include <filesystem>
#include <mutex>

#include "readsync/core/types/IRemoteObjectStore.hpp"

namespace readsync {

/**
 * @brief IRemoteObjectStore over a local directory
 *
 * Document `id` is the file `<root>/<id>`; its progress record is
 * `<root>/<id>_progress.json`. Used by the CLI (e.g. over a synced folder)
 * and by tests.
 */
class DirectoryObjectStore final : public IRemoteObjectStore
{
public:
    explicit DirectoryObjectStore(std::filesystem::path root);

    std::string fetchRange(const std::string& objectId, int64_t startInclusive, int64_t endInclusive) override;
    std::optional<nlohmann::json> readRecord(const std::string& objectId) override;
    void writeRecord(const std::string& objectId, const nlohmann::json& record) override;

    // Size in bytes of document `objectId`. Throws RemoteFetchError if absent.
    int64_t documentSize(const std::string& objectId) const;

    [[nodiscard]] std::filesystem::path root() const { return _root; }

private:
    std::filesystem::path _root;
    std::mutex _recordMutex;

    std::filesystem::path documentPath(const std::string& objectId) const;
    std::filesystem::path recordPath(const std::string& objectId) const;
};

} // namespace readsync
