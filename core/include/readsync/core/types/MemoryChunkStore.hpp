#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>

#include "readsync/core/types/IChunkStore.hpp"

namespace readsync {

/**
 * @brief In-process chunk store keyed by (documentId, chunkIndex).
 *
 * Several ChunkCache instances may share one store. Every accessor except
 * open()/isOpen() throws CacheUninitializedError until open() is called.
 */
class MemoryChunkStore final : public IChunkStore {
public:
    MemoryChunkStore();
    ~MemoryChunkStore() override;

    MemoryChunkStore(const MemoryChunkStore&) = delete;
    MemoryChunkStore& operator=(const MemoryChunkStore&) = delete;

    void open() override;
    bool isOpen() const override;

    std::optional<ContentChunk> get(const std::string& documentId, int64_t chunkIndex) const override;
    void put(const ContentChunk& chunk) override;
    void remove(const std::string& documentId, int64_t chunkIndex) override;
    std::vector<ContentChunk> listAll() const override;
    void clear() override;

    // Sum of content bytes currently held.
    [[nodiscard]] size_t storedBytes() const;

private:
    struct Impl;
    std::unique_ptr<Impl> pImpl_;
};

} // namespace readsync
