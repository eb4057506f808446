#include "readsync/core/types/MemoryChunkStore.hpp"

#include "readsync/core/util/Errors.hpp"

#include <atomic>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>

namespace readsync {

struct MemoryChunkStore::Impl {
    std::atomic<bool> open{false};
    mutable std::shared_mutex mapMutex;
    std::unordered_map<ChunkKey, ContentChunk, ChunkKeyHasher> map;
    size_t storedBytes = 0;

    void requireOpen() const
    {
        if (!open.load(std::memory_order_acquire)) [[unlikely]]
            throw CacheUninitializedError("chunk store has not been opened");
    }
};

MemoryChunkStore::MemoryChunkStore()
    : pImpl_(std::make_unique<Impl>()) {}

MemoryChunkStore::~MemoryChunkStore() = default;

void MemoryChunkStore::open()
{
    pImpl_->open.store(true, std::memory_order_release);
}

bool MemoryChunkStore::isOpen() const
{
    return pImpl_->open.load(std::memory_order_acquire);
}

std::optional<ContentChunk> MemoryChunkStore::get(const std::string& documentId, int64_t chunkIndex) const
{
    pImpl_->requireOpen();
    std::shared_lock<std::shared_mutex> rlock(pImpl_->mapMutex);
    auto it = pImpl_->map.find(ChunkKey{documentId, chunkIndex});
    if (it == pImpl_->map.end())
        return std::nullopt;
    return it->second;
}

void MemoryChunkStore::put(const ContentChunk& chunk)
{
    pImpl_->requireOpen();
    std::unique_lock<std::shared_mutex> wlock(pImpl_->mapMutex);
    auto [it, inserted] = pImpl_->map.try_emplace(chunk.key(), chunk);
    if (!inserted) {
        pImpl_->storedBytes -= it->second.bytes();
        it->second = chunk;
    }
    pImpl_->storedBytes += chunk.bytes();
}

void MemoryChunkStore::remove(const std::string& documentId, int64_t chunkIndex)
{
    pImpl_->requireOpen();
    std::unique_lock<std::shared_mutex> wlock(pImpl_->mapMutex);
    auto it = pImpl_->map.find(ChunkKey{documentId, chunkIndex});
    if (it == pImpl_->map.end())
        return;
    pImpl_->storedBytes -= it->second.bytes();
    pImpl_->map.erase(it);
}

std::vector<ContentChunk> MemoryChunkStore::listAll() const
{
    pImpl_->requireOpen();
    std::shared_lock<std::shared_mutex> rlock(pImpl_->mapMutex);
    std::vector<ContentChunk> out;
    out.reserve(pImpl_->map.size());
    for (const auto& [key, chunk] : pImpl_->map) {
        out.push_back(chunk);
    }
    return out;
}

void MemoryChunkStore::clear()
{
    pImpl_->requireOpen();
    std::unique_lock<std::shared_mutex> wlock(pImpl_->mapMutex);
    pImpl_->map.clear();
    pImpl_->storedBytes = 0;
}

size_t MemoryChunkStore::storedBytes() const
{
    std::shared_lock<std::shared_mutex> rlock(pImpl_->mapMutex);
    return pImpl_->storedBytes;
}

} // namespace readsync
