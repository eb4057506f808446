#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "readsync/core/types/CacheConfig.hpp"
#include "readsync/core/types/ContentChunk.hpp"
#include "readsync/core/types/IChunkStore.hpp"
#include "readsync/core/types/IRemoteObjectStore.hpp"

namespace readsync {

/**
 * @brief Bounded local cache of fixed-size text chunks of remote documents
 *
 * Turns arbitrary-offset reads of a range-fetchable remote object into chunk
 * lookups against an IChunkStore. Missing chunks are fetched from the
 * IRemoteObjectStore, a window of neighbouring chunks is prefetched, and
 * chunks of other documents are evicted oldest-inserted first when the store
 * grows past CacheConfig::maxCacheBytes.
 *
 * Eviction order is by insertion time (ContentChunk::cachedAt), not by last
 * access; a cache hit never refreshes a chunk. The document named by the call
 * that triggers eviction is never evicted, so the cache may stay over budget by
 * up to that document's cached footprint.
 *
 * Concurrent requests for the same (documentId, chunkIndex) share one remote
 * fetch.
 */
class ChunkCache
{
public:
    using Clock = std::function<int64_t()>;

    struct RangeResult {
        std::string content;
        int64_t actualOffset = 0;
    };

    struct ContextResult {
        std::string content;
        int64_t offset = 0;     // absolute offset of content[0]
        int64_t totalSize = 0;
    };

    struct Stats {
        size_t chunkCount{0};
        size_t totalBytes{0};
        std::set<std::string> documentIds;
    };

    struct Counters {
        uint64_t hits{0};
        uint64_t misses{0};
        uint64_t evictions{0};
        uint64_t bytesFetched{0};
    };

    /**
     * @param store Chunk storage; must outlive the cache
     * @param remote Source of document bytes; must outlive the cache
     * @param config Initial configuration, validated
     * @param clock Wall-clock milliseconds used to stamp new chunks
     */
    ChunkCache(IChunkStore& store,
               IRemoteObjectStore& remote,
               CacheConfig config = {},
               Clock clock = {});
    ~ChunkCache();

    ChunkCache(const ChunkCache&) = delete;
    ChunkCache& operator=(const ChunkCache&) = delete;

    /**
     * @brief Open the chunk store. Must be called before any read.
     */
    void initialize();

    bool initialized() const { return _store.isOpen(); }

    [[nodiscard]] CacheConfig config() const;

    /**
     * @brief Merge a partial JSON override onto the current configuration
     *
     * Applies from the next cache operation on. Chunks cached under a
     * different chunkSize are refetched when next touched. Throws ConfigError
     * and keeps the old configuration if the result is invalid.
     */
    void updateConfig(const nlohmann::json& overrides);

    /**
     * @brief Content of the chunk holding `position`, after making sure the
     * preload window around it is cached
     *
     * Chunks [target - preloadWindow, target + preloadWindow] (clamped to the
     * document) are resolved concurrently. If any of them cannot be fetched
     * the call throws RemoteFetchError and returns nothing. Runs eviction
     * before returning.
     *
     * @throws CacheUninitializedError before initialize()
     * @throws RemoteFetchError if a required chunk could not be fetched
     */
    std::string loadAround(const std::string& documentId, int64_t documentSize, int64_t position);

    /**
     * @brief Exactly bytes [offset, offset + length) of the document, clipped
     * to its end
     *
     * `length` defaults to the configured chunk size. actualOffset is the
     * requested offset, unmodified.
     */
    RangeResult readRange(const std::string& documentId,
                          int64_t documentSize,
                          int64_t offset,
                          std::optional<int64_t> length = std::nullopt);

    /**
     * @brief The view [position, position + viewSize) plus viewSize bytes of
     * context on each side, clamped to the document
     *
     * `viewSize` defaults to the configured chunk size.
     */
    ContextResult readWithContext(const std::string& documentId,
                                  int64_t documentSize,
                                  int64_t position,
                                  std::optional<int64_t> viewSize = std::nullopt);

    // Best-effort removal; storage errors are logged, never thrown.
    void evictBook(const std::string& documentId);
    void evictAll();

    [[nodiscard]] Stats stats() const;

    [[nodiscard]] Counters counters() const;
    void resetCounters();

private:
    IChunkStore& _store;
    IRemoteObjectStore& _remote;
    Clock _clock;

    mutable std::mutex _configMutex;
    CacheConfig _config;

    // In-flight remote fetches, one per chunk key
    std::mutex _inflightMutex;
    std::unordered_map<ChunkKey, std::shared_future<ContentChunk>, ChunkKeyHasher> _inflight;

    // Serializes eviction passes
    std::mutex _evictionMutex;

    std::atomic<int64_t> _lastCachedAt{0};

    std::atomic<uint64_t> _hits{0};
    std::atomic<uint64_t> _misses{0};
    std::atomic<uint64_t> _evictions{0};
    std::atomic<uint64_t> _bytesFetched{0};

    void requireInitialized(const char* operation) const;

    // Resolve chunks [first, last] concurrently; results in index order.
    std::vector<ContentChunk> resolveChunks(const std::string& documentId,
                                            int64_t documentSize,
                                            int64_t first,
                                            int64_t last,
                                            const CacheConfig& cfg);

    // Cache lookup, falling back to a single-flight remote fetch
    ContentChunk getOrFetch(const std::string& documentId,
                            int64_t documentSize,
                            int64_t chunkIndex,
                            const CacheConfig& cfg);

    ContentChunk fetchChunk(const std::string& documentId,
                            int64_t chunkIndex,
                            int64_t startOffset,
                            int64_t endOffset,
                            bool replaceStale);

    // Evict other documents' chunks, oldest first, until under budget
    void evictIfNeeded(const std::string& activeDocumentId, const CacheConfig& cfg);

    int64_t nextCachedAt();
};

} // namespace readsync
