#include "readsync/core/util/ChunkCache.hpp"

#include "readsync/core/util/Errors.hpp"
#include "readsync/core/util/Logging.hpp"
#include "readsync/core/util/TimeUtils.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <exception>
#include <stdexcept>

namespace readsync {

namespace {

int64_t chunkStart(int64_t chunkIndex, const CacheConfig& cfg)
{
    return chunkIndex * cfg.chunkSize;
}

int64_t chunkEnd(int64_t chunkIndex, int64_t documentSize, const CacheConfig& cfg)
{
    return std::min(chunkStart(chunkIndex, cfg) + cfg.chunkSize - 1, documentSize - 1);
}

} // namespace

ChunkCache::ChunkCache(IChunkStore& store, IRemoteObjectStore& remote, CacheConfig config, Clock clock)
    : _store(store)
    , _remote(remote)
    , _clock(clock ? std::move(clock) : Clock(&util::now_ms))
    , _config(config)
{
    _config.validate();
}

ChunkCache::~ChunkCache() = default;

void ChunkCache::initialize()
{
    if (_store.isOpen()) return;
    _store.open();
    Logger()->debug("Chunk cache opened (chunkSize={}, preloadWindow={}, maxCacheBytes={})",
                    _config.chunkSize, _config.preloadWindow, _config.maxCacheBytes);
}

CacheConfig ChunkCache::config() const
{
    std::lock_guard<std::mutex> lock(_configMutex);
    return _config;
}

void ChunkCache::updateConfig(const nlohmann::json& overrides)
{
    std::lock_guard<std::mutex> lock(_configMutex);
    _config = _config.merged(overrides);
    Logger()->info("Cache config updated: {}", toJson(_config).dump());
}

void ChunkCache::requireInitialized(const char* operation) const
{
    if (!_store.isOpen()) [[unlikely]]
        throw CacheUninitializedError(std::string(operation) + " called before the chunk cache was initialized");
}

std::string ChunkCache::loadAround(const std::string& documentId, int64_t documentSize, int64_t position)
{
    requireInitialized("loadAround");
    const CacheConfig cfg = config();

    if (documentSize <= 0) return {};
    position = std::clamp<int64_t>(position, 0, documentSize - 1);

    const int64_t target = position / cfg.chunkSize;
    const int64_t lastInDocument = (documentSize + cfg.chunkSize - 1) / cfg.chunkSize - 1;
    const int64_t first = std::max<int64_t>(0, target - cfg.preloadWindow);
    const int64_t last = std::min(lastInDocument, target + cfg.preloadWindow);

    auto chunks = resolveChunks(documentId, documentSize, first, last, cfg);

    evictIfNeeded(documentId, cfg);

    return std::move(chunks[static_cast<size_t>(target - first)].content);
}

ChunkCache::RangeResult ChunkCache::readRange(const std::string& documentId,
                                              int64_t documentSize,
                                              int64_t offset,
                                              std::optional<int64_t> length)
{
    requireInitialized("readRange");
    const CacheConfig cfg = config();

    const int64_t len = length.value_or(cfg.chunkSize);
    if (offset < 0 || len < 0) {
        throw std::invalid_argument("readRange: negative offset or length for " + documentId);
    }

    RangeResult result;
    result.actualOffset = offset;

    const int64_t end = std::min(offset + len, documentSize);
    if (offset >= documentSize || end <= offset) return result;

    const int64_t first = offset / cfg.chunkSize;
    const int64_t last = (end - 1) / cfg.chunkSize;

    auto chunks = resolveChunks(documentId, documentSize, first, last, cfg);

    std::string combined;
    for (const auto& c : chunks) {
        combined += c.content;
    }

    const auto inFirst = static_cast<size_t>(offset - chunks.front().startOffset);
    if (inFirst < combined.size()) {
        result.content = combined.substr(inFirst, static_cast<size_t>(end - offset));
    }

    evictIfNeeded(documentId, cfg);

    return result;
}

ChunkCache::ContextResult ChunkCache::readWithContext(const std::string& documentId,
                                                      int64_t documentSize,
                                                      int64_t position,
                                                      std::optional<int64_t> viewSize)
{
    requireInitialized("readWithContext");
    const int64_t view = std::max<int64_t>(0, viewSize.value_or(config().chunkSize));

    // Same amount of context before and after the view
    const int64_t start = std::max<int64_t>(0, position - view);
    const int64_t end = std::max(start, std::min(documentSize, position + view + view));

    auto range = readRange(documentId, documentSize, start, end - start);

    return {std::move(range.content), start, documentSize};
}

std::vector<ContentChunk> ChunkCache::resolveChunks(const std::string& documentId,
                                                    int64_t documentSize,
                                                    int64_t first,
                                                    int64_t last,
                                                    const CacheConfig& cfg)
{
    const int64_t count = last - first + 1;
    std::vector<ContentChunk> chunks(static_cast<size_t>(count));
    std::vector<std::exception_ptr> errors(static_cast<size_t>(count));

    #pragma omp parallel for schedule(dynamic, 1)
    for (int64_t i = 0; i < count; i++) {
        try {
            chunks[i] = getOrFetch(documentId, documentSize, first + i, cfg);
        } catch (...) {
            errors[i] = std::current_exception();
        }
    }

    // All or nothing: the first failure in index order wins
    for (auto& e : errors) {
        if (e) std::rethrow_exception(e);
    }
    return chunks;
}

ContentChunk ChunkCache::getOrFetch(const std::string& documentId,
                                    int64_t documentSize,
                                    int64_t chunkIndex,
                                    const CacheConfig& cfg)
{
    const int64_t start = chunkStart(chunkIndex, cfg);
    const int64_t end = chunkEnd(chunkIndex, documentSize, cfg);

    auto current = [start, end](const ContentChunk& c) {
        return c.startOffset == start && c.endOffset == end;
    };

    // A chunk cached under another chunk size or document size is stale
    if (auto cached = _store.get(documentId, chunkIndex); cached && current(*cached)) [[likely]] {
        _hits.fetch_add(1, std::memory_order_relaxed);
        return std::move(*cached);
    }

    ChunkKey key{documentId, chunkIndex};
    std::promise<ContentChunk> promise;
    std::shared_future<ContentChunk> future;
    bool owner = false;
    {
        std::lock_guard<std::mutex> lock(_inflightMutex);
        auto it = _inflight.find(key);
        if (it != _inflight.end()) {
            future = it->second;
        } else {
            future = promise.get_future().share();
            _inflight.emplace(key, future);
            owner = true;
        }
    }

    if (!owner) {
        return future.get();
    }

    try {
        // A previous owner may have stored the chunk between our lookup and
        // our registration
        auto stored = _store.get(documentId, chunkIndex);
        if (stored && current(*stored)) {
            _hits.fetch_add(1, std::memory_order_relaxed);
            promise.set_value(std::move(*stored));
        } else {
            _misses.fetch_add(1, std::memory_order_relaxed);
            promise.set_value(fetchChunk(documentId, chunkIndex, start, end, stored.has_value()));
        }
    } catch (...) {
        promise.set_exception(std::current_exception());
    }

    {
        std::lock_guard<std::mutex> lock(_inflightMutex);
        _inflight.erase(key);
    }

    return future.get();
}

ContentChunk ChunkCache::fetchChunk(const std::string& documentId,
                                    int64_t chunkIndex,
                                    int64_t startOffset,
                                    int64_t endOffset,
                                    bool replaceStale)
{
    Logger()->debug("Cache miss {}#{} [{}, {}]", documentId, chunkIndex, startOffset, endOffset);

    ContentChunk chunk;
    chunk.documentId = documentId;
    chunk.chunkIndex = chunkIndex;
    chunk.startOffset = startOffset;
    chunk.endOffset = endOffset;

    try {
        chunk.content = _remote.fetchRange(documentId, startOffset, endOffset);
    } catch (const RemoteFetchError&) {
        throw;
    } catch (const std::exception& e) {
        throw RemoteFetchError("fetching " + documentId + " bytes " + std::to_string(startOffset) + "-" +
                               std::to_string(endOffset) + ": " + e.what());
    }
    _bytesFetched.fetch_add(chunk.content.size(), std::memory_order_relaxed);

    chunk.cachedAt = nextCachedAt();
    if (replaceStale) {
        _store.remove(documentId, chunkIndex);
    }
    _store.put(chunk);
    return chunk;
}

[[gnu::cold]] void ChunkCache::evictIfNeeded(const std::string& activeDocumentId, const CacheConfig& cfg)
{
    std::lock_guard<std::mutex> evictLock(_evictionMutex);

    try {
        auto all = _store.listAll();

        size_t total = 0;
        for (const auto& c : all) total += c.bytes();
        const auto budget = static_cast<size_t>(cfg.maxCacheBytes);
        if (total <= budget) return;

        std::vector<ContentChunk> candidates;
        candidates.reserve(all.size());
        for (auto& c : all) {
            if (c.documentId != activeDocumentId) candidates.push_back(std::move(c));
        }

        std::sort(candidates.begin(), candidates.end(),
                  [](const ContentChunk& a, const ContentChunk& b) {
                      return a.cachedAt < b.cachedAt;
                  });

        const size_t target = total - budget;
        size_t freed = 0;
        uint64_t evicted = 0;
        for (const auto& c : candidates) {
            if (freed >= target) break;
            _store.remove(c.documentId, c.chunkIndex);
            freed += c.bytes();
            evicted++;
        }
        _evictions.fetch_add(evicted, std::memory_order_relaxed);

        if (evicted > 0) {
            Logger()->debug("Evicted {} chunks ({} bytes)", evicted, freed);
        }
        if (freed < target) {
            Logger()->debug("Cache stays {} bytes over budget; chunks of {} are protected",
                            target - freed, activeDocumentId);
        }
    } catch (const std::exception& e) {
        Logger()->warn("Chunk eviction failed: {}", e.what());
    }
}

void ChunkCache::evictBook(const std::string& documentId)
{
    if (!_store.isOpen()) return;
    try {
        size_t removed = 0;
        for (const auto& c : _store.listAll()) {
            if (c.documentId != documentId) continue;
            _store.remove(c.documentId, c.chunkIndex);
            removed++;
        }
        Logger()->debug("Removed {} cached chunks of {}", removed, documentId);
    } catch (const std::exception& e) {
        Logger()->error("Error clearing cache of {}: {}", documentId, e.what());
    }
}

void ChunkCache::evictAll()
{
    if (!_store.isOpen()) return;
    try {
        _store.clear();
    } catch (const std::exception& e) {
        Logger()->error("Error clearing chunk cache: {}", e.what());
    }
}

ChunkCache::Stats ChunkCache::stats() const
{
    Stats s;
    if (!_store.isOpen()) return s;

    for (const auto& c : _store.listAll()) {
        s.chunkCount++;
        s.totalBytes += c.bytes();
        s.documentIds.insert(c.documentId);
    }
    return s;
}

auto ChunkCache::counters() const -> Counters
{
    return {
        _hits.load(std::memory_order_relaxed),
        _misses.load(std::memory_order_relaxed),
        _evictions.load(std::memory_order_relaxed),
        _bytesFetched.load(std::memory_order_relaxed)
    };
}

void ChunkCache::resetCounters()
{
    _hits.store(0, std::memory_order_relaxed);
    _misses.store(0, std::memory_order_relaxed);
    _evictions.store(0, std::memory_order_relaxed);
    _bytesFetched.store(0, std::memory_order_relaxed);
}

int64_t ChunkCache::nextCachedAt()
{
    // Strictly increasing so insertion order survives equal clock readings
    const int64_t now = _clock();
    int64_t prev = _lastCachedAt.load(std::memory_order_relaxed);
    int64_t next;
    do {
        next = std::max(now, prev + 1);
    } while (!_lastCachedAt.compare_exchange_weak(prev, next, std::memory_order_relaxed));
    return next;
}

} // namespace readsync
