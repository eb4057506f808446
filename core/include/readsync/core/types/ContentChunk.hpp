#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

namespace readsync {

struct ChunkKey {
    std::string documentId;
    int64_t chunkIndex = 0;

    bool operator==(const ChunkKey& other) const noexcept
    {
        return chunkIndex == other.chunkIndex && documentId == other.documentId;
    }
};

struct ChunkKeyHasher {
    std::size_t operator()(const ChunkKey& key) const noexcept
    {
        std::size_t seed = std::hash<std::string>{}(key.documentId);
        seed ^= std::hash<int64_t>{}(key.chunkIndex) + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
        return seed;
    }
};

/**
 * @brief One cached byte range [startOffset, endOffset] of a document.
 *
 * Never mutated once stored; a refresh is a remove followed by a put.
 */
struct ContentChunk {
    std::string documentId;
    int64_t chunkIndex = 0;
    int64_t startOffset = 0;
    int64_t endOffset = 0;  // inclusive
    std::string content;
    int64_t cachedAt = 0;   // epoch ms, insertion time

    ChunkKey key() const { return {documentId, chunkIndex}; }
    size_t bytes() const { return content.size(); }
};

} // namespace readsync
