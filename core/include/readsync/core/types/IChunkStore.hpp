#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "readsync/core/types/ContentChunk.hpp"

namespace readsync {

// Local keyed storage of content chunks. No eviction policy of its own.
// Implementations must be safe to call from several threads.
class IChunkStore {
public:
    virtual ~IChunkStore() = default;

    virtual void open() = 0;
    virtual bool isOpen() const = 0;

    virtual std::optional<ContentChunk> get(const std::string& documentId, int64_t chunkIndex) const = 0;
    virtual void put(const ContentChunk& chunk) = 0;
    virtual void remove(const std::string& documentId, int64_t chunkIndex) = 0;
    virtual std::vector<ContentChunk> listAll() const = 0;
    virtual void clear() = 0;
};

} // namespace readsync
