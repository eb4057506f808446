#pragma once

#include <nlohmann/json_fwd.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace readsync {

class IRemoteObjectStore;

/**
 * @brief Last known reading position of one document.
 *
 * `lastUpdated` is the only field compared when local and remote copies are
 * merged. `percentage` and `lineNumber` are informational.
 */
struct ReadingProgress {
    std::string documentId;
    int64_t position = 0;
    double percentage = 0.0;
    int64_t lastUpdated = 0;
    std::optional<int64_t> lineNumber;

    /**
     * @brief Build a progress record for `position` in a document of
     * `documentSize` bytes, stamped with `timestampMs`.
     *
     * The position is clamped into [0, documentSize). Throws
     * std::invalid_argument for an empty documentId or a non-positive size.
     */
    static ReadingProgress at(const std::string& documentId,
                              int64_t position,
                              int64_t documentSize,
                              int64_t timestampMs);

    bool operator==(const ReadingProgress& other) const = default;
};

nlohmann::json toJson(const ReadingProgress& progress);

// Parses a record produced by toJson(). Throws std::runtime_error when
// documentId, position or lastUpdated are missing.
ReadingProgress progressFromJson(const nlohmann::json& j);

// Best-effort 1-based line number of byte `offsetInText` within `text`:
// one plus the count of '\n' before it. `baseLine` is the line number of the
// first byte of `text`, for callers holding only a window of the document.
int64_t lineNumberAt(std::string_view text, int64_t offsetInText, int64_t baseLine = 1);

// Line number of byte `position` in remote document `documentId`, read in
// pieces of at most `step` bytes so memory does not grow with the prefix.
// Throws RemoteFetchError from the remote.
int64_t lineNumberOf(IRemoteObjectStore& remote, const std::string& documentId, int64_t position, int64_t step);

} // namespace readsync
