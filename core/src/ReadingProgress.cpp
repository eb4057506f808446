#include "readsync/core/types/ReadingProgress.hpp"

#include "readsync/core/types/IRemoteObjectStore.hpp"
#include "readsync/core/util/LoadJson.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <stdexcept>

namespace readsync {

ReadingProgress ReadingProgress::at(const std::string& documentId,
                                    int64_t position,
                                    int64_t documentSize,
                                    int64_t timestampMs)
{
    if (documentId.empty()) {
        throw std::invalid_argument("reading progress needs a document id");
    }
    if (documentSize <= 0) {
        throw std::invalid_argument("document " + documentId + " has no content");
    }

    ReadingProgress p;
    p.documentId = documentId;
    p.position = std::clamp<int64_t>(position, 0, documentSize - 1);
    p.percentage = static_cast<double>(p.position) / static_cast<double>(documentSize) * 100.0;
    p.lastUpdated = timestampMs;
    return p;
}

nlohmann::json toJson(const ReadingProgress& progress)
{
    nlohmann::json j = {
        {"documentId", progress.documentId},
        {"position", progress.position},
        {"percentage", progress.percentage},
        {"lastUpdated", progress.lastUpdated},
    };
    if (progress.lineNumber) {
        j["lineNumber"] = *progress.lineNumber;
    }
    return j;
}

ReadingProgress progressFromJson(const nlohmann::json& j)
{
    json::require_fields(j, {"documentId", "position", "lastUpdated"}, "reading progress record");

    ReadingProgress p;
    p.documentId = json::string_or(&j, "documentId", "");
    if (p.documentId.empty()) {
        throw std::runtime_error("reading progress record has an empty documentId");
    }
    p.position = std::max<int64_t>(0, json::integer_or(&j, "position", 0));
    p.percentage = json::number_or(&j, "percentage", 0.0);
    p.lastUpdated = json::integer_or(&j, "lastUpdated", 0);
    auto it = j.find("lineNumber");
    if (it != j.end() && it->is_number()) {
        p.lineNumber = json::integer_or(&j, "lineNumber", 0);
    }
    return p;
}

int64_t lineNumberAt(std::string_view text, int64_t offsetInText, int64_t baseLine)
{
    auto end = static_cast<size_t>(std::clamp<int64_t>(offsetInText, 0, static_cast<int64_t>(text.size())));
    return baseLine + std::count(text.begin(), text.begin() + static_cast<std::ptrdiff_t>(end), '\n');
}

int64_t lineNumberOf(IRemoteObjectStore& remote, const std::string& documentId, int64_t position, int64_t step)
{
    if (step <= 0) {
        throw std::invalid_argument("line counting needs a positive step");
    }
    int64_t line = 1;
    for (int64_t start = 0; start < position; start += step) {
        const int64_t end = std::min(start + step, position) - 1;
        const auto piece = remote.fetchRange(documentId, start, end);
        line = lineNumberAt(piece, static_cast<int64_t>(piece.size()), line);
    }
    return line;
}

} // namespace readsync
