#include "readsync/core/types/DirectoryObjectStore.hpp"

#include "readsync/core/util/Errors.hpp"
#include "readsync/core/util/LoadJson.hpp"
#include "readsync/core/util/Logging.hpp"

#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace readsync {

namespace {

// Object ids name files directly under the root
bool validObjectId(const std::string& id)
{
    return !id.empty() && id != "." && id != ".." &&
           id.find('/') == std::string::npos && id.find('\\') == std::string::npos;
}

} // namespace

DirectoryObjectStore::DirectoryObjectStore(fs::path root)
    : _root(std::move(root))
{
}

fs::path DirectoryObjectStore::documentPath(const std::string& objectId) const
{
    return _root / objectId;
}

fs::path DirectoryObjectStore::recordPath(const std::string& objectId) const
{
    return _root / (objectId + "_progress.json");
}

int64_t DirectoryObjectStore::documentSize(const std::string& objectId) const
{
    if (!validObjectId(objectId)) {
        throw RemoteFetchError("invalid object id '" + objectId + "'");
    }
    std::error_code ec;
    auto size = fs::file_size(documentPath(objectId), ec);
    if (ec) {
        throw RemoteFetchError("cannot stat " + documentPath(objectId).string() + ": " + ec.message());
    }
    return static_cast<int64_t>(size);
}

std::string DirectoryObjectStore::fetchRange(const std::string& objectId, int64_t startInclusive, int64_t endInclusive)
{
    const int64_t size = documentSize(objectId);
    if (startInclusive < 0 || endInclusive < startInclusive || endInclusive >= size) {
        throw RemoteFetchError("range " + std::to_string(startInclusive) + "-" + std::to_string(endInclusive) +
                               " not satisfiable for " + objectId + " (" + std::to_string(size) + " bytes)");
    }

    std::ifstream in(documentPath(objectId), std::ios::binary);
    if (!in) {
        throw RemoteFetchError("cannot open " + documentPath(objectId).string());
    }

    std::string out(static_cast<size_t>(endInclusive - startInclusive + 1), '\0');
    in.seekg(startInclusive);
    in.read(out.data(), static_cast<std::streamsize>(out.size()));
    if (in.gcount() != static_cast<std::streamsize>(out.size())) {
        throw RemoteFetchError("short read from " + documentPath(objectId).string());
    }
    return out;
}

std::optional<nlohmann::json> DirectoryObjectStore::readRecord(const std::string& objectId)
{
    if (!validObjectId(objectId)) {
        throw RemoteFetchError("invalid object id '" + objectId + "'");
    }

    std::lock_guard<std::mutex> lock(_recordMutex);
    const auto path = recordPath(objectId);
    if (!fs::exists(path)) return std::nullopt;

    std::ifstream in(path);
    if (!in) {
        throw RemoteFetchError("cannot open " + path.string());
    }
    std::ostringstream text;
    text << in.rdbuf();
    return json::parse_or_none(text.str(), path.string());
}

void DirectoryObjectStore::writeRecord(const std::string& objectId, const nlohmann::json& record)
{
    if (!validObjectId(objectId)) {
        throw RemoteWriteError("invalid object id '" + objectId + "'");
    }

    std::lock_guard<std::mutex> lock(_recordMutex);
    try {
        fs::create_directories(_root);
        json::save_json_file(recordPath(objectId), record);
    } catch (const std::exception& e) {
        throw RemoteWriteError("writing record for " + objectId + ": " + e.what());
    }
    Logger()->debug("Wrote {}", recordPath(objectId).string());
}

} // namespace readsync
