#include "readsync/core/types/ProgressLedger.hpp"

#include "readsync/core/util/Logging.hpp"

#include <nlohmann/json.hpp>

#include <stdexcept>

namespace readsync {

ProgressLedger::ProgressLedger(IKeyValueStore& store, std::string storageKey)
    : _store(store)
    , _storageKey(std::move(storageKey))
{
}

nlohmann::json ProgressLedger::loadAll() const
{
    auto stored = _store.get(_storageKey);
    if (!stored) return nlohmann::json::object();
    if (!stored->is_object()) {
        Logger()->error("Ignoring local progress under '{}': not a JSON object", _storageKey);
        return nlohmann::json::object();
    }
    return std::move(*stored);
}

std::optional<ReadingProgress> ProgressLedger::get(const std::string& documentId) const
{
    std::lock_guard<std::mutex> lock(_mutex);
    auto all = loadAll();
    auto it = all.find(documentId);
    if (it == all.end()) return std::nullopt;
    try {
        return progressFromJson(*it);
    } catch (const std::exception& e) {
        Logger()->warn("Ignoring malformed local progress for {}: {}", documentId, e.what());
        return std::nullopt;
    }
}

void ProgressLedger::put(const ReadingProgress& progress)
{
    if (progress.documentId.empty()) {
        throw std::invalid_argument("cannot store progress without a document id");
    }
    std::lock_guard<std::mutex> lock(_mutex);
    auto all = loadAll();
    all[progress.documentId] = toJson(progress);
    _store.set(_storageKey, all);
}

bool ProgressLedger::putIfNewer(const ReadingProgress& progress)
{
    if (progress.documentId.empty()) {
        throw std::invalid_argument("cannot store progress without a document id");
    }
    std::lock_guard<std::mutex> lock(_mutex);
    auto all = loadAll();
    auto it = all.find(progress.documentId);
    if (it != all.end()) {
        try {
            if (progressFromJson(*it).lastUpdated >= progress.lastUpdated) return false;
        } catch (const std::exception& e) {
            Logger()->warn("Replacing malformed local progress for {}: {}", progress.documentId, e.what());
        }
    }
    all[progress.documentId] = toJson(progress);
    _store.set(_storageKey, all);
    return true;
}

void ProgressLedger::remove(const std::string& documentId)
{
    std::lock_guard<std::mutex> lock(_mutex);
    auto all = loadAll();
    if (all.erase(documentId) == 0) return;
    _store.set(_storageKey, all);
}

void ProgressLedger::clear()
{
    std::lock_guard<std::mutex> lock(_mutex);
    _store.remove(_storageKey);
}

std::map<std::string, ReadingProgress> ProgressLedger::all() const
{
    std::lock_guard<std::mutex> lock(_mutex);
    std::map<std::string, ReadingProgress> out;
    const auto stored = loadAll();
    for (const auto& el : stored.items()) {
        try {
            out.emplace(el.key(), progressFromJson(el.value()));
        } catch (const std::exception& e) {
            Logger()->warn("Ignoring malformed local progress for {}: {}", el.key(), e.what());
        }
    }
    return out;
}

} // namespace readsync
