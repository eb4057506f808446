#include "readsync/core/util/Synchronizer.hpp"

#include "readsync/core/util/Errors.hpp"
#include "readsync/core/util/Logging.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <stdexcept>

namespace readsync {

const char* toString(SyncAction action)
{
    switch (action) {
        case SyncAction::None:          return "none";
        case SyncAction::AdoptedRemote: return "adopted-remote";
        case SyncAction::PushedLocal:   return "pushed-local";
    }
    return "unknown";
}

Synchronizer::Synchronizer(ProgressLedger& ledger, IRemoteObjectStore& remote, SyncConfig config)
    : _ledger(ledger)
    , _remote(remote)
    , _config(config)
{
    _config.validate();
}

Synchronizer::~Synchronizer()
{
    stopPeriodic();
}

void Synchronizer::recordProgress(const ReadingProgress& progress)
{
    if (progress.documentId.empty()) {
        throw std::invalid_argument("recordProgress: empty document id");
    }
    if (progress.position < 0) {
        throw std::invalid_argument("recordProgress: negative position for " + progress.documentId);
    }

    _ledger.put(progress);

    std::lock_guard<std::mutex> lock(_pendingMutex);
    _pending.insert_or_assign(progress.documentId, progress);
}

std::optional<ReadingProgress> Synchronizer::getProgress(const std::string& documentId) const
{
    return _ledger.get(documentId);
}

std::optional<ReadingProgress> Synchronizer::fetchRemote(const std::string& documentId)
{
    std::optional<nlohmann::json> record;
    try {
        record = _remote.readRecord(documentId);
    } catch (const RemoteFetchError&) {
        throw;
    } catch (const std::exception& e) {
        throw RemoteFetchError("reading progress of " + documentId + ": " + e.what());
    }
    if (!record) return std::nullopt;

    try {
        auto progress = progressFromJson(*record);
        progress.documentId = documentId;
        return progress;
    } catch (const std::exception& e) {
        Logger()->warn("Ignoring malformed remote progress for {}: {}", documentId, e.what());
        return std::nullopt;
    }
}

void Synchronizer::pushRemote(const ReadingProgress& progress)
{
    try {
        _remote.writeRecord(progress.documentId, toJson(progress));
    } catch (const RemoteWriteError&) {
        throw;
    } catch (const std::exception& e) {
        throw RemoteWriteError("writing progress of " + progress.documentId + ": " + e.what());
    }
}

bool Synchronizer::adoptRemote(const ReadingProgress& remote)
{
    // The ledger may have moved on while the remote record was in flight
    if (!_ledger.putIfNewer(remote)) {
        Logger()->debug("{}: local progress changed during sync, keeping it", remote.documentId);
        return false;
    }

    // A queued record older than what we just adopted must not be pushed
    std::lock_guard<std::mutex> lock(_pendingMutex);
    auto it = _pending.find(remote.documentId);
    if (it != _pending.end() && it->second.lastUpdated <= remote.lastUpdated) {
        _pending.erase(it);
    }
    return true;
}

void Synchronizer::dequeueIfUnchanged(const ReadingProgress& written)
{
    std::lock_guard<std::mutex> lock(_pendingMutex);
    auto it = _pending.find(written.documentId);
    if (it != _pending.end() && it->second.lastUpdated <= written.lastUpdated) {
        _pending.erase(it);
    }
}

SyncAction Synchronizer::reconcile(const std::string& documentId)
{
    auto local = _ledger.get(documentId);
    auto remote = fetchRemote(documentId);

    if (!local && !remote) {
        return SyncAction::None;
    }

    if (!local) {
        if (!adoptRemote(*remote)) return SyncAction::None;
        Logger()->debug("{}: adopted remote position {}", documentId, remote->position);
        return SyncAction::AdoptedRemote;
    }

    if (!remote || local->lastUpdated > remote->lastUpdated) {
        pushRemote(*local);
        dequeueIfUnchanged(*local);
        Logger()->debug("{}: pushed local position {}", documentId, local->position);
        return SyncAction::PushedLocal;
    }

    if (remote->lastUpdated > local->lastUpdated) {
        if (!adoptRemote(*remote)) return SyncAction::None;
        Logger()->debug("{}: adopted remote position {}", documentId, remote->position);
        return SyncAction::AdoptedRemote;
    }

    return SyncAction::None;
}

FlushResult Synchronizer::flushPending()
{
    FlushResult result;

    std::unique_lock<std::mutex> guard(_flushMutex, std::try_to_lock);
    if (!guard.owns_lock()) {
        result.skipped = true;
        return result;
    }

    std::vector<ReadingProgress> batch;
    {
        std::lock_guard<std::mutex> lock(_pendingMutex);
        batch.reserve(_pending.size());
        for (const auto& [id, progress] : _pending) {
            batch.push_back(progress);
        }
    }
    if (batch.empty()) return result;

    _flushing.store(true, std::memory_order_release);

    std::atomic<size_t> written{0};
    std::atomic<size_t> failed{0};

    #pragma omp parallel for schedule(dynamic, 1)
    for (size_t i = 0; i < batch.size(); i++) {
        try {
            pushRemote(batch[i]);
            dequeueIfUnchanged(batch[i]);
            written.fetch_add(1, std::memory_order_relaxed);
        } catch (const std::exception& e) {
            Logger()->warn("Progress of {} not synced, will retry: {}", batch[i].documentId, e.what());
            failed.fetch_add(1, std::memory_order_relaxed);
        }
    }

    _flushing.store(false, std::memory_order_release);

    result.written = written.load();
    result.failed = failed.load();
    if (result.failed > 0) {
        Logger()->info("Flushed {} progress records, {} failed", result.written, result.failed);
    } else {
        Logger()->debug("Flushed {} progress records", result.written);
    }
    return result;
}

void Synchronizer::startPeriodic()
{
    std::lock_guard<std::mutex> lock(_driverMutex);
    if (_timerThread.joinable()) return;

    {
        std::lock_guard<std::mutex> lk(_timerMutex);
        _stopRequested = false;
    }
    _timerThread = std::thread(&Synchronizer::periodicLoop, this);
    Logger()->info("Periodic progress sync started ({} ms)", _config.flushIntervalMs);
}

void Synchronizer::stopPeriodic()
{
    std::lock_guard<std::mutex> lock(_driverMutex);
    if (!_timerThread.joinable()) return;

    {
        std::lock_guard<std::mutex> lk(_timerMutex);
        _stopRequested = true;
    }
    _timerCV.notify_all();
    _timerThread.join();
    Logger()->info("Periodic progress sync stopped");
}

bool Synchronizer::periodicRunning() const
{
    std::lock_guard<std::mutex> lock(_driverMutex);
    return _timerThread.joinable();
}

void Synchronizer::periodicLoop()
{
    const auto interval = std::chrono::milliseconds(_config.flushIntervalMs);

    while (true) {
        {
            std::lock_guard<std::mutex> lk(_timerMutex);
            if (_stopRequested) return;
        }

        try {
            flushPending();
        } catch (const std::exception& e) {
            Logger()->error("Periodic progress flush failed: {}", e.what());
        }

        std::unique_lock<std::mutex> lk(_timerMutex);
        if (_timerCV.wait_for(lk, interval, [this] { return _stopRequested; })) {
            return;
        }
    }
}

std::optional<ReadingProgress> Synchronizer::pullLatest(const std::string& documentId)
{
    std::optional<ReadingProgress> remote;
    try {
        remote = fetchRemote(documentId);
    } catch (const RemoteFetchError& e) {
        Logger()->warn("Could not fetch latest progress of {}: {}", documentId, e.what());
        return _ledger.get(documentId);
    }

    if (!remote) return _ledger.get(documentId);

    // No-op when the ledger already holds something at least as new
    adoptRemote(*remote);
    return remote;
}

ReconcileSummary Synchronizer::reconcileAll(const std::vector<std::string>& documentIds)
{
    std::atomic<size_t> succeeded{0};
    std::atomic<size_t> failed{0};

    #pragma omp parallel for schedule(dynamic, 1)
    for (size_t i = 0; i < documentIds.size(); i++) {
        try {
            reconcile(documentIds[i]);
            succeeded.fetch_add(1, std::memory_order_relaxed);
        } catch (const std::exception& e) {
            Logger()->error("Error syncing progress of {}: {}", documentIds[i], e.what());
            failed.fetch_add(1, std::memory_order_relaxed);
        }
    }

    return {succeeded.load(), failed.load()};
}

void Synchronizer::forget(const std::string& documentId)
{
    _ledger.remove(documentId);
    std::lock_guard<std::mutex> lock(_pendingMutex);
    _pending.erase(documentId);
}

void Synchronizer::forgetAll()
{
    _ledger.clear();
    std::lock_guard<std::mutex> lock(_pendingMutex);
    _pending.clear();
}

SyncStatus Synchronizer::status() const
{
    std::lock_guard<std::mutex> lock(_pendingMutex);
    return {_flushing.load(std::memory_order_acquire), _pending.size()};
}

std::optional<ReadingProgress> Synchronizer::pending(const std::string& documentId) const
{
    std::lock_guard<std::mutex> lock(_pendingMutex);
    auto it = _pending.find(documentId);
    if (it == _pending.end()) return std::nullopt;
    return it->second;
}

} // namespace readsync
