#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "readsync/core/types/CacheConfig.hpp"
#include "readsync/core/types/IRemoteObjectStore.hpp"
#include "readsync/core/types/ProgressLedger.hpp"
#include "readsync/core/types/ReadingProgress.hpp"

namespace readsync {

enum class SyncAction {
    None,          // nothing to do, or timestamps equal
    AdoptedRemote, // remote copy written into the ledger
    PushedLocal    // local copy written to the remote
};

const char* toString(SyncAction action);

struct FlushResult {
    bool skipped{false};  // another flush was running
    size_t written{0};
    size_t failed{0};
};

struct ReconcileSummary {
    size_t succeeded{0};
    size_t failed{0};
};

struct SyncStatus {
    bool isFlushing{false};
    size_t pendingCount{0};
};

/**
 * @brief Keeps the local ProgressLedger and the remote progress records in
 * step, last write wins
 *
 * recordProgress() writes the ledger and queues one pending remote write per
 * document (newer records replace older ones). flushPending() drains that
 * queue; the periodic driver calls it every SyncConfig::flushIntervalMs.
 * reconcile() compares ledger and remote by ReadingProgress::lastUpdated and
 * copies the newer one over the older; equal timestamps are left alone.
 */
class Synchronizer
{
public:
    Synchronizer(ProgressLedger& ledger, IRemoteObjectStore& remote, SyncConfig config = {});
    ~Synchronizer();

    Synchronizer(const Synchronizer&) = delete;
    Synchronizer& operator=(const Synchronizer&) = delete;

    // Ledger write plus pending enqueue. Never touches the remote.
    void recordProgress(const ReadingProgress& progress);

    [[nodiscard]] std::optional<ReadingProgress> getProgress(const std::string& documentId) const;

    /**
     * @brief Merge local and remote state of one document
     * @throws RemoteFetchError if the remote record could not be read
     * @throws RemoteWriteError if pushing the local record failed
     */
    SyncAction reconcile(const std::string& documentId);

    /**
     * @brief Write every pending record to the remote
     *
     * Failed writes stay queued for the next flush. If a flush is already
     * running the call returns immediately with `skipped` set.
     */
    FlushResult flushPending();

    // Flush now and then every flushIntervalMs on a background thread.
    void startPeriodic();
    // No flush starts after this returns.
    void stopPeriodic();
    [[nodiscard]] bool periodicRunning() const;

    /**
     * @brief Fetch the remote record and adopt it if local is absent or older
     *
     * Returns the remote record whenever one was fetched, even if the ledger
     * keeps a newer local one. Without a remote record (or if reading it
     * failed, which is logged) the local record is returned.
     */
    std::optional<ReadingProgress> pullLatest(const std::string& documentId);

    // reconcile() for each id concurrently; failures are logged and counted.
    ReconcileSummary reconcileAll(const std::vector<std::string>& documentIds);

    void forget(const std::string& documentId);
    void forgetAll();

    [[nodiscard]] SyncStatus status() const;
    [[nodiscard]] std::optional<ReadingProgress> pending(const std::string& documentId) const;

    [[nodiscard]] const SyncConfig& config() const { return _config; }

private:
    ProgressLedger& _ledger;
    IRemoteObjectStore& _remote;
    const SyncConfig _config;

    mutable std::mutex _pendingMutex;
    std::unordered_map<std::string, ReadingProgress> _pending;

    std::mutex _flushMutex;
    std::atomic<bool> _flushing{false};

    mutable std::mutex _driverMutex;  // start/stop
    std::mutex _timerMutex;
    std::condition_variable _timerCV;
    bool _stopRequested = false;
    std::thread _timerThread;

    std::optional<ReadingProgress> fetchRemote(const std::string& documentId);
    void pushRemote(const ReadingProgress& progress);
    // Write `remote` into the ledger unless the ledger holds a record at least
    // as new. Returns whether it was adopted.
    bool adoptRemote(const ReadingProgress& remote);
    // Drop the pending entry unless a newer record replaced it meanwhile
    void dequeueIfUnchanged(const ReadingProgress& written);
    void periodicLoop();
};

} // namespace readsync
