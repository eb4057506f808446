#include "test.hpp"

#include <chrono>
#include <stdexcept>
#include <thread>

#include <nlohmann/json.hpp>

#include "readsync/core/types/ProgressLedger.hpp"
#include "readsync/core/util/Errors.hpp"
#include "readsync/core/util/Logging.hpp"
#include "readsync/core/util/Synchronizer.hpp"
#include "readsync/testing/FakeStores.hpp"

using namespace readsync;
using readsync::testing::FakeRemote;
using readsync::testing::MemoryKeyValueStore;

namespace {

ReadingProgress progress(const std::string& id, int64_t position, int64_t lastUpdated)
{
    ReadingProgress p;
    p.documentId = id;
    p.position = position;
    p.percentage = static_cast<double>(position) / 10.0;
    p.lastUpdated = lastUpdated;
    return p;
}

SyncConfig interval(int64_t ms)
{
    SyncConfig c;
    c.flushIntervalMs = ms;
    return c;
}

// Poll `pred` for up to two seconds
template <typename Pred>
bool eventually(Pred pred)
{
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (!pred()) {
        if (std::chrono::steady_clock::now() > deadline) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return true;
}

struct QuietLogs {
    QuietLogs() { SetLogLevel("error"); }
};
QuietLogs quietLogs;

} // namespace

// --- recordProgress ------------------------------------------------------------

TEST(RecordProgress, WritesLedgerWithoutNetwork)
{
    MemoryKeyValueStore kv;
    ProgressLedger ledger(kv);
    FakeRemote remote;
    Synchronizer sync(ledger, remote);

    sync.recordProgress(progress("A", 10, 100));

    auto stored = sync.getProgress("A");
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->position, 10);
    EXPECT_EQ(remote.writeCalls(), 0);
    EXPECT_EQ(remote.recordReads(), 0);
    EXPECT_EQ(sync.status().pendingCount, 1u);
}

TEST(RecordProgress, CoalescesPerDocument)
{
    MemoryKeyValueStore kv;
    ProgressLedger ledger(kv);
    FakeRemote remote;
    Synchronizer sync(ledger, remote);

    sync.recordProgress(progress("A", 10, 100));
    sync.recordProgress(progress("A", 20, 200));
    sync.recordProgress(progress("A", 30, 300));
    sync.recordProgress(progress("B", 5, 150));

    EXPECT_EQ(sync.status().pendingCount, 2u);
    EXPECT_EQ(sync.pending("A")->position, 30);

    auto r = sync.flushPending();
    EXPECT_FALSE(r.skipped);
    EXPECT_EQ(r.written, 2u);
    EXPECT_EQ(remote.writeCalls(), 2);
    EXPECT_EQ(remote.record("A")->at("position").get<int64_t>(), 30);
}

TEST(RecordProgress, RejectsInvalidRecords)
{
    MemoryKeyValueStore kv;
    ProgressLedger ledger(kv);
    FakeRemote remote;
    Synchronizer sync(ledger, remote);

    EXPECT_THROW(sync.recordProgress(progress("", 10, 100)), std::invalid_argument);
    EXPECT_THROW(sync.recordProgress(progress("A", -1, 100)), std::invalid_argument);
    EXPECT_EQ(sync.status().pendingCount, 0u);
    EXPECT_FALSE(sync.getProgress("A").has_value());
}

// --- reconcile -------------------------------------------------------------------

TEST(Reconcile, NewerRemoteIsAdopted)
{
    MemoryKeyValueStore kv;
    ProgressLedger ledger(kv);
    FakeRemote remote;
    Synchronizer sync(ledger, remote);

    ledger.put(progress("A", 10, 100));
    remote.setRecord("A", toJson(progress("A", 50, 200)));

    EXPECT_EQ(sync.reconcile("A"), SyncAction::AdoptedRemote);
    EXPECT_EQ(sync.getProgress("A")->position, 50);
    EXPECT_EQ(sync.getProgress("A")->lastUpdated, 200);
    EXPECT_EQ(remote.writeCalls(), 0);
}

TEST(Reconcile, NewerLocalIsPushed)
{
    MemoryKeyValueStore kv;
    ProgressLedger ledger(kv);
    FakeRemote remote;
    Synchronizer sync(ledger, remote);

    ledger.put(progress("A", 80, 300));
    remote.setRecord("A", toJson(progress("A", 50, 200)));

    EXPECT_EQ(sync.reconcile("A"), SyncAction::PushedLocal);
    EXPECT_EQ(remote.record("A")->at("position").get<int64_t>(), 80);
    EXPECT_EQ(remote.record("A")->at("lastUpdated").get<int64_t>(), 300);
    EXPECT_EQ(sync.getProgress("A")->position, 80);
}

TEST(Reconcile, EqualTimestampsChangeNothing)
{
    MemoryKeyValueStore kv;
    ProgressLedger ledger(kv);
    FakeRemote remote;
    Synchronizer sync(ledger, remote);

    ledger.put(progress("A", 80, 300));
    remote.setRecord("A", toJson(progress("A", 50, 300)));

    EXPECT_EQ(sync.reconcile("A"), SyncAction::None);
    EXPECT_EQ(sync.getProgress("A")->position, 80);
    EXPECT_EQ(remote.record("A")->at("position").get<int64_t>(), 50);
    EXPECT_EQ(remote.writeCalls(), 0);
}

TEST(Reconcile, OneSidedRecordsAreCopied)
{
    MemoryKeyValueStore kv;
    ProgressLedger ledger(kv);
    FakeRemote remote;
    Synchronizer sync(ledger, remote);

    ledger.put(progress("local", 7, 100));
    remote.setRecord("remote", toJson(progress("remote", 9, 100)));

    EXPECT_EQ(sync.reconcile("local"), SyncAction::PushedLocal);
    EXPECT_TRUE(remote.record("local").has_value());

    EXPECT_EQ(sync.reconcile("remote"), SyncAction::AdoptedRemote);
    EXPECT_EQ(sync.getProgress("remote")->position, 9);

    EXPECT_EQ(sync.reconcile("nowhere"), SyncAction::None);
    EXPECT_FALSE(sync.getProgress("nowhere").has_value());
    EXPECT_FALSE(remote.record("nowhere").has_value());
}

TEST(Reconcile, IsIdempotent)
{
    MemoryKeyValueStore kv;
    ProgressLedger ledger(kv);
    FakeRemote remote;
    Synchronizer sync(ledger, remote);

    ledger.put(progress("A", 80, 300));
    EXPECT_EQ(sync.reconcile("A"), SyncAction::PushedLocal);
    EXPECT_EQ(sync.reconcile("A"), SyncAction::None);
    EXPECT_EQ(remote.writeCalls(), 1);
}

TEST(Reconcile, MalformedRemoteRecordCountsAsAbsent)
{
    MemoryKeyValueStore kv;
    ProgressLedger ledger(kv);
    FakeRemote remote;
    Synchronizer sync(ledger, remote);

    ledger.put(progress("A", 80, 300));
    remote.setRecord("A", nlohmann::json{{"unexpected", true}});

    EXPECT_EQ(sync.reconcile("A"), SyncAction::PushedLocal);
    EXPECT_EQ(remote.record("A")->at("position").get<int64_t>(), 80);
}

TEST(Reconcile, RemoteErrorsPropagate)
{
    MemoryKeyValueStore kv;
    ProgressLedger ledger(kv);
    FakeRemote remote;
    Synchronizer sync(ledger, remote);

    ledger.put(progress("A", 80, 300));

    remote.failRecordReads(true);
    EXPECT_THROW(sync.reconcile("A"), RemoteFetchError);
    remote.failRecordReads(false);

    remote.failWritesOf("A");
    EXPECT_THROW(sync.reconcile("A"), RemoteWriteError);
    EXPECT_EQ(sync.getProgress("A")->position, 80);
}

TEST(Reconcile, RecordMadeDuringRemoteReadWins)
{
    MemoryKeyValueStore kv;
    ProgressLedger ledger(kv);
    FakeRemote remote;
    Synchronizer sync(ledger, remote);

    ledger.put(progress("A", 10, 100));
    remote.setRecord("A", toJson(progress("A", 50, 200)));
    remote.closeGate();

    SyncAction action = SyncAction::PushedLocal;
    std::thread t([&] { action = sync.reconcile("A"); });
    ASSERT_TRUE(remote.waitForGateArrivals(1));

    sync.recordProgress(progress("A", 99, 300));
    remote.openGate();
    t.join();

    EXPECT_TRUE(action == SyncAction::None);
    auto local = sync.getProgress("A");
    ASSERT_TRUE(local.has_value());
    EXPECT_EQ(local->position, 99);
    EXPECT_EQ(local->lastUpdated, 300);
    EXPECT_EQ(sync.pending("A")->position, 99);

    // The queued record then reaches the remote
    EXPECT_EQ(sync.flushPending().written, 1u);
    EXPECT_EQ(remote.record("A")->at("position").get<int64_t>(), 99);
}

TEST(Reconcile, PushClearsMatchingPendingEntry)
{
    MemoryKeyValueStore kv;
    ProgressLedger ledger(kv);
    FakeRemote remote;
    Synchronizer sync(ledger, remote);

    sync.recordProgress(progress("A", 10, 100));
    EXPECT_EQ(sync.reconcile("A"), SyncAction::PushedLocal);
    EXPECT_EQ(sync.status().pendingCount, 0u);
}

TEST(Reconcile, AdoptingNewerRemoteDropsStalePending)
{
    MemoryKeyValueStore kv;
    ProgressLedger ledger(kv);
    FakeRemote remote;
    Synchronizer sync(ledger, remote);

    sync.recordProgress(progress("A", 10, 100));
    remote.setRecord("A", toJson(progress("A", 90, 500)));

    EXPECT_EQ(sync.reconcile("A"), SyncAction::AdoptedRemote);
    EXPECT_FALSE(sync.pending("A").has_value());

    sync.flushPending();
    EXPECT_EQ(remote.record("A")->at("position").get<int64_t>(), 90);
}

// --- flushPending ------------------------------------------------------------------

TEST(FlushPending, SecondFlushWritesNothing)
{
    MemoryKeyValueStore kv;
    ProgressLedger ledger(kv);
    FakeRemote remote;
    Synchronizer sync(ledger, remote);

    sync.recordProgress(progress("A", 10, 100));
    EXPECT_EQ(sync.flushPending().written, 1u);
    EXPECT_EQ(sync.flushPending().written, 0u);
    EXPECT_EQ(remote.writeCalls(), 1);
}

TEST(FlushPending, FailedWritesStayQueued)
{
    MemoryKeyValueStore kv;
    ProgressLedger ledger(kv);
    FakeRemote remote;
    Synchronizer sync(ledger, remote);

    sync.recordProgress(progress("A", 10, 100));
    sync.recordProgress(progress("B", 20, 100));
    remote.failWritesOf("B");

    auto r = sync.flushPending();
    EXPECT_EQ(r.written, 1u);
    EXPECT_EQ(r.failed, 1u);
    EXPECT_FALSE(sync.pending("A").has_value());
    EXPECT_TRUE(sync.pending("B").has_value());

    remote.failWritesOf("B", false);
    r = sync.flushPending();
    EXPECT_EQ(r.written, 1u);
    EXPECT_EQ(r.failed, 0u);
    EXPECT_EQ(sync.status().pendingCount, 0u);
    EXPECT_EQ(remote.record("B")->at("position").get<int64_t>(), 20);
}

TEST(FlushPending, OverlappingFlushIsSkipped)
{
    MemoryKeyValueStore kv;
    ProgressLedger ledger(kv);
    FakeRemote remote;
    Synchronizer sync(ledger, remote);

    sync.recordProgress(progress("A", 10, 100));
    remote.closeGate();

    FlushResult first;
    std::thread t([&] { first = sync.flushPending(); });
    ASSERT_TRUE(remote.waitForGateArrivals(1));

    EXPECT_TRUE(sync.status().isFlushing);
    auto second = sync.flushPending();
    EXPECT_TRUE(second.skipped);
    EXPECT_EQ(second.written, 0u);

    remote.openGate();
    t.join();

    EXPECT_FALSE(first.skipped);
    EXPECT_EQ(first.written, 1u);
    EXPECT_EQ(remote.writeCalls(), 1);
    EXPECT_FALSE(sync.status().isFlushing);
}

TEST(FlushPending, NewerRecordDuringFlushSurvives)
{
    MemoryKeyValueStore kv;
    ProgressLedger ledger(kv);
    FakeRemote remote;
    Synchronizer sync(ledger, remote);

    sync.recordProgress(progress("A", 10, 100));
    remote.closeGate();

    std::thread t([&] { sync.flushPending(); });
    ASSERT_TRUE(remote.waitForGateArrivals(1));

    sync.recordProgress(progress("A", 40, 200));

    remote.openGate();
    t.join();

    auto queued = sync.pending("A");
    ASSERT_TRUE(queued.has_value());
    EXPECT_EQ(queued->position, 40);

    EXPECT_EQ(sync.flushPending().written, 1u);
    EXPECT_EQ(remote.record("A")->at("position").get<int64_t>(), 40);
    EXPECT_EQ(remote.record("A")->at("lastUpdated").get<int64_t>(), 200);
}

// --- periodic driver -----------------------------------------------------------------

TEST(Periodic, FlushesImmediatelyAndOnInterval)
{
    MemoryKeyValueStore kv;
    ProgressLedger ledger(kv);
    FakeRemote remote;
    Synchronizer sync(ledger, remote, interval(20));

    sync.recordProgress(progress("A", 10, 100));
    sync.startPeriodic();
    EXPECT_TRUE(eventually([&] { return remote.writeCalls() >= 1; }));

    sync.recordProgress(progress("B", 10, 100));
    EXPECT_TRUE(eventually([&] { return remote.record("B").has_value(); }));

    sync.stopPeriodic();
    EXPECT_FALSE(sync.periodicRunning());
}

TEST(Periodic, NoFlushAfterStop)
{
    MemoryKeyValueStore kv;
    ProgressLedger ledger(kv);
    FakeRemote remote;
    Synchronizer sync(ledger, remote, interval(20));

    sync.startPeriodic();
    sync.stopPeriodic();
    const int writesAtStop = remote.writeCalls();

    sync.recordProgress(progress("A", 10, 100));
    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    EXPECT_EQ(remote.writeCalls(), writesAtStop);
    EXPECT_TRUE(sync.pending("A").has_value());
}

TEST(Periodic, StartAndStopAreIdempotent)
{
    MemoryKeyValueStore kv;
    ProgressLedger ledger(kv);
    FakeRemote remote;
    Synchronizer sync(ledger, remote, interval(20));

    EXPECT_NO_THROW(sync.stopPeriodic());
    sync.startPeriodic();
    sync.startPeriodic();
    EXPECT_TRUE(sync.periodicRunning());
    sync.stopPeriodic();
    sync.stopPeriodic();
    EXPECT_FALSE(sync.periodicRunning());

    // Can be restarted after a stop
    sync.recordProgress(progress("A", 10, 100));
    sync.startPeriodic();
    EXPECT_TRUE(eventually([&] { return remote.record("A").has_value(); }));
}

TEST(Periodic, FailuresDoNotStopTheDriver)
{
    MemoryKeyValueStore kv;
    ProgressLedger ledger(kv);
    FakeRemote remote;
    Synchronizer sync(ledger, remote, interval(10));

    remote.failWritesOf("A");
    sync.recordProgress(progress("A", 10, 100));
    sync.startPeriodic();
    EXPECT_TRUE(eventually([&] { return remote.writeCalls() >= 2; }));

    remote.failWritesOf("A", false);
    EXPECT_TRUE(eventually([&] { return remote.record("A").has_value(); }));
    EXPECT_TRUE(eventually([&] { return sync.status().pendingCount == 0; }));
}

TEST(Periodic, DestructorStopsDriver)
{
    MemoryKeyValueStore kv;
    ProgressLedger ledger(kv);
    FakeRemote remote;
    {
        Synchronizer sync(ledger, remote, interval(10));
        sync.startPeriodic();
    }
    const int writes = remote.writeCalls();
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_EQ(remote.writeCalls(), writes);
}

// --- pullLatest / reconcileAll / forget ------------------------------------------------

TEST(PullLatest, AdoptsNewerRemote)
{
    MemoryKeyValueStore kv;
    ProgressLedger ledger(kv);
    FakeRemote remote;
    Synchronizer sync(ledger, remote);

    ledger.put(progress("A", 10, 100));
    remote.setRecord("A", toJson(progress("A", 70, 400)));

    auto latest = sync.pullLatest("A");
    ASSERT_TRUE(latest.has_value());
    EXPECT_EQ(latest->position, 70);
    EXPECT_EQ(sync.getProgress("A")->position, 70);
}

TEST(PullLatest, ReturnsFetchedRemoteButKeepsNewerLocal)
{
    MemoryKeyValueStore kv;
    ProgressLedger ledger(kv);
    FakeRemote remote;
    Synchronizer sync(ledger, remote);

    ledger.put(progress("A", 10, 900));
    remote.setRecord("A", toJson(progress("A", 70, 400)));

    auto latest = sync.pullLatest("A");
    ASSERT_TRUE(latest.has_value());
    EXPECT_EQ(latest->position, 70);
    EXPECT_EQ(latest->lastUpdated, 400);

    EXPECT_EQ(sync.getProgress("A")->position, 10);
    EXPECT_EQ(sync.getProgress("A")->lastUpdated, 900);
    EXPECT_EQ(remote.writeCalls(), 0);
    EXPECT_EQ(remote.record("A")->at("position").get<int64_t>(), 70);
}

TEST(PullLatest, RecordMadeDuringFetchIsNotOverwritten)
{
    MemoryKeyValueStore kv;
    ProgressLedger ledger(kv);
    FakeRemote remote;
    Synchronizer sync(ledger, remote);

    ledger.put(progress("A", 10, 100));
    remote.setRecord("A", toJson(progress("A", 50, 200)));
    remote.closeGate();

    std::optional<ReadingProgress> latest;
    std::thread t([&] { latest = sync.pullLatest("A"); });
    ASSERT_TRUE(remote.waitForGateArrivals(1));

    sync.recordProgress(progress("A", 99, 300));
    remote.openGate();
    t.join();

    ASSERT_TRUE(latest.has_value());
    EXPECT_EQ(latest->position, 50);
    EXPECT_EQ(sync.getProgress("A")->position, 99);
    EXPECT_EQ(sync.pending("A")->position, 99);
}

TEST(PullLatest, FallsBackToLocalOnRemoteFailure)
{
    MemoryKeyValueStore kv;
    ProgressLedger ledger(kv);
    FakeRemote remote;
    Synchronizer sync(ledger, remote);

    ledger.put(progress("A", 10, 100));
    remote.failRecordReads(true);

    std::optional<ReadingProgress> latest;
    EXPECT_NO_THROW(latest = sync.pullLatest("A"));
    ASSERT_TRUE(latest.has_value());
    EXPECT_EQ(latest->position, 10);

    EXPECT_FALSE(sync.pullLatest("missing").has_value());
}

TEST(ReconcileAll, OneFailureDoesNotAbortOthers)
{
    MemoryKeyValueStore kv;
    ProgressLedger ledger(kv);
    FakeRemote remote;
    Synchronizer sync(ledger, remote);

    ledger.put(progress("A", 1, 100));
    ledger.put(progress("B", 2, 100));
    ledger.put(progress("C", 3, 100));
    remote.failWritesOf("B");

    auto summary = sync.reconcileAll({"A", "B", "C"});
    EXPECT_EQ(summary.succeeded, 2u);
    EXPECT_EQ(summary.failed, 1u);
    EXPECT_TRUE(remote.record("A").has_value());
    EXPECT_FALSE(remote.record("B").has_value());
    EXPECT_TRUE(remote.record("C").has_value());
}

TEST(Forget, DropsLedgerAndPendingEntries)
{
    MemoryKeyValueStore kv;
    ProgressLedger ledger(kv);
    FakeRemote remote;
    Synchronizer sync(ledger, remote);

    sync.recordProgress(progress("A", 1, 100));
    sync.recordProgress(progress("B", 2, 100));

    sync.forget("A");
    EXPECT_FALSE(sync.getProgress("A").has_value());
    EXPECT_FALSE(sync.pending("A").has_value());
    EXPECT_TRUE(sync.getProgress("B").has_value());

    sync.forgetAll();
    EXPECT_FALSE(sync.getProgress("B").has_value());
    EXPECT_EQ(sync.status().pendingCount, 0u);
    EXPECT_FALSE(kv.get(ProgressLedger::kDefaultStorageKey).has_value());

    EXPECT_EQ(sync.flushPending().written, 0u);
    EXPECT_EQ(remote.writeCalls(), 0);
}

TEST(SyncActionNames, AreStable)
{
    EXPECT_EQ(std::string(toString(SyncAction::None)), "none");
    EXPECT_EQ(std::string(toString(SyncAction::AdoptedRemote)), "adopted-remote");
    EXPECT_EQ(std::string(toString(SyncAction::PushedLocal)), "pushed-local");
}
