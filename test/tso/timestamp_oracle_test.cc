#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../../src/tso/timestamp_oracle.h"
#include "../../src/storage/memory_checkpoint_store.h"
#include "../../src/common/status.h"
#include "../manual_clock.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using namespace Meridian;
using namespace std::chrono_literals;
using ::testing::_;
using ::testing::Invoke;
using ::testing::NiceMock;
using ::testing::Return;

namespace {

constexpr char kStream[] = "global/timestamp";

TsoOptions FastOptions() {
    TsoOptions options;
    options.update_physical_interval = 1ms;
    options.save_interval = 3s;
    options.max_reset_ts_gap = 3s;
    options.persist_margin = 3s;
    options.update_timestamp_guard = 1ms;
    options.save_retry_limit = 3;
    options.save_retry_backoff = 1ms;
    options.max_count_per_request = 4096;
    return options;
}

class MockCheckpointStore : public CheckpointStore {
public:
    MOCK_METHOD(absl::StatusOr<Checkpoint>, Load, (const std::string& stream_id), (override));
    MOCK_METHOD(absl::StatusOr<uint64_t>, Save,
            (const std::string& stream_id, int64_t saved_physical, uint64_t expected_version), (override));

    // Behaves like a healthy store until told otherwise
    void DelegateTo(MemoryCheckpointStore* real) {
        ON_CALL(*this, Load(_)).WillByDefault(Invoke(real, &MemoryCheckpointStore::Load));
        ON_CALL(*this, Save(_, _, _)).WillByDefault(Invoke(real, &MemoryCheckpointStore::Save));
    }
};

} // namespace

class TimestampOracleTest : public ::testing::Test {
protected:
    TimestampOracleTest() : election_("member-1"), guard_(&election_), clock_(1000) {}

    std::unique_ptr<TimestampOracle> MakeOracle(const TsoOptions& options, CheckpointStore* store = nullptr) {
        return std::make_unique<TimestampOracle>(kStream, options, store ? store : &store_, &guard_, &clock_);
    }

    int64_t Watermark() {
        auto cp = store_.Load(kStream);
        return cp.ok() ? cp->saved_physical : 0;
    }

    MemoryCheckpointStore store_;
    LocalElection election_;
    LeadershipGuard guard_;
    ManualClock clock_;
};

TEST_F(TimestampOracleTest, FirstAllocationsOnFreshStream) {
    auto oracle = MakeOracle(FastOptions());
    election_.Elect();
    ASSERT_TRUE(oracle->SyncTimestamp().ok());
    EXPECT_TRUE(oracle->IsInitialized());
    EXPECT_EQ(Watermark(), 4000);

    auto first = oracle->GetTimestamp(1);
    auto second = oracle->GetTimestamp(1);
    ASSERT_TRUE(first.ok() && second.ok());
    EXPECT_EQ(*first, (Timestamp{1000, 0}));
    EXPECT_EQ(*second, (Timestamp{1000, 1}));
}

TEST_F(TimestampOracleTest, BlockReservation) {
    auto oracle = MakeOracle(FastOptions());
    election_.Elect();
    ASSERT_TRUE(oracle->SyncTimestamp().ok());

    auto block = oracle->GetTimestamp(10);
    auto after = oracle->GetTimestamp(1);
    ASSERT_TRUE(block.ok() && after.ok());
    EXPECT_EQ(*block, (Timestamp{1000, 0}));
    EXPECT_EQ(*after, (Timestamp{1000, 10}));
}

TEST_F(TimestampOracleTest, RejectsBadCount) {
    auto oracle = MakeOracle(FastOptions());
    election_.Elect();
    ASSERT_TRUE(oracle->SyncTimestamp().ok());
    EXPECT_TRUE(absl::IsInvalidArgument(oracle->GetTimestamp(0).status()));
    EXPECT_TRUE(absl::IsInvalidArgument(oracle->GetTimestamp(4097).status()));
    EXPECT_TRUE(oracle->GetTimestamp(4096).ok());
}

TEST_F(TimestampOracleTest, NotLeaderBeforeInitialization) {
    auto oracle = MakeOracle(FastOptions());
    EXPECT_TRUE(IsNotLeader(oracle->GetTimestamp(1).status()));
    // Not elected either
    EXPECT_TRUE(IsNotLeader(oracle->SyncTimestamp()));
}

TEST_F(TimestampOracleTest, ResumesAboveSavedWatermark) {
    store_.Put(kStream, 5000);
    clock_.Set(6000);
    auto oracle = MakeOracle(FastOptions());
    election_.Elect();
    ASSERT_TRUE(oracle->SyncTimestamp().ok());
    auto ts = oracle->GetTimestamp(1);
    ASSERT_TRUE(ts.ok());
    EXPECT_EQ(*ts, (Timestamp{6000, 0}));
    EXPECT_EQ(Watermark(), 9000);
}

TEST_F(TimestampOracleTest, ClockBehindWatermarkBeyondGapIsAnomaly) {
    store_.Put(kStream, 5000);
    clock_.Set(4000);
    TsoOptions options = FastOptions();
    options.max_reset_ts_gap = 100ms;
    auto oracle = MakeOracle(options);
    election_.Elect();

    auto start = std::chrono::steady_clock::now();
    absl::Status status = oracle->SyncTimestamp();
    auto waited = std::chrono::steady_clock::now() - start;
    EXPECT_TRUE(IsClockAnomaly(status)) << status;
    EXPECT_GE(waited, 100ms);
    EXPECT_FALSE(oracle->IsInitialized());
    // Nothing was persisted
    EXPECT_EQ(Watermark(), 5000);
}

TEST_F(TimestampOracleTest, WaitsForClockToCatchUp) {
    store_.Put(kStream, 5000);
    clock_.Set(4990);
    TsoOptions options = FastOptions();
    options.max_reset_ts_gap = 2s;
    auto oracle = MakeOracle(options);
    election_.Elect();

    std::thread ticker([this]() {
        for (int i = 0; i < 20; ++i) {
            std::this_thread::sleep_for(2ms);
            clock_.Advance(1);
        }
    });
    absl::Status status = oracle->SyncTimestamp();
    ticker.join();
    ASSERT_TRUE(status.ok()) << status;

    auto ts = oracle->GetTimestamp(1);
    ASSERT_TRUE(ts.ok());
    EXPECT_GE(ts->physical, 5000);
}

TEST_F(TimestampOracleTest, CatchUpWaitCancelledByReset) {
    store_.Put(kStream, 5000);
    TsoOptions options = FastOptions();
    options.max_reset_ts_gap = 10s;
    auto oracle = MakeOracle(options);
    election_.Elect();

    std::thread resetter([&oracle]() {
        std::this_thread::sleep_for(50ms);
        oracle->ResetTimestamp();
    });
    auto start = std::chrono::steady_clock::now();
    absl::Status status = oracle->SyncTimestamp();
    resetter.join();
    EXPECT_TRUE(IsNotLeader(status)) << status;
    EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);
}

TEST_F(TimestampOracleTest, CatchUpWaitAbandonedOnLeadershipLoss) {
    store_.Put(kStream, 5000);
    TsoOptions options = FastOptions();
    options.max_reset_ts_gap = 10s;
    auto oracle = MakeOracle(options);
    election_.Elect();

    std::thread deposer([this]() {
        std::this_thread::sleep_for(30ms);
        election_.Depose();
    });
    absl::Status status = oracle->SyncTimestamp();
    deposer.join();
    EXPECT_TRUE(IsNotLeader(status)) << status;
}

TEST_F(TimestampOracleTest, CatchUpWaitCancelledByCaller) {
    store_.Put(kStream, 5000);
    TsoOptions options = FastOptions();
    options.max_reset_ts_gap = 10s;
    auto oracle = MakeOracle(options);
    election_.Elect();

    std::atomic<bool> cancelled{false};
    std::thread canceller([&cancelled]() {
        std::this_thread::sleep_for(30ms);
        cancelled = true;
    });
    absl::Status status = oracle->SyncTimestamp([&cancelled]() { return cancelled.load(); });
    canceller.join();
    EXPECT_TRUE(absl::IsCancelled(status)) << status;
}

TEST_F(TimestampOracleTest, TickFollowsClock) {
    auto oracle = MakeOracle(FastOptions());
    election_.Elect();
    ASSERT_TRUE(oracle->SyncTimestamp().ok());
    ASSERT_TRUE(oracle->GetTimestamp(5).ok());

    clock_.Set(1020);
    ASSERT_TRUE(oracle->UpdateTimestamp().ok());
    EXPECT_EQ(*oracle->GetCurrent(), (Timestamp{1020, 0}));

    // Small backward step leaves physical alone
    clock_.Set(1010);
    ASSERT_TRUE(oracle->UpdateTimestamp().ok());
    EXPECT_EQ(oracle->GetCurrent()->physical, 1020);
}

TEST_F(TimestampOracleTest, WatermarkStaysAheadOfIssuedTimestamps) {
    auto oracle = MakeOracle(FastOptions());
    election_.Elect();
    ASSERT_TRUE(oracle->SyncTimestamp().ok());

    for (int i = 0; i < 20; ++i) {
        clock_.Advance(700);
        ASSERT_TRUE(oracle->UpdateTimestamp().ok());
        auto ts = oracle->GetTimestamp(1);
        ASSERT_TRUE(ts.ok());
        EXPECT_EQ(ts->physical, clock_.NowMs());
        EXPECT_LT(ts->physical, Watermark());
        EXPECT_EQ(oracle->SavedPhysical(), Watermark());
    }
}

TEST_F(TimestampOracleTest, ClockJumpBackwardIsAnomaly) {
    auto oracle = MakeOracle(FastOptions());
    election_.Elect();
    ASSERT_TRUE(oracle->SyncTimestamp().ok());
    clock_.Set(9000);
    ASSERT_TRUE(oracle->UpdateTimestamp().ok());

    clock_.Set(5000);
    absl::Status status = oracle->UpdateTimestamp();
    EXPECT_TRUE(IsClockAnomaly(status)) << status;
    EXPECT_FALSE(oracle->IsInitialized());
    EXPECT_TRUE(IsNotLeader(oracle->GetTimestamp(1).status()));
}

TEST_F(TimestampOracleTest, ForwardResetSurvivesTicks) {
    auto oracle = MakeOracle(FastOptions());
    election_.Elect();
    ASSERT_TRUE(oracle->SyncTimestamp().ok());
    ASSERT_TRUE(oracle->ResetUserTimestamp(Timestamp{10000, 0}, false, true).ok());

    // Cursor is far ahead of the clock on purpose, the clock itself only moved forward
    clock_.Set(1001);
    absl::Status status = oracle->UpdateTimestamp();
    ASSERT_TRUE(status.ok()) << status;
    EXPECT_TRUE(oracle->IsInitialized());
    EXPECT_EQ(*oracle->GetTimestamp(1), (Timestamp{10000, 1}));

    clock_.Set(5000);
    ASSERT_TRUE(oracle->UpdateTimestamp().ok());
    EXPECT_EQ(oracle->GetCurrent()->physical, 10000);

    // A real backward jump is still caught
    clock_.Set(1500);
    status = oracle->UpdateTimestamp();
    EXPECT_TRUE(IsClockAnomaly(status)) << status;
    EXPECT_FALSE(oracle->IsInitialized());
}

TEST_F(TimestampOracleTest, StalledClockBorrowsAfterForwardReset) {
    TsoOptions options = FastOptions();
    options.max_count_per_request = kMaxLogical / 2;
    auto oracle = MakeOracle(options);
    election_.Elect();
    ASSERT_TRUE(oracle->SyncTimestamp().ok());
    ASSERT_TRUE(oracle->ResetUserTimestamp(Timestamp{10000, 0}, false, true).ok());

    ASSERT_TRUE(oracle->GetTimestamp(kMaxLogical / 2).ok());
    auto ts = oracle->GetTimestamp(kMaxLogical / 2);
    ASSERT_TRUE(ts.ok()) << ts.status();
    EXPECT_EQ(*ts, (Timestamp{10001, 0}));
}

TEST_F(TimestampOracleTest, LogicalCeilingMovesToNewClock) {
    TsoOptions options = FastOptions();
    options.max_count_per_request = kMaxLogical / 2;
    auto oracle = MakeOracle(options);
    election_.Elect();
    ASSERT_TRUE(oracle->SyncTimestamp().ok());

    ASSERT_TRUE(oracle->GetTimestamp(kMaxLogical / 2).ok());
    auto upper = oracle->GetTimestamp(kMaxLogical / 2);
    ASSERT_TRUE(upper.ok());
    EXPECT_EQ(*upper, (Timestamp{1000, kMaxLogical / 2}));

    clock_.Set(1500);
    auto ts = oracle->GetTimestamp(1);
    ASSERT_TRUE(ts.ok());
    EXPECT_EQ(*ts, (Timestamp{1500, 0}));
}

TEST_F(TimestampOracleTest, LogicalCeilingBumpsStalledClock) {
    TsoOptions options = FastOptions();
    options.max_count_per_request = kMaxLogical / 2;
    auto oracle = MakeOracle(options);
    election_.Elect();
    ASSERT_TRUE(oracle->SyncTimestamp().ok());

    ASSERT_TRUE(oracle->GetTimestamp(kMaxLogical / 2).ok());
    ASSERT_TRUE(oracle->GetTimestamp(kMaxLogical / 2).ok());

    // Clock never moves; after one tick interval physical is borrowed
    auto ts = oracle->GetTimestamp(1);
    ASSERT_TRUE(ts.ok()) << ts.status();
    EXPECT_EQ(*ts, (Timestamp{1001, 0}));
}

class BlockedAllocationTest : public TimestampOracleTest {
protected:
    // Watermark two milliseconds ahead: one borrowed millisecond, then nothing
    void ExhaustUpToWatermark(const TsoOptions& base) {
        TsoOptions options = base;
        options.persist_margin = 2ms;
        options.max_count_per_request = kMaxLogical / 2;
        oracle_ = MakeOracle(options);
        election_.Elect();
        ASSERT_TRUE(oracle_->SyncTimestamp().ok());
        ASSERT_EQ(oracle_->SavedPhysical(), 1002);
        for (int i = 0; i < 4; ++i) {
            auto ts = oracle_->GetTimestamp(kMaxLogical / 2);
            ASSERT_TRUE(ts.ok()) << ts.status();
            EXPECT_LT(ts->physical, 1002);
        }
    }

    std::unique_ptr<TimestampOracle> oracle_;
};

TEST_F(BlockedAllocationTest, ResetWakesBlockedAllocation) {
    TsoOptions options = FastOptions();
    options.max_reset_ts_gap = 10s;
    ExhaustUpToWatermark(options);

    std::thread resetter([this]() {
        std::this_thread::sleep_for(50ms);
        oracle_->ResetTimestamp();
    });
    auto ts = oracle_->GetTimestamp(1);
    resetter.join();
    EXPECT_TRUE(IsNotLeader(ts.status())) << ts.status();
}

TEST_F(BlockedAllocationTest, ReinitializationKeepsNewCursor) {
    TsoOptions options = FastOptions();
    options.max_reset_ts_gap = 200ms;
    ExhaustUpToWatermark(options);

    absl::StatusOr<Timestamp> blocked;
    std::thread waiter([this, &blocked]() { blocked = oracle_->GetTimestamp(1); });
    std::this_thread::sleep_for(30ms);
    oracle_->ResetTimestamp();
    clock_.Set(1100);
    ASSERT_TRUE(oracle_->SyncTimestamp().ok());
    waiter.join();

    if (!blocked.ok()) {
        EXPECT_TRUE(IsNotLeader(blocked.status())) << blocked.status();
    }
    // The waiter's bound has long expired; it must not have touched the new cursor
    std::this_thread::sleep_for(250ms);
    EXPECT_TRUE(oracle_->IsInitialized());
    auto ts = oracle_->GetTimestamp(1);
    ASSERT_TRUE(ts.ok()) << ts.status();
    EXPECT_GE(ts->physical, 1100);
}

TEST_F(BlockedAllocationTest, CallerCancellation) {
    TsoOptions options = FastOptions();
    options.max_reset_ts_gap = 10s;
    ExhaustUpToWatermark(options);

    std::atomic<bool> cancelled{false};
    std::thread canceller([&cancelled]() {
        std::this_thread::sleep_for(30ms);
        cancelled = true;
    });
    auto ts = oracle_->GetTimestamp(1, [&cancelled]() { return cancelled.load(); });
    canceller.join();
    EXPECT_TRUE(absl::IsCancelled(ts.status())) << ts.status();
    // Still serving once time moves
    EXPECT_TRUE(oracle_->IsInitialized());
}

TEST_F(BlockedAllocationTest, BoundedWaitIsAnomaly) {
    TsoOptions options = FastOptions();
    options.max_reset_ts_gap = 50ms;
    ExhaustUpToWatermark(options);

    auto ts = oracle_->GetTimestamp(1);
    EXPECT_TRUE(IsClockAnomaly(ts.status())) << ts.status();
    EXPECT_FALSE(oracle_->IsInitialized());
}

TEST_F(BlockedAllocationTest, TickUnblocksAllocation) {
    TsoOptions options = FastOptions();
    options.max_reset_ts_gap = 10s;
    ExhaustUpToWatermark(options);

    std::thread ticker([this]() {
        std::this_thread::sleep_for(20ms);
        clock_.Set(1100);
        ASSERT_TRUE(oracle_->UpdateTimestamp().ok());
    });
    auto ts = oracle_->GetTimestamp(1);
    ticker.join();
    ASSERT_TRUE(ts.ok()) << ts.status();
    EXPECT_EQ(*ts, (Timestamp{1100, 0}));
}

TEST_F(TimestampOracleTest, ConcurrentAllocationsNeverOverlap) {
    auto oracle = MakeOracle(FastOptions());
    election_.Elect();
    ASSERT_TRUE(oracle->SyncTimestamp().ok());

    struct Block {
        Timestamp ts;
        int64_t count;
    };
    constexpr int kThreads = 8;
    constexpr int kPerThread = 2000;
    std::vector<std::vector<Block>> results(kThreads);
    std::atomic<bool> done{false};

    std::thread ticker([&]() {
        while (!done) {
            clock_.Advance(1);
            EXPECT_TRUE(oracle->UpdateTimestamp().ok());
            std::this_thread::sleep_for(100us);
        }
    });
    std::vector<std::thread> workers;
    for (int t = 0; t < kThreads; ++t) {
        workers.emplace_back([&, t]() {
            for (int i = 0; i < kPerThread; ++i) {
                int64_t count = 1 + (i % 3);
                auto ts = oracle->GetTimestamp(count);
                ASSERT_TRUE(ts.ok()) << ts.status();
                results[t].push_back(Block{*ts, count});
            }
        });
    }
    for (auto& w : workers) w.join();
    done = true;
    ticker.join();

    std::vector<Block> all;
    for (const auto& per_thread : results) {
        for (size_t i = 1; i < per_thread.size(); ++i) {
            EXPECT_GT(per_thread[i].ts, per_thread[i - 1].ts);
        }
        all.insert(all.end(), per_thread.begin(), per_thread.end());
    }
    std::sort(all.begin(), all.end(), [](const Block& a, const Block& b) { return a.ts < b.ts; });
    for (size_t i = 1; i < all.size(); ++i) {
        const Block& prev = all[i - 1];
        if (all[i].ts.physical == prev.ts.physical) {
            EXPECT_GE(all[i].ts.logical, prev.ts.logical + prev.count);
        }
        EXPECT_LT(all[i].ts.logical + all[i].count, kMaxLogical + 1);
    }
}

TEST_F(TimestampOracleTest, NewEpochInvalidatesOldCursor) {
    auto oracle = MakeOracle(FastOptions());
    election_.Elect();
    ASSERT_TRUE(oracle->SyncTimestamp().ok());
    auto before = oracle->GetTimestamp(1);
    ASSERT_TRUE(before.ok());

    election_.Elect();
    EXPECT_TRUE(IsNotLeader(oracle->GetTimestamp(1).status()));
    EXPECT_TRUE(IsNotLeader(oracle->UpdateTimestamp()));

    // Re-initialization waits for the clock to pass the old watermark
    clock_.Set(4000);
    ASSERT_TRUE(oracle->SyncTimestamp().ok());
    auto after = oracle->GetTimestamp(1);
    ASSERT_TRUE(after.ok());
    EXPECT_GT(*after, *before);
}

TEST_F(TimestampOracleTest, HandoverToAnotherProcess) {
    auto a = MakeOracle(FastOptions());
    election_.Elect();
    ASSERT_TRUE(a->SyncTimestamp().ok());
    Timestamp last_a;
    for (int i = 0; i < 100; ++i) {
        auto ts = a->GetTimestamp(1);
        ASSERT_TRUE(ts.ok());
        last_a = *ts;
    }

    // Second process, same store, its clock already past A's watermark
    LocalElection election_b("member-2");
    LeadershipGuard guard_b(&election_b);
    ManualClock clock_b(4100);
    TimestampOracle b(kStream, FastOptions(), &store_, &guard_b, &clock_b);
    election_b.Elect();
    ASSERT_TRUE(b.SyncTimestamp().ok());
    auto first_b = b.GetTimestamp(1);
    ASSERT_TRUE(first_b.ok());
    EXPECT_GT(*first_b, last_a);

    // A never heard it lost; its next persist loses the CAS
    clock_.Set(3999);
    absl::Status status = a->UpdateTimestamp();
    EXPECT_TRUE(IsVersionConflict(status)) << status;
    EXPECT_FALSE(a->IsInitialized());
    EXPECT_TRUE(IsNotLeader(a->GetTimestamp(1).status()));
}

TEST_F(TimestampOracleTest, ConflictDuringInitialization) {
    NiceMock<MockCheckpointStore> store;
    store.DelegateTo(&store_);
    EXPECT_CALL(store, Load(_)).WillOnce(Return(Checkpoint{500, 4}));
    EXPECT_CALL(store, Save(_, _, 4u)).WillOnce(Return(absl::AbortedError("version mismatch")));

    auto oracle = MakeOracle(FastOptions(), &store);
    election_.Elect();
    EXPECT_TRUE(IsVersionConflict(oracle->SyncTimestamp()));
    EXPECT_FALSE(oracle->IsInitialized());
}

TEST_F(TimestampOracleTest, InitializationRetriesUnavailableStore) {
    NiceMock<MockCheckpointStore> store;
    store.DelegateTo(&store_);
    EXPECT_CALL(store, Load(_))
        .WillOnce(Return(absl::UnavailableError("store down")))
        .WillOnce(Return(absl::NotFoundError("no checkpoint")));
    EXPECT_CALL(store, Save(_, 4000, kNoCheckpointVersion))
        .Times(3)
        .WillRepeatedly(Return(absl::UnavailableError("store down")));

    auto oracle = MakeOracle(FastOptions(), &store);
    election_.Elect();
    absl::Status status = oracle->SyncTimestamp();
    EXPECT_TRUE(absl::IsUnavailable(status)) << status;
    EXPECT_FALSE(oracle->IsInitialized());
}

TEST_F(TimestampOracleTest, TickPersistFailureEscalates) {
    NiceMock<MockCheckpointStore> store;
    store.DelegateTo(&store_);
    TsoOptions options = FastOptions();
    options.save_interval = 30ms;
    options.persist_margin = 10ms;
    auto oracle = MakeOracle(options, &store);
    election_.Elect();
    ASSERT_TRUE(oracle->SyncTimestamp().ok());
    ASSERT_EQ(oracle->SavedPhysical(), 1010);

    ON_CALL(store, Save(_, _, _)).WillByDefault(Return(absl::UnavailableError("store down")));

    // Clock runs past the watermark; the cursor is held below it
    clock_.Set(1050);
    absl::Status status = oracle->UpdateTimestamp();
    EXPECT_TRUE(absl::IsUnavailable(status)) << status;
    ASSERT_TRUE(oracle->IsInitialized());
    EXPECT_EQ(oracle->GetCurrent()->physical, 1009);
    auto ts = oracle->GetTimestamp(1);
    ASSERT_TRUE(ts.ok());
    EXPECT_LT(ts->physical, 1010);

    std::this_thread::sleep_for(40ms);
    status = oracle->UpdateTimestamp();
    EXPECT_TRUE(IsClockAnomaly(status)) << status;
    EXPECT_FALSE(oracle->IsInitialized());
}

TEST_F(TimestampOracleTest, TickRecoversWhenStoreReturns) {
    NiceMock<MockCheckpointStore> store;
    store.DelegateTo(&store_);
    TsoOptions options = FastOptions();
    options.persist_margin = 10ms;
    auto oracle = MakeOracle(options, &store);
    election_.Elect();
    ASSERT_TRUE(oracle->SyncTimestamp().ok());

    EXPECT_CALL(store, Save(_, _, _))
        .WillOnce(Return(absl::UnavailableError("blip")))
        .WillRepeatedly(Invoke(&store_, &MemoryCheckpointStore::Save));
    clock_.Set(1050);
    ASSERT_TRUE(oracle->UpdateTimestamp().ok());
    EXPECT_EQ(oracle->GetCurrent()->physical, 1050);
    EXPECT_EQ(oracle->SavedPhysical(), 1060);
}

TEST_F(TimestampOracleTest, AdvancePhysical) {
    auto oracle = MakeOracle(FastOptions());
    election_.Elect();
    ASSERT_TRUE(oracle->SyncTimestamp().ok());
    ASSERT_TRUE(oracle->GetTimestamp(3).ok());

    // Never backward
    ASSERT_TRUE(oracle->AdvancePhysical(900).ok());
    EXPECT_EQ(*oracle->GetCurrent(), (Timestamp{1000, 3}));

    ASSERT_TRUE(oracle->AdvancePhysical(1500).ok());
    EXPECT_EQ(*oracle->GetCurrent(), (Timestamp{1500, 0}));

    // Past the watermark it is persisted first
    ASSERT_TRUE(oracle->AdvancePhysical(8000).ok());
    EXPECT_EQ(*oracle->GetCurrent(), (Timestamp{8000, 0}));
    EXPECT_EQ(Watermark(), 11000);
}

TEST_F(TimestampOracleTest, ResetUserTimestamp) {
    auto oracle = MakeOracle(FastOptions());
    election_.Elect();
    ASSERT_TRUE(oracle->SyncTimestamp().ok());

    ASSERT_TRUE(oracle->ResetUserTimestamp(Timestamp{2000, 5}, false, false).ok());
    EXPECT_EQ(*oracle->GetTimestamp(1), (Timestamp{2000, 6}));

    EXPECT_TRUE(absl::IsInvalidArgument(oracle->ResetUserTimestamp(Timestamp{1500, 0}, false, false)));
    EXPECT_TRUE(oracle->ResetUserTimestamp(Timestamp{1500, 0}, true, false).ok());
    EXPECT_EQ(*oracle->GetTimestamp(1), (Timestamp{2000, 7}));

    EXPECT_TRUE(absl::IsInvalidArgument(oracle->ResetUserTimestamp(Timestamp{10000, 0}, false, false)));
    ASSERT_TRUE(oracle->ResetUserTimestamp(Timestamp{10000, 0}, false, true).ok());
    EXPECT_EQ(*oracle->GetTimestamp(1), (Timestamp{10000, 1}));
    EXPECT_EQ(Watermark(), 13000);

    EXPECT_TRUE(absl::IsInvalidArgument(oracle->ResetUserTimestamp(Timestamp{20000, kMaxLogical}, false, true)));
}
