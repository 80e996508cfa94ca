#ifndef MERIDIAN_TSO_TIMESTAMP_ORACLE_H_
#define MERIDIAN_TSO_TIMESTAMP_ORACLE_H_

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/synchronization/mutex.h"

#include "common/cancellation.h"
#include "common/clock.h"
#include "election/leadership_guard.h"
#include "storage/checkpoint_store.h"
#include "timestamp.h"
#include "tso_options.h"

namespace Meridian {

/**
 * The (physical, logical) cursor of one timestamp stream and the protocol that
 * keeps it monotonic across restarts and leaders.
 *
 * Invariant: while the cursor is valid, every physical value it can hand out is
 * strictly below the watermark persisted in the CheckpointStore.
 *
 * Two locks:
 *  - mu_ guards the cursor; only arithmetic happens under it.
 *  - persist_mu_ serializes everything that writes the checkpoint (init, tick,
 *    advance, reset). Store I/O happens with persist_mu_ held and mu_ released.
 */
class TimestampOracle {
public:
	TimestampOracle(std::string stream_id, const TsoOptions& options, CheckpointStore* store,
			LeadershipGuard* guard, Clock* clock);

	TimestampOracle(const TimestampOracle&) = delete;
	TimestampOracle& operator=(const TimestampOracle&) = delete;

	/// Loads the checkpoint, waits for the clock to pass it, seeds the cursor and
	/// persists a new watermark. Must succeed before GetTimestamp is served.
	absl::Status SyncTimestamp(const CancelCheck& cancelled = nullptr);

	/// Periodic tick: moves physical forward with the wall clock and keeps the
	/// watermark ahead of it.
	absl::Status UpdateTimestamp();

	/// Reserves `count` consecutive timestamps and returns the first one.
	absl::StatusOr<Timestamp> GetTimestamp(int64_t count, const CancelCheck& cancelled = nullptr);

	/// Moves physical to at least `physical`, resetting logical when it moves.
	absl::Status AdvancePhysical(int64_t physical);

	/// Moves the cursor forward so that every later timestamp is greater than `ts`.
	absl::Status ResetUserTimestamp(const Timestamp& ts, bool ignore_smaller, bool skip_upper_bound_check);

	/// Invalidates the cursor and cancels any blocked wait. Safe from any thread.
	void ResetTimestamp();

	bool IsInitialized() const;

	/// The next timestamp that would be issued
	absl::StatusOr<Timestamp> GetCurrent() const;

	/// Watermark of the last successful persist, 0 when invalid
	int64_t SavedPhysical() const;

	const std::string& stream_id() const { return stream_id_; }

private:
	using SteadyTime = std::chrono::steady_clock::time_point;

	struct Cursor {
		int64_t physical = 0;
		int64_t logical = 0;
		/// Physical should have moved by then; past it a stalled clock is assumed
		SteadyTime update_deadline{};
		/// Highest wall clock reading seen by this cursor
		int64_t last_now = 0;
		/// Physical set by a reset or a sync; borrowing is measured from here when it is ahead of the clock
		int64_t floor_physical = 0;
		int64_t saved_physical = 0;
		uint64_t version = kNoCheckpointVersion;
		uint64_t epoch = 0;
		bool valid = false;
	};

	void AdvanceLocked(int64_t physical) ABSL_EXCLUSIVE_LOCKS_REQUIRED(mu_);
	void InvalidateLocked(const char* reason) ABSL_EXCLUSIVE_LOCKS_REQUIRED(mu_);

	/// Snapshot of a valid cursor owned by the current leadership term,
	/// optionally with the cancellation token of that cursor
	absl::StatusOr<Cursor> LeaderSnapshot(std::shared_ptr<Cancellation>* token = nullptr) const;

	/// Persists `saved_physical`, retrying transient store failures.
	/// Requires persist_mu_.
	absl::StatusOr<uint64_t> SaveWithRetry(int64_t saved_physical, uint64_t version,
			const std::shared_ptr<Cancellation>& token);
	absl::StatusOr<Checkpoint> LoadWithRetry(const std::shared_ptr<Cancellation>& token);

	/// Publishes a persisted watermark if the cursor still belongs to `epoch`
	bool CommitWatermark(uint64_t epoch, int64_t saved_physical, uint64_t version);

	/// Records a failed tick persist; returns ClockAnomaly once failures outlast the save interval
	absl::Status OnPersistFailure(const absl::Status& status);

	const std::string stream_id_;
	const TsoOptions options_;
	CheckpointStore* store_;
	LeadershipGuard* guard_;
	Clock* clock_;

	mutable absl::Mutex mu_;
	Cursor cursor_ ABSL_GUARDED_BY(mu_);
	std::shared_ptr<Cancellation> cancel_ ABSL_GUARDED_BY(mu_);

	std::mutex persist_mu_;
	std::optional<SteadyTime> first_persist_failure_;
};

} // namespace Meridian

#endif // MERIDIAN_TSO_TIMESTAMP_ORACLE_H_
