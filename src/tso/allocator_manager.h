#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/synchronization/mutex.h"

#include "common/cancellation.h"
#include "common/clock.h"
#include "election/leadership_guard.h"
#include "storage/checkpoint_store.h"
#include "global_allocator.h"
#include "local_allocator.h"

namespace Meridian {

/**
 * Owns the global allocator and the per-region local allocators, binds them
 * to leadership and runs the periodic tick.
 *
 * On election every allocator is initialized (global first) before it serves;
 * on deposition all of them are reset before the guard callback returns.
 * Errors that make the watermark untrustworthy resign leadership.
 *
 * Registers callbacks on `guard` for its whole lifetime, so it must outlive
 * any election notification.
 */
class AllocatorManager {
public:
	AllocatorManager(const TsoOptions& options, bool enable_local_tso,
			const std::vector<std::string>& local_regions, CheckpointStore* store,
			LeadershipGuard* guard, Clock* clock);
	~AllocatorManager();

	AllocatorManager(const AllocatorManager&) = delete;
	AllocatorManager& operator=(const AllocatorManager&) = delete;

	/// Starts the tick thread
	void Start();
	void Stop();

	/// Allocates `count` timestamps from the stream named by `stream_key`.
	/// "" and "global" select the global stream, anything else a region.
	absl::StatusOr<Timestamp> HandleRequest(const std::string& stream_key, int64_t count,
			const CancelCheck& cancelled = nullptr);

	absl::Status ResetUserTimestamp(const std::string& stream_key, const Timestamp& ts,
			bool ignore_smaller, bool skip_upper_bound_check);

	absl::StatusOr<ITimestampAllocator*> GetAllocator(const std::string& stream_key) const;

	/// True once the stream's allocator finished initialization under the current leadership
	bool IsReady(const std::string& stream_key) const;

	/// False while leading with any allocator not initialized
	bool IsHealthy() const;

	/// Pulls every local stream up to the global physical time
	absl::Status SyncLocalAllocators();

	/// One tick: update every allocator, then sync the local ones
	void Tick();

	bool enable_local_tso() const { return enable_local_tso_; }

private:
	void OnElected(uint64_t epoch);
	void OnDeposed(uint64_t epoch);

	/// Resigns when `status` means the watermark can no longer be vouched for.
	/// Returns the error to hand to callers: NotLeader after a resignation.
	absl::Status HandleFailure(const std::string& stream_id, const absl::Status& status);

	std::vector<ITimestampAllocator*> AllAllocators() const;

	const TsoOptions options_;
	const bool enable_local_tso_;
	LeadershipGuard* guard_;

	std::unique_ptr<GlobalTsoAllocator> global_;
	absl::flat_hash_map<std::string, std::unique_ptr<LocalTsoAllocator>> locals_;

	absl::Mutex tick_mu_;
	std::thread tick_thread_;
	std::shared_ptr<Cancellation> stop_ ABSL_GUARDED_BY(tick_mu_);
};

} // namespace Meridian
