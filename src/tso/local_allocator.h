#pragma once

#include <string>

#include "allocator.h"
#include "timestamp_oracle.h"

namespace Meridian {

/**
 * Allocator of one region's timestamp stream. It keeps its own checkpoint and
 * is pulled forward to the global stream by SyncWithGlobal.
 */
class LocalTsoAllocator : public ITimestampAllocator {
public:
	LocalTsoAllocator(std::string region, const TsoOptions& options, CheckpointStore* store,
			LeadershipGuard* guard, Clock* clock);

	const std::string& GetStreamId() const override { return oracle_.stream_id(); }
	const std::string& region() const { return region_; }

	absl::Status Initialize(const CancelCheck& cancelled) override;
	bool IsInitialized() const override;
	absl::Status UpdateTimestamp() override;
	absl::StatusOr<Timestamp> GenerateTimestamp(int64_t count, const CancelCheck& cancelled) override;
	absl::Status ResetUserTimestamp(const Timestamp& ts, bool ignore_smaller, bool skip_upper_bound_check) override;
	absl::StatusOr<Timestamp> GetCurrent() const override;
	void Reset() override;

	/// Moves this stream's physical up to `global_physical` if it is behind
	absl::Status SyncWithGlobal(int64_t global_physical);

private:
	const std::string region_;
	TimestampOracle oracle_;
};

} // namespace Meridian
