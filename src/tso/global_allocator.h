#pragma once

#include <string>

#include "allocator.h"
#include "timestamp_oracle.h"

namespace Meridian {

/**
 * Allocator of the cluster-wide timestamp stream
 */
class GlobalTsoAllocator : public ITimestampAllocator {
public:
	GlobalTsoAllocator(const TsoOptions& options, CheckpointStore* store,
			LeadershipGuard* guard, Clock* clock);

	const std::string& GetStreamId() const override { return oracle_.stream_id(); }

	absl::Status Initialize(const CancelCheck& cancelled) override;
	bool IsInitialized() const override;
	absl::Status UpdateTimestamp() override;
	absl::StatusOr<Timestamp> GenerateTimestamp(int64_t count, const CancelCheck& cancelled) override;
	absl::Status ResetUserTimestamp(const Timestamp& ts, bool ignore_smaller, bool skip_upper_bound_check) override;
	absl::StatusOr<Timestamp> GetCurrent() const override;
	void Reset() override;

private:
	TimestampOracle oracle_;
};

} // namespace Meridian
