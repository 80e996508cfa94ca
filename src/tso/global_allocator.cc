#include "global_allocator.h"

#include <glog/logging.h>

namespace Meridian {

GlobalTsoAllocator::GlobalTsoAllocator(const TsoOptions& options, CheckpointStore* store,
		LeadershipGuard* guard, Clock* clock)
	: oracle_(GlobalStreamId(), options, store, guard, clock) {}

absl::Status GlobalTsoAllocator::Initialize(const CancelCheck& cancelled) {
	absl::Status status = oracle_.SyncTimestamp(cancelled);
	if (!status.ok()) {
		LOG(ERROR) << "[GlobalTsoAllocator] Initialization failed: " << status;
	}
	return status;
}

bool GlobalTsoAllocator::IsInitialized() const {
	return oracle_.IsInitialized();
}

absl::Status GlobalTsoAllocator::UpdateTimestamp() {
	return oracle_.UpdateTimestamp();
}

absl::StatusOr<Timestamp> GlobalTsoAllocator::GenerateTimestamp(int64_t count, const CancelCheck& cancelled) {
	return oracle_.GetTimestamp(count, cancelled);
}

absl::Status GlobalTsoAllocator::ResetUserTimestamp(const Timestamp& ts, bool ignore_smaller,
		bool skip_upper_bound_check) {
	return oracle_.ResetUserTimestamp(ts, ignore_smaller, skip_upper_bound_check);
}

absl::StatusOr<Timestamp> GlobalTsoAllocator::GetCurrent() const {
	return oracle_.GetCurrent();
}

void GlobalTsoAllocator::Reset() {
	oracle_.ResetTimestamp();
}

} // namespace Meridian
