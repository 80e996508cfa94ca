#include "local_allocator.h"

#include <utility>

#include <glog/logging.h>

namespace Meridian {

LocalTsoAllocator::LocalTsoAllocator(std::string region, const TsoOptions& options,
		CheckpointStore* store, LeadershipGuard* guard, Clock* clock)
	: region_(std::move(region)),
	  oracle_(LocalStreamId(region_), options, store, guard, clock) {}

absl::Status LocalTsoAllocator::Initialize(const CancelCheck& cancelled) {
	absl::Status status = oracle_.SyncTimestamp(cancelled);
	if (!status.ok()) {
		LOG(ERROR) << "[LocalTsoAllocator:" << region_ << "] Initialization failed: " << status;
	}
	return status;
}

bool LocalTsoAllocator::IsInitialized() const {
	return oracle_.IsInitialized();
}

absl::Status LocalTsoAllocator::UpdateTimestamp() {
	return oracle_.UpdateTimestamp();
}

absl::StatusOr<Timestamp> LocalTsoAllocator::GenerateTimestamp(int64_t count, const CancelCheck& cancelled) {
	return oracle_.GetTimestamp(count, cancelled);
}

absl::Status LocalTsoAllocator::ResetUserTimestamp(const Timestamp& ts, bool ignore_smaller,
		bool skip_upper_bound_check) {
	return oracle_.ResetUserTimestamp(ts, ignore_smaller, skip_upper_bound_check);
}

absl::StatusOr<Timestamp> LocalTsoAllocator::GetCurrent() const {
	return oracle_.GetCurrent();
}

void LocalTsoAllocator::Reset() {
	oracle_.ResetTimestamp();
}

absl::Status LocalTsoAllocator::SyncWithGlobal(int64_t global_physical) {
	return oracle_.AdvancePhysical(global_physical);
}

} // namespace Meridian
