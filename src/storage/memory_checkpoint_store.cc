#include "memory_checkpoint_store.h"

#include <glog/logging.h>

namespace Meridian {

absl::StatusOr<Checkpoint> MemoryCheckpointStore::Load(const std::string& stream_id) {
	absl::MutexLock lock(&mutex_);
	auto it = checkpoints_.find(stream_id);
	if (it == checkpoints_.end()) {
		return absl::NotFoundError("no checkpoint for stream " + stream_id);
	}
	return it->second;
}

absl::StatusOr<uint64_t> MemoryCheckpointStore::Save(const std::string& stream_id,
		int64_t saved_physical, uint64_t expected_version) {
	absl::MutexLock lock(&mutex_);
	auto it = checkpoints_.find(stream_id);
	uint64_t current = (it == checkpoints_.end()) ? kNoCheckpointVersion : it->second.version;
	if (current != expected_version) {
		VLOG(2) << "Checkpoint CAS failed for " << stream_id << " expected:" << expected_version
			<< " current:" << current;
		return absl::AbortedError("checkpoint version mismatch for stream " + stream_id);
	}
	Checkpoint& cp = checkpoints_[stream_id];
	cp.saved_physical = saved_physical;
	cp.version = current + 1;
	return cp.version;
}

void MemoryCheckpointStore::Put(const std::string& stream_id, int64_t saved_physical) {
	absl::MutexLock lock(&mutex_);
	Checkpoint& cp = checkpoints_[stream_id];
	cp.saved_physical = saved_physical;
	cp.version++;
}

} // namespace Meridian
