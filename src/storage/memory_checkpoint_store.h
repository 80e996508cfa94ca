#pragma once

#include <string>

#include "absl/container/flat_hash_map.h"
#include "absl/synchronization/mutex.h"
#include "checkpoint_store.h"

namespace Meridian {

/**
 * Process-local checkpoint store. Several allocators sharing one instance
 * behave like several processes sharing one metadata store.
 */
class MemoryCheckpointStore : public CheckpointStore {
public:
	MemoryCheckpointStore() = default;

	absl::StatusOr<Checkpoint> Load(const std::string& stream_id) override;
	absl::StatusOr<uint64_t> Save(const std::string& stream_id, int64_t saved_physical,
			uint64_t expected_version) override;

	/// Unconditional write, used to plant state in tests
	void Put(const std::string& stream_id, int64_t saved_physical);

private:
	absl::Mutex mutex_;
	absl::flat_hash_map<std::string, Checkpoint> checkpoints_ ABSL_GUARDED_BY(mutex_);
};

} // namespace Meridian
