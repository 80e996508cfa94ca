#pragma once

#include <string>

#include "checkpoint_store.h"

namespace Meridian {

/**
 * Checkpoint store on a local directory, one file per stream.
 *
 * Compare-and-swap runs under an exclusive flock on a per-stream lock file, so
 * every process on the host sharing the directory sees linearizable saves. The
 * new value is written to a temporary file, fsync'ed and renamed over the old
 * one; a crash leaves either the old or the new checkpoint, never a torn one.
 */
class FileCheckpointStore : public CheckpointStore {
public:
	explicit FileCheckpointStore(std::string directory);

	/// Creates the directory if needed
	absl::Status Open();

	absl::StatusOr<Checkpoint> Load(const std::string& stream_id) override;
	absl::StatusOr<uint64_t> Save(const std::string& stream_id, int64_t saved_physical,
			uint64_t expected_version) override;

	const std::string& directory() const { return directory_; }

private:
	std::string PathFor(const std::string& stream_id) const;

	/// Reads the checkpoint file; the caller holds the stream lock
	absl::StatusOr<Checkpoint> ReadLocked(const std::string& path) const;

	std::string directory_;
};

} // namespace Meridian
