#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"

namespace Meridian {

/// Version of a stream that has never been saved
inline constexpr uint64_t kNoCheckpointVersion = 0;

struct Checkpoint {
	/// Upper bound of every physical value ever issued on the stream
	int64_t saved_physical = 0;
	uint64_t version = kNoCheckpointVersion;
};

/**
 * Durable "last saved timestamp" per stream on a linearizable store.
 * All mutation is compare-and-swap against the version last read.
 */
class CheckpointStore {
public:
	virtual ~CheckpointStore() = default;

	/// kNotFound when the stream has never been saved, kUnavailable on transient failures
	virtual absl::StatusOr<Checkpoint> Load(const std::string& stream_id) = 0;

	/// Stores `saved_physical` only if the current version equals `expected_version`
	/// (kNoCheckpointVersion for a stream that does not exist yet). Returns the new
	/// version, kAborted on a version mismatch, kUnavailable on transient failures.
	virtual absl::StatusOr<uint64_t> Save(const std::string& stream_id, int64_t saved_physical,
			uint64_t expected_version) = 0;
};

/// Builds a store from a backend URL: "memory://" or "file://<directory>"
absl::StatusOr<std::unique_ptr<CheckpointStore>> OpenCheckpointStore(const std::string& endpoint);

} // namespace Meridian
