#pragma once

#include <cstdint>
#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"

#include "common/cancellation.h"
#include "timestamp.h"

namespace Meridian {

inline std::string GlobalStreamId() {
	return "global/timestamp";
}

inline std::string LocalStreamId(const std::string& region) {
	return "local/" + region + "/timestamp";
}

/**
 * Interface for one timestamp stream served by this process
 */
class ITimestampAllocator {
public:
	virtual ~ITimestampAllocator() = default;

	/// Stream id in the checkpoint store, e.g. "global/timestamp"
	virtual const std::string& GetStreamId() const = 0;

	virtual absl::Status Initialize(const CancelCheck& cancelled) = 0;
	virtual bool IsInitialized() const = 0;
	virtual absl::Status UpdateTimestamp() = 0;
	virtual absl::StatusOr<Timestamp> GenerateTimestamp(int64_t count, const CancelCheck& cancelled) = 0;
	virtual absl::Status ResetUserTimestamp(const Timestamp& ts, bool ignore_smaller, bool skip_upper_bound_check) = 0;
	virtual absl::StatusOr<Timestamp> GetCurrent() const = 0;
	virtual void Reset() = 0;
};

} // namespace Meridian
