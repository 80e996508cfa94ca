#ifndef MERIDIAN_COMMON_STATUS_H_
#define MERIDIAN_COMMON_STATUS_H_

#include "absl/strings/string_view.h"
#include "absl/status/status.h"

namespace Meridian {

// Error taxonomy of the timestamp oracle on top of absl::Status codes.
//
//   NotLeader        kFailedPrecondition  caller must re-resolve the leader
//   VersionConflict  kAborted             another process saved the checkpoint
//   ClockAnomaly     kInternal            wall clock unusable, leadership must be given up
//
// Transient store failures use kUnavailable and a missing checkpoint kNotFound.

inline absl::Status NotLeaderError(absl::string_view msg) {
	return absl::FailedPreconditionError(msg);
}

inline absl::Status VersionConflictError(absl::string_view msg) {
	return absl::AbortedError(msg);
}

inline absl::Status ClockAnomalyError(absl::string_view msg) {
	return absl::InternalError(msg);
}

inline bool IsNotLeader(const absl::Status& s) {
	return s.code() == absl::StatusCode::kFailedPrecondition;
}

inline bool IsVersionConflict(const absl::Status& s) {
	return s.code() == absl::StatusCode::kAborted;
}

inline bool IsClockAnomaly(const absl::Status& s) {
	return s.code() == absl::StatusCode::kInternal;
}

// Errors after which this process can no longer vouch for its watermark.
inline bool RequiresResignation(const absl::Status& s) {
	return IsVersionConflict(s) || IsClockAnomaly(s);
}

} // namespace Meridian

#endif // MERIDIAN_COMMON_STATUS_H_
