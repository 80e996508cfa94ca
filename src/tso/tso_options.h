#pragma once

#include <chrono>
#include <cstdint>

#include "common/configuration.h"

namespace Meridian {

/**
 * Tuning of one timestamp stream, resolved from MeridianConfig::Tso.
 * Durations are kept at microsecond precision; the physical clock is in ms.
 */
struct TsoOptions {
	/// Tick period, already clamped into [1ms, 10s]
	std::chrono::microseconds update_physical_interval{std::chrono::milliseconds(tso_update_physical_interval_ms)};
	std::chrono::microseconds save_interval{std::chrono::milliseconds(tso_save_interval_ms)};
	/// Bound on the clock catch-up wait and on how far the cursor may run ahead of the clock
	std::chrono::microseconds max_reset_ts_gap{std::chrono::milliseconds(tso_max_gap_reset_ts_ms)};
	/// Distance between the cursor and the watermark written on each persist
	std::chrono::microseconds persist_margin{std::chrono::milliseconds(tso_save_interval_ms)};
	std::chrono::microseconds update_timestamp_guard{std::chrono::milliseconds(tso_update_timestamp_guard_ms)};
	int save_retry_limit = static_cast<int>(tso_save_retry_limit);
	std::chrono::microseconds save_retry_backoff{std::chrono::milliseconds(tso_save_retry_backoff_ms)};
	int64_t max_count_per_request = tso_max_count_per_request;

	static TsoOptions FromConfig(const MeridianConfig::Tso& config);

	int64_t MaxResetTsGapMs() const;
	int64_t PersistMarginMs() const;
	int64_t UpdateTimestampGuardMs() const;
};

} // namespace Meridian
