#include "tso_options.h"

#include <algorithm>

namespace Meridian {

namespace {

// Rounds up so that a sub-millisecond setting still keeps a non-zero distance
int64_t CeilMs(std::chrono::microseconds d) {
	return std::chrono::ceil<std::chrono::milliseconds>(d).count();
}

} // namespace

TsoOptions TsoOptions::FromConfig(const MeridianConfig::Tso& config) {
	TsoOptions options;
	options.update_physical_interval = config.EffectiveUpdatePhysicalInterval();
	options.save_interval = config.save_interval.get();
	options.max_reset_ts_gap = config.max_gap_reset_ts.get();
	options.persist_margin = config.EffectivePersistMargin();
	options.update_timestamp_guard = config.update_timestamp_guard.get();
	options.save_retry_limit = std::max(1, config.save_retry_limit.get());
	options.save_retry_backoff = config.save_retry_backoff.get();
	options.max_count_per_request = config.max_count_per_request.get();
	return options;
}

int64_t TsoOptions::MaxResetTsGapMs() const {
	return std::chrono::duration_cast<std::chrono::milliseconds>(max_reset_ts_gap).count();
}

int64_t TsoOptions::PersistMarginMs() const {
	return std::max<int64_t>(1, CeilMs(persist_margin));
}

int64_t TsoOptions::UpdateTimestampGuardMs() const {
	return CeilMs(update_timestamp_guard);
}

} // namespace Meridian
