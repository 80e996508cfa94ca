#pragma once

#include <cstdint>

/// Timestamp oracle defaults
/// The interval between two physical updates
const int64_t tso_update_physical_interval_ms = 50;
/// The update interval is clamped into [min, max]
const int64_t tso_min_update_physical_interval_ms = 1;
const int64_t tso_max_update_physical_interval_ms = 10000;
/// The interval between two checkpoint saves, also the default persist margin
const int64_t tso_save_interval_ms = 3000;
/// The max time to wait for the wall clock to catch up with a saved watermark
const int64_t tso_max_gap_reset_ts_ms = 3000;
/// Persist again once the cursor comes within this distance of the watermark
const int64_t tso_update_timestamp_guard_ms = 1;
/// The amount of attempts on a failing store before we give up on a tick
const int64_t tso_save_retry_limit = 3;
const int64_t tso_save_retry_backoff_ms = 20;
/// The largest block of timestamps a single request can reserve
const int64_t tso_max_count_per_request = 4096;

/// Server defaults
#define MERIDIAN_DEFAULT_LISTEN_ADDR "0.0.0.0:3379"
#define MERIDIAN_DEFAULT_BACKEND "memory://"
