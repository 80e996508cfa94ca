#include "timestamp_oracle.h"

#include <algorithm>
#include <utility>

#include <glog/logging.h>

#include "common/status.h"

namespace Meridian {

namespace {

constexpr std::chrono::microseconds kInitialBumpBackoff{100};
constexpr std::chrono::milliseconds kCatchUpPollInterval{10};

std::chrono::steady_clock::time_point SteadyNow() {
	return std::chrono::steady_clock::now();
}

} // namespace

TimestampOracle::TimestampOracle(std::string stream_id, const TsoOptions& options,
		CheckpointStore* store, LeadershipGuard* guard, Clock* clock)
	: stream_id_(std::move(stream_id)),
	  options_(options),
	  store_(store),
	  guard_(guard),
	  clock_(clock),
	  cancel_(std::make_shared<Cancellation>()) {}

void TimestampOracle::AdvanceLocked(int64_t physical) {
	cursor_.physical = physical;
	cursor_.logical = 0;
	cursor_.update_deadline = SteadyNow() + options_.update_physical_interval;
}

void TimestampOracle::InvalidateLocked(const char* reason) {
	if (cursor_.valid) {
		LOG(WARNING) << "[TimestampOracle:" << stream_id_ << "] Cursor invalidated (" << reason
			<< ") at " << Timestamp{cursor_.physical, cursor_.logical} << " epoch:" << cursor_.epoch;
	}
	cursor_ = Cursor{};
	cancel_->Cancel();
}

void TimestampOracle::ResetTimestamp() {
	absl::MutexLock lock(&mu_);
	InvalidateLocked("reset");
}

bool TimestampOracle::IsInitialized() const {
	absl::MutexLock lock(&mu_);
	return cursor_.valid;
}

absl::StatusOr<Timestamp> TimestampOracle::GetCurrent() const {
	absl::MutexLock lock(&mu_);
	if (!cursor_.valid) {
		return NotLeaderError("timestamp stream " + stream_id_ + " is not initialized");
	}
	return Timestamp{cursor_.physical, cursor_.logical};
}

int64_t TimestampOracle::SavedPhysical() const {
	absl::MutexLock lock(&mu_);
	return cursor_.saved_physical;
}

absl::StatusOr<TimestampOracle::Cursor> TimestampOracle::LeaderSnapshot(
		std::shared_ptr<Cancellation>* token) const {
	absl::MutexLock lock(&mu_);
	if (!cursor_.valid) {
		return NotLeaderError("timestamp stream " + stream_id_ + " is not initialized");
	}
	if (!guard_->IsLeaderAt(cursor_.epoch)) {
		return NotLeaderError("leadership of epoch " + std::to_string(cursor_.epoch) + " is gone");
	}
	if (token != nullptr) {
		*token = cancel_;
	}
	return cursor_;
}

bool TimestampOracle::CommitWatermark(uint64_t epoch, int64_t saved_physical, uint64_t version) {
	absl::MutexLock lock(&mu_);
	if (!cursor_.valid || cursor_.epoch != epoch) {
		return false;
	}
	cursor_.saved_physical = saved_physical;
	cursor_.version = version;
	return true;
}

absl::StatusOr<Checkpoint> TimestampOracle::LoadWithRetry(const std::shared_ptr<Cancellation>& token) {
	absl::Status last_error;
	std::chrono::microseconds backoff = options_.save_retry_backoff;
	for (int attempt = 1; attempt <= options_.save_retry_limit; ++attempt) {
		auto result = store_->Load(stream_id_);
		if (result.ok() || !absl::IsUnavailable(result.status())) {
			return result;
		}
		last_error = result.status();
		LOG(WARNING) << "[TimestampOracle:" << stream_id_ << "] Loading checkpoint failed (attempt "
			<< attempt << "/" << options_.save_retry_limit << "): " << last_error;
		if (attempt == options_.save_retry_limit) {
			break;
		}
		if (token->WaitFor(backoff)) {
			return NotLeaderError("timestamp stream " + stream_id_ + " reset while loading checkpoint");
		}
		backoff *= 2;
	}
	return last_error;
}

absl::StatusOr<uint64_t> TimestampOracle::SaveWithRetry(int64_t saved_physical, uint64_t version,
		const std::shared_ptr<Cancellation>& token) {
	absl::Status last_error;
	std::chrono::microseconds backoff = options_.save_retry_backoff;
	for (int attempt = 1; attempt <= options_.save_retry_limit; ++attempt) {
		auto result = store_->Save(stream_id_, saved_physical, version);
		if (result.ok() || !absl::IsUnavailable(result.status())) {
			return result;
		}
		last_error = result.status();
		LOG(WARNING) << "[TimestampOracle:" << stream_id_ << "] Saving watermark " << saved_physical
			<< " failed (attempt " << attempt << "/" << options_.save_retry_limit << "): " << last_error;
		if (attempt == options_.save_retry_limit) {
			break;
		}
		if (token->WaitFor(backoff)) {
			return NotLeaderError("timestamp stream " + stream_id_ + " reset while saving checkpoint");
		}
		backoff *= 2;
	}
	return last_error;
}

absl::Status TimestampOracle::OnPersistFailure(const absl::Status& status) {
	const SteadyTime now = SteadyNow();
	if (!first_persist_failure_.has_value()) {
		first_persist_failure_ = now;
	}
	if (now - *first_persist_failure_ >= options_.save_interval) {
		return ClockAnomalyError("watermark of " + stream_id_ + " could not be persisted for " +
				FormatDuration(options_.save_interval) + ": " + std::string(status.message()));
	}
	return absl::OkStatus();
}

absl::Status TimestampOracle::SyncTimestamp(const CancelCheck& cancelled) {
	std::lock_guard<std::mutex> persist_lock(persist_mu_);

	const uint64_t epoch = guard_->CurrentEpoch();
	if (!guard_->IsLeaderAt(epoch)) {
		return NotLeaderError("not the leader, cannot initialize " + stream_id_);
	}

	auto token = std::make_shared<Cancellation>();
	{
		absl::MutexLock lock(&mu_);
		InvalidateLocked("re-initializing");
		cancel_ = token;
	}
	first_persist_failure_.reset();

	int64_t saved_physical = 0;
	uint64_t version = kNoCheckpointVersion;
	auto loaded = LoadWithRetry(token);
	if (loaded.ok()) {
		saved_physical = loaded->saved_physical;
		version = loaded->version;
	} else if (absl::IsNotFound(loaded.status())) {
		LOG(INFO) << "[TimestampOracle:" << stream_id_ << "] No checkpoint found, starting fresh";
	} else {
		LOG(ERROR) << "[TimestampOracle:" << stream_id_ << "] Failed to load checkpoint: " << loaded.status();
		return loaded.status();
	}

	int64_t now = clock_->NowMs();
	if (now < saved_physical) {
		LOG(WARNING) << "[TimestampOracle:" << stream_id_ << "] Clock " << now
			<< " is behind the saved watermark " << saved_physical << ", waiting up to "
			<< FormatDuration(options_.max_reset_ts_gap);
		const SteadyTime deadline = SteadyNow() + options_.max_reset_ts_gap;
		while (now < saved_physical) {
			if (!guard_->IsLeaderAt(epoch)) {
				return NotLeaderError("leadership lost while waiting for the clock");
			}
			if (cancelled && cancelled()) {
				return absl::CancelledError("initialization of " + stream_id_ + " cancelled");
			}
			const auto remaining = deadline - SteadyNow();
			if (remaining <= std::chrono::steady_clock::duration::zero()) {
				return ClockAnomalyError("clock of " + stream_id_ + " stayed " +
						std::to_string(saved_physical - now) + "ms behind the saved watermark for more than " +
						FormatDuration(options_.max_reset_ts_gap));
			}
			std::chrono::steady_clock::duration step = remaining;
			step = std::min<std::chrono::steady_clock::duration>(step, std::chrono::milliseconds(saved_physical - now));
			step = std::min<std::chrono::steady_clock::duration>(step, kCatchUpPollInterval);
			if (token->WaitFor(step)) {
				return NotLeaderError("timestamp stream " + stream_id_ + " reset while waiting for the clock");
			}
			now = clock_->NowMs();
		}
	}

	const int64_t last = std::max(now, saved_physical);
	const int64_t new_saved = last + options_.PersistMarginMs();
	auto new_version = SaveWithRetry(new_saved, version, token);
	if (!new_version.ok()) {
		LOG(ERROR) << "[TimestampOracle:" << stream_id_ << "] Failed to persist initial watermark "
			<< new_saved << ": " << new_version.status();
		if (IsVersionConflict(new_version.status())) {
			return VersionConflictError("checkpoint of " + stream_id_ + " changed during initialization");
		}
		return new_version.status();
	}

	{
		absl::MutexLock lock(&mu_);
		if (token->IsCancelled() || !guard_->IsLeaderAt(epoch)) {
			return NotLeaderError("leadership lost during initialization of " + stream_id_);
		}
		cursor_ = Cursor{};
		AdvanceLocked(last);
		cursor_.last_now = now;
		cursor_.floor_physical = last;
		cursor_.saved_physical = new_saved;
		cursor_.version = *new_version;
		cursor_.epoch = epoch;
		cursor_.valid = true;
	}
	LOG(INFO) << "[TimestampOracle:" << stream_id_ << "] Initialized at " << Timestamp{last, 0}
		<< " watermark:" << new_saved << " epoch:" << epoch;
	return absl::OkStatus();
}

absl::Status TimestampOracle::UpdateTimestamp() {
	std::lock_guard<std::mutex> persist_lock(persist_mu_);

	std::shared_ptr<Cancellation> token;
	auto snapshot = LeaderSnapshot(&token);
	if (!snapshot.ok()) {
		return snapshot.status();
	}
	const Cursor cur = *snapshot;

	const int64_t now = clock_->NowMs();
	if (cur.last_now - now > options_.MaxResetTsGapMs()) {
		{
			absl::MutexLock lock(&mu_);
			if (cursor_.valid && cursor_.epoch == cur.epoch) {
				InvalidateLocked("clock moved backward");
			}
		}
		return ClockAnomalyError("clock of " + stream_id_ + " moved " + std::to_string(cur.last_now - now) +
				"ms backward, more than " + FormatDuration(options_.max_reset_ts_gap));
	}
	{
		absl::MutexLock lock(&mu_);
		if (cursor_.valid && cursor_.epoch == cur.epoch) {
			cursor_.last_now = std::max(cursor_.last_now, now);
		}
	}

	const int64_t next = std::max(now, cur.physical);
	absl::Status result;
	if (next + options_.UpdateTimestampGuardMs() >= cur.saved_physical) {
		const int64_t new_saved = next + options_.PersistMarginMs();
		auto version = SaveWithRetry(new_saved, cur.version, token);
		if (version.ok()) {
			first_persist_failure_.reset();
			if (!CommitWatermark(cur.epoch, new_saved, *version)) {
				return NotLeaderError("timestamp stream " + stream_id_ + " reset during update");
			}
			VLOG(2) << "[TimestampOracle:" << stream_id_ << "] Watermark moved to " << new_saved;
		} else if (IsVersionConflict(version.status())) {
			absl::MutexLock lock(&mu_);
			if (cursor_.valid && cursor_.epoch == cur.epoch) {
				InvalidateLocked("checkpoint version conflict");
			}
			return VersionConflictError("checkpoint of " + stream_id_ + " was saved by another process");
		} else if (IsNotLeader(version.status())) {
			return version.status();
		} else {
			absl::Status escalated = OnPersistFailure(version.status());
			if (!escalated.ok()) {
				absl::MutexLock lock(&mu_);
				if (cursor_.valid && cursor_.epoch == cur.epoch) {
					InvalidateLocked("watermark persist failures");
				}
				return escalated;
			}
			// Keep serving below the old watermark until the store comes back
			result = version.status();
		}
	}

	absl::MutexLock lock(&mu_);
	if (!cursor_.valid || cursor_.epoch != cur.epoch) {
		return NotLeaderError("timestamp stream " + stream_id_ + " reset during update");
	}
	const int64_t target = std::min(next, cursor_.saved_physical - 1);
	if (target > cursor_.physical) {
		AdvanceLocked(target);
	}
	return result;
}

absl::StatusOr<Timestamp> TimestampOracle::GetTimestamp(int64_t count, const CancelCheck& cancelled) {
	if (count < 1 || count > options_.max_count_per_request) {
		return absl::InvalidArgumentError("count must be in [1, " +
				std::to_string(options_.max_count_per_request) + "], got " + std::to_string(count));
	}

	const SteadyTime start = SteadyNow();
	std::chrono::microseconds backoff = kInitialBumpBackoff;
	while (true) {
		std::shared_ptr<Cancellation> token;
		uint64_t epoch = 0;
		{
			absl::MutexLock lock(&mu_);
			if (!cursor_.valid) {
				return NotLeaderError("timestamp stream " + stream_id_ + " is not initialized");
			}
			if (!guard_->IsLeaderAt(cursor_.epoch)) {
				return NotLeaderError("leadership of epoch " + std::to_string(cursor_.epoch) + " is gone");
			}
			if (cursor_.logical + count <= kMaxLogical) {
				Timestamp ts{cursor_.physical, cursor_.logical};
				cursor_.logical += count;
				return ts;
			}

			// Logical space of this millisecond is exhausted, physical has to move first
			const int64_t now = clock_->NowMs();
			const int64_t ceiling = cursor_.saved_physical - 1;
			int64_t target = cursor_.physical;
			if (now > cursor_.physical) {
				target = std::min(now, ceiling);
			} else if (SteadyNow() >= cursor_.update_deadline) {
				// Clock stalled for a whole tick: borrow the next millisecond
				const int64_t base = std::max(now, cursor_.floor_physical);
				if (cursor_.physical + 1 - base > options_.MaxResetTsGapMs()) {
					InvalidateLocked("clock stalled");
					return ClockAnomalyError("cursor of " + stream_id_ + " would run more than " +
							FormatDuration(options_.max_reset_ts_gap) + " ahead of the clock");
				}
				target = std::min(cursor_.physical + 1, ceiling);
				if (target > cursor_.physical) {
					LOG_EVERY_N(WARNING, 100) << "[TimestampOracle:" << stream_id_
						<< "] Clock stalled at " << now << ", advancing physical to " << target;
				}
			}
			if (target > cursor_.physical) {
				AdvanceLocked(target);
				continue;
			}
			token = cancel_;
			epoch = cursor_.epoch;
		}

		if (SteadyNow() - start > options_.max_reset_ts_gap) {
			absl::MutexLock lock(&mu_);
			if (!cursor_.valid || cursor_.epoch != epoch || cancel_ != token) {
				return NotLeaderError("timestamp stream " + stream_id_ + " reset while waiting for the clock");
			}
			InvalidateLocked("logical counter exhausted");
			return ClockAnomalyError("physical time of " + stream_id_ + " did not advance within " +
					FormatDuration(options_.max_reset_ts_gap));
		}
		if (cancelled && cancelled()) {
			return absl::CancelledError("request cancelled while waiting for the physical clock");
		}
		if (token->WaitFor(backoff)) {
			return NotLeaderError("timestamp stream " + stream_id_ + " reset while waiting for the clock");
		}
		backoff = std::min(backoff * 2, options_.update_physical_interval);
	}
}

absl::Status TimestampOracle::AdvancePhysical(int64_t physical) {
	std::lock_guard<std::mutex> persist_lock(persist_mu_);

	std::shared_ptr<Cancellation> token;
	auto snapshot = LeaderSnapshot(&token);
	if (!snapshot.ok()) {
		return snapshot.status();
	}
	const Cursor cur = *snapshot;
	if (cur.physical >= physical) {
		return absl::OkStatus();
	}

	if (physical + options_.UpdateTimestampGuardMs() >= cur.saved_physical) {
		const int64_t new_saved = physical + options_.PersistMarginMs();
		auto version = SaveWithRetry(new_saved, cur.version, token);
		if (!version.ok()) {
			if (IsVersionConflict(version.status())) {
				absl::MutexLock lock(&mu_);
				if (cursor_.valid && cursor_.epoch == cur.epoch) {
					InvalidateLocked("checkpoint version conflict");
				}
				return VersionConflictError("checkpoint of " + stream_id_ + " was saved by another process");
			}
			return version.status();
		}
		if (!CommitWatermark(cur.epoch, new_saved, *version)) {
			return NotLeaderError("timestamp stream " + stream_id_ + " reset during advance");
		}
	}

	absl::MutexLock lock(&mu_);
	if (!cursor_.valid || cursor_.epoch != cur.epoch) {
		return NotLeaderError("timestamp stream " + stream_id_ + " reset during advance");
	}
	if (physical > cursor_.physical && physical < cursor_.saved_physical) {
		VLOG(1) << "[TimestampOracle:" << stream_id_ << "] Advancing physical "
			<< cursor_.physical << " -> " << physical;
		AdvanceLocked(physical);
		cursor_.floor_physical = std::max(cursor_.floor_physical, physical);
	}
	return absl::OkStatus();
}

absl::Status TimestampOracle::ResetUserTimestamp(const Timestamp& ts, bool ignore_smaller,
		bool skip_upper_bound_check) {
	if (ts.physical <= 0 || ts.logical < 0 || ts.logical >= kMaxLogical) {
		return absl::InvalidArgumentError("invalid timestamp " + ts.ToString());
	}

	std::lock_guard<std::mutex> persist_lock(persist_mu_);

	std::shared_ptr<Cancellation> token;
	auto snapshot = LeaderSnapshot(&token);
	if (!snapshot.ok()) {
		return snapshot.status();
	}
	const Cursor cur = *snapshot;
	const Timestamp current{cur.physical, cur.logical};
	if (ts < current) {
		if (ignore_smaller) {
			return absl::OkStatus();
		}
		return absl::InvalidArgumentError("reset timestamp " + ts.ToString() +
				" is smaller than the current timestamp " + current.ToString());
	}
	if (!skip_upper_bound_check && ts.physical - cur.physical > options_.MaxResetTsGapMs()) {
		return absl::InvalidArgumentError("reset timestamp " + ts.ToString() + " is more than " +
				FormatDuration(options_.max_reset_ts_gap) + " ahead of the current timestamp");
	}

	if (ts.physical + options_.UpdateTimestampGuardMs() >= cur.saved_physical) {
		const int64_t new_saved = ts.physical + options_.PersistMarginMs();
		auto version = SaveWithRetry(new_saved, cur.version, token);
		if (!version.ok()) {
			if (IsVersionConflict(version.status())) {
				absl::MutexLock lock(&mu_);
				if (cursor_.valid && cursor_.epoch == cur.epoch) {
					InvalidateLocked("checkpoint version conflict");
				}
				return VersionConflictError("checkpoint of " + stream_id_ + " was saved by another process");
			}
			return version.status();
		}
		if (!CommitWatermark(cur.epoch, new_saved, *version)) {
			return NotLeaderError("timestamp stream " + stream_id_ + " reset during timestamp reset");
		}
	}

	absl::MutexLock lock(&mu_);
	if (!cursor_.valid || cursor_.epoch != cur.epoch) {
		return NotLeaderError("timestamp stream " + stream_id_ + " reset during timestamp reset");
	}
	const Timestamp next = ts.Next();
	if (next > Timestamp{cursor_.physical, cursor_.logical}) {
		if (next.physical != cursor_.physical) {
			AdvanceLocked(next.physical);
		}
		cursor_.logical = next.logical;
		cursor_.floor_physical = std::max(cursor_.floor_physical, next.physical);
		LOG(INFO) << "[TimestampOracle:" << stream_id_ << "] Timestamp reset, next is " << next;
	}
	return absl::OkStatus();
}

} // namespace Meridian
