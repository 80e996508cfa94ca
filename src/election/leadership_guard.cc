#include "leadership_guard.h"

#include <utility>

#include <glog/logging.h>

namespace Meridian {

LeadershipGuard::LeadershipGuard(LeaderElection* election)
	: election_(election) {
	election_->Subscribe(this);
}

void LeadershipGuard::OnElected(uint64_t epoch) {
	uint64_t current = state_.load(std::memory_order_acquire);
	do {
		if ((current >> 1) > epoch || current == Pack(epoch, true)) {
			LOG(WARNING) << "[LeadershipGuard] Ignoring stale election, epoch:" << epoch
				<< " current:" << (current >> 1);
			return;
		}
	} while (!state_.compare_exchange_weak(current, Pack(epoch, true), std::memory_order_acq_rel));

	LOG(INFO) << "[LeadershipGuard] Became leader, epoch:" << epoch;
	std::vector<TransitionCallback> callbacks;
	{
		absl::MutexLock lock(&callbacks_mu_);
		callbacks = elected_callbacks_;
	}
	for (auto& callback : callbacks) {
		callback(epoch);
	}
}

void LeadershipGuard::OnDeposed(uint64_t epoch) {
	uint64_t current = state_.load(std::memory_order_acquire);
	do {
		// Only the term we are leading can be lost
		if (current != Pack(epoch, true)) {
			VLOG(1) << "[LeadershipGuard] Ignoring deposition of epoch:" << epoch
				<< " current:" << (current >> 1) << " leader:" << (current & 1);
			return;
		}
	} while (!state_.compare_exchange_weak(current, Pack(epoch, false), std::memory_order_acq_rel));

	LOG(WARNING) << "[LeadershipGuard] Lost leadership, epoch:" << epoch;
	std::vector<TransitionCallback> callbacks;
	{
		absl::MutexLock lock(&callbacks_mu_);
		callbacks = deposed_callbacks_;
	}
	for (auto& callback : callbacks) {
		callback(epoch);
	}
}

void LeadershipGuard::Resign(const std::string& reason) {
	uint64_t current = state_.load(std::memory_order_acquire);
	if ((current & 1) == 0) {
		return;
	}
	uint64_t epoch = current >> 1;
	LOG(ERROR) << "[LeadershipGuard] Resigning leadership, epoch:" << epoch << " reason: " << reason;
	// Local deposition first so nothing is served while the election catches up
	OnDeposed(epoch);
	election_->Resign(epoch);
}

void LeadershipGuard::RegisterElectedCallback(TransitionCallback callback) {
	absl::MutexLock lock(&callbacks_mu_);
	elected_callbacks_.push_back(std::move(callback));
}

void LeadershipGuard::RegisterDeposedCallback(TransitionCallback callback) {
	absl::MutexLock lock(&callbacks_mu_);
	deposed_callbacks_.push_back(std::move(callback));
}

} // namespace Meridian
