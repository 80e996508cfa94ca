#include "election.h"

#include <utility>

#include <glog/logging.h>

namespace Meridian {

LocalElection::LocalElection(std::string member_id)
	: member_id_(std::move(member_id)) {}

void LocalElection::Subscribe(ElectionObserver* observer) {
	absl::MutexLock lock(&mutex_);
	observers_.push_back(observer);
}

uint64_t LocalElection::Elect() {
	std::vector<ElectionObserver*> observers;
	bool was_leader;
	uint64_t old_epoch;
	uint64_t new_epoch;
	{
		absl::MutexLock lock(&mutex_);
		was_leader = leader_;
		old_epoch = epoch_;
		new_epoch = ++epoch_;
		leader_ = true;
		observers = observers_;
	}

	if (was_leader) {
		for (auto* observer : observers) {
			observer->OnDeposed(old_epoch);
		}
	}
	LOG(INFO) << "[LocalElection] " << member_id_ << " elected, epoch:" << new_epoch;
	for (auto* observer : observers) {
		observer->OnElected(new_epoch);
	}
	return new_epoch;
}

void LocalElection::Depose() {
	DeposeIf(0, true);
}

void LocalElection::Resign(uint64_t epoch) {
	DeposeIf(epoch, false);
}

void LocalElection::DeposeIf(uint64_t epoch, bool any_epoch) {
	std::vector<ElectionObserver*> observers;
	uint64_t deposed_epoch;
	{
		absl::MutexLock lock(&mutex_);
		if (!leader_ || (!any_epoch && epoch != epoch_)) {
			return;
		}
		leader_ = false;
		deposed_epoch = epoch_;
		observers = observers_;
	}

	LOG(INFO) << "[LocalElection] " << member_id_ << " deposed, epoch:" << deposed_epoch;
	for (auto* observer : observers) {
		observer->OnDeposed(deposed_epoch);
	}
}

bool LocalElection::IsLeader() const {
	absl::MutexLock lock(&mutex_);
	return leader_;
}

uint64_t LocalElection::epoch() const {
	absl::MutexLock lock(&mutex_);
	return epoch_;
}

} // namespace Meridian
