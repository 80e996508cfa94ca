#include "allocator_manager.h"

#include <string>
#include <utility>

#include <glog/logging.h>

#include "common/status.h"

namespace Meridian {

AllocatorManager::AllocatorManager(const TsoOptions& options, bool enable_local_tso,
		const std::vector<std::string>& local_regions, CheckpointStore* store,
		LeadershipGuard* guard, Clock* clock)
	: options_(options),
	  enable_local_tso_(enable_local_tso),
	  guard_(guard),
	  global_(std::make_unique<GlobalTsoAllocator>(options, store, guard, clock)) {
	if (enable_local_tso_) {
		for (const auto& region : local_regions) {
			locals_.emplace(region, std::make_unique<LocalTsoAllocator>(region, options, store, guard, clock));
		}
	}
	LOG(INFO) << "[AllocatorManager] Serving " << GlobalStreamId() << " and " << locals_.size()
		<< " local stream(s), tick:" << FormatDuration(options_.update_physical_interval);

	guard_->RegisterElectedCallback([this](uint64_t epoch) { OnElected(epoch); });
	guard_->RegisterDeposedCallback([this](uint64_t epoch) { OnDeposed(epoch); });
}

AllocatorManager::~AllocatorManager() {
	Stop();
}

void AllocatorManager::Start() {
	absl::MutexLock lock(&tick_mu_);
	if (tick_thread_.joinable()) {
		return;
	}
	stop_ = std::make_shared<Cancellation>();
	tick_thread_ = std::thread([this, stop = stop_]() {
		while (!stop->WaitFor(options_.update_physical_interval)) {
			Tick();
		}
	});
}

void AllocatorManager::Stop() {
	std::thread thread;
	{
		absl::MutexLock lock(&tick_mu_);
		if (!tick_thread_.joinable()) {
			return;
		}
		stop_->Cancel();
		thread = std::move(tick_thread_);
	}
	thread.join();
	LOG(INFO) << "[AllocatorManager] Tick thread stopped";
}

std::vector<ITimestampAllocator*> AllocatorManager::AllAllocators() const {
	std::vector<ITimestampAllocator*> allocators;
	allocators.reserve(locals_.size() + 1);
	allocators.push_back(global_.get());
	for (const auto& [region, local] : locals_) {
		allocators.push_back(local.get());
	}
	return allocators;
}

void AllocatorManager::OnElected(uint64_t epoch) {
	LOG(INFO) << "[AllocatorManager] Initializing allocators for epoch:" << epoch;
	// Global first so the locals can be synced to it right away
	for (auto* allocator : AllAllocators()) {
		absl::Status status = allocator->Initialize(nullptr);
		if (status.ok()) {
			continue;
		}
		if (IsNotLeader(status)) {
			LOG(WARNING) << "[AllocatorManager] Leadership of epoch " << epoch
				<< " lost while initializing " << allocator->GetStreamId();
			return;
		}
		guard_->Resign("failed to initialize " + allocator->GetStreamId() + ": " + status.ToString());
		return;
	}
	if (enable_local_tso_) {
		absl::Status status = SyncLocalAllocators();
		if (!status.ok()) {
			LOG(WARNING) << "[AllocatorManager] Initial local sync failed: " << status;
		}
	}
	LOG(INFO) << "[AllocatorManager] All allocators ready, epoch:" << epoch;
}

void AllocatorManager::OnDeposed(uint64_t epoch) {
	for (auto* allocator : AllAllocators()) {
		allocator->Reset();
	}
	LOG(INFO) << "[AllocatorManager] Allocators reset after losing epoch:" << epoch;
}

absl::Status AllocatorManager::HandleFailure(const std::string& stream_id, const absl::Status& status) {
	if (RequiresResignation(status)) {
		guard_->Resign(stream_id + ": " + status.ToString());
		return NotLeaderError(stream_id + " resigned: " + std::string(status.message()));
	}
	if (IsNotLeader(status)) {
		VLOG(2) << "[AllocatorManager] " << stream_id << " not serving: " << status;
	} else {
		LOG(WARNING) << "[AllocatorManager] " << stream_id << ": " << status;
	}
	return status;
}

void AllocatorManager::Tick() {
	if (!guard_->IsLeader()) {
		return;
	}
	for (auto* allocator : AllAllocators()) {
		if (!allocator->IsInitialized()) {
			continue;
		}
		absl::Status status = allocator->UpdateTimestamp();
		if (!status.ok()) {
			HandleFailure(allocator->GetStreamId(), status).IgnoreError();
		}
	}
	if (enable_local_tso_ && guard_->IsLeader()) {
		// Failures were handled per stream
		SyncLocalAllocators().IgnoreError();
	}
}

absl::Status AllocatorManager::SyncLocalAllocators() {
	auto global_ts = global_->GetCurrent();
	if (!global_ts.ok()) {
		return global_ts.status();
	}
	absl::Status first_error;
	for (const auto& [region, local] : locals_) {
		if (!local->IsInitialized()) {
			continue;
		}
		absl::Status status = local->SyncWithGlobal(global_ts->physical);
		if (!status.ok()) {
			first_error.Update(HandleFailure(local->GetStreamId(), status));
		}
	}
	return first_error;
}

absl::StatusOr<ITimestampAllocator*> AllocatorManager::GetAllocator(const std::string& stream_key) const {
	if (stream_key.empty() || stream_key == "global") {
		return global_.get();
	}
	if (!enable_local_tso_) {
		return absl::InvalidArgumentError("local TSO is disabled, unknown stream " + stream_key);
	}
	auto it = locals_.find(stream_key);
	if (it == locals_.end()) {
		return absl::InvalidArgumentError("unknown region " + stream_key);
	}
	return it->second.get();
}

absl::StatusOr<Timestamp> AllocatorManager::HandleRequest(const std::string& stream_key, int64_t count,
		const CancelCheck& cancelled) {
	auto allocator = GetAllocator(stream_key);
	if (!allocator.ok()) {
		return allocator.status();
	}
	auto ts = (*allocator)->GenerateTimestamp(count, cancelled);
	if (!ts.ok() && RequiresResignation(ts.status())) {
		return HandleFailure((*allocator)->GetStreamId(), ts.status());
	}
	return ts;
}

absl::Status AllocatorManager::ResetUserTimestamp(const std::string& stream_key, const Timestamp& ts,
		bool ignore_smaller, bool skip_upper_bound_check) {
	auto allocator = GetAllocator(stream_key);
	if (!allocator.ok()) {
		return allocator.status();
	}
	absl::Status status = (*allocator)->ResetUserTimestamp(ts, ignore_smaller, skip_upper_bound_check);
	if (!status.ok() && RequiresResignation(status)) {
		return HandleFailure((*allocator)->GetStreamId(), status);
	}
	return status;
}

bool AllocatorManager::IsReady(const std::string& stream_key) const {
	auto allocator = GetAllocator(stream_key);
	return allocator.ok() && guard_->IsLeader() && (*allocator)->IsInitialized();
}

bool AllocatorManager::IsHealthy() const {
	if (!guard_->IsLeader()) {
		return true;
	}
	for (auto* allocator : AllAllocators()) {
		if (!allocator->IsInitialized()) {
			return false;
		}
	}
	return true;
}

} // namespace Meridian
