#ifndef MERIDIAN_ELECTION_LEADERSHIP_GUARD_H_
#define MERIDIAN_ELECTION_LEADERSHIP_GUARD_H_

#include <atomic>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "absl/synchronization/mutex.h"
#include "election.h"

namespace Meridian {

/**
 * Tracks whether this process currently holds allocator leadership, and under
 * which epoch. Every allocation is gated by IsLeaderAt(epoch of the cursor).
 *
 * Leader flag and epoch live in a single atomic word so a deposition is visible
 * to all allocating threads at once, before any callback runs.
 */
class LeadershipGuard : public ElectionObserver {
public:
	using TransitionCallback = std::function<void(uint64_t epoch)>;

	/// Subscribes to `election`, which must outlive the guard
	explicit LeadershipGuard(LeaderElection* election);

	void OnElected(uint64_t epoch) override;

	/// Drops leadership, then runs the deposed callbacks synchronously
	void OnDeposed(uint64_t epoch) override;

	uint64_t CurrentEpoch() const { return state_.load(std::memory_order_acquire) >> 1; }
	bool IsLeader() const { return (state_.load(std::memory_order_acquire) & 1) != 0; }
	bool IsLeaderAt(uint64_t epoch) const {
		return state_.load(std::memory_order_acquire) == Pack(epoch, true);
	}

	/// Voluntarily gives up the current term
	void Resign(const std::string& reason);

	void RegisterElectedCallback(TransitionCallback callback);
	void RegisterDeposedCallback(TransitionCallback callback);

private:
	static uint64_t Pack(uint64_t epoch, bool leader) { return (epoch << 1) | (leader ? 1 : 0); }

	LeaderElection* election_;
	std::atomic<uint64_t> state_{0};

	absl::Mutex callbacks_mu_;
	std::vector<TransitionCallback> elected_callbacks_ ABSL_GUARDED_BY(callbacks_mu_);
	std::vector<TransitionCallback> deposed_callbacks_ ABSL_GUARDED_BY(callbacks_mu_);
};

} // namespace Meridian

#endif // MERIDIAN_ELECTION_LEADERSHIP_GUARD_H_
