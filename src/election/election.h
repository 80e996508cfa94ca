#ifndef MERIDIAN_ELECTION_ELECTION_H_
#define MERIDIAN_ELECTION_ELECTION_H_

#include <cstdint>
#include <string>
#include <vector>

#include "absl/synchronization/mutex.h"

namespace Meridian {

/**
 * Receives leadership transitions from a LeaderElection.
 * Epochs strictly increase across terms and are opaque otherwise.
 */
class ElectionObserver {
public:
	virtual ~ElectionObserver() = default;

	virtual void OnElected(uint64_t epoch) = 0;
	virtual void OnDeposed(uint64_t epoch) = 0;
};

/**
 * The leader-election capability the oracle consumes.
 */
class LeaderElection {
public:
	virtual ~LeaderElection() = default;

	virtual void Subscribe(ElectionObserver* observer) = 0;

	/// Gives up the term identified by `epoch`; a no-op for any other term
	virtual void Resign(uint64_t epoch) = 0;

	virtual const std::string& MemberId() const = 0;
};

/**
 * Election driven by its owner: the standalone server elects itself on start,
 * tests elect and depose at will. Observers are notified on the calling thread
 * without any lock held, so they may call back into Resign().
 */
class LocalElection : public LeaderElection {
public:
	explicit LocalElection(std::string member_id);

	void Subscribe(ElectionObserver* observer) override;
	void Resign(uint64_t epoch) override;
	const std::string& MemberId() const override { return member_id_; }

	/// Starts a new term, deposing the current one first. Returns the new epoch.
	uint64_t Elect();

	/// Ends the current term, if any
	void Depose();

	bool IsLeader() const;
	uint64_t epoch() const;

private:
	void DeposeIf(uint64_t epoch, bool any_epoch);

	const std::string member_id_;
	mutable absl::Mutex mutex_;
	std::vector<ElectionObserver*> observers_ ABSL_GUARDED_BY(mutex_);
	uint64_t epoch_ ABSL_GUARDED_BY(mutex_) = 0;
	bool leader_ ABSL_GUARDED_BY(mutex_) = false;
};

} // namespace Meridian

#endif // MERIDIAN_ELECTION_ELECTION_H_
