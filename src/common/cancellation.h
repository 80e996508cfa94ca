#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>

namespace Meridian {

/// Polled by blocking waits to abandon work on behalf of a caller that went away
/// (e.g. a cancelled RPC). An empty function never cancels.
using CancelCheck = std::function<bool()>;

/**
 * One-shot cancellation signal with interruptible timed waits.
 * Once cancelled it stays cancelled; owners replace it to start over.
 */
class Cancellation {
public:
	Cancellation() = default;
	Cancellation(const Cancellation&) = delete;
	Cancellation& operator=(const Cancellation&) = delete;

	void Cancel() {
		{
			std::lock_guard<std::mutex> lock(mutex_);
			cancelled_ = true;
		}
		cv_.notify_all();
	}

	bool IsCancelled() const {
		std::lock_guard<std::mutex> lock(mutex_);
		return cancelled_;
	}

	/// Sleeps for up to `timeout`. Returns true if cancelled before or during the wait.
	template<typename Rep, typename Period>
	bool WaitFor(std::chrono::duration<Rep, Period> timeout) {
		std::unique_lock<std::mutex> lock(mutex_);
		return cv_.wait_for(lock, timeout, [this] { return cancelled_; });
	}

private:
	mutable std::mutex mutex_;
	std::condition_variable cv_;
	bool cancelled_ = false;
};

} // namespace Meridian
