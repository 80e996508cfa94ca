#pragma once

#include <chrono>
#include <cstdint>

namespace Meridian {

/**
 * Wall-clock source for the physical part of timestamps.
 * Injected into the allocators so tests can stall or rewind time.
 */
class Clock {
public:
	virtual ~Clock() = default;

	/// Milliseconds since the UNIX epoch
	virtual int64_t NowMs() = 0;
};

class SystemClock : public Clock {
public:
	int64_t NowMs() override {
		return std::chrono::duration_cast<std::chrono::milliseconds>(
				std::chrono::system_clock::now().time_since_epoch()).count();
	}
};

} // namespace Meridian
