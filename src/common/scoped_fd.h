// RAII wrapper for file descriptors (checkpoint files, lock files).
#ifndef MERIDIAN_SRC_COMMON_SCOPED_FD_H_
#define MERIDIAN_SRC_COMMON_SCOPED_FD_H_

#include <fcntl.h>
#include <unistd.h>
#include <sys/types.h>
#include <string>

namespace Meridian {

struct ScopedFd {
	int fd = -1;

	ScopedFd() = default;
	explicit ScopedFd(int f) : fd(f) {}

	~ScopedFd() { reset(); }

	ScopedFd(const ScopedFd&) = delete;
	ScopedFd& operator=(const ScopedFd&) = delete;

	ScopedFd(ScopedFd&& o) noexcept : fd(o.fd) { o.fd = -1; }
	ScopedFd& operator=(ScopedFd&& o) noexcept {
		if (this != &o) {
			reset();
			fd = o.fd;
			o.fd = -1;
		}
		return *this;
	}

	// Opens with O_CLOEXEC; check valid() and errno on failure.
	static ScopedFd Open(const std::string& path, int flags, mode_t mode = 0644) {
		return ScopedFd(::open(path.c_str(), flags | O_CLOEXEC, mode));
	}

	int get() const { return fd; }
	bool valid() const { return fd >= 0; }

	void reset() {
		if (fd >= 0) {
			::close(fd);
			fd = -1;
		}
	}
};

}  // namespace Meridian

#endif  // MERIDIAN_SRC_COMMON_SCOPED_FD_H_
