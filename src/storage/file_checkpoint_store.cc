#include "file_checkpoint_store.h"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <string>
#include <utility>

#include <sys/file.h>
#include <sys/stat.h>

#include <glog/logging.h>

#include "common/scoped_fd.h"

namespace Meridian {

namespace {

// Longest record is "<uint64> <int64>\n"
constexpr size_t kMaxRecordSize = 64;

std::string EscapeStreamId(const std::string& stream_id) {
	std::string out;
	out.reserve(stream_id.size());
	for (char c : stream_id) {
		if (c == '/') {
			out += "%2F";
		} else if (c == '%') {
			out += "%25";
		} else {
			out += c;
		}
	}
	return out;
}

absl::Status ErrnoStatus(const std::string& what, const std::string& path) {
	int err = errno;
	std::string msg = what + " " + path + ": " + strerror(err);
	if (err == ENOSPC || err == EROFS || err == EACCES || err == EPERM) {
		return absl::InternalError(msg);
	}
	return absl::UnavailableError(msg);
}

bool WriteAll(int fd, const char* data, size_t size) {
	size_t done = 0;
	while (done < size) {
		ssize_t n = ::write(fd, data + done, size - done);
		if (n < 0) {
			if (errno == EINTR) continue;
			return false;
		}
		done += static_cast<size_t>(n);
	}
	return true;
}

// Exclusive lock held for the whole read-compare-write cycle
class StreamLock {
public:
	explicit StreamLock(const std::string& path) : fd_(ScopedFd::Open(path, O_RDWR | O_CREAT)) {
		if (!fd_.valid()) {
			status_ = ErrnoStatus("open lock file", path);
			return;
		}
		while (::flock(fd_.get(), LOCK_EX) != 0) {
			if (errno != EINTR) {
				status_ = ErrnoStatus("flock", path);
				return;
			}
		}
	}

	~StreamLock() {
		if (fd_.valid() && status_.ok()) {
			::flock(fd_.get(), LOCK_UN);
		}
	}

	const absl::Status& status() const { return status_; }

private:
	ScopedFd fd_;
	absl::Status status_;
};

} // namespace

FileCheckpointStore::FileCheckpointStore(std::string directory)
	: directory_(std::move(directory)) {}

absl::Status FileCheckpointStore::Open() {
	if (directory_.empty()) {
		return absl::InvalidArgumentError("checkpoint directory is empty");
	}
	if (::mkdir(directory_.c_str(), 0755) != 0 && errno != EEXIST) {
		return ErrnoStatus("mkdir", directory_);
	}
	struct stat st;
	if (::stat(directory_.c_str(), &st) != 0) {
		return ErrnoStatus("stat", directory_);
	}
	if (!S_ISDIR(st.st_mode)) {
		return absl::InvalidArgumentError(directory_ + " is not a directory");
	}
	LOG(INFO) << "Checkpoint store opened at " << directory_;
	return absl::OkStatus();
}

std::string FileCheckpointStore::PathFor(const std::string& stream_id) const {
	return directory_ + "/" + EscapeStreamId(stream_id) + ".ckpt";
}

absl::StatusOr<Checkpoint> FileCheckpointStore::ReadLocked(const std::string& path) const {
	ScopedFd fd = ScopedFd::Open(path, O_RDONLY);
	if (!fd.valid()) {
		if (errno == ENOENT) {
			return absl::NotFoundError("no checkpoint at " + path);
		}
		return ErrnoStatus("open", path);
	}

	char buf[kMaxRecordSize + 1] = {0};
	size_t len = 0;
	while (len < kMaxRecordSize) {
		ssize_t n = ::read(fd.get(), buf + len, kMaxRecordSize - len);
		if (n < 0) {
			if (errno == EINTR) continue;
			return ErrnoStatus("read", path);
		}
		if (n == 0) break;
		len += static_cast<size_t>(n);
	}

	unsigned long long version = 0;
	long long saved_physical = 0;
	if (std::sscanf(buf, "%llu %lld", &version, &saved_physical) != 2) {
		LOG(ERROR) << "Corrupted checkpoint file " << path;
		return absl::DataLossError("corrupted checkpoint file " + path);
	}
	Checkpoint cp;
	cp.version = static_cast<uint64_t>(version);
	cp.saved_physical = static_cast<int64_t>(saved_physical);
	return cp;
}

absl::StatusOr<Checkpoint> FileCheckpointStore::Load(const std::string& stream_id) {
	const std::string path = PathFor(stream_id);
	StreamLock lock(path + ".lock");
	if (!lock.status().ok()) {
		return lock.status();
	}
	return ReadLocked(path);
}

absl::StatusOr<uint64_t> FileCheckpointStore::Save(const std::string& stream_id,
		int64_t saved_physical, uint64_t expected_version) {
	const std::string path = PathFor(stream_id);
	StreamLock lock(path + ".lock");
	if (!lock.status().ok()) {
		return lock.status();
	}

	uint64_t current = kNoCheckpointVersion;
	auto existing = ReadLocked(path);
	if (existing.ok()) {
		current = existing->version;
	} else if (!absl::IsNotFound(existing.status())) {
		return existing.status();
	}
	if (current != expected_version) {
		VLOG(2) << "Checkpoint CAS failed for " << stream_id << " expected:" << expected_version
			<< " current:" << current;
		return absl::AbortedError("checkpoint version mismatch for stream " + stream_id);
	}

	const uint64_t next_version = current + 1;
	const std::string record = std::to_string(next_version) + " " + std::to_string(saved_physical) + "\n";
	const std::string tmp_path = path + ".tmp";
	{
		ScopedFd fd = ScopedFd::Open(tmp_path, O_WRONLY | O_CREAT | O_TRUNC);
		if (!fd.valid()) {
			return ErrnoStatus("open", tmp_path);
		}
		if (!WriteAll(fd.get(), record.data(), record.size())) {
			return ErrnoStatus("write", tmp_path);
		}
		if (::fsync(fd.get()) != 0) {
			return ErrnoStatus("fsync", tmp_path);
		}
	}
	if (::rename(tmp_path.c_str(), path.c_str()) != 0) {
		return ErrnoStatus("rename", path);
	}
	ScopedFd dir = ScopedFd::Open(directory_, O_RDONLY | O_DIRECTORY);
	if (dir.valid() && ::fsync(dir.get()) != 0) {
		LOG(WARNING) << "fsync of " << directory_ << " failed: " << strerror(errno);
	}

	VLOG(3) << "Saved checkpoint " << stream_id << " physical:" << saved_physical
		<< " version:" << next_version;
	return next_version;
}

} // namespace Meridian
