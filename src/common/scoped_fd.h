// RAII wrapper for file descriptors (child process pipes).
// Ensures fd is closed on scope exit, including the early-return paths of a failed spawn.
#ifndef BOOTSTRAP_SRC_COMMON_SCOPED_FD_H_
#define BOOTSTRAP_SRC_COMMON_SCOPED_FD_H_

#include <fcntl.h>
#include <unistd.h>

namespace Bootstrap {

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

	int get() const { return fd; }

	void reset() {
		if (fd >= 0) {
			::close(fd);
			fd = -1;
		}
	}
};

// Both ends are close-on-exec; dup2 onto a standard stream clears the flag in the child.
struct ScopedPipe {
	ScopedFd read_end;
	ScopedFd write_end;

	bool Open() {
		int fds[2];
		if (::pipe2(fds, O_CLOEXEC) != 0) {
			return false;
		}
		read_end = ScopedFd(fds[0]);
		write_end = ScopedFd(fds[1]);
		return true;
	}
};

} // namespace Bootstrap

#endif  // BOOTSTRAP_SRC_COMMON_SCOPED_FD_H_
