#include "process_runner.h"

#include <cerrno>
#include <csignal>
#include <cstring>

#include <fcntl.h>
#include <paths.h>
#include <poll.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>

#include <glog/logging.h>

#include "../common/scoped_fd.h"

namespace Bootstrap {

namespace {

// How often the child is checked for exit while its stderr stays open.
constexpr int kReapIntervalMs = 100;

// Written by the child to the status pipe when it fails before exec.
struct ChildError {
	int stage;
	int error_number;
};

enum ChildStage : int {
	kStageRedirect = 1,
	kStageChdir = 2,
	kStageExec = 3
};

const char* StageName(int stage) {
	switch (stage) {
		case kStageRedirect: return "dup2";
		case kStageChdir:    return "chdir";
		case kStageExec:     return "exec";
	}
	return "spawn";
}

// Child side: only async-signal-safe calls from here on.
[[noreturn]] void ReportAndExit(int status_fd, int stage, int error_number) {
	ChildError error{stage, error_number};
	ssize_t ignored = ::write(status_fd, &error, sizeof(error));
	(void)ignored;
	::_exit(127);
}

std::vector<char*> ToCStrings(const std::vector<std::string>& values) {
	std::vector<char*> pointers;
	pointers.reserve(values.size() + 1);
	for (const std::string& value : values) {
		pointers.push_back(const_cast<char*>(value.c_str()));
	}
	pointers.push_back(nullptr);
	return pointers;
}

bool WriteAll(int fd, const char* data, size_t size) {
	while (size > 0) {
		ssize_t n = ::write(fd, data, size);
		if (n < 0) {
			if (errno == EINTR) continue;
			return false;
		}
		data += n;
		size -= static_cast<size_t>(n);
	}
	return true;
}

// PATH the child will see, or the system default when it has none.
std::string ChildSearchPath(const std::vector<std::string>& environment) {
	for (const std::string& entry : environment) {
		if (entry.compare(0, 5, "PATH=") == 0) {
			return entry.substr(5);
		}
	}
	return _PATH_DEFPATH;
}

// Looks argv[0] up on the child's PATH, not ours. Names containing a slash are
// used as given. Returns an empty string and sets *error_number when nothing
// executable is found.
std::string ResolveExecutable(const ProcessSpec& spec, int* error_number) {
	const std::string& name = spec.argv.front();
	if (name.find('/') != std::string::npos) {
		return name;
	}

	const std::string search_path = ChildSearchPath(spec.environment);
	*error_number = ENOENT;
	size_t begin = 0;
	while (begin <= search_path.size()) {
		size_t end = search_path.find(':', begin);
		if (end == std::string::npos) {
			end = search_path.size();
		}
		std::string directory = search_path.substr(begin, end - begin);
		begin = end + 1;
		if (directory.empty()) {
			directory = ".";
		}

		std::string candidate = directory + "/" + name;
		// Relative entries resolve in the child's working directory.
		std::string lookup = candidate;
		if (candidate.front() != '/' && !spec.working_directory.empty()) {
			lookup = spec.working_directory + "/" + candidate;
		}

		struct stat info;
		if (::stat(lookup.c_str(), &info) != 0 || !S_ISREG(info.st_mode)) {
			continue;
		}
		if (::access(lookup.c_str(), X_OK) == 0) {
			return candidate;
		}
		*error_number = EACCES;
	}
	return "";
}

class StderrSink {
public:
	StderrSink(const ProcessSpec& spec, std::string* tail)
		: spec_(spec), tail_(tail), forwarding_(spec.forward_stderr_fd >= 0) {}

	void Consume(const char* data, size_t size) {
		if (forwarding_ && !WriteAll(spec_.forward_stderr_fd, data, size)) {
			forwarding_ = false;
		}
		if (spec_.stderr_tail_bytes > 0) {
			tail_->append(data, size);
			if (tail_->size() > spec_.stderr_tail_bytes) {
				tail_->erase(0, tail_->size() - spec_.stderr_tail_bytes);
			}
		}
	}

private:
	const ProcessSpec& spec_;
	std::string* tail_;
	bool forwarding_;
};

// Reads the child's stderr until EOF or until the child has exited while a
// descendant (e.g. `cmd &`) still holds the pipe. In the latter case the bytes
// already buffered are taken and the pipe is abandoned. Returns true if the
// child was reaped here, with its status in *wait_status.
bool DrainStderr(int read_fd, pid_t pid, const ProcessSpec& spec,
		std::string* tail, int* wait_status) {
	StderrSink sink(spec, tail);
	char buffer[4096];
	while (true) {
		struct pollfd readable = {read_fd, POLLIN, 0};
		int ready = ::poll(&readable, 1, kReapIntervalMs);
		if (ready < 0) {
			if (errno == EINTR) continue;
			LOG(WARNING) << "Polling child stderr failed: " << strerror(errno);
			return false;
		}
		if (ready == 0) {
			pid_t done = ::waitpid(pid, wait_status, WNOHANG);
			if (done == pid) {
				break;
			}
			if (done < 0 && errno != EINTR) {
				// The blocking waitpid in the caller reports it.
				return false;
			}
			continue;
		}

		ssize_t n = ::read(read_fd, buffer, sizeof(buffer));
		if (n < 0) {
			if (errno == EINTR) continue;
			LOG(WARNING) << "Reading child stderr failed: " << strerror(errno);
			return false;
		}
		if (n == 0) {
			return false;
		}
		sink.Consume(buffer, static_cast<size_t>(n));
	}

	int flags = ::fcntl(read_fd, F_GETFL);
	if (flags >= 0 && ::fcntl(read_fd, F_SETFL, flags | O_NONBLOCK) == 0) {
		while (true) {
			ssize_t n = ::read(read_fd, buffer, sizeof(buffer));
			if (n < 0 && errno == EINTR) continue;
			if (n <= 0) break;
			sink.Consume(buffer, static_cast<size_t>(n));
		}
	}
	VLOG(1) << "pid " << pid << " exited with its stderr still open in a descendant";
	return true;
}

bool ReadChildError(int read_fd, ChildError* error) {
	size_t received = 0;
	char* out = reinterpret_cast<char*>(error);
	while (received < sizeof(ChildError)) {
		ssize_t n = ::read(read_fd, out + received, sizeof(ChildError) - received);
		if (n < 0) {
			if (errno == EINTR) continue;
			return false;
		}
		if (n == 0) {
			break;
		}
		received += static_cast<size_t>(n);
	}
	return received == sizeof(ChildError);
}

ProcessExit SpawnFailure(const std::string& operation, int error_number) {
	ProcessExit result;
	result.kind = ProcessExit::Kind::kSpawnFailed;
	result.exit_code = -1;
	result.failed_operation = operation;
	result.error_number = error_number;
	return result;
}

} // namespace

std::string ProcessExit::Describe() const {
	switch (kind) {
		case Kind::kExited:
			return "exited with status " + std::to_string(exit_code);
		case Kind::kSignaled: {
			const char* name = strsignal(signal);
			return "killed by signal " + std::to_string(signal) + (name ? std::string(" (") + name + ")" : "");
		}
		case Kind::kSpawnFailed:
			return failed_operation + " failed: " + strerror(error_number);
	}
	return "unknown";
}

ProcessExit PosixProcessRunner::Run(const ProcessSpec& spec) {
	if (spec.argv.empty() || spec.argv.front().empty()) {
		return SpawnFailure("exec", EINVAL);
	}

	int resolve_error = 0;
	const std::string executable = ResolveExecutable(spec, &resolve_error);
	if (executable.empty()) {
		return SpawnFailure("exec", resolve_error);
	}

	// Everything the child touches is prepared before fork.
	std::vector<char*> argv = ToCStrings(spec.argv);
	std::vector<char*> envp = ToCStrings(spec.environment);
	const char* working_directory = spec.working_directory.empty() ? nullptr : spec.working_directory.c_str();

	ScopedPipe stderr_pipe;
	ScopedPipe status_pipe;
	if (!stderr_pipe.Open() || !status_pipe.Open()) {
		return SpawnFailure("pipe", errno);
	}

	VLOG(2) << "Spawning " << executable << " with " << spec.argv.size() - 1
		<< " args, " << spec.environment.size() << " env entries, cwd "
		<< (working_directory ? working_directory : "(inherited)");

	pid_t pid = ::fork();
	if (pid < 0) {
		return SpawnFailure("fork", errno);
	}

	if (pid == 0) {
		int status_fd = status_pipe.write_end.get();
		if (::dup2(stderr_pipe.write_end.get(), STDERR_FILENO) < 0) {
			ReportAndExit(status_fd, kStageRedirect, errno);
		}
		if (working_directory && ::chdir(working_directory) != 0) {
			ReportAndExit(status_fd, kStageChdir, errno);
		}
		::execve(executable.c_str(), argv.data(), envp.data());
		ReportAndExit(status_fd, kStageExec, errno);
	}

	// Parent keeps only the read ends so EOF arrives when the child is done.
	stderr_pipe.write_end.reset();
	status_pipe.write_end.reset();

	ProcessExit result;
	int status = 0;
	bool reaped = DrainStderr(stderr_pipe.read_end.get(), pid, spec, &result.stderr_tail, &status);

	ChildError child_error{0, 0};
	bool spawn_failed = ReadChildError(status_pipe.read_end.get(), &child_error);

	while (!reaped && ::waitpid(pid, &status, 0) < 0) {
		if (errno != EINTR) {
			ProcessExit failure = SpawnFailure("waitpid", errno);
			failure.stderr_tail = std::move(result.stderr_tail);
			return failure;
		}
	}

	if (spawn_failed) {
		ProcessExit failure = SpawnFailure(StageName(child_error.stage), child_error.error_number);
		failure.stderr_tail = std::move(result.stderr_tail);
		return failure;
	}

	if (WIFEXITED(status)) {
		result.kind = ProcessExit::Kind::kExited;
		result.exit_code = WEXITSTATUS(status);
	} else if (WIFSIGNALED(status)) {
		result.kind = ProcessExit::Kind::kSignaled;
		result.exit_code = -1;
		result.signal = WTERMSIG(status);
	}
	VLOG(1) << spec.argv.front() << " (pid " << pid << ") " << result.Describe();
	return result;
}

} // namespace Bootstrap
