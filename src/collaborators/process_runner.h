#pragma once

#include <string>
#include <vector>

#include <unistd.h>

namespace Bootstrap {

struct ProcessSpec {
    std::vector<std::string> argv;        // argv[0] is looked up on the PATH in environment
    std::string working_directory;        // empty keeps the current directory
    std::vector<std::string> environment; // NAME=value entries, replaces the environment
    size_t stderr_tail_bytes = 4096;      // 0 disables capture
    int forward_stderr_fd = STDERR_FILENO; // -1 disables live forwarding
};

struct ProcessExit {
    enum class Kind {
        kExited,
        kSignaled,
        kSpawnFailed
    };

    Kind kind = Kind::kExited;
    int exit_code = 0;
    int signal = 0;
    int error_number = 0;
    // Operation that failed when kind is kSpawnFailed (pipe, fork, chdir, exec, waitpid).
    std::string failed_operation;
    std::string stderr_tail;

    bool success() const { return kind == Kind::kExited && exit_code == 0; }
    std::string Describe() const;
};

/**
 * Interface for running one child process to completion
 */
class IProcessRunner {
public:
    virtual ~IProcessRunner() = default;

    virtual ProcessExit Run(const ProcessSpec& spec) = 0;
};

/**
 * fork/execve runner. Blocks the calling thread until the child exits,
 * streaming the child's stderr through while keeping its tail.
 */
class PosixProcessRunner : public IProcessRunner {
public:
    ProcessExit Run(const ProcessSpec& spec) override;
};

} // namespace Bootstrap
