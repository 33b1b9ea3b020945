#pragma once
// Child Process: a spawned tool server with piped stdin/stdout/stderr
//
// The child runs in its own process group so that kill() also takes down
// anything it forked. The destructor kills and reaps, so a ChildProcess
// never outlives its owner as a running process.

#include <vaidya/types.hpp>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <sys/types.h>

namespace vaidya {

class ChildProcess {
public:
    ChildProcess() = default;
    ~ChildProcess();

    // Non-copyable, non-movable (owns pid and file descriptors)
    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;
    ChildProcess(ChildProcess&&) = delete;
    ChildProcess& operator=(ChildProcess&&) = delete;

    // Launch `command` (searched on PATH when it has no slash) with the
    // inherited environment plus `env_overrides`. Returns false with
    // last_error() set when the executable cannot be started.
    bool spawn(const std::string& command,
               const std::vector<std::string>& args,
               const std::map<std::string, std::string>& env_overrides);

    // Write all of `data` to the child's stdin. SIGPIPE is suppressed;
    // a closed pipe returns false.
    bool write(const std::string& data);

    // Non-blocking readable ends; -1 once closed
    int stdout_fd() const { return stdout_fd_; }
    int stderr_fd() const { return stderr_fd_; }

    // Becomes readable when the child exits (-1 if the kernel has no pidfd)
    int exit_fd() const { return pidfd_; }

    void close_stdout();
    void close_stderr();

    // Observe exit without blocking. The process stays unreaped (and its
    // group id reserved) until kill().
    std::optional<ExitStatus> try_wait();

    // SIGKILL the process group and reap. Safe to call repeatedly.
    void kill();

    const std::string& last_error() const { return last_error_; }

private:
    pid_t pid_ = -1;
    int stdin_fd_ = -1;
    int stdout_fd_ = -1;
    int stderr_fd_ = -1;
    int pidfd_ = -1;
    bool reaped_ = false;
    std::optional<ExitStatus> status_;
    std::string last_error_;

    void close_fds();
};

} // namespace vaidya
