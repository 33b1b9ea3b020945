#include <vaidya/child_process.hpp>
#include <vaidya/log.hpp>
#include <sys/syscall.h>
#include <sys/wait.h>
#include <unistd.h>
#include <fcntl.h>
#include <csignal>
#include <cerrno>
#include <cstring>
#include <ctime>

extern char** environ;

namespace vaidya {

namespace {

void close_fd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

void set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags >= 0) {
        fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }
}

int open_pidfd(pid_t pid) {
#ifdef SYS_pidfd_open
    long fd = syscall(SYS_pidfd_open, pid, 0);
    if (fd >= 0) return static_cast<int>(fd);
    log_debug("process", "pidfd_open unavailable: %s", strerror(errno));
#else
    (void)pid;
#endif
    return -1;
}

// Inherited environment with overrides applied, as KEY=VALUE strings
std::vector<std::string> merged_environment(const std::map<std::string, std::string>& overrides) {
    std::vector<std::string> env;
    for (char** e = environ; e && *e; ++e) {
        std::string entry(*e);
        auto eq = entry.find('=');
        std::string key = eq == std::string::npos ? entry : entry.substr(0, eq);
        if (overrides.count(key) == 0) {
            env.push_back(std::move(entry));
        }
    }
    for (const auto& [key, value] : overrides) {
        env.push_back(key + "=" + value);
    }
    return env;
}

}  // anonymous namespace

ChildProcess::~ChildProcess() {
    kill();
}

bool ChildProcess::spawn(const std::string& command,
                         const std::vector<std::string>& args,
                         const std::map<std::string, std::string>& env_overrides) {
    if (pid_ > 0) {
        last_error_ = "Process already spawned";
        return false;
    }

    // Everything the child needs is built before fork()
    std::vector<const char*> argv;
    argv.push_back(command.c_str());
    for (const auto& arg : args) argv.push_back(arg.c_str());
    argv.push_back(nullptr);

    std::vector<std::string> env = merged_environment(env_overrides);
    std::vector<const char*> envp;
    envp.reserve(env.size() + 1);
    for (const auto& entry : env) envp.push_back(entry.c_str());
    envp.push_back(nullptr);

    int in_pipe[2] = {-1, -1};
    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};  // carries errno if exec fails

    auto close_all = [&]() {
        for (int* p : {in_pipe, out_pipe, err_pipe, exec_pipe}) {
            close_fd(p[0]);
            close_fd(p[1]);
        }
    };

    if (pipe2(in_pipe, O_CLOEXEC) < 0 || pipe2(out_pipe, O_CLOEXEC) < 0 ||
        pipe2(err_pipe, O_CLOEXEC) < 0 || pipe2(exec_pipe, O_CLOEXEC) < 0) {
        last_error_ = std::string("pipe() failed: ") + strerror(errno);
        close_all();
        return false;
    }

    pid_t pid = fork();
    if (pid < 0) {
        last_error_ = std::string("fork() failed: ") + strerror(errno);
        close_all();
        return false;
    }

    if (pid == 0) {
        // Child: own process group, default signal state, pipes on 0/1/2
        setpgid(0, 0);
        signal(SIGPIPE, SIG_DFL);
        sigset_t none;
        sigemptyset(&none);
        sigprocmask(SIG_SETMASK, &none, nullptr);

        dup2(in_pipe[0], STDIN_FILENO);
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);

        execvpe(argv[0], const_cast<char* const*>(argv.data()),
                const_cast<char* const*>(envp.data()));

        int err = errno;
        ssize_t ignored = ::write(exec_pipe[1], &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    // Parent. Also set the group here so kill() works even if the child
    // has not run yet.
    setpgid(pid, pid);
    pid_ = pid;

    close_fd(in_pipe[0]);
    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);
    close_fd(exec_pipe[1]);

    int exec_errno = 0;
    ssize_t n;
    do {
        n = read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    close_fd(exec_pipe[0]);

    stdin_fd_ = in_pipe[1];
    stdout_fd_ = out_pipe[0];
    stderr_fd_ = err_pipe[0];

    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        last_error_ = "Failed to start '" + command + "': " + strerror(exec_errno);
        kill();
        return false;
    }

    set_nonblocking(stdout_fd_);
    set_nonblocking(stderr_fd_);
    pidfd_ = open_pidfd(pid_);

    log_debug("process", "Spawned '%s' (pid=%d)", command.c_str(), static_cast<int>(pid_));
    return true;
}

bool ChildProcess::write(const std::string& data) {
    if (stdin_fd_ < 0) {
        last_error_ = "stdin closed";
        return false;
    }

    // Block SIGPIPE for this thread; a pending one is consumed below
    sigset_t pipe_set, old_set;
    sigemptyset(&pipe_set);
    sigaddset(&pipe_set, SIGPIPE);
    pthread_sigmask(SIG_BLOCK, &pipe_set, &old_set);

    bool ok = true;
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = ::write(stdin_fd_, data.data() + sent, data.size() - sent);
        if (n < 0) {
            if (errno == EINTR) continue;
            last_error_ = std::string("write() failed: ") + strerror(errno);
            if (errno == EPIPE) {
                struct timespec zero = {0, 0};
                sigtimedwait(&pipe_set, nullptr, &zero);
                close_fd(stdin_fd_);
            }
            ok = false;
            break;
        }
        sent += static_cast<size_t>(n);
    }

    pthread_sigmask(SIG_SETMASK, &old_set, nullptr);
    return ok;
}

void ChildProcess::close_stdout() {
    close_fd(stdout_fd_);
}

void ChildProcess::close_stderr() {
    close_fd(stderr_fd_);
}

std::optional<ExitStatus> ChildProcess::try_wait() {
    if (status_ || pid_ <= 0) return status_;

    siginfo_t info;
    memset(&info, 0, sizeof(info));
    if (waitid(P_PID, static_cast<id_t>(pid_), &info, WEXITED | WNOHANG | WNOWAIT) < 0) {
        return std::nullopt;
    }
    if (info.si_pid != pid_) {
        return std::nullopt;  // still running
    }

    ExitStatus status;
    status.signaled = info.si_code == CLD_KILLED || info.si_code == CLD_DUMPED;
    status.code = info.si_status;
    status_ = status;
    return status_;
}

void ChildProcess::kill() {
    if (pid_ > 0 && !reaped_) {
        // Not reaped yet, so the group id cannot have been recycled
        ::kill(-pid_, SIGKILL);
        ::kill(pid_, SIGKILL);

        int status = 0;
        pid_t r;
        do {
            r = waitpid(pid_, &status, 0);
        } while (r < 0 && errno == EINTR);
        reaped_ = true;

        if (!status_ && r == pid_) {
            ExitStatus s;
            s.signaled = WIFSIGNALED(status);
            s.code = s.signaled ? WTERMSIG(status) : WEXITSTATUS(status);
            status_ = s;
        }
        log_debug("process", "Reaped pid=%d", static_cast<int>(pid_));
    }
    close_fds();
}

void ChildProcess::close_fds() {
    close_fd(stdin_fd_);
    close_fd(stdout_fd_);
    close_fd(stderr_fd_);
    close_fd(pidfd_);
}

} // namespace vaidya
