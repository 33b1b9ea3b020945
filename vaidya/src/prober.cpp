#include <vaidya/prober.hpp>
#include <vaidya/child_process.hpp>
#include <vaidya/descriptor.hpp>
#include <vaidya/log.hpp>
#include <vaidya/rpc/protocol.hpp>
#include <poll.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>

namespace vaidya {

namespace {

using Clock = std::chrono::steady_clock;

// Exit polling interval when the kernel offers no pidfd
constexpr int EXIT_CHECK_INTERVAL_MS = 50;

// Milliseconds until `deadline`, rounded up so poll() never wakes early
int remaining_ms(Clock::time_point deadline) {
    auto left = deadline - Clock::now();
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(left).count();
    if (std::chrono::milliseconds(ms) < left) ++ms;
    return ms > 0 ? static_cast<int>(ms) : 0;
}

// Upper bound on bytes consumed from one fd per poll() wakeup
constexpr size_t READ_BUDGET_BYTES = 64 * 1024;

enum class ReadStatus {
    Drained,    // EAGAIN, more may come later
    Throttled,  // budget spent, fd still readable
    Closed      // EOF or error, fd closed
};

// Read what is currently available from `fd` into `sink`, at most
// READ_BUDGET_BYTES, so the caller gets back to its deadline check
template <typename Sink>
ReadStatus drain(int fd, Sink&& sink) {
    char buf[4096];
    size_t consumed = 0;
    while (consumed < READ_BUDGET_BYTES) {
        ssize_t n = read(fd, buf, sizeof(buf));
        if (n > 0) {
            consumed += static_cast<size_t>(n);
            sink(buf, static_cast<size_t>(n));
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return ReadStatus::Drained;
        return ReadStatus::Closed;
    }
    return ReadStatus::Throttled;
}

}  // anonymous namespace

CapabilityProbeResult CapabilityProber::probe(const ServiceDescriptor& descriptor,
                                              int timeout_ms) const {
    const auto start = Clock::now();
    const auto deadline = start + std::chrono::milliseconds(timeout_ms);

    ProbeSession session(identity_);

    auto finalize = [&]() {
        auto result = session.result();
        result.elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            Clock::now() - start).count();
        log_debug("prober", "'%s' finished: %s in %lldms", descriptor.name.c_str(),
                  probe_outcome_to_string(result.outcome),
                  static_cast<long long>(result.elapsed_ms));
        return result;
    };

    // Resolve ${...} placeholders before launch
    std::string unresolved;
    auto command = expand_placeholders(descriptor.command, descriptor.env, unresolved);
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
    bool resolved = command.has_value();

    for (const auto& arg : descriptor.args) {
        if (!resolved) break;
        auto expanded = expand_placeholders(arg, descriptor.env, unresolved);
        if (!expanded) {
            resolved = false;
            break;
        }
        args.push_back(std::move(*expanded));
    }
    for (const auto& [key, value] : descriptor.env) {
        if (!resolved) break;
        auto expanded = expand_placeholders(value, descriptor.env, unresolved);
        if (!expanded) {
            resolved = false;
            break;
        }
        env[key] = std::move(*expanded);
    }

    if (!resolved) {
        session.on_transport_error("Command contains unresolved variable '" + unresolved + "'");
        return finalize();
    }
    if (command->empty()) {
        session.on_transport_error("Missing 'command' field");
        return finalize();
    }

    ChildProcess child;
    if (!child.spawn(*command, args, env)) {
        session.on_transport_error(child.last_error());
        return finalize();
    }

    rpc::LineBuffer stdout_buffer;
    std::string stderr_tail;

    auto send = [&](const std::vector<std::string>& lines) {
        for (const auto& line : lines) {
            if (!child.write(line)) {
                // Peer stopped reading; its exit (or the deadline) settles the probe
                log_debug("prober", "'%s': %s", descriptor.name.c_str(), child.last_error().c_str());
                return;
            }
        }
    };

    // Returns true while the budget ran out with output still pending
    auto pump_stdout = [&]() {
        if (child.stdout_fd() < 0) return false;
        auto status = drain(child.stdout_fd(), [&](const char* data, size_t len) {
            if (session.finished()) return;
            stdout_buffer.append(data, len);
            while (stdout_buffer.has_complete_line() && !session.finished()) {
                send(session.on_line(stdout_buffer.extract_line()));
            }
            if (stdout_buffer.pending() > MAX_LINE_BYTES) {
                session.on_transport_error("Server output line exceeds " +
                                           std::to_string(MAX_LINE_BYTES) + " bytes");
            }
        });
        if (status == ReadStatus::Closed) child.close_stdout();
        return status == ReadStatus::Throttled;
    };

    auto pump_stderr = [&]() {
        if (child.stderr_fd() < 0) return;
        auto status = drain(child.stderr_fd(), [&](const char* data, size_t len) {
            stderr_tail.append(data, len);
            if (stderr_tail.size() > STDERR_TAIL_BYTES) {
                stderr_tail.erase(0, stderr_tail.size() - STDERR_TAIL_BYTES);
            }
        });
        if (status == ReadStatus::Closed) child.close_stderr();
    };

    send(session.begin());

    while (!session.finished()) {
        if (Clock::now() >= deadline) {
            session.on_timeout();
            break;
        }

        int wait_ms = remaining_ms(deadline);
        const bool has_pidfd = child.exit_fd() >= 0;
        if (!has_pidfd) wait_ms = std::min(wait_ms, EXIT_CHECK_INTERVAL_MS);

        pollfd fds[3];
        nfds_t count = 0;
        int out_idx = -1, err_idx = -1, exit_idx = -1;
        if (child.stdout_fd() >= 0) {
            out_idx = static_cast<int>(count);
            fds[count++] = {child.stdout_fd(), POLLIN, 0};
        }
        if (child.stderr_fd() >= 0) {
            err_idx = static_cast<int>(count);
            fds[count++] = {child.stderr_fd(), POLLIN, 0};
        }
        if (has_pidfd) {
            exit_idx = static_cast<int>(count);
            fds[count++] = {child.exit_fd(), POLLIN, 0};
        }

        int ret = ::poll(fds, count, wait_ms);
        if (ret < 0) {
            if (errno == EINTR) continue;
            session.on_transport_error(std::string("poll() failed: ") + strerror(errno));
            break;
        }

        if (out_idx >= 0 && fds[out_idx].revents != 0) pump_stdout();
        if (err_idx >= 0 && fds[err_idx].revents != 0) pump_stderr();
        if (session.finished()) break;

        bool check_exit = has_pidfd ? (exit_idx >= 0 && fds[exit_idx].revents != 0) : true;
        if (check_exit) {
            if (auto status = child.try_wait()) {
                // Whatever the server wrote before exiting still counts,
                // as long as the deadline allows
                while (pump_stdout() && !session.finished() && Clock::now() < deadline) {
                }
                pump_stderr();
                session.on_exit(*status);
            }
        }
    }

    child.kill();

    if (!stderr_tail.empty() && session.state() != ProbeSession::State::Complete) {
        log_debug("prober", "'%s' stderr tail:\n%s", descriptor.name.c_str(), stderr_tail.c_str());
    }

    return finalize();
}

} // namespace vaidya
