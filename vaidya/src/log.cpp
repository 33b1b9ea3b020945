#include <vaidya/log.hpp>
#include <atomic>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <iostream>

namespace vaidya {

namespace {

std::atomic<bool> verbose_mode{false};

}  // anonymous namespace

void set_verbose(bool enabled) {
    verbose_mode.store(enabled);
}

void log_debug(const char* component, const char* fmt, ...) {
    if (!verbose_mode) return;

    auto now = std::chrono::system_clock::now();
    auto now_time_t = std::chrono::system_clock::to_time_t(now);
    auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm local{};
    localtime_r(&now_time_t, &local);
    char time_buf[32];
    std::strftime(time_buf, sizeof(time_buf), "%H:%M:%S", &local);

    std::cerr << "[" << time_buf << "." << std::setfill('0') << std::setw(3)
              << now_ms.count() << "][" << component << "] ";
    std::cerr.flush();

    va_list args;
    va_start(args, fmt);
    vfprintf(stderr, fmt, args);
    va_end(args);
    std::fputc('\n', stderr);
    std::fflush(stderr);
}

} // namespace vaidya
