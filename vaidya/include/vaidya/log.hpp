#pragma once
// Logging: stderr diagnostics for the engine and the CLI
//
// Regular messages are written directly as "[component] message" lines.
// Debug messages go through log_debug() and are only emitted in verbose
// mode (--verbose or VAIDYA_VERBOSE=1).

namespace vaidya {

void set_verbose(bool enabled);

// printf-style, prefixed with [HH:MM:SS.mmm][component]
void log_debug(const char* component, const char* fmt, ...);

} // namespace vaidya
