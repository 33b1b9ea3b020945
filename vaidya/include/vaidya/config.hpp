#pragma once
// Config: environment-derived settings shared by the walker and the CLI
//
//   HOME                     home directory (~/.claude.json lives here)
//   CLAUDE_CONFIG_DIR        claude directory (default: $HOME/.claude)
//   VAIDYA_PROBE_TIMEOUT_MS  per-service probe deadline (default: 10000)
//   VAIDYA_VERBOSE           "1" enables debug logging
//
// Command-line flags override the environment.

#include <string>
#include <cstdlib>
#include <unistd.h>

namespace vaidya {

struct Config {
    static constexpr int DEFAULT_PROBE_TIMEOUT_MS = 10000;

    std::string home_dir;
    std::string claude_dir;
    std::string project_dir;
    int probe_timeout_ms = DEFAULT_PROBE_TIMEOUT_MS;
    bool verbose = false;

    static Config from_env() {
        Config config;

        const char* home = std::getenv("HOME");
        config.home_dir = home ? home : ".";

        if (const char* claude_dir = std::getenv("CLAUDE_CONFIG_DIR")) {
            config.claude_dir = claude_dir;
        } else {
            config.claude_dir = config.home_dir + "/.claude";
        }

        char cwd[4096];
        if (getcwd(cwd, sizeof(cwd))) {
            config.project_dir = cwd;
        } else {
            config.project_dir = ".";
        }

        if (const char* timeout = std::getenv("VAIDYA_PROBE_TIMEOUT_MS")) {
            int ms = std::atoi(timeout);
            if (ms > 0) config.probe_timeout_ms = ms;
        }

        if (const char* v = std::getenv("VAIDYA_VERBOSE")) {
            config.verbose = std::string(v) == "1";
        }

        return config;
    }
};

} // namespace vaidya
