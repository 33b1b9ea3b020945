// vaidya: diagnostics for externally launched MCP tool servers
//
// Usage: vaidya <command> [options]
//
// Commands:
//   diagnose   Validate every declaration file, optionally probe servers
//   validate   Validate specific declaration files
//   probe      Launch one server and list its tools/resources/prompts
//   help       Show this help

#include <vaidya/config.hpp>
#include <vaidya/diagnostics.hpp>
#include <vaidya/discovery.hpp>
#include <vaidya/log.hpp>
#include <vaidya/prober.hpp>
#include <vaidya/report.hpp>
#include <vaidya/validator.hpp>
#include <vaidya/version.hpp>
#include <iostream>
#include <string>
#include <vector>
#include <cstring>
#include <cstdlib>
#include <csignal>

using namespace vaidya;

struct CliOptions {
    bool json_output = false;
    bool probe = false;
    std::vector<std::string> positional;
};

// Get program name from path
static const char* prog_name(const char* path) {
    const char* last = path;
    for (const char* p = path; *p; ++p) {
        if (*p == '/') last = p + 1;
    }
    return last;
}

void print_usage(const char* prog) {
    const char* name = prog_name(prog);
    std::cerr << "vaidya " << VAIDYA_VERSION << " - MCP server diagnostics\n\n"
              << "Usage: " << name << " <command> [options]\n\n"
              << "Commands:\n"
              << "  diagnose [FILE...]   Validate declaration files (default: discovered)\n"
              << "  validate FILE...     Validate the given declaration files\n"
              << "  probe NAME           Launch a server and list its capabilities\n"
              << "  help                 Show this help\n\n"
              << "Options:\n"
              << "  --probe              diagnose: also probe every valid server\n"
              << "  --json               Output as JSON\n"
              << "  --project DIR        Project directory (default: current directory)\n"
              << "  --timeout MS         Per-server probe deadline (default: "
              << Config::DEFAULT_PROBE_TIMEOUT_MS << ")\n"
              << "  --verbose            Enable verbose debug logging\n"
              << "  -v, --version        Show version\n\n"
              << "Environment:\n"
              << "  CLAUDE_CONFIG_DIR, VAIDYA_PROBE_TIMEOUT_MS, VAIDYA_VERBOSE\n";
}

std::vector<SourceDocument> sources_for(const Config& config, const CliOptions& opts) {
    if (!opts.positional.empty()) {
        return load_source_documents(opts.positional);
    }
    return load_source_documents(find_declaration_files(config));
}

int cmd_diagnose(const Config& config, const CliOptions& opts) {
    DiagnosticOptions options;
    options.probe = opts.probe;
    options.timeout_ms = config.probe_timeout_ms;

    auto report = diagnose(sources_for(config, opts), options);

    if (opts.json_output) {
        std::cout << to_json(report).dump(2, ' ', false, json::error_handler_t::replace) << "\n";
    } else {
        std::cout << format_report(report);
    }
    return 0;
}

int cmd_validate(const CliOptions& opts) {
    if (opts.positional.empty()) {
        std::cerr << "Usage: vaidya validate FILE... [--json]\n";
        return 1;
    }

    bool all_valid = true;
    json results = json::array();

    for (const auto& doc : load_source_documents(opts.positional)) {
        auto result = validate_document(doc);
        all_valid = all_valid && result.valid;

        if (opts.json_output) {
            results.push_back(to_json(result));
            continue;
        }

        std::cout << doc.path << ": " << (result.valid ? "valid" : "invalid")
                  << " (" << result.services.size() << " server(s), "
                  << result.issues.size() << " issue(s))\n";
        for (const auto& issue : result.issues) {
            std::cout << "  " << severity_to_string(issue.severity)
                      << " [" << issue.service << "] " << issue.message << "\n";
            if (issue.fix) std::cout << "    Fix: " << *issue.fix << "\n";
        }
    }

    if (opts.json_output) {
        std::cout << results.dump(2, ' ', false, json::error_handler_t::replace) << "\n";
    }
    return all_valid ? 0 : 1;
}

int cmd_probe(const Config& config, const CliOptions& opts) {
    if (opts.positional.size() != 1) {
        std::cerr << "Usage: vaidya probe NAME [--project DIR] [--timeout MS] [--json]\n";
        return 1;
    }
    const std::string& name = opts.positional[0];

    // Validation only; probing a single server is done below
    auto report = diagnose(load_source_documents(find_declaration_files(config)));
    auto service = find_service(report, name);
    if (!service) {
        std::cerr << "[vaidya] Server not found: " << name << "\n";
        return 1;
    }

    CapabilityProber prober;
    auto result = prober.probe(*service, config.probe_timeout_ms);

    if (opts.json_output) {
        json j = to_json(result);
        j["server"] = service->name;
        j["source"] = service->source.to_string();
        std::cout << j.dump(2, ' ', false, json::error_handler_t::replace) << "\n";
    } else {
        std::cout << format_probe_result(name, result);
    }
    return result.error ? 1 : 0;
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    // Writes to an exited server must not take the CLI down
    std::signal(SIGPIPE, SIG_IGN);

    Config config = Config::from_env();
    CliOptions opts;
    std::string command = argv[1];

    if (command == "help" || command == "--help" || command == "-h") {
        print_usage(argv[0]);
        return 0;
    }
    if (command == "-v" || command == "--version") {
        std::cout << "vaidya " << VAIDYA_VERSION << "\n";
        return 0;
    }

    for (int i = 2; i < argc; ++i) {
        if (strcmp(argv[i], "--json") == 0) {
            opts.json_output = true;
        } else if (strcmp(argv[i], "--probe") == 0) {
            opts.probe = true;
        } else if (strcmp(argv[i], "--verbose") == 0) {
            config.verbose = true;
        } else if (strcmp(argv[i], "--project") == 0 && i + 1 < argc) {
            config.project_dir = argv[++i];
        } else if (strcmp(argv[i], "--timeout") == 0 && i + 1 < argc) {
            int ms = std::atoi(argv[++i]);
            if (ms <= 0) {
                std::cerr << "Invalid --timeout: " << argv[i] << "\n";
                return 1;
            }
            config.probe_timeout_ms = ms;
        } else if (argv[i][0] == '-' && argv[i][1] == '-') {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        } else {
            opts.positional.push_back(argv[i]);
        }
    }

    set_verbose(config.verbose);
    log_debug("vaidya", "home=%s claude_dir=%s project=%s timeout=%dms",
              config.home_dir.c_str(), config.claude_dir.c_str(),
              config.project_dir.c_str(), config.probe_timeout_ms);

    if (command == "diagnose") {
        return cmd_diagnose(config, opts);
    }
    if (command == "validate") {
        return cmd_validate(opts);
    }
    if (command == "probe") {
        return cmd_probe(config, opts);
    }

    std::cerr << "Unknown command: " << command << "\n";
    print_usage(argv[0]);
    return 1;
}
