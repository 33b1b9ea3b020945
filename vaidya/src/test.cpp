#include <vaidya/descriptor.hpp>
#include <vaidya/diagnostics.hpp>
#include <vaidya/discovery.hpp>
#include <vaidya/probe_session.hpp>
#include <vaidya/report.hpp>
#include <vaidya/validator.hpp>
#include <iostream>
#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <set>
#include <unistd.h>

using namespace vaidya;

namespace fs = std::filesystem;

SourceDocument doc(const std::string& path, const std::string& content) {
    return SourceDocument{path, content, ""};
}

size_t count_severity(const ValidationResult& r, Severity severity) {
    size_t n = 0;
    for (const auto& i : r.issues) {
        if (i.severity == severity) ++n;
    }
    return n;
}

bool has_kind(const ValidationResult& r, IssueKind kind) {
    for (const auto& i : r.issues) {
        if (i.kind == kind) return true;
    }
    return false;
}

std::string response(int id, const json& result) {
    return json{{"jsonrpc", "2.0"}, {"id", id}, {"result", result}}.dump();
}

std::string error_response(int id, int code, const std::string& message) {
    return json{{"jsonrpc", "2.0"}, {"id", id},
                {"error", {{"code", code}, {"message", message}}}}.dump();
}

// ═══════════════════════════════════════════════════════════════════
// Extraction
// ═══════════════════════════════════════════════════════════════════

void test_extract_server_map() {
    std::cout << "Testing extraction of server map..." << std::endl;

    auto result = extract_descriptors(doc("/work/.mcp.json", R"({
        "mcpServers": {
            "search": {"type": "stdio", "command": "node", "args": ["server.js", "--port", "0"],
                       "env": {"API_KEY": "k", "DEBUG": ""}},
            "broken": 42,
            "bare": {}
        }
    })"));

    assert(result.issues.empty());
    assert(result.descriptors.size() == 2);

    const auto& bare = result.descriptors[0];
    const auto& search = result.descriptors[1];
    assert(bare.name == "bare");
    assert(bare.command.empty());
    assert(bare.transport_type.empty());

    assert(search.name == "search");
    assert(search.command == "node");
    assert(search.transport_type == "stdio");
    assert((search.args == std::vector<std::string>{"server.js", "--port", "0"}));
    assert(search.env.size() == 2);
    assert(search.env.at("API_KEY") == "k");
    assert(search.source.to_string() == "/work/.mcp.json");

    std::cout << "  PASS" << std::endl;
}

void test_extract_project_overrides() {
    std::cout << "Testing extraction of project overrides..." << std::endl;

    auto result = extract_descriptors(doc("/home/me/.claude.json", R"({
        "mcpServers": {"memory": {"command": "sh"}},
        "projects": {
            "/home/me/app": {"mcpServers": {"memory": {"command": "sh"}, "db": {"command": "sh"}}},
            "/home/me/empty": {"allowedTools": []},
            "/home/me/odd": "not an object"
        }
    })"));

    assert(result.issues.empty());
    assert(result.descriptors.size() == 3);
    assert(result.descriptors[0].source.scope.empty());

    size_t in_project = 0;
    for (const auto& d : result.descriptors) {
        if (d.source.scope == "/home/me/app") {
            ++in_project;
            assert(d.source.to_string() == "/home/me/.claude.json [project: /home/me/app]");
        }
    }
    assert(in_project == 2);

    // Settings documents may legitimately have no top-level servers
    auto only_projects = extract_descriptors(doc("/home/me/.claude.json", R"({"projects": {}})"));
    assert(only_projects.issues.empty());
    assert(only_projects.descriptors.empty());

    std::cout << "  PASS" << std::endl;
}

void test_extract_unparseable() {
    std::cout << "Testing unparseable documents..." << std::endl;

    const char* bad[] = {
        "{not json",
        "[1, 2, 3]",
        R"({"mcpServers": []})",
        R"({"somethingElse": {}})",
    };

    for (const char* content : bad) {
        auto result = extract_descriptors(doc("/work/.mcp.json", content));
        assert(result.descriptors.empty());
        assert(result.issues.size() == 1);
        assert(result.issues[0].kind == IssueKind::DocumentUnparseable);
        assert(result.issues[0].severity == Severity::Error);
        assert(result.issues[0].service == DOCUMENT_SCOPE);
    }

    auto settings = extract_descriptors(doc("/h/.claude.json", R"({"projects": []})"));
    assert(settings.issues.size() == 1);

    SourceDocument unreadable{"/work/missing.json", "", "cannot open file: No such file or directory"};
    auto missing = validate_document(unreadable);
    assert(!missing.valid);
    assert(missing.services.empty());
    assert(missing.issues.size() == 1);
    assert(missing.issues[0].message.find("Failed to parse") != std::string::npos);

    std::cout << "  PASS" << std::endl;
}

void test_expand_placeholders() {
    std::cout << "Testing placeholder expansion..." << std::endl;

    setenv("VAIDYA_TEST_ROOT", "/opt/tools", 1);
    unsetenv("VAIDYA_TEST_UNSET");

    std::string unresolved;
    std::map<std::string, std::string> overrides = {{"VAIDYA_TEST_ROOT", "/override"}};

    auto a = expand_placeholders("${VAIDYA_TEST_ROOT}/bin/server", {}, unresolved);
    assert(a && *a == "/opt/tools/bin/server");

    auto b = expand_placeholders("${VAIDYA_TEST_ROOT}/bin/server", overrides, unresolved);
    assert(b && *b == "/override/bin/server");

    auto c = expand_placeholders("${VAIDYA_TEST_UNSET:-fallback}-x", {}, unresolved);
    assert(c && *c == "fallback-x");

    auto d = expand_placeholders("pre-${VAIDYA_TEST_UNSET}-post", {}, unresolved);
    assert(!d);
    assert(unresolved == "${VAIDYA_TEST_UNSET}");

    auto e = expand_placeholders("no placeholders ${ here", {}, unresolved);
    assert(e && *e == "no placeholders ${ here");

    assert(has_placeholder("${X}"));
    assert(!has_placeholder("$X"));
    assert(!has_placeholder("${unterminated"));

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════
// Validator
// ═══════════════════════════════════════════════════════════════════

void test_validate_correct_config() {
    std::cout << "Testing validation of correct config..." << std::endl;

    auto result = validate_document(doc("/work/.mcp.json", R"({
        "mcpServers": {"test-server": {"type": "stdio", "command": "sh", "args": ["server.js"]}}
    })"));

    assert(result.valid);
    assert(result.services.size() == 1);
    assert(result.services[0].name == "test-server");
    assert(result.issues.empty());

    std::cout << "  PASS" << std::endl;
}

void test_validate_missing_command() {
    std::cout << "Testing missing command..." << std::endl;

    auto result = validate_document(doc("/work/.mcp.json", R"({
        "mcpServers": {"broken-server": {"type": "stdio", "args": ["/nonexistent/arg"]}}
    })"));

    assert(!result.valid);
    assert(count_severity(result, Severity::Error) == 1);
    assert(result.issues[0].severity == Severity::Error);
    assert(result.issues[0].message.find("command") != std::string::npos);
    assert(result.issues[0].fix.has_value());
    // Argument checks are skipped once the command is missing
    assert(!has_kind(result, IssueKind::PathNotFound));

    std::cout << "  PASS" << std::endl;
}

void test_validate_command_resolution() {
    std::cout << "Testing command resolution..." << std::endl;

    auto missing = validate_document(doc("/work/.mcp.json", R"({
        "mcpServers": {"missing-binary": {"type": "stdio", "command": "nonexistent-binary-xyz-12345"}}
    })"));
    assert(!missing.valid);
    assert(has_kind(missing, IssueKind::BinaryNotFound));
    assert(missing.issues[0].message.find("not found") != std::string::npos);
    assert(missing.issues[0].fix->find("nonexistent-binary-xyz-12345") != std::string::npos);

    auto absolute = validate_document(doc("/work/.mcp.json", R"({
        "mcpServers": {"abs": {"type": "stdio", "command": "/nonexistent/dir/server"}}
    })"));
    assert(!absolute.valid);
    assert(has_kind(absolute, IssueKind::BinaryNotFound));

    assert(command_exists("sh"));
    assert(command_exists("/bin/sh"));
    assert(!command_exists(""));

    std::cout << "  PASS" << std::endl;
}

void test_validate_templated_command() {
    std::cout << "Testing templated commands skip resolution..." << std::endl;

    unsetenv("VAIDYA_TEST_UNSET");
    auto result = validate_document(doc("/work/.mcp.json", R"({
        "mcpServers": {
            "plugin": {"type": "stdio", "command": "${CLAUDE_PLUGIN_ROOT}/bin/server"},
            "unset": {"type": "stdio", "command": "${VAIDYA_TEST_UNSET}"},
            "literal": {"type": "stdio", "command": "/bin/sh${NOTHING}"}
        }
    })"));

    assert(result.valid);
    assert(!has_kind(result, IssueKind::BinaryNotFound));

    std::cout << "  PASS" << std::endl;
}

void test_validate_warnings_and_info() {
    std::cout << "Testing argument, env and type checks..." << std::endl;

    auto result = validate_document(doc("/work/.mcp.json", R"({
        "mcpServers": {
            "srv": {
                "command": "sh",
                "args": ["/nonexistent/path/server.js", "/bin/sh", "${ROOT}/missing", "relative/missing"],
                "env": {"API_KEY": "", "TOKEN": "", "OK": "1"}
            }
        }
    })"));

    // Warnings and info never invalidate a source
    assert(result.valid);

    size_t path_warnings = 0, env_warnings = 0, type_infos = 0;
    for (const auto& issue : result.issues) {
        assert(issue.service == "srv");
        assert(issue.source == "/work/.mcp.json");
        if (issue.kind == IssueKind::PathNotFound) {
            assert(issue.severity == Severity::Warning);
            assert(issue.message.find("does not exist") != std::string::npos);
            assert(issue.message.find("/nonexistent/path/server.js") != std::string::npos);
            ++path_warnings;
        } else if (issue.kind == IssueKind::EmptyEnvironmentValue) {
            assert(issue.severity == Severity::Warning);
            ++env_warnings;
        } else if (issue.kind == IssueKind::MissingTypeHint) {
            assert(issue.severity == Severity::Info);
            ++type_infos;
        }
    }
    assert(path_warnings == 1);
    assert(env_warnings == 2);
    assert(type_infos == 1);

    std::cout << "  PASS" << std::endl;
}

void test_validate_accumulates_per_descriptor() {
    std::cout << "Testing issues accumulate across siblings..." << std::endl;

    auto result = validate_document(doc("/work/.mcp.json", R"({
        "mcpServers": {
            "a": {"command": ""},
            "b": {"type": "stdio", "command": "nonexistent-binary-xyz-12345", "env": {"X": ""}},
            "c": {"type": "stdio", "command": "sh"}
        }
    })"));

    assert(!result.valid);
    assert(result.services.size() == 3);
    assert(count_severity(result, Severity::Error) == 2);
    assert(result.has_error_for(result.services[0]));
    assert(result.has_error_for(result.services[1]));
    assert(!result.has_error_for(result.services[2]));

    std::cout << "  PASS" << std::endl;
}

void test_validate_env_warning_order() {
    std::cout << "Testing empty env warnings follow key order..." << std::endl;

    // Objects are parsed into key order, so declaration order is not kept
    auto result = validate_document(doc("/work/.mcp.json", R"({
        "mcpServers": {"srv": {"type": "stdio", "command": "sh",
                               "env": {"ZETA": "", "MIDDLE": "set", "ALPHA": ""}}}
    })"));

    assert(result.valid);
    assert(result.issues.size() == 2);
    assert(result.issues[0].message == "Environment variable 'ALPHA' is empty");
    assert(result.issues[1].message == "Environment variable 'ZETA' is empty");

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════
// Probe session (protocol state machine, no process)
// ═══════════════════════════════════════════════════════════════════

void test_session_handshake_order() {
    std::cout << "Testing session handshake ordering..." << std::endl;

    ProbeSession session({"vaidya-test", "0.0.1", "2024-11-05"});
    assert(session.state() == ProbeSession::State::Spawned);

    auto init = session.begin();
    assert(init.size() == 1);
    assert(init[0].back() == '\n');
    auto request = json::parse(init[0]);
    assert(request["jsonrpc"] == "2.0");
    assert(request["id"] == 1);
    assert(request["method"] == "initialize");
    assert(request["params"]["protocolVersion"] == "2024-11-05");
    assert(request["params"]["capabilities"].is_object());
    assert(request["params"]["clientInfo"]["name"] == "vaidya-test");
    assert(session.state() == ProbeSession::State::AwaitingHandshake);

    auto out = session.on_line(response(1, {
        {"protocolVersion", "2024-11-05"},
        {"capabilities", {{"tools", json::object()}, {"prompts", false}}},
        {"serverInfo", {{"name", "fake"}, {"version", "0.3"}}}
    }));
    assert(session.state() == ProbeSession::State::Discovering);
    assert(out.size() == 4);

    auto note = json::parse(out[0]);
    assert(note["method"] == "notifications/initialized");
    assert(!note.contains("id"));

    const char* methods[] = {"tools/list", "resources/list", "prompts/list"};
    std::set<int> ids;
    for (int i = 0; i < 3; ++i) {
        auto r = json::parse(out[i + 1]);
        assert(r["method"] == methods[i]);
        assert(r["params"].is_object() && r["params"].empty());
        int id = r["id"].get<int>();
        assert(id != 1);
        ids.insert(id);
    }
    assert(ids.size() == 3);

    auto result = session.result();
    assert(result.server_info && result.server_info->name == "fake");
    assert(result.capabilities);
    assert(result.capabilities->tools == true);
    assert(result.capabilities->prompts == false);
    assert(!result.capabilities->resources.has_value());

    std::cout << "  PASS" << std::endl;
}

void test_session_out_of_order_discovery() {
    std::cout << "Testing out-of-order discovery responses..." << std::endl;

    ProbeSession session;
    session.begin();
    session.on_line(response(1, json::object()));

    session.on_line(response(4, {{"prompts", json::array({
        {{"name", "review"}, {"arguments", json::array({{{"name", "file"}, {"required", true}}})}}
    })}}));
    assert(!session.finished());
    session.on_line(response(2, {{"tools", json::array({
        {{"name", "echo"}, {"description", "Echo input"}, {"inputSchema", {{"type", "object"}}}},
        {{"description", "nameless entries are dropped"}}
    })}}));
    assert(!session.finished());
    session.on_line(response(3, {{"resources", json::array({
        {{"uri", "file:///tmp/a"}, {"mimeType", "text/plain"}}
    })}}));

    assert(session.state() == ProbeSession::State::Complete);
    auto result = session.result();
    assert(result.outcome == ProbeOutcome::Complete);
    assert(!result.error);
    assert(result.tools.size() == 1 && result.tools[0].name == "echo");
    assert(result.tools[0].input_schema["type"] == "object");
    assert(result.resources.size() == 1 && *result.resources[0].mime_type == "text/plain");
    assert(result.prompts.size() == 1);
    assert(result.prompts[0].arguments->at(0).required == true);

    std::cout << "  PASS" << std::endl;
}

void test_session_discovery_error_settles() {
    std::cout << "Testing discovery method error settles slot..." << std::endl;

    ProbeSession session;
    session.begin();
    session.on_line(response(1, json::object()));
    session.on_line(response(2, {{"tools", json::array({{{"name", "t"}}})}}));
    session.on_line(error_response(3, rpc::error::METHOD_NOT_FOUND, "Method not found"));
    session.on_line(response(4, {{"prompts", json::array()}}));

    assert(session.state() == ProbeSession::State::Complete);
    auto result = session.result();
    assert(!result.error);
    assert(result.tools.size() == 1);
    assert(result.resources.empty());

    std::cout << "  PASS" << std::endl;
}

void test_session_handshake_rejected() {
    std::cout << "Testing handshake rejection..." << std::endl;

    ProbeSession session;
    session.begin();
    auto out = session.on_line(error_response(1, rpc::error::INVALID_PARAMS, "Unsupported protocol"));

    assert(out.empty());
    assert(session.state() == ProbeSession::State::TransportError);
    auto result = session.result();
    assert(result.outcome == ProbeOutcome::TransportError);
    assert(result.error->find("Handshake rejected") != std::string::npos);
    assert(result.error->find("Unsupported protocol") != std::string::npos);

    std::cout << "  PASS" << std::endl;
}

void test_session_skips_malformed_lines() {
    std::cout << "Testing malformed lines do not change the result..." << std::endl;

    std::vector<std::string> clean = {
        response(1, {{"serverInfo", {{"name", "s"}, {"version", "1"}}}}),
        response(2, {{"tools", json::array({{{"name", "a"}}})}}),
        response(3, {{"resources", json::array()}}),
        response(4, {{"prompts", json::array()}}),
    };
    std::vector<std::string> noisy = {
        "Server starting on stdio...",
        clean[0],
        "{\"truncated\": ",
        clean[1],
        R"({"jsonrpc":"2.0","method":"notifications/message","params":{"level":"info"}})",
        R"({"jsonrpc":"2.0","id":99,"result":{}})",
        R"({"jsonrpc":"2.0","id":"2","result":{"tools":[]}})",
        clean[2],
        "",
        clean[3],
    };

    auto run = [](const std::vector<std::string>& lines) {
        ProbeSession session;
        session.begin();
        for (const auto& line : lines) session.on_line(line);
        assert(session.state() == ProbeSession::State::Complete);
        return to_json(session.result()).dump();
    };

    assert(run(clean) == run(noisy));

    std::cout << "  PASS" << std::endl;
}

void test_session_timeout_keeps_partial() {
    std::cout << "Testing timeout keeps settled results..." << std::endl;

    ProbeSession session;
    session.begin();
    session.on_line(response(1, json::object()));
    session.on_line(response(2, {{"tools", json::array({{{"name", "a"}}, {{"name", "b"}}})}}));
    session.on_timeout();

    assert(session.state() == ProbeSession::State::TimedOut);
    auto result = session.result();
    assert(result.outcome == ProbeOutcome::TimedOut);
    assert(*result.error == ProbeSession::TIMEOUT_MESSAGE);
    assert(result.tools.size() == 2);

    // First terminal transition wins
    session.on_exit(ExitStatus{false, 0});
    session.on_line(response(3, {{"resources", json::array({{{"uri", "x"}}})}}));
    assert(session.state() == ProbeSession::State::TimedOut);
    assert(session.result().resources.empty());

    std::cout << "  PASS" << std::endl;
}

void test_session_premature_exit() {
    std::cout << "Testing premature exit..." << std::endl;

    ProbeSession before;
    before.begin();
    before.on_exit(ExitStatus{false, 3});
    assert(before.state() == ProbeSession::State::PrematureExit);
    assert(before.result().error->find("exited with code 3 before initialization") != std::string::npos);

    ProbeSession during;
    during.begin();
    during.on_line(response(1, json::object()));
    during.on_exit(ExitStatus{true, 9});
    assert(during.state() == ProbeSession::State::PrematureExit);
    assert(during.result().error->find("signal 9") != std::string::npos);

    ProbeSession complete;
    complete.begin();
    complete.on_line(response(1, json::object()));
    complete.on_line(response(2, json::object()));
    complete.on_line(response(3, json::object()));
    complete.on_line(response(4, json::object()));
    complete.on_exit(ExitStatus{false, 0});
    assert(complete.state() == ProbeSession::State::Complete);
    assert(!complete.result().error);

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════
// Aggregator
// ═══════════════════════════════════════════════════════════════════

void test_duplicates_across_sources() {
    std::cout << "Testing duplicate detection..." << std::endl;

    auto report = diagnose({
        doc("/a/.mcp.json", R"({"mcpServers": {"search": {"type": "stdio", "command": "sh"}, "only-a": {"type": "stdio", "command": "sh"}}})"),
        doc("/b/.mcp.json", R"({"mcpServers": {"search": {"type": "stdio", "command": "sh"}}})"),
    });

    assert(report.duplicates.size() == 1);
    assert(report.duplicates[0].name == "search");
    assert(report.duplicates[0].locations.size() == 2);
    assert(report.duplicates[0].locations[0] == "/a/.mcp.json");
    assert(report.duplicates[0].locations[1] == "/b/.mcp.json");
    assert(report.total_services == 3);
    assert(report.healthy_services == 3);
    assert(!report.probes.has_value());
    assert(report.recommendations.size() == 1);
    assert(report.recommendations[0].find("duplicate") != std::string::npos);

    // A project override shadowing a top-level server is a distinct source
    auto settings = diagnose({doc("/h/.claude.json", R"({
        "mcpServers": {"memory": {"type": "stdio", "command": "sh"}},
        "projects": {"/h/app": {"mcpServers": {"memory": {"type": "stdio", "command": "sh"}}}}
    })")});
    assert(settings.duplicates.size() == 1);
    assert(settings.duplicates[0].locations[1] == "/h/.claude.json [project: /h/app]");

    std::cout << "  PASS" << std::endl;
}

void test_health_counts() {
    std::cout << "Testing health counts..." << std::endl;

    auto report = diagnose({
        doc("/h/.claude.json", R"({
            "mcpServers": {"db": {"type": "stdio", "command": "nonexistent-binary-xyz-12345"}},
            "projects": {"/h/app": {"mcpServers": {"db": {"type": "stdio", "command": "sh"}}}}
        })"),
        doc("/w/.mcp.json", R"({"mcpServers": {"x": {}, "y": {"command": "sh", "env": {"K": ""}}}})"),
        doc("/w/broken.json", "{{{"),
    });

    assert(report.configs.size() == 3);
    assert(report.total_services == 4);
    // Unhealthy: top-level db (not found) and x (no command)
    assert(report.healthy_services == 2);
    assert(!report.configs[2].valid);
    assert(report.configs[2].services.empty());

    bool saw_errors = false;
    for (const auto& rec : report.recommendations) {
        if (rec == "2 server(s) have configuration errors") saw_errors = true;
    }
    assert(saw_errors);

    std::cout << "  PASS" << std::endl;
}

void test_empty_report() {
    std::cout << "Testing report with no services..." << std::endl;

    auto report = diagnose({}, DiagnosticOptions{true, 100},
        [](const ServiceDescriptor&, int) -> CapabilityProbeResult {
            assert(false && "nothing to probe");
            return {};
        });

    assert(report.total_services == 0);
    assert(report.healthy_services == 0);
    assert(report.probes.has_value() && report.probes->empty());
    assert(report.recommendations.size() == 1);
    assert(report.recommendations[0] == "No MCP servers configured");

    auto text = format_report(report);
    assert(text.find("Total servers: 0") != std::string::npos);

    std::cout << "  PASS" << std::endl;
}

void test_probe_order_and_skips() {
    std::cout << "Testing sequential probing order..." << std::endl;

    std::vector<std::string> probed;
    int in_flight = 0;
    auto fake = [&](const ServiceDescriptor& d, int timeout_ms) {
        assert(timeout_ms == 250);
        ++in_flight;
        assert(in_flight == 1);
        probed.push_back(d.source.to_string() + "#" + d.name);
        CapabilityProbeResult r;
        r.outcome = ProbeOutcome::Complete;
        if (d.name == "flaky") {
            r.outcome = ProbeOutcome::TimedOut;
            r.error = ProbeSession::TIMEOUT_MESSAGE;
        }
        --in_flight;
        return r;
    };

    auto report = diagnose({
        doc("/a/.mcp.json", R"({"mcpServers": {"z": {"command": "sh"}, "broken": {}, "flaky": {"command": "sh"}}})"),
        doc("/b/.mcp.json", R"({"mcpServers": {"a": {"command": "sh"}}})"),
    }, DiagnosticOptions{true, 250}, fake);

    // nlohmann::json orders object keys, so declaration order is key order
    std::vector<std::string> expected = {"/a/.mcp.json#flaky", "/a/.mcp.json#z", "/b/.mcp.json#a"};
    assert(probed == expected);
    assert(report.probes->size() == 3);

    bool saw_failed = false;
    for (const auto& rec : report.recommendations) {
        if (rec == "1 server(s) failed capability probing") saw_failed = true;
    }
    assert(saw_failed);

    auto j = to_json(report);
    assert(j["probeResults"].size() == 3);
    assert(j["probeResults"][0]["server"] == "flaky");
    assert(j["probeResults"][0]["error"] == ProbeSession::TIMEOUT_MESSAGE);
    assert(j["totalServers"] == 4);
    assert(j["healthyServers"] == 3);

    std::cout << "  PASS" << std::endl;
}

void test_sanitize_utf8() {
    std::cout << "Testing UTF-8 sanitizing..." << std::endl;

    const std::string fffd = "\xEF\xBF\xBD";

    assert(rpc::sanitize_utf8("plain ascii") == "plain ascii");
    assert(rpc::sanitize_utf8("caf\xC3\xA9 \xE2\x82\xAC \xF0\x9F\x98\x80") ==
           "caf\xC3\xA9 \xE2\x82\xAC \xF0\x9F\x98\x80");
    assert(rpc::sanitize_utf8("x\xFFy") == "x" + fffd + "y");
    // Overlong, surrogate, above U+10FFFF, truncated
    assert(rpc::sanitize_utf8("\xC0\x80") == fffd + fffd);
    assert(rpc::sanitize_utf8("\xED\xA0\x80") == fffd + fffd + fffd);
    assert(rpc::sanitize_utf8("\xF4\x90\x80\x80") == fffd + fffd + fffd + fffd);
    assert(rpc::sanitize_utf8("\xE2\x82") == fffd + fffd);

    std::cout << "  PASS" << std::endl;
}

void test_report_json_with_invalid_utf8() {
    std::cout << "Testing JSON report with invalid UTF-8 input..." << std::endl;

    std::string bad_content = "{\"mcpServers\": {\"a\": {\"command\": \"x\xFF\"}}}";
    std::string bad_path = "/p/caf\xE9/.mcp.json";

    auto report = diagnose({
        doc("/p/.mcp.json", bad_content),
        doc(bad_path, R"({"mcpServers": {"a": {"type": "stdio", "command": "sh"}}})"),
        doc("/q/.mcp.json", R"({"mcpServers": {"a": {"type": "stdio", "command": "sh"}}})"),
    });

    assert(report.configs.size() == 3);
    assert(report.configs[0].issues.size() == 1);
    assert(report.configs[0].issues[0].kind == IssueKind::DocumentUnparseable);
    assert(report.duplicates.size() == 1);

    std::string out = to_json(report).dump(2);
    assert(out.find('\xFF') == std::string::npos);
    assert(out.find('\xE9') == std::string::npos);
    assert(out.find("\xEF\xBF\xBD") != std::string::npos);

    auto parsed = json::parse(out);
    assert(parsed["configs"].size() == 3);
    assert(parsed["duplicateServers"][0]["locations"].size() == 2);

    std::cout << "  PASS" << std::endl;
}

void test_find_service() {
    std::cout << "Testing find_service..." << std::endl;

    auto report = diagnose({
        doc("/a/.mcp.json", R"({"mcpServers": {"one": {"command": "sh"}}})"),
        doc("/b/.mcp.json", R"({"mcpServers": {"one": {"command": "other"}, "two": {"command": "sh"}}})"),
    });

    auto one = find_service(report, "one");
    assert(one && one->command == "sh");
    assert(find_service(report, "two").has_value());
    assert(!find_service(report, "three").has_value());

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════
// Discovery
// ═══════════════════════════════════════════════════════════════════

void write_file(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());
    std::ofstream out(path);
    out << content;
}

void test_find_declaration_files() {
    std::cout << "Testing declaration discovery..." << std::endl;

    char tmpl[] = "/tmp/vaidya-test-XXXXXX";
    char* dir = mkdtemp(tmpl);
    assert(dir != nullptr);
    fs::path root(dir);

    write_file(root / "home" / ".claude.json", R"({"mcpServers": {}})");
    write_file(root / "project" / ".mcp.json", R"({"mcpServers": {}})");
    write_file(root / "home" / ".claude" / "plugins" / "cache" / "p2" / "1.0" / ".mcp.json", "{}");
    write_file(root / "home" / ".claude" / "plugins" / "cache" / "p1" / ".mcp.json", "{}");
    write_file(root / "home" / ".claude" / "plugins" / "cache" / "p1" / "other.json", "{}");

    Config config;
    config.home_dir = (root / "home").string();
    config.claude_dir = (root / "home" / ".claude").string();
    config.project_dir = (root / "project").string();

    auto files = find_declaration_files(config);
    assert(files.size() == 4);
    assert(files[0] == (root / "home" / ".claude.json").string());
    assert(files[1] == (root / "project" / ".mcp.json").string());
    assert(files[2].find("/p1/.mcp.json") != std::string::npos);
    assert(files[3].find("/p2/1.0/.mcp.json") != std::string::npos);

    auto loaded = load_source_document(files[1]);
    assert(loaded.read_error.empty());
    assert(loaded.content == R"({"mcpServers": {}})");

    auto missing = load_source_document((root / "nope.json").string());
    assert(!missing.read_error.empty());

    fs::remove_all(root);

    std::cout << "  PASS" << std::endl;
}

int main() {
    std::cout << "=== vaidya core tests ===" << std::endl;

    test_extract_server_map();
    test_extract_project_overrides();
    test_extract_unparseable();
    test_expand_placeholders();

    test_validate_correct_config();
    test_validate_missing_command();
    test_validate_command_resolution();
    test_validate_templated_command();
    test_validate_warnings_and_info();
    test_validate_accumulates_per_descriptor();
    test_validate_env_warning_order();

    test_session_handshake_order();
    test_session_out_of_order_discovery();
    test_session_discovery_error_settles();
    test_session_handshake_rejected();
    test_session_skips_malformed_lines();
    test_session_timeout_keeps_partial();
    test_session_premature_exit();

    test_duplicates_across_sources();
    test_health_counts();
    test_empty_report();
    test_probe_order_and_skips();
    test_find_service();
    test_sanitize_utf8();
    test_report_json_with_invalid_utf8();

    test_find_declaration_files();

    std::cout << "\nAll tests passed!" << std::endl;
    return 0;
}
