// Capability prober tests against scripted /bin/sh peers and stock utilities
//
// Scripts must not contain brace placeholders: the prober expands them
// before launch.

#include <vaidya/diagnostics.hpp>
#include <vaidya/prober.hpp>
#include <iostream>
#include <cassert>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <thread>
#include <unistd.h>

using namespace vaidya;

namespace fs = std::filesystem;

const char* WELL_BEHAVED = R"SH(
read -r init
case "$init" in *'"method":"initialize"'*) ;; *) exit 7 ;; esac
echo '{"jsonrpc":"2.0","id":1,"result":{"protocolVersion":"2024-11-05","capabilities":{"tools":{},"resources":{}},"serverInfo":{"name":"fake-server","version":"0.1.0"}}}'
read -r initialized
case "$initialized" in *notifications/initialized*) ;; *) exit 8 ;; esac
read -r a
read -r b
read -r c
echo '{"jsonrpc":"2.0","id":4,"result":{"prompts":[{"name":"summarize","arguments":[{"name":"text","required":true}]}]}}'
echo '{"jsonrpc":"2.0","id":2,"result":{"tools":[{"name":"echo","description":"Echo input","inputSchema":{"type":"object"}}]}}'
echo '{"jsonrpc":"2.0","id":3,"result":{"resources":[]}}'
sleep 10
)SH";

ServiceDescriptor sh_service(const std::string& name, const std::string& script) {
    ServiceDescriptor d;
    d.name = name;
    d.command = "/bin/sh";
    d.args = {"-c", script};
    d.transport_type = "stdio";
    d.source = SourceId{"/test/.mcp.json", ""};
    return d;
}

bool contains(const std::optional<std::string>& s, const std::string& needle) {
    return s && s->find(needle) != std::string::npos;
}

std::string read_file(const fs::path& path) {
    std::ifstream in(path);
    std::string s;
    std::getline(in, s);
    return s;
}

// Reaped, or at least a zombie awaiting its new parent
bool process_gone(pid_t pid) {
    for (int i = 0; i < 40; ++i) {
        if (::kill(pid, 0) != 0) return true;
        std::ifstream stat("/proc/" + std::to_string(pid) + "/stat");
        std::string line;
        if (std::getline(stat, line)) {
            auto close = line.rfind(')');
            if (close != std::string::npos && close + 2 < line.size() && line[close + 2] == 'Z') {
                return true;
            }
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    return false;
}

void test_well_behaved_server() {
    std::cout << "Testing well-behaved server..." << std::endl;

    CapabilityProber prober;
    auto result = prober.probe(sh_service("fake", WELL_BEHAVED), 5000);

    assert(!result.error);
    assert(result.outcome == ProbeOutcome::Complete);
    assert(result.server_info && result.server_info->name == "fake-server");
    assert(result.server_info->version == "0.1.0");
    assert(result.capabilities && result.capabilities->tools == true);
    assert(result.tools.size() == 1);
    assert(result.tools[0].name == "echo");
    assert(*result.tools[0].description == "Echo input");
    assert(result.resources.empty());
    assert(result.prompts.size() == 1);
    assert(result.prompts[0].arguments->size() == 1);
    // Completion does not wait for the peer's trailing sleep
    assert(result.elapsed_ms < 5000);

    std::cout << "  PASS" << std::endl;
}

void test_noisy_server() {
    std::cout << "Testing server with log noise on stdout and stderr..." << std::endl;

    const char* script = R"SH(
echo "fake server starting" >&2
echo 'listening on stdio'
read -r init
echo '{"partial":'
echo '{"jsonrpc":"2.0","method":"notifications/message","params":{"level":"info"}}'
echo '{"jsonrpc":"2.0","id":1,"result":{"serverInfo":{"name":"noisy","version":"2"}}}'
read -r initialized
read -r a
read -r b
read -r c
echo '{"jsonrpc":"2.0","id":3,"result":{"resources":[{"uri":"file:///etc/hosts","mimeType":"text/plain"}]}}'
echo 'not json at all'
echo '{"jsonrpc":"2.0","id":42,"result":{"tools":[{"name":"stray"}]}}'
echo '{"jsonrpc":"2.0","id":2,"result":{"tools":[{"name":"a"},{"name":"b"}]}}'
echo "still alive" >&2
echo '{"jsonrpc":"2.0","id":4,"error":{"code":-32601,"message":"Method not found"}}'
sleep 10
)SH";

    CapabilityProber prober;
    auto result = prober.probe(sh_service("noisy", script), 5000);

    assert(!result.error);
    assert(result.outcome == ProbeOutcome::Complete);
    assert(result.server_info->name == "noisy");
    assert(!result.capabilities);
    assert(result.tools.size() == 2);
    assert(result.tools[0].name == "a");
    assert(result.resources.size() == 1);
    assert(*result.resources[0].mime_type == "text/plain");
    assert(result.prompts.empty());

    std::cout << "  PASS" << std::endl;
}

void test_large_response() {
    std::cout << "Testing response spanning many reads..." << std::endl;

    const char* script = R"SH(
read -r init
echo '{"jsonrpc":"2.0","id":1,"result":{}}'
read -r initialized
read -r a
read -r b
read -r c
printf '{"jsonrpc":"2.0","id":2,"result":{"tools":['
i=0
while [ $i -lt 500 ]; do
    if [ $i -gt 0 ]; then printf ','; fi
    printf '{"name":"tool-%d","description":"generated tool number %d"}' $i $i
    i=$((i+1))
done
printf ']}}\n'
echo '{"jsonrpc":"2.0","id":3,"result":{"resources":[]}}'
echo '{"jsonrpc":"2.0","id":4,"result":{"prompts":[]}}'
sleep 10
)SH";

    CapabilityProber prober;
    auto result = prober.probe(sh_service("large", script), 10000);

    assert(!result.error);
    assert(result.tools.size() == 500);
    assert(result.tools[0].name == "tool-0");
    assert(result.tools[499].name == "tool-499");

    std::cout << "  PASS" << std::endl;
}

void test_immediate_exit() {
    std::cout << "Testing server that exits immediately..." << std::endl;

    CapabilityProber prober;
    auto result = prober.probe(sh_service("quitter", "exit 3"), 5000);

    assert(result.outcome == ProbeOutcome::PrematureExit);
    assert(contains(result.error, "exited with code 3"));
    assert(contains(result.error, "before initialization"));
    assert(result.tools.empty());
    assert(result.resources.empty());
    assert(result.prompts.empty());
    assert(!result.server_info);
    assert(result.elapsed_ms < 5000);

    auto killed = prober.probe(sh_service("suicidal", "kill -9 $$"), 5000);
    assert(killed.outcome == ProbeOutcome::PrematureExit);
    assert(contains(killed.error, "signal 9"));

    std::cout << "  PASS" << std::endl;
}

void test_exit_during_discovery() {
    std::cout << "Testing exit after handshake (env passed through)..." << std::endl;

    const char* script = R"SH(
read -r init
echo "{\"jsonrpc\":\"2.0\",\"id\":1,\"result\":{\"serverInfo\":{\"name\":\"$FAKE_NAME\",\"version\":\"1\"}}}"
read -r initialized
read -r a
echo '{"jsonrpc":"2.0","id":2,"result":{"tools":[{"name":"only"}]}}'
exit 0
)SH";

    auto service = sh_service("envy", script);
    service.env["FAKE_NAME"] = "from-env";

    CapabilityProber prober;
    auto result = prober.probe(service, 5000);

    assert(result.outcome == ProbeOutcome::PrematureExit);
    assert(contains(result.error, "exited with code 0 before discovery completed"));
    assert(result.server_info && result.server_info->name == "from-env");
    // Written before the exit, so it still counts
    assert(result.tools.size() == 1);

    std::cout << "  PASS" << std::endl;
}

void test_handshake_rejected() {
    std::cout << "Testing handshake rejected over the wire..." << std::endl;

    const char* script = R"SH(
read -r init
echo '{"jsonrpc":"2.0","id":1,"error":{"code":-32602,"message":"Unsupported protocol version"}}'
sleep 10
)SH";

    CapabilityProber prober;
    auto result = prober.probe(sh_service("picky", script), 5000);

    assert(result.outcome == ProbeOutcome::TransportError);
    assert(contains(result.error, "Handshake rejected"));
    assert(contains(result.error, "Unsupported protocol version"));
    assert(result.elapsed_ms < 5000);

    std::cout << "  PASS" << std::endl;
}

void test_timeout_kills_process_group() {
    std::cout << "Testing timeout and process cleanup..." << std::endl;

    char tmpl[] = "/tmp/vaidya-prober-XXXXXX";
    char* dir = mkdtemp(tmpl);
    assert(dir != nullptr);
    fs::path root(dir);

    std::string script =
        "echo $$ > " + (root / "pid").string() + "\n"
        "sleep 30 &\n"
        "echo $! > " + (root / "bg").string() + "\n"
        "wait\n";

    CapabilityProber prober;
    auto result = prober.probe(sh_service("silent", script), 300);

    assert(result.outcome == ProbeOutcome::TimedOut);
    assert(*result.error == ProbeSession::TIMEOUT_MESSAGE);
    assert(result.elapsed_ms >= 300);
    assert(result.elapsed_ms < 5000);
    assert(result.tools.empty());

    pid_t pid = static_cast<pid_t>(std::atoi(read_file(root / "pid").c_str()));
    pid_t bg = static_cast<pid_t>(std::atoi(read_file(root / "bg").c_str()));
    assert(pid > 0 && bg > 0);
    assert(process_gone(pid));
    assert(process_gone(bg));

    fs::remove_all(root);

    std::cout << "  PASS" << std::endl;
}

void test_timeout_keeps_partial_results() {
    std::cout << "Testing timeout after partial discovery..." << std::endl;

    const char* script = R"SH(
read -r init
echo '{"jsonrpc":"2.0","id":1,"result":{"serverInfo":{"name":"slow","version":"1"}}}'
read -r initialized
read -r a
read -r b
read -r c
echo '{"jsonrpc":"2.0","id":2,"result":{"tools":[{"name":"fast-tool"}]}}'
sleep 10
)SH";

    CapabilityProber prober;
    auto result = prober.probe(sh_service("slow", script), 400);

    assert(result.outcome == ProbeOutcome::TimedOut);
    assert(*result.error == ProbeSession::TIMEOUT_MESSAGE);
    assert(result.elapsed_ms >= 400);
    assert(result.server_info->name == "slow");
    assert(result.tools.size() == 1);
    assert(result.tools[0].name == "fast-tool");
    assert(result.resources.empty());
    assert(result.prompts.empty());

    std::cout << "  PASS" << std::endl;
}

void test_closed_stdout_waits_for_deadline() {
    std::cout << "Testing closed stdout with live process..." << std::endl;

    CapabilityProber prober;
    auto result = prober.probe(sh_service("mute", "exec 1>&-\nsleep 10"), 300);

    assert(result.outcome == ProbeOutcome::TimedOut);
    assert(result.elapsed_ms >= 300);
    assert(result.elapsed_ms < 5000);

    std::cout << "  PASS" << std::endl;
}

void test_flooding_server_respects_deadline() {
    std::cout << "Testing deadline against a flooding server..." << std::endl;

    ServiceDescriptor flood;
    flood.name = "flood";
    flood.command = "yes";
    flood.args = {"not json"};

    const int timeout_ms = 500;
    CapabilityProber prober;
    auto result = prober.probe(flood, timeout_ms);

    assert(result.outcome == ProbeOutcome::TimedOut);
    assert(*result.error == ProbeSession::TIMEOUT_MESSAGE);
    assert(result.elapsed_ms >= timeout_ms);
    assert(result.elapsed_ms < 2 * timeout_ms);
    assert(result.tools.empty());

    std::cout << "  PASS" << std::endl;
}

void test_unterminated_line_is_bounded() {
    std::cout << "Testing endless output without newlines..." << std::endl;

    ServiceDescriptor zeros;
    zeros.name = "zeros";
    zeros.command = "cat";
    zeros.args = {"/dev/zero"};

    const int timeout_ms = 2000;
    CapabilityProber prober;
    auto result = prober.probe(zeros, timeout_ms);

    assert(result.outcome == ProbeOutcome::TransportError);
    assert(contains(result.error, "exceeds"));
    assert(result.elapsed_ms < timeout_ms);

    std::cout << "  PASS" << std::endl;
}

void test_spawn_failure() {
    std::cout << "Testing spawn failure..." << std::endl;

    CapabilityProber prober;

    ServiceDescriptor absolute;
    absolute.name = "ghost";
    absolute.command = "/nonexistent/vaidya-test-binary";
    auto a = prober.probe(absolute, 2000);
    assert(a.outcome == ProbeOutcome::TransportError);
    assert(contains(a.error, "Failed to start"));
    assert(contains(a.error, "/nonexistent/vaidya-test-binary"));
    assert(a.tools.empty());

    ServiceDescriptor bare;
    bare.name = "ghost2";
    bare.command = "vaidya-no-such-binary-xyz-12345";
    auto b = prober.probe(bare, 2000);
    assert(b.outcome == ProbeOutcome::TransportError);
    assert(contains(b.error, "Failed to start"));

    ServiceDescriptor empty;
    empty.name = "empty";
    auto c = prober.probe(empty, 2000);
    assert(c.outcome == ProbeOutcome::TransportError);
    assert(contains(c.error, "command"));

    std::cout << "  PASS" << std::endl;
}

void test_placeholders() {
    std::cout << "Testing placeholder expansion at launch..." << std::endl;

    unsetenv("VAIDYA_TEST_UNSET_SHELL");

    CapabilityProber prober;

    ServiceDescriptor unresolved = sh_service("templated", WELL_BEHAVED);
    unresolved.command = "${VAIDYA_TEST_UNSET_SHELL}";
    auto a = prober.probe(unresolved, 2000);
    assert(a.outcome == ProbeOutcome::TransportError);
    assert(contains(a.error, "unresolved variable"));
    assert(contains(a.error, "${VAIDYA_TEST_UNSET_SHELL}"));

    ServiceDescriptor resolved = sh_service("templated", WELL_BEHAVED);
    resolved.command = "${VAIDYA_TEST_SHELL_DIR}/sh";
    resolved.env["VAIDYA_TEST_SHELL_DIR"] = "/bin";
    auto b = prober.probe(resolved, 5000);
    assert(!b.error);
    assert(b.tools.size() == 1);

    ServiceDescriptor fallback = sh_service("templated", WELL_BEHAVED);
    fallback.command = "${VAIDYA_TEST_UNSET_SHELL:-/bin/sh}";
    auto c = prober.probe(fallback, 5000);
    assert(!c.error);

    std::cout << "  PASS" << std::endl;
}

void test_diagnose_with_probes() {
    std::cout << "Testing diagnose with live probes..." << std::endl;

    json good = {{"mcpServers", {
        {"good", {{"type", "stdio"}, {"command", "/bin/sh"}, {"args", {"-c", WELL_BEHAVED}}}},
        {"missing", {{"type", "stdio"}, {"command", "vaidya-no-such-binary-xyz-12345"}}}
    }}};
    json dead = {{"mcpServers", {
        {"dead", {{"type", "stdio"}, {"command", "/bin/sh"}, {"args", {"-c", "exit 1"}}}}
    }}};

    auto report = diagnose({
        SourceDocument{"/test/a/.mcp.json", good.dump(), ""},
        SourceDocument{"/test/b/.mcp.json", dead.dump(), ""},
    }, DiagnosticOptions{true, 5000});

    assert(report.total_services == 3);
    assert(report.healthy_services == 2);
    assert(report.probes.has_value());
    // The server with a configuration error is never launched
    assert(report.probes->size() == 2);
    assert((*report.probes)[0].descriptor.name == "good");
    assert(!(*report.probes)[0].result.error);
    assert((*report.probes)[0].result.tools.size() == 1);
    assert((*report.probes)[1].descriptor.name == "dead");
    assert((*report.probes)[1].result.outcome == ProbeOutcome::PrematureExit);

    bool saw_failed = false;
    for (const auto& rec : report.recommendations) {
        if (rec == "1 server(s) failed capability probing") saw_failed = true;
    }
    assert(saw_failed);

    std::cout << "  PASS" << std::endl;
}

int main() {
    std::signal(SIGPIPE, SIG_IGN);

    std::cout << "=== vaidya prober tests ===" << std::endl;

    test_well_behaved_server();
    test_noisy_server();
    test_large_response();
    test_immediate_exit();
    test_exit_during_discovery();
    test_handshake_rejected();
    test_timeout_kills_process_group();
    test_timeout_keeps_partial_results();
    test_closed_stdout_waits_for_deadline();
    test_flooding_server_respects_deadline();
    test_unterminated_line_is_bounded();
    test_spawn_failure();
    test_placeholders();
    test_diagnose_with_probes();

    std::cout << "\nAll tests passed!" << std::endl;
    return 0;
}
