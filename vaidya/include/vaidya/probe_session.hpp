#pragma once
// Probe session: protocol state machine for one capability probe
//
//   Spawned -> AwaitingHandshake -> Discovering -> Complete
//                                              \-> TimedOut
//                                              \-> PrematureExit
//                                              \-> TransportError
//
// Pure: consumes inbound lines and process events, produces outbound wire
// lines. The caller owns the process and the clock. The first terminal
// transition wins; events after it are ignored.

#include <vaidya/rpc/protocol.hpp>
#include <vaidya/types.hpp>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace vaidya {

struct ClientIdentity {
    std::string name;
    std::string version;
    std::string protocol_version;

    static ClientIdentity current();
};

class ProbeSession {
public:
    enum class State {
        Spawned,
        AwaitingHandshake,
        Discovering,
        Complete,
        TimedOut,
        PrematureExit,
        TransportError
    };

    static constexpr const char* TIMEOUT_MESSAGE = "Timeout waiting for server responses";

    explicit ProbeSession(ClientIdentity identity = ClientIdentity::current());

    // Returns the initialize request. Spawned -> AwaitingHandshake.
    std::vector<std::string> begin();

    // Feed one inbound stdout line. Returns lines to write to the peer.
    std::vector<std::string> on_line(const std::string& line);

    // Process exited on its own
    void on_exit(const ExitStatus& status);

    void on_timeout();
    void on_transport_error(const std::string& message);

    State state() const { return state_; }
    bool finished() const;

    // Result so far; outcome reflects the terminal state once finished()
    CapabilityProbeResult result() const;

private:
    ClientIdentity identity_;
    State state_ = State::Spawned;
    bool handshake_complete_ = false;
    int64_t next_id_ = 1;
    std::unordered_map<int64_t, rpc::PendingMethod> pending_;
    bool tools_settled_ = false;
    bool resources_settled_ = false;
    bool prompts_settled_ = false;
    CapabilityProbeResult result_;

    std::string send_request(rpc::PendingMethod method, const json& params = json::object());
    void handle_initialize(const json& response, std::vector<std::string>& out);
    void handle_discovery(rpc::PendingMethod method, const json& response);
    void finish(State terminal, const std::string& error);
    void check_complete();
};

const char* state_to_string(ProbeSession::State state);

} // namespace vaidya
