#include <vaidya/probe_session.hpp>
#include <vaidya/log.hpp>
#include <vaidya/version.hpp>

namespace vaidya {

namespace {

std::optional<std::string> optional_string(const json& object, const char* key) {
    auto it = object.find(key);
    if (it == object.end() || !it->is_string()) return std::nullopt;
    return it->get<std::string>();
}

std::optional<bool> capability_flag(const json& capabilities, const char* key) {
    auto it = capabilities.find(key);
    if (it == capabilities.end()) return std::nullopt;
    if (it->is_null()) return false;
    if (it->is_boolean()) return it->get<bool>();
    return true;
}

// Fetch result.<key> as an array, or an empty array
json result_array(const json& response, const char* key) {
    auto result = response.find("result");
    if (result == response.end() || !result->is_object()) return json::array();
    auto items = result->find(key);
    if (items == result->end() || !items->is_array()) return json::array();
    return *items;
}

std::vector<ToolInfo> parse_tools(const json& items) {
    std::vector<ToolInfo> tools;
    for (const auto& item : items) {
        if (!item.is_object()) continue;
        auto name = optional_string(item, "name");
        if (!name) continue;

        ToolInfo tool;
        tool.name = *name;
        tool.description = optional_string(item, "description");
        auto schema = item.find("inputSchema");
        if (schema != item.end()) tool.input_schema = *schema;
        tools.push_back(std::move(tool));
    }
    return tools;
}

std::vector<ResourceInfo> parse_resources(const json& items) {
    std::vector<ResourceInfo> resources;
    for (const auto& item : items) {
        if (!item.is_object()) continue;
        auto uri = optional_string(item, "uri");
        if (!uri) continue;

        ResourceInfo resource;
        resource.uri = *uri;
        resource.name = optional_string(item, "name");
        resource.description = optional_string(item, "description");
        resource.mime_type = optional_string(item, "mimeType");
        resources.push_back(std::move(resource));
    }
    return resources;
}

std::vector<PromptInfo> parse_prompts(const json& items) {
    std::vector<PromptInfo> prompts;
    for (const auto& item : items) {
        if (!item.is_object()) continue;
        auto name = optional_string(item, "name");
        if (!name) continue;

        PromptInfo prompt;
        prompt.name = *name;
        prompt.description = optional_string(item, "description");

        auto args = item.find("arguments");
        if (args != item.end() && args->is_array()) {
            std::vector<PromptArgument> arguments;
            for (const auto& arg : *args) {
                if (!arg.is_object()) continue;
                auto arg_name = optional_string(arg, "name");
                if (!arg_name) continue;

                PromptArgument a;
                a.name = *arg_name;
                a.description = optional_string(arg, "description");
                auto required = arg.find("required");
                if (required != arg.end() && required->is_boolean()) {
                    a.required = required->get<bool>();
                }
                arguments.push_back(std::move(a));
            }
            prompt.arguments = std::move(arguments);
        }
        prompts.push_back(std::move(prompt));
    }
    return prompts;
}

bool has_error(const json& response) {
    auto it = response.find("error");
    return it != response.end() && !it->is_null();
}

std::string error_message(const json& response) {
    const json& err = response["error"];
    if (err.is_object()) {
        auto message = err.find("message");
        if (message != err.end() && message->is_string()) {
            return message->get<std::string>();
        }
    }
    return err.dump();
}

std::string describe_exit(const ExitStatus& status) {
    if (status.signaled) {
        return "Server killed by signal " + std::to_string(status.code);
    }
    return "Server exited with code " + std::to_string(status.code);
}

}  // anonymous namespace

ClientIdentity ClientIdentity::current() {
    return {VAIDYA_CLIENT_NAME, VAIDYA_VERSION, VAIDYA_MCP_PROTOCOL_VERSION};
}

ProbeSession::ProbeSession(ClientIdentity identity)
    : identity_(std::move(identity)) {}

bool ProbeSession::finished() const {
    return state_ == State::Complete || state_ == State::TimedOut ||
           state_ == State::PrematureExit || state_ == State::TransportError;
}

std::vector<std::string> ProbeSession::begin() {
    std::vector<std::string> out;
    if (state_ != State::Spawned) return out;

    out.push_back(send_request(rpc::PendingMethod::Initialize,
        rpc::make_initialize_params(identity_.protocol_version,
                                    identity_.name, identity_.version)));
    state_ = State::AwaitingHandshake;
    return out;
}

std::string ProbeSession::send_request(rpc::PendingMethod method, const json& params) {
    int64_t id = next_id_++;
    pending_[id] = method;
    return rpc::to_line(rpc::make_request(id, rpc::method_name(method), params));
}

std::vector<std::string> ProbeSession::on_line(const std::string& line) {
    std::vector<std::string> out;
    if (finished() || line.empty()) return out;

    json message;
    try {
        message = json::parse(line);
    } catch (const json::parse_error&) {
        log_debug("probe", "Dropping non-JSON line (%zu bytes)", line.size());
        return out;
    }

    int64_t id = 0;
    if (!message.is_object() || message.contains("method") ||
        !rpc::response_id(message, id)) {
        // Server-initiated requests, notifications and log chatter are not ours
        return out;
    }

    auto it = pending_.find(id);
    if (it == pending_.end()) {
        log_debug("probe", "Dropping response with unknown id %lld", static_cast<long long>(id));
        return out;
    }
    rpc::PendingMethod method = it->second;
    pending_.erase(it);

    switch (method) {
        case rpc::PendingMethod::Initialize:
            handle_initialize(message, out);
            break;
        case rpc::PendingMethod::ToolsList:
        case rpc::PendingMethod::ResourcesList:
        case rpc::PendingMethod::PromptsList:
            handle_discovery(method, message);
            break;
    }

    return out;
}

void ProbeSession::handle_initialize(const json& response, std::vector<std::string>& out) {
    if (has_error(response)) {
        finish(State::TransportError, "Handshake rejected: " + error_message(response));
        return;
    }

    auto result = response.find("result");
    if (result != response.end() && result->is_object()) {
        auto info = result->find("serverInfo");
        if (info != result->end() && info->is_object()) {
            ServerInfo server;
            server.name = optional_string(*info, "name").value_or("");
            server.version = optional_string(*info, "version").value_or("");
            result_.server_info = server;
        }

        auto caps = result->find("capabilities");
        if (caps != result->end() && caps->is_object()) {
            CapabilityFlags flags;
            flags.tools = capability_flag(*caps, "tools");
            flags.resources = capability_flag(*caps, "resources");
            flags.prompts = capability_flag(*caps, "prompts");
            result_.capabilities = flags;
        }
    }

    handshake_complete_ = true;
    state_ = State::Discovering;

    out.push_back(rpc::to_line(rpc::make_notification(rpc::INITIALIZED_NOTIFICATION)));
    out.push_back(send_request(rpc::PendingMethod::ToolsList));
    out.push_back(send_request(rpc::PendingMethod::ResourcesList));
    out.push_back(send_request(rpc::PendingMethod::PromptsList));
}

void ProbeSession::handle_discovery(rpc::PendingMethod method, const json& response) {
    bool failed = has_error(response);
    if (failed) {
        log_debug("probe", "%s failed: %s", rpc::method_name(method), error_message(response).c_str());
    }

    switch (method) {
        case rpc::PendingMethod::ToolsList:
            if (!failed) result_.tools = parse_tools(result_array(response, "tools"));
            tools_settled_ = true;
            break;
        case rpc::PendingMethod::ResourcesList:
            if (!failed) result_.resources = parse_resources(result_array(response, "resources"));
            resources_settled_ = true;
            break;
        case rpc::PendingMethod::PromptsList:
            if (!failed) result_.prompts = parse_prompts(result_array(response, "prompts"));
            prompts_settled_ = true;
            break;
        case rpc::PendingMethod::Initialize:
            break;
    }

    check_complete();
}

void ProbeSession::check_complete() {
    if (tools_settled_ && resources_settled_ && prompts_settled_) {
        finish(State::Complete, "");
    }
}

void ProbeSession::on_exit(const ExitStatus& status) {
    if (finished()) return;

    if (!handshake_complete_) {
        finish(State::PrematureExit, describe_exit(status) + " before initialization");
    } else {
        finish(State::PrematureExit, describe_exit(status) + " before discovery completed");
    }
}

void ProbeSession::on_timeout() {
    finish(State::TimedOut, TIMEOUT_MESSAGE);
}

void ProbeSession::on_transport_error(const std::string& message) {
    finish(State::TransportError, message);
}

void ProbeSession::finish(State terminal, const std::string& error) {
    if (finished()) return;

    state_ = terminal;
    pending_.clear();
    if (!error.empty() && !result_.error) {
        result_.error = error;
    }
    log_debug("probe", "Session finished: %s", state_to_string(terminal));
}

CapabilityProbeResult ProbeSession::result() const {
    CapabilityProbeResult r = result_;
    switch (state_) {
        case State::Complete: r.outcome = ProbeOutcome::Complete; break;
        case State::TimedOut: r.outcome = ProbeOutcome::TimedOut; break;
        case State::PrematureExit: r.outcome = ProbeOutcome::PrematureExit; break;
        default: r.outcome = ProbeOutcome::TransportError; break;
    }
    return r;
}

const char* state_to_string(ProbeSession::State state) {
    switch (state) {
        case ProbeSession::State::Spawned: return "spawned";
        case ProbeSession::State::AwaitingHandshake: return "awaiting_handshake";
        case ProbeSession::State::Discovering: return "discovering";
        case ProbeSession::State::Complete: return "complete";
        case ProbeSession::State::TimedOut: return "timed_out";
        case ProbeSession::State::PrematureExit: return "premature_exit";
        case ProbeSession::State::TransportError: return "transport_error";
    }
    return "unknown";
}

} // namespace vaidya
