#pragma once
// RPC Protocol: JSON-RPC 2.0 client helpers for the discovery handshake
//
// Builds outbound requests/notifications and frames the inbound byte
// stream into newline-delimited messages (same framing as MCP stdio).

#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>

namespace vaidya::rpc {

using json = nlohmann::json;

// JSON-RPC 2.0 error codes servers answer discovery requests with
namespace error {
    constexpr int METHOD_NOT_FOUND = -32601;
    constexpr int INVALID_PARAMS = -32602;
}

// Replace every byte that does not start a well-formed UTF-8 sequence
// (RFC 3629: no overlongs, no surrogates, nothing above U+10FFFF) with
// U+FFFD. nlohmann::json refuses to dump invalid UTF-8, and paths and
// parser messages carry arbitrary bytes.
inline std::string sanitize_utf8(const std::string& input) {
    static const char REPLACEMENT[] = "\xEF\xBF\xBD";

    std::string output;
    output.reserve(input.size());

    size_t i = 0;
    while (i < input.size()) {
        unsigned char lead = static_cast<unsigned char>(input[i]);
        if (lead < 0x80) {
            output += input[i++];
            continue;
        }

        // Sequence length and the allowed range of the second byte
        size_t len = 0;
        unsigned char lo = 0x80, hi = 0xBF;
        if (lead >= 0xC2 && lead <= 0xDF) {
            len = 2;
        } else if (lead >= 0xE0 && lead <= 0xEF) {
            len = 3;
            if (lead == 0xE0) lo = 0xA0;
            if (lead == 0xED) hi = 0x9F;
        } else if (lead >= 0xF0 && lead <= 0xF4) {
            len = 4;
            if (lead == 0xF0) lo = 0x90;
            if (lead == 0xF4) hi = 0x8F;
        }

        bool ok = len > 0 && i + len <= input.size();
        for (size_t k = 1; ok && k < len; ++k) {
            unsigned char c = static_cast<unsigned char>(input[i + k]);
            ok = k == 1 ? (c >= lo && c <= hi) : (c & 0xC0) == 0x80;
        }

        if (ok) {
            output.append(input, i, len);
            i += len;
        } else {
            output += REPLACEMENT;
            ++i;
        }
    }
    return output;
}

// Methods this client issues. Responses are routed by the tag recorded
// for their id, never by inspecting the payload.
enum class PendingMethod {
    Initialize,
    ToolsList,
    ResourcesList,
    PromptsList
};

inline const char* method_name(PendingMethod method) {
    switch (method) {
        case PendingMethod::Initialize: return "initialize";
        case PendingMethod::ToolsList: return "tools/list";
        case PendingMethod::ResourcesList: return "resources/list";
        case PendingMethod::PromptsList: return "prompts/list";
    }
    return "";
}

constexpr const char* INITIALIZED_NOTIFICATION = "notifications/initialized";

// Build a JSON-RPC 2.0 request
inline json make_request(int64_t id, const std::string& method,
                         const json& params = json::object()) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"method", method},
        {"params", params}
    };
}

// Build a JSON-RPC 2.0 notification (no id, no response expected)
inline json make_notification(const std::string& method) {
    return {
        {"jsonrpc", "2.0"},
        {"method", method}
    };
}

inline json make_initialize_params(const std::string& protocol_version,
                                   const std::string& client_name,
                                   const std::string& client_version) {
    return {
        {"protocolVersion", protocol_version},
        {"capabilities", json::object()},
        {"clientInfo", {
            {"name", client_name},
            {"version", client_version}
        }}
    };
}

// Serialize one message as a wire line
inline std::string to_line(const json& message) {
    return message.dump(-1, ' ', false, json::error_handler_t::replace) + "\n";
}

// Extract the numeric id of a response, if it has one
inline bool response_id(const json& message, int64_t& id) {
    auto it = message.find("id");
    if (it == message.end() || !it->is_number_integer()) return false;
    id = it->get<int64_t>();
    return true;
}

// Message framing: newline-delimited, unbounded input stream
class LineBuffer {
public:
    void append(const char* data, size_t len) { buffer_.append(data, len); }

    bool has_complete_line() const {
        return buffer_.find('\n') != std::string::npos;
    }

    std::string extract_line() {
        size_t pos = buffer_.find('\n');
        if (pos == std::string::npos) return "";

        std::string line = buffer_.substr(0, pos);
        buffer_.erase(0, pos + 1);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        return line;
    }

    // Bytes of the unterminated tail
    size_t pending() const { return buffer_.size(); }

private:
    std::string buffer_;
};

} // namespace vaidya::rpc
