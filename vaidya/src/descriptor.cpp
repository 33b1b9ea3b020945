#include <vaidya/descriptor.hpp>
#include <vaidya/log.hpp>
#include <vaidya/rpc/protocol.hpp>
#include <cstdlib>

namespace vaidya {

namespace {

constexpr const char* SETTINGS_SUFFIX = ".claude.json";

bool ends_with(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string string_field(const json& spec, const char* key) {
    auto it = spec.find(key);
    if (it == spec.end() || !it->is_string()) return "";
    return it->get<std::string>();
}

ValidationIssue document_issue(const std::string& path, const std::string& message) {
    ValidationIssue issue;
    issue.service = DOCUMENT_SCOPE;
    issue.severity = Severity::Error;
    issue.kind = IssueKind::DocumentUnparseable;
    // Parser messages quote the offending bytes verbatim
    issue.message = rpc::sanitize_utf8(message);
    issue.source = path;
    return issue;
}

ExtractionResult unrecognised(const std::string& path, const std::string& reason) {
    ExtractionResult result;
    result.issues.push_back(document_issue(path, "Unrecognized document shape in " + path + ": " + reason));
    return result;
}

}  // anonymous namespace

DocumentShape shape_for_path(const std::string& path) {
    return ends_with(path, SETTINGS_SUFFIX) ? DocumentShape::UserSettings : DocumentShape::ServerMap;
}

std::vector<ServiceDescriptor> extract_server_map(const json& servers, const SourceId& source) {
    std::vector<ServiceDescriptor> descriptors;

    for (auto it = servers.begin(); it != servers.end(); ++it) {
        const json& spec = it.value();
        if (!spec.is_object()) {
            log_debug("descriptor", "Skipping non-object entry '%s' in %s",
                      it.key().c_str(), source.to_string().c_str());
            continue;
        }

        ServiceDescriptor d;
        d.name = it.key();
        d.command = string_field(spec, "command");
        d.transport_type = string_field(spec, "type");
        d.source = source;

        auto args = spec.find("args");
        if (args != spec.end() && args->is_array()) {
            for (const auto& arg : *args) {
                if (arg.is_string()) d.args.push_back(arg.get<std::string>());
            }
        }

        auto env = spec.find("env");
        if (env != spec.end() && env->is_object()) {
            for (auto e = env->begin(); e != env->end(); ++e) {
                if (e.value().is_string()) d.env[e.key()] = e.value().get<std::string>();
            }
        }

        descriptors.push_back(std::move(d));
    }

    return descriptors;
}

ExtractionResult extract_descriptors(const SourceDocument& document) {
    ExtractionResult result;
    const std::string& path = document.path;

    if (!document.read_error.empty()) {
        result.issues.push_back(document_issue(path, "Failed to parse " + path + ": " + document.read_error));
        return result;
    }

    json data;
    try {
        data = json::parse(document.content);
    } catch (const json::parse_error& e) {
        result.issues.push_back(document_issue(path, "Failed to parse " + path + ": " + e.what()));
        return result;
    }

    if (!data.is_object()) {
        return unrecognised(path, "top level is not an object");
    }

    auto servers = data.find("mcpServers");
    if (servers != data.end() && !servers->is_object()) {
        return unrecognised(path, "'mcpServers' is not an object");
    }

    if (shape_for_path(path) == DocumentShape::ServerMap) {
        if (servers == data.end()) {
            return unrecognised(path, "missing 'mcpServers' section");
        }
        result.descriptors = extract_server_map(*servers, SourceId{path, ""});
        return result;
    }

    // User settings: top-level map plus per-project overrides
    auto projects = data.find("projects");
    if (projects != data.end() && !projects->is_object()) {
        return unrecognised(path, "'projects' is not an object");
    }

    if (servers != data.end()) {
        result.descriptors = extract_server_map(*servers, SourceId{path, ""});
    }

    if (projects != data.end()) {
        for (auto it = projects->begin(); it != projects->end(); ++it) {
            const json& project = it.value();
            if (!project.is_object()) continue;

            auto project_servers = project.find("mcpServers");
            if (project_servers == project.end() || !project_servers->is_object()) continue;

            auto found = extract_server_map(*project_servers, SourceId{path, it.key()});
            for (auto& d : found) {
                result.descriptors.push_back(std::move(d));
            }
        }
    }

    return result;
}

bool has_placeholder(const std::string& value) {
    auto open = value.find("${");
    return open != std::string::npos && value.find('}', open + 2) != std::string::npos;
}

std::optional<std::string> expand_placeholders(
    const std::string& value,
    const std::map<std::string, std::string>& overrides,
    std::string& unresolved) {

    std::string out;
    out.reserve(value.size());

    size_t pos = 0;
    while (pos < value.size()) {
        size_t open = value.find("${", pos);
        if (open == std::string::npos) {
            out.append(value, pos, std::string::npos);
            break;
        }
        size_t close = value.find('}', open + 2);
        if (close == std::string::npos) {
            out.append(value, pos, std::string::npos);
            break;
        }

        out.append(value, pos, open - pos);

        std::string body = value.substr(open + 2, close - open - 2);
        std::string name = body;
        std::optional<std::string> fallback;
        size_t sep = body.find(":-");
        if (sep != std::string::npos) {
            name = body.substr(0, sep);
            fallback = body.substr(sep + 2);
        }

        auto it = overrides.find(name);
        if (it != overrides.end()) {
            out += it->second;
        } else if (const char* env = std::getenv(name.c_str())) {
            out += env;
        } else if (fallback) {
            out += *fallback;
        } else {
            unresolved = value.substr(open, close - open + 1);
            return std::nullopt;
        }

        pos = close + 1;
    }

    return out;
}

} // namespace vaidya
