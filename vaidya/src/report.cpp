#include <vaidya/report.hpp>
#include <vaidya/rpc/protocol.hpp>
#include <cstdio>
#include <ctime>
#include <sstream>

namespace vaidya {

namespace {

template <typename T>
void put_optional(json& j, const char* key, const std::optional<T>& value) {
    if (value) j[key] = *value;
}

const char* severity_icon(Severity severity) {
    switch (severity) {
        case Severity::Error: return "✗";
        case Severity::Warning: return "⚠";
        case Severity::Info: return "ℹ";
    }
    return "?";
}

// Paths and parser messages are not guaranteed to be UTF-8
std::string text(const std::string& s) {
    return rpc::sanitize_utf8(s);
}

std::string join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += sep;
        out += parts[i];
    }
    return out;
}

}  // anonymous namespace

json to_json(const ServiceDescriptor& service) {
    json j = {
        {"name", service.name},
        {"type", service.transport_type},
        {"command", service.command},
        {"args", service.args},
        {"env", service.env},
        {"source", text(service.source.to_string())}
    };
    return j;
}

json to_json(const ValidationIssue& issue) {
    json j = {
        {"server", issue.service},
        {"severity", severity_to_string(issue.severity)},
        {"kind", issue_kind_to_string(issue.kind)},
        {"message", text(issue.message)},
        {"source", text(issue.source)}
    };
    put_optional(j, "fix", issue.fix);
    return j;
}

json to_json(const ValidationResult& result) {
    json services = json::array();
    for (const auto& s : result.services) services.push_back(to_json(s));
    json issues = json::array();
    for (const auto& i : result.issues) issues.push_back(to_json(i));

    return {
        {"configPath", text(result.source_path)},
        {"servers", services},
        {"issues", issues},
        {"valid", result.valid}
    };
}

json to_json(const CapabilityProbeResult& result) {
    json tools = json::array();
    for (const auto& t : result.tools) {
        json j = {{"name", t.name}};
        put_optional(j, "description", t.description);
        if (!t.input_schema.is_null()) j["inputSchema"] = t.input_schema;
        tools.push_back(j);
    }

    json resources = json::array();
    for (const auto& r : result.resources) {
        json j = {{"uri", r.uri}};
        put_optional(j, "name", r.name);
        put_optional(j, "description", r.description);
        put_optional(j, "mimeType", r.mime_type);
        resources.push_back(j);
    }

    json prompts = json::array();
    for (const auto& p : result.prompts) {
        json j = {{"name", p.name}};
        put_optional(j, "description", p.description);
        if (p.arguments) {
            json args = json::array();
            for (const auto& a : *p.arguments) {
                json arg = {{"name", a.name}};
                put_optional(arg, "description", a.description);
                put_optional(arg, "required", a.required);
                args.push_back(arg);
            }
            j["arguments"] = args;
        }
        prompts.push_back(j);
    }

    json j = {
        {"tools", tools},
        {"resources", resources},
        {"prompts", prompts},
        {"probeTime", result.elapsed_ms},
        {"outcome", probe_outcome_to_string(result.outcome)}
    };
    if (result.server_info) {
        j["serverInfo"] = {
            {"name", result.server_info->name},
            {"version", result.server_info->version}
        };
    }
    if (result.capabilities) {
        json caps = json::object();
        put_optional(caps, "tools", result.capabilities->tools);
        put_optional(caps, "resources", result.capabilities->resources);
        put_optional(caps, "prompts", result.capabilities->prompts);
        j["capabilities"] = caps;
    }
    if (result.error) j["error"] = text(*result.error);
    return j;
}

json to_json(const DiagnosticReport& report) {
    json configs = json::array();
    for (const auto& c : report.configs) configs.push_back(to_json(c));

    json duplicates = json::array();
    for (const auto& d : report.duplicates) {
        json locations = json::array();
        for (const auto& loc : d.locations) locations.push_back(text(loc));
        duplicates.push_back({{"name", d.name}, {"locations", locations}});
    }

    json j = {
        {"configs", configs},
        {"duplicateServers", duplicates},
        {"totalServers", report.total_services},
        {"healthyServers", report.healthy_services},
        {"recommendations", report.recommendations},
        {"generatedAt", format_timestamp(report.generated_at)}
    };

    if (report.probes) {
        json probes = json::array();
        for (const auto& p : *report.probes) {
            json entry = to_json(p.result);
            entry["server"] = p.descriptor.name;
            entry["source"] = text(p.descriptor.source.to_string());
            probes.push_back(entry);
        }
        j["probeResults"] = probes;
    }
    return j;
}

std::string format_timestamp(std::chrono::system_clock::time_point tp) {
    auto t = std::chrono::system_clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()).count() % 1000;

    std::tm utc{};
    gmtime_r(&t, &utc);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &utc);

    char out[40];
    snprintf(out, sizeof(out), "%s.%03lldZ", buf, static_cast<long long>(ms));
    return out;
}

std::string format_report(const DiagnosticReport& report) {
    std::ostringstream out;
    out << "╔══════════════════════════════════════════════╗\n";
    out << "║         MCP SERVER DIAGNOSTICS               ║\n";
    out << "╚══════════════════════════════════════════════╝\n\n";

    out << "Total servers: " << report.total_services << "\n";
    out << "Healthy: " << report.healthy_services << "\n";
    out << "Config files: " << report.configs.size() << "\n\n";

    for (const auto& config : report.configs) {
        out << "Config: " << config.source_path << "\n";
        out << "  Servers: " << config.services.size() << "\n";
        out << "  Valid: " << (config.valid ? "✓" : "✗") << "\n";

        for (const auto& service : config.services) {
            out << "\n  [" << service.name << "]";
            if (!service.source.scope.empty()) out << " (project: " << service.source.scope << ")";
            out << "\n";
            out << "    Command: " << service.command << "\n";
            if (!service.args.empty()) out << "    Args: " << join(service.args, " ") << "\n";
        }

        if (!config.issues.empty()) {
            out << "\n  Issues:\n";
            for (const auto& issue : config.issues) {
                out << "    " << severity_icon(issue.severity) << " [" << issue.service << "] "
                    << issue.message << "\n";
                if (issue.fix) out << "      Fix: " << *issue.fix << "\n";
            }
        }
        out << "\n";
    }

    if (report.probes) {
        out << "Capability Probes:\n";
        for (const auto& p : *report.probes) {
            const auto& r = p.result;
            out << "  " << p.descriptor.name << ": "
                << (r.error ? "✗ " : "✓ ")
                << r.tools.size() << " tools, "
                << r.resources.size() << " resources, "
                << r.prompts.size() << " prompts"
                << " (" << r.elapsed_ms << "ms)";
            if (r.error) out << " - " << *r.error;
            out << "\n";
        }
        out << "\n";
    }

    if (!report.duplicates.empty()) {
        out << "Duplicate Server Names:\n";
        for (const auto& dup : report.duplicates) {
            out << "  " << dup.name << ": found in " << dup.locations.size() << " configs\n";
            for (const auto& loc : dup.locations) {
                out << "    - " << loc << "\n";
            }
        }
        out << "\n";
    }

    if (!report.recommendations.empty()) {
        out << "Recommendations:\n";
        for (const auto& rec : report.recommendations) {
            out << "  • " << rec << "\n";
        }
    }

    return out.str();
}

std::string format_probe_result(const std::string& name, const CapabilityProbeResult& result) {
    std::ostringstream out;
    out << "Server: " << name << "\n";
    out << "═══════════════════════════════\n";

    if (result.server_info) {
        out << "Identity: " << result.server_info->name;
        if (!result.server_info->version.empty()) out << " " << result.server_info->version;
        out << "\n";
    }
    out << "Outcome:  " << probe_outcome_to_string(result.outcome)
        << " (" << result.elapsed_ms << "ms)\n";
    if (result.error) out << "Error:    " << *result.error << "\n";

    out << "\nTools (" << result.tools.size() << "):\n";
    for (const auto& t : result.tools) {
        out << "  " << t.name;
        if (t.description) out << " - " << *t.description;
        out << "\n";
    }

    out << "\nResources (" << result.resources.size() << "):\n";
    for (const auto& r : result.resources) {
        out << "  " << r.uri;
        if (r.name) out << " (" << *r.name << ")";
        if (r.mime_type) out << " [" << *r.mime_type << "]";
        out << "\n";
    }

    out << "\nPrompts (" << result.prompts.size() << "):\n";
    for (const auto& p : result.prompts) {
        out << "  " << p.name;
        if (p.arguments && !p.arguments->empty()) {
            std::vector<std::string> names;
            for (const auto& a : *p.arguments) {
                names.push_back(a.required.value_or(false) ? a.name + "*" : a.name);
            }
            out << "(" << join(names, ", ") << ")";
        }
        if (p.description) out << " - " << *p.description;
        out << "\n";
    }

    return out.str();
}

} // namespace vaidya
