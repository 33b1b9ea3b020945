#pragma once
// Core types: descriptors, issues, probe results, reports
//
// Plain value structs. Created fresh on every diagnostic run,
// never persisted, never mutated after they leave the stage
// that built them.

#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace vaidya {

using json = nlohmann::json;

// Where a descriptor was declared: a document, optionally narrowed to
// one per-project override section inside it.
struct SourceId {
    std::string path;
    std::string scope;  // project key, empty for the top-level map

    std::string to_string() const {
        if (scope.empty()) return path;
        return path + " [project: " + scope + "]";
    }

    bool operator==(const SourceId& other) const {
        return path == other.path && scope == other.scope;
    }

    bool operator!=(const SourceId& other) const {
        return !(*this == other);
    }
};

struct ServiceDescriptor {
    std::string name;
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
    std::string transport_type;  // empty when the document omits "type"
    SourceId source;
};

enum class Severity {
    Error,
    Warning,
    Info
};

enum class IssueKind {
    MissingField,
    BinaryNotFound,
    PathNotFound,
    EmptyEnvironmentValue,
    MissingTypeHint,
    DocumentUnparseable
};

// Service name used for issues that concern the whole document
constexpr const char* DOCUMENT_SCOPE = "(file)";

struct ValidationIssue {
    std::string service;
    Severity severity = Severity::Error;
    IssueKind kind = IssueKind::MissingField;
    std::string message;
    std::optional<std::string> fix;
    std::string source;  // SourceId::to_string() of the named descriptor
};

struct ValidationResult {
    std::string source_path;
    std::vector<ServiceDescriptor> services;
    std::vector<ValidationIssue> issues;
    bool valid = true;

    bool has_error_for(const ServiceDescriptor& service) const;
};

// Capability surface reported by a live server

struct ToolInfo {
    std::string name;
    std::optional<std::string> description;
    json input_schema;  // null when absent
};

struct ResourceInfo {
    std::string uri;
    std::optional<std::string> name;
    std::optional<std::string> description;
    std::optional<std::string> mime_type;
};

struct PromptArgument {
    std::string name;
    std::optional<std::string> description;
    std::optional<bool> required;
};

struct PromptInfo {
    std::string name;
    std::optional<std::string> description;
    std::optional<std::vector<PromptArgument>> arguments;
};

struct ServerInfo {
    std::string name;
    std::string version;
};

struct CapabilityFlags {
    std::optional<bool> tools;
    std::optional<bool> resources;
    std::optional<bool> prompts;
};

// How a child process ended
struct ExitStatus {
    bool signaled = false;
    int code = 0;  // exit code, or signal number when signaled
};

enum class ProbeOutcome {
    Complete,
    TimedOut,
    PrematureExit,
    TransportError
};

struct CapabilityProbeResult {
    std::vector<ToolInfo> tools;
    std::vector<ResourceInfo> resources;
    std::vector<PromptInfo> prompts;
    std::optional<ServerInfo> server_info;
    std::optional<CapabilityFlags> capabilities;
    int64_t elapsed_ms = 0;
    std::optional<std::string> error;
    ProbeOutcome outcome = ProbeOutcome::TransportError;
};

struct ProbeRecord {
    ServiceDescriptor descriptor;
    CapabilityProbeResult result;
};

struct DuplicateService {
    std::string name;
    std::vector<std::string> locations;
};

struct DiagnosticReport {
    std::vector<ValidationResult> configs;
    std::optional<std::vector<ProbeRecord>> probes;
    std::vector<DuplicateService> duplicates;
    size_t total_services = 0;
    size_t healthy_services = 0;
    std::vector<std::string> recommendations;
    std::chrono::system_clock::time_point generated_at;
};

inline bool ValidationResult::has_error_for(const ServiceDescriptor& service) const {
    const std::string location = service.source.to_string();
    for (const auto& issue : issues) {
        if (issue.severity == Severity::Error &&
            issue.service == service.name &&
            issue.source == location) {
            return true;
        }
    }
    return false;
}

inline const char* severity_to_string(Severity severity) {
    switch (severity) {
        case Severity::Error: return "error";
        case Severity::Warning: return "warning";
        case Severity::Info: return "info";
    }
    return "error";
}

inline const char* issue_kind_to_string(IssueKind kind) {
    switch (kind) {
        case IssueKind::MissingField: return "missing_field";
        case IssueKind::BinaryNotFound: return "binary_not_found";
        case IssueKind::PathNotFound: return "path_not_found";
        case IssueKind::EmptyEnvironmentValue: return "empty_environment_value";
        case IssueKind::MissingTypeHint: return "missing_type_hint";
        case IssueKind::DocumentUnparseable: return "document_unparseable";
    }
    return "unknown";
}

inline const char* probe_outcome_to_string(ProbeOutcome outcome) {
    switch (outcome) {
        case ProbeOutcome::Complete: return "complete";
        case ProbeOutcome::TimedOut: return "timed_out";
        case ProbeOutcome::PrematureExit: return "premature_exit";
        case ProbeOutcome::TransportError: return "transport_error";
    }
    return "unknown";
}

} // namespace vaidya
