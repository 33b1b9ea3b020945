#pragma once
// Descriptor extraction: declaration documents -> ServiceDescriptors
//
// Two document shapes are recognised:
//   server map     {"mcpServers": {name: spec, ...}}            (.mcp.json)
//   user settings  {"mcpServers": {...},
//                   "projects": {key: {"mcpServers": {...}}}}   (~/.claude.json)
//
// Descriptors from a project section carry SourceId{path, key}.
// Anything the extractor cannot make sense of yields no descriptors and
// a single document-level error issue.

#include <vaidya/types.hpp>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace vaidya {

// Raw declaration document handed over by the walker
struct SourceDocument {
    std::string path;
    std::string content;
    std::string read_error;  // non-empty when the file could not be read
};

enum class DocumentShape {
    ServerMap,
    UserSettings
};

struct ExtractionResult {
    std::vector<ServiceDescriptor> descriptors;
    std::vector<ValidationIssue> issues;  // document-level only
};

DocumentShape shape_for_path(const std::string& path);

ExtractionResult extract_descriptors(const SourceDocument& document);

// Extract the "mcpServers" map of one JSON object. Malformed entries are skipped.
std::vector<ServiceDescriptor> extract_server_map(const json& servers, const SourceId& source);

// Does the string contain a ${...} template placeholder?
bool has_placeholder(const std::string& value);

// Substitute ${VAR} and ${VAR:-default}. Lookup order: overrides, then the
// process environment. Returns nullopt and sets `unresolved` to the first
// placeholder that has neither a value nor a default.
std::optional<std::string> expand_placeholders(
    const std::string& value,
    const std::map<std::string, std::string>& overrides,
    std::string& unresolved);

} // namespace vaidya
