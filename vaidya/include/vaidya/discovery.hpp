#pragma once
// Discovery: locate and load declaration documents
//
// Search order:
//   <home>/.claude.json
//   <project_dir>/.mcp.json
//   <claude_dir>/plugins/cache/**/.mcp.json   (sorted)

#include <vaidya/config.hpp>
#include <vaidya/descriptor.hpp>
#include <string>
#include <vector>

namespace vaidya {

std::vector<std::string> find_declaration_files(const Config& config);

// Read one file. Failures are recorded in SourceDocument::read_error.
SourceDocument load_source_document(const std::string& path);

std::vector<SourceDocument> load_source_documents(const std::vector<std::string>& paths);

} // namespace vaidya
