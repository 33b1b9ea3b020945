#include <vaidya/discovery.hpp>
#include <vaidya/log.hpp>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace vaidya {

std::vector<std::string> find_declaration_files(const Config& config) {
    std::vector<std::string> files;
    std::error_code ec;

    std::string user_settings = config.home_dir + "/.claude.json";
    if (fs::is_regular_file(user_settings, ec)) {
        files.push_back(user_settings);
    }

    std::string project = config.project_dir + "/.mcp.json";
    if (fs::is_regular_file(project, ec)) {
        files.push_back(project);
    }

    fs::path plugin_cache = fs::path(config.claude_dir) / "plugins" / "cache";
    if (fs::is_directory(plugin_cache, ec)) {
        std::vector<std::string> plugin_files;
        auto it = fs::recursive_directory_iterator(
            plugin_cache, fs::directory_options::skip_permission_denied, ec);
        for (; !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
            if (it->path().filename() == ".mcp.json" && it->is_regular_file(ec)) {
                plugin_files.push_back(it->path().string());
            }
        }
        if (ec) {
            log_debug("discovery", "Stopped walking %s: %s",
                      plugin_cache.string().c_str(), ec.message().c_str());
        }
        std::sort(plugin_files.begin(), plugin_files.end());
        files.insert(files.end(), plugin_files.begin(), plugin_files.end());
    }

    log_debug("discovery", "Found %zu declaration file(s)", files.size());
    return files;
}

SourceDocument load_source_document(const std::string& path) {
    SourceDocument doc;
    doc.path = path;

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        doc.read_error = std::string("cannot open file: ") + strerror(errno);
        return doc;
    }

    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad()) {
        doc.read_error = "read failed";
        return doc;
    }
    doc.content = ss.str();
    return doc;
}

std::vector<SourceDocument> load_source_documents(const std::vector<std::string>& paths) {
    std::vector<SourceDocument> docs;
    docs.reserve(paths.size());
    for (const auto& path : paths) {
        docs.push_back(load_source_document(path));
    }
    return docs;
}

} // namespace vaidya
