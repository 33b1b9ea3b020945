#include <vaidya/validator.hpp>
#include <vaidya/log.hpp>
#include <sys/stat.h>
#include <unistd.h>
#include <cstdlib>
#include <sstream>

namespace vaidya {

namespace {

bool path_exists(const std::string& path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0;
}

bool is_executable_file(const std::string& path) {
    struct stat st;
    if (stat(path.c_str(), &st) != 0) return false;
    return S_ISREG(st.st_mode) && access(path.c_str(), X_OK) == 0;
}

ValidationIssue make_issue(const ServiceDescriptor& service, Severity severity,
                           IssueKind kind, std::string message) {
    ValidationIssue issue;
    issue.service = service.name;
    issue.severity = severity;
    issue.kind = kind;
    issue.message = std::move(message);
    issue.source = service.source.to_string();
    return issue;
}

}  // anonymous namespace

bool command_exists(const std::string& command) {
    if (command.empty()) return false;

    if (command[0] == '/') {
        return path_exists(command);
    }
    if (command.find('/') != std::string::npos) {
        return is_executable_file(command);
    }

    const char* path_env = std::getenv("PATH");
    if (!path_env) return false;

    std::istringstream dirs(path_env);
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        if (dir.empty()) dir = ".";
        if (is_executable_file(dir + "/" + command)) {
            return true;
        }
    }
    return false;
}

ValidationResult validate(const std::string& source_path,
                          const std::vector<ServiceDescriptor>& services) {
    ValidationResult result;
    result.source_path = source_path;
    result.services = services;

    auto& issues = result.issues;

    for (const auto& service : services) {
        if (service.command.empty()) {
            auto issue = make_issue(service, Severity::Error, IssueKind::MissingField,
                                    "Missing 'command' field");
            issue.fix = "Add a 'command' field specifying the executable to run";
            issues.push_back(std::move(issue));
        } else {
            if (has_placeholder(service.command)) {
                // Templated: resolved at launch time, nothing to check here
                log_debug("validator", "Skipping resolution of templated command for '%s'",
                          service.name.c_str());
            } else if (!command_exists(service.command)) {
                auto issue = make_issue(service, Severity::Error, IssueKind::BinaryNotFound,
                                        "Command '" + service.command + "' not found");
                issue.fix = "Install or provide full path for '" + service.command + "'";
                issues.push_back(std::move(issue));
            }

            for (const auto& arg : service.args) {
                if (!arg.empty() && arg[0] == '/' && !has_placeholder(arg) && !path_exists(arg)) {
                    issues.push_back(make_issue(service, Severity::Warning, IssueKind::PathNotFound,
                                                "Argument path '" + arg + "' does not exist"));
                }
            }
        }

        if (service.transport_type.empty()) {
            issues.push_back(make_issue(service, Severity::Info, IssueKind::MissingTypeHint,
                                        "No 'type' specified, defaulting to 'stdio'"));
        }

        for (const auto& [key, value] : service.env) {
            if (value.empty()) {
                issues.push_back(make_issue(service, Severity::Warning,
                                            IssueKind::EmptyEnvironmentValue,
                                            "Environment variable '" + key + "' is empty"));
            }
        }
    }

    for (const auto& issue : issues) {
        if (issue.severity == Severity::Error) {
            result.valid = false;
            break;
        }
    }

    return result;
}

ValidationResult validate_document(const SourceDocument& document) {
    auto extracted = extract_descriptors(document);
    auto result = validate(document.path, extracted.descriptors);

    if (!extracted.issues.empty()) {
        result.issues.insert(result.issues.begin(),
                             extracted.issues.begin(), extracted.issues.end());
        result.valid = false;
    }

    return result;
}

} // namespace vaidya
