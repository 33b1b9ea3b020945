#include <vaidya/diagnostics.hpp>
#include <vaidya/log.hpp>
#include <vaidya/validator.hpp>
#include <algorithm>
#include <unordered_map>

namespace vaidya {

ProbeFn default_probe_fn() {
    return [](const ServiceDescriptor& descriptor, int timeout_ms) {
        CapabilityProber prober;
        return prober.probe(descriptor, timeout_ms);
    };
}

std::vector<DuplicateService> find_duplicates(const std::vector<ValidationResult>& configs) {
    std::vector<std::string> order;
    std::unordered_map<std::string, std::vector<std::string>> locations;

    for (const auto& config : configs) {
        for (const auto& service : config.services) {
            auto it = locations.find(service.name);
            if (it == locations.end()) {
                order.push_back(service.name);
                it = locations.emplace(service.name, std::vector<std::string>{}).first;
            }
            it->second.push_back(service.source.to_string());
        }
    }

    std::vector<DuplicateService> duplicates;
    for (const auto& name : order) {
        const auto& where = locations[name];
        bool distinct = std::any_of(where.begin(), where.end(),
            [&](const std::string& loc) { return loc != where.front(); });
        if (distinct) {
            duplicates.push_back({name, where});
        }
    }
    return duplicates;
}

DiagnosticReport diagnose(const std::vector<SourceDocument>& sources,
                          const DiagnosticOptions& options,
                          ProbeFn probe_fn) {
    DiagnosticReport report;
    report.generated_at = std::chrono::system_clock::now();

    for (const auto& source : sources) {
        report.configs.push_back(validate_document(source));
    }

    report.duplicates = find_duplicates(report.configs);

    size_t unhealthy = 0;
    for (const auto& config : report.configs) {
        report.total_services += config.services.size();
        for (const auto& service : config.services) {
            if (config.has_error_for(service)) ++unhealthy;
        }
    }
    report.healthy_services = report.total_services - unhealthy;

    size_t failed_probes = 0;
    if (options.probe) {
        std::vector<ProbeRecord> probes;
        for (const auto& config : report.configs) {
            for (const auto& service : config.services) {
                if (config.has_error_for(service)) {
                    log_debug("diagnose", "Not probing '%s': configuration errors",
                              service.name.c_str());
                    continue;
                }
                log_debug("diagnose", "Probing '%s' (%s)", service.name.c_str(),
                          service.source.to_string().c_str());
                auto result = probe_fn(service, options.timeout_ms);
                if (result.error) ++failed_probes;
                probes.push_back({service, std::move(result)});
            }
        }
        report.probes = std::move(probes);
    }

    if (!report.duplicates.empty()) {
        report.recommendations.push_back("Found " + std::to_string(report.duplicates.size()) +
                                         " duplicate server name(s) across configs");
    }
    if (unhealthy > 0) {
        report.recommendations.push_back(std::to_string(unhealthy) +
                                         " server(s) have configuration errors");
    }
    if (report.total_services == 0) {
        report.recommendations.push_back("No MCP servers configured");
    }
    if (failed_probes > 0) {
        report.recommendations.push_back(std::to_string(failed_probes) +
                                         " server(s) failed capability probing");
    }

    return report;
}

std::optional<ServiceDescriptor> find_service(const DiagnosticReport& report,
                                              const std::string& name) {
    for (const auto& config : report.configs) {
        for (const auto& service : config.services) {
            if (service.name == name) return service;
        }
    }
    return std::nullopt;
}

} // namespace vaidya
