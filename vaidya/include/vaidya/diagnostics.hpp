#pragma once
// Diagnostic Aggregator: validate every source, find cross-source name
// collisions, optionally probe, and summarise health
//
// Probing is strictly sequential (source order, then declaration order):
// at most one child process is alive at any time.

#include <vaidya/descriptor.hpp>
#include <vaidya/prober.hpp>
#include <vaidya/types.hpp>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace vaidya {

struct DiagnosticOptions {
    bool probe = false;
    int timeout_ms = CapabilityProber::DEFAULT_TIMEOUT_MS;
};

using ProbeFn = std::function<CapabilityProbeResult(const ServiceDescriptor&, int timeout_ms)>;

// Default ProbeFn backed by a CapabilityProber
ProbeFn default_probe_fn();

DiagnosticReport diagnose(const std::vector<SourceDocument>& sources,
                          const DiagnosticOptions& options = {},
                          ProbeFn probe_fn = default_probe_fn());

// Names declared by more than one distinct source, in first-seen order
std::vector<DuplicateService> find_duplicates(const std::vector<ValidationResult>& configs);

// First descriptor named `name` across the report's configs
std::optional<ServiceDescriptor> find_service(const DiagnosticReport& report,
                                              const std::string& name);

} // namespace vaidya
