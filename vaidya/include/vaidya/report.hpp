#pragma once
// Report: JSON serialisation and human-readable rendering

#include <vaidya/types.hpp>
#include <string>

namespace vaidya {

json to_json(const ServiceDescriptor& service);
json to_json(const ValidationIssue& issue);
json to_json(const ValidationResult& result);
json to_json(const CapabilityProbeResult& result);
json to_json(const DiagnosticReport& report);

// UTC, e.g. 2026-10-18T05:42:07.123Z
std::string format_timestamp(std::chrono::system_clock::time_point tp);

std::string format_report(const DiagnosticReport& report);
std::string format_probe_result(const std::string& name, const CapabilityProbeResult& result);

} // namespace vaidya
