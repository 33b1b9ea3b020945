#pragma once
// Capability Prober: spawn a tool server and run the discovery handshake
//
// One probe = one ChildProcess + one ProbeSession, multiplexed with poll()
// against a wall-clock deadline. probe() never throws for a misbehaving
// peer; every failure is reported in CapabilityProbeResult::error, next to
// whatever capability data arrived before it. The process is killed and
// reaped before probe() returns.

#include <vaidya/types.hpp>
#include <vaidya/probe_session.hpp>
#include <string>

namespace vaidya {

class CapabilityProber {
public:
    static constexpr int DEFAULT_TIMEOUT_MS = 10000;
    static constexpr size_t STDERR_TAIL_BYTES = 4096;
    // A stdout line longer than this fails the probe
    static constexpr size_t MAX_LINE_BYTES = 1024 * 1024;

    explicit CapabilityProber(ClientIdentity identity = ClientIdentity::current())
        : identity_(std::move(identity)) {}

    CapabilityProbeResult probe(const ServiceDescriptor& descriptor,
                                int timeout_ms = DEFAULT_TIMEOUT_MS) const;

private:
    ClientIdentity identity_;
};

} // namespace vaidya
