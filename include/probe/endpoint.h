// endpoint.h - endpoint descriptors and probe outcomes
#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace modelswitch {

/// Upper bound for per-endpoint and batch timeouts. Larger values would
/// overflow the nanosecond clocks used for waiting.
constexpr std::chrono::milliseconds kMaxProbeTimeout{std::chrono::hours(24)};

/// One named API endpoint profile as handed to the prober.
struct EndpointDescriptor {
    std::string name;      // unique within a batch
    std::string base_url;  // e.g. https://api.example.com or https://proxy/anthropic
    std::string token;     // opaque, may be empty
    std::optional<std::chrono::milliseconds> timeout_override;
};

/// Why a probe did not produce a clean answer.
enum class ErrorKind {
    ConnectionRefused,
    DnsFailure,
    TlsFailure,
    Timeout,
    RateLimited,        // online but limited, not a failure
    MalformedResponse,
    BatchTimeout,
    Internal,
};

/// Which request mode produced the final answer.
enum class ProbeMode {
    Streaming,
    NonStreaming,
};

enum class HealthState {
    Healthy,
    Degraded,
    Unreachable,
};

struct ProbeOutcome {
    std::string name;
    bool reachable{false};
    std::optional<std::chrono::microseconds> latency;  // set only when reachable
    std::optional<int> http_status;
    std::optional<ErrorKind> error_kind;
    std::optional<std::string> raw_detail;
    ProbeMode mode{ProbeMode::Streaming};

    static ProbeOutcome unreachable(std::string name, ErrorKind kind, std::string detail = {}) {
        ProbeOutcome out;
        out.name = std::move(name);
        out.reachable = false;
        out.error_kind = kind;
        if (!detail.empty()) out.raw_detail = std::move(detail);
        return out;
    }
};

inline const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::ConnectionRefused:
            return "connectionRefused";
        case ErrorKind::DnsFailure:
            return "dnsFailure";
        case ErrorKind::TlsFailure:
            return "tlsFailure";
        case ErrorKind::Timeout:
            return "timeout";
        case ErrorKind::RateLimited:
            return "rateLimited";
        case ErrorKind::MalformedResponse:
            return "malformedResponse";
        case ErrorKind::BatchTimeout:
            return "batchTimeout";
        case ErrorKind::Internal:
            return "internal";
    }
    return "unknown";
}

inline const char* to_string(HealthState state) {
    switch (state) {
        case HealthState::Healthy:
            return "healthy";
        case HealthState::Degraded:
            return "degraded";
        case HealthState::Unreachable:
            return "unreachable";
    }
    return "unknown";
}

inline const char* to_string(ProbeMode mode) {
    switch (mode) {
        case ProbeMode::Streaming:
            return "streaming";
        case ProbeMode::NonStreaming:
            return "nonStreaming";
    }
    return "unknown";
}

}  // namespace modelswitch
