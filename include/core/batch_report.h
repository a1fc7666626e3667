#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "probe/endpoint.h"

namespace modelswitch {

struct ReportEntry {
    EndpointDescriptor endpoint;
    ProbeOutcome outcome;
    HealthState health{HealthState::Unreachable};
};

/// Result of one probe batch. results follow the caller's descriptor order,
/// never the order in which probes finished.
struct BatchReport {
    std::vector<ReportEntry> results;
    std::chrono::system_clock::time_point started_at{};
    std::chrono::system_clock::time_point completed_at{};

    const ReportEntry* find(const std::string& name) const {
        for (const auto& entry : results) {
            if (entry.endpoint.name == name) return &entry;
        }
        return nullptr;
    }

    size_t countHealth(HealthState state) const {
        size_t n = 0;
        for (const auto& entry : results) {
            if (entry.health == state) ++n;
        }
        return n;
    }
};

enum class FailoverReason {
    CurrentHealthy,
    FasterAlternative,
    NoHealthyCandidate,
};

struct FailoverDecision {
    std::optional<std::string> chosen;
    FailoverReason reason{FailoverReason::NoHealthyCandidate};
};

inline const char* to_string(FailoverReason reason) {
    switch (reason) {
        case FailoverReason::CurrentHealthy:
            return "currentHealthy";
        case FailoverReason::FasterAlternative:
            return "fasterAlternative";
        case FailoverReason::NoHealthyCandidate:
            return "noHealthyCandidate";
    }
    return "unknown";
}

}  // namespace modelswitch
