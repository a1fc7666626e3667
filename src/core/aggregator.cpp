#include "core/aggregator.h"

#include <unordered_map>

#include <spdlog/spdlog.h>

namespace modelswitch {

BatchReport aggregate(const std::vector<ProbeOutcome>& outcomes,
                      const std::vector<EndpointDescriptor>& original_order,
                      const StatusPolicy& policy) {
    std::unordered_map<std::string, size_t> index_by_name;
    index_by_name.reserve(original_order.size());
    for (size_t i = 0; i < original_order.size(); ++i) {
        index_by_name.emplace(original_order[i].name, i);
    }

    std::vector<const ProbeOutcome*> slots(original_order.size(), nullptr);
    for (const auto& outcome : outcomes) {
        auto it = index_by_name.find(outcome.name);
        if (it == index_by_name.end()) {
            spdlog::warn("Aggregator: dropping outcome for unknown endpoint '{}'", outcome.name);
            continue;
        }
        if (slots[it->second]) {
            spdlog::warn("Aggregator: ignoring duplicate outcome for '{}'", outcome.name);
            continue;
        }
        slots[it->second] = &outcome;
    }

    BatchReport report;
    report.results.reserve(original_order.size());
    for (size_t i = 0; i < original_order.size(); ++i) {
        ReportEntry entry;
        entry.endpoint = original_order[i];
        if (slots[i]) {
            entry.outcome = *slots[i];
        } else {
            entry.outcome = ProbeOutcome::unreachable(original_order[i].name, ErrorKind::Internal,
                                                      "no outcome recorded");
        }
        if (!entry.outcome.reachable) {
            entry.outcome.latency.reset();
        }
        entry.health = classifyHealth(entry.outcome, policy);
        report.results.push_back(std::move(entry));
    }
    return report;
}

FailoverDecision selectFailover(const BatchReport& report,
                                const std::optional<std::string>& current_active) {
    FailoverDecision decision;

    if (current_active) {
        const auto* current = report.find(*current_active);
        if (current && current->health == HealthState::Healthy) {
            decision.chosen = *current_active;
            decision.reason = FailoverReason::CurrentHealthy;
            return decision;
        }
    }

    const ReportEntry* best = nullptr;
    auto best_latency = std::chrono::microseconds::max();
    for (const auto& entry : report.results) {
        if (entry.health != HealthState::Healthy) continue;
        const auto latency = entry.outcome.latency.value_or(std::chrono::microseconds::max());
        // Strict comparison keeps the earliest entry on ties.
        if (!best || latency < best_latency) {
            best = &entry;
            best_latency = latency;
        }
    }

    if (!best) {
        decision.reason = FailoverReason::NoHealthyCandidate;
        return decision;
    }
    decision.chosen = best->endpoint.name;
    decision.reason = FailoverReason::FasterAlternative;
    return decision;
}

}  // namespace modelswitch
