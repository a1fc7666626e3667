#pragma once

#include <optional>
#include <string>
#include <vector>

#include "core/batch_report.h"
#include "probe/status_policy.h"

namespace modelswitch {

/// Build a report in original_order from outcomes in any order.
///
/// Outcomes are matched to descriptors by name. A descriptor without an
/// outcome gets an internal-error outcome so the report always holds exactly
/// one entry per descriptor. Outcomes naming unknown endpoints are dropped and
/// a second outcome for the same name is ignored.
BatchReport aggregate(const std::vector<ProbeOutcome>& outcomes,
                      const std::vector<EndpointDescriptor>& original_order,
                      const StatusPolicy& policy = {});

/// Pick the endpoint to promote.
///
/// A healthy current endpoint is always kept. Otherwise the healthy entry
/// with the lowest latency wins, earlier entries winning ties.
FailoverDecision selectFailover(const BatchReport& report,
                                const std::optional<std::string>& current_active = std::nullopt);

}  // namespace modelswitch
