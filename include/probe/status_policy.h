// status_policy.h - HTTP status tables used to classify probe answers
#pragma once

#include <vector>

#include "probe/endpoint.h"

namespace modelswitch {

/// Status-code tables shared read-only by every probe of a batch.
struct StatusPolicy {
    // Answers that mean "online but limited" (quota, rate limit, conflict).
    std::vector<int> rate_limit_statuses{409, 429};
    // Answers to a streaming request that mean the endpoint rejects the
    // streaming form itself; these trigger one non-streaming retry.
    std::vector<int> fallback_statuses{400, 405, 415, 422};

    bool isRateLimited(int status) const;
    bool requiresFallback(int status) const;
};

/// Derive the health state of a single outcome.
///
/// Unreachable when no response arrived. Degraded for rate-limit statuses.
/// Healthy for 2xx/3xx, or for any answer to a streaming request. A
/// non-streaming answer outside 2xx/3xx is Degraded.
HealthState classifyHealth(const ProbeOutcome& outcome, const StatusPolicy& policy = {});

}  // namespace modelswitch
