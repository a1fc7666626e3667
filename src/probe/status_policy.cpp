#include "probe/status_policy.h"

#include <algorithm>

namespace modelswitch {

bool StatusPolicy::isRateLimited(int status) const {
    return std::find(rate_limit_statuses.begin(), rate_limit_statuses.end(), status) !=
           rate_limit_statuses.end();
}

bool StatusPolicy::requiresFallback(int status) const {
    return std::find(fallback_statuses.begin(), fallback_statuses.end(), status) !=
           fallback_statuses.end();
}

HealthState classifyHealth(const ProbeOutcome& outcome, const StatusPolicy& policy) {
    if (!outcome.reachable) {
        return HealthState::Unreachable;
    }
    if (outcome.error_kind == ErrorKind::RateLimited) {
        return HealthState::Degraded;
    }
    if (!outcome.http_status) {
        // Reachable without a status only comes from custom probers.
        return HealthState::Healthy;
    }

    const int status = *outcome.http_status;
    if (policy.isRateLimited(status)) {
        return HealthState::Degraded;
    }
    if (status >= 200 && status < 400) {
        return HealthState::Healthy;
    }
    if (outcome.mode == ProbeMode::Streaming) {
        return HealthState::Healthy;
    }
    return HealthState::Degraded;
}

}  // namespace modelswitch
