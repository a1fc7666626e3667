#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

#include "core/batch_report.h"
#include "probe/prober.h"
#include "probe/status_policy.h"

namespace modelswitch {

/// Called once per endpoint as results come in, in completion order.
using ProgressCallback = std::function<void(size_t completed, size_t total)>;

struct BatchOptions {
    static constexpr int kDefaultConcurrency = 5;
    static constexpr int kMaxConcurrency = 10;

    int concurrency_limit{kDefaultConcurrency};
    std::chrono::milliseconds per_endpoint_timeout{8000};
    // Caps the wall-clock time of the whole batch when set.
    std::optional<std::chrono::milliseconds> batch_timeout;
    StatusPolicy status_policy;
};

/// Fans a batch of probes out over a bounded set of worker threads.
///
/// Every descriptor gets exactly one outcome. A prober that throws yields an
/// internal-error outcome for that endpoint only. When the batch timeout
/// fires, probes still in flight are abandoned (their threads are detached
/// and their late results discarded silently) and reported as batchTimeout.
/// Abandoned threads may still be inside the prober when the process exits.
class ProbeScheduler {
public:
    explicit ProbeScheduler(std::shared_ptr<Prober> prober);

    /// Throws std::invalid_argument for an empty batch, duplicate or empty
    /// names, an empty base URL, a non-positive concurrency limit or a
    /// timeout outside (0, kMaxProbeTimeout]. Concurrency above
    /// kMaxConcurrency is clamped.
    BatchReport runBatch(const std::vector<EndpointDescriptor>& descriptors,
                         const BatchOptions& options,
                         ProgressCallback progress = nullptr);

private:
    std::shared_ptr<Prober> prober_;
};

/// Throws std::invalid_argument describing the first contract violation.
void validateBatch(const std::vector<EndpointDescriptor>& descriptors, const BatchOptions& options);

}  // namespace modelswitch
