#include "core/probe_scheduler.h"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>
#include <unordered_set>
#include <utility>

#include <spdlog/spdlog.h>

#include "core/aggregator.h"

namespace modelswitch {

namespace {

// Shared between the caller and the workers. Owned through shared_ptr so
// that abandoned workers can outlive runBatch().
struct BatchState {
    std::shared_ptr<Prober> prober;
    std::vector<EndpointDescriptor> descriptors;
    std::chrono::milliseconds default_timeout{0};
    ProgressCallback progress;

    std::atomic<size_t> next{0};

    std::mutex mutex;
    std::condition_variable cv;
    std::vector<ProbeOutcome> outcomes;  // completion order
    std::vector<bool> done;
    bool closed{false};
};

void notifyProgress(BatchState& state) {
    if (!state.progress) return;
    try {
        state.progress(state.outcomes.size(), state.descriptors.size());
    } catch (const std::exception& e) {
        spdlog::warn("Progress callback failed: {}", e.what());
    }
}

ProbeOutcome runOne(Prober& prober, const EndpointDescriptor& endpoint,
                    std::chrono::milliseconds timeout) {
    ProbeOutcome outcome;
    try {
        outcome = prober.probe(endpoint, timeout);
    } catch (const std::exception& e) {
        spdlog::error("Probe {} raised: {}", endpoint.name, e.what());
        return ProbeOutcome::unreachable(endpoint.name, ErrorKind::Internal, e.what());
    } catch (...) {
        spdlog::error("Probe {} raised a non-standard exception", endpoint.name);
        return ProbeOutcome::unreachable(endpoint.name, ErrorKind::Internal, "unknown exception");
    }
    outcome.name = endpoint.name;
    if (!outcome.reachable) {
        outcome.latency.reset();
    }
    return outcome;
}

void record(BatchState& state, size_t index, ProbeOutcome outcome) {
    std::lock_guard<std::mutex> lock(state.mutex);
    // Late results from abandoned workers are dropped without logging: the
    // caller may already be tearing down the process.
    if (state.closed) {
        return;
    }
    state.done[index] = true;
    state.outcomes.push_back(std::move(outcome));
    notifyProgress(state);
    state.cv.notify_all();
}

void workerLoop(const std::shared_ptr<BatchState>& state) {
    while (true) {
        {
            std::lock_guard<std::mutex> lock(state->mutex);
            if (state->closed) return;
        }
        const size_t index = state->next.fetch_add(1);
        if (index >= state->descriptors.size()) return;

        const auto& endpoint = state->descriptors[index];
        const auto timeout = endpoint.timeout_override.value_or(state->default_timeout);
        record(*state, index, runOne(*state->prober, endpoint, timeout));
    }
}

}  // namespace

void validateBatch(const std::vector<EndpointDescriptor>& descriptors, const BatchOptions& options) {
    if (descriptors.empty()) {
        throw std::invalid_argument("no endpoints to probe");
    }
    if (options.concurrency_limit <= 0) {
        throw std::invalid_argument("concurrency limit must be positive, got " +
                                    std::to_string(options.concurrency_limit));
    }
    if (options.per_endpoint_timeout.count() <= 0 || options.per_endpoint_timeout > kMaxProbeTimeout) {
        throw std::invalid_argument("per-endpoint timeout must be between 1 and " +
                                    std::to_string(kMaxProbeTimeout.count()) + "ms");
    }
    if (options.batch_timeout &&
        (options.batch_timeout->count() <= 0 || *options.batch_timeout > kMaxProbeTimeout)) {
        throw std::invalid_argument("batch timeout must be between 1 and " +
                                    std::to_string(kMaxProbeTimeout.count()) + "ms when set");
    }

    std::unordered_set<std::string> names;
    for (const auto& endpoint : descriptors) {
        if (endpoint.name.empty()) {
            throw std::invalid_argument("endpoint name must not be empty");
        }
        if (!names.insert(endpoint.name).second) {
            throw std::invalid_argument("duplicate endpoint name: " + endpoint.name);
        }
        if (endpoint.base_url.empty()) {
            throw std::invalid_argument("endpoint '" + endpoint.name + "' has no base URL");
        }
        if (endpoint.timeout_override &&
            (endpoint.timeout_override->count() <= 0 || *endpoint.timeout_override > kMaxProbeTimeout)) {
            throw std::invalid_argument("endpoint '" + endpoint.name + "' has an out-of-range timeout");
        }
    }
}

ProbeScheduler::ProbeScheduler(std::shared_ptr<Prober> prober) : prober_(std::move(prober)) {
    if (!prober_) {
        throw std::invalid_argument("ProbeScheduler requires a prober");
    }
}

BatchReport ProbeScheduler::runBatch(const std::vector<EndpointDescriptor>& descriptors,
                                     const BatchOptions& options,
                                     ProgressCallback progress) {
    validateBatch(descriptors, options);

    int limit = options.concurrency_limit;
    if (limit > BatchOptions::kMaxConcurrency) {
        spdlog::warn("Concurrency {} exceeds the maximum, using {}", limit, BatchOptions::kMaxConcurrency);
        limit = BatchOptions::kMaxConcurrency;
    }

    const size_t total = descriptors.size();
    auto state = std::make_shared<BatchState>();
    state->prober = prober_;
    state->descriptors = descriptors;
    state->default_timeout = options.per_endpoint_timeout;
    state->progress = std::move(progress);
    state->done.assign(total, false);
    state->outcomes.reserve(total);

    const auto started_at = std::chrono::system_clock::now();
    const auto steady_start = std::chrono::steady_clock::now();
    const size_t worker_count = std::min(static_cast<size_t>(limit), total);
    spdlog::info("Probing {} endpoints with {} workers (timeout {}ms)", total, worker_count,
                 options.per_endpoint_timeout.count());

    std::vector<std::thread> workers;
    workers.reserve(worker_count);
    for (size_t i = 0; i < worker_count; ++i) {
        try {
            workers.emplace_back([state]() { workerLoop(state); });
        } catch (const std::system_error& e) {
            spdlog::warn("Could not start probe worker {}: {}", i, e.what());
            break;
        }
    }
    if (workers.empty()) {
        workerLoop(state);
    }

    bool timed_out = false;
    std::vector<ProbeOutcome> outcomes;
    {
        std::unique_lock<std::mutex> lock(state->mutex);
        auto all_done = [&state, total]() { return state->outcomes.size() == total; };
        if (options.batch_timeout) {
            timed_out = !state->cv.wait_for(lock, *options.batch_timeout, all_done);
        } else {
            state->cv.wait(lock, all_done);
        }

        if (timed_out) {
            const std::string detail =
                "batch timeout of " + std::to_string(options.batch_timeout->count()) + "ms exceeded";
            for (size_t i = 0; i < total; ++i) {
                if (state->done[i]) continue;
                state->done[i] = true;
                state->outcomes.push_back(
                    ProbeOutcome::unreachable(descriptors[i].name, ErrorKind::BatchTimeout, detail));
                notifyProgress(*state);
            }
            spdlog::warn("Probe batch hit its {}ms timeout; abandoning in-flight probes",
                         options.batch_timeout->count());
        }
        state->closed = true;
        outcomes = std::move(state->outcomes);
    }

    for (auto& worker : workers) {
        if (timed_out) {
            worker.detach();
        } else {
            worker.join();
        }
    }

    BatchReport report = aggregate(outcomes, descriptors, options.status_policy);
    report.started_at = started_at;
    report.completed_at = std::chrono::system_clock::now();

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - steady_start);
    spdlog::info("Probe batch done in {}ms: healthy={} degraded={} unreachable={}", elapsed.count(),
                 report.countHealth(HealthState::Healthy), report.countHealth(HealthState::Degraded),
                 report.countHealth(HealthState::Unreachable));
    return report;
}

}  // namespace modelswitch
