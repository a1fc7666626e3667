#include "cli/probe_runner.h"

#include <memory>
#include <stdexcept>

#include <spdlog/spdlog.h>

#include "utils/url.h"

namespace modelswitch {
namespace cli {

ProbeConfig applyCliOverrides(ProbeConfig config, const ProbeCliOptions& options) {
    if (options.concurrency) config.concurrency = *options.concurrency;
    if (options.timeout_ms) config.timeout = std::chrono::milliseconds(*options.timeout_ms);
    if (options.batch_timeout_ms) config.batch_timeout = std::chrono::milliseconds(*options.batch_timeout_ms);
    if (options.warmup) config.warmup = *options.warmup;
    if (options.tls_policy) config.tls_policy = *options.tls_policy;
    return config;
}

BatchOptions makeBatchOptions(const ProbeConfig& config) {
    BatchOptions options;
    options.concurrency_limit = config.concurrency;
    options.per_endpoint_timeout = config.timeout;
    if (config.batch_timeout.count() > 0) {
        options.batch_timeout = config.batch_timeout;
    }
    options.status_policy.rate_limit_statuses = config.rate_limit_statuses;
    options.status_policy.fallback_statuses = config.fallback_statuses;
    return options;
}

HttpProbeOptions makeHttpProbeOptions(const ProbeConfig& config) {
    auto tls = parseTlsPolicy(config.tls_policy);
    if (!tls) {
        throw std::invalid_argument("unknown TLS policy: " + config.tls_policy);
    }

    HttpProbeOptions options;
    options.warmup = config.warmup;
    options.tls_policy = *tls;
    options.status_policy.rate_limit_statuses = config.rate_limit_statuses;
    options.status_policy.fallback_statuses = config.fallback_statuses;
    options.probe_path = config.probe_path;
    options.probe_model = config.probe_model;
    return options;
}

ProfileStore loadProfiles(const std::string& config_path) {
    const std::filesystem::path path =
        config_path.empty() ? ProfileStore::defaultPath() : std::filesystem::path(config_path);
    return ProfileStore::loadFromFile(path);
}

BatchReport runProbes(const std::vector<EndpointDescriptor>& descriptors,
                      const ProbeConfig& config,
                      ProgressCallback progress) {
    for (const auto& endpoint : descriptors) {
        if (!parseUrl(endpoint.base_url)) {
            throw std::invalid_argument("profile '" + endpoint.name +
                                        "' has an invalid base URL: " + endpoint.base_url);
        }
    }

    auto http_options = makeHttpProbeOptions(config);
    const auto batch_options = makeBatchOptions(config);
    spdlog::debug("Probe settings: tls={} warmup={} path={}", to_string(http_options.tls_policy),
                  http_options.warmup, http_options.probe_path);

    ProbeScheduler scheduler(std::make_shared<HttpProber>(std::move(http_options)));
    return scheduler.runBatch(descriptors, batch_options, std::move(progress));
}

}  // namespace cli
}  // namespace modelswitch
