// probe_runner.h - wiring between CLI settings and the probe engine
#pragma once

#include <string>
#include <vector>

#include "core/batch_report.h"
#include "core/probe_scheduler.h"
#include "probe/http_prober.h"
#include "profiles/profile_store.h"
#include "utils/cli.h"
#include "utils/config.h"

namespace modelswitch {
namespace cli {

/// Layer command-line flags over the loaded configuration.
ProbeConfig applyCliOverrides(ProbeConfig config, const ProbeCliOptions& options);

/// A batch timeout of 0 means no batch deadline.
BatchOptions makeBatchOptions(const ProbeConfig& config);

/// Throws std::invalid_argument for an unknown TLS policy name.
HttpProbeOptions makeHttpProbeOptions(const ProbeConfig& config);

/// Profile file from --config, else ProfileStore::defaultPath().
ProfileStore loadProfiles(const std::string& config_path);

/// Probe the descriptors over HTTP.
///
/// Every base URL must parse as an http(s) URL; otherwise
/// std::invalid_argument is thrown before any request is sent.
BatchReport runProbes(const std::vector<EndpointDescriptor>& descriptors,
                      const ProbeConfig& config,
                      ProgressCallback progress = nullptr);

}  // namespace cli
}  // namespace modelswitch
