#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace modelswitch {

/// Probe settings shared by every command. CLI flags override these.
struct ProbeConfig {
    int concurrency{5};
    std::chrono::milliseconds timeout{8000};
    std::chrono::milliseconds batch_timeout{0};  // 0 = no batch deadline
    bool warmup{false};
    std::string tls_policy{"relaxed"};
    std::vector<int> rate_limit_statuses{409, 429};
    std::vector<int> fallback_statuses{400, 405, 415, 422};
    std::string probe_path{"/v1/messages"};
    std::string probe_model{"claude-3-5-haiku-latest"};
};

ProbeConfig loadProbeConfig();
std::pair<ProbeConfig, std::string> loadProbeConfigWithLog();

/// "429, 409" -> {429, 409}. Returns nullopt when any item is not an HTTP
/// status code.
std::optional<std::vector<int>> parseStatusList(const std::string& csv);

/// Accepts 1/0, true/false, yes/no, on/off (case-insensitive)
std::optional<bool> parseBool(const std::string& value);

}  // namespace modelswitch
