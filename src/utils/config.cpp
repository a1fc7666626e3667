#include "utils/config.h"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <sstream>
#include <stdexcept>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include "probe/endpoint.h"
#include "utils/json_utils.h"

namespace modelswitch {

namespace {

// Values past this are clamped again by the scheduler.
constexpr long long kMaxConcurrencySetting = 1 << 16;

std::optional<std::string> getEnvValue(const char* name) {
    if (!name || !*name) {
        return std::nullopt;
    }
    if (const char* v = std::getenv(name)) {
        return std::string(v);
    }
    return std::nullopt;
}

std::filesystem::path defaultConfigPath() {
    std::filesystem::path home = getEnvValue("HOME").value_or("");
    if (home.empty()) return std::filesystem::path();
    return home / ".modelswitch/config.json";
}

std::string trim(const std::string& s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(begin, end - begin);
}

std::optional<long long> parseInteger(const std::string& value) {
    try {
        size_t pos = 0;
        long long v = std::stoll(value, &pos);
        if (pos != value.size()) return std::nullopt;
        return v;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::vector<int> statusListFromJson(const nlohmann::json& v, const std::vector<int>& fallback) {
    std::vector<int> list;
    if (v.is_array()) {
        for (const auto& item : v) {
            if (!item.is_number_integer()) return fallback;
            const auto status = item.get<long long>();
            if (status < 100 || status > 599) return fallback;
            list.push_back(static_cast<int>(status));
        }
    } else if (v.is_string()) {
        auto parsed = parseStatusList(v.get<std::string>());
        if (!parsed) return fallback;
        list = std::move(*parsed);
    } else {
        return fallback;
    }
    return list;
}

// Integer member within [lo, hi]; anything else is reported and ignored.
std::optional<long long> integerInRange(const nlohmann::json& j, const char* key, long long lo, long long hi) {
    if (!j.contains(key)) return std::nullopt;
    const auto& v = j[key];
    std::optional<long long> value;
    if (v.is_number_unsigned()) {
        const auto u = v.get<unsigned long long>();
        if (u <= static_cast<unsigned long long>(hi)) value = static_cast<long long>(u);
    } else if (v.is_number_integer()) {
        value = v.get<long long>();
    }
    if (!value || *value < lo || *value > hi) {
        spdlog::warn("Ignoring probe.{}={} (expected an integer between {} and {})", key, v.dump(), lo, hi);
        return std::nullopt;
    }
    return value;
}

void applyJson(ProbeConfig& cfg, const nlohmann::json& j) {
    if (auto v = integerInRange(j, "concurrency", 1, kMaxConcurrencySetting)) {
        cfg.concurrency = static_cast<int>(*v);
    }
    if (auto v = integerInRange(j, "timeout_ms", 1, kMaxProbeTimeout.count())) {
        cfg.timeout = std::chrono::milliseconds(*v);
    }
    if (auto v = integerInRange(j, "batch_timeout_ms", 0, kMaxProbeTimeout.count())) {
        cfg.batch_timeout = std::chrono::milliseconds(*v);
    }
    cfg.warmup = get_or<bool>(j, "warmup", cfg.warmup);
    cfg.tls_policy = get_or<std::string>(j, "tls_policy", cfg.tls_policy);
    if (j.contains("rate_limit_statuses")) {
        cfg.rate_limit_statuses = statusListFromJson(j["rate_limit_statuses"], cfg.rate_limit_statuses);
    }
    if (j.contains("fallback_statuses")) {
        cfg.fallback_statuses = statusListFromJson(j["fallback_statuses"], cfg.fallback_statuses);
    }
    cfg.probe_path = get_or<std::string>(j, "probe_path", cfg.probe_path);
    cfg.probe_model = get_or<std::string>(j, "probe_model", cfg.probe_model);
}

}  // namespace

std::optional<std::vector<int>> parseStatusList(const std::string& csv) {
    std::vector<int> out;
    std::stringstream ss(csv);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item = trim(item);
        if (item.empty()) continue;
        auto v = parseInteger(item);
        if (!v || *v < 100 || *v > 599) return std::nullopt;
        out.push_back(static_cast<int>(*v));
    }
    return out;
}

std::optional<bool> parseBool(const std::string& value) {
    std::string lower = trim(value);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "1" || lower == "true" || lower == "yes" || lower == "on") return true;
    if (lower == "0" || lower == "false" || lower == "no" || lower == "off") return false;
    return std::nullopt;
}

ProbeConfig loadProbeConfig() {
    auto info = loadProbeConfigWithLog();
    return info.first;
}

std::pair<ProbeConfig, std::string> loadProbeConfigWithLog() {
    ProbeConfig cfg;
    std::ostringstream log;
    bool used_file = false;
    bool used_env = false;

    // Optional JSON config file: path from MODELSWITCH_CONFIG or ~/.modelswitch/config.json
    std::filesystem::path cfg_path;
    if (auto env = getEnvValue("MODELSWITCH_CONFIG")) {
        cfg_path = *env;
    } else {
        cfg_path = defaultConfigPath();
    }

    std::error_code ec;
    if (!cfg_path.empty() && std::filesystem::exists(cfg_path, ec)) {
        try {
            auto j = read_json_file(cfg_path);
            if (j.contains("probe") && j["probe"].is_object()) {
                applyJson(cfg, j["probe"]);
                log << "file=" << cfg_path << " ";
                used_file = true;
            }
        } catch (const std::exception& e) {
            spdlog::warn("Ignoring config file {}: {}", cfg_path.string(), e.what());
        }
    }

    if (auto env = getEnvValue("MODELSWITCH_CONCURRENCY")) {
        if (auto v = parseInteger(*env); v && *v > 0) {
            cfg.concurrency = static_cast<int>(std::min<long long>(*v, kMaxConcurrencySetting));
            log << "env:CONCURRENCY=" << *v << " ";
            used_env = true;
        } else {
            spdlog::warn("Ignoring invalid MODELSWITCH_CONCURRENCY={}", *env);
        }
    }

    if (auto env = getEnvValue("MODELSWITCH_TIMEOUT_MS")) {
        if (auto v = parseInteger(*env); v && *v > 0 && *v <= kMaxProbeTimeout.count()) {
            cfg.timeout = std::chrono::milliseconds(*v);
            log << "env:TIMEOUT_MS=" << *v << " ";
            used_env = true;
        } else {
            spdlog::warn("Ignoring invalid MODELSWITCH_TIMEOUT_MS={}", *env);
        }
    }

    if (auto env = getEnvValue("MODELSWITCH_BATCH_TIMEOUT_MS")) {
        if (auto v = parseInteger(*env); v && *v >= 0 && *v <= kMaxProbeTimeout.count()) {
            cfg.batch_timeout = std::chrono::milliseconds(*v);
            log << "env:BATCH_TIMEOUT_MS=" << *v << " ";
            used_env = true;
        } else {
            spdlog::warn("Ignoring invalid MODELSWITCH_BATCH_TIMEOUT_MS={}", *env);
        }
    }

    if (auto env = getEnvValue("MODELSWITCH_WARMUP")) {
        if (auto v = parseBool(*env)) {
            cfg.warmup = *v;
            log << "env:WARMUP=" << (*v ? "true" : "false") << " ";
            used_env = true;
        } else {
            spdlog::warn("Ignoring invalid MODELSWITCH_WARMUP={}", *env);
        }
    }

    if (auto env = getEnvValue("MODELSWITCH_TLS_POLICY")) {
        cfg.tls_policy = trim(*env);
        log << "env:TLS_POLICY=" << cfg.tls_policy << " ";
        used_env = true;
    }

    if (auto env = getEnvValue("MODELSWITCH_RATE_LIMIT_STATUSES")) {
        if (auto list = parseStatusList(*env)) {
            cfg.rate_limit_statuses = std::move(*list);
            log << "env:RATE_LIMIT_STATUSES=" << *env << " ";
            used_env = true;
        } else {
            spdlog::warn("Ignoring invalid MODELSWITCH_RATE_LIMIT_STATUSES={}", *env);
        }
    }

    if (log.tellp() > 0) log << "|";
    log << "sources=";
    if (used_env) log << "env";
    if (used_file) {
        if (used_env) log << ",";
        log << "file";
    }
    if (!used_env && !used_file) log << "default";

    return {cfg, log.str()};
}

}  // namespace modelswitch
