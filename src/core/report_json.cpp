#include "core/report_json.h"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace modelswitch {

namespace {
inline std::tm* safe_gmtime(const std::time_t* time, std::tm* result) {
#ifdef _WIN32
    if (gmtime_s(result, time) == 0) {
        return result;
    }
    return nullptr;
#else
    return gmtime_r(time, result);
#endif
}
}  // namespace

std::string format_timestamp(std::chrono::system_clock::time_point tp) {
    const auto time_t_value = std::chrono::system_clock::to_time_t(tp);
    std::tm tm_value{};
    safe_gmtime(&time_t_value, &tm_value);
    const auto millis =
        std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count() % 1000;
    std::ostringstream oss;
    oss << std::put_time(&tm_value, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
        << millis << 'Z';
    return oss.str();
}

nlohmann::ordered_json to_json(const ReportEntry& entry) {
    const auto& outcome = entry.outcome;
    nlohmann::ordered_json j;
    j["name"] = entry.endpoint.name;
    j["base_url"] = entry.endpoint.base_url;
    j["health"] = to_string(entry.health);
    j["reachable"] = outcome.reachable;
    j["mode"] = to_string(outcome.mode);
    if (outcome.latency) {
        j["latency_ms"] = static_cast<double>(outcome.latency->count()) / 1000.0;
    }
    if (outcome.http_status) {
        j["http_status"] = *outcome.http_status;
    }
    if (outcome.error_kind) {
        j["error_kind"] = to_string(*outcome.error_kind);
    }
    if (outcome.raw_detail) {
        j["detail"] = *outcome.raw_detail;
    }
    return j;
}

nlohmann::ordered_json to_json(const BatchReport& report) {
    nlohmann::ordered_json j;
    j["started_at"] = format_timestamp(report.started_at);
    j["completed_at"] = format_timestamp(report.completed_at);
    auto results = nlohmann::ordered_json::array();
    for (const auto& entry : report.results) {
        results.push_back(to_json(entry));
    }
    j["results"] = std::move(results);
    return j;
}

nlohmann::ordered_json to_json(const FailoverDecision& decision) {
    nlohmann::ordered_json j;
    if (decision.chosen) {
        j["chosen"] = *decision.chosen;
    } else {
        j["chosen"] = nullptr;
    }
    j["reason"] = to_string(decision.reason);
    return j;
}

}  // namespace modelswitch
