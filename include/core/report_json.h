// report_json.h - JSON rendering of probe reports for scripts and the UI layer
#pragma once

#include <chrono>
#include <string>

#include <nlohmann/json.hpp>

#include "core/batch_report.h"

namespace modelswitch {

// UTC ISO-8601 timestamp with millisecond precision, e.g. 2024-05-01T12:00:00.123Z
std::string format_timestamp(std::chrono::system_clock::time_point tp);

// Tokens are never serialized.
nlohmann::ordered_json to_json(const ReportEntry& entry);
nlohmann::ordered_json to_json(const BatchReport& report);
nlohmann::ordered_json to_json(const FailoverDecision& decision);

}  // namespace modelswitch
