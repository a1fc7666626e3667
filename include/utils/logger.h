// logger.h - spdlog setup for the modelswitch CLI
//
// Diagnostics never go to stdout: stdout carries the command's table or JSON
// document. Console diagnostics go to stderr, and a daily JSON-lines file
// under the log directory keeps a persistent record of each run.
#pragma once

#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace modelswitch::logger {

// Case-insensitive level name (trace|debug|info|warn|warning|error|critical|
// fatal|off). Unknown names map to info.
spdlog::level::level_enum parse_level(const std::string& level_text);

// MODELSWITCH_LOG_DIR when set and non-empty, else ~/.modelswitch/logs.
std::string get_log_dir();

// <log dir>/modelswitch.jsonl.YYYY-MM-DD, dated in local time.
std::string get_log_file_path();

// MODELSWITCH_LOG_RETENTION_DAYS when it is an integer in [1, 364], else 7.
int get_retention_days();

// Removes modelswitch.jsonl.* files dated before today minus retention_days.
// Other files in log_dir are left alone; a missing directory is a no-op.
void cleanup_old_logs(const std::string& log_dir, int retention_days);

// Installs the default "modelswitch" logger.
//  - additional_sinks, when given, are used as-is and file_path is ignored.
//  - Otherwise a non-empty file_path opens a plain file sink in append mode
//    (throws spdlog::spdlog_ex when it cannot be opened).
//  - With neither, output goes to a stderr color sink.
// An empty pattern keeps each sink's own pattern. Warnings and above are
// flushed immediately.
void init(const std::string& level = "warn",
          const std::string& pattern = "[%Y-%m-%d %T.%e] [%l] %v",
          const std::string& file_path = "",
          std::vector<spdlog::sink_ptr> additional_sinks = {});

// CLI entry point. Level comes from MODELSWITCH_LOG_LEVEL (default warn, so
// a normal run prints nothing but the command output). Always attaches a
// human-readable stderr color sink, plus a JSON-lines file sink at
// get_log_file_path() after pruning old files. If the log directory or file
// cannot be created, the file sink is dropped and a warning is logged to
// stderr; the command still runs.
void init_from_env();

}  // namespace modelswitch::logger
