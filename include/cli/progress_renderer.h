#pragma once

#include <chrono>
#include <cstddef>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>

#include "core/batch_report.h"

namespace modelswitch {
namespace cli {

/// Progress line for a probe batch ("probing 3/5 [============        ]")
///
/// onProgress() is safe to call from scheduler worker threads.
class ProgressRenderer {
public:
    /// @param out Stream the progress line is drawn on (stderr by default so
    ///            that --json output on stdout stays clean)
    explicit ProgressRenderer(std::ostream& out = std::cerr);

    /// Update progress
    /// @param completed Endpoints with a recorded outcome
    /// @param total Endpoints in the batch
    void onProgress(size_t completed, size_t total);

    /// Terminate the progress line. Safe to call more than once.
    void finish();

    /// Get progress bar string
    /// @return Progress bar string (e.g., " 40% [========>           ]")
    static std::string formatProgressBar(size_t completed, size_t total, int width = 20);

    /// Format a latency for display
    /// @return e.g. "842 ms", "1.53 s", "-" when absent
    static std::string formatLatency(const std::optional<std::chrono::microseconds>& latency);

private:
    std::ostream& out_;
    std::mutex mutex_;
    size_t last_length_{0};
    bool drawn_{false};
    bool finished_{false};

    /// Clear current line and print new content
    void clearAndPrint(const std::string& content);
};

/// One row per endpoint in input order; the active profile is marked with '*'
std::string formatReportTable(const BatchReport& report,
                              const std::optional<std::string>& active = std::nullopt);

/// Human-readable failover verdict
std::string formatDecision(const FailoverDecision& decision,
                           const std::optional<std::string>& current = std::nullopt);

}  // namespace cli
}  // namespace modelswitch
