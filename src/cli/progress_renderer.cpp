#include "cli/progress_renderer.h"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace modelswitch {
namespace cli {

ProgressRenderer::ProgressRenderer(std::ostream& out) : out_(out) {}

void ProgressRenderer::onProgress(size_t completed, size_t total) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (finished_ || total == 0) {
        return;
    }

    std::ostringstream oss;
    oss << "probing " << completed << "/" << total << " " << formatProgressBar(completed, total);
    clearAndPrint(oss.str());
}

void ProgressRenderer::finish() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (finished_) {
        return;
    }
    finished_ = true;
    if (drawn_) {
        out_ << std::endl;
    }
}

std::string ProgressRenderer::formatProgressBar(size_t completed, size_t total, int width) {
    if (total == 0) {
        return "";
    }

    double progress = static_cast<double>(std::min(completed, total)) / static_cast<double>(total);
    int filled = static_cast<int>(progress * width);

    std::ostringstream oss;
    int percent = static_cast<int>(progress * 100);
    oss << std::setw(3) << percent << "% [";

    for (int i = 0; i < width; ++i) {
        if (i < filled) {
            oss << "=";
        } else if (i == filled) {
            oss << ">";
        } else {
            oss << " ";
        }
    }

    oss << "]";
    return oss.str();
}

std::string ProgressRenderer::formatLatency(const std::optional<std::chrono::microseconds>& latency) {
    if (!latency) {
        return "-";
    }
    const double ms = static_cast<double>(latency->count()) / 1000.0;
    std::ostringstream oss;
    if (ms < 1000.0) {
        oss << static_cast<long long>(ms + 0.5) << " ms";
    } else {
        oss << std::fixed << std::setprecision(2) << ms / 1000.0 << " s";
    }
    return oss.str();
}

void ProgressRenderer::clearAndPrint(const std::string& content) {
    out_ << "\r" << content;

    // Pad with spaces to clear any remaining characters from previous output
    if (content.length() < last_length_) {
        for (size_t i = content.length(); i < last_length_; ++i) {
            out_ << " ";
        }
        out_ << "\r" << content;
    }
    last_length_ = content.length();
    drawn_ = true;

    out_.flush();
}

std::string formatReportTable(const BatchReport& report, const std::optional<std::string>& active) {
    size_t name_width = 4;
    for (const auto& entry : report.results) {
        name_width = std::max(name_width, entry.endpoint.name.size());
    }

    std::ostringstream oss;
    oss << "  " << std::left << std::setw(static_cast<int>(name_width)) << "NAME"
        << "  " << std::setw(12) << "HEALTH"
        << std::setw(10) << "LATENCY"
        << std::setw(8) << "STATUS"
        << "DETAIL\n";

    for (const auto& entry : report.results) {
        const auto& outcome = entry.outcome;
        const bool is_active = active && *active == entry.endpoint.name;

        std::string status = outcome.http_status ? std::to_string(*outcome.http_status) : "-";
        std::string detail;
        if (outcome.error_kind) {
            detail = to_string(*outcome.error_kind);
            if (outcome.raw_detail) {
                detail += ": " + *outcome.raw_detail;
            }
        } else if (outcome.mode == ProbeMode::NonStreaming) {
            detail = "non-streaming";
        }

        oss << (is_active ? "* " : "  ") << std::left
            << std::setw(static_cast<int>(name_width)) << entry.endpoint.name
            << "  " << std::setw(12) << to_string(entry.health)
            << std::setw(10) << ProgressRenderer::formatLatency(outcome.latency)
            << std::setw(8) << status
            << detail << "\n";
    }
    return oss.str();
}

std::string formatDecision(const FailoverDecision& decision, const std::optional<std::string>& current) {
    std::ostringstream oss;
    switch (decision.reason) {
        case FailoverReason::CurrentHealthy:
            oss << "Keeping " << decision.chosen.value_or("") << ": current endpoint is healthy";
            break;
        case FailoverReason::FasterAlternative:
            oss << "Switch to " << decision.chosen.value_or("");
            if (current) {
                oss << " (current " << *current << " is not healthy)";
            } else {
                oss << " (fastest healthy endpoint)";
            }
            break;
        case FailoverReason::NoHealthyCandidate:
            oss << "No healthy endpoint available";
            break;
    }
    return oss.str();
}

}  // namespace cli
}  // namespace modelswitch
