// Probes every profile and chooses the endpoint to use

#include "cli/commands.h"
#include "cli/probe_runner.h"
#include "cli/progress_renderer.h"
#include "core/aggregator.h"
#include "core/report_json.h"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace modelswitch {
namespace cli {
namespace commands {

int autoSelect(const CliResult& args, std::ostream& out, std::ostream& err) {
    auto [loaded, source_log] = loadProbeConfigWithLog();
    spdlog::debug("Probe config: {}", source_log);
    const auto config = applyCliOverrides(loaded, args.probe_options);

    ProfileStore store;
    BatchReport report;
    std::optional<std::string> current;
    try {
        store = loadProfiles(args.config_path);
        if (!args.current.empty()) {
            if (!store.find(args.current)) {
                throw std::invalid_argument("unknown profile: " + args.current);
            }
            current = args.current;
        } else {
            current = store.activeFromEnvironment();
        }

        const auto descriptors = store.descriptors();
        if (args.probe_options.json) {
            report = runProbes(descriptors, config);
        } else {
            ProgressRenderer progress(err);
            report = runProbes(descriptors, config, [&progress](size_t completed, size_t total) {
                progress.onProgress(completed, total);
            });
            progress.finish();
        }
    } catch (const std::exception& e) {
        err << "Error: " << e.what() << std::endl;
        return kExitError;
    }

    const auto decision = selectFailover(report, current);
    if (decision.chosen) {
        spdlog::info("Failover decision: {} ({})", *decision.chosen, to_string(decision.reason));
    } else {
        spdlog::warn("No healthy endpoint among {} profiles", report.results.size());
    }

    if (args.probe_options.json) {
        nlohmann::ordered_json j;
        j["current"] = current ? nlohmann::ordered_json(*current) : nlohmann::ordered_json(nullptr);
        j["decision"] = to_json(decision);
        if (decision.chosen) {
            if (const auto* profile = store.find(*decision.chosen)) {
                j["decision"]["base_url"] = profile->base_url;
            }
        }
        j["report"] = to_json(report);
        out << j.dump(2) << std::endl;
    } else {
        out << formatReportTable(report, current) << "\n" << formatDecision(decision, current) << std::endl;
    }

    return decision.chosen ? kExitOk : kExitNoHealthy;
}

}  // namespace commands
}  // namespace cli
}  // namespace modelswitch
