// Probes profiles and prints their health

#include "cli/commands.h"
#include "cli/probe_runner.h"
#include "cli/progress_renderer.h"
#include "core/report_json.h"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace modelswitch {
namespace cli {
namespace commands {

int test(const CliResult& args, std::ostream& out, std::ostream& err) {
    auto [loaded, source_log] = loadProbeConfigWithLog();
    spdlog::debug("Probe config: {}", source_log);
    const auto config = applyCliOverrides(loaded, args.probe_options);

    BatchReport report;
    std::optional<std::string> active;
    try {
        const auto store = loadProfiles(args.config_path);
        const auto descriptors = store.descriptors(args.names);
        active = store.activeFromEnvironment();

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

    if (args.probe_options.json) {
        out << to_json(report).dump(2) << std::endl;
    } else {
        out << formatReportTable(report, active);
    }
    return kExitOk;
}

}  // namespace commands
}  // namespace cli
}  // namespace modelswitch
