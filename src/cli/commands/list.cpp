// Lists the configured endpoint profiles

#include "cli/commands.h"
#include "cli/probe_runner.h"
#include <algorithm>
#include <iomanip>
#include <stdexcept>
#include <string>

namespace modelswitch {
namespace cli {
namespace commands {

int list(const CliResult& args, std::ostream& out, std::ostream& err) {
    ProfileStore store;
    try {
        store = loadProfiles(args.config_path);
    } catch (const std::exception& e) {
        err << "Error: " << e.what() << std::endl;
        return kExitError;
    }

    if (store.empty()) {
        out << "No profiles configured" << std::endl;
        return kExitOk;
    }

    const auto active = store.activeFromEnvironment();

    size_t name_width = 4;
    for (const auto& profile : store.profiles()) {
        name_width = std::max(name_width, profile.name.size());
    }

    size_t index = 1;
    for (const auto& profile : store.profiles()) {
        const bool is_active = active && *active == profile.name;
        out << (is_active ? "* " : "  ") << std::right << std::setw(2) << index++ << ". "
            << std::left << std::setw(static_cast<int>(name_width)) << profile.name << "  "
            << profile.base_url << std::endl;
    }
    return kExitOk;
}

}  // namespace commands
}  // namespace cli
}  // namespace modelswitch
