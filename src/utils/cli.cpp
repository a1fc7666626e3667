#include "utils/cli.h"
#include "probe/endpoint.h"
#include "utils/version.h"
#include <cstring>
#include <sstream>

namespace modelswitch {

std::string getListHelpMessage();
std::string getTestHelpMessage();
std::string getAutoHelpMessage();

namespace {

void appendProbeOptions(std::ostringstream& oss) {
    oss << "    --config <FILE>           Profile file (default: MODELSWITCH_PROFILES or ./model_config.json)\n";
    oss << "    --concurrency <N>         Parallel probes (default: 5, max: 10)\n";
    oss << "    --timeout-ms <MS>         Per-endpoint timeout (default: 8000)\n";
    oss << "    --batch-timeout-ms <MS>   Deadline for the whole batch (default: none)\n";
    oss << "    --warmup                  Open the connection before the timed request\n";
    oss << "    --tls <POLICY>            strict | relaxed | insecure (default: relaxed)\n";
    oss << "    --json                    Print machine-readable JSON\n";
    oss << "    -h, --help                Print help\n";
}

void appendEnvironment(std::ostringstream& oss) {
    oss << "\n";
    oss << "ENVIRONMENT VARIABLES:\n";
    oss << "    ANTHROPIC_BASE_URL              Identifies the active profile\n";
    oss << "    MODELSWITCH_PROFILES            Profile file path\n";
    oss << "    MODELSWITCH_CONFIG              Settings file (default: ~/.modelswitch/config.json)\n";
    oss << "    MODELSWITCH_CONCURRENCY         Parallel probes\n";
    oss << "    MODELSWITCH_TIMEOUT_MS          Per-endpoint timeout\n";
    oss << "    MODELSWITCH_BATCH_TIMEOUT_MS    Batch deadline (0 = none)\n";
    oss << "    MODELSWITCH_WARMUP              Warm up connections (true|false)\n";
    oss << "    MODELSWITCH_TLS_POLICY          strict | relaxed | insecure\n";
    oss << "    MODELSWITCH_RATE_LIMIT_STATUSES Statuses treated as rate limiting (default: 409,429)\n";
    oss << "    MODELSWITCH_LOG_LEVEL           Log level (trace|debug|info|warn|error)\n";
    oss << "    MODELSWITCH_LOG_DIR             Log directory (default: ~/.modelswitch/logs)\n";
    oss << "    MODELSWITCH_LOG_RETENTION_DAYS  Log retention days (default: 7)\n";
}

CliResult usageError(const std::string& message, const std::string& usage) {
    CliResult result;
    result.should_exit = true;
    result.exit_code = 1;
    result.output = "Error: " + message + "\n\n" + usage;
    return result;
}

std::optional<long long> parseNumber(const char* text) {
    try {
        size_t pos = 0;
        long long v = std::stoll(text, &pos);
        if (pos != std::strlen(text)) return std::nullopt;
        return v;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

/// Parses one option shared by test/auto. Returns an error message on a bad
/// value, empty string when consumed, nullopt when the argument is not a
/// shared option.
std::optional<std::string> parseProbeOption(int argc, char* argv[], int& i, CliResult& result) {
    const char* arg = argv[i];
    auto& opts = result.probe_options;

    auto nextValue = [&]() -> const char* {
        if (i + 1 >= argc) return nullptr;
        return argv[++i];
    };

    if (std::strcmp(arg, "--json") == 0) {
        opts.json = true;
        return std::string();
    }
    if (std::strcmp(arg, "--warmup") == 0) {
        opts.warmup = true;
        return std::string();
    }
    if (std::strcmp(arg, "--no-warmup") == 0) {
        opts.warmup = false;
        return std::string();
    }
    if (std::strcmp(arg, "--config") == 0) {
        const char* v = nextValue();
        if (!v) return std::string("--config requires a file path");
        result.config_path = v;
        return std::string();
    }
    if (std::strcmp(arg, "--concurrency") == 0) {
        const char* v = nextValue();
        std::optional<long long> n = v ? parseNumber(v) : std::nullopt;
        if (!n || *n <= 0 || *n > 1 << 16) return std::string("--concurrency requires a positive integer");
        opts.concurrency = static_cast<int>(*n);
        return std::string();
    }
    if (std::strcmp(arg, "--timeout-ms") == 0) {
        const char* v = nextValue();
        std::optional<long long> n = v ? parseNumber(v) : std::nullopt;
        if (!n || *n <= 0 || *n > kMaxProbeTimeout.count()) {
            return "--timeout-ms requires an integer between 1 and " + std::to_string(kMaxProbeTimeout.count());
        }
        opts.timeout_ms = *n;
        return std::string();
    }
    if (std::strcmp(arg, "--batch-timeout-ms") == 0) {
        const char* v = nextValue();
        std::optional<long long> n = v ? parseNumber(v) : std::nullopt;
        if (!n || *n < 0 || *n > kMaxProbeTimeout.count()) {
            return "--batch-timeout-ms requires an integer between 0 and " +
                   std::to_string(kMaxProbeTimeout.count());
        }
        opts.batch_timeout_ms = *n;
        return std::string();
    }
    if (std::strcmp(arg, "--tls") == 0) {
        const char* v = nextValue();
        if (!v) return std::string("--tls requires strict, relaxed or insecure");
        std::string policy = v;
        if (policy != "strict" && policy != "relaxed" && policy != "insecure") {
            return "unknown TLS policy: " + policy;
        }
        opts.tls_policy = policy;
        return std::string();
    }
    return std::nullopt;
}

// Helper to check for help flag in arguments
bool hasHelpFlag(int argc, char* argv[], int start) {
    for (int i = start; i < argc; ++i) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            return true;
        }
    }
    return false;
}

}  // namespace

std::string getHelpMessage() {
    std::ostringstream oss;
    oss << "modelswitch " << MODELSWITCH_VERSION << " - probe API endpoint profiles and pick a healthy one\n";
    oss << "\n";
    oss << "USAGE:\n";
    oss << "    modelswitch <COMMAND> [OPTIONS]\n";
    oss << "\n";
    oss << "COMMANDS:\n";
    oss << "    list       List configured profiles (aliases: ls, --list, -l)\n";
    oss << "    test       Probe profiles and print their health\n";
    oss << "    auto       Probe profiles and choose the endpoint to use\n";
    oss << "\n";
    oss << "OPTIONS:\n";
    oss << "    -h, --help       Print help information\n";
    oss << "    -V, --version    Print version information\n";
    oss << "\n";
    oss << "Run 'modelswitch <COMMAND> --help' for more info.\n";
    return oss.str();
}

std::string getListHelpMessage() {
    std::ostringstream oss;
    oss << "modelswitch list - List configured profiles\n";
    oss << "\n";
    oss << "USAGE:\n";
    oss << "    modelswitch list [--config <FILE>]\n";
    oss << "\n";
    oss << "OPTIONS:\n";
    oss << "    --config <FILE>  Profile file (default: MODELSWITCH_PROFILES or ./model_config.json)\n";
    oss << "    -h, --help       Print help\n";
    oss << "\n";
    oss << "The active profile (matching ANTHROPIC_BASE_URL) is marked with '*'.\n";
    return oss.str();
}

std::string getTestHelpMessage() {
    std::ostringstream oss;
    oss << "modelswitch test - Probe profiles and print their health\n";
    oss << "\n";
    oss << "USAGE:\n";
    oss << "    modelswitch test [NAME...] [OPTIONS]\n";
    oss << "\n";
    oss << "ARGUMENTS:\n";
    oss << "    [NAME...]                 Profiles to probe (default: all)\n";
    oss << "\n";
    oss << "OPTIONS:\n";
    appendProbeOptions(oss);
    appendEnvironment(oss);
    return oss.str();
}

std::string getAutoHelpMessage() {
    std::ostringstream oss;
    oss << "modelswitch auto - Probe all profiles and choose the endpoint to use\n";
    oss << "\n";
    oss << "USAGE:\n";
    oss << "    modelswitch auto [--current <NAME>] [OPTIONS]\n";
    oss << "\n";
    oss << "OPTIONS:\n";
    oss << "    --current <NAME>          Active profile (default: from ANTHROPIC_BASE_URL)\n";
    appendProbeOptions(oss);
    oss << "\n";
    oss << "EXIT STATUS:\n";
    oss << "    0    An endpoint was chosen\n";
    oss << "    1    Usage or configuration error\n";
    oss << "    3    No healthy endpoint\n";
    appendEnvironment(oss);
    return oss.str();
}

std::string getVersionMessage() {
    std::ostringstream oss;
    oss << "modelswitch " << MODELSWITCH_VERSION << "\n";
    return oss.str();
}

CliResult parseCliArgs(int argc, char* argv[]) {
    CliResult result;

    // No arguments - show help
    if (argc < 2) {
        result.should_exit = false;
        result.subcommand = Subcommand::None;
        return result;
    }

    const char* command = argv[1];

    // Global help and version
    if (std::strcmp(command, "-h") == 0 || std::strcmp(command, "--help") == 0) {
        result.should_exit = true;
        result.exit_code = 0;
        result.output = getHelpMessage();
        return result;
    }

    if (std::strcmp(command, "-V") == 0 || std::strcmp(command, "--version") == 0) {
        result.should_exit = true;
        result.exit_code = 0;
        result.output = getVersionMessage();
        return result;
    }

    if (std::strcmp(command, "list") == 0 || std::strcmp(command, "ls") == 0 ||
        std::strcmp(command, "--list") == 0 || std::strcmp(command, "-l") == 0) {
        result.subcommand = Subcommand::List;

        if (hasHelpFlag(argc, argv, 2)) {
            result.should_exit = true;
            result.exit_code = 0;
            result.output = getListHelpMessage();
            return result;
        }

        for (int i = 2; i < argc; ++i) {
            if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
                result.config_path = argv[++i];
            } else {
                return usageError(std::string("unexpected argument: ") + argv[i], getListHelpMessage());
            }
        }
        return result;
    }

    if (std::strcmp(command, "test") == 0) {
        result.subcommand = Subcommand::Test;

        if (hasHelpFlag(argc, argv, 2)) {
            result.should_exit = true;
            result.exit_code = 0;
            result.output = getTestHelpMessage();
            return result;
        }

        for (int i = 2; i < argc; ++i) {
            auto consumed = parseProbeOption(argc, argv, i, result);
            if (consumed) {
                if (!consumed->empty()) return usageError(*consumed, getTestHelpMessage());
                continue;
            }
            if (argv[i][0] == '-') {
                return usageError(std::string("unknown option: ") + argv[i], getTestHelpMessage());
            }
            result.names.push_back(argv[i]);
        }
        return result;
    }

    if (std::strcmp(command, "auto") == 0) {
        result.subcommand = Subcommand::Auto;

        if (hasHelpFlag(argc, argv, 2)) {
            result.should_exit = true;
            result.exit_code = 0;
            result.output = getAutoHelpMessage();
            return result;
        }

        for (int i = 2; i < argc; ++i) {
            if (std::strcmp(argv[i], "--current") == 0) {
                if (i + 1 >= argc) {
                    return usageError("--current requires a profile name", getAutoHelpMessage());
                }
                result.current = argv[++i];
                continue;
            }
            auto consumed = parseProbeOption(argc, argv, i, result);
            if (consumed) {
                if (!consumed->empty()) return usageError(*consumed, getAutoHelpMessage());
                continue;
            }
            return usageError(std::string("unexpected argument: ") + argv[i], getAutoHelpMessage());
        }
        return result;
    }

    // Check for unknown flags (starting with - or --)
    if (command[0] == '-') {
        result.should_exit = true;
        result.exit_code = 1;
        std::ostringstream oss;
        oss << "Unknown option: " << command << "\n\n";
        oss << getHelpMessage();
        result.output = oss.str();
        return result;
    }

    // Unknown command
    result.should_exit = true;
    result.exit_code = 1;
    std::ostringstream oss;
    oss << "Unknown command: " << command << "\n\n";
    oss << getHelpMessage();
    result.output = oss.str();
    return result;
}

std::string subcommandToString(Subcommand subcommand) {
    switch (subcommand) {
        case Subcommand::None: return "none";
        case Subcommand::List: return "list";
        case Subcommand::Test: return "test";
        case Subcommand::Auto: return "auto";
        default: return "unknown";
    }
}

}  // namespace modelswitch
