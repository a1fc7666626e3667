#pragma once

#include <optional>
#include <string>
#include <vector>

namespace modelswitch {

/// Subcommand types for the modelswitch CLI
enum class Subcommand {
    None,   // No subcommand (prints help)
    List,   // list | ls | --list | -l
    Test,   // test [NAME...]
    Auto,   // auto [--current NAME]
};

/// Options shared by the probing commands. Unset fields fall back to the
/// loaded ProbeConfig.
struct ProbeCliOptions {
    std::optional<int> concurrency;
    std::optional<long long> timeout_ms;
    std::optional<long long> batch_timeout_ms;
    std::optional<bool> warmup;
    std::optional<std::string> tls_policy;
    bool json{false};
};

/// Result of CLI argument parsing
struct CliResult {
    /// Whether the program should exit immediately (e.g., after --help or --version)
    bool should_exit{false};

    /// Exit code to use if should_exit is true
    int exit_code{0};

    /// Output message to display (help text, version info, or error message)
    std::string output;

    /// Parsed subcommand
    Subcommand subcommand{Subcommand::None};

    /// Profile file given with --config
    std::string config_path;

    /// Profiles named on the command line (test)
    std::vector<std::string> names;

    /// Profile treated as active (auto --current)
    std::string current;

    ProbeCliOptions probe_options;
};

/// Parse command line arguments
///
/// @param argc Number of arguments
/// @param argv Argument values
/// @return CliResult indicating whether to continue or exit
CliResult parseCliArgs(int argc, char* argv[]);

/// Get the help message for the CLI
std::string getHelpMessage();

/// Get the version message for the CLI
std::string getVersionMessage();

/// Convert subcommand enum to string
std::string subcommandToString(Subcommand cmd);

}  // namespace modelswitch
