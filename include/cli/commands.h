// CLI command function declarations
#pragma once

#include <iostream>

#include "utils/cli.h"

namespace modelswitch {
namespace cli {
namespace commands {

/// Execute the 'list' command
/// @return Exit code (0=success, 1=error)
int list(const CliResult& args, std::ostream& out = std::cout, std::ostream& err = std::cerr);

/// Execute the 'test' command
/// @return Exit code (0=success, 1=error)
int test(const CliResult& args, std::ostream& out = std::cout, std::ostream& err = std::cerr);

/// Execute the 'auto' command
/// @return Exit code (0=endpoint chosen, 1=error, 3=no healthy endpoint)
int autoSelect(const CliResult& args, std::ostream& out = std::cout, std::ostream& err = std::cerr);

constexpr int kExitOk = 0;
constexpr int kExitError = 1;
constexpr int kExitNoHealthy = 3;

}  // namespace commands
}  // namespace cli
}  // namespace modelswitch
