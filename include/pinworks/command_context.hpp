#ifndef PINWORKS_COMMAND_CONTEXT_HPP
#define PINWORKS_COMMAND_CONTEXT_HPP

#include "pinworks/command_arguments.hpp"

#include <iosfwd>
#include <string>
#include <vector>

namespace pinworks {

class CommandRegistry;
class DriverContext;
struct Command;

struct CommandContext {
    CommandRegistry& registry;
    DriverContext& driver;
    const Command& command;
    CommandArguments arguments;
    std::ostream& out;
    std::ostream& err;
    bool verbose = false;
    bool force = false;
    bool help_requested = false;
};

// Shared by the CLI entry point and script exec(): parse, check privileges,
// run the handler and map failures to exit codes.
int run_command(CommandRegistry& registry,
                DriverContext& driver,
                const Command& command,
                const std::vector<std::string>& raw_args,
                std::ostream& out,
                std::ostream& err,
                bool verbose);

namespace exit_code {
constexpr int kOk = 0;
constexpr int kFailure = 1;
constexpr int kUnknownCommand = 2;
constexpr int kArgumentError = 3;
constexpr int kCommandThrew = 4;
constexpr int kRootRequired = 5;
constexpr int kScriptFailed = 6;
constexpr int kScriptingDisabled = 64;
} // namespace exit_code

} // namespace pinworks

#endif // PINWORKS_COMMAND_CONTEXT_HPP
