#include "pinworks/cli_parser.hpp"
#include "pinworks/command_context.hpp"
#include "pinworks/command_registry.hpp"
#include "pinworks/driver_context.hpp"
#include "gpio/error.hpp"

#include <exception>
#include <ostream>
#include <unistd.h>

namespace pinworks {

namespace {
bool is_root_user() {
    return ::geteuid() == 0;
}
}

int run_command(CommandRegistry& registry,
                DriverContext& driver,
                const Command& command,
                const std::vector<std::string>& raw_args,
                std::ostream& out,
                std::ostream& err,
                bool verbose) {
    ParsedCommand parsed;
    try {
        parsed = parse_command_arguments(command, raw_args);
    } catch (const std::exception& ex) {
        err << "Argument error: " << ex.what() << "\n";
        print_command_usage(command, err);
        return exit_code::kArgumentError;
    }

    if (parsed.help_requested) {
        print_command_usage(command, out);
        return exit_code::kOk;
    }

    if (needs_root(command, driver.simulated()) && !is_root_user()) {
        err << "Command '" << command.name << "' requires root privileges. Please rerun with sudo or use --simulate." << "\n";
        return exit_code::kRootRequired;
    }

    CommandContext context{registry, driver, command, std::move(parsed.arguments), out, err, verbose, parsed.force, parsed.help_requested};

    try {
        return command.handler(context);
    } catch (const gpio::GpioError& ex) {
        err << "Command '" << command.name << "' failed: " << ex.what() << " [" << gpio::to_string(ex.code()) << "]\n";
    } catch (const std::exception& ex) {
        err << "Command '" << command.name << "' failed: " << ex.what() << "\n";
    } catch (...) {
        err << "Command '" << command.name << "' failed with an unknown error." << "\n";
    }
    return exit_code::kCommandThrew;
}

} // namespace pinworks
