#include "pinworks/cli_parser.hpp"
#include "pinworks/command_context.hpp"
#include "pinworks/command_registry.hpp"
#include "pinworks/commands/gpio.hpp"
#include "pinworks/commands/script.hpp"
#include "pinworks/driver_context.hpp"
#include "board_config.hpp"
#include "logging.hpp"

#if PINWORKS_WITH_BCM2835
#include "gpio/bcm2835_registers.hpp"
#endif

#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

constexpr const char* kDriverBanner = "pinworks";
constexpr const char* kDriverVersion = "0.1.0";

void print_boards(std::ostream& out) {
    out << "Boards:\n";
    for (const auto& board : gpio::known_boards()) {
        out << "  " << std::left << std::setw(10) << board.name << std::right
            << "base 0x" << std::hex << board.peripheral_base << std::dec
            << ", " << board.pin_count << " pins\n";
    }
}

std::string join_aliases(const pinworks::Command& command) {
    std::string joined;
    for (const auto& alias : command.aliases) {
        joined += (joined.empty() ? "" : ", ") + alias;
    }
    return joined;
}

void print_global_help(const pinworks::CommandRegistry& registry, std::ostream& out, bool verbose) {
    out << kDriverBanner << " " << kDriverVersion << (verbose ? " [verbose]" : "") << "\n"
        << "Usage: pinworks [--verbose] [--board <name>] [--simulate] <command> [options]\n"
        << "       pinworks help <command>\n";
    for (const auto& category : registry.categories()) {
        out << "\n" << category << ":\n";
        for (const auto& command : registry.commands()) {
            if (command.category != category) {
                continue;
            }
            const std::string aliases = join_aliases(command);
            out << "  " << std::left << std::setw(12) << command.name << std::right << command.summary;
            if (!aliases.empty()) {
                out << " [" << aliases << "]";
            }
            out << "\n";
        }
    }
    if (verbose) {
        out << "\n";
        print_boards(out);
    }
}

int help_command(const pinworks::CommandContext& context) {
    if (context.arguments.positional_count() == 0) {
        print_global_help(context.registry, context.out, context.verbose);
        return pinworks::exit_code::kOk;
    }
    const std::string& target = context.arguments.positional(0);
    const pinworks::Command* command = context.registry.find(target);
    if (command == nullptr) {
        context.err << "Unknown command: " << target << "\n";
        return pinworks::exit_code::kFailure;
    }
    pinworks::print_command_usage(*command, context.out);
    return pinworks::exit_code::kOk;
}

int version_command(const pinworks::CommandContext& context) {
    const gpio::BoardConfig& board = context.driver.board();
    const char* scripting = PINWORKS_WITH_LUAJIT ? "LuaJIT" : "disabled";
    auto yes_no = [](bool value) { return value ? "yes" : "no"; };
    context.out << kDriverBanner << " " << kDriverVersion << "\n"
                << "Board: " << board.name << ", " << board.pin_count << " pins, GPIO block at 0x" << std::hex
                << board.gpio_base() << std::dec << "\n"
                << "Backend: " << (context.driver.simulated() ? "simulated" : "bcm2835") << "\n"
                << "Scripting: " << scripting << "\n"
                << "Verbose: " << yes_no(context.verbose) << "\n"
                << "Session active: " << yes_no(context.driver.session_active()) << "\n";
    return pinworks::exit_code::kOk;
}

pinworks::Command builtin(std::string name,
                          std::vector<std::string> aliases,
                          std::string summary,
                          std::string usage,
                          std::size_t max_positionals,
                          pinworks::CommandHandler handler) {
    pinworks::Command command;
    command.name = std::move(name);
    command.aliases = std::move(aliases);
    command.summary = std::move(summary);
    command.usage = std::move(usage);
    command.max_positionals = max_positionals;
    command.access = pinworks::CommandAccess::None;
    command.handler = std::move(handler);
    return command;
}

void register_builtin_commands(pinworks::CommandRegistry& registry) {
    registry.register_command(builtin("help", {"?", "list"},
                                      "List commands, or show the usage of one command.",
                                      "pinworks help [command]", 1, help_command));
    registry.register_command(builtin("version", {"about"},
                                      "Print the version, board profile and register backend.",
                                      "pinworks version", 0, version_command));
}

pinworks::RegisterBlockFactory hardware_register_factory() {
#if PINWORKS_WITH_BCM2835
    return [](const gpio::BoardConfig& board) -> std::unique_ptr<gpio::RegisterBlock> {
        return std::make_unique<gpio::Bcm2835RegisterBlock>(board);
    };
#else
    return {};
#endif
}

// Options that come before the command name.
struct GlobalOptions {
    bool verbose = false;
    bool help = false;
    bool simulate = false;
    std::string board;
    std::string command;
    std::vector<std::string> command_args;
};

GlobalOptions parse_global_options(int argc, char** argv) {
    GlobalOptions options;
    int i = 1;
    for (; i < argc && options.command.empty(); ++i) {
        const std::string arg = argv[i];
        if (arg == "--verbose" || arg == "-v") {
            options.verbose = true;
        } else if (arg == "--help" || arg == "-h" || arg == "--list-commands") {
            options.help = true;
        } else if (arg == "--simulate") {
            options.simulate = true;
        } else if (arg.rfind("--board=", 0) == 0) {
            options.board = arg.substr(8);
        } else if (arg == "--board") {
            if (i + 1 >= argc) {
                throw std::invalid_argument("Option '--board' expects a value");
            }
            options.board = argv[++i];
        } else if (arg.size() > 1 && arg[0] == '-') {
            throw std::invalid_argument("Unknown global option '" + arg + "'");
        } else {
            options.command = arg;
        }
    }
    options.command_args.assign(argv + i, argv + argc);
    return options;
}

// $PINWORKS_BOARD (or the default profile) unless --board names another one.
std::optional<gpio::BoardConfig> select_board(const std::string& name) {
    if (name.empty()) {
        return gpio::board_from_environment();
    }
    return gpio::find_board(name);
}

} // namespace

int main(int argc, char** argv) {
    if (!logger_open_from_environment()) {
        std::cerr << "Warning: cannot open PINWORKS_LOG_FILE; logging to stderr\n";
    }

    GlobalOptions options;
    try {
        options = parse_global_options(argc, argv);
    } catch (const std::invalid_argument& ex) {
        std::cerr << ex.what() << "\n";
        return pinworks::exit_code::kArgumentError;
    }

    pinworks::CommandRegistry registry;
    register_builtin_commands(registry);
    pinworks::commands::register_gpio_commands(registry);
    pinworks::commands::register_script_commands(registry);

    if (options.command.empty()) {
        if (options.help) {
            print_global_help(registry, std::cout, options.verbose);
            return pinworks::exit_code::kOk;
        }
        std::cerr << "No command specified. Use --help to list commands.\n";
        return pinworks::exit_code::kFailure;
    }

    const pinworks::Command* command = registry.find(options.command);
    if (command == nullptr) {
        std::cerr << "Unknown command: " << options.command << "\n";
        print_global_help(registry, std::cerr, options.verbose);
        return pinworks::exit_code::kUnknownCommand;
    }

    const auto board = select_board(options.board);
    if (!board) {
        std::cerr << "Unknown board: " << options.board << "\n";
        print_boards(std::cerr);
        return pinworks::exit_code::kArgumentError;
    }

    pinworks::DriverContext driver(options.verbose,
                                   *board,
                                   options.simulate ? pinworks::simulated_register_factory()
                                                    : hardware_register_factory(),
                                   options.simulate);

    return pinworks::run_command(registry, driver, *command, options.command_args, std::cout, std::cerr,
                                 options.verbose);
}
