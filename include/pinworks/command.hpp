#ifndef PINWORKS_COMMAND_HPP
#define PINWORKS_COMMAND_HPP

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace pinworks {

struct CommandContext;

enum class CommandSafety {
    Safe,
    RequiresForce
};

// What a command needs from the driver before its handler runs.
enum class CommandAccess {
    None,       // pure CLI (help, version, script host)
    Peripheral  // opens the GPIO peripheral; root unless running on the simulator
};

struct OptionSpec {
    std::string long_name;
    char short_name = '\0';
    bool requires_value = false;
    bool required = false;
    bool repeatable = false;
    std::string value_name;
    std::string description;
};

using CommandHandler = std::function<int(const CommandContext&)>;

struct Command {
    std::string name;
    std::vector<std::string> aliases;
    std::string category = "general";
    std::string summary;
    std::string description;
    std::string usage;
    std::vector<OptionSpec> options;
    std::size_t min_positionals = 0;
    std::size_t max_positionals = static_cast<std::size_t>(-1);
    CommandSafety safety = CommandSafety::Safe;
    CommandAccess access = CommandAccess::Peripheral;
    bool stop_parsing_options_after_positionals = false;
    CommandHandler handler;
};

inline bool needs_root(const Command& command, bool simulated) noexcept {
    return command.access == CommandAccess::Peripheral && !simulated;
}

} // namespace pinworks

#endif // PINWORKS_COMMAND_HPP
