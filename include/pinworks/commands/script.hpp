#ifndef PINWORKS_COMMANDS_SCRIPT_HPP
#define PINWORKS_COMMANDS_SCRIPT_HPP

#include "pinworks/command_registry.hpp"

namespace pinworks::commands {

void register_script_commands(CommandRegistry& registry);

} // namespace pinworks::commands

#endif // PINWORKS_COMMANDS_SCRIPT_HPP
