#ifndef PINWORKS_COMMANDS_GPIO_HPP
#define PINWORKS_COMMANDS_GPIO_HPP

#include "pinworks/command_registry.hpp"

namespace pinworks::commands {

void register_gpio_commands(CommandRegistry& registry);

} // namespace pinworks::commands

#endif // PINWORKS_COMMANDS_GPIO_HPP
