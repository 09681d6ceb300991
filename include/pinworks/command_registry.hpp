#ifndef PINWORKS_COMMAND_REGISTRY_HPP
#define PINWORKS_COMMAND_REGISTRY_HPP

#include "pinworks/command.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace pinworks {

class CommandRegistry {
public:
    CommandRegistry();

    // Names and aliases are case-insensitive; a clash throws std::invalid_argument.
    Command& register_command(Command command);

    const Command* find(std::string_view name) const;

    const std::vector<Command>& commands() const noexcept { return commands_; }

    // Categories in registration order.
    std::vector<std::string> categories() const;

private:
    std::vector<Command> commands_;
    std::unordered_map<std::string, std::size_t> lookup_;
};

} // namespace pinworks

#endif // PINWORKS_COMMAND_REGISTRY_HPP
