#include "pinworks/command_registry.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace pinworks {

namespace {
std::string normalize(std::string_view name) {
    std::string normalized{name};
    std::transform(normalized.begin(), normalized.end(), normalized.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return normalized;
}
}

CommandRegistry::CommandRegistry() = default;

Command& CommandRegistry::register_command(Command command) {
    if (command.name.empty()) {
        throw std::invalid_argument("command name must not be empty");
    }
    if (!command.handler) {
        throw std::invalid_argument("command '" + command.name + "' has no handler");
    }

    std::vector<std::string> keys{normalize(command.name)};
    for (const auto& alias : command.aliases) {
        keys.push_back(normalize(alias));
    }
    for (std::size_t i = 0; i < keys.size(); ++i) {
        const bool clashes = lookup_.count(keys[i]) != 0U ||
                             std::find(keys.begin(), keys.begin() + static_cast<std::ptrdiff_t>(i), keys[i]) !=
                                 keys.begin() + static_cast<std::ptrdiff_t>(i);
        if (clashes) {
            throw std::invalid_argument((i == 0 ? "duplicate command name: " : "duplicate command alias: ") +
                                        keys[i]);
        }
    }

    const std::size_t index = commands_.size();
    commands_.push_back(std::move(command));
    for (const auto& key : keys) {
        lookup_.emplace(key, index);
    }
    return commands_.back();
}

const Command* CommandRegistry::find(std::string_view name) const {
    const auto it = lookup_.find(normalize(name));
    if (it == lookup_.end()) return nullptr;
    return &commands_.at(it->second);
}

std::vector<std::string> CommandRegistry::categories() const {
    std::vector<std::string> seen;
    for (const auto& command : commands_) {
        if (std::find(seen.begin(), seen.end(), command.category) == seen.end()) {
            seen.push_back(command.category);
        }
    }
    return seen;
}

} // namespace pinworks
