#include "pinworks/cli_parser.hpp"

#include <cctype>
#include <initializer_list>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>

namespace pinworks {

namespace {

bool is_long_option(const std::string& token) {
    return token.size() > 2 && token.compare(0, 2, "--") == 0;
}

// "-5" and "-0x10" are values, not short options.
bool is_short_option(const std::string& token) {
    return token.size() >= 2 && token[0] == '-' && token[1] != '-' &&
           !std::isdigit(static_cast<unsigned char>(token[1]));
}

class ArgumentScanner {
public:
    ArgumentScanner(const Command& command, const std::vector<std::string>& tokens)
        : command_(command), tokens_(tokens) {
        for (const auto& option : command.options) {
            if (option.long_name.empty()) {
                throw std::invalid_argument("command '" + command.name + "' declares an option without a name");
            }
            if (option.short_name != '\0' && !by_short_.emplace(option.short_name, &option).second) {
                throw std::invalid_argument(std::string("command '") + command.name + "' declares -" +
                                            option.short_name + " twice");
            }
        }
    }

    ParsedCommand scan() {
        bool options_done = false;
        for (next_ = 0; next_ < tokens_.size();) {
            const std::string& token = tokens_[next_++];
            if (!options_done && command_.stop_parsing_options_after_positionals && !positionals_.empty()) {
                options_done = true;
            }
            if (options_done) {
                positionals_.push_back(token);
            } else if (token == "--") {
                options_done = true;
            } else if (token == "--help" || token == "-h") {
                help_ = true;
            } else if (token == "--force" || token == "-f") {
                force_ = true;
            } else if (is_long_option(token)) {
                take_long(token.substr(2));
            } else if (is_short_option(token)) {
                take_short(token);
            } else {
                positionals_.push_back(token);
            }
        }
        if (!help_) {
            validate();
        }

        ParsedCommand parsed;
        parsed.arguments = CommandArguments{std::move(values_), std::move(positionals_)};
        parsed.help_requested = help_;
        parsed.force = force_;
        return parsed;
    }

private:
    void take_long(std::string name) {
        std::optional<std::string> inline_value;
        const auto equals = name.find('=');
        if (equals != std::string::npos) {
            inline_value = name.substr(equals + 1);
            name.resize(equals);
        }
        store(match_long(name), "--" + name, inline_value);
    }

    void take_short(const std::string& token) {
        const auto it = by_short_.find(token[1]);
        if (it == by_short_.end()) {
            throw std::invalid_argument("Unknown option '" + token.substr(0, 2) + "'");
        }
        std::optional<std::string> inline_value;
        if (token.size() > 2) {
            inline_value = token.substr(2);
        }
        store(*it->second, token.substr(0, 2), inline_value);
    }

    // Exact name first, then a unique prefix.
    const OptionSpec& match_long(const std::string& name) const {
        for (const auto& option : command_.options) {
            if (option.long_name == name) {
                return option;
            }
        }
        const OptionSpec* found = nullptr;
        for (const auto& option : command_.options) {
            if (option.long_name.compare(0, name.size(), name) != 0) {
                continue;
            }
            if (found != nullptr) {
                throw std::invalid_argument("Ambiguous option '--" + name + "' could be --" + found->long_name +
                                            " or --" + option.long_name);
            }
            found = &option;
        }
        if (found == nullptr) {
            throw std::invalid_argument("Unknown option '--" + name + "'");
        }
        return *found;
    }

    void store(const OptionSpec& option, const std::string& spelled, std::optional<std::string> value) {
        if (!option.requires_value && value) {
            throw std::invalid_argument("Option '" + spelled + "' does not take a value");
        }
        if (option.requires_value && !value) {
            if (next_ >= tokens_.size()) {
                throw std::invalid_argument("Option '" + spelled + "' expects a value");
            }
            value = tokens_[next_++];
        }
        auto& slot = values_[option.long_name];
        if (!slot.empty() && !option.repeatable) {
            throw std::invalid_argument("Option '--" + option.long_name + "' given more than once");
        }
        slot.push_back(option.requires_value ? *value : std::string("true"));
    }

    void validate() const {
        for (const auto& option : command_.options) {
            if (option.required && values_.count(option.long_name) == 0) {
                throw std::invalid_argument("Missing required option '--" + option.long_name + "'");
            }
        }
        if (positionals_.size() < command_.min_positionals) {
            throw std::invalid_argument("Expected at least " + std::to_string(command_.min_positionals) +
                                        " positional argument(s)");
        }
        if (positionals_.size() > command_.max_positionals) {
            throw std::invalid_argument("Expected at most " + std::to_string(command_.max_positionals) +
                                        " positional argument(s)");
        }
        if (command_.safety == CommandSafety::RequiresForce && !force_) {
            throw std::invalid_argument("'" + command_.name + "' changes every pin; rerun with --force");
        }
    }

    const Command& command_;
    const std::vector<std::string>& tokens_;
    std::unordered_map<char, const OptionSpec*> by_short_;
    std::unordered_map<std::string, std::vector<std::string>> values_;
    std::vector<std::string> positionals_;
    std::size_t next_ = 0;
    bool help_ = false;
    bool force_ = false;
};

} // namespace

ParsedCommand parse_command_arguments(const Command& command, const std::vector<std::string>& raw_args) {
    return ArgumentScanner(command, raw_args).scan();
}

void print_command_usage(const Command& command, std::ostream& out) {
    out << "Usage: " << command.usage << "\n";
    if (!command.aliases.empty()) {
        out << "Aliases:";
        for (const auto& alias : command.aliases) {
            out << ' ' << alias;
        }
        out << "\n";
    }
    for (const std::string* text : {&command.summary, &command.description}) {
        if (!text->empty()) {
            out << *text << "\n";
        }
    }

    out << "\nOptions:\n";
    auto describe = [&out](const std::string& spelled, const std::string& text) {
        out << "  " << spelled << "\n";
        if (!text.empty()) {
            out << "      " << text << "\n";
        }
    };
    for (const auto& option : command.options) {
        std::string spelled = "--" + option.long_name;
        if (option.short_name != '\0') {
            spelled += std::string(", -") + option.short_name;
        }
        if (option.requires_value) {
            spelled += " <" + (option.value_name.empty() ? std::string("value") : option.value_name) + ">";
        }
        if (option.required) {
            spelled += " (required)";
        }
        if (option.repeatable) {
            spelled += " (repeatable)";
        }
        describe(spelled, option.description);
    }
    if (command.safety == CommandSafety::RequiresForce) {
        describe("--force, -f", "Confirm an operation that reconfigures every pin.");
    }
    describe("--help, -h", "Show this help.");
}

} // namespace pinworks
