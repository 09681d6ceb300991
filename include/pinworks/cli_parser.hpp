#ifndef PINWORKS_CLI_PARSER_HPP
#define PINWORKS_CLI_PARSER_HPP

#include "pinworks/command.hpp"
#include "pinworks/command_arguments.hpp"

#include <ostream>
#include <string>
#include <vector>

namespace pinworks {

struct ParsedCommand {
    CommandArguments arguments;
    bool help_requested = false;
    bool force = false;
};

// Long options may be abbreviated to any unique prefix ("--time" for "--timeout-ms").
ParsedCommand parse_command_arguments(const Command& command, const std::vector<std::string>& raw_args);

void print_command_usage(const Command& command, std::ostream& out);

} // namespace pinworks

#endif // PINWORKS_CLI_PARSER_HPP
