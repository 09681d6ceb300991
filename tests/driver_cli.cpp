#include "pinworks/cli_parser.hpp"
#include "pinworks/command_registry.hpp"

#include <cassert>
#include <sstream>
#include <stdexcept>
#include <string>

using namespace pinworks;

namespace {
bool parse_fails(const Command& command, const std::vector<std::string>& args) {
    try {
        (void)parse_command_arguments(command, args);
    } catch (const std::invalid_argument&) {
        return true;
    }
    return false;
}
}

int main() {
    CommandRegistry registry;

    Command watch_cmd{
        .name = "watch",
        .aliases = {"wait"},
        .category = "gpio",
        .summary = "",
        .description = "",
        .usage = "pinworks watch <pin> --event <kind>",
        .options = {
            OptionSpec{"event", 'e', true, true, false, "kind", ""},
            OptionSpec{"timeout-ms", 't', true, false, false, "ms", ""},
            OptionSpec{"oneshot", '\0', false, false, false, "", ""},
            OptionSpec{"tag", '\0', true, false, true, "t", ""}
        },
        .min_positionals = 1,
        .max_positionals = 2,
        .safety = CommandSafety::Safe,
        .access = CommandAccess::Peripheral,
        .handler = [](const CommandContext&) { return 0; }
    };

    Command& stored = registry.register_command(watch_cmd);

    ParsedCommand parsed = parse_command_arguments(stored, {"--event", "rising", "17", "--timeout-ms=250"});
    assert(!parsed.help_requested);
    assert(!parsed.force);
    assert(parsed.arguments.value("event") == std::optional<std::string>("rising"));
    assert(parsed.arguments.value_as_uint("timeout-ms", 0) == 250);
    assert(parsed.arguments.value_as_uint("missing", 7) == 7);
    assert(parsed.arguments.positional_count() == 1);
    assert(parsed.arguments.positional_as_uint(0, "pin") == 17);
    assert(!parsed.arguments.has("oneshot"));

    // Short options, flags, repeatable values and unique prefixes
    parsed = parse_command_arguments(stored, {"-efalling", "0x1f", "--one", "--tag", "a", "--tag", "b", "--time", "5"});
    assert(parsed.arguments.value_or("event", "") == "falling");
    assert(parsed.arguments.positional_as_uint(0, "pin") == 31);
    assert(parsed.arguments.has("oneshot"));
    assert(parsed.arguments.values("tag").size() == 2);
    assert(parsed.arguments.values("tag")[1] == "b");
    assert(parsed.arguments.value_as_uint("timeout-ms", 0) == 5);

    // Ambiguous prefix: --t matches --timeout-ms and --tag
    assert(parse_fails(stored, {"--event", "rising", "1", "--t", "3"}));
    assert(parse_fails(stored, {"--event", "rising", "1", "--bogus"}));
    assert(parse_fails(stored, {"--event", "rising", "1", "--oneshot=yes"}));
    assert(parse_fails(stored, {"--event", "rising", "1", "--event", "falling"}));
    assert(parse_fails(stored, {"17"}));
    assert(parse_fails(stored, {"--event", "rising"}));
    assert(parse_fails(stored, {"--event", "rising", "1", "2", "3"}));
    assert(parse_fails(stored, {"--event"}));

    // Negative numbers are positionals, not short options
    parsed = parse_command_arguments(stored, {"--event", "rising", "-5"});
    assert(parsed.arguments.positional(0) == "-5");
    bool threw = false;
    try {
        (void)parsed.arguments.positional_as_uint(0, "pin");
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    ParsedCommand help_parse = parse_command_arguments(stored, {"--help"});
    assert(help_parse.help_requested);

    parsed = parse_command_arguments(stored, {"--event", "low", "--", "--oneshot"});
    assert(parsed.arguments.positional(0) == "--oneshot");
    assert(!parsed.arguments.has("oneshot"));

    // Lookup is case-insensitive and covers aliases
    assert(registry.find("WAIT") == &stored);
    assert(registry.find("nope") == nullptr);

    threw = false;
    try {
        Command clash = watch_cmd;
        clash.name = "other";
        registry.register_command(clash);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
    assert(registry.find("other") == nullptr);

    Command destructive{
        .name = "reset",
        .aliases = {},
        .category = "gpio",
        .summary = "",
        .description = "",
        .usage = "pinworks reset --force",
        .options = {},
        .min_positionals = 0,
        .max_positionals = 0,
        .safety = CommandSafety::RequiresForce,
        .access = CommandAccess::Peripheral,
        .handler = [](const CommandContext&) { return 0; }
    };

    Command& stored_destructive = registry.register_command(destructive);
    assert(parse_fails(stored_destructive, {}));
    ParsedCommand forced = parse_command_arguments(stored_destructive, {"--force"});
    assert(forced.force);

    std::ostringstream usage;
    print_command_usage(stored_destructive, usage);
    assert(usage.str().find("--force") != std::string::npos);

    assert((registry.categories() == std::vector<std::string>{"gpio"}));
    assert(needs_root(stored_destructive, false));
    assert(!needs_root(stored_destructive, true));

    return 0;
}
