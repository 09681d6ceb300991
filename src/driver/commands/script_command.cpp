#include "pinworks/commands/script.hpp"

#include "pinworks/command_context.hpp"
#include "pinworks/command_registry.hpp"
#include "pinworks/scripting/lua_engine.hpp"

#include <exception>
#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include <system_error>

namespace pinworks::commands {
namespace {

#if PINWORKS_WITH_LUAJIT
std::optional<std::string> resolve_script(const std::string& path, std::ostream& err) {
    std::error_code ec;
    const auto absolute = std::filesystem::absolute(path, ec);
    if (ec || !std::filesystem::is_regular_file(absolute, ec)) {
        err << "Script '" << path << "' does not exist or is not a regular file.\n";
        return std::nullopt;
    }
    return absolute.string();
}
#endif

int script_command(const CommandContext& context) {
#if PINWORKS_WITH_LUAJIT
    const auto& positionals = context.arguments.positionals();
    const auto path = resolve_script(positionals.front(), context.err);
    if (!path) {
        return exit_code::kFailure;
    }

    scripting::ScriptOptions options;
    options.path = *path;
    options.args.assign(positionals.begin() + 1, positionals.end());
    options.allow_unsafe_libraries = context.arguments.has("allow-unsafe");

    try {
        scripting::LuaEngine engine(context.registry, context.driver, context.out, context.err, context.verbose);
        engine.open_standard_libraries(options.allow_unsafe_libraries);
        engine.register_bindings();
        if (engine.run_file(options) != 0) {
            return exit_code::kScriptFailed;
        }
    } catch (const std::exception& ex) {
        context.err << "Lua engine error: " << ex.what() << "\n";
        context.driver.shutdown();
        return exit_code::kScriptFailed;
    }
    // Scripts may leave the peripheral open; the CLI run ends here.
    context.driver.shutdown();
    return exit_code::kOk;
#else
    context.err << "pinworks was built without LuaJIT; install it and reconfigure to use 'script'.\n";
    return exit_code::kScriptingDisabled;
#endif
}

} // namespace

void register_script_commands(CommandRegistry& registry) {
    registry.register_command({
        .name = "script",
        .aliases = {"lua"},
        .category = "scripting",
        .summary = "Run a Lua script that drives pins through the command set.",
        .description = "The script sees exec(), the commands table, driver and the pinworks module "
                       "(board, pins, level, wait, sleep_ms). Arguments after the script path fill 'arg'.",
        .usage = "pinworks script [--allow-unsafe] <script.lua> [args...]",
        .options = {
            OptionSpec{"allow-unsafe", '\0', false, false, false, "", "Keep Lua's os and io libraries loaded."}
        },
        .min_positionals = 1,
        .max_positionals = static_cast<std::size_t>(-1),
        .safety = CommandSafety::Safe,
        .access = CommandAccess::None,
        .stop_parsing_options_after_positionals = true,
        .handler = script_command,
    });
}

} // namespace pinworks::commands
