#include "pinworks/command_context.hpp"
#include "pinworks/command_registry.hpp"
#include "pinworks/commands/gpio.hpp"
#include "pinworks/commands/script.hpp"
#include "pinworks/driver_context.hpp"
#include "gpio/peripheral.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

using namespace pinworks;

namespace {

const char* kScript = R"lua(
local board = pinworks.board()
assert(board.simulated)
assert(arg[1] == "17")

local pin = tonumber(arg[1])
assert(commands.write{args = {arg[1], "high"}})
assert(pinworks.level(pin) == 1)
assert(exec("toggle", arg[1]) == 0)
assert(pinworks.level(pin) == 0)

local ok, status = commands.fsel{allow_failure = true, args = {"12", "alt6"}}
assert(ok == false and status == 4)

local rows = pinworks.pins()
assert(#rows == board.pin_count)
assert(rows[pin + 1].func == "output")
assert(rows[33].bank == 1)

assert(pinworks.wait(5, "rising", 5) == false)
assert(exec("no-such-command") == 2)

with_session(function(cmds, module)
    assert(driver.is_active())
    assert(cmds.read{args = {"6"}, pull = "up"})
    assert(module.level(6) == 0)
end)
)lua";

int run(CommandRegistry& registry, DriverContext& driver, const std::vector<std::string>& args,
        std::string* err_text = nullptr) {
    std::ostringstream out;
    std::ostringstream err;
    const int code = run_command(registry, driver, *registry.find("script"), args, out, err, false);
    if (err_text != nullptr) {
        *err_text = err.str();
    }
    return code;
}

}

int main() {
    CommandRegistry registry;
    commands::register_gpio_commands(registry);
    commands::register_script_commands(registry);
    assert(registry.find("lua") == registry.find("script"));
    assert(!needs_root(*registry.find("script"), false));

    DriverContext driver(false, gpio::default_board(), simulated_register_factory(), true);

    const auto path = std::filesystem::temp_directory_path() / "pinworks_script_command_test.lua";
    {
        std::ofstream file(path);
        file << kScript;
    }

    std::string err;
#if PINWORKS_WITH_LUAJIT
    assert(run(registry, driver, {path.string(), "17"}, &err) == exit_code::kOk);
    assert(!driver.session_active());
    assert(!gpio::Gpio::instantiated());

    assert(run(registry, driver, {"/nonexistent/pinworks.lua"}, &err) == exit_code::kFailure);
    assert(err.find("does not exist") != std::string::npos);

    // A failing assertion inside the script is a script failure
    assert(run(registry, driver, {path.string(), "18"}, &err) == exit_code::kScriptFailed);
#else
    assert(run(registry, driver, {path.string(), "17"}, &err) == exit_code::kScriptingDisabled);
    assert(err.find("LuaJIT") != std::string::npos);
#endif

    assert(run(registry, driver, {}, &err) == exit_code::kArgumentError);

    std::filesystem::remove(path);
    return 0;
}
