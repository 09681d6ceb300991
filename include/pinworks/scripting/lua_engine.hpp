#ifndef PINWORKS_SCRIPTING_LUA_ENGINE_HPP
#define PINWORKS_SCRIPTING_LUA_ENGINE_HPP

#include "pinworks/command_registry.hpp"

#include <iosfwd>
#include <stdexcept>
#include <string>
#include <vector>

namespace pinworks {
class DriverContext;
}

#if PINWORKS_WITH_LUAJIT
extern "C" {
struct lua_State;
}
#endif

namespace pinworks::scripting {

struct ScriptOptions {
    std::string path;
    std::vector<std::string> args;
    bool allow_unsafe_libraries = false;
};

#if PINWORKS_WITH_LUAJIT

// Script environment:
//   exec(name, ...)                 run a command with string arguments, returns its exit code
//   commands.<name>{opts, ...}      run a command; raises unless opts.allow_failure is set
//   driver.start_session(), driver.shutdown(), driver.is_active()
//   with_session(fn)                fn(commands, pinworks) with the peripheral held
//   pinworks.board()                {name, peripheral_base, pin_count, simulated}
//   pinworks.pins()                 array of {id, bank, func, level}, no pin is claimed
//   pinworks.level(pin)             0 or 1, no pin is claimed
//   pinworks.wait(pin, event, ms)   claim pin as input, block until event or timeout; true/false
//   pinworks.sleep_ms(ms)
class LuaEngine {
public:
    LuaEngine(CommandRegistry& registry,
              DriverContext& driver,
              std::ostream& out,
              std::ostream& err,
              bool verbose);
    ~LuaEngine();

    LuaEngine(const LuaEngine&) = delete;
    LuaEngine& operator=(const LuaEngine&) = delete;

    LuaEngine(LuaEngine&&) = delete;
    LuaEngine& operator=(LuaEngine&&) = delete;

    void open_standard_libraries(bool allow_unsafe);
    void register_bindings();
    int run_file(const ScriptOptions& options);

private:
    using Function = int (*)(::lua_State*);
    struct Binding {
        const char* name;
        Function function;
    };

    CommandRegistry& registry_;
    DriverContext& driver_;
    std::ostream& out_;
    std::ostream& err_;
    bool verbose_;
    ::lua_State* state_ = nullptr;

    void install(int table_index, const Binding* first, const Binding* last);
    void install_commands(int table_index);
    void set_arguments(const ScriptOptions& options);

    static LuaEngine& self(::lua_State* L);

    static int lua_exec(::lua_State* L);
    static int lua_command(::lua_State* L);
    static int lua_start_session(::lua_State* L);
    static int lua_shutdown(::lua_State* L);
    static int lua_is_active(::lua_State* L);
    static int lua_with_session(::lua_State* L);
    static int lua_board(::lua_State* L);
    static int lua_pins(::lua_State* L);
    static int lua_level(::lua_State* L);
    static int lua_wait(::lua_State* L);
    static int lua_sleep_ms(::lua_State* L);

    int invoke_command(const std::string& name, const std::vector<std::string>& args);
};

#else // PINWORKS_WITH_LUAJIT

class LuaEngine {
public:
    LuaEngine(CommandRegistry&, DriverContext&, std::ostream&, std::ostream&, bool) {
        throw std::runtime_error("LuaJIT support not enabled in this build");
    }
    void open_standard_libraries(bool) {}
    void register_bindings() {}
    int run_file(const ScriptOptions&) { return 1; }
};

#endif // PINWORKS_WITH_LUAJIT

} // namespace pinworks::scripting

#endif // PINWORKS_SCRIPTING_LUA_ENGINE_HPP
