#include "pinworks/scripting/lua_engine.hpp"

#if PINWORKS_WITH_LUAJIT

#include "pinworks/claimed_pin.hpp"
#include "pinworks/command_context.hpp"
#include "pinworks/driver_context.hpp"
#include "gpio/irq.hpp"
#include "gpio/peripheral.hpp"
#include "logging.hpp"
#include "timing.hpp"

#include <cctype>
#include <cstdint>
#include <exception>
#include <initializer_list>
#include <iostream>
#include <iterator>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

extern "C" {
#include "lua.hpp"
}

namespace {

using pinworks::Command;
using pinworks::OptionSpec;

// "wait" stays "wait"; "?" becomes "_". Leading digits get an underscore prefix.
std::string lua_identifier(std::string_view name) {
    std::string identifier;
    identifier.reserve(name.size() + 1);
    for (char ch : name) {
        const unsigned char c = static_cast<unsigned char>(ch);
        identifier.push_back(std::isalnum(c) ? static_cast<char>(std::tolower(c)) : '_');
    }
    if (!identifier.empty() && std::isdigit(static_cast<unsigned char>(identifier.front()))) {
        identifier.insert(identifier.begin(), '_');
    }
    return identifier;
}

// Lua keys use underscores where long options use dashes: timeout_ms -> timeout-ms.
std::string option_name(std::string_view key) {
    std::string name;
    name.reserve(key.size());
    for (char ch : key) {
        name.push_back(ch == '_' ? '-' : static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    }
    return name;
}

std::string scalar(lua_State* L, int index, const char* what) {
    const int type = lua_type(L, index);
    if (type == LUA_TBOOLEAN) {
        return lua_toboolean(L, index) ? "true" : "false";
    }
    if (type != LUA_TSTRING && type != LUA_TNUMBER) {
        luaL_error(L, "%s must be a string, number or boolean", what);
    }
    size_t len = 0;
    const char* text = lua_tolstring(L, index, &len);
    return std::string(text, len);
}

bool flag(lua_State* L, int index, const char* what) {
    if (!lua_isnil(L, index) && !lua_isboolean(L, index)) {
        luaL_error(L, "%s expects a boolean", what);
    }
    return lua_toboolean(L, index) != 0;
}

// Scalar or array of scalars at index; nil entries are skipped.
std::vector<std::string> scalars(lua_State* L, int index, const char* what) {
    std::vector<std::string> values;
    if (!lua_istable(L, index)) {
        values.push_back(scalar(L, index, what));
        return values;
    }
    const int table = index > 0 ? index : lua_gettop(L) + index + 1;
    const int count = static_cast<int>(lua_objlen(L, table));
    for (int i = 1; i <= count; ++i) {
        lua_rawgeti(L, table, i);
        if (lua_istable(L, -1)) {
            luaL_error(L, "%s does not accept nested tables", what);
        }
        if (!lua_isnil(L, -1)) {
            values.push_back(scalar(L, -1, what));
        }
        lua_pop(L, 1);
    }
    return values;
}

// Turns commands.<name>{key = value, ...} into the token list the CLI parser expects.
class CommandCall {
public:
    explicit CommandCall(const Command& command) : command_(command) {}

    void read_table(lua_State* L, int table) {
        lua_pushnil(L);
        while (lua_next(L, table) != 0) {
            if (lua_type(L, -2) != LUA_TSTRING) {
                luaL_error(L, "option keys for '%s' must be strings", command_.name.c_str());
            }
            read_entry(L, option_name(lua_tostring(L, -2)));
            lua_pop(L, 1);
        }
    }

    void add_positional(lua_State* L, int index) {
        if (lua_isnil(L, index)) {
            return;
        }
        if (lua_istable(L, index)) {
            luaL_error(L, "positional arguments to '%s' must be scalars", command_.name.c_str());
        }
        positionals_.push_back(scalar(L, index, "positional argument"));
    }

    bool allow_failure() const noexcept { return allow_failure_; }
    bool missing_force() const noexcept {
        return command_.safety == pinworks::CommandSafety::RequiresForce && !force_ && !help_;
    }

    std::vector<std::string> tokens() const {
        std::vector<std::string> args = options_;
        if (force_) args.emplace_back("--force");
        if (help_) args.emplace_back("--help");
        args.insert(args.end(), positionals_.begin(), positionals_.end());
        return args;
    }

private:
    void read_entry(lua_State* L, const std::string& key) {
        if (key == "args") {
            auto values = scalars(L, -1, "options.args");
            positionals_.insert(positionals_.end(), std::make_move_iterator(values.begin()),
                                std::make_move_iterator(values.end()));
            return;
        }
        if (key == "allow-failure") {
            allow_failure_ = flag(L, -1, "options.allow_failure");
            return;
        }
        if (key == "force") {
            force_ = flag(L, -1, "options.force");
            return;
        }
        if (key == "help") {
            help_ = flag(L, -1, "options.help");
            return;
        }

        const OptionSpec* spec = find(key);
        if (spec == nullptr) {
            luaL_error(L, "'%s' has no option '%s'", command_.name.c_str(), key.c_str());
            return;
        }
        const std::string shown = "--" + spec->long_name;
        if (!spec->requires_value) {
            if (flag(L, -1, shown.c_str())) {
                options_.push_back(shown);
            }
            return;
        }
        const auto values = scalars(L, -1, shown.c_str());
        if (values.empty() || (values.size() > 1 && !spec->repeatable)) {
            luaL_error(L, "%s expects %s", shown.c_str(), spec->repeatable ? "one or more values" : "one value");
        }
        for (const auto& value : values) {
            options_.push_back(shown);
            options_.push_back(value);
        }
    }

    const OptionSpec* find(const std::string& long_name) const {
        for (const auto& option : command_.options) {
            if (option.long_name == long_name) {
                return &option;
            }
        }
        return nullptr;
    }

    const Command& command_;
    std::vector<std::string> options_;
    std::vector<std::string> positionals_;
    bool allow_failure_ = false;
    bool force_ = false;
    bool help_ = false;
};

uint32_t pin_id(lua_State* L, int index) {
    const lua_Integer value = luaL_checkinteger(L, index);
    if (value < 0 || static_cast<uint64_t>(value) > UINT32_MAX) {
        luaL_error(L, "pin must be a non-negative integer");
    }
    return static_cast<uint32_t>(value);
}

} // namespace

namespace pinworks::scripting {

LuaEngine::LuaEngine(CommandRegistry& registry,
                     DriverContext& driver,
                     std::ostream& out,
                     std::ostream& err,
                     bool verbose)
    : registry_(registry),
      driver_(driver),
      out_(out),
      err_(err),
      verbose_(verbose),
      state_(luaL_newstate()) {
    if (state_ == nullptr) {
        throw std::runtime_error("Failed to create a LuaJIT state");
    }
}

LuaEngine::~LuaEngine() {
    lua_close(state_);
}

void LuaEngine::open_standard_libraries(bool allow_unsafe) {
    luaL_openlibs(state_);
    if (allow_unsafe) {
        return;
    }
    for (const char* library : {LUA_OSLIBNAME, LUA_IOLIBNAME}) {
        lua_pushnil(state_);
        lua_setglobal(state_, library);
    }
}

LuaEngine& LuaEngine::self(lua_State* L) {
    void* engine = lua_touserdata(L, lua_upvalueindex(1));
    if (engine == nullptr) {
        luaL_error(L, "pinworks binding called without its engine");
    }
    return *static_cast<LuaEngine*>(engine);
}

void LuaEngine::install(int table_index, const Binding* first, const Binding* last) {
    for (const Binding* binding = first; binding != last; ++binding) {
        lua_pushlightuserdata(state_, this);
        lua_pushcclosure(state_, binding->function, 1);
        lua_setfield(state_, table_index, binding->name);
    }
}

void LuaEngine::install_commands(int table_index) {
    for (const auto& command : registry_.commands()) {
        std::vector<std::string> keys{command.name};
        keys.insert(keys.end(), command.aliases.begin(), command.aliases.end());
        const std::size_t spelled = keys.size();
        for (std::size_t i = 0; i < spelled; ++i) {
            const std::string identifier = lua_identifier(keys[i]);
            if (identifier != keys[i]) {
                keys.push_back(identifier);
            }
        }
        for (const auto& key : keys) {
            lua_pushlightuserdata(state_, this);
            lua_pushlightuserdata(state_, const_cast<Command*>(&command));
            lua_pushcclosure(state_, &LuaEngine::lua_command, 2);
            lua_setfield(state_, table_index, key.c_str());
        }
    }
}

void LuaEngine::register_bindings() {
    static const Binding kDriver[] = {
        {"start_session", &LuaEngine::lua_start_session},
        {"shutdown", &LuaEngine::lua_shutdown},
        {"is_active", &LuaEngine::lua_is_active},
    };
    static const Binding kModule[] = {
        {"exec", &LuaEngine::lua_exec},
        {"with_session", &LuaEngine::lua_with_session},
        {"board", &LuaEngine::lua_board},
        {"pins", &LuaEngine::lua_pins},
        {"level", &LuaEngine::lua_level},
        {"wait", &LuaEngine::lua_wait},
        {"sleep_ms", &LuaEngine::lua_sleep_ms},
    };

    const int base = lua_gettop(state_);

    lua_newtable(state_);
    const int driver_table = lua_gettop(state_);
    install(driver_table, std::begin(kDriver), std::end(kDriver));

    lua_newtable(state_);
    const int commands_table = lua_gettop(state_);
    install_commands(commands_table);

    lua_newtable(state_);
    const int module_table = lua_gettop(state_);
    install(module_table, std::begin(kModule), std::end(kModule));
    lua_pushvalue(state_, driver_table);
    lua_setfield(state_, module_table, "driver");
    lua_pushvalue(state_, commands_table);
    lua_setfield(state_, module_table, "commands");

    // Globals: exec and with_session are shared with the module table.
    lua_getfield(state_, module_table, "exec");
    lua_setglobal(state_, "exec");
    lua_getfield(state_, module_table, "with_session");
    lua_setglobal(state_, "with_session");
    lua_pushvalue(state_, driver_table);
    lua_setglobal(state_, "driver");
    lua_pushvalue(state_, commands_table);
    lua_setglobal(state_, "commands");
    lua_pushvalue(state_, module_table);
    lua_setglobal(state_, "pinworks");

    lua_settop(state_, base);
}

void LuaEngine::set_arguments(const ScriptOptions& options) {
    lua_createtable(state_, static_cast<int>(options.args.size()), 1);
    lua_pushlstring(state_, options.path.data(), options.path.size());
    lua_rawseti(state_, -2, 0);
    int index = 1;
    for (const auto& value : options.args) {
        lua_pushlstring(state_, value.data(), value.size());
        lua_rawseti(state_, -2, index++);
    }
    lua_setglobal(state_, "arg");
}

int LuaEngine::run_file(const ScriptOptions& options) {
    set_arguments(options);

    int status = luaL_loadfile(state_, options.path.c_str());
    const char* stage = "load";
    if (status == LUA_OK) {
        status = lua_pcall(state_, 0, 0, 0);
        stage = "run";
    }
    if (status != LUA_OK) {
        const char* message = lua_tostring(state_, -1);
        err_ << "Script '" << options.path << "' failed to " << stage << ": "
             << (message != nullptr ? message : "(no error message)") << "\n";
        lua_pop(state_, 1);
    }
    return status;
}

int LuaEngine::invoke_command(const std::string& name, const std::vector<std::string>& args) {
    const Command* command = registry_.find(name);
    if (command == nullptr) {
        err_ << "Unknown command: " << name << "\n";
        return exit_code::kUnknownCommand;
    }
    LOG_HAL_DEBUG("script runs '%s' with %zu argument(s)", command->name.c_str(), args.size());
    return run_command(registry_, driver_, *command, args, out_, err_, verbose_);
}

int LuaEngine::lua_exec(lua_State* L) {
    LuaEngine& engine = self(L);
    const std::string name = luaL_checkstring(L, 1);
    std::vector<std::string> args;
    for (int i = 2; i <= lua_gettop(L); ++i) {
        if (!lua_isnil(L, i)) {
            args.push_back(scalar(L, i, "exec argument"));
        }
    }
    lua_pushinteger(L, engine.invoke_command(name, args));
    return 1;
}

int LuaEngine::lua_command(lua_State* L) {
    LuaEngine& engine = self(L);
    const auto* command = static_cast<const Command*>(lua_touserdata(L, lua_upvalueindex(2)));
    if (command == nullptr) {
        return luaL_error(L, "command binding lost its command");
    }

    CommandCall call(*command);
    int first_positional = 1;
    if (lua_istable(L, 1)) {
        call.read_table(L, 1);
        first_positional = 2;
    }
    for (int i = first_positional; i <= lua_gettop(L); ++i) {
        call.add_positional(L, i);
    }
    if (call.missing_force()) {
        return luaL_error(L, "'%s' reconfigures every pin; pass force = true", command->name.c_str());
    }

    const int status = engine.invoke_command(command->name, call.tokens());
    if (status == exit_code::kOk) {
        lua_pushboolean(L, 1);
        return 1;
    }
    if (!call.allow_failure()) {
        return luaL_error(L, "'%s' exited with status %d", command->name.c_str(), status);
    }
    lua_pushboolean(L, 0);
    lua_pushinteger(L, status);
    return 2;
}

int LuaEngine::lua_start_session(lua_State* L) {
    LuaEngine& engine = self(L);
    std::string failure;
    try {
        engine.driver_.require_gpio();
    } catch (const std::exception& ex) {
        failure = ex.what();
    }
    if (!failure.empty()) {
        return luaL_error(L, "cannot open the GPIO peripheral: %s", failure.c_str());
    }
    lua_pushboolean(L, 1);
    return 1;
}

int LuaEngine::lua_shutdown(lua_State* L) {
    self(L).driver_.shutdown();
    return 0;
}

int LuaEngine::lua_is_active(lua_State* L) {
    lua_pushboolean(L, self(L).driver_.session_active() ? 1 : 0);
    return 1;
}

int LuaEngine::lua_with_session(lua_State* L) {
    LuaEngine& engine = self(L);
    luaL_checktype(L, 1, LUA_TFUNCTION);
    lua_settop(L, 1);

    const bool opened_here = !engine.driver_.session_active();
    std::string failure;
    try {
        engine.driver_.require_gpio();
    } catch (const std::exception& ex) {
        failure = ex.what();
    }
    if (!failure.empty()) {
        return luaL_error(L, "cannot open the GPIO peripheral: %s", failure.c_str());
    }

    lua_getglobal(L, "commands");
    lua_getglobal(L, "pinworks");
    const int status = lua_pcall(L, 2, LUA_MULTRET, 0);
    if (opened_here) {
        engine.driver_.shutdown();
    }
    if (status != LUA_OK) {
        return lua_error(L);
    }
    return lua_gettop(L);
}

int LuaEngine::lua_board(lua_State* L) {
    LuaEngine& engine = self(L);
    const gpio::BoardConfig& board = engine.driver_.board();
    lua_createtable(L, 0, 4);
    lua_pushlstring(L, board.name.data(), board.name.size());
    lua_setfield(L, -2, "name");
    lua_pushnumber(L, static_cast<lua_Number>(board.peripheral_base));
    lua_setfield(L, -2, "peripheral_base");
    lua_pushinteger(L, static_cast<lua_Integer>(board.pin_count));
    lua_setfield(L, -2, "pin_count");
    lua_pushboolean(L, engine.driver_.simulated() ? 1 : 0);
    lua_setfield(L, -2, "simulated");
    return 1;
}

int LuaEngine::lua_pins(lua_State* L) {
    LuaEngine& engine = self(L);
    struct Row {
        uint32_t id;
        gpio::Function function;
        bool level;
    };
    std::vector<Row> rows;
    std::string failure;
    try {
        gpio::Gpio& gpio = engine.driver_.require_gpio();
        for (uint32_t id = 0; id < gpio.board().pin_count; ++id) {
            rows.push_back(Row{id, gpio.read_function(id), gpio.read_level(id)});
        }
    } catch (const std::exception& ex) {
        failure = ex.what();
    }
    if (!failure.empty()) {
        return luaL_error(L, "pins() failed: %s", failure.c_str());
    }

    lua_createtable(L, static_cast<int>(rows.size()), 0);
    int index = 1;
    for (const auto& row : rows) {
        lua_createtable(L, 0, 4);
        lua_pushinteger(L, static_cast<lua_Integer>(row.id));
        lua_setfield(L, -2, "id");
        lua_pushinteger(L, static_cast<lua_Integer>(gpio::bank_index(gpio::bank_of(row.id))));
        lua_setfield(L, -2, "bank");
        lua_pushstring(L, gpio::to_string(row.function));
        lua_setfield(L, -2, "func");
        lua_pushinteger(L, row.level ? 1 : 0);
        lua_setfield(L, -2, "level");
        lua_rawseti(L, -2, index++);
    }
    return 1;
}

int LuaEngine::lua_level(lua_State* L) {
    LuaEngine& engine = self(L);
    const uint32_t id = pin_id(L, 1);
    bool high = false;
    std::string failure;
    try {
        high = engine.driver_.require_gpio().read_level(id);
    } catch (const std::exception& ex) {
        failure = ex.what();
    }
    if (!failure.empty()) {
        return luaL_error(L, "level(%d) failed: %s", static_cast<int>(id), failure.c_str());
    }
    lua_pushinteger(L, high ? 1 : 0);
    return 1;
}

int LuaEngine::lua_wait(lua_State* L) {
    LuaEngine& engine = self(L);
    const uint32_t id = pin_id(L, 1);
    const char* event_text = luaL_optstring(L, 2, "both");
    const lua_Integer timeout_ms = luaL_optinteger(L, 3, 0);
    const auto event = gpio::parse_event(event_text);
    if (!event) {
        return luaL_error(L, "unknown event '%s'", event_text);
    }
    if (timeout_ms < 0) {
        return luaL_error(L, "timeout must not be negative");
    }

    // Shared so a callback left behind by a busy unregister never points into this frame.
    auto fired = std::make_shared<bool>(false);
    bool registered = false;
    std::string failure;
    try {
        gpio::Gpio& gpio = engine.driver_.require_gpio();
        gpio::PollingIrqController& irq = engine.driver_.require_irq();
        ClaimedPin pin(gpio, id);
        pin->to_input();
        registered = gpio.register_oneshot(*pin, *event, [fired]() { *fired = true; });
        if (registered) {
            const uint64_t timeout_ns = static_cast<uint64_t>(timeout_ms) * 1'000'000ULL;
            const uint64_t start = get_timestamp_ns();
            while (!*fired) {
                uint64_t remaining = 0;
                if (timeout_ns != 0) {
                    const uint64_t elapsed = elapsed_since_ns(start);
                    if (elapsed >= timeout_ns) {
                        break;
                    }
                    remaining = timeout_ns - elapsed;
                }
                irq.wait(gpio, remaining);
            }
            if (!gpio.unregister(*pin)) {
                LOG_HAL_WARN("GPIO %u: event bank busy, one-shot left registered", id);
            }
        }
    } catch (const std::exception& ex) {
        failure = ex.what();
    }
    if (!failure.empty()) {
        return luaL_error(L, "wait(%d) failed: %s", static_cast<int>(id), failure.c_str());
    }
    if (!registered) {
        return luaL_error(L, "wait(%d): event bank busy", static_cast<int>(id));
    }
    lua_pushboolean(L, *fired ? 1 : 0);
    return 1;
}

int LuaEngine::lua_sleep_ms(lua_State* L) {
    const lua_Integer ms = luaL_checkinteger(L, 1);
    if (ms > 0) {
        sleep_ns(static_cast<uint64_t>(ms) * 1'000'000ULL);
    }
    return 0;
}

} // namespace pinworks::scripting

#endif // PINWORKS_WITH_LUAJIT
