#include "pinworks/commands/gpio.hpp"
#include "pinworks/claimed_pin.hpp"
#include "pinworks/command_context.hpp"
#include "pinworks/driver_context.hpp"
#include "gpio/error.hpp"
#include "gpio/event_bank.hpp"
#include "gpio/peripheral.hpp"
#include "gpio/pin.hpp"
#include "timing.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <iomanip>
#include <memory>
#include <ostream>
#include <initializer_list>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace pinworks::commands {
namespace {

uint32_t pin_argument(const CommandContext& context) {
    return context.arguments.positional_as_uint(0, "pin");
}

gpio::Pull require_pull(const std::string& text) {
    auto pull = gpio::parse_pull(text);
    if (!pull) {
        throw std::invalid_argument("Unknown pull state '" + text + "' (expected up, down or off)");
    }
    return *pull;
}

void apply_pull(gpio::Pin& pin, gpio::Pull pull) {
    switch (pull) {
    case gpio::Pull::PullUp: pin.pull_up(); break;
    case gpio::Pull::PullDown: pin.pull_down(); break;
    case gpio::Pull::Disabled: pin.disable_pull(); break;
    case gpio::Pull::Unknown: break;
    }
}

void apply_function(gpio::Pin& pin, gpio::Function function) {
    switch (function) {
    case gpio::Function::Input: pin.to_input(); break;
    case gpio::Function::Output: pin.to_output(); break;
    case gpio::Function::Alt0: pin.to_alt_function(0); break;
    case gpio::Function::Alt1: pin.to_alt_function(1); break;
    case gpio::Function::Alt2: pin.to_alt_function(2); break;
    case gpio::Function::Alt3: pin.to_alt_function(3); break;
    case gpio::Function::Alt4: pin.to_alt_function(4); break;
    case gpio::Function::Alt5: pin.to_alt_function(5); break;
    case gpio::Function::Unknown:
        throw std::invalid_argument("Function 'unknown' cannot be selected");
    }
}

std::optional<bool> parse_level(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (text == "1" || text == "high" || text == "on") return true;
    if (text == "0" || text == "low" || text == "off") return false;
    return std::nullopt;
}

int pins_command(const CommandContext& context) {
    gpio::Gpio& gpio = context.driver.require_gpio();
    const uint32_t pin_count = gpio.board().pin_count;

    uint32_t first = 0;
    uint32_t last = pin_count;
    if (auto bank_text = context.arguments.value("bank")) {
        const uint64_t bank = parse_unsigned(*bank_text, "Option '--bank'");
        if (bank >= gpio::kBankCount) {
            throw std::invalid_argument("Option '--bank' expects 0 or 1");
        }
        first = static_cast<uint32_t>(bank) * gpio::kPinsPerBank;
        last = std::min(pin_count, first + gpio::kPinsPerBank);
    }

    context.out << "Board: " << gpio.board().name << " (" << pin_count << " pins)\n";
    context.out << std::left << std::setw(6) << "GPIO" << std::setw(8) << "BANK"
                << std::setw(10) << "FUNCTION" << "LEVEL" << "\n";
    for (uint32_t id = first; id < last; ++id) {
        context.out << std::setw(6) << id << std::setw(8) << gpio::to_string(gpio::bank_of(id))
                    << std::setw(10) << gpio::to_string(gpio.read_function(id))
                    << (gpio.read_level(id) ? 1 : 0) << "\n";
    }
    context.out << std::right;
    return 0;
}

int mode_command(const CommandContext& context) {
    const uint32_t id = pin_argument(context);
    const std::string& text = context.arguments.positional(1);
    auto function = gpio::parse_function(text);
    if (!function) {
        if (text.size() > 3 && text.rfind("alt", 0) == 0) {
            // Let the pin report alternate functions it does not have.
            const uint64_t n = parse_unsigned(text.substr(3), "alternate function");
            ClaimedPin pin(context.driver.require_gpio(), id);
            pin->to_alt_function(static_cast<uint32_t>(std::min<uint64_t>(n, UINT32_MAX)));
        }
        throw std::invalid_argument("Unknown function '" + text + "' (expected input, output or alt0..alt5)");
    }

    ClaimedPin pin(context.driver.require_gpio(), id);
    apply_function(*pin, *function);
    context.out << "GPIO " << id << " -> " << gpio::to_string(pin->function()) << "\n";
    return 0;
}

int pull_command(const CommandContext& context) {
    const uint32_t id = pin_argument(context);
    const gpio::Pull pull = require_pull(context.arguments.positional(1));

    ClaimedPin pin(context.driver.require_gpio(), id);
    apply_pull(*pin, pull);
    context.out << "GPIO " << id << " pull " << gpio::to_string(pin->pull()) << "\n";
    return 0;
}

int read_command(const CommandContext& context) {
    const uint32_t id = pin_argument(context);
    ClaimedPin pin(context.driver.require_gpio(), id);
    pin->to_input();
    if (auto pull = context.arguments.value("pull")) {
        apply_pull(*pin, require_pull(*pull));
    }
    const bool high = pin->is_high();
    if (context.verbose) {
        context.out << "GPIO " << id << ": " << (high ? "high" : "low") << "\n";
    } else {
        context.out << (high ? 1 : 0) << "\n";
    }
    return 0;
}

int write_command(const CommandContext& context) {
    const uint32_t id = pin_argument(context);
    const std::string& text = context.arguments.positional(1);
    const auto level = parse_level(text);
    if (!level) {
        throw std::invalid_argument("Unknown level '" + text + "' (expected 0, 1, low or high)");
    }

    ClaimedPin pin(context.driver.require_gpio(), id);
    pin->to_output();
    if (*level) {
        pin->set_high();
    } else {
        pin->set_low();
    }
    if (context.verbose) {
        context.out << "GPIO " << id << " driven " << (*level ? "high" : "low") << "\n";
    }
    return 0;
}

int toggle_command(const CommandContext& context) {
    const uint32_t id = pin_argument(context);
    gpio::Gpio& gpio = context.driver.require_gpio();
    if (gpio.read_function(id) != gpio::Function::Output) {
        context.err << "GPIO " << id << " is configured as " << gpio::to_string(gpio.read_function(id))
                    << "; use 'write' to make it an output first.\n";
        return 1;
    }

    ClaimedPin pin(gpio, id);
    pin->to_output();
    pin->toggle();
    context.out << "GPIO " << id << " -> " << (gpio.read_level(id) ? 1 : 0) << "\n";
    return 0;
}

// State shared with the watch callback. The callback may outlive the command
// when the bank stays busy; once detached it returns without touching anything.
struct WatchSink {
    std::ostream* out;
    gpio::Gpio* gpio;
    uint32_t id;
    gpio::Event event;
    uint64_t seen = 0;
    bool attached = true;
};

constexpr int kUnregisterAttempts = 3;
constexpr uint64_t kUnregisterRetryNs = 1'000'000;

// Unregisters the watched pin on every exit path and detaches the sink.
class WatchRegistration {
public:
    WatchRegistration(gpio::Gpio& gpio, const gpio::Pin& pin, std::shared_ptr<WatchSink> sink, std::ostream& err)
        : gpio_(gpio), pin_(pin), sink_(std::move(sink)), err_(err) {}
    ~WatchRegistration() { remove(); }

    WatchRegistration(const WatchRegistration&) = delete;
    WatchRegistration& operator=(const WatchRegistration&) = delete;

    void remove() {
        if (!sink_->attached) {
            return;
        }
        sink_->attached = false;
        for (int attempt = 0; attempt < kUnregisterAttempts; ++attempt) {
            if (gpio_.unregister(pin_)) {
                return;
            }
            sleep_ns(kUnregisterRetryNs);
        }
        err_ << "Event bank busy; callbacks for GPIO " << pin_.id() << " left registered but detached.\n";
    }

private:
    gpio::Gpio& gpio_;
    const gpio::Pin& pin_;
    std::shared_ptr<WatchSink> sink_;
    std::ostream& err_;
};

int watch_command(const CommandContext& context) {
    const uint32_t id = pin_argument(context);
    const std::string event_text = context.arguments.value_or("event", "both");
    const auto event = gpio::parse_event(event_text);
    if (!event) {
        throw std::invalid_argument("Unknown event '" + event_text + "'");
    }
    const uint64_t count = context.arguments.value_as_uint("count", 1);
    if (count == 0) {
        throw std::invalid_argument("Option '--count' must be at least 1");
    }
    const uint64_t timeout_ns = context.arguments.value_as_uint("timeout-ms", 0) * 1'000'000ULL;
    const bool oneshot = context.arguments.has("oneshot");

    gpio::Gpio& gpio = context.driver.require_gpio();
    gpio::PollingIrqController& irq = context.driver.require_irq();

    ClaimedPin pin(gpio, id);
    pin->to_input();
    if (auto pull = context.arguments.value("pull")) {
        apply_pull(*pin, require_pull(*pull));
    }

    auto sink = std::make_shared<WatchSink>(WatchSink{&context.out, &gpio, id, *event});
    auto on_event = [sink]() {
        if (!sink->attached) {
            return;
        }
        ++sink->seen;
        *sink->out << "GPIO " << sink->id << " " << gpio::to_string(sink->event) << " #" << sink->seen
                   << " level=" << (sink->gpio->read_level(sink->id) ? 1 : 0) << std::endl;
    };
    WatchRegistration registration(gpio, *pin, sink, context.err);

    gpio::EventBank& bank = gpio.events(pin->bank());
    const uint32_t slot = gpio::slot_of(id);
    if (!oneshot && !gpio.register_recurring(*pin, *event, on_event)) {
        context.err << "Event bank busy; callback not registered.\n";
        return 1;
    }

    const uint64_t start = get_timestamp_ns();
    bool timed_out = false;
    while (sink->seen < count) {
        if (oneshot && bank.state(slot) == gpio::SlotState::Empty &&
            !gpio.register_oneshot(*pin, *event, on_event)) {
            context.err << "Event bank busy; callback not registered.\n";
            break;
        }
        uint64_t remaining = 0;
        if (timeout_ns != 0) {
            const uint64_t elapsed = elapsed_since_ns(start);
            if (elapsed >= timeout_ns) {
                timed_out = true;
                break;
            }
            remaining = timeout_ns - elapsed;
        }
        if (irq.wait(gpio, remaining) == 0 && timeout_ns != 0) {
            timed_out = true;
            break;
        }
    }
    const uint64_t seen = sink->seen;
    registration.remove();

    if (context.verbose || timed_out) {
        context.out << seen << " event(s) on GPIO " << id << "\n";
    }
    if (seen < count) {
        if (timed_out) {
            context.err << "Timed out waiting for " << event_text << " on GPIO " << id << ".\n";
        }
        return 1;
    }
    return 0;
}

int reset_command(const CommandContext& context) {
    gpio::Gpio& gpio = context.driver.require_gpio();
    const gpio::RegisterMap& registers = gpio.registers();

    for (gpio::Bank bank : {gpio::Bank::Bank0, gpio::Bank::Bank1}) {
        for (gpio::DetectKind kind : gpio::kAllDetectKinds) {
            registers.detect_enable(kind, bank).set(0);
        }
        registers.event_status(bank).set(0xFFFFFFFFu);
    }

    uint32_t reset = 0;
    for (uint32_t id = 0; id < gpio.board().pin_count; ++id) {
        if (gpio.pin_in_use(id)) {
            continue;
        }
        ClaimedPin pin(gpio, id);
        pin->to_input().disable_pull();
        ++reset;
    }
    context.out << "Reset " << reset << " pin(s) to input with pull disabled; event detection cleared.\n";
    return 0;
}

} // namespace

void register_gpio_commands(CommandRegistry& registry) {
    registry.register_command({
        .name = "pins",
        .aliases = {"ls"},
        .category = "gpio",
        .summary = "List the function and level of every pin.",
        .description = "Reads the function select and level registers without claiming any pin.",
        .usage = "pinworks pins [--bank <0|1>]",
        .options = {
            OptionSpec{"bank", 'b', true, false, false, "n", "Only list pins of interrupt bank 0 or 1."}
        },
        .min_positionals = 0,
        .max_positionals = 0,
        .safety = CommandSafety::Safe,
        .access = CommandAccess::Peripheral,
        .handler = pins_command,
    });

    registry.register_command({
        .name = "mode",
        .aliases = {"fsel"},
        .category = "gpio",
        .summary = "Select the function of a pin.",
        .description = "Writes the 3-bit function select field: input, output or alt0..alt5.",
        .usage = "pinworks mode <pin> <input|output|alt0..alt5>",
        .options = {},
        .min_positionals = 2,
        .max_positionals = 2,
        .safety = CommandSafety::Safe,
        .access = CommandAccess::Peripheral,
        .handler = mode_command,
    });

    registry.register_command({
        .name = "pull",
        .aliases = {"pud"},
        .category = "gpio",
        .summary = "Configure the pull-up/down resistor of a pin.",
        .description = "Runs the GPPUD/GPPUDCLK handshake to latch the requested pull state.",
        .usage = "pinworks pull <pin> <up|down|off>",
        .options = {},
        .min_positionals = 2,
        .max_positionals = 2,
        .safety = CommandSafety::Safe,
        .access = CommandAccess::Peripheral,
        .handler = pull_command,
    });

    registry.register_command({
        .name = "read",
        .aliases = {"get"},
        .category = "gpio",
        .summary = "Switch a pin to input and print its level.",
        .description = "Prints 1 or 0; with --verbose prints high or low.",
        .usage = "pinworks read <pin> [--pull <up|down|off>]",
        .options = {
            OptionSpec{"pull", 'p', true, false, false, "state", "Configure the pull resistor before reading."}
        },
        .min_positionals = 1,
        .max_positionals = 1,
        .safety = CommandSafety::Safe,
        .access = CommandAccess::Peripheral,
        .handler = read_command,
    });

    registry.register_command({
        .name = "write",
        .aliases = {"set"},
        .category = "gpio",
        .summary = "Switch a pin to output and drive it.",
        .description = "Accepts 1/high/on or 0/low/off.",
        .usage = "pinworks write <pin> <0|1|low|high>",
        .options = {},
        .min_positionals = 2,
        .max_positionals = 2,
        .safety = CommandSafety::Safe,
        .access = CommandAccess::Peripheral,
        .handler = write_command,
    });

    registry.register_command({
        .name = "toggle",
        .aliases = {},
        .category = "gpio",
        .summary = "Invert the level of an output pin.",
        .description = "Fails when the pin is not already configured as an output.",
        .usage = "pinworks toggle <pin>",
        .options = {},
        .min_positionals = 1,
        .max_positionals = 1,
        .safety = CommandSafety::Safe,
        .access = CommandAccess::Peripheral,
        .handler = toggle_command,
    });

    registry.register_command({
        .name = "watch",
        .aliases = {"wait"},
        .category = "gpio",
        .summary = "Wait for edge or level events on an input pin.",
        .description = "Registers an event callback and services the polled interrupt lines until --count "
                       "events were seen or --timeout-ms expired (0 waits forever).",
        .usage = "pinworks watch <pin> [--event <kind>] [--count n] [--timeout-ms t] [--oneshot] [--pull <state>]",
        .options = {
            OptionSpec{"event", 'e', true, false, false, "kind",
                       "rising, falling, both, high, low, async-rising, async-falling or async-both (default both)."},
            OptionSpec{"count", 'n', true, false, false, "n", "Number of events to wait for (default 1)."},
            OptionSpec{"timeout-ms", 't', true, false, false, "ms", "Give up after this many milliseconds."},
            OptionSpec{"oneshot", '\0', false, false, false, "", "Use one-shot callbacks, re-armed after each event."},
            OptionSpec{"pull", 'p', true, false, false, "state", "Configure the pull resistor first."}
        },
        .min_positionals = 1,
        .max_positionals = 1,
        .safety = CommandSafety::Safe,
        .access = CommandAccess::Peripheral,
        .handler = watch_command,
    });

    registry.register_command({
        .name = "reset",
        .aliases = {},
        .category = "gpio",
        .summary = "Return every unclaimed pin to input with pull disabled.",
        .description = "Also clears all detect-enable registers and pending event status.",
        .usage = "pinworks reset --force",
        .options = {},
        .min_positionals = 0,
        .max_positionals = 0,
        .safety = CommandSafety::RequiresForce,
        .access = CommandAccess::Peripheral,
        .handler = reset_command,
    });
}

} // namespace pinworks::commands
