#include "gpio/pin.hpp"
#include "gpio/error.hpp"
#include "logging.hpp"
#include "timing.hpp"

#include <string>

namespace gpio {

namespace {
constexpr Function kAltFunctions[] = {
    Function::Alt0, Function::Alt1, Function::Alt2,
    Function::Alt3, Function::Alt4, Function::Alt5,
};
}

Pin::Pin(uint32_t id, RegisterMap registers, uint32_t claim) noexcept
    : id_(id), registers_(registers), claim_(claim) {}

Pin& Pin::to_input() {
    select(Function::Input);
    return *this;
}

Pin& Pin::to_output() {
    select(Function::Output);
    return *this;
}

Pin& Pin::to_alt_function(uint32_t n) {
    if (n > kMaxAltFunction) {
        throw GpioError(ErrorCode::UnsupportedAltFunction,
                        "GPIO " + std::to_string(id_) + ": alternate function " + std::to_string(n) +
                            " does not exist (0.." + std::to_string(kMaxAltFunction) + ")");
    }
    select(kAltFunctions[n]);
    return *this;
}

Pin& Pin::disable_pull() {
    apply_pull(Pull::Disabled, PullCode::Disabled);
    return *this;
}

Pin& Pin::pull_up() {
    apply_pull(Pull::PullUp, PullCode::PullUp);
    return *this;
}

Pin& Pin::pull_down() {
    apply_pull(Pull::PullDown, PullCode::PullDown);
    return *this;
}

void Pin::set_high() const {
    require_function(Function::Output, "set_high");
    registers_.output_set(bank()).set(pin_mask(id_));
}

void Pin::set_low() const {
    require_function(Function::Output, "set_low");
    registers_.output_clear(bank()).set(pin_mask(id_));
}

void Pin::toggle() const {
    require_function(Function::Output, "toggle");
    if (registers_.level(bank()).get() & pin_mask(id_)) {
        set_low();
    } else {
        set_high();
    }
}

bool Pin::is_high() const {
    require_function(Function::Input, "is_high");
    return (registers_.level(bank()).get() & pin_mask(id_)) != 0;
}

void Pin::select(Function function) {
    registers_.function_select(id_ / 10)
        .modify(function_field(id_), static_cast<uint32_t>(encode(function)));
    function_ = function;
    LOG_GPIO_DEBUG("GPIO %u -> %s", id_, to_string(function));
}

// GPPUD/GPPUDCLK handshake: latch the control value into the pin, then
// remove both the control value and the clock.
void Pin::apply_pull(Pull pull, PullCode code) {
    const ReadWrite control = registers_.pull_control();
    const ReadWrite clock = registers_.pull_clock(bank());

    control.modify(kPullControlField, static_cast<uint32_t>(code));
    busy_wait_cycles(kPullSettleCycles);
    clock.set(pin_mask(id_));
    busy_wait_cycles(kPullSettleCycles);
    control.set(0);
    clock.set(pin_mask(id_));

    pull_ = pull;
    LOG_GPIO_DEBUG("GPIO %u pull %s", id_, to_string(pull));
}

void Pin::require_function(Function expected, const char* operation) const {
    if (function_ != expected) {
        throw GpioError(ErrorCode::PinStateMismatch,
                        std::string(operation) + " needs GPIO " + std::to_string(id_) + " in " +
                            to_string(expected) + " mode, it is " + to_string(function_));
    }
}

} // namespace gpio
