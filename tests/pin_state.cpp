#include "gpio/error.hpp"
#include "gpio/memory_registers.hpp"
#include "gpio/pin.hpp"

#include <cassert>
#include <utility>

using namespace gpio;

namespace {
template <typename Fn>
ErrorCode expect_error(Fn&& fn) {
    try {
        fn();
    } catch (const GpioError& ex) {
        return ex.code();
    }
    assert(false && "expected GpioError");
    return ErrorCode::InvalidPinId;
}

void function_transitions() {
    SimulatedGpioBlock block;
    Pin pin(17, RegisterMap(block));
    assert(pin.function() == Function::Unknown);
    assert(pin.pull() == Pull::Unknown);
    assert(pin.bank() == Bank::Bank0);

    pin.to_output();
    assert(pin.function() == Function::Output);
    assert(block.peek(reg::GPFSEL0 + 4) == (0b001u << 21));

    pin.to_alt_function(4);
    assert(pin.function() == Function::Alt4);
    assert(block.peek(reg::GPFSEL0 + 4) == (0b011u << 21));

    pin.to_input();
    assert(block.peek(reg::GPFSEL0 + 4) == 0);

    // Neighbours in the same register are preserved
    block.poke(reg::GPFSEL0 + 16, 0x3FFFFFFFu);
    Pin high(45, RegisterMap(block));
    high.to_output();
    assert(block.peek(reg::GPFSEL0 + 16) == ((0x3FFFFFFFu & ~(0x7u << 15)) | (0x1u << 15)));
    assert(high.bank() == Bank::Bank1);
}

void unsupported_alt_function_writes_nothing() {
    MemoryRegisterBlock block;
    Pin pin(4, RegisterMap(block));
    assert(expect_error([&] { pin.to_alt_function(6); }) == ErrorCode::UnsupportedAltFunction);
    assert(block.writes().empty());
    assert(block.read_count() == 0);
    assert(pin.function() == Function::Unknown);
}

void pull_handshake_sequence() {
    MemoryRegisterBlock block;
    Pin pin(40, RegisterMap(block));
    pin.pull_up();
    assert(pin.pull() == Pull::PullUp);

    const auto& writes = block.writes();
    assert(writes.size() == 4);
    assert(writes[0].offset == reg::GPPUD && writes[0].value == static_cast<uint32_t>(PullCode::PullUp));
    assert(writes[1].offset == reg::GPPUDCLK1 && writes[1].value == (1u << 8));
    assert(writes[2].offset == reg::GPPUD && writes[2].value == 0);
    assert(writes[3].offset == reg::GPPUDCLK1 && writes[3].value == (1u << 8));

    block.clear_log();
    Pin low(3, RegisterMap(block));
    low.pull_down();
    assert(block.writes().size() == 4);
    assert(block.writes()[0].value == static_cast<uint32_t>(PullCode::PullDown));
    assert(block.writes()[1].offset == reg::GPPUDCLK0 && block.writes()[1].value == (1u << 3));

    block.clear_log();
    low.disable_pull();
    assert(block.writes()[0].value == static_cast<uint32_t>(PullCode::Disabled));
    assert(low.pull() == Pull::Disabled);
}

void output_operations() {
    SimulatedGpioBlock block;
    Pin pin(22, RegisterMap(block));
    pin.to_output();

    pin.set_high();
    assert(block.writes_to(reg::GPSET0).back().value == (1u << 22));
    assert(block.level_of(22));
    pin.set_low();
    assert(block.writes_to(reg::GPCLR0).back().value == (1u << 22));
    assert(!block.level_of(22));

    pin.toggle();
    assert(block.level_of(22));
    pin.toggle();
    assert(!block.level_of(22));

    Pin upper(50, RegisterMap(block));
    upper.to_output().set_high();
    assert(block.writes_to(reg::GPSET1).back().value == (1u << 18));
    assert(block.level_of(50));
}

void state_mismatch_touches_nothing() {
    MemoryRegisterBlock block;
    Pin pin(9, RegisterMap(block));

    // Unknown state: neither direction is allowed
    assert(expect_error([&] { pin.set_high(); }) == ErrorCode::PinStateMismatch);
    assert(expect_error([&] { (void)pin.is_high(); }) == ErrorCode::PinStateMismatch);

    pin.to_input();
    block.clear_log();
    assert(expect_error([&] { pin.set_low(); }) == ErrorCode::PinStateMismatch);
    assert(expect_error([&] { pin.toggle(); }) == ErrorCode::PinStateMismatch);
    assert(block.writes().empty());
    assert(block.read_count() == 0);

    pin.to_output();
    block.clear_log();
    assert(expect_error([&] { (void)pin.is_high(); }) == ErrorCode::PinStateMismatch);
    assert(block.read_count() == 0);
}

void input_level() {
    SimulatedGpioBlock block;
    Pin pin(33, RegisterMap(block));
    pin.to_input().pull_down();
    assert(!pin.is_high());
    block.drive_input(33, true);
    assert(pin.is_high());
}

void move_only_handle() {
    MemoryRegisterBlock block;
    Pin pin(5, RegisterMap(block));
    pin.to_output();
    Pin moved = std::move(pin);
    assert(moved.id() == 5);
    assert(moved.function() == Function::Output);
}
}

int main() {
    function_transitions();
    unsupported_alt_function_writes_nothing();
    pull_handshake_sequence();
    output_operations();
    state_mismatch_touches_nothing();
    input_level();
    move_only_handle();
    return 0;
}
