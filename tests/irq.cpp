#include "gpio/irq.hpp"
#include "gpio/memory_registers.hpp"
#include "gpio/peripheral.hpp"
#include "timing.hpp"

#include <cassert>

using namespace gpio;

int main() {
    SimulatedGpioBlock block;
    PollingIrqController irq{RegisterMap(block)};
    assert(!irq.line_enabled(Bank::Bank0));
    assert(!irq.line_enabled(Bank::Bank1));

    Gpio gpio(block, default_board(), &irq);

    // Status bits on a disabled line are not serviced
    block.raise_event(3);
    assert(irq.pending(Bank::Bank0) == 0);
    assert(irq.service(gpio) == 0);

    Pin button = gpio.acquire_pin(3);
    button.to_input().pull_up();
    int presses = 0;
    assert(gpio.register_recurring(button, Event::FallingEdge, [&] { ++presses; }));
    assert(irq.line_enabled(Bank::Bank0));
    assert(!irq.line_enabled(Bank::Bank1));

    // The stale bit from before registration is delivered once, then acknowledged
    assert(irq.pending(Bank::Bank0) == (1u << 3));
    assert(irq.service(gpio) == 1);
    assert(presses == 1);
    assert(irq.pending(Bank::Bank0) == 0);

    block.drive_input(3, true);
    block.drive_input(3, false);
    assert(irq.wait(gpio, 50'000'000, 100'000) == 1);
    assert(presses == 2);

    // Nothing pending: wait gives up after the timeout
    const uint64_t start = get_timestamp_ns();
    assert(irq.wait(gpio, 5'000'000, 500'000) == 0);
    assert(elapsed_since_ns(start) >= 5'000'000);
    assert(presses == 2);

    // Bank1 is routed independently
    Pin upper = gpio.acquire_pin(47);
    upper.to_input();
    int level_events = 0;
    assert(gpio.register_oneshot(upper, Event::High, [&] { ++level_events; }));
    assert(irq.line_enabled(Bank::Bank1));
    block.drive_input(47, true);
    assert(irq.service(gpio) == 1);
    assert(level_events == 1);
    block.drive_input(47, true);
    assert(irq.service(gpio) == 0);

    irq.disable_line(Bank::Bank0);
    block.drive_input(3, true);
    block.drive_input(3, false);
    assert(irq.service(gpio) == 0);
    assert(presses == 2);

    return 0;
}
