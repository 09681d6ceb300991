#include "gpio/bcm2835_registers.hpp"
#include "gpio/irq.hpp"
#include "gpio/peripheral.hpp"

#include <cstdlib>
#include <iostream>

// Count presses of a button wired from GPIO 27 (or argv[1]) to ground.
// The first falling edge is reported by a one-shot callback, every edge after
// that by a recurring one.
int main(int argc, char** argv) {
    const uint32_t id = argc > 1 ? static_cast<uint32_t>(std::strtoul(argv[1], nullptr, 10)) : 27;

    gpio::Bcm2835RegisterBlock registers;
    gpio::PollingIrqController irq{gpio::RegisterMap(registers)};
    gpio::Gpio peripheral(registers, gpio::default_board(), &irq);

    gpio::Pin button = peripheral.acquire_pin(id);
    button.to_input().pull_up();

    unsigned presses = 0;
    bool first_seen = false;
    if (!peripheral.register_oneshot(button, gpio::Event::FallingEdge, [&] { first_seen = true; })) {
        std::cerr << "event bank busy" << std::endl;
        return 1;
    }
    irq.wait(peripheral, 0);
    std::cout << "first press" << (first_seen ? "" : " (missed)") << std::endl;

    if (!peripheral.register_recurring(button, gpio::Event::FallingEdge, [&] { ++presses; })) {
        std::cerr << "event bank busy" << std::endl;
        return 1;
    }
    while (presses < 5) {
        if (irq.wait(peripheral, 10000000000ULL) == 0) {
            break;
        }
        std::cout << "press " << presses << std::endl;
    }

    if (!peripheral.unregister(button)) {
        std::cerr << "event bank busy, callbacks left armed" << std::endl;
    }
    return 0;
}
