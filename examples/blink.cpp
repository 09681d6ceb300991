#include "gpio/bcm2835_registers.hpp"
#include "gpio/peripheral.hpp"
#include "timing.hpp"

#include <cstdlib>
#include <iostream>

// Toggle GPIO 17 (or argv[1]) ten times at 2 Hz.
int main(int argc, char** argv) {
    const uint32_t id = argc > 1 ? static_cast<uint32_t>(std::strtoul(argv[1], nullptr, 10)) : 17;

    gpio::Bcm2835RegisterBlock registers;
    gpio::Gpio peripheral(registers);
    gpio::Pin led = peripheral.acquire_pin(id);
    led.to_output().set_low();

    for (int i = 0; i < 20; ++i) {
        led.toggle();
        sleep_ns(250000000ULL);
    }
    led.set_low();
    std::cout << "blinked GPIO " << id << std::endl;
    return 0;
}
