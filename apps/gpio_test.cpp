#include "gpio/bcm2835_registers.hpp"
#include "gpio/error.hpp"
#include "gpio/peripheral.hpp"

#include <cstdlib>
#include <iostream>
#include <limits>
#include <string>
#include <vector>

// Interactive wiring check: drives each listed pin high and low, waiting for
// the operator between steps. Pins default to the 40-pin header's GPIO lines.

static void wait_for_enter() {
    std::cout << "Press Enter to continue...";
    std::cout.flush();
    std::cin.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
}

int main(int argc, char** argv) {
    std::vector<uint32_t> pins;
    for (int i = 1; i < argc; ++i) {
        char* end = nullptr;
        const unsigned long value = std::strtoul(argv[i], &end, 10);
        if (end == argv[i] || *end != '\0') {
            std::cerr << "Invalid pin '" << argv[i] << "'" << std::endl;
            return 1;
        }
        pins.push_back(static_cast<uint32_t>(value));
    }
    if (pins.empty()) {
        pins = {4, 5, 6, 12, 13, 16, 17, 18, 19, 20, 21, 22, 23, 24, 25, 26, 27};
    }

    std::cout << "GPIO test program is running." << std::endl;
    wait_for_enter();

    try {
        const gpio::BoardConfig board = gpio::board_from_environment();
        gpio::Bcm2835RegisterBlock registers(board);
        gpio::Gpio peripheral(registers, board);

        for (uint32_t id : pins) {
            std::cout << std::endl << "Testing GPIO " << id << std::endl;
            gpio::Pin pin = peripheral.acquire_pin(id);
            pin.to_output().disable_pull();
            pin.set_low();

            std::cout << "Pin is OFF. ";
            wait_for_enter();

            std::cout << "Turning pin ON." << std::endl;
            pin.set_high();

            std::cout << "Pin is ON. ";
            wait_for_enter();

            std::cout << "Turning pin OFF." << std::endl;
            pin.set_low();
            pin.to_input();
            peripheral.release_pin(std::move(pin));
        }
    } catch (const gpio::GpioError& ex) {
        std::cerr << "GPIO error (" << gpio::to_string(ex.code()) << "): " << ex.what() << std::endl;
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << ex.what() << std::endl;
        return 1;
    }

    std::cout << std::endl << "GPIO test complete." << std::endl;
    return 0;
}
