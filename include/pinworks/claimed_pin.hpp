#ifndef PINWORKS_CLAIMED_PIN_HPP
#define PINWORKS_CLAIMED_PIN_HPP

#include "gpio/peripheral.hpp"
#include "gpio/pin.hpp"

#include <cstdint>
#include <utility>

namespace pinworks {

// Pin claimed for the duration of one command or script call.
class ClaimedPin {
public:
    ClaimedPin(gpio::Gpio& gpio, uint32_t id) : gpio_(gpio), pin_(gpio.acquire_pin(id)) {}
    ~ClaimedPin() {
        if (gpio_.holds(pin_)) {
            gpio_.release_pin(std::move(pin_));
        }
    }

    ClaimedPin(const ClaimedPin&) = delete;
    ClaimedPin& operator=(const ClaimedPin&) = delete;

    gpio::Pin& operator*() noexcept { return pin_; }
    gpio::Pin* operator->() noexcept { return &pin_; }

private:
    gpio::Gpio& gpio_;
    gpio::Pin pin_;
};

} // namespace pinworks

#endif // PINWORKS_CLAIMED_PIN_HPP
