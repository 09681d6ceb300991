#include "gpio/pin_registry.hpp"
#include "gpio/error.hpp"
#include "logging.hpp"

#include <stdexcept>
#include <string>

namespace gpio {

PinRegistry::PinRegistry(uint32_t pin_count) : pin_count_(pin_count) {
    if (pin_count_ == 0 || pin_count_ > kMaxPinCount) {
        throw std::invalid_argument("pin count must be within 1.." + std::to_string(kMaxPinCount) +
                                    ", got " + std::to_string(pin_count_));
    }
}

uint32_t PinRegistry::claim(uint32_t id) {
    check_id(id);
    if (stamps_[id] != 0) {
        throw GpioError(ErrorCode::PinInUse, "GPIO " + std::to_string(id) + " is already in use");
    }
    const uint32_t stamp = next_stamp_;
    next_stamp_ = next_stamp_ == UINT32_MAX ? 1 : next_stamp_ + 1;
    stamps_[id] = stamp;
    LOG_GPIO_DEBUG("claimed GPIO %u (claim %u)", id, stamp);
    return stamp;
}

void PinRegistry::release(uint32_t id) {
    check_id(id);
    if (stamps_[id] == 0) {
        throw GpioError(ErrorCode::PinNotInUse, "GPIO " + std::to_string(id) + " is not in use");
    }
    stamps_[id] = 0;
    LOG_GPIO_DEBUG("released GPIO %u", id);
}

bool PinRegistry::in_use(uint32_t id) const noexcept {
    return id < pin_count_ && stamps_[id] != 0;
}

bool PinRegistry::holds(uint32_t id, uint32_t stamp) const noexcept {
    return id < pin_count_ && stamp != 0 && stamps_[id] == stamp;
}

uint32_t PinRegistry::used_count() const noexcept {
    uint32_t count = 0;
    for (uint32_t id = 0; id < pin_count_; ++id) {
        if (stamps_[id] != 0) {
            ++count;
        }
    }
    return count;
}

void PinRegistry::check_id(uint32_t id) const {
    if (id >= pin_count_) {
        throw GpioError(ErrorCode::InvalidPinId, "GPIO " + std::to_string(id) +
                                                     " is outside 0.." + std::to_string(pin_count_ - 1));
    }
}

} // namespace gpio
