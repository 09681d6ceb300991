// Bookkeeping of which pin ids are claimed
#ifndef GPIO_PIN_REGISTRY_HPP
#define GPIO_PIN_REGISTRY_HPP

#include <stdint.h>
#include <array>
#include "board_config.hpp"

namespace gpio {

// Fixed table of claimed pins. Claiming and releasing never touch registers.
// Every claim gets a fresh non-zero stamp, so a handle from an earlier claim of
// the same id can be told apart from the current one.
class PinRegistry {
public:
    explicit PinRegistry(uint32_t pin_count);

    // Returns the claim stamp. Throws GpioError(InvalidPinId) or GpioError(PinInUse).
    uint32_t claim(uint32_t id);
    // Throws GpioError(InvalidPinId) or GpioError(PinNotInUse).
    void release(uint32_t id);

    bool in_use(uint32_t id) const noexcept;
    // True while the claim that returned stamp is still current.
    bool holds(uint32_t id, uint32_t stamp) const noexcept;
    uint32_t used_count() const noexcept;
    uint32_t pin_count() const noexcept { return pin_count_; }

private:
    void check_id(uint32_t id) const;

    uint32_t pin_count_;
    uint32_t next_stamp_ = 1;
    std::array<uint32_t, kMaxPinCount> stamps_{}; // 0 = free
};

} // namespace gpio

#endif // GPIO_PIN_REGISTRY_HPP
