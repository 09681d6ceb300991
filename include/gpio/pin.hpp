// A claimed GPIO pin and its function/pull state
#ifndef GPIO_PIN_HPP
#define GPIO_PIN_HPP

#include <stdint.h>
#include "gpio/registers.hpp"
#include "gpio/types.hpp"

namespace gpio {

// Busy-wait between the steps of the pull-up/down handshake.
constexpr uint32_t kPullSettleCycles = 150;

// Handle for one claimed pin. The handle tracks the function and pull it last
// configured; the registers remain the source of truth for the hardware.
//
// Output operations are valid only in Output state and input operations only
// in Input state. A call in the wrong state throws GpioError(PinStateMismatch)
// before any register is touched.
class Pin {
public:
    // claim is the registry stamp of the claim this handle came from, 0 for none.
    Pin(uint32_t id, RegisterMap registers, uint32_t claim = 0) noexcept;

    Pin(const Pin&) = delete;
    Pin& operator=(const Pin&) = delete;
    Pin(Pin&&) noexcept = default;
    Pin& operator=(Pin&&) noexcept = default;

    uint32_t id() const noexcept { return id_; }
    uint32_t claim() const noexcept { return claim_; }
    Function function() const noexcept { return function_; }
    Pull pull() const noexcept { return pull_; }
    Bank bank() const noexcept { return bank_of(id_); }

    Pin& to_input();
    Pin& to_output();
    // n in 0..5; anything else throws GpioError(UnsupportedAltFunction) without a write.
    Pin& to_alt_function(uint32_t n);

    Pin& disable_pull();
    Pin& pull_up();
    Pin& pull_down();

    void set_high() const;
    void set_low() const;
    void toggle() const;

    bool is_high() const;

private:
    void select(Function function);
    void apply_pull(Pull pull, PullCode code);
    void require_function(Function expected, const char* operation) const;

    uint32_t id_;
    RegisterMap registers_;
    uint32_t claim_;
    Function function_ = Function::Unknown;
    Pull pull_ = Pull::Unknown;
};

} // namespace gpio

#endif // GPIO_PIN_HPP
