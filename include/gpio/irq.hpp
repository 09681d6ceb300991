// Interrupt line control for the two GPIO banks
#ifndef GPIO_IRQ_HPP
#define GPIO_IRQ_HPP

#include <stdint.h>
#include <array>
#include <atomic>
#include <initializer_list>
#include "gpio/registers.hpp"
#include "gpio/types.hpp"

namespace gpio {

class Gpio;

// Outward seam: the peripheral asks for a bank's line once, on the first
// callback registered for that bank.
class IrqController {
public:
    virtual ~IrqController() = default;

    virtual void enable_line(Bank bank) = 0;
};

// Linux user space has no GPIO interrupt lines; this controller stands in for
// them by polling the event status registers and running the dispatcher from
// the calling thread.
class PollingIrqController : public IrqController {
public:
    explicit PollingIrqController(const RegisterMap& registers) noexcept : registers_(registers) {}

    void enable_line(Bank bank) override;
    void disable_line(Bank bank) noexcept;
    bool line_enabled(Bank bank) const noexcept;

    // Event status of an enabled bank; 0 for a disabled one.
    uint32_t pending(Bank bank) const;

    // Dispatches every enabled bank with a pending status. Returns the number
    // of callbacks invoked.
    uint32_t service(Gpio& gpio);

    // Services every interval_ns until at least one callback ran or timeout_ns
    // elapsed. A timeout of 0 waits forever.
    uint32_t wait(Gpio& gpio, uint64_t timeout_ns, uint64_t interval_ns = 1'000'000);

private:
    RegisterMap registers_;
    std::array<std::atomic<bool>, kBankCount> enabled_{};
};

} // namespace gpio

#endif // GPIO_IRQ_HPP
