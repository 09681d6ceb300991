// Owner of the GPIO peripheral: pin registry, event banks and interrupt routing
#ifndef GPIO_PERIPHERAL_HPP
#define GPIO_PERIPHERAL_HPP

#include <stdint.h>
#include "board_config.hpp"
#include "gpio/event_bank.hpp"
#include "gpio/irq.hpp"
#include "gpio/pin.hpp"
#include "gpio/pin_registry.hpp"
#include "gpio/registers.hpp"

namespace gpio {

// Scoped ownership of the GPIO block. At most one instance lives in the
// process at a time; a second construction throws
// GpioError(AlreadyInstantiated) until the first is destroyed.
//
// The register block and the interrupt controller are borrowed and must
// outlive the instance.
class Gpio {
public:
    explicit Gpio(RegisterBlock& block, const BoardConfig& board = default_board(),
                  IrqController* irq = nullptr);
    ~Gpio() = default;

    Gpio(const Gpio&) = delete;
    Gpio& operator=(const Gpio&) = delete;
    Gpio(Gpio&&) = delete;
    Gpio& operator=(Gpio&&) = delete;

    // Claims the pin; the handle starts with function and pull Unknown.
    Pin acquire_pin(uint32_t id);
    // Returns the pin to the registry. Registers keep their current values.
    // A handle from an earlier claim of the id throws GpioError(PinNotInUse).
    void release_pin(Pin&& pin);
    bool pin_in_use(uint32_t id) const noexcept { return registry_.in_use(id); }
    bool holds(const Pin& pin) const noexcept { return registry_.holds(pin.id(), pin.claim()); }

    // The pin must be claimed and in Input mode. Returns false when the bank
    // was busy and nothing was stored.
    bool register_recurring(const Pin& pin, Event event, Callback callback);
    bool register_oneshot(const Pin& pin, Event event, Callback callback);
    bool unregister(const Pin& pin);

    // Entry point for a bank's interrupt line.
    uint32_t handle_interrupt(Bank bank);

    // Installs the controller and enables the lines already in use.
    void set_irq_controller(IrqController* irq);

    // Raw state of any pin in range, claimed or not.
    Function read_function(uint32_t id) const;
    bool read_level(uint32_t id) const;

    EventBank& events(Bank bank) noexcept;
    const BoardConfig& board() const noexcept { return board_; }
    const RegisterMap& registers() const noexcept { return registers_; }
    const PinRegistry& pins() const noexcept { return registry_; }

    static bool instantiated() noexcept;

private:
    // Holds the process-wide ownership flag for as long as it lives.
    class OwnershipToken {
    public:
        OwnershipToken();
        ~OwnershipToken();
        OwnershipToken(const OwnershipToken&) = delete;
        OwnershipToken& operator=(const OwnershipToken&) = delete;
    };

    EventBank& bank_for(const Pin& pin);
    void require_input(const Pin& pin, const char* operation) const;
    void line_in_use(EventBank& bank);

    OwnershipToken token_;
    BoardConfig board_;
    RegisterMap registers_;
    PinRegistry registry_;
    EventBank bank0_;
    EventBank bank1_;
    IrqController* irq_;
};

} // namespace gpio

#endif // GPIO_PERIPHERAL_HPP
