#include "gpio/peripheral.hpp"
#include "gpio/error.hpp"
#include "logging.hpp"

#include <atomic>
#include <string>
#include <utility>

namespace gpio {

namespace {
std::atomic<bool> g_instantiated{false};

uint32_t bank1_slots(uint32_t pin_count) noexcept {
    return pin_count > kPinsPerBank ? pin_count - kPinsPerBank : 0;
}

uint32_t bank0_slots(uint32_t pin_count) noexcept {
    return pin_count < kPinsPerBank ? pin_count : kPinsPerBank;
}
}

Gpio::OwnershipToken::OwnershipToken() {
    bool expected = false;
    if (!g_instantiated.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
        throw GpioError(ErrorCode::AlreadyInstantiated, "the GPIO peripheral is already owned");
    }
}

Gpio::OwnershipToken::~OwnershipToken() {
    g_instantiated.store(false, std::memory_order_release);
}

Gpio::Gpio(RegisterBlock& block, const BoardConfig& board, IrqController* irq)
    : token_(),
      board_(board),
      registers_(block),
      registry_(board.pin_count),
      bank0_(Bank::Bank0, bank0_slots(board.pin_count)),
      bank1_(Bank::Bank1, bank1_slots(board.pin_count)),
      irq_(irq) {
    LOG_GPIO_INFO("GPIO peripheral acquired (%.*s, %u pins)", static_cast<int>(board_.name.size()),
                  board_.name.data(), board_.pin_count);
}

bool Gpio::instantiated() noexcept {
    return g_instantiated.load(std::memory_order_acquire);
}

Pin Gpio::acquire_pin(uint32_t id) {
    const uint32_t claim = registry_.claim(id);
    return Pin(id, registers_, claim);
}

void Gpio::release_pin(Pin&& pin) {
    Pin released = std::move(pin);
    if (!registry_.holds(released.id(), released.claim())) {
        throw GpioError(ErrorCode::PinNotInUse,
                        "GPIO " + std::to_string(released.id()) + " is not held by this handle");
    }
    registry_.release(released.id());
}

bool Gpio::register_recurring(const Pin& pin, Event event, Callback callback) {
    require_input(pin, "register_recurring");
    EventBank& bank = bank_for(pin);
    if (!gpio::register_recurring(bank, registers_, pin.id(), event, std::move(callback))) {
        return false;
    }
    line_in_use(bank);
    return true;
}

bool Gpio::register_oneshot(const Pin& pin, Event event, Callback callback) {
    require_input(pin, "register_oneshot");
    EventBank& bank = bank_for(pin);
    if (!gpio::register_oneshot(bank, registers_, pin.id(), event, std::move(callback))) {
        return false;
    }
    line_in_use(bank);
    return true;
}

bool Gpio::unregister(const Pin& pin) {
    return gpio::unregister(bank_for(pin), registers_, pin.id());
}

uint32_t Gpio::handle_interrupt(Bank bank) {
    return dispatch(events(bank), registers_);
}

void Gpio::set_irq_controller(IrqController* irq) {
    irq_ = irq;
    if (irq_ == nullptr) {
        return;
    }
    for (EventBank* bank : {&bank0_, &bank1_}) {
        if (bank->line_armed()) {
            irq_->enable_line(bank->id());
        }
    }
}

Function Gpio::read_function(uint32_t id) const {
    if (id >= board_.pin_count) {
        throw GpioError(ErrorCode::InvalidPinId, "GPIO " + std::to_string(id) + " does not exist");
    }
    return decode_function(registers_.function_select(id / 10).read_field(function_field(id)));
}

bool Gpio::read_level(uint32_t id) const {
    if (id >= board_.pin_count) {
        throw GpioError(ErrorCode::InvalidPinId, "GPIO " + std::to_string(id) + " does not exist");
    }
    return (registers_.level(bank_of(id)).get() & pin_mask(id)) != 0;
}

EventBank& Gpio::events(Bank bank) noexcept {
    return bank == Bank::Bank0 ? bank0_ : bank1_;
}

EventBank& Gpio::bank_for(const Pin& pin) {
    if (!registry_.holds(pin.id(), pin.claim())) {
        throw GpioError(ErrorCode::PinNotInUse,
                        "GPIO " + std::to_string(pin.id()) + " is not claimed by this handle");
    }
    return events(pin.bank());
}

void Gpio::require_input(const Pin& pin, const char* operation) const {
    if (pin.function() != Function::Input) {
        throw GpioError(ErrorCode::PinStateMismatch,
                        std::string(operation) + " needs GPIO " + std::to_string(pin.id()) +
                            " in input mode, it is " + to_string(pin.function()));
    }
}

void Gpio::line_in_use(EventBank& bank) {
    if (bank.arm_line() && irq_ != nullptr) {
        irq_->enable_line(bank.id());
    }
}

} // namespace gpio
