// Per-bank callback storage and the interrupt dispatcher
#ifndef GPIO_EVENT_BANK_HPP
#define GPIO_EVENT_BANK_HPP

#include <stdint.h>
#include <array>
#include <atomic>
#include <functional>
#include <memory>
#include "gpio/registers.hpp"
#include "gpio/types.hpp"

namespace gpio {

using Callback = std::function<void()>;

// Non-blocking guard shared by registration (normal context) and dispatch
// (interrupt context). Never spins: a busy guard means "skip".
class BankGuard {
public:
    BankGuard() = default;
    BankGuard(const BankGuard&) = delete;
    BankGuard& operator=(const BankGuard&) = delete;

    bool try_acquire() noexcept { return !flag_.test_and_set(std::memory_order_acquire); }
    void release() noexcept { flag_.clear(std::memory_order_release); }

private:
    std::atomic_flag flag_;
};

// Single acquisition attempt, released on scope exit if it succeeded.
class GuardAttempt {
public:
    explicit GuardAttempt(BankGuard& guard) noexcept
        : guard_(guard), acquired_(guard.try_acquire()) {}
    ~GuardAttempt() {
        if (acquired_) {
            guard_.release();
        }
    }

    GuardAttempt(const GuardAttempt&) = delete;
    GuardAttempt& operator=(const GuardAttempt&) = delete;

    bool acquired() const noexcept { return acquired_; }

private:
    BankGuard& guard_;
    bool acquired_;
};

enum class SlotState : uint8_t {
    Empty,
    Recurring,
    Oneshot,
};

const char* to_string(SlotState state) noexcept;

// Callback slots of one interrupt bank, one slot per pin of the bank.
// A slot holds at most one callback; storing one kind clears the other.
//
// Recurring callbacks are shared so that an invocation in flight keeps its
// callable alive when the slot is cleared concurrently.
class EventBank {
public:
    EventBank(Bank id, uint32_t slot_count);

    EventBank(const EventBank&) = delete;
    EventBank& operator=(const EventBank&) = delete;

    Bank id() const noexcept { return id_; }
    uint32_t slot_count() const noexcept { return slot_count_; }
    BankGuard& guard() noexcept { return guard_; }

    // Each of these makes one attempt on the guard and returns false, leaving
    // the slot untouched, when the guard is busy.
    bool store_recurring(uint32_t slot, Callback callback);
    bool store_oneshot(uint32_t slot, Callback callback);
    bool clear(uint32_t slot);

    // Takes the one-shot callback and a reference to the recurring one under
    // the guard, then runs them outside it. Returns the number invoked; 0 when
    // the guard was busy. A callback that throws is logged and still counts.
    uint32_t fire(uint32_t slot);

    // Unsynchronised snapshot for diagnostics and tests.
    SlotState state(uint32_t slot) const;

    // True for the first caller only; the line is then considered enabled.
    bool arm_line() noexcept { return !line_armed_.exchange(true, std::memory_order_acq_rel); }
    bool line_armed() const noexcept { return line_armed_.load(std::memory_order_acquire); }

private:
    void check_slot(uint32_t slot) const;

    Bank id_;
    uint32_t slot_count_;
    BankGuard guard_;
    std::array<std::shared_ptr<const Callback>, kPinsPerBank> recurring_;
    std::array<Callback, kPinsPerBank> oneshot_;
    std::atomic<bool> line_armed_{false};
};

// Registration and unregistration for a pin routed to `bank`. A pin outside
// the bank is a routing fault and throws std::logic_error.
//
// register_* store the callback and then set the detect-enable bit(s) for the
// event. Return false, with no effect, when the bank guard was busy.
bool register_recurring(EventBank& bank, const RegisterMap& registers, uint32_t pin, Event event,
                        Callback callback);
bool register_oneshot(EventBank& bank, const RegisterMap& registers, uint32_t pin, Event event,
                      Callback callback);

// Clears both slots and all six detect-enable bits of the pin. Returns false,
// with no effect, when the bank guard was busy.
bool unregister(EventBank& bank, const RegisterMap& registers, uint32_t pin);

// Interrupt handler body for one bank: read the event status, acknowledge it,
// then fire the slot of every set bit from the lowest up. Returns the number
// of callbacks invoked. Exceptions from callbacks do not escape, so one failing
// callback never costs the pins after it their acknowledged events.
uint32_t dispatch(EventBank& bank, const RegisterMap& registers);

} // namespace gpio

#endif // GPIO_EVENT_BANK_HPP
