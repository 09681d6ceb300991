#include "gpio/event_bank.hpp"
#include "logging.hpp"

#include <bit>
#include <stdexcept>
#include <string>
#include <utility>

namespace gpio {

namespace {
uint32_t routed_slot(const EventBank& bank, uint32_t pin) {
    const uint32_t slot = slot_of(pin);
    if (bank_of(pin) != bank.id() || slot >= bank.slot_count()) {
        throw std::logic_error("GPIO " + std::to_string(pin) + " is not routed to " +
                               to_string(bank.id()));
    }
    return slot;
}

void require_callable(const Callback& callback) {
    if (!callback) {
        throw std::invalid_argument("event callback is empty");
    }
}

void run_callback(const Callback& callback, Bank bank, uint32_t slot, const char* kind) {
    try {
        callback();
    } catch (const std::exception& ex) {
        LOG_GPIO_ERROR("%s slot %u: %s callback threw: %s", to_string(bank), slot, kind, ex.what());
    }
}

void enable_detect(const RegisterMap& registers, Bank bank, uint32_t pin, Event event) {
    const DetectSet set = detect_kinds(event);
    for (uint8_t i = 0; i < set.count; ++i) {
        registers.detect_enable(set.kinds[i], bank).modify(pin_field(pin), 1);
    }
}
}

const char* to_string(SlotState state) noexcept {
    switch (state) {
    case SlotState::Empty: return "empty";
    case SlotState::Recurring: return "recurring";
    case SlotState::Oneshot: return "oneshot";
    }
    return "unknown";
}

EventBank::EventBank(Bank id, uint32_t slot_count) : id_(id), slot_count_(slot_count) {
    if (slot_count_ > kPinsPerBank) {
        throw std::invalid_argument("a bank holds at most " + std::to_string(kPinsPerBank) +
                                    " slots, got " + std::to_string(slot_count_));
    }
}

bool EventBank::store_recurring(uint32_t slot, Callback callback) {
    check_slot(slot);
    auto shared = std::make_shared<const Callback>(std::move(callback));
    GuardAttempt attempt(guard_);
    if (!attempt.acquired()) {
        return false;
    }
    recurring_[slot] = std::move(shared);
    oneshot_[slot] = nullptr;
    return true;
}

bool EventBank::store_oneshot(uint32_t slot, Callback callback) {
    check_slot(slot);
    GuardAttempt attempt(guard_);
    if (!attempt.acquired()) {
        return false;
    }
    oneshot_[slot] = std::move(callback);
    recurring_[slot].reset();
    return true;
}

bool EventBank::clear(uint32_t slot) {
    check_slot(slot);
    std::shared_ptr<const Callback> released;
    Callback dropped;
    {
        GuardAttempt attempt(guard_);
        if (!attempt.acquired()) {
            return false;
        }
        released = std::move(recurring_[slot]);
        dropped = std::move(oneshot_[slot]);
        recurring_[slot].reset();
        oneshot_[slot] = nullptr;
    }
    // Callables are destroyed here, outside the guard.
    return true;
}

uint32_t EventBank::fire(uint32_t slot) {
    check_slot(slot);
    Callback oneshot;
    std::shared_ptr<const Callback> recurring;
    {
        GuardAttempt attempt(guard_);
        if (!attempt.acquired()) {
            LOG_GPIO_TRACE("%s slot %u busy, skipped", to_string(id_), slot);
            return 0;
        }
        oneshot = std::move(oneshot_[slot]);
        oneshot_[slot] = nullptr;
        recurring = recurring_[slot];
    }

    uint32_t invoked = 0;
    if (oneshot) {
        run_callback(oneshot, id_, slot, "one-shot");
        ++invoked;
    }
    if (recurring) {
        run_callback(*recurring, id_, slot, "recurring");
        ++invoked;
    }
    return invoked;
}

SlotState EventBank::state(uint32_t slot) const {
    check_slot(slot);
    if (oneshot_[slot]) {
        return SlotState::Oneshot;
    }
    if (recurring_[slot]) {
        return SlotState::Recurring;
    }
    return SlotState::Empty;
}

void EventBank::check_slot(uint32_t slot) const {
    if (slot >= slot_count_) {
        throw std::logic_error(std::string(to_string(id_)) + " has no slot " + std::to_string(slot));
    }
}

bool register_recurring(EventBank& bank, const RegisterMap& registers, uint32_t pin, Event event,
                        Callback callback) {
    const uint32_t slot = routed_slot(bank, pin);
    require_callable(callback);
    if (!bank.store_recurring(slot, std::move(callback))) {
        LOG_GPIO_DEBUG("GPIO %u: %s busy, recurring callback dropped", pin, to_string(bank.id()));
        return false;
    }
    enable_detect(registers, bank.id(), pin, event);
    LOG_GPIO_DEBUG("GPIO %u: recurring callback on %s", pin, to_string(event));
    return true;
}

bool register_oneshot(EventBank& bank, const RegisterMap& registers, uint32_t pin, Event event,
                      Callback callback) {
    const uint32_t slot = routed_slot(bank, pin);
    require_callable(callback);
    if (!bank.store_oneshot(slot, std::move(callback))) {
        LOG_GPIO_DEBUG("GPIO %u: %s busy, one-shot callback dropped", pin, to_string(bank.id()));
        return false;
    }
    enable_detect(registers, bank.id(), pin, event);
    LOG_GPIO_DEBUG("GPIO %u: one-shot callback on %s", pin, to_string(event));
    return true;
}

bool unregister(EventBank& bank, const RegisterMap& registers, uint32_t pin) {
    const uint32_t slot = routed_slot(bank, pin);
    if (!bank.clear(slot)) {
        LOG_GPIO_DEBUG("GPIO %u: %s busy, unregister skipped", pin, to_string(bank.id()));
        return false;
    }
    for (DetectKind kind : kAllDetectKinds) {
        registers.detect_enable(kind, bank.id()).modify(pin_field(pin), 0);
    }
    LOG_GPIO_DEBUG("GPIO %u: callbacks removed", pin);
    return true;
}

uint32_t dispatch(EventBank& bank, const RegisterMap& registers) {
    const ReadWrite status = registers.event_status(bank.id());
    const uint32_t pending = status.get();
    if (pending == 0) {
        return 0;
    }
    // Write-1-to-clear before any callback runs so events raised meanwhile latch again.
    status.set(pending);

    uint32_t invoked = 0;
    uint32_t remaining = pending;
    while (remaining != 0) {
        const uint32_t slot = static_cast<uint32_t>(std::countr_zero(remaining));
        remaining &= remaining - 1;
        if (slot >= bank.slot_count()) {
            break;
        }
        invoked += bank.fire(slot);
    }
    LOG_GPIO_TRACE("%s: status 0x%08x, %u callback(s)", to_string(bank.id()), pending, invoked);
    return invoked;
}

} // namespace gpio
