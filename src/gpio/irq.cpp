#include "gpio/irq.hpp"
#include "gpio/peripheral.hpp"
#include "logging.hpp"
#include "timing.hpp"

namespace gpio {

void PollingIrqController::enable_line(Bank bank) {
    if (!enabled_[bank_index(bank)].exchange(true)) {
        LOG_HAL_INFO("interrupt line for %s enabled (polled)", to_string(bank));
    }
}

void PollingIrqController::disable_line(Bank bank) noexcept {
    enabled_[bank_index(bank)].store(false);
}

bool PollingIrqController::line_enabled(Bank bank) const noexcept {
    return enabled_[bank_index(bank)].load();
}

uint32_t PollingIrqController::pending(Bank bank) const {
    if (!line_enabled(bank)) {
        return 0;
    }
    return registers_.event_status(bank).get();
}

uint32_t PollingIrqController::service(Gpio& gpio) {
    uint32_t invoked = 0;
    for (Bank bank : {Bank::Bank0, Bank::Bank1}) {
        if (pending(bank) != 0) {
            invoked += gpio.handle_interrupt(bank);
        }
    }
    return invoked;
}

uint32_t PollingIrqController::wait(Gpio& gpio, uint64_t timeout_ns, uint64_t interval_ns) {
    const uint64_t start = get_timestamp_ns();
    while (true) {
        const uint32_t invoked = service(gpio);
        if (invoked > 0) {
            return invoked;
        }
        if (timeout_ns != 0 && elapsed_since_ns(start) >= timeout_ns) {
            LOG_HAL_DEBUG("no event within %llu ns", (unsigned long long)timeout_ns);
            return 0;
        }
        sleep_ns(interval_ns);
    }
}

} // namespace gpio
