#include "pinworks/driver_context.hpp"
#include "gpio/memory_registers.hpp"
#include "logging.hpp"

#include <stdexcept>
#include <utility>

namespace pinworks {

RegisterBlockFactory simulated_register_factory() {
    return [](const gpio::BoardConfig&) -> std::unique_ptr<gpio::RegisterBlock> {
        return std::make_unique<gpio::SimulatedGpioBlock>();
    };
}

DriverContext::DriverContext(bool verbose, gpio::BoardConfig board, RegisterBlockFactory factory, bool simulated)
    : verbose_(verbose),
      simulated_(simulated),
      board_(board),
      factory_(std::move(factory)) {}

DriverContext::~DriverContext() {
    shutdown();
}

void DriverContext::set_board(const gpio::BoardConfig& board) {
    if (registers_) {
        throw std::logic_error("board cannot change while a GPIO session is open");
    }
    board_ = board;
}

gpio::RegisterBlock& DriverContext::require_registers() {
    if (!registers_) {
        if (!factory_) {
            throw std::runtime_error("no register backend available in this build (try --simulate)");
        }
        registers_ = factory_(board_);
        if (!registers_) {
            throw std::runtime_error("register backend could not be created");
        }
        LOG_HAL_INFO("register backend opened for board '%.*s'%s", static_cast<int>(board_.name.size()),
                     board_.name.data(), simulated_ ? " (simulated)" : "");
    }
    return *registers_;
}

gpio::PollingIrqController& DriverContext::require_irq() {
    if (!irq_) {
        irq_ = std::make_unique<gpio::PollingIrqController>(gpio::RegisterMap(require_registers()));
        if (gpio_) {
            gpio_->set_irq_controller(irq_.get());
        }
    }
    return *irq_;
}

gpio::Gpio& DriverContext::require_gpio() {
    if (!gpio_) {
        gpio::RegisterBlock& block = require_registers();
        gpio::PollingIrqController& irq = require_irq();
        gpio_ = std::make_unique<gpio::Gpio>(block, board_, &irq);
    }
    return *gpio_;
}

void DriverContext::shutdown() noexcept {
    gpio_.reset();
    irq_.reset();
    registers_.reset();
}

} // namespace pinworks
