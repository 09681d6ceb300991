#ifndef PINWORKS_DRIVER_CONTEXT_HPP
#define PINWORKS_DRIVER_CONTEXT_HPP

#include "board_config.hpp"
#include "gpio/irq.hpp"
#include "gpio/peripheral.hpp"
#include "gpio/registers.hpp"

#include <functional>
#include <memory>

namespace pinworks {

// Creates the register backend once a command first needs the peripheral.
using RegisterBlockFactory = std::function<std::unique_ptr<gpio::RegisterBlock>(const gpio::BoardConfig&)>;

// Backend for --simulate and tests: a SimulatedGpioBlock.
RegisterBlockFactory simulated_register_factory();

// Lazily opened GPIO session shared by every command of one CLI or script run.
class DriverContext {
public:
    DriverContext(bool verbose, gpio::BoardConfig board, RegisterBlockFactory factory, bool simulated = false);
    ~DriverContext();

    DriverContext(const DriverContext&) = delete;
    DriverContext& operator=(const DriverContext&) = delete;

    DriverContext(DriverContext&&) = delete;
    DriverContext& operator=(DriverContext&&) = delete;

    bool verbose() const noexcept { return verbose_; }
    void set_verbose(bool verbose) noexcept { verbose_ = verbose; }
    bool simulated() const noexcept { return simulated_; }

    const gpio::BoardConfig& board() const noexcept { return board_; }
    // Only while no session is open; throws std::logic_error otherwise.
    void set_board(const gpio::BoardConfig& board);

    gpio::RegisterBlock& require_registers();
    gpio::Gpio& require_gpio();
    gpio::PollingIrqController& require_irq();

    bool session_active() const noexcept { return static_cast<bool>(gpio_); }

    void shutdown() noexcept;

private:
    bool verbose_;
    bool simulated_;
    gpio::BoardConfig board_;
    RegisterBlockFactory factory_;
    std::unique_ptr<gpio::RegisterBlock> registers_;
    std::unique_ptr<gpio::PollingIrqController> irq_;
    std::unique_ptr<gpio::Gpio> gpio_;
};

} // namespace pinworks

#endif // PINWORKS_DRIVER_CONTEXT_HPP
