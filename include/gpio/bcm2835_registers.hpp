// Hardware register backend on top of the bcm2835 library
#ifndef GPIO_BCM2835_REGISTERS_HPP
#define GPIO_BCM2835_REGISTERS_HPP

#include <stdint.h>
#include "board_config.hpp"
#include "gpio/registers.hpp"

namespace gpio {

// Initialise the bcm2835 mapping, lock memory and, unless PINWORKS_REALTIME=0,
// move the process to SCHED_FIFO pinned to PINWORKS_PIN_CPU (default 0).
// Reference counted; returns false when the mapping could not be established.
bool bcm2835_session_start();

// Restore scheduler state and release bcm2835 resources with the last reference.
void bcm2835_session_stop();

// RAII helper to ensure bcm2835_session_stop() is called.
class Bcm2835Session {
public:
    explicit Bcm2835Session(bool throw_on_failure = true);
    Bcm2835Session(const Bcm2835Session&) = delete;
    Bcm2835Session& operator=(const Bcm2835Session&) = delete;
    Bcm2835Session(Bcm2835Session&& other) noexcept;
    Bcm2835Session& operator=(Bcm2835Session&& other) noexcept;
    ~Bcm2835Session();

    bool active() const noexcept { return active_; }

private:
    bool active_ = false;
};

// Register access through the library's mapping of the GPIO block.
class Bcm2835RegisterBlock : public RegisterBlock {
public:
    explicit Bcm2835RegisterBlock(const BoardConfig& board = default_board());

    uint32_t read(uint32_t offset) const override;
    void write(uint32_t offset, uint32_t value) override;

private:
    Bcm2835Session session_;
};

} // namespace gpio

#endif // GPIO_BCM2835_REGISTERS_HPP
