// In-memory register blocks for tests and dry runs
#ifndef GPIO_MEMORY_REGISTERS_HPP
#define GPIO_MEMORY_REGISTERS_HPP

#include <stdint.h>
#include <array>
#include <cstddef>
#include <vector>
#include "gpio/registers.hpp"

namespace gpio {

struct RegisterWrite {
    uint32_t offset = 0;
    uint32_t value = 0;
};

// Plain storage: every register reads back what was last written. Writes are
// recorded in order so callers can check the exact access sequence.
class MemoryRegisterBlock : public RegisterBlock {
public:
    MemoryRegisterBlock() = default;

    uint32_t read(uint32_t offset) const override;
    void write(uint32_t offset, uint32_t value) override;

    // Direct storage access; neither is recorded.
    uint32_t peek(uint32_t offset) const;
    void poke(uint32_t offset, uint32_t value);

    const std::vector<RegisterWrite>& writes() const noexcept { return writes_; }
    std::vector<RegisterWrite> writes_to(uint32_t offset) const;
    std::size_t read_count() const noexcept { return read_count_; }
    void clear_log() noexcept;

protected:
    // Storage update for a recorded write; overridden to model register side effects.
    virtual void apply_write(uint32_t offset, uint32_t value);

    uint32_t& word(uint32_t offset);
    uint32_t word(uint32_t offset) const;

private:
    std::array<uint32_t, reg::kBlockSize / 4> words_{};
    std::vector<RegisterWrite> writes_;
    mutable std::size_t read_count_ = 0;
};

// Models the parts of the GPIO block the library depends on:
// - GPSET/GPCLR drive the GPLEV bits and are not stored themselves
// - GPLEV ignores writes
// - GPEDS is write-1-to-clear
// - level changes latch GPEDS bits according to the enabled detect registers
class SimulatedGpioBlock : public MemoryRegisterBlock {
public:
    SimulatedGpioBlock() = default;

    // External signal on an input pin.
    void drive_input(uint32_t pin, bool high);
    // Latch a status bit without a level change.
    void raise_event(uint32_t pin);

    bool level_of(uint32_t pin) const;
    bool event_pending(uint32_t pin) const;

protected:
    void apply_write(uint32_t offset, uint32_t value) override;

private:
    void change_levels(Bank bank, uint32_t new_levels);
    bool detect_enabled(DetectKind kind, Bank bank, uint32_t mask) const;
};

} // namespace gpio

#endif // GPIO_MEMORY_REGISTERS_HPP
