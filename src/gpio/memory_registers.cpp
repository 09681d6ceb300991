#include "gpio/memory_registers.hpp"

#include <sstream>
#include <stdexcept>

namespace gpio {

namespace {
std::size_t index_of(uint32_t offset) {
    if ((offset % 4) != 0 || offset >= reg::kBlockSize) {
        std::ostringstream oss;
        oss << "register offset 0x" << std::hex << offset << " is outside the GPIO block";
        throw std::out_of_range(oss.str());
    }
    return offset / 4;
}

Bank bank_for_offset(uint32_t offset, uint32_t bank0_offset) {
    return offset == bank0_offset ? Bank::Bank0 : Bank::Bank1;
}

uint32_t banked(uint32_t bank0_offset, Bank bank) {
    return bank0_offset + bank_index(bank) * reg::kBankStride;
}
}

uint32_t MemoryRegisterBlock::read(uint32_t offset) const {
    ++read_count_;
    return word(offset);
}

void MemoryRegisterBlock::write(uint32_t offset, uint32_t value) {
    (void)index_of(offset);
    writes_.push_back(RegisterWrite{offset, value});
    apply_write(offset, value);
}

uint32_t MemoryRegisterBlock::peek(uint32_t offset) const {
    return word(offset);
}

void MemoryRegisterBlock::poke(uint32_t offset, uint32_t value) {
    word(offset) = value;
}

std::vector<RegisterWrite> MemoryRegisterBlock::writes_to(uint32_t offset) const {
    std::vector<RegisterWrite> matching;
    for (const auto& entry : writes_) {
        if (entry.offset == offset) {
            matching.push_back(entry);
        }
    }
    return matching;
}

void MemoryRegisterBlock::clear_log() noexcept {
    writes_.clear();
    read_count_ = 0;
}

void MemoryRegisterBlock::apply_write(uint32_t offset, uint32_t value) {
    word(offset) = value;
}

uint32_t& MemoryRegisterBlock::word(uint32_t offset) {
    return words_[index_of(offset)];
}

uint32_t MemoryRegisterBlock::word(uint32_t offset) const {
    return words_[index_of(offset)];
}

void SimulatedGpioBlock::drive_input(uint32_t pin, bool high) {
    const Bank bank = bank_of(pin);
    const uint32_t levels = word(banked(reg::GPLEV0, bank));
    change_levels(bank, high ? (levels | pin_mask(pin)) : (levels & ~pin_mask(pin)));
}

void SimulatedGpioBlock::raise_event(uint32_t pin) {
    word(banked(reg::GPEDS0, bank_of(pin))) |= pin_mask(pin);
}

bool SimulatedGpioBlock::level_of(uint32_t pin) const {
    return (word(banked(reg::GPLEV0, bank_of(pin))) & pin_mask(pin)) != 0;
}

bool SimulatedGpioBlock::event_pending(uint32_t pin) const {
    return (word(banked(reg::GPEDS0, bank_of(pin))) & pin_mask(pin)) != 0;
}

void SimulatedGpioBlock::apply_write(uint32_t offset, uint32_t value) {
    switch (offset) {
    case reg::GPSET0:
    case reg::GPSET1: {
        const Bank bank = bank_for_offset(offset, reg::GPSET0);
        change_levels(bank, word(banked(reg::GPLEV0, bank)) | value);
        return;
    }
    case reg::GPCLR0:
    case reg::GPCLR1: {
        const Bank bank = bank_for_offset(offset, reg::GPCLR0);
        change_levels(bank, word(banked(reg::GPLEV0, bank)) & ~value);
        return;
    }
    case reg::GPLEV0:
    case reg::GPLEV1:
        return;
    case reg::GPEDS0:
    case reg::GPEDS1:
        word(offset) &= ~value;
        return;
    default:
        MemoryRegisterBlock::apply_write(offset, value);
        return;
    }
}

void SimulatedGpioBlock::change_levels(Bank bank, uint32_t new_levels) {
    uint32_t& levels = word(banked(reg::GPLEV0, bank));
    const uint32_t rising = ~levels & new_levels;
    const uint32_t falling = levels & ~new_levels;
    levels = new_levels;

    uint32_t latched = 0;
    for (uint32_t bit = 0; bit < kPinsPerBank; ++bit) {
        const uint32_t mask = 1u << bit;
        if ((rising & mask) && (detect_enabled(DetectKind::Rising, bank, mask) ||
                                detect_enabled(DetectKind::AsyncRising, bank, mask))) {
            latched |= mask;
        }
        if ((falling & mask) && (detect_enabled(DetectKind::Falling, bank, mask) ||
                                 detect_enabled(DetectKind::AsyncFalling, bank, mask))) {
            latched |= mask;
        }
        if ((new_levels & mask) && detect_enabled(DetectKind::High, bank, mask)) {
            latched |= mask;
        }
        if (!(new_levels & mask) && detect_enabled(DetectKind::Low, bank, mask)) {
            latched |= mask;
        }
    }
    word(banked(reg::GPEDS0, bank)) |= latched;
}

bool SimulatedGpioBlock::detect_enabled(DetectKind kind, Bank bank, uint32_t mask) const {
    return (word(detect_enable_offset(kind, bank)) & mask) != 0;
}

} // namespace gpio
