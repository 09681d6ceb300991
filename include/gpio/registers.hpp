// Register map of the BCM283x GPIO block
#ifndef GPIO_REGISTERS_HPP
#define GPIO_REGISTERS_HPP

#include <stdint.h>
#include <array>
#include "gpio/types.hpp"

namespace gpio {

// Byte offsets from the start of the GPIO block
namespace reg {
constexpr uint32_t GPFSEL0   = 0x00; // function select, pins 0..9; GPFSEL1..5 follow every 4 bytes
constexpr uint32_t GPSET0    = 0x1C; // output set, write-only
constexpr uint32_t GPSET1    = 0x20;
constexpr uint32_t GPCLR0    = 0x28; // output clear, write-only
constexpr uint32_t GPCLR1    = 0x2C;
constexpr uint32_t GPLEV0    = 0x34; // pin level, read-only
constexpr uint32_t GPLEV1    = 0x38;
constexpr uint32_t GPEDS0    = 0x40; // event detect status, write 1 to clear
constexpr uint32_t GPEDS1    = 0x44;
constexpr uint32_t GPREN0    = 0x4C; // rising edge detect enable
constexpr uint32_t GPFEN0    = 0x58; // falling edge detect enable
constexpr uint32_t GPHEN0    = 0x64; // high level detect enable
constexpr uint32_t GPLEN0    = 0x70; // low level detect enable
constexpr uint32_t GPAREN0   = 0x7C; // async rising edge detect enable
constexpr uint32_t GPAFEN0   = 0x88; // async falling edge detect enable
constexpr uint32_t GPPUD     = 0x94; // pull-up/down control
constexpr uint32_t GPPUDCLK0 = 0x98; // pull-up/down clock
constexpr uint32_t GPPUDCLK1 = 0x9C;

constexpr uint32_t kFunctionSelectCount = 6;
constexpr uint32_t kBankStride = 0x04;   // bank1 register = bank0 register + stride
constexpr uint32_t kBlockSize = 0xB4;    // up to and including the test register
} // namespace reg

// Hardware encodings of the 3-bit function field
enum class FunctionCode : uint32_t {
    Input  = 0b000,
    Output = 0b001,
    Alt0   = 0b100,
    Alt1   = 0b101,
    Alt2   = 0b110,
    Alt3   = 0b111,
    Alt4   = 0b011,
    Alt5   = 0b010,
};

// Hardware encodings of the GPPUD control field
enum class PullCode : uint32_t {
    Disabled = 0b00,
    PullDown = 0b01,
    PullUp   = 0b10,
};

FunctionCode encode(Function function);
Function decode_function(uint32_t code) noexcept;

// The six detect-enable registers of a bank
enum class DetectKind : uint8_t {
    Rising,
    Falling,
    High,
    Low,
    AsyncRising,
    AsyncFalling,
};

constexpr std::array<DetectKind, 6> kAllDetectKinds = {
    DetectKind::Rising, DetectKind::Falling, DetectKind::High,
    DetectKind::Low, DetectKind::AsyncRising, DetectKind::AsyncFalling,
};

// Detect bits an event arms; composite events arm two.
struct DetectSet {
    std::array<DetectKind, 2> kinds{};
    uint8_t count = 0;
};

DetectSet detect_kinds(Event event) noexcept;

// Raw 32-bit access to a register block. Offsets are byte offsets from the GPIO base.
class RegisterBlock {
public:
    virtual ~RegisterBlock() = default;

    virtual uint32_t read(uint32_t offset) const = 0;
    virtual void write(uint32_t offset, uint32_t value) = 0;
};

// Bit field inside a register: mask is applied after shifting down.
struct RegisterField {
    uint32_t mask = 0;
    uint32_t shift = 0;

    constexpr uint32_t in_place() const noexcept { return mask << shift; }
};

constexpr RegisterField kPullControlField{0x3, 0};

inline RegisterField function_field(uint32_t pin) noexcept {
    return RegisterField{0x7, (pin % 10) * 3};
}

inline RegisterField pin_field(uint32_t pin) noexcept {
    return RegisterField{0x1, pin % kPinsPerBank};
}

class ReadOnly {
public:
    ReadOnly(const RegisterBlock& block, uint32_t offset) : block_(&block), offset_(offset) {}

    uint32_t get() const { return block_->read(offset_); }
    uint32_t offset() const noexcept { return offset_; }

private:
    const RegisterBlock* block_;
    uint32_t offset_;
};

class WriteOnly {
public:
    WriteOnly(RegisterBlock& block, uint32_t offset) : block_(&block), offset_(offset) {}

    void set(uint32_t value) const { block_->write(offset_, value); }
    uint32_t offset() const noexcept { return offset_; }

private:
    RegisterBlock* block_;
    uint32_t offset_;
};

class ReadWrite {
public:
    ReadWrite(RegisterBlock& block, uint32_t offset) : block_(&block), offset_(offset) {}

    uint32_t get() const { return block_->read(offset_); }
    void set(uint32_t value) const { block_->write(offset_, value); }

    uint32_t read_field(RegisterField field) const {
        return (get() >> field.shift) & field.mask;
    }

    // Read-modify-write of a single field; other bits are preserved.
    void modify(RegisterField field, uint32_t value) const {
        const uint32_t current = get();
        set((current & ~field.in_place()) | ((value & field.mask) << field.shift));
    }

    uint32_t offset() const noexcept { return offset_; }

private:
    RegisterBlock* block_;
    uint32_t offset_;
};

// Named registers of the GPIO block. Cheap to copy; refers to, but does not own, the block.
class RegisterMap {
public:
    explicit RegisterMap(RegisterBlock& block) : block_(&block) {}

    ReadWrite function_select(uint32_t index) const;
    WriteOnly output_set(Bank bank) const;
    WriteOnly output_clear(Bank bank) const;
    ReadOnly level(Bank bank) const;
    ReadWrite event_status(Bank bank) const;
    ReadWrite detect_enable(DetectKind kind, Bank bank) const;
    ReadWrite pull_control() const;
    ReadWrite pull_clock(Bank bank) const;

    RegisterBlock& block() const noexcept { return *block_; }

private:
    RegisterBlock* block_;
};

uint32_t detect_enable_offset(DetectKind kind, Bank bank) noexcept;

} // namespace gpio

#endif // GPIO_REGISTERS_HPP
