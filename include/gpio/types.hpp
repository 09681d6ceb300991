// Basic GPIO types shared by the register map, pins and event banks
#ifndef GPIO_TYPES_HPP
#define GPIO_TYPES_HPP

#include <stdint.h>
#include <optional>
#include <string_view>

namespace gpio {

constexpr uint32_t kPinsPerBank = 32;
constexpr uint32_t kBankCount = 2;
constexpr uint32_t kMaxAltFunction = 5;

// Pin function as tracked by a Pin handle. Unknown until the first transition.
enum class Function : uint8_t {
    Input,
    Output,
    Alt0,
    Alt1,
    Alt2,
    Alt3,
    Alt4,
    Alt5,
    Unknown,
};

enum class Pull : uint8_t {
    Disabled,
    PullUp,
    PullDown,
    Unknown,
};

// Detect events a callback can be registered for
enum class Event : uint8_t {
    RisingEdge,        // low -> high, synchronised to the GPIO clock
    FallingEdge,       // high -> low
    BothEdges,         // either edge; arms two detect bits
    High,              // level held high
    Low,               // level held low
    AsyncRisingEdge,   // low -> high, not bound to the GPIO clock
    AsyncFallingEdge,
    AsyncBothEdges,
};

// Interrupt banks: Bank0 covers pins 0..31, Bank1 covers 32..pin_count-1
enum class Bank : uint8_t {
    Bank0 = 0,
    Bank1 = 1,
};

inline Bank bank_of(uint32_t pin) noexcept {
    return pin < kPinsPerBank ? Bank::Bank0 : Bank::Bank1;
}

inline uint32_t slot_of(uint32_t pin) noexcept {
    return pin % kPinsPerBank;
}

inline uint32_t pin_mask(uint32_t pin) noexcept {
    return 1u << (pin % kPinsPerBank);
}

inline uint32_t bank_index(Bank bank) noexcept {
    return static_cast<uint32_t>(bank);
}

const char* to_string(Function function) noexcept;
const char* to_string(Pull pull) noexcept;
const char* to_string(Event event) noexcept;
const char* to_string(Bank bank) noexcept;

// Accepts "input"/"in", "output"/"out", "alt0".."alt5" (case-insensitive)
std::optional<Function> parse_function(std::string_view text);
// Accepts "up", "down", "off"/"none"/"disabled"
std::optional<Pull> parse_pull(std::string_view text);
// Accepts "rising", "falling", "both", "high", "low", "async-rising", "async-falling", "async-both"
std::optional<Event> parse_event(std::string_view text);

} // namespace gpio

#endif // GPIO_TYPES_HPP
