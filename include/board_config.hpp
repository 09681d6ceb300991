#ifndef BOARD_CONFIG_HPP
#define BOARD_CONFIG_HPP

#include <stdint.h>
#include <optional>
#include <string_view>
#include <vector>

// ~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~
// Board Definitions
//
// The GPIO block sits at a fixed offset from the peripheral base, but the base itself and the
// number of usable pins differ between board revisions. The defaults below are overridden by the
// build (see PINWORKS_BOARD_PIN_COUNT / PINWORKS_PERIPHERAL_BASE in CMakeLists.txt) and, at run
// time, by the PINWORKS_BOARD environment variable or the CLI --board option.
// ~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~

// Number of GPIO lines the board exposes (40 on header-only boards, 54 on the full SoC).
#ifndef PINWORKS_BOARD_PIN_COUNT
#define PINWORKS_BOARD_PIN_COUNT 54
#endif

// Physical peripheral base (0x20000000 on BCM2835, 0x3F000000 on BCM2836/7).
#ifndef PINWORKS_PERIPHERAL_BASE
#define PINWORKS_PERIPHERAL_BASE 0x3F000000
#endif

// Offset of the GPIO register block from the peripheral base.
#define PINWORKS_GPIO_OFFSET 0x00200000

namespace gpio {

// Upper bound the register layout can address (two banks, the second one partial).
constexpr uint32_t kMaxPinCount = 54;

struct BoardConfig {
    std::string_view name;
    uint64_t peripheral_base = PINWORKS_PERIPHERAL_BASE;
    uint32_t pin_count = PINWORKS_BOARD_PIN_COUNT;

    uint64_t gpio_base() const noexcept { return peripheral_base + PINWORKS_GPIO_OFFSET; }
};

static_assert(PINWORKS_BOARD_PIN_COUNT > 0 && PINWORKS_BOARD_PIN_COUNT <= 54,
              "PINWORKS_BOARD_PIN_COUNT must be within 1..54");

// Board profile built from the compile-time defaults.
const BoardConfig& default_board() noexcept;

// Named profiles: "pi1", "pi2", "pi3", "header40".
const std::vector<BoardConfig>& known_boards();
std::optional<BoardConfig> find_board(std::string_view name);

// Resolves PINWORKS_BOARD, falling back to default_board() when unset or unknown.
BoardConfig board_from_environment();

} // namespace gpio

#endif // BOARD_CONFIG_HPP
