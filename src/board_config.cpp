#include "board_config.hpp"
#include "logging.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <string>

namespace gpio {

namespace {
std::string lowercase(std::string_view text) {
    std::string lowered{text};
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return lowered;
}
}

const BoardConfig& default_board() noexcept {
    static const BoardConfig board{"default", PINWORKS_PERIPHERAL_BASE, PINWORKS_BOARD_PIN_COUNT};
    return board;
}

const std::vector<BoardConfig>& known_boards() {
    static const std::vector<BoardConfig> boards = {
        {"pi1", 0x20000000, 54},
        {"pi2", 0x3F000000, 54},
        {"pi3", 0x3F000000, 54},
        {"header40", 0x3F000000, 40},
    };
    return boards;
}

std::optional<BoardConfig> find_board(std::string_view name) {
    const std::string wanted = lowercase(name);
    if (wanted == "default") {
        return default_board();
    }
    for (const auto& board : known_boards()) {
        if (board.name == wanted) {
            return board;
        }
    }
    return std::nullopt;
}

BoardConfig board_from_environment() {
    const char* env_board = std::getenv("PINWORKS_BOARD");
    if (env_board == nullptr || *env_board == '\0') {
        return default_board();
    }
    auto board = find_board(env_board);
    if (!board) {
        LOG_HAL_WARN("Unknown PINWORKS_BOARD value '%s', using the build default", env_board);
        return default_board();
    }
    return *board;
}

} // namespace gpio
