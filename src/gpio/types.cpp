#include "gpio/types.hpp"

#include <algorithm>
#include <cctype>
#include <string>

namespace gpio {

namespace {
std::string normalize(std::string_view text) {
    std::string normalized{text};
    std::transform(normalized.begin(), normalized.end(), normalized.begin(), [](unsigned char c) {
        return c == '_' ? '-' : static_cast<char>(std::tolower(c));
    });
    return normalized;
}
}

const char* to_string(Function function) noexcept {
    switch (function) {
    case Function::Input: return "input";
    case Function::Output: return "output";
    case Function::Alt0: return "alt0";
    case Function::Alt1: return "alt1";
    case Function::Alt2: return "alt2";
    case Function::Alt3: return "alt3";
    case Function::Alt4: return "alt4";
    case Function::Alt5: return "alt5";
    case Function::Unknown: break;
    }
    return "unknown";
}

const char* to_string(Pull pull) noexcept {
    switch (pull) {
    case Pull::Disabled: return "off";
    case Pull::PullUp: return "up";
    case Pull::PullDown: return "down";
    case Pull::Unknown: break;
    }
    return "unknown";
}

const char* to_string(Event event) noexcept {
    switch (event) {
    case Event::RisingEdge: return "rising";
    case Event::FallingEdge: return "falling";
    case Event::BothEdges: return "both";
    case Event::High: return "high";
    case Event::Low: return "low";
    case Event::AsyncRisingEdge: return "async-rising";
    case Event::AsyncFallingEdge: return "async-falling";
    case Event::AsyncBothEdges: return "async-both";
    }
    return "unknown";
}

const char* to_string(Bank bank) noexcept {
    return bank == Bank::Bank0 ? "bank0" : "bank1";
}

std::optional<Function> parse_function(std::string_view text) {
    const std::string key = normalize(text);
    if (key == "input" || key == "in") return Function::Input;
    if (key == "output" || key == "out") return Function::Output;
    if (key.size() == 4 && key.rfind("alt", 0) == 0 && key[3] >= '0' && key[3] <= '5') {
        return static_cast<Function>(static_cast<uint8_t>(Function::Alt0) + (key[3] - '0'));
    }
    return std::nullopt;
}

std::optional<Pull> parse_pull(std::string_view text) {
    const std::string key = normalize(text);
    if (key == "up") return Pull::PullUp;
    if (key == "down") return Pull::PullDown;
    if (key == "off" || key == "none" || key == "disabled") return Pull::Disabled;
    return std::nullopt;
}

std::optional<Event> parse_event(std::string_view text) {
    const std::string key = normalize(text);
    if (key == "rising") return Event::RisingEdge;
    if (key == "falling") return Event::FallingEdge;
    if (key == "both") return Event::BothEdges;
    if (key == "high") return Event::High;
    if (key == "low") return Event::Low;
    if (key == "async-rising") return Event::AsyncRisingEdge;
    if (key == "async-falling") return Event::AsyncFallingEdge;
    if (key == "async-both") return Event::AsyncBothEdges;
    return std::nullopt;
}

} // namespace gpio
