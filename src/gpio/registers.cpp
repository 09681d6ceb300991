#include "gpio/registers.hpp"

#include <stdexcept>
#include <string>

namespace gpio {

namespace {
uint32_t banked(uint32_t bank0_offset, Bank bank) noexcept {
    return bank0_offset + bank_index(bank) * reg::kBankStride;
}
}

FunctionCode encode(Function function) {
    switch (function) {
    case Function::Input: return FunctionCode::Input;
    case Function::Output: return FunctionCode::Output;
    case Function::Alt0: return FunctionCode::Alt0;
    case Function::Alt1: return FunctionCode::Alt1;
    case Function::Alt2: return FunctionCode::Alt2;
    case Function::Alt3: return FunctionCode::Alt3;
    case Function::Alt4: return FunctionCode::Alt4;
    case Function::Alt5: return FunctionCode::Alt5;
    case Function::Unknown: break;
    }
    throw std::invalid_argument("Function 'unknown' has no hardware encoding");
}

Function decode_function(uint32_t code) noexcept {
    switch (static_cast<FunctionCode>(code & 0x7)) {
    case FunctionCode::Input: return Function::Input;
    case FunctionCode::Output: return Function::Output;
    case FunctionCode::Alt0: return Function::Alt0;
    case FunctionCode::Alt1: return Function::Alt1;
    case FunctionCode::Alt2: return Function::Alt2;
    case FunctionCode::Alt3: return Function::Alt3;
    case FunctionCode::Alt4: return Function::Alt4;
    case FunctionCode::Alt5: return Function::Alt5;
    }
    return Function::Unknown;
}

DetectSet detect_kinds(Event event) noexcept {
    switch (event) {
    case Event::RisingEdge: return {{DetectKind::Rising}, 1};
    case Event::FallingEdge: return {{DetectKind::Falling}, 1};
    case Event::BothEdges: return {{DetectKind::Rising, DetectKind::Falling}, 2};
    case Event::High: return {{DetectKind::High}, 1};
    case Event::Low: return {{DetectKind::Low}, 1};
    case Event::AsyncRisingEdge: return {{DetectKind::AsyncRising}, 1};
    case Event::AsyncFallingEdge: return {{DetectKind::AsyncFalling}, 1};
    case Event::AsyncBothEdges: return {{DetectKind::AsyncRising, DetectKind::AsyncFalling}, 2};
    }
    return {};
}

uint32_t detect_enable_offset(DetectKind kind, Bank bank) noexcept {
    uint32_t base = reg::GPREN0;
    switch (kind) {
    case DetectKind::Rising: base = reg::GPREN0; break;
    case DetectKind::Falling: base = reg::GPFEN0; break;
    case DetectKind::High: base = reg::GPHEN0; break;
    case DetectKind::Low: base = reg::GPLEN0; break;
    case DetectKind::AsyncRising: base = reg::GPAREN0; break;
    case DetectKind::AsyncFalling: base = reg::GPAFEN0; break;
    }
    return banked(base, bank);
}

ReadWrite RegisterMap::function_select(uint32_t index) const {
    if (index >= reg::kFunctionSelectCount) {
        throw std::out_of_range("no function select register " + std::to_string(index));
    }
    return ReadWrite(*block_, reg::GPFSEL0 + index * 4);
}

WriteOnly RegisterMap::output_set(Bank bank) const {
    return WriteOnly(*block_, banked(reg::GPSET0, bank));
}

WriteOnly RegisterMap::output_clear(Bank bank) const {
    return WriteOnly(*block_, banked(reg::GPCLR0, bank));
}

ReadOnly RegisterMap::level(Bank bank) const {
    return ReadOnly(*block_, banked(reg::GPLEV0, bank));
}

ReadWrite RegisterMap::event_status(Bank bank) const {
    return ReadWrite(*block_, banked(reg::GPEDS0, bank));
}

ReadWrite RegisterMap::detect_enable(DetectKind kind, Bank bank) const {
    return ReadWrite(*block_, detect_enable_offset(kind, bank));
}

ReadWrite RegisterMap::pull_control() const {
    return ReadWrite(*block_, reg::GPPUD);
}

ReadWrite RegisterMap::pull_clock(Bank bank) const {
    return ReadWrite(*block_, banked(reg::GPPUDCLK0, bank));
}

} // namespace gpio
