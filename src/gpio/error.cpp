#include "gpio/error.hpp"

namespace gpio {

const char* to_string(ErrorCode code) noexcept {
    switch (code) {
    case ErrorCode::InvalidPinId: return "InvalidPinId";
    case ErrorCode::PinInUse: return "PinInUse";
    case ErrorCode::PinNotInUse: return "PinNotInUse";
    case ErrorCode::UnsupportedAltFunction: return "UnsupportedAltFunction";
    case ErrorCode::AlreadyInstantiated: return "AlreadyInstantiated";
    case ErrorCode::PinStateMismatch: return "PinStateMismatch";
    }
    return "Unknown";
}

} // namespace gpio
