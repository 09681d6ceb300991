#ifndef GPIO_ERROR_HPP
#define GPIO_ERROR_HPP

#include <stdexcept>
#include <string>

namespace gpio {

enum class ErrorCode {
    InvalidPinId,           // id outside the board's pin range
    PinInUse,               // acquire on a claimed pin
    PinNotInUse,            // release on an unclaimed pin
    UnsupportedAltFunction, // alt function index outside 0..5
    AlreadyInstantiated,    // a peripheral handle is already alive
    PinStateMismatch,       // operation not valid for the pin's current function
};

const char* to_string(ErrorCode code) noexcept;

// Recoverable GPIO failure reported to the caller.
class GpioError : public std::runtime_error {
public:
    GpioError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

} // namespace gpio

#endif // GPIO_ERROR_HPP
