#include "gpio/error.hpp"
#include "gpio/pin_registry.hpp"

#include <cassert>
#include <stdexcept>

using namespace gpio;

namespace {
template <typename Fn>
ErrorCode expect_error(Fn&& fn) {
    try {
        fn();
    } catch (const GpioError& ex) {
        return ex.code();
    }
    assert(false && "expected GpioError");
    return ErrorCode::PinStateMismatch;
}
}

int main() {
    PinRegistry registry(54);
    assert(registry.pin_count() == 54);
    assert(registry.used_count() == 0);

    const uint32_t first_claim = registry.claim(17);
    assert(first_claim != 0);
    assert(registry.in_use(17));
    assert(registry.holds(17, first_claim));
    assert(registry.used_count() == 1);

    assert(expect_error([&] { registry.claim(17); }) == ErrorCode::PinInUse);
    assert(expect_error([&] { registry.claim(54); }) == ErrorCode::InvalidPinId);
    assert(expect_error([&] { registry.release(54); }) == ErrorCode::InvalidPinId);
    assert(expect_error([&] { registry.release(3); }) == ErrorCode::PinNotInUse);

    registry.release(17);
    assert(!registry.in_use(17));
    assert(!registry.holds(17, first_claim));
    const uint32_t second_claim = registry.claim(17);
    assert(registry.in_use(17));
    assert(second_claim != first_claim);
    assert(registry.holds(17, second_claim) && !registry.holds(17, first_claim));
    assert(!registry.holds(17, 0));

    registry.claim(0);
    registry.claim(53);
    assert(registry.used_count() == 3);
    assert(!registry.in_use(99));

    // A 40-pin board rejects the upper ids
    PinRegistry header(40);
    header.claim(39);
    assert(expect_error([&] { header.claim(40); }) == ErrorCode::InvalidPinId);

    bool threw = false;
    try {
        PinRegistry invalid(55);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        PinRegistry empty(0);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    return 0;
}
