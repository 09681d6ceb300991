#include "gpio/event_bank.hpp"
#include "gpio/memory_registers.hpp"

#include <cassert>
#include <memory>
#include <stdexcept>
#include <vector>

using namespace gpio;

namespace {

// Records the status register the moment a callback runs.
struct Probe {
    const MemoryRegisterBlock* block = nullptr;
    uint32_t status_offset = 0;
    std::vector<uint32_t> seen;

    Callback callback() {
        return [this] { seen.push_back(block->peek(status_offset)); };
    }
};

void acknowledge_before_callback() {
    MemoryRegisterBlock block;
    RegisterMap map(block);
    EventBank bank(Bank::Bank0, 32);

    Probe probe{&block, reg::GPEDS0, {}};
    assert(register_recurring(bank, map, 17, Event::RisingEdge, probe.callback()));
    assert(bank.state(17) == SlotState::Recurring);
    assert(block.peek(reg::GPREN0) == (1u << 17));

    // Plain storage keeps whatever the acknowledge writes back.
    block.poke(reg::GPEDS0, 1u << 17);
    block.clear_log();
    assert(dispatch(bank, map) == 1);
    assert(probe.seen.size() == 1);

    const auto acks = block.writes_to(reg::GPEDS0);
    assert(acks.size() == 1);
    assert(acks[0].value == (1u << 17));
    assert(block.writes().front().offset == reg::GPEDS0);

    // Recurring callbacks stay armed
    assert(bank.state(17) == SlotState::Recurring);
    assert(dispatch(bank, map) == 1);
    assert(probe.seen.size() == 2);
}

void acknowledge_clears_simulated_status() {
    SimulatedGpioBlock block;
    RegisterMap map(block);
    EventBank bank(Bank::Bank0, 32);

    Probe probe{&block, reg::GPEDS0, {}};
    assert(register_recurring(bank, map, 17, Event::RisingEdge, probe.callback()));
    block.drive_input(17, true);
    assert(block.event_pending(17));
    assert(dispatch(bank, map) == 1);
    assert(probe.seen.size() == 1);
    assert(probe.seen[0] == 0);
    assert(!block.event_pending(17));
    assert(dispatch(bank, map) == 0);
}

void unregister_clears_all_enables() {
    MemoryRegisterBlock block;
    RegisterMap map(block);
    EventBank bank(Bank::Bank1, 22);

    for (DetectKind kind : kAllDetectKinds) {
        block.poke(detect_enable_offset(kind, Bank::Bank1), 0xFFFFFFFFu);
    }
    int calls = 0;
    assert(register_recurring(bank, map, 40, Event::BothEdges, [&] { ++calls; }));
    assert(register_oneshot(bank, map, 41, Event::High, [&] { ++calls; }));

    assert(unregister(bank, map, 40));
    assert(bank.state(8) == SlotState::Empty);
    for (DetectKind kind : kAllDetectKinds) {
        assert(block.peek(detect_enable_offset(kind, Bank::Bank1)) == ~(1u << 8));
        assert(block.peek(detect_enable_offset(kind, Bank::Bank0)) == 0);
    }
    assert(bank.state(9) == SlotState::Oneshot);

    // Events for the removed pin invoke nothing
    block.poke(reg::GPEDS1, 1u << 8);
    assert(dispatch(bank, map) == 0);
    assert(calls == 0);
}

void unregister_clears_oneshot_slot() {
    MemoryRegisterBlock block;
    RegisterMap map(block);
    EventBank bank(Bank::Bank1, 22);

    int calls = 0;
    assert(register_oneshot(bank, map, 40, Event::FallingEdge, [&] { ++calls; }));
    assert(bank.state(8) == SlotState::Oneshot);
    assert(block.peek(detect_enable_offset(DetectKind::Falling, Bank::Bank1)) == (1u << 8));

    assert(unregister(bank, map, 40));
    assert(bank.state(8) == SlotState::Empty);
    for (DetectKind kind : kAllDetectKinds) {
        assert(block.peek(detect_enable_offset(kind, Bank::Bank1)) == 0);
    }
    block.poke(reg::GPEDS1, 1u << 8);
    assert(dispatch(bank, map) == 0);
    assert(calls == 0);
}

void throwing_callback_does_not_stop_dispatch() {
    MemoryRegisterBlock block;
    RegisterMap map(block);
    EventBank bank(Bank::Bank0, 32);

    int thrown = 0;
    int later = 0;
    int oneshot_after = 0;
    assert(register_recurring(bank, map, 3, Event::RisingEdge, [&] {
        ++thrown;
        throw std::runtime_error("callback failure");
    }));
    assert(register_oneshot(bank, map, 5, Event::RisingEdge, [] { throw std::runtime_error("one-shot failure"); }));
    assert(register_recurring(bank, map, 9, Event::RisingEdge, [&] { ++later; }));
    assert(register_oneshot(bank, map, 12, Event::RisingEdge, [&] { ++oneshot_after; }));

    block.poke(reg::GPEDS0, (1u << 3) | (1u << 5) | (1u << 9) | (1u << 12));
    assert(dispatch(bank, map) == 4);
    assert(thrown == 1);
    assert(later == 1);
    assert(oneshot_after == 1);
    // The failed one-shot is consumed like any other; the recurring one stays armed
    assert(bank.state(5) == SlotState::Empty);
    assert(bank.state(3) == SlotState::Recurring);

    block.poke(reg::GPEDS0, (1u << 3) | (1u << 9));
    assert(dispatch(bank, map) == 2);
    assert(thrown == 2 && later == 2);
}

void oneshot_supersedes_recurring() {
    SimulatedGpioBlock block;
    RegisterMap map(block);
    EventBank bank(Bank::Bank0, 32);

    int recurring = 0;
    int oneshot = 0;
    assert(register_recurring(bank, map, 5, Event::FallingEdge, [&] { ++recurring; }));
    assert(register_oneshot(bank, map, 5, Event::FallingEdge, [&] { ++oneshot; }));
    assert(bank.state(5) == SlotState::Oneshot);

    block.raise_event(5);
    assert(dispatch(bank, map) == 1);
    assert(oneshot == 1 && recurring == 0);
    assert(bank.state(5) == SlotState::Empty);

    block.raise_event(5);
    assert(dispatch(bank, map) == 0);
    assert(oneshot == 1);

    // And the other way round
    assert(register_oneshot(bank, map, 6, Event::Low, [&] { ++oneshot; }));
    assert(register_recurring(bank, map, 6, Event::Low, [&] { ++recurring; }));
    assert(bank.state(6) == SlotState::Recurring);
    block.raise_event(6);
    assert(dispatch(bank, map) == 1);
    assert(recurring == 1 && oneshot == 1);
}

void composite_events_arm_two_bits() {
    MemoryRegisterBlock block;
    RegisterMap map(block);
    EventBank bank(Bank::Bank0, 32);
    assert(register_recurring(bank, map, 2, Event::AsyncBothEdges, [] {}));
    assert(block.peek(reg::GPAREN0) == (1u << 2));
    assert(block.peek(reg::GPAFEN0) == (1u << 2));
    assert(block.peek(reg::GPREN0) == 0);
}

void contention_is_a_silent_skip() {
    MemoryRegisterBlock block;
    RegisterMap map(block);
    EventBank bank(Bank::Bank0, 32);

    int calls = 0;
    assert(register_recurring(bank, map, 12, Event::RisingEdge, [&] { ++calls; }));

    assert(bank.guard().try_acquire());
    block.clear_log();
    assert(!register_recurring(bank, map, 13, Event::RisingEdge, [&] { ++calls; }));
    assert(!register_oneshot(bank, map, 13, Event::RisingEdge, [&] { ++calls; }));
    assert(!unregister(bank, map, 12));
    assert(block.writes().empty());
    assert(bank.state(13) == SlotState::Empty);
    assert(bank.state(12) == SlotState::Recurring);

    // Dispatch still acknowledges but skips the busy bank's callbacks
    block.poke(reg::GPEDS0, 1u << 12);
    assert(dispatch(bank, map) == 0);
    assert(calls == 0);
    assert(block.writes_to(reg::GPEDS0).size() == 1);

    bank.guard().release();
    block.poke(reg::GPEDS0, 1u << 12);
    assert(dispatch(bank, map) == 1);
    assert(calls == 1);
}

void lowest_pin_first_and_slot_limit() {
    MemoryRegisterBlock block;
    RegisterMap map(block);
    EventBank bank(Bank::Bank1, 22);

    std::vector<uint32_t> order;
    assert(register_recurring(bank, map, 50, Event::High, [&] { order.push_back(50); }));
    assert(register_recurring(bank, map, 33, Event::High, [&] { order.push_back(33); }));

    // Bits above the bank's last pin are acknowledged and ignored
    block.poke(reg::GPEDS1, (1u << 18) | (1u << 1) | (1u << 30));
    assert(dispatch(bank, map) == 2);
    assert((order == std::vector<uint32_t>{33, 50}));
    assert(block.writes_to(reg::GPEDS1).back().value == ((1u << 18) | (1u << 1) | (1u << 30)));
}

void recurring_survives_unregister_in_flight() {
    MemoryRegisterBlock block;
    RegisterMap map(block);
    EventBank bank(Bank::Bank0, 32);

    auto witness = std::make_shared<int>(0);
    std::weak_ptr<int> alive = witness;
    bool cleared_inside = false;
    assert(register_recurring(bank, map, 7, Event::RisingEdge, [&bank, &map, &cleared_inside, witness] {
        cleared_inside = unregister(bank, map, 7);
        // The callable, and the state it captured, outlive the unregister above.
        ++*witness;
    }));
    witness.reset();

    block.poke(reg::GPEDS0, 1u << 7);
    assert(dispatch(bank, map) == 1);
    assert(cleared_inside);
    assert(bank.state(7) == SlotState::Empty);
    assert(alive.expired());
}

void routing_faults() {
    MemoryRegisterBlock block;
    RegisterMap map(block);
    EventBank bank0(Bank::Bank0, 32);
    EventBank bank1(Bank::Bank1, 8);

    bool threw = false;
    try {
        (void)register_recurring(bank0, map, 40, Event::RisingEdge, [] {});
    } catch (const std::logic_error&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        (void)unregister(bank1, map, 45);
    } catch (const std::logic_error&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        (void)register_oneshot(bank0, map, 3, Event::RisingEdge, Callback{});
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
    assert(bank0.state(3) == SlotState::Empty);
}

void line_is_armed_once() {
    EventBank bank(Bank::Bank0, 32);
    assert(!bank.line_armed());
    assert(bank.arm_line());
    assert(!bank.arm_line());
    assert(bank.line_armed());
}

} // namespace

int main() {
    acknowledge_before_callback();
    acknowledge_clears_simulated_status();
    unregister_clears_all_enables();
    unregister_clears_oneshot_slot();
    throwing_callback_does_not_stop_dispatch();
    oneshot_supersedes_recurring();
    composite_events_arm_two_bits();
    contention_is_a_silent_skip();
    lowest_pin_first_and_slot_limit();
    recurring_survives_unregister_in_flight();
    routing_faults();
    line_is_armed_once();
    return 0;
}
