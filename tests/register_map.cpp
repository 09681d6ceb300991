#include "gpio/memory_registers.hpp"
#include "gpio/registers.hpp"

#include <cassert>
#include <stdexcept>

using namespace gpio;

int main() {
    // Function codes
    assert(encode(Function::Input) == FunctionCode::Input);
    assert(static_cast<uint32_t>(encode(Function::Output)) == 0b001);
    assert(static_cast<uint32_t>(encode(Function::Alt0)) == 0b100);
    assert(static_cast<uint32_t>(encode(Function::Alt4)) == 0b011);
    assert(static_cast<uint32_t>(encode(Function::Alt5)) == 0b010);
    assert(decode_function(0b111) == Function::Alt3);
    assert(decode_function(0b110) == Function::Alt2);
    bool threw = false;
    try {
        (void)encode(Function::Unknown);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    // Field locations
    assert(function_field(17).shift == 21);
    assert(function_field(17).mask == 0x7);
    assert(function_field(40).shift == 0);
    assert(pin_field(40).shift == 8);
    assert(kPullControlField.in_place() == 0x3);

    // Detect-enable layout: bank1 sits one word above bank0
    assert(detect_enable_offset(DetectKind::Rising, Bank::Bank0) == 0x4C);
    assert(detect_enable_offset(DetectKind::Rising, Bank::Bank1) == 0x50);
    assert(detect_enable_offset(DetectKind::Falling, Bank::Bank1) == 0x5C);
    assert(detect_enable_offset(DetectKind::High, Bank::Bank0) == 0x64);
    assert(detect_enable_offset(DetectKind::Low, Bank::Bank1) == 0x74);
    assert(detect_enable_offset(DetectKind::AsyncRising, Bank::Bank0) == 0x7C);
    assert(detect_enable_offset(DetectKind::AsyncFalling, Bank::Bank1) == 0x8C);

    const DetectSet both = detect_kinds(Event::BothEdges);
    assert(both.count == 2);
    assert(both.kinds[0] == DetectKind::Rising && both.kinds[1] == DetectKind::Falling);
    const DetectSet async_both = detect_kinds(Event::AsyncBothEdges);
    assert(async_both.count == 2 && async_both.kinds[1] == DetectKind::AsyncFalling);
    assert(detect_kinds(Event::Low).count == 1);

    // Named registers resolve to the documented offsets
    MemoryRegisterBlock block;
    RegisterMap map(block);
    assert(map.function_select(0).offset() == 0x00);
    assert(map.function_select(5).offset() == 0x14);
    assert(map.output_set(Bank::Bank1).offset() == 0x20);
    assert(map.output_clear(Bank::Bank0).offset() == 0x28);
    assert(map.level(Bank::Bank1).offset() == 0x38);
    assert(map.event_status(Bank::Bank0).offset() == 0x40);
    assert(map.pull_control().offset() == 0x94);
    assert(map.pull_clock(Bank::Bank1).offset() == 0x9C);
    threw = false;
    try {
        (void)map.function_select(6);
    } catch (const std::out_of_range&) {
        threw = true;
    }
    assert(threw);

    // Read-modify-write keeps the neighbouring fields
    block.poke(reg::GPFSEL0 + 4, 0xFFFFFFFFu);
    map.function_select(1).modify(function_field(17), static_cast<uint32_t>(FunctionCode::Output));
    assert(block.peek(reg::GPFSEL0 + 4) == ((0xFFFFFFFFu & ~(0x7u << 21)) | (0x1u << 21)));
    assert(map.function_select(1).read_field(function_field(17)) == 0b001);
    assert(block.writes().size() == 1);

    // Offsets outside the block are rejected
    threw = false;
    try {
        block.write(reg::kBlockSize, 1);
    } catch (const std::out_of_range&) {
        threw = true;
    }
    assert(threw);
    assert(block.writes().size() == 1);

    // Simulated block: set/clear drive the level, status is write-1-to-clear
    SimulatedGpioBlock sim;
    RegisterMap sim_map(sim);
    sim_map.output_set(Bank::Bank0).set(1u << 4);
    assert(sim.level_of(4));
    assert(sim.peek(reg::GPSET0) == 0);
    sim_map.output_clear(Bank::Bank0).set(1u << 4);
    assert(!sim.level_of(4));

    sim.raise_event(3);
    sim.raise_event(5);
    assert(sim_map.event_status(Bank::Bank0).get() == ((1u << 3) | (1u << 5)));
    sim_map.event_status(Bank::Bank0).set(1u << 3);
    assert(sim_map.event_status(Bank::Bank0).get() == (1u << 5));

    // Edges latch only where detection is enabled
    sim_map.detect_enable(DetectKind::Rising, Bank::Bank1).modify(pin_field(40), 1);
    sim.drive_input(40, true);
    assert(sim.event_pending(40));
    sim_map.event_status(Bank::Bank1).set(pin_mask(40));
    sim.drive_input(40, false);
    assert(!sim.event_pending(40));
    sim.drive_input(41, true);
    assert(!sim.event_pending(41));

    return 0;
}
