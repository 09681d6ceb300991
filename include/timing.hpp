#ifndef TIMING_HPP
#define TIMING_HPP

#include <stdint.h>

// Monotonic timestamp in nanoseconds (CLOCK_MONOTONIC_RAW)
uint64_t get_timestamp_ns();

// Nanoseconds elapsed since a timestamp taken with get_timestamp_ns()
uint64_t elapsed_since_ns(uint64_t start_ns);

// Busy-wait for a specified number of nanoseconds
void busy_wait_ns(uint64_t ns);

// Busy-wait for a specific number of cycles. Used where the peripheral only
// asks for "at least N cycles" and no clock is involved.
void busy_wait_cycles(uint32_t cycles);

// Sleep the calling thread; used by polling loops that must not burn a core.
void sleep_ns(uint64_t ns);

#endif // TIMING_HPP
