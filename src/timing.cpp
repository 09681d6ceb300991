#include "timing.hpp"
#include <cerrno>
#include <time.h>

uint64_t get_timestamp_ns() {
    struct timespec ts;
    clock_gettime(CLOCK_MONOTONIC_RAW, &ts);
    return static_cast<uint64_t>(ts.tv_sec) * 1000000000ULL + static_cast<uint64_t>(ts.tv_nsec);
}

uint64_t elapsed_since_ns(uint64_t start_ns) {
    return get_timestamp_ns() - start_ns;
}

void busy_wait_ns(uint64_t ns) {
    uint64_t start = get_timestamp_ns();
    while (get_timestamp_ns() - start < ns);
}

void busy_wait_cycles(uint32_t cycles) {
    for (uint32_t i = 0; i < cycles; ++i) {
        asm volatile("nop");
    }
}

void sleep_ns(uint64_t ns) {
    struct timespec req;
    req.tv_sec = static_cast<time_t>(ns / 1000000000ULL);
    req.tv_nsec = static_cast<long>(ns % 1000000000ULL);
    // EINTR leaves the remaining time in req
    while (nanosleep(&req, &req) != 0 && errno == EINTR) {
    }
}
