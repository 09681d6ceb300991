// Header-only logging with compile-time levels, one set of macros per component:
//   LOG_GPIO_*  pins, pin registry, event banks and dispatch
//   LOG_HAL_*   register backends, bcm2835 session, interrupt lines, driver
// Levels: 0=NONE, 1=ERROR, 2=WARN, 3=INFO, 4=DEBUG, 5=TRACE.
// A disabled level is a constant-false branch: arguments are type-checked but never evaluated.
// Dispatch runs in interrupt context; it logs at TRACE only.

#ifndef LOGGING_HPP
#define LOGGING_HPP

#include <stdarg.h>
#include <stdint.h>
#include <stdio.h>
#include <stdlib.h>
#include "timing.hpp"

#ifndef LOG_GPIO_LEVEL
#define LOG_GPIO_LEVEL 0
#endif

#ifndef LOG_HAL_LEVEL
#define LOG_HAL_LEVEL 0
#endif

static inline FILE*& logger_output_slot()
{
    static FILE* out = stderr;
    return out;
}

// Caller keeps ownership of f; nullptr restores stderr.
static inline void logger_set_output_file(FILE* f)
{
    FILE*& out = logger_output_slot();
    fflush(out);
    out = f != nullptr ? f : stderr;
}

// Appends to $PINWORKS_LOG_FILE when set. Returns false if the file cannot be opened.
static inline bool logger_open_from_environment()
{
    const char* path = getenv("PINWORKS_LOG_FILE");
    if (path == nullptr || *path == '\0') {
        return true;
    }
    FILE* file = fopen(path, "a");
    if (file == nullptr) {
        return false;
    }
    setvbuf(file, nullptr, _IOLBF, 0);
    logger_set_output_file(file);
    return true;
}

__attribute__((format(printf, 3, 4)))
static inline void logger_log(const char* component, const char* level, const char* fmt, ...)
{
    const uint64_t us = get_timestamp_ns() / 1000;
    FILE* out = logger_output_slot();
    va_list ap;
    va_start(ap, fmt);
    flockfile(out);
    fprintf(out, "[%llu.%06llu] [%s] [%s] ",
            (unsigned long long)(us / 1000000ULL), (unsigned long long)(us % 1000000ULL), level, component);
    vfprintf(out, fmt, ap);
    fputc('\n', out);
    funlockfile(out);
    va_end(ap);
}

#define PINWORKS_LOG(enabled, component, level, fmt, ...) \
    do { if (enabled) logger_log(component, level, fmt, ##__VA_ARGS__); } while (0)

#define LOG_GPIO_TRACE(fmt, ...) PINWORKS_LOG(LOG_GPIO_LEVEL >= 5, "gpio", "TRACE", fmt, ##__VA_ARGS__)
#define LOG_GPIO_DEBUG(fmt, ...) PINWORKS_LOG(LOG_GPIO_LEVEL >= 4, "gpio", "DEBUG", fmt, ##__VA_ARGS__)
#define LOG_GPIO_INFO(fmt, ...)  PINWORKS_LOG(LOG_GPIO_LEVEL >= 3, "gpio", "INFO", fmt, ##__VA_ARGS__)
#define LOG_GPIO_WARN(fmt, ...)  PINWORKS_LOG(LOG_GPIO_LEVEL >= 2, "gpio", "WARN", fmt, ##__VA_ARGS__)
#define LOG_GPIO_ERROR(fmt, ...) PINWORKS_LOG(LOG_GPIO_LEVEL >= 1, "gpio", "ERROR", fmt, ##__VA_ARGS__)

#define LOG_HAL_TRACE(fmt, ...) PINWORKS_LOG(LOG_HAL_LEVEL >= 5, "hal", "TRACE", fmt, ##__VA_ARGS__)
#define LOG_HAL_DEBUG(fmt, ...) PINWORKS_LOG(LOG_HAL_LEVEL >= 4, "hal", "DEBUG", fmt, ##__VA_ARGS__)
#define LOG_HAL_INFO(fmt, ...)  PINWORKS_LOG(LOG_HAL_LEVEL >= 3, "hal", "INFO", fmt, ##__VA_ARGS__)
#define LOG_HAL_WARN(fmt, ...)  PINWORKS_LOG(LOG_HAL_LEVEL >= 2, "hal", "WARN", fmt, ##__VA_ARGS__)
#define LOG_HAL_ERROR(fmt, ...) PINWORKS_LOG(LOG_HAL_LEVEL >= 1, "hal", "ERROR", fmt, ##__VA_ARGS__)

#endif // LOGGING_HPP
