#include "gpio/bcm2835_registers.hpp"
#include "logging.hpp"

#include <bcm2835.h>
#include <sched.h>
#include <sys/mman.h>
#include <cerrno>
#include <charconv>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <stdexcept>

namespace gpio {

namespace {

// Scheduler policy and affinity of the calling thread, saved so they can be put back.
class RealtimeScope {
public:
    bool enter() {
        policy_ = sched_getscheduler(0);
        if (policy_ == -1 || sched_getparam(0, &param_) != 0) {
            LOG_HAL_ERROR("cannot query scheduler: %s", std::strerror(errno));
            return false;
        }

        sched_param fifo{};
        fifo.sched_priority = sched_get_priority_max(SCHED_FIFO);
        if (sched_setscheduler(0, SCHED_FIFO, &fifo) != 0) {
            LOG_HAL_ERROR("SCHED_FIFO refused: %s", std::strerror(errno));
            return false;
        }
        elevated_ = true;

        CPU_ZERO(&affinity_);
        affinity_saved_ = sched_getaffinity(0, sizeof(affinity_), &affinity_) == 0;
        const int cpu = target_cpu();
        cpu_set_t one;
        CPU_ZERO(&one);
        CPU_SET(static_cast<unsigned>(cpu), &one);
        if (sched_setaffinity(0, sizeof(one), &one) == 0) {
            pinned_ = true;
            LOG_HAL_DEBUG("pinned to CPU %d", cpu);
        } else {
            LOG_HAL_WARN("cannot pin to CPU %d: %s", cpu, std::strerror(errno));
        }
        return true;
    }

    void leave() {
        if (elevated_ && sched_setscheduler(0, policy_, &param_) != 0) {
            LOG_HAL_WARN("cannot restore scheduler policy: %s", std::strerror(errno));
        }
        if (pinned_ && affinity_saved_ && sched_setaffinity(0, sizeof(affinity_), &affinity_) != 0) {
            LOG_HAL_WARN("cannot restore CPU affinity: %s", std::strerror(errno));
        }
        *this = RealtimeScope{};
    }

    static bool requested() {
        const char* env = std::getenv("PINWORKS_REALTIME");
        return env == nullptr || std::strcmp(env, "0") != 0;
    }

private:
    static int target_cpu() {
        const char* env = std::getenv("PINWORKS_PIN_CPU");
        if (env == nullptr) {
            return 0;
        }
        int cpu = 0;
        const char* end = env + std::strlen(env);
        const auto result = std::from_chars(env, end, cpu);
        if (result.ec != std::errc() || result.ptr != end || cpu < 0 || cpu >= CPU_SETSIZE) {
            LOG_HAL_WARN("ignoring PINWORKS_PIN_CPU='%s', using CPU 0", env);
            return 0;
        }
        return cpu;
    }

    int policy_ = SCHED_OTHER;
    sched_param param_{};
    cpu_set_t affinity_{};
    bool elevated_ = false;
    bool pinned_ = false;
    bool affinity_saved_ = false;
};

struct SessionState {
    std::mutex mutex;
    unsigned users = 0;
    bool memory_locked = false;
    RealtimeScope realtime;
};

SessionState& session_state() {
    static SessionState state;
    return state;
}

} // namespace

bool bcm2835_session_start() {
    SessionState& state = session_state();
    std::lock_guard<std::mutex> lock(state.mutex);
    if (state.users > 0) {
        ++state.users;
        return true;
    }

    if (!bcm2835_init()) {
        LOG_HAL_ERROR("bcm2835_init failed; root or /dev/gpiomem access is required");
        return false;
    }

    if (!state.memory_locked) {
        state.memory_locked = mlockall(MCL_CURRENT | MCL_FUTURE) == 0;
        if (!state.memory_locked) {
            LOG_HAL_WARN("mlockall failed: %s", std::strerror(errno));
        }
    }

    if (RealtimeScope::requested() && !state.realtime.enter()) {
        state.realtime.leave();
        bcm2835_close();
        return false;
    }

    state.users = 1;
    LOG_HAL_INFO("bcm2835 session started");
    return true;
}

void bcm2835_session_stop() {
    SessionState& state = session_state();
    std::lock_guard<std::mutex> lock(state.mutex);
    if (state.users == 0 || --state.users > 0) {
        return;
    }
    state.realtime.leave();
    bcm2835_close();
    LOG_HAL_INFO("bcm2835 session stopped");
}

Bcm2835Session::Bcm2835Session(bool throw_on_failure)
    : active_(bcm2835_session_start())
{
    if (!active_ && throw_on_failure) {
        throw std::runtime_error("bcm2835 session could not be started");
    }
}

Bcm2835Session::Bcm2835Session(Bcm2835Session&& other) noexcept
    : active_(other.active_)
{
    other.active_ = false;
}

Bcm2835Session& Bcm2835Session::operator=(Bcm2835Session&& other) noexcept
{
    if (this != &other) {
        if (active_) {
            bcm2835_session_stop();
        }
        active_ = other.active_;
        other.active_ = false;
    }
    return *this;
}

Bcm2835Session::~Bcm2835Session()
{
    if (active_) {
        bcm2835_session_stop();
    }
}

Bcm2835RegisterBlock::Bcm2835RegisterBlock(const BoardConfig& board)
    : session_(true)
{
    if (bcm2835_gpio == nullptr || bcm2835_gpio == MAP_FAILED) {
        throw std::runtime_error("bcm2835 did not map the GPIO block");
    }
    const auto mapped_base = static_cast<unsigned long long>(bcm2835_peripherals_base);
    if (mapped_base != board.peripheral_base) {
        LOG_HAL_WARN("board '%.*s' expects peripherals at 0x%llx, bcm2835 mapped 0x%llx",
                     static_cast<int>(board.name.size()), board.name.data(),
                     (unsigned long long)board.peripheral_base, mapped_base);
    }
    LOG_HAL_DEBUG("GPIO block at 0x%llx", mapped_base + PINWORKS_GPIO_OFFSET);
}

uint32_t Bcm2835RegisterBlock::read(uint32_t offset) const {
    return bcm2835_peri_read(bcm2835_gpio + offset / 4);
}

void Bcm2835RegisterBlock::write(uint32_t offset, uint32_t value) {
    bcm2835_peri_write(bcm2835_gpio + offset / 4, value);
}

} // namespace gpio
