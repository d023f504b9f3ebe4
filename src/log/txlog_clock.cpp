#include "log/txlog_clock.hpp"
#include <cmath>

namespace txlog {

namespace {

const int64_t NANOS_PER_SECOND = 1000000000;

// 进程启动时确定一次
const int64_t STEADY_TICKS_PER_SECOND =
    std::chrono::steady_clock::period::den / std::chrono::steady_clock::period::num;

} // namespace

int64_t SteadyClock::ticks() const {
    return std::chrono::steady_clock::now().time_since_epoch().count();
}

int64_t SteadyClock::ticksPerSecond() const {
    return STEADY_TICKS_PER_SECOND;
}

Timestamp SteadyClock::wallNow() const {
    return std::chrono::system_clock::now();
}

int64_t Clock::now() {
    return SteadyClock::getInstance().ticks();
}

Duration Clock::durationSince(int64_t tick) {
    return toDuration(now() - tick, STEADY_TICKS_PER_SECOND);
}

Duration Clock::toDuration(int64_t elapsed_ticks, int64_t ticks_per_second) {
    if (ticks_per_second <= 0) {
        return Duration::zero();
    }
    if (NANOS_PER_SECOND % ticks_per_second == 0) {
        return Duration(elapsed_ticks * (NANOS_PER_SECOND / ticks_per_second));
    }
    double nanos = static_cast<double>(elapsed_ticks) * 1e9 / static_cast<double>(ticks_per_second);
    // std::llround 对 .5 远离零取整
    return Duration(std::llround(nanos));
}

} // namespace txlog
