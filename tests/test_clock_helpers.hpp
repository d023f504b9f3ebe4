#pragma once

#include "log/txlog_clock.hpp"
#include <atomic>
#include <chrono>

namespace txlog {

// 手动推进的时钟，让时间轴测试结果确定
class ManualClock : public IClock {
public:
    // 2024-01-01 12:34:56 UTC
    static constexpr int64_t WALL_BASE_SECONDS = 1704112496;

    explicit ManualClock(int64_t ticks_per_second = 1000000000)
        : ticks_per_second_(ticks_per_second),
          wall_base_(std::chrono::seconds(WALL_BASE_SECONDS)) {}

    int64_t ticks() const override { return ticks_.load(); }
    int64_t ticksPerSecond() const override { return ticks_per_second_; }

    Timestamp wallNow() const override {
        Duration elapsed = Clock::toDuration(ticks_.load(), ticks_per_second_);
        return wall_base_ + std::chrono::duration_cast<Timestamp::duration>(elapsed);
    }

    void advanceTicks(int64_t ticks) { ticks_.fetch_add(ticks); }

    void advance(std::chrono::microseconds d) {
        advanceTicks(d.count() * ticks_per_second_ / 1000000);
    }

private:
    const int64_t ticks_per_second_;
    const Timestamp wall_base_;
    std::atomic<int64_t> ticks_{0};
};

} // namespace txlog
