#pragma once

#include "../txlog_core.hpp"
#include <cstdint>
#include <chrono>

namespace txlog {

// 时间来源接口，记录器通过它读取单调计数和挂钟时间
class IClock {
public:
    virtual ~IClock() = default;

    // 单调递增的计数值
    virtual int64_t ticks() const = 0;

    // 每秒的计数值
    virtual int64_t ticksPerSecond() const = 0;

    // 挂钟时间，只用于报表中的开始/结束时刻
    virtual Timestamp wallNow() const = 0;
};

// 基于std::chrono::steady_clock的默认实现
class SteadyClock : public IClock {
public:
    static SteadyClock& getInstance() {
        static SteadyClock instance;
        return instance;
    }

    int64_t ticks() const override;
    int64_t ticksPerSecond() const override;
    Timestamp wallNow() const override;
};

class Clock {
public:
    // 当前单调计数
    static int64_t now();

    // 从tick到现在经过的时间
    static Duration durationSince(int64_t tick);

    // 计数差换算为时间，四舍五入（远离零）
    static Duration toDuration(int64_t elapsed_ticks, int64_t ticks_per_second);

    static double toMilliseconds(Duration d) {
        return std::chrono::duration<double, std::milli>(d).count();
    }

    static double toMicroseconds(Duration d) {
        return std::chrono::duration<double, std::micro>(d).count();
    }

    static double toSeconds(Duration d) {
        return std::chrono::duration<double>(d).count();
    }
};

} // namespace txlog
