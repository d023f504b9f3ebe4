#pragma once

#include "txlog_event_log.hpp"
#include <string>

namespace txlog {

// 把事务日志快照渲染为文本报表
class TimelineRenderer {
public:
    // 每个字符代表的最小时间（秒）
    static constexpr double MIN_SCALE_SECONDS = 0.0005;
    // 时间轴的最大宽度（字符）
    static constexpr int MAX_WIDTH = 80;
    // 由空到满的11级字符
    static constexpr const char* GLYPH_RAMP = "`.:;+=xX$&#";
    static constexpr char BEFORE_START_GLYPH = '_';
    static constexpr char PREVIOUS_ATTEMPT_GLYPH = '-';

    // 命令列表报表
    static std::string renderCommands(const EventLogSnapshot& snapshot);

    // 瀑布图报表
    static std::string render(const EventLogSnapshot& snapshot, bool show_commands = false);

    // 从0.5ms开始交替乘2和乘5，直到宽度不超过MAX_WIDTH，返回秒
    static double computeScale(Duration total, int& width);

    // 第pos个格子的字符，start/end为命令在整个事务中的比例区间
    static char cellGlyph(int pos, int count, double start, double end, bool skip);

    // 一条命令的时间轴，前skip个格子属于之前的尝试
    static std::string buildGraph(int width, Duration offset, Duration duration, Duration total, int skip);
};

} // namespace txlog
