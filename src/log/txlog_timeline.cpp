#include "log/txlog_timeline.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>

namespace txlog {

namespace {

// 列宽：操作列8，时间列34，字节列13
const char* OPER_HEADER = "  oper. ";
const char* TIMES_HEADER = "---- start ---- end -- duration --";
const char* BYTES_HEADER = "- sent  recv ";
const size_t OPER_WIDTH = 8;
const size_t TIMES_WIDTH = 34;
const size_t BYTES_WIDTH = 13;

// 用于避免时间轴字符串过长的迭代上限
const int MAX_SCALE_ITERATIONS = 64;

std::string frameLine(int width) {
    return "+" + std::string(OPER_WIDTH, '-') + "+" + std::string(width + 2, '-') + "+" +
           std::string(TIMES_WIDTH, '-') + "+" + std::string(BYTES_WIDTH, '-') + "+";
}

std::string optionalBytes(const std::optional<int64_t>& bytes) {
    return bytes ? std::to_string(*bytes) : std::string();
}

} // namespace

double TimelineRenderer::computeScale(Duration total, int& width) {
    double seconds = std::max(0.0, Clock::toSeconds(total));
    double scale = MIN_SCALE_SECONDS;
    bool flag = false;
    int iterations = 0;
    double columns = seconds / scale;
    while (columns > MAX_WIDTH && iterations < MAX_SCALE_ITERATIONS) {
        scale *= flag ? 5.0 : 2.0;
        flag = !flag;
        columns = seconds / scale;
        ++iterations;
    }
    width = static_cast<int>(std::min(columns, static_cast<double>(MAX_WIDTH)));
    return scale;
}

char TimelineRenderer::cellGlyph(int pos, int count, double start, double end, bool skip) {
    double cb = 1.0 * pos / count;
    double ce = 1.0 * (pos + 1) / count;

    if (cb >= end) return ' ';
    if (ce < start) return skip ? PREVIOUS_ATTEMPT_GLYPH : BEFORE_START_GLYPH;

    double x = count * (std::min(ce, end) - std::max(cb, start));
    if (x < 0) x = 0;
    if (x > 1) x = 1;

    long p = std::lround(x * 10);
    return GLYPH_RAMP[p];
}

std::string TimelineRenderer::buildGraph(int width, Duration offset, Duration duration, Duration total, int skip) {
    if (width <= 0) {
        return std::string();
    }
    if (total.count() <= 0) {
        return std::string(width, ' ');
    }

    double begin = static_cast<double>(offset.count()) / total.count();
    double end = static_cast<double>((offset + duration).count()) / total.count();

    std::string graph(width, ' ');
    for (int i = 0; i < width; i++) {
        graph[i] = cellGlyph(i, width, begin, end, i < skip);
    }
    return graph;
}

std::string TimelineRenderer::renderCommands(const EventLogSnapshot& snapshot) {
    std::ostringstream oss;
    oss << "Transaction #" << snapshot.id << " command log:\n";

    int reads = 0, writes = 0;
    const size_t count = snapshot.commands.size();
    for (size_t i = 0; i < count; ++i) {
        const Command& cmd = snapshot.commands[i];
        oss << Utils::padLeft(std::to_string(i + 1), 3) << "/" << Utils::padLeft(std::to_string(count), 3)
            << " : " << cmd.toString() << "\n";
        switch (cmd.mode()) {
            case Mode::READ: ++reads; break;
            case Mode::WRITE: ++writes; break;
            default: break;
        }
    }

    oss << "Stats: " << snapshot.operations << " operations (" << reads << " reads, " << writes
        << " writes), " << snapshot.commit_size << " committed bytes\n";
    return oss.str();
}

std::string TimelineRenderer::render(const EventLogSnapshot& snapshot, bool show_commands) {
    std::ostringstream oss;
    const Duration total = snapshot.total_duration;

    int width = 0;
    double scale = computeScale(total, width);

    // 表头
    oss << "Transaction #" << snapshot.id << " (" << snapshot.commands.size() << " operations, '#' = "
        << Utils::formatThousands(scale * 1000.0, 1) << " ms, started "
        << Utils::formatTimeOfDay(snapshot.started_at) << "Z";
    if (snapshot.stopped_at) {
        oss << ", ended " << Utils::formatTimeOfDay(*snapshot.stopped_at) << "Z)\n";
    } else {
        oss << ", did not finish)\n";
    }
    oss << "+" << OPER_HEADER << "+" << std::string(width + 2, '-') << "+" << TIMES_HEADER << "+"
        << BYTES_HEADER << "+\n";

    int previous_step = -1;
    bool previous_was_on_error = false;
    int attempts = 1;
    int chars_to_skip = 0;

    for (const Command& cmd : snapshot.commands) {
        if (previous_was_on_error) {
            oss << frameLine(width) << " == Attempt #" << ++attempts << " ==\n";
        }

        // 进行中的命令画到事务结束
        Duration end = cmd.end_offset ? *cmd.end_offset : std::max(total, cmd.start_offset);
        Duration length = end - cmd.start_offset;
        std::string graph = buildGraph(width, cmd.start_offset, length, total, chars_to_skip);

        char intensity = ' ';
        if (length >= std::chrono::milliseconds(10)) {
            intensity = '*';
        } else if (length >= std::chrono::milliseconds(1)) {
            intensity = '~';
        }

        oss << "|" << (cmd.step == previous_step ? ':' : ' ')
            << Utils::padRight(std::to_string(cmd.step), 3)
            << (cmd.failed() ? '!' : ' ')
            << Utils::padLeft(cmd.shortName(), 2)
            << intensity
            << "| " << graph << " | T+"
            << Utils::padLeft(Utils::formatFixed(Clock::toMilliseconds(cmd.start_offset), 3), 7)
            << " ~ "
            << Utils::padLeft(cmd.end_offset ? Utils::formatFixed(Clock::toMilliseconds(*cmd.end_offset), 3)
                                             : std::string("open"), 7)
            << " (" << Utils::padLeft(Utils::formatThousands(std::llround(Clock::toMicroseconds(length))), 7)
            << " us) | " << Utils::padLeft(optionalBytes(cmd.argument_bytes), 5) << " "
            << Utils::padLeft(optionalBytes(cmd.result_bytes), 5) << " |";
        if (show_commands) {
            oss << " " << cmd.toString();
        }
        oss << "\n";

        previous_was_on_error = cmd.op == Operation::ON_ERROR;
        if (previous_was_on_error && total.count() > 0) {
            chars_to_skip = static_cast<int>(std::floor(1.0 * width * end.count() / total.count()));
        }
        previous_step = cmd.step;
    }

    oss << frameLine(width) << "\n";

    // 汇总
    double total_ms = Clock::toMilliseconds(total);
    if (snapshot.completed) {
        bool any = false;
        if (snapshot.read_size > 0) {
            oss << "Read " << Utils::formatThousands(snapshot.read_size) << " bytes";
            any = true;
        }
        if (snapshot.commit_size > 0) {
            if (any) oss << " and ";
            oss << "Committed " << Utils::formatThousands(snapshot.commit_size) << " bytes";
            any = true;
        }
        if (!any) oss << "Completed";
        oss << " in " << Utils::formatThousands(total_ms, 3) << " ms and " << attempts << " attempt(s)\n";
    } else {
        oss << "Did not finish after " << Utils::formatThousands(total_ms, 3) << " ms and " << attempts
            << " attempt(s)\n";
    }
    return oss.str();
}

} // namespace txlog
