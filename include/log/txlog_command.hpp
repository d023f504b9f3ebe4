#pragma once

#include "../txlog_core.hpp"
#include <optional>
#include <string>
#include <vector>

namespace txlog {

// 一条被记录的事务操作
// 结束之后即不可变；进行中的命令只能通过PendingCommand修改
struct Command {
    Operation op;
    std::vector<std::string> args;          // 已转换为可打印形式的参数
    std::string result;                     // 可打印的结果摘要，可为空

    int step;                               // 开始时的步号，步号相同的命令是并发的
    std::optional<int> end_step;            // 结束时分配的新步号
    Duration start_offset;                  // 相对事务开始的偏移
    std::optional<Duration> end_offset;
    std::optional<int64_t> argument_bytes;  // 写入的数据大小
    std::optional<int64_t> result_bytes;    // 读取的数据大小
    uint64_t context_id;                    // 仅用于诊断
    std::optional<OperationError> error;

    Command() : op(Operation::INVALID), step(0), start_offset(Duration::zero()), context_id(0) {}

    explicit Command(Operation o, std::vector<std::string> a = {})
        : op(o), args(std::move(a)), step(0), start_offset(Duration::zero()), context_id(0) {}

    Mode mode() const {
        return Utils::operationMode(op);
    }

    std::string shortName() const {
        return Utils::operationShortName(op);
    }

    bool isOpen() const {
        return !end_offset.has_value();
    }

    bool failed() const {
        return error.has_value();
    }

    // 进行中的命令返回0
    Duration duration() const {
        return end_offset ? (*end_offset - start_offset) : Duration::zero();
    }

    // 例如 Get('foo') => 'bar'
    std::string toString() const;
};

} // namespace txlog
