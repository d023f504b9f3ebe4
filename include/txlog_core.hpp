#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <memory>
#include <chrono>
#include <stdexcept>

namespace txlog {

// 基础类型定义
using Key = std::string;
using Value = std::string;
using Timestamp = std::chrono::system_clock::time_point;
// 记录器内部的时间精度
using Duration = std::chrono::nanoseconds;

using TransactionID = uint64_t;
const TransactionID NO_TX = 0;

// 存储提交版本号，-1 表示没有提交版本（只读事务）
using Version = int64_t;
const Version NO_VERSION = -1;

// 事务操作类型枚举
enum class Operation {
    INVALID = 0,
    // 写操作
    SET,
    CLEAR,
    CLEAR_RANGE,
    ATOMIC,
    ADD_CONFLICT_RANGE,
    // 读操作
    GET,
    GET_KEY,
    GET_VALUES,
    GET_KEYS,
    GET_RANGE,
    WATCH,
    // 事务控制
    GET_READ_VERSION,
    COMMIT,
    CANCEL,
    RESET,
    ON_ERROR,
    // 注释
    LOG
};

// 操作分类，用于统计读写次数
enum class Mode {
    INVALID = 0,
    READ,
    WRITE,
    META,
    WATCH,
    ANNOTATION
};

// 原子操作类型，参数和值都按小端整数解释
enum class MutationType {
    ADD = 0,
    BIT_AND = 1,
    BIT_OR = 2,
    BIT_XOR = 3,
    MAX = 4,
    MIN = 5,
    APPEND_IF_FITS = 6
};

enum class ConflictRangeType {
    READ = 0,
    WRITE = 1
};

// 错误码
enum class ErrorCode {
    OK = 0,
    TRANSACTION_TOO_OLD = 1007,
    FUTURE_VERSION = 1009,
    NOT_COMMITTED = 1020,
    COMMIT_UNKNOWN_RESULT = 1021,
    TRANSACTION_CANCELLED = 1025,
    TRANSACTION_TIMED_OUT = 1031,
    OPERATION_CANCELLED = 1101,
    RETRY_LIMIT_REACHED = 1200,
    INVALID_OPERATION = 2000,
    READ_ONLY = 2020,
    KEY_TOO_LARGE = 2102,
    VALUE_TOO_LARGE = 2103,
    INTERNAL_ERROR = 4100
};

// 是否可以通过重试事务解决
inline bool isRetryable(ErrorCode code) {
    switch (code) {
        case ErrorCode::TRANSACTION_TOO_OLD:
        case ErrorCode::FUTURE_VERSION:
        case ErrorCode::NOT_COMMITTED:
        case ErrorCode::COMMIT_UNKNOWN_RESULT:
            return true;
        default:
            return false;
    }
}

const size_t MAX_KEY_SIZE = 10000;
const size_t MAX_VALUE_SIZE = 100000;

// 键值对
struct KeyValue {
    Key key;
    Value value;

    KeyValue() = default;
    KeyValue(Key k, Value v) : key(std::move(k)), value(std::move(v)) {}

    bool operator==(const KeyValue& other) const {
        return key == other.key && value == other.value;
    }
};

// 挂在命令上的操作错误，记录器只保存不抛出
struct OperationError {
    ErrorCode code;
    std::string message;

    OperationError() : code(ErrorCode::OK) {}
    OperationError(ErrorCode c, std::string m) : code(c), message(std::move(m)) {}
};

// 存储操作失败时抛出的异常
class TransactionError : public std::runtime_error {
public:
    TransactionError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const { return code_; }

    OperationError toOperationError() const {
        return OperationError(code_, what());
    }

private:
    ErrorCode code_;
};

} // namespace txlog

#include "txlog_utils.hpp"
