#pragma once

#include <string>
#include <chrono>
#include <cstdint>
#include "txlog_core.hpp"

namespace txlog {

// 工具函数
class Utils {
public:
    // 操作类型名称
    static std::string operationToString(Operation op);

    // 时间轴中使用的两个字符的缩写
    static std::string operationShortName(Operation op);

    // 操作所属的统计分类
    static Mode operationMode(Operation op);

    static std::string mutationTypeToString(MutationType type);
    static std::string errorCodeToString(ErrorCode code);

    // 可打印的键，不可见字节输出为<XX>
    static std::string printableKey(const std::string& key);
    // 值过长时截断
    static std::string printableValue(const std::string& value, size_t max_length = 64);

    // 与区域设置无关的数字格式化
    static std::string formatFixed(double value, int decimals);
    static std::string formatThousands(int64_t value);
    static std::string formatThousands(double value, int decimals);
    static std::string padLeft(const std::string& str, size_t width);
    static std::string padRight(const std::string& str, size_t width);

    // UTC时刻的 HH:MM:SS.ffffff 表示
    static std::string formatTimeOfDay(Timestamp ts);

    // 当前线程的执行上下文编号，每个线程首次调用时分配
    static uint64_t currentContextId();

    // 检查字符串是否为非负整数
    static bool isNumeric(const std::string& str);

    // 布尔配置值 yes/true/1
    static bool parseBool(const std::string& str);
};

// 打印调用栈
void printBacktrace();

// 注册崩溃信号处理函数
void setSignalHandler();

} // namespace txlog
