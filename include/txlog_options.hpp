#pragma once

#include "txlog_core.hpp"
#include "transaction/txlog_transaction.hpp"
#include <string>

namespace txlog {

// 数据库配置，可以从 "key value" 格式的配置文件加载
struct DatabaseOptions {
    static constexpr const char* DEFAULT_DB_NAME = "DB";

    std::string db_name = DEFAULT_DB_NAME;
    bool read_only = false;
    int64_t timeout_ms = 0;             // 0 表示不超时
    int retry_limit = 0;                // 0 表示不限制
    int64_t max_retry_delay_ms = 1000;
    size_t worker_threads = 4;
    std::string log_level = "info";
    std::string log_file;               // 为空则不输出到文件

    // 慢事务追踪
    bool trace_transactions = false;
    int64_t trace_threshold_ms = 0;
    bool trace_show_commands = false;

    // 从配置文件加载，文件无法打开或数值格式错误时返回false
    bool loadFromFile(const std::string& config_file);

    // 设置单个选项，未知的键记录警告后忽略
    bool setOption(const std::string& key, const std::string& value);

    // 新事务使用的选项
    TransactionOptions toTransactionOptions() const;

    // 连接字符串形式，例如 db=DB; readonly; timeout=1.5
    std::string toString() const;
};

} // namespace txlog
