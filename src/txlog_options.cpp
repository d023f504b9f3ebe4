#include "txlog_options.hpp"
#include "txlog_logger.hpp"
#include <fstream>
#include <locale>
#include <sstream>

namespace txlog {

namespace {

void appendSeparator(std::string& out) {
    if (!out.empty()) {
        out += "; ";
    }
}

void addKeyValue(std::string& out, const std::string& key, std::string value) {
    if (value.find(' ') != std::string::npos || value.find(';') != std::string::npos) {
        std::string quoted = "\"";
        for (char c : value) {
            if (c == '"') {
                quoted += "\\\"";
            } else {
                quoted += c;
            }
        }
        quoted += "\"";
        value = quoted;
    }
    appendSeparator(out);
    out += key + "=" + value;
}

void addKeyValue(std::string& out, const std::string& key, int64_t value) {
    appendSeparator(out);
    out += key + "=" + std::to_string(value);
}

void addKeyValue(std::string& out, const std::string& key, double value) {
    std::ostringstream oss;
    oss.imbue(std::locale::classic());
    oss << value;
    appendSeparator(out);
    out += key + "=" + oss.str();
}

void addKeyword(std::string& out, const std::string& key) {
    appendSeparator(out);
    out += key;
}

// 整数解析，必须完整匹配
bool parseInt(const std::string& str, int64_t& value) {
    if (str.empty()) {
        return false;
    }
    size_t start = (str[0] == '-') ? 1 : 0;
    if (start == str.size() || !Utils::isNumeric(str.substr(start))) {
        return false;
    }
    try {
        value = std::stoll(str);
    } catch (const std::out_of_range&) {
        return false;
    }
    return true;
}

} // namespace

bool DatabaseOptions::setOption(const std::string& key, const std::string& value) {
    int64_t number = 0;
    if (key == "db_name") {
        db_name = value;
    } else if (key == "read_only") {
        read_only = Utils::parseBool(value);
    } else if (key == "timeout_ms") {
        if (!parseInt(value, number) || number < 0) return false;
        timeout_ms = number;
    } else if (key == "retry_limit") {
        if (!parseInt(value, number) || number < 0) return false;
        retry_limit = static_cast<int>(number);
    } else if (key == "max_retry_delay_ms") {
        if (!parseInt(value, number) || number < 0) return false;
        max_retry_delay_ms = number;
    } else if (key == "worker_threads") {
        if (!parseInt(value, number) || number <= 0) return false;
        worker_threads = static_cast<size_t>(number);
    } else if (key == "log_level") {
        LogLevel level = LogLevel::INFO;
        if (!Logger::parseLogLevel(value, level)) return false;
        log_level = value;
    } else if (key == "log_file") {
        log_file = value;
    } else if (key == "trace_transactions") {
        trace_transactions = Utils::parseBool(value);
    } else if (key == "trace_threshold_ms") {
        if (!parseInt(value, number) || number < 0) return false;
        trace_threshold_ms = number;
    } else if (key == "trace_show_commands") {
        trace_show_commands = Utils::parseBool(value);
    } else {
        TXLOG_LOG_WARNING("未知的配置项: ", key);
    }
    return true;
}

bool DatabaseOptions::loadFromFile(const std::string& config_file) {
    std::ifstream file(config_file);
    if (!file.is_open()) {
        TXLOG_LOG_ERROR("无法打开配置文件: ", config_file);
        return false;
    }

    std::string line;
    int line_number = 0;
    while (std::getline(file, line)) {
        ++line_number;
        // 跳过注释和空行
        if (line.empty() || line[0] == '#') {
            continue;
        }

        std::istringstream iss(line);
        std::string key, value;
        if (!(iss >> key)) {
            continue;
        }
        std::getline(iss >> std::ws, value);
        while (!value.empty() && (value.back() == '\r' || value.back() == ' ' || value.back() == '\t')) {
            value.pop_back();
        }

        if (!setOption(key, value)) {
            TXLOG_LOG_ERROR("配置文件 ", config_file, " 第 ", line_number, " 行的值无效: ", key, " ", value);
            return false;
        }
    }

    TXLOG_LOG_DEBUG("已加载配置: ", toString());
    return true;
}

TransactionOptions DatabaseOptions::toTransactionOptions() const {
    TransactionOptions options;
    options.timeout_ms = timeout_ms;
    options.retry_limit = retry_limit;
    options.max_retry_delay_ms = max_retry_delay_ms;
    options.read_only = read_only;
    return options;
}

std::string DatabaseOptions::toString() const {
    std::string out;
    addKeyValue(out, "db", db_name);
    if (read_only) addKeyword(out, "readonly");
    if (timeout_ms > 0) addKeyValue(out, "timeout", timeout_ms / 1000.0);
    if (retry_limit > 0) addKeyValue(out, "retry_limit", static_cast<int64_t>(retry_limit));
    if (max_retry_delay_ms > 0) addKeyValue(out, "retry_delay", max_retry_delay_ms);
    addKeyValue(out, "workers", static_cast<int64_t>(worker_threads));
    if (!log_file.empty()) addKeyValue(out, "log_file", log_file);
    return out;
}

} // namespace txlog
