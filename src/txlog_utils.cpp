#include "txlog_core.hpp"
#include <sstream>
#include <iomanip>
#include <locale>
#include <algorithm>
#include <atomic>
#include <cctype>
#include <cmath>
#include <ctime>
#include <unordered_map>
#include <execinfo.h>
#include <cxxabi.h>
#include <iostream>
#include <cstdlib>
#include <csignal>
#include <cstdio>

namespace txlog {

std::string Utils::operationToString(Operation op) {
    static const std::unordered_map<Operation, std::string> op_map = {
        {Operation::INVALID, "Invalid"},
        {Operation::SET, "Set"},
        {Operation::CLEAR, "Clear"},
        {Operation::CLEAR_RANGE, "ClearRange"},
        {Operation::ATOMIC, "Atomic"},
        {Operation::ADD_CONFLICT_RANGE, "AddConflictRange"},
        {Operation::GET, "Get"},
        {Operation::GET_KEY, "GetKey"},
        {Operation::GET_VALUES, "GetValues"},
        {Operation::GET_KEYS, "GetKeys"},
        {Operation::GET_RANGE, "GetRange"},
        {Operation::WATCH, "Watch"},
        {Operation::GET_READ_VERSION, "GetReadVersion"},
        {Operation::COMMIT, "Commit"},
        {Operation::CANCEL, "Cancel"},
        {Operation::RESET, "Reset"},
        {Operation::ON_ERROR, "OnError"},
        {Operation::LOG, "Log"},
    };

    auto it = op_map.find(op);
    return (it != op_map.end()) ? it->second : "Invalid";
}

std::string Utils::operationShortName(Operation op) {
    switch (op) {
        case Operation::SET: return "s";
        case Operation::CLEAR: return "c";
        case Operation::CLEAR_RANGE: return "cr";
        case Operation::ATOMIC: return "a";
        case Operation::ADD_CONFLICT_RANGE: return "rc";
        case Operation::GET: return "R";
        case Operation::GET_KEY: return "k";
        case Operation::GET_VALUES: return "R*";
        case Operation::GET_KEYS: return "k*";
        case Operation::GET_RANGE: return "r";
        case Operation::WATCH: return "W";
        case Operation::GET_READ_VERSION: return "rv";
        case Operation::COMMIT: return "Co";
        case Operation::CANCEL: return "cX";
        case Operation::RESET: return "rz";
        case Operation::ON_ERROR: return "!!";
        case Operation::LOG: return "//";
        default: return "??";
    }
}

Mode Utils::operationMode(Operation op) {
    switch (op) {
        case Operation::SET:
        case Operation::CLEAR:
        case Operation::CLEAR_RANGE:
        case Operation::ATOMIC:
        case Operation::COMMIT:
            return Mode::WRITE;
        case Operation::GET:
        case Operation::GET_KEY:
        case Operation::GET_VALUES:
        case Operation::GET_KEYS:
        case Operation::GET_RANGE:
            return Mode::READ;
        case Operation::WATCH:
            return Mode::WATCH;
        case Operation::LOG:
            return Mode::ANNOTATION;
        case Operation::ADD_CONFLICT_RANGE:
        case Operation::GET_READ_VERSION:
        case Operation::CANCEL:
        case Operation::RESET:
        case Operation::ON_ERROR:
            return Mode::META;
        default:
            return Mode::INVALID;
    }
}

std::string Utils::mutationTypeToString(MutationType type) {
    switch (type) {
        case MutationType::ADD: return "Add";
        case MutationType::BIT_AND: return "BitAnd";
        case MutationType::BIT_OR: return "BitOr";
        case MutationType::BIT_XOR: return "BitXor";
        case MutationType::MAX: return "Max";
        case MutationType::MIN: return "Min";
        case MutationType::APPEND_IF_FITS: return "AppendIfFits";
        default: return "Unknown";
    }
}

std::string Utils::errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK: return "success";
        case ErrorCode::TRANSACTION_TOO_OLD: return "transaction_too_old";
        case ErrorCode::FUTURE_VERSION: return "future_version";
        case ErrorCode::NOT_COMMITTED: return "not_committed";
        case ErrorCode::COMMIT_UNKNOWN_RESULT: return "commit_unknown_result";
        case ErrorCode::TRANSACTION_CANCELLED: return "transaction_cancelled";
        case ErrorCode::TRANSACTION_TIMED_OUT: return "transaction_timed_out";
        case ErrorCode::OPERATION_CANCELLED: return "operation_cancelled";
        case ErrorCode::RETRY_LIMIT_REACHED: return "retry_limit_reached";
        case ErrorCode::INVALID_OPERATION: return "invalid_operation";
        case ErrorCode::READ_ONLY: return "read_only";
        case ErrorCode::KEY_TOO_LARGE: return "key_too_large";
        case ErrorCode::VALUE_TOO_LARGE: return "value_too_large";
        case ErrorCode::INTERNAL_ERROR: return "internal_error";
        default: return "unknown_error";
    }
}

std::string Utils::printableKey(const std::string& key) {
    static const char* HEX = "0123456789ABCDEF";
    std::string out;
    out.reserve(key.size() + 2);
    out.push_back('\'');
    for (unsigned char c : key) {
        if (c >= 32 && c < 127 && c != '<' && c != '>' && c != '\'') {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('<');
            out.push_back(HEX[c >> 4]);
            out.push_back(HEX[c & 0x0F]);
            out.push_back('>');
        }
    }
    out.push_back('\'');
    return out;
}

std::string Utils::printableValue(const std::string& value, size_t max_length) {
    if (value.size() <= max_length) {
        return printableKey(value);
    }
    return printableKey(value.substr(0, max_length)) + "... (" + std::to_string(value.size()) + " bytes)";
}

std::string Utils::formatFixed(double value, int decimals) {
    std::ostringstream oss;
    oss.imbue(std::locale::classic());
    oss << std::fixed << std::setprecision(decimals) << value;
    return oss.str();
}

namespace {

// 在整数部分每三位插入逗号
std::string groupThousands(const std::string& digits) {
    size_t start = (!digits.empty() && digits[0] == '-') ? 1 : 0;
    size_t end = digits.find('.');
    if (end == std::string::npos) {
        end = digits.size();
    }
    std::string result = digits.substr(0, start);
    size_t int_len = end - start;
    for (size_t i = 0; i < int_len; ++i) {
        if (i > 0 && (int_len - i) % 3 == 0) {
            result.push_back(',');
        }
        result.push_back(digits[start + i]);
    }
    result.append(digits, end, std::string::npos);
    return result;
}

} // namespace

std::string Utils::formatThousands(int64_t value) {
    return groupThousands(std::to_string(value));
}

std::string Utils::formatThousands(double value, int decimals) {
    return groupThousands(formatFixed(value, decimals));
}

std::string Utils::padLeft(const std::string& str, size_t width) {
    if (str.size() >= width) {
        return str;
    }
    return std::string(width - str.size(), ' ') + str;
}

std::string Utils::padRight(const std::string& str, size_t width) {
    if (str.size() >= width) {
        return str;
    }
    return str + std::string(width - str.size(), ' ');
}

std::string Utils::formatTimeOfDay(Timestamp ts) {
    auto tt = std::chrono::system_clock::to_time_t(ts);
    std::tm tm{};
    gmtime_r(&tt, &tm);
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(ts.time_since_epoch()).count() % 1000000;
    if (micros < 0) {
        micros += 1000000;
    }

    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%02d:%02d:%02d.%06lld",
                  tm.tm_hour, tm.tm_min, tm.tm_sec, static_cast<long long>(micros));
    return buffer;
}

uint64_t Utils::currentContextId() {
    static std::atomic<uint64_t> next_context_id{1};
    thread_local uint64_t context_id = next_context_id.fetch_add(1);
    return context_id;
}

bool Utils::isNumeric(const std::string& str) {
    if (str.empty()) {
        return false;
    }
    return std::all_of(str.begin(), str.end(),
                       [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; });
}

bool Utils::parseBool(const std::string& str) {
    return str == "yes" || str == "true" || str == "1";
}

void printBacktrace() {
    constexpr int MAX_FRAMES = 64;
    void* addrlist[MAX_FRAMES + 1];

    int addrlen = backtrace(addrlist, MAX_FRAMES);
    if (addrlen == 0) {
        std::cerr << "  <empty stack>\n";
        return;
    }

    char** symbollist = backtrace_symbols(addrlist, addrlen);
    if (symbollist == nullptr) {
        std::cerr << "  <no symbols>\n";
        return;
    }

    for (int i = 0; i < addrlen; i++) {
        char *mangled = nullptr, *offset_begin = nullptr, *offset_end = nullptr;

        // 找到括号和+偏移
        for (char *p = symbollist[i]; *p; ++p) {
            if (*p == '(') mangled = p;
            else if (*p == '+') offset_begin = p;
            else if (*p == ')' && offset_begin) {
                offset_end = p;
                break;
            }
        }

        if (mangled && offset_begin && offset_end) {
            *mangled++ = '\0';
            *offset_begin++ = '\0';
            *offset_end = '\0';

            int status;
            char* demangled = abi::__cxa_demangle(mangled, nullptr, nullptr, &status);

            std::cerr << "  [" << i << "] " << symbollist[i]
                      << " : " << (status == 0 ? demangled : mangled)
                      << " + " << offset_begin << '\n';

            std::free(demangled);
        } else {
            std::cerr << "  [" << i << "] " << symbollist[i] << '\n';
        }
    }

    std::free(symbollist);
}

namespace {

void crashSignalHandler(int signo) {
    std::fprintf(stderr, "<<<<<<<<<<<<<<<<<catch signal %d>>>>>>>>>>>>>>>>>>>>>>>>>\n", signo);
    std::fprintf(stderr, "Dump stack start...\n");
    printBacktrace();
    std::fprintf(stderr, "Dump stack end...\n");

    std::signal(signo, SIG_DFL); /* 恢复信号默认处理 */
    std::raise(signo);           /* 重新发送信号 */
}

} // namespace

void setSignalHandler() {
    std::signal(SIGSEGV, crashSignalHandler);
    std::signal(SIGABRT, crashSignalHandler);
}

} // namespace txlog
