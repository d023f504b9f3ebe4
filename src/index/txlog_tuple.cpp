#include "index/txlog_tuple.hpp"
#include <limits>

namespace txlog {
namespace tuple {

namespace {

const int MAX_INT_BYTES = 8;

// 去掉前导零后的字节数
int byteLength(uint64_t value) {
    int length = 0;
    while (value != 0) {
        ++length;
        value >>= 8;
    }
    return length;
}

uint64_t lengthMask(int length) {
    return length >= MAX_INT_BYTES ? std::numeric_limits<uint64_t>::max()
                                   : ((uint64_t(1) << (8 * length)) - 1);
}

} // namespace

void encodeNull(std::string& out) {
    out.push_back(static_cast<char>(NULL_CODE));
}

void encodeBytes(std::string& out, const std::string& value, uint8_t code) {
    out.push_back(static_cast<char>(code));
    for (char c : value) {
        out.push_back(c);
        if (c == '\x00') {
            out.push_back('\xff');
        }
    }
    out.push_back('\x00');
}

void encodeString(std::string& out, const std::string& value) {
    encodeBytes(out, value, STRING_CODE);
}

void encodeInt(std::string& out, int64_t value) {
    if (value == 0) {
        out.push_back(static_cast<char>(INT_ZERO_CODE));
        return;
    }
    // 负数用长度内的反码表示，保证字节序与数值顺序一致
    uint64_t magnitude = value > 0 ? static_cast<uint64_t>(value)
                                   : static_cast<uint64_t>(-(value + 1)) + 1;
    int length = byteLength(magnitude);
    uint64_t bits = value > 0 ? magnitude : (~magnitude & lengthMask(length));
    out.push_back(static_cast<char>(value > 0 ? INT_ZERO_CODE + length : INT_ZERO_CODE - length));
    for (int i = length - 1; i >= 0; --i) {
        out.push_back(static_cast<char>((bits >> (8 * i)) & 0xFF));
    }
}

bool decodeNull(const std::string& in, size_t& pos) {
    if (!peekNull(in, pos)) {
        return false;
    }
    ++pos;
    return true;
}

bool decodeBytes(const std::string& in, size_t& pos, std::string& value, uint8_t code) {
    if (pos >= in.size() || static_cast<uint8_t>(in[pos]) != code) {
        return false;
    }
    size_t i = pos + 1;
    std::string result;
    while (i < in.size()) {
        char c = in[i];
        if (c == '\x00') {
            if (i + 1 < in.size() && in[i + 1] == '\xff') {
                result.push_back('\x00');
                i += 2;
                continue;
            }
            value = std::move(result);
            pos = i + 1;
            return true;
        }
        result.push_back(c);
        ++i;
    }
    // 缺少结束符
    return false;
}

bool decodeString(const std::string& in, size_t& pos, std::string& value) {
    return decodeBytes(in, pos, value, STRING_CODE);
}

bool decodeInt(const std::string& in, size_t& pos, int64_t& value) {
    if (pos >= in.size()) {
        return false;
    }
    int code = static_cast<uint8_t>(in[pos]);
    if (code < INT_ZERO_CODE - MAX_INT_BYTES || code > INT_ZERO_CODE + MAX_INT_BYTES) {
        return false;
    }
    int length = code > INT_ZERO_CODE ? code - INT_ZERO_CODE : INT_ZERO_CODE - code;
    if (pos + 1 + length > in.size()) {
        return false;
    }
    uint64_t bits = 0;
    for (int i = 0; i < length; ++i) {
        bits = (bits << 8) | static_cast<uint8_t>(in[pos + 1 + i]);
    }

    if (code >= INT_ZERO_CODE) {
        if (bits > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            return false;
        }
        value = static_cast<int64_t>(bits);
    } else {
        uint64_t magnitude = ~bits & lengthMask(length);
        if (magnitude > static_cast<uint64_t>(std::numeric_limits<int64_t>::max()) + 1) {
            return false;
        }
        value = magnitude == static_cast<uint64_t>(std::numeric_limits<int64_t>::max()) + 1
                    ? std::numeric_limits<int64_t>::min()
                    : -static_cast<int64_t>(magnitude);
    }
    pos += 1 + length;
    return true;
}

} // namespace tuple
} // namespace txlog
