#pragma once

#include "../txlog_core.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <type_traits>

namespace txlog {

// 保序的元组编码：编码后的字节序与元素的自然顺序一致
namespace tuple {

const uint8_t NULL_CODE = 0x00;
const uint8_t BYTES_CODE = 0x01;
const uint8_t STRING_CODE = 0x02;
const uint8_t INT_ZERO_CODE = 0x14;

void encodeNull(std::string& out);
// 0x00 转义为 0x00 0xFF，以 0x00 结尾
void encodeBytes(std::string& out, const std::string& value, uint8_t code = BYTES_CODE);
void encodeString(std::string& out, const std::string& value);
void encodeInt(std::string& out, int64_t value);

// 解码失败时返回false，pos停在出错的位置
bool decodeNull(const std::string& in, size_t& pos);
bool decodeBytes(const std::string& in, size_t& pos, std::string& value, uint8_t code = BYTES_CODE);
bool decodeString(const std::string& in, size_t& pos, std::string& value);
bool decodeInt(const std::string& in, size_t& pos, int64_t& value);

inline bool peekNull(const std::string& in, size_t pos) {
    return pos < in.size() && static_cast<uint8_t>(in[pos]) == NULL_CODE;
}

} // namespace tuple

// 元素类型到编码的映射
template<typename T, typename Enable = void>
struct TupleTraits;

template<>
struct TupleTraits<std::string> {
    static bool isNull(const std::string&) { return false; }
    static void encode(std::string& out, const std::string& value) { tuple::encodeString(out, value); }
    static bool decode(const std::string& in, size_t& pos, std::string& value) {
        return tuple::decodeString(in, pos, value);
    }
};

template<typename T>
struct TupleTraits<T, std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>>> {
    static bool isNull(const T&) { return false; }
    static void encode(std::string& out, const T& value) { tuple::encodeInt(out, static_cast<int64_t>(value)); }
    static bool decode(const std::string& in, size_t& pos, T& value) {
        int64_t decoded = 0;
        if (!tuple::decodeInt(in, pos, decoded)) {
            return false;
        }
        value = static_cast<T>(decoded);
        return true;
    }
};

// 空的optional编码为null
template<typename T>
struct TupleTraits<std::optional<T>> {
    static bool isNull(const std::optional<T>& value) { return !value.has_value(); }
    static void encode(std::string& out, const std::optional<T>& value) {
        if (value) {
            TupleTraits<T>::encode(out, *value);
        } else {
            tuple::encodeNull(out);
        }
    }
    static bool decode(const std::string& in, size_t& pos, std::optional<T>& value) {
        if (tuple::peekNull(in, pos)) {
            value.reset();
            return tuple::decodeNull(in, pos);
        }
        T inner{};
        if (!TupleTraits<T>::decode(in, pos, inner)) {
            return false;
        }
        value = std::move(inner);
        return true;
    }
};

// 键前缀，负责打包和解包其中的元组
class Subspace {
public:
    Subspace() = default;
    explicit Subspace(Key prefix) : prefix_(std::move(prefix)) {}

    const Key& key() const { return prefix_; }

    template<typename... Ts>
    Key pack(const Ts&... items) const {
        Key out = prefix_;
        (TupleTraits<Ts>::encode(out, items), ...);
        return out;
    }

    // 键不属于这个子空间或有多余字节时返回false
    template<typename... Ts>
    bool unpack(const Key& key, Ts&... items) const {
        if (!contains(key)) {
            return false;
        }
        size_t pos = prefix_.size();
        bool ok = (TupleTraits<Ts>::decode(key, pos, items) && ...);
        return ok && pos == key.size();
    }

    bool contains(const Key& key) const {
        return key.compare(0, prefix_.size(), prefix_) == 0 && key.size() >= prefix_.size();
    }

    // 子空间内所有元组键的范围
    Key rangeBegin() const { return prefix_ + '\x00'; }
    Key rangeEnd() const { return prefix_ + '\xff'; }

    Subspace sub(const std::string& name) const {
        return Subspace(pack(name));
    }

private:
    Key prefix_;
};

} // namespace txlog
