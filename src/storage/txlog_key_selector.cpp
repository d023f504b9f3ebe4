#include "storage/txlog_key_selector.hpp"
#include <algorithm>
#include <stdexcept>

namespace txlog {

KeyRange KeyRange::startsWith(const Key& prefix) {
    if (prefix.empty()) {
        return KeyRange(Key(), KEYSPACE_END);
    }
    return KeyRange(prefix, incrementKey(prefix));
}

Key KeySelector::resolve(const std::vector<Key>& sorted_keys) const {
    auto base = or_equal ? std::upper_bound(sorted_keys.begin(), sorted_keys.end(), key)
                         : std::lower_bound(sorted_keys.begin(), sorted_keys.end(), key);
    int64_t index = static_cast<int64_t>(base - sorted_keys.begin()) - 1 + offset;
    if (index < 0) {
        return Key();
    }
    if (index >= static_cast<int64_t>(sorted_keys.size())) {
        return KEYSPACE_END;
    }
    return sorted_keys[static_cast<size_t>(index)];
}

std::string KeySelector::toString() const {
    std::string name;
    int extra = 0;
    if (offset >= 1) {
        name = or_equal ? "fGT" : "fGE";
        extra = offset - 1;
    } else {
        name = or_equal ? "lLE" : "lLT";
        extra = offset;
    }
    std::string result = name + "{" + Utils::printableKey(key) + "}";
    if (extra > 0) {
        result += "+" + std::to_string(extra);
    } else if (extra < 0) {
        result += std::to_string(extra);
    }
    return result;
}

std::string RangeOptions::toString() const {
    std::string result;
    if (limit > 0) {
        result = "limit=" + std::to_string(limit);
    }
    if (reverse) {
        result += result.empty() ? "reverse" : ", reverse";
    }
    return result;
}

Key incrementKey(const Key& key) {
    Key result = key;
    while (!result.empty() && static_cast<unsigned char>(result.back()) == 0xFF) {
        result.pop_back();
    }
    if (result.empty()) {
        throw std::invalid_argument("key must contain at least one byte not equal to 0xFF");
    }
    result.back() = static_cast<char>(static_cast<unsigned char>(result.back()) + 1);
    return result;
}

} // namespace txlog
