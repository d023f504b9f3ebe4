#pragma once

#include "../txlog_core.hpp"
#include <string>
#include <vector>

namespace txlog {

// 键空间的结束位置
const Key KEYSPACE_END = Key(1, '\xff');

// 键区间 [begin, end)
struct KeyRange {
    Key begin;
    Key end;

    KeyRange() = default;
    KeyRange(Key b, Key e) : begin(std::move(b)), end(std::move(e)) {}

    bool contains(const Key& key) const {
        return key >= begin && key < end;
    }

    bool intersects(const KeyRange& other) const {
        return begin < other.end && other.begin < end;
    }

    // 只包含单个键的区间
    static KeyRange single(const Key& key) {
        return KeyRange(key, key + '\x00');
    }

    // 以prefix开头的所有键
    static KeyRange startsWith(const Key& prefix);
};

// 相对某个键定位另一个键：先找到最后一个 < key（or_equal时 <= key）的键，再向后移动offset个位置
struct KeySelector {
    Key key;
    bool or_equal;
    int offset;

    KeySelector(Key k, bool eq, int off) : key(std::move(k)), or_equal(eq), offset(off) {}

    static KeySelector firstGreaterOrEqual(const Key& key) { return KeySelector(key, false, 1); }
    static KeySelector firstGreaterThan(const Key& key) { return KeySelector(key, true, 1); }
    static KeySelector lastLessThan(const Key& key) { return KeySelector(key, false, 0); }
    static KeySelector lastLessOrEqual(const Key& key) { return KeySelector(key, true, 0); }

    KeySelector operator+(int delta) const { return KeySelector(key, or_equal, offset + delta); }

    // 在有序键列表中解析，越界时返回空键或KEYSPACE_END
    Key resolve(const std::vector<Key>& sorted_keys) const;

    std::string toString() const;
};

// 范围读取的选项
struct RangeOptions {
    int limit = 0;       // 0 表示不限制
    bool reverse = false;

    RangeOptions() = default;
    RangeOptions(int l, bool r) : limit(l), reverse(r) {}

    std::string toString() const;
};

// 键的字典序后继前缀：去掉末尾的0xff后最后一个字节加一
Key incrementKey(const Key& key);

} // namespace txlog
