#pragma once

#include "txlog_tuple.hpp"
#include "../transaction/txlog_transaction.hpp"
#include "../storage/txlog_key_selector.hpp"
#include <string>
#include <vector>

namespace txlog {

// 简单的二级索引，把 (value, id) 作为键存储，值为空
// 键为 subspace + tuple(value) + tuple(id)，按值再按id排序
template<typename TId, typename TValue>
class Index {
public:
    Index(std::string name, Subspace subspace, bool index_null_values = false)
        : name_(std::move(name)), subspace_(std::move(subspace)), index_null_values_(index_null_values) {}

    const std::string& getName() const { return name_; }
    const Subspace& getSubspace() const { return subspace_; }
    bool indexNullValues() const { return index_null_values_; }

    // 值为null且不索引null时不写入
    bool add(ITransaction& tr, const TId& id, const TValue& value) const {
        if (!index_null_values_ && TupleTraits<TValue>::isNull(value)) {
            return false;
        }
        tr.set(subspace_.pack(value, id), Value());
        return true;
    }

    // 值没有变化时返回false
    bool update(ITransaction& tr, const TId& id, const TValue& new_value, const TValue& previous_value) const {
        if (new_value == previous_value) {
            return false;
        }
        if (index_null_values_ || !TupleTraits<TValue>::isNull(previous_value)) {
            tr.clear(subspace_.pack(previous_value, id));
        }
        if (index_null_values_ || !TupleTraits<TValue>::isNull(new_value)) {
            tr.set(subspace_.pack(new_value, id), Value());
        }
        return true;
    }

    void remove(ITransaction& tr, const TId& id, const TValue& value) const {
        tr.clear(subspace_.pack(value, id));
    }

    // 值等于value的所有id，按id排序
    std::vector<TId> lookup(ITransaction& tr, const TValue& value, bool reverse = false) const {
        Key prefix = subspace_.pack(value);
        KeyRange range = KeyRange::startsWith(prefix);
        auto items = tr.getRange(KeySelector::firstGreaterOrEqual(range.begin),
                                 KeySelector::firstGreaterOrEqual(range.end),
                                 RangeOptions(0, reverse));
        return decodeIds(items, &value);
    }

    std::vector<TId> lookupGreaterThan(ITransaction& tr, const TValue& value, bool or_equal,
                                       bool reverse = false) const {
        Key prefix = subspace_.pack(value);
        if (!or_equal) {
            prefix = incrementKey(prefix);
        }
        auto items = tr.getRange(KeySelector::firstGreaterOrEqual(prefix),
                                 KeySelector::firstGreaterOrEqual(subspace_.rangeEnd()),
                                 RangeOptions(0, reverse));
        return decodeIds(items, nullptr);
    }

    std::vector<TId> lookupLessThan(ITransaction& tr, const TValue& value, bool or_equal,
                                    bool reverse = false) const {
        Key prefix = subspace_.pack(value);
        if (or_equal) {
            prefix = incrementKey(prefix);
        }
        auto items = tr.getRange(KeySelector::firstGreaterOrEqual(subspace_.rangeBegin()),
                                 KeySelector::firstGreaterOrEqual(prefix),
                                 RangeOptions(0, reverse));
        return decodeIds(items, nullptr);
    }

    std::string toString() const {
        return "Index[" + name_ + "]";
    }

private:
    // expected非空时只保留值相等的条目
    std::vector<TId> decodeIds(const std::vector<KeyValue>& items, const TValue* expected) const {
        std::vector<TId> ids;
        ids.reserve(items.size());
        for (const auto& kv : items) {
            TValue value{};
            TId id{};
            if (!subspace_.unpack(kv.key, value, id)) {
                throw TransactionError(ErrorCode::INTERNAL_ERROR,
                                       toString() + " 中的键无法解码: " + Utils::printableKey(kv.key));
            }
            if (expected != nullptr && !(value == *expected)) {
                continue;
            }
            ids.push_back(std::move(id));
        }
        return ids;
    }

    std::string name_;
    Subspace subspace_;
    bool index_null_values_;
};

} // namespace txlog
