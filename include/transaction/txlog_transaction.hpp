#pragma once

#include "../txlog_core.hpp"
#include "../storage/txlog_key_selector.hpp"
#include <future>
#include <optional>
#include <vector>

namespace txlog {

// 事务的行为选项
struct TransactionOptions {
    int64_t timeout_ms = 0;            // 0 表示不超时，计时跨越重试
    int retry_limit = 0;               // 0 表示不限制
    int64_t initial_retry_delay_ms = 10;
    int64_t max_retry_delay_ms = 1000;
    bool read_only = false;
};

// 事务接口，读写操作失败时抛出TransactionError
class ITransaction {
public:
    virtual ~ITransaction() = default;

    virtual TransactionID getId() const = 0;

    // 第一次调用时确定读版本
    virtual Version getReadVersion() = 0;

    // 读操作，snapshot为true时不添加读冲突区间
    virtual std::optional<Value> get(const Key& key, bool snapshot = false) = 0;
    virtual Key getKey(const KeySelector& selector, bool snapshot = false) = 0;
    virtual std::vector<std::optional<Value>> getValues(const std::vector<Key>& keys, bool snapshot = false) = 0;
    virtual std::vector<Key> getKeys(const std::vector<KeySelector>& selectors, bool snapshot = false) = 0;
    virtual std::vector<KeyValue> getRange(const KeySelector& begin, const KeySelector& end,
                                           const RangeOptions& options = RangeOptions(),
                                           bool snapshot = false) = 0;

    // 写操作，提交前只在事务内可见
    virtual void set(const Key& key, const Value& value) = 0;
    virtual void clear(const Key& key) = 0;
    virtual void clearRange(const Key& begin, const Key& end) = 0;
    virtual void atomicOp(const Key& key, const Value& param, MutationType type) = 0;
    virtual void addConflictRange(const Key& begin, const Key& end, ConflictRangeType type) = 0;

    // 键的值发生变化时完成
    virtual std::shared_future<void> watch(const Key& key) = 0;

    virtual void commit() = 0;

    // 只读事务提交后返回NO_VERSION
    virtual Version getCommittedVersion() const = 0;

    // 待提交修改的估计大小
    virtual int64_t getApproximateSize() const = 0;

    // 可重试错误：退避后重置事务；否则抛出该错误
    virtual void onError(ErrorCode code) = 0;

    virtual void reset() = 0;
    virtual void cancel() = 0;

    // 已经因onError重试的次数
    virtual int getRetryCount() const = 0;
};

} // namespace txlog
