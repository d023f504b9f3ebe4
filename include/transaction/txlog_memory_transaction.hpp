#pragma once

#include "txlog_transaction.hpp"
#include "../storage/txlog_memory_storage.hpp"
#include <chrono>
#include <map>
#include <mutex>

namespace txlog {

// 基于MemoryStorage的事务，读到自己的写入，提交时做冲突检测
// 所有方法都可以被多个线程并发调用
class MemoryTransaction : public ITransaction {
public:
    MemoryTransaction(MemoryStorage& storage, const TransactionOptions& options = TransactionOptions());
    ~MemoryTransaction() override = default;

    TransactionID getId() const override { return id_; }
    Version getReadVersion() override;

    std::optional<Value> get(const Key& key, bool snapshot = false) override;
    Key getKey(const KeySelector& selector, bool snapshot = false) override;
    std::vector<std::optional<Value>> getValues(const std::vector<Key>& keys, bool snapshot = false) override;
    std::vector<Key> getKeys(const std::vector<KeySelector>& selectors, bool snapshot = false) override;
    std::vector<KeyValue> getRange(const KeySelector& begin, const KeySelector& end,
                                   const RangeOptions& options = RangeOptions(),
                                   bool snapshot = false) override;

    void set(const Key& key, const Value& value) override;
    void clear(const Key& key) override;
    void clearRange(const Key& begin, const Key& end) override;
    void atomicOp(const Key& key, const Value& param, MutationType type) override;
    void addConflictRange(const Key& begin, const Key& end, ConflictRangeType type) override;

    std::shared_future<void> watch(const Key& key) override;

    void commit() override;
    Version getCommittedVersion() const override;
    int64_t getApproximateSize() const override;

    void onError(ErrorCode code) override;
    void reset() override;
    void cancel() override;
    int getRetryCount() const override;

private:
    // 事务内对一个键的写入
    struct WriteEntry {
        bool overridden = false;                // true: value为最终结果
        std::optional<Value> value;
        std::vector<std::pair<MutationType, Value>> atomics;  // 叠加在已存储的值上
    };

    // 以下方法调用方持有mutex_
    void checkUsable() const;
    void checkWritable(const Key& key) const;
    Version ensureReadVersion();
    bool isCleared(const Key& key) const;
    std::optional<Value> readLocked(const Key& key);
    std::map<Key, Value> readRangeLocked(const Key& begin, const Key& end);
    Key resolveLocked(const KeySelector& selector);
    void resetLocked();

    MemoryStorage& storage_;
    const TransactionID id_;
    const TransactionOptions options_;
    const std::chrono::steady_clock::time_point deadline_;

    mutable std::mutex mutex_;
    std::optional<Version> read_version_;
    std::map<Key, WriteEntry> writes_;
    std::vector<KeyRange> cleared_ranges_;
    std::vector<KeyRange> read_conflicts_;
    std::vector<KeyRange> write_conflicts_;
    Version committed_version_ = NO_VERSION;
    int64_t approximate_size_ = 0;
    int retries_ = 0;
    bool committed_ = false;
    bool cancelled_ = false;
};

} // namespace txlog
