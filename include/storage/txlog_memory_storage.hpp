#pragma once

#include "../txlog_core.hpp"
#include "txlog_key_selector.hpp"
#include <atomic>
#include <deque>
#include <future>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <vector>

namespace txlog {

// 提交时写入存储的一条修改
struct Mutation {
    enum class Type {
        SET,
        CLEAR,
        CLEAR_RANGE,
        ATOMIC
    };

    Type type;
    Key key;
    Key end;              // 仅CLEAR_RANGE使用
    Value value;          // SET的值或原子操作的参数
    MutationType atomic_type;

    static Mutation set(Key key, Value value) {
        return Mutation{Type::SET, std::move(key), Key(), std::move(value), MutationType::ADD};
    }
    static Mutation clear(Key key) {
        return Mutation{Type::CLEAR, std::move(key), Key(), Value(), MutationType::ADD};
    }
    static Mutation clearRange(Key begin, Key end) {
        return Mutation{Type::CLEAR_RANGE, std::move(begin), std::move(end), Value(), MutationType::ADD};
    }
    static Mutation atomic(Key key, Value param, MutationType type) {
        return Mutation{Type::ATOMIC, std::move(key), Key(), std::move(param), type};
    }
};

// 存储统计
struct StorageStats {
    uint64_t committed_transactions = 0;
    uint64_t conflicts = 0;
    uint64_t live_keys = 0;
    Version version = 0;
};

// 多版本内存存储，按键保存版本链，提交时做乐观冲突检测
class MemoryStorage {
public:
    // 保留的已提交写冲突区间数量，更早的读版本视为过旧
    static const size_t DEFAULT_CONFLICT_HISTORY = 100000;

    explicit MemoryStorage(size_t conflict_history = DEFAULT_CONFLICT_HISTORY);
    ~MemoryStorage() = default;

    MemoryStorage(const MemoryStorage&) = delete;
    MemoryStorage& operator=(const MemoryStorage&) = delete;

    // 最新的已提交版本
    Version getReadVersion() const;

    TransactionID nextTransactionId() {
        return transaction_id_generator_.fetch_add(1);
    }

    // 在指定版本读取
    std::optional<Value> read(const Key& key, Version version) const;

    // 在指定版本读取 [begin, end) 内的所有键值
    std::map<Key, Value> readRange(const Key& begin, const Key& end, Version version) const;

    // 检查读冲突区间，通过后把修改作为一个新版本写入
    // 冲突时抛出NOT_COMMITTED，读版本过旧时抛出TRANSACTION_TOO_OLD
    Version commit(Version read_version,
                   const std::vector<KeyRange>& read_conflicts,
                   const std::vector<KeyRange>& write_conflicts,
                   const std::vector<Mutation>& mutations);

    // 键的值与expected不同时完成
    std::shared_future<void> watch(const Key& key, const std::optional<Value>& expected);

    StorageStats getStats() const;

    // 原子操作的语义，existing为空表示键不存在
    static Value applyAtomic(MutationType type, const std::optional<Value>& existing, const Value& param);

private:
    struct VersionedValue {
        Version version;
        std::optional<Value> value;  // 空表示在该版本被删除
    };

    struct Watcher {
        std::optional<Value> expected;
        std::shared_ptr<std::promise<void>> promise;
    };

    using VersionChain = std::vector<VersionedValue>;

    static const VersionedValue* visibleAt(const VersionChain& chain, Version version);
    static std::optional<Value> latestValue(const VersionChain& chain);

    // 调用方持有写锁
    void writeVersion(const Key& key, Version version, std::optional<Value> value);
    void fireWatchers(const Key& key);

    mutable std::shared_mutex mutex_;
    std::map<Key, VersionChain> data_;
    std::deque<std::pair<Version, KeyRange>> write_history_;
    size_t conflict_history_;
    Version oldest_tracked_version_ = 0;
    Version version_ = 0;
    uint64_t committed_transactions_ = 0;
    uint64_t conflicts_ = 0;
    std::multimap<Key, Watcher> watchers_;
    std::atomic<TransactionID> transaction_id_generator_{1};
};

} // namespace txlog
