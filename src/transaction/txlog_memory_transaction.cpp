#include "transaction/txlog_memory_transaction.hpp"
#include "txlog_logger.hpp"
#include <algorithm>
#include <thread>

namespace txlog {

namespace {

std::chrono::steady_clock::time_point makeDeadline(int64_t timeout_ms) {
    if (timeout_ms <= 0) {
        return std::chrono::steady_clock::time_point::max();
    }
    return std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
}

} // namespace

MemoryTransaction::MemoryTransaction(MemoryStorage& storage, const TransactionOptions& options)
    : storage_(storage),
      id_(storage.nextTransactionId()),
      options_(options),
      deadline_(makeDeadline(options.timeout_ms)) {
}

void MemoryTransaction::checkUsable() const {
    if (cancelled_) {
        throw TransactionError(ErrorCode::TRANSACTION_CANCELLED, "事务已取消");
    }
    if (std::chrono::steady_clock::now() >= deadline_) {
        throw TransactionError(ErrorCode::TRANSACTION_TIMED_OUT,
                               "事务超时 (" + std::to_string(options_.timeout_ms) + " ms)");
    }
}

void MemoryTransaction::checkWritable(const Key& key) const {
    checkUsable();
    if (committed_) {
        throw TransactionError(ErrorCode::INVALID_OPERATION, "事务已提交");
    }
    if (options_.read_only) {
        throw TransactionError(ErrorCode::READ_ONLY, "只读事务不能写入");
    }
    if (key.size() > MAX_KEY_SIZE) {
        throw TransactionError(ErrorCode::KEY_TOO_LARGE, "键长度 " + std::to_string(key.size()) + " 超出限制");
    }
}

Version MemoryTransaction::ensureReadVersion() {
    if (!read_version_) {
        read_version_ = storage_.getReadVersion();
    }
    return *read_version_;
}

bool MemoryTransaction::isCleared(const Key& key) const {
    for (const auto& range : cleared_ranges_) {
        if (range.contains(key)) {
            return true;
        }
    }
    return false;
}

std::optional<Value> MemoryTransaction::readLocked(const Key& key) {
    auto it = writes_.find(key);
    if (it != writes_.end() && it->second.overridden) {
        return it->second.value;
    }
    std::optional<Value> value;
    if (!isCleared(key)) {
        value = storage_.read(key, ensureReadVersion());
    }
    if (it != writes_.end()) {
        for (const auto& atomic : it->second.atomics) {
            value = MemoryStorage::applyAtomic(atomic.first, value, atomic.second);
        }
    }
    return value;
}

std::map<Key, Value> MemoryTransaction::readRangeLocked(const Key& begin, const Key& end) {
    std::map<Key, Value> merged = storage_.readRange(begin, end, ensureReadVersion());
    for (auto it = merged.begin(); it != merged.end();) {
        if (isCleared(it->first)) {
            it = merged.erase(it);
        } else {
            ++it;
        }
    }
    for (auto it = writes_.lower_bound(begin); it != writes_.end() && it->first < end; ++it) {
        std::optional<Value> value;
        if (it->second.overridden) {
            value = it->second.value;
        } else {
            auto stored = merged.find(it->first);
            if (stored != merged.end()) {
                value = stored->second;
            }
            for (const auto& atomic : it->second.atomics) {
                value = MemoryStorage::applyAtomic(atomic.first, value, atomic.second);
            }
        }
        if (value) {
            merged[it->first] = *value;
        } else {
            merged.erase(it->first);
        }
    }
    return merged;
}

Key MemoryTransaction::resolveLocked(const KeySelector& selector) {
    std::map<Key, Value> all = readRangeLocked(Key(), KEYSPACE_END);
    std::vector<Key> keys;
    keys.reserve(all.size());
    for (const auto& kv : all) {
        keys.push_back(kv.first);
    }
    return selector.resolve(keys);
}

Version MemoryTransaction::getReadVersion() {
    std::lock_guard<std::mutex> lock(mutex_);
    checkUsable();
    return ensureReadVersion();
}

std::optional<Value> MemoryTransaction::get(const Key& key, bool snapshot) {
    std::lock_guard<std::mutex> lock(mutex_);
    checkUsable();
    std::optional<Value> value = readLocked(key);
    if (!snapshot) {
        read_conflicts_.push_back(KeyRange::single(key));
    }
    return value;
}

Key MemoryTransaction::getKey(const KeySelector& selector, bool snapshot) {
    std::lock_guard<std::mutex> lock(mutex_);
    checkUsable();
    Key result = resolveLocked(selector);
    if (!snapshot) {
        const Key& low = std::min(selector.key, result);
        const Key& high = std::max(selector.key, result);
        read_conflicts_.emplace_back(low, high + '\x00');
    }
    return result;
}

std::vector<std::optional<Value>> MemoryTransaction::getValues(const std::vector<Key>& keys, bool snapshot) {
    std::lock_guard<std::mutex> lock(mutex_);
    checkUsable();
    std::vector<std::optional<Value>> values;
    values.reserve(keys.size());
    for (const auto& key : keys) {
        values.push_back(readLocked(key));
        if (!snapshot) {
            read_conflicts_.push_back(KeyRange::single(key));
        }
    }
    return values;
}

std::vector<Key> MemoryTransaction::getKeys(const std::vector<KeySelector>& selectors, bool snapshot) {
    std::vector<Key> keys;
    keys.reserve(selectors.size());
    for (const auto& selector : selectors) {
        keys.push_back(getKey(selector, snapshot));
    }
    return keys;
}

std::vector<KeyValue> MemoryTransaction::getRange(const KeySelector& begin, const KeySelector& end,
                                                  const RangeOptions& options, bool snapshot) {
    std::lock_guard<std::mutex> lock(mutex_);
    checkUsable();
    Key begin_key = resolveLocked(begin);
    Key end_key = resolveLocked(end);

    std::vector<KeyValue> result;
    if (begin_key >= end_key) {
        return result;
    }

    std::map<Key, Value> merged = readRangeLocked(begin_key, end_key);
    result.reserve(merged.size());
    for (auto& kv : merged) {
        result.emplace_back(kv.first, std::move(kv.second));
    }
    if (options.reverse) {
        std::reverse(result.begin(), result.end());
    }
    if (options.limit > 0 && result.size() > static_cast<size_t>(options.limit)) {
        result.resize(static_cast<size_t>(options.limit));
    }
    if (!snapshot) {
        read_conflicts_.emplace_back(begin_key, end_key);
    }
    return result;
}

void MemoryTransaction::set(const Key& key, const Value& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    checkWritable(key);
    if (value.size() > MAX_VALUE_SIZE) {
        throw TransactionError(ErrorCode::VALUE_TOO_LARGE, "值长度 " + std::to_string(value.size()) + " 超出限制");
    }
    WriteEntry& entry = writes_[key];
    entry.overridden = true;
    entry.value = value;
    entry.atomics.clear();
    write_conflicts_.push_back(KeyRange::single(key));
    approximate_size_ += static_cast<int64_t>(key.size() + value.size());
}

void MemoryTransaction::clear(const Key& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    checkWritable(key);
    WriteEntry& entry = writes_[key];
    entry.overridden = true;
    entry.value.reset();
    entry.atomics.clear();
    write_conflicts_.push_back(KeyRange::single(key));
    approximate_size_ += static_cast<int64_t>(key.size());
}

void MemoryTransaction::clearRange(const Key& begin, const Key& end) {
    std::lock_guard<std::mutex> lock(mutex_);
    checkWritable(begin);
    if (end.size() > MAX_KEY_SIZE) {
        throw TransactionError(ErrorCode::KEY_TOO_LARGE, "键长度 " + std::to_string(end.size()) + " 超出限制");
    }
    if (begin >= end) {
        return;
    }
    writes_.erase(writes_.lower_bound(begin), writes_.lower_bound(end));
    cleared_ranges_.emplace_back(begin, end);
    write_conflicts_.emplace_back(begin, end);
    approximate_size_ += static_cast<int64_t>(begin.size() + end.size());
}

void MemoryTransaction::atomicOp(const Key& key, const Value& param, MutationType type) {
    std::lock_guard<std::mutex> lock(mutex_);
    checkWritable(key);
    if (param.size() > MAX_VALUE_SIZE) {
        throw TransactionError(ErrorCode::VALUE_TOO_LARGE, "参数长度 " + std::to_string(param.size()) + " 超出限制");
    }
    auto it = writes_.find(key);
    if (it != writes_.end()) {
        if (it->second.overridden) {
            it->second.value = MemoryStorage::applyAtomic(type, it->second.value, param);
        } else {
            it->second.atomics.emplace_back(type, param);
        }
    } else if (isCleared(key)) {
        WriteEntry entry;
        entry.overridden = true;
        entry.value = MemoryStorage::applyAtomic(type, std::nullopt, param);
        writes_.emplace(key, std::move(entry));
    } else {
        WriteEntry entry;
        entry.atomics.emplace_back(type, param);
        writes_.emplace(key, std::move(entry));
    }
    write_conflicts_.push_back(KeyRange::single(key));
    approximate_size_ += static_cast<int64_t>(key.size() + param.size());
}

void MemoryTransaction::addConflictRange(const Key& begin, const Key& end, ConflictRangeType type) {
    std::lock_guard<std::mutex> lock(mutex_);
    checkUsable();
    if (begin >= end) {
        return;
    }
    if (type == ConflictRangeType::READ) {
        read_conflicts_.emplace_back(begin, end);
    } else {
        write_conflicts_.emplace_back(begin, end);
    }
}

std::shared_future<void> MemoryTransaction::watch(const Key& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    checkUsable();
    std::optional<Value> expected = readLocked(key);
    return storage_.watch(key, expected);
}

void MemoryTransaction::commit() {
    std::lock_guard<std::mutex> lock(mutex_);
    checkUsable();
    if (committed_) {
        throw TransactionError(ErrorCode::INVALID_OPERATION, "事务已提交");
    }

    if (writes_.empty() && cleared_ranges_.empty() && write_conflicts_.empty()) {
        // 只读事务不产生新版本
        committed_ = true;
        committed_version_ = NO_VERSION;
        return;
    }

    std::vector<Mutation> mutations;
    mutations.reserve(cleared_ranges_.size() + writes_.size());
    for (const auto& range : cleared_ranges_) {
        mutations.push_back(Mutation::clearRange(range.begin, range.end));
    }
    for (const auto& entry : writes_) {
        if (entry.second.overridden) {
            if (entry.second.value) {
                mutations.push_back(Mutation::set(entry.first, *entry.second.value));
            } else {
                mutations.push_back(Mutation::clear(entry.first));
            }
        } else {
            for (const auto& atomic : entry.second.atomics) {
                mutations.push_back(Mutation::atomic(entry.first, atomic.second, atomic.first));
            }
        }
    }

    committed_version_ = storage_.commit(ensureReadVersion(), read_conflicts_, write_conflicts_, mutations);
    committed_ = true;
}

Version MemoryTransaction::getCommittedVersion() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return committed_version_;
}

int64_t MemoryTransaction::getApproximateSize() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return approximate_size_;
}

void MemoryTransaction::onError(ErrorCode code) {
    if (!isRetryable(code)) {
        throw TransactionError(code, "不可重试的错误: " + Utils::errorCodeToString(code));
    }

    std::chrono::milliseconds delay(0);
    int attempt = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        checkUsable();
        if (options_.retry_limit > 0 && retries_ >= options_.retry_limit) {
            throw TransactionError(ErrorCode::RETRY_LIMIT_REACHED,
                                   "已达到重试次数上限 " + std::to_string(options_.retry_limit));
        }
        int64_t backoff = options_.initial_retry_delay_ms;
        for (int i = 0; i < retries_ && backoff < options_.max_retry_delay_ms; ++i) {
            backoff *= 2;
        }
        delay = std::chrono::milliseconds(std::max<int64_t>(0, std::min(backoff, options_.max_retry_delay_ms)));
        attempt = ++retries_;
        resetLocked();
    }

    TXLOG_LOG_DEBUGF("事务 #{} 第 {} 次重试，等待 {} ms", id_, attempt, delay.count());
    if (delay.count() > 0) {
        std::this_thread::sleep_for(delay);
    }
}

void MemoryTransaction::resetLocked() {
    read_version_.reset();
    writes_.clear();
    cleared_ranges_.clear();
    read_conflicts_.clear();
    write_conflicts_.clear();
    committed_version_ = NO_VERSION;
    approximate_size_ = 0;
    committed_ = false;
}

void MemoryTransaction::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    resetLocked();
    retries_ = 0;
    cancelled_ = false;
}

void MemoryTransaction::cancel() {
    std::lock_guard<std::mutex> lock(mutex_);
    cancelled_ = true;
}

int MemoryTransaction::getRetryCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return retries_;
}

} // namespace txlog
