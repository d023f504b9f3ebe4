#include "storage/txlog_memory_storage.hpp"
#include "txlog_logger.hpp"
#include <algorithm>
#include <set>

namespace txlog {

namespace {

// 小端无符号比较，两者长度相同
int compareLittleEndian(const Value& a, const Value& b) {
    for (size_t i = a.size(); i-- > 0;) {
        unsigned char x = static_cast<unsigned char>(a[i]);
        unsigned char y = static_cast<unsigned char>(b[i]);
        if (x != y) {
            return x < y ? -1 : 1;
        }
    }
    return 0;
}

// 截断或补零到指定长度
Value resized(const Value& value, size_t length) {
    Value result = value.substr(0, std::min(value.size(), length));
    result.resize(length, '\0');
    return result;
}

} // namespace

MemoryStorage::MemoryStorage(size_t conflict_history) : conflict_history_(conflict_history) {
    if (conflict_history_ == 0) {
        conflict_history_ = 1;
    }
}

Version MemoryStorage::getReadVersion() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return version_;
}

const MemoryStorage::VersionedValue* MemoryStorage::visibleAt(const VersionChain& chain, Version version) {
    // 版本链按版本递增
    for (auto it = chain.rbegin(); it != chain.rend(); ++it) {
        if (it->version <= version) {
            return &*it;
        }
    }
    return nullptr;
}

std::optional<Value> MemoryStorage::latestValue(const VersionChain& chain) {
    if (chain.empty()) {
        return std::nullopt;
    }
    return chain.back().value;
}

std::optional<Value> MemoryStorage::read(const Key& key, Version version) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    if (version > version_) {
        throw TransactionError(ErrorCode::FUTURE_VERSION, "读版本 " + std::to_string(version) + " 尚未提交");
    }
    auto it = data_.find(key);
    if (it == data_.end()) {
        return std::nullopt;
    }
    const VersionedValue* visible = visibleAt(it->second, version);
    if (visible == nullptr) {
        return std::nullopt;
    }
    return visible->value;
}

std::map<Key, Value> MemoryStorage::readRange(const Key& begin, const Key& end, Version version) const {
    std::map<Key, Value> result;
    if (begin >= end) {
        return result;
    }
    std::shared_lock<std::shared_mutex> lock(mutex_);
    if (version > version_) {
        throw TransactionError(ErrorCode::FUTURE_VERSION, "读版本 " + std::to_string(version) + " 尚未提交");
    }
    for (auto it = data_.lower_bound(begin); it != data_.end() && it->first < end; ++it) {
        const VersionedValue* visible = visibleAt(it->second, version);
        if (visible != nullptr && visible->value) {
            result.emplace(it->first, *visible->value);
        }
    }
    return result;
}

void MemoryStorage::writeVersion(const Key& key, Version version, std::optional<Value> value) {
    VersionChain& chain = data_[key];
    if (!chain.empty() && chain.back().version == version) {
        chain.back().value = std::move(value);
    } else {
        chain.push_back(VersionedValue{version, std::move(value)});
    }
}

Version MemoryStorage::commit(Version read_version,
                              const std::vector<KeyRange>& read_conflicts,
                              const std::vector<KeyRange>& write_conflicts,
                              const std::vector<Mutation>& mutations) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    if (read_version < oldest_tracked_version_ && !read_conflicts.empty()) {
        throw TransactionError(ErrorCode::TRANSACTION_TOO_OLD,
                               "读版本 " + std::to_string(read_version) + " 早于冲突检测窗口");
    }
    if (read_version > version_) {
        throw TransactionError(ErrorCode::FUTURE_VERSION, "读版本 " + std::to_string(read_version) + " 尚未提交");
    }

    // 读取之后是否有其他事务写入了读过的区间
    for (const auto& entry : write_history_) {
        if (entry.first <= read_version) {
            continue;
        }
        for (const auto& range : read_conflicts) {
            if (range.intersects(entry.second)) {
                ++conflicts_;
                TXLOG_LOG_DEBUG("提交冲突: 区间 ", Utils::printableKey(range.begin), " - ",
                                Utils::printableKey(range.end), " 在版本 ", entry.first, " 被修改");
                throw TransactionError(ErrorCode::NOT_COMMITTED, "事务与并发提交的事务冲突");
            }
        }
    }

    const Version new_version = version_ + 1;
    std::set<Key> touched;

    for (const auto& mutation : mutations) {
        switch (mutation.type) {
            case Mutation::Type::SET:
                writeVersion(mutation.key, new_version, mutation.value);
                touched.insert(mutation.key);
                break;
            case Mutation::Type::CLEAR: {
                auto it = data_.find(mutation.key);
                if (it != data_.end() && latestValue(it->second)) {
                    writeVersion(mutation.key, new_version, std::nullopt);
                    touched.insert(mutation.key);
                }
                break;
            }
            case Mutation::Type::CLEAR_RANGE: {
                std::vector<Key> cleared;
                for (auto it = data_.lower_bound(mutation.key); it != data_.end() && it->first < mutation.end; ++it) {
                    if (latestValue(it->second)) {
                        cleared.push_back(it->first);
                    }
                }
                for (const auto& key : cleared) {
                    writeVersion(key, new_version, std::nullopt);
                    touched.insert(key);
                }
                break;
            }
            case Mutation::Type::ATOMIC: {
                std::optional<Value> existing;
                auto it = data_.find(mutation.key);
                if (it != data_.end()) {
                    existing = latestValue(it->second);
                }
                writeVersion(mutation.key, new_version, applyAtomic(mutation.atomic_type, existing, mutation.value));
                touched.insert(mutation.key);
                break;
            }
        }
    }

    for (const auto& range : write_conflicts) {
        write_history_.emplace_back(new_version, range);
    }
    while (write_history_.size() > conflict_history_) {
        oldest_tracked_version_ = write_history_.front().first;
        write_history_.pop_front();
    }

    version_ = new_version;
    ++committed_transactions_;

    for (const auto& key : touched) {
        fireWatchers(key);
    }
    return new_version;
}

void MemoryStorage::fireWatchers(const Key& key) {
    auto range = watchers_.equal_range(key);
    if (range.first == range.second) {
        return;
    }
    std::optional<Value> current = latestValue(data_[key]);
    for (auto it = range.first; it != range.second;) {
        if (it->second.expected != current) {
            it->second.promise->set_value();
            it = watchers_.erase(it);
        } else {
            ++it;
        }
    }
}

std::shared_future<void> MemoryStorage::watch(const Key& key, const std::optional<Value>& expected) {
    auto promise = std::make_shared<std::promise<void>>();
    std::shared_future<void> future = promise->get_future().share();

    std::unique_lock<std::shared_mutex> lock(mutex_);
    std::optional<Value> current;
    auto it = data_.find(key);
    if (it != data_.end()) {
        current = latestValue(it->second);
    }
    if (current != expected) {
        promise->set_value();
    } else {
        watchers_.emplace(key, Watcher{expected, promise});
    }
    return future;
}

StorageStats MemoryStorage::getStats() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    StorageStats stats;
    stats.committed_transactions = committed_transactions_;
    stats.conflicts = conflicts_;
    stats.version = version_;
    for (const auto& entry : data_) {
        if (latestValue(entry.second)) {
            ++stats.live_keys;
        }
    }
    return stats;
}

Value MemoryStorage::applyAtomic(MutationType type, const std::optional<Value>& existing, const Value& param) {
    const size_t length = param.size();
    switch (type) {
        case MutationType::ADD: {
            Value current = resized(existing.value_or(Value()), length);
            Value result(length, '\0');
            unsigned carry = 0;
            for (size_t i = 0; i < length; ++i) {
                unsigned sum = static_cast<unsigned char>(current[i]) + static_cast<unsigned char>(param[i]) + carry;
                result[i] = static_cast<char>(sum & 0xFF);
                carry = sum >> 8;
            }
            return result;
        }
        case MutationType::BIT_AND: {
            if (!existing) {
                return param;
            }
            Value current = resized(*existing, length);
            Value result(length, '\0');
            for (size_t i = 0; i < length; ++i) {
                result[i] = static_cast<char>(current[i] & param[i]);
            }
            return result;
        }
        case MutationType::BIT_OR:
        case MutationType::BIT_XOR: {
            Value current = resized(existing.value_or(Value()), length);
            Value result(length, '\0');
            for (size_t i = 0; i < length; ++i) {
                result[i] = type == MutationType::BIT_OR ? static_cast<char>(current[i] | param[i])
                                                         : static_cast<char>(current[i] ^ param[i]);
            }
            return result;
        }
        case MutationType::MAX:
        case MutationType::MIN: {
            if (!existing) {
                return param;
            }
            Value current = resized(*existing, length);
            int cmp = compareLittleEndian(current, param);
            if (type == MutationType::MAX) {
                return cmp >= 0 ? current : param;
            }
            return cmp <= 0 ? current : param;
        }
        case MutationType::APPEND_IF_FITS: {
            Value current = existing.value_or(Value());
            if (current.size() + param.size() > MAX_VALUE_SIZE) {
                return current;
            }
            return current + param;
        }
    }
    throw TransactionError(ErrorCode::INVALID_OPERATION, "未知的原子操作类型");
}

} // namespace txlog
