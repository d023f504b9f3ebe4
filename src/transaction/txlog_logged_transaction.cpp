#include "transaction/txlog_logged_transaction.hpp"
#include "txlog_logger.hpp"

namespace txlog {

namespace {

const char* NULL_RESULT = "<null>";

std::vector<std::string> readArgs(std::string first, bool snapshot) {
    std::vector<std::string> args;
    args.push_back(std::move(first));
    if (snapshot) {
        args.push_back("snapshot");
    }
    return args;
}

// 最多列出前几个，其余只给出数量
template<typename T, typename Fn>
std::string listPreview(const std::vector<T>& items, Fn&& format) {
    const size_t MAX_ITEMS = 4;
    std::string out = "[";
    for (size_t i = 0; i < items.size() && i < MAX_ITEMS; ++i) {
        if (i > 0) out += ", ";
        out += format(items[i]);
    }
    if (items.size() > MAX_ITEMS) {
        out += ", ... (" + std::to_string(items.size()) + " total)";
    }
    out += "]";
    return out;
}

int64_t rangeBytes(const std::vector<KeyValue>& items) {
    int64_t bytes = 0;
    for (const auto& kv : items) {
        bytes += static_cast<int64_t>(kv.key.size() + kv.value.size());
    }
    return bytes;
}

} // namespace

LoggedTransaction::LoggedTransaction(std::unique_ptr<ITransaction> inner,
                                     WorkerThreadPool* pool,
                                     LogHandler on_completed,
                                     const IClock& clock)
    : inner_(std::move(inner)), pool_(pool), on_completed_(std::move(on_completed)), log_(clock) {
    log_.start(inner_->getId());
}

LoggedTransaction::~LoggedTransaction() {
    finish();
}

void LoggedTransaction::finish() {
    log_.stop();
    bool expected = false;
    if (!finished_.compare_exchange_strong(expected, true)) {
        return;
    }
    if (!on_completed_) {
        return;
    }
    try {
        on_completed_(log_);
    } catch (const std::exception& e) {
        TXLOG_LOG_ERROR("事务 #", log_.id(), " 的日志回调抛出异常: ", e.what());
    }
}

Version LoggedTransaction::getReadVersion() {
    return execute(Command(Operation::GET_READ_VERSION), [this](PendingCommand& handle) {
        Version version = inner_->getReadVersion();
        handle.setResult(std::to_string(version));
        return version;
    });
}

std::optional<Value> LoggedTransaction::get(const Key& key, bool snapshot) {
    return execute(Command(Operation::GET, readArgs(Utils::printableKey(key), snapshot)),
                   [&](PendingCommand& handle) {
        std::optional<Value> value = inner_->get(key, snapshot);
        handle.setResultBytes(value ? static_cast<int64_t>(value->size()) : 0);
        handle.setResult(value ? Utils::printableValue(*value) : NULL_RESULT);
        return value;
    });
}

Key LoggedTransaction::getKey(const KeySelector& selector, bool snapshot) {
    return execute(Command(Operation::GET_KEY, readArgs(selector.toString(), snapshot)),
                   [&](PendingCommand& handle) {
        Key key = inner_->getKey(selector, snapshot);
        handle.setResultBytes(static_cast<int64_t>(key.size()));
        handle.setResult(Utils::printableKey(key));
        return key;
    });
}

std::vector<std::optional<Value>> LoggedTransaction::getValues(const std::vector<Key>& keys, bool snapshot) {
    std::string preview = listPreview(keys, [](const Key& key) { return Utils::printableKey(key); });
    return execute(Command(Operation::GET_VALUES, readArgs(preview, snapshot)), [&](PendingCommand& handle) {
        std::vector<std::optional<Value>> values = inner_->getValues(keys, snapshot);
        int64_t bytes = 0;
        size_t found = 0;
        for (const auto& value : values) {
            if (value) {
                bytes += static_cast<int64_t>(value->size());
                ++found;
            }
        }
        handle.setResultBytes(bytes);
        handle.setResult(std::to_string(found) + " of " + std::to_string(values.size()) + " found");
        return values;
    });
}

std::vector<Key> LoggedTransaction::getKeys(const std::vector<KeySelector>& selectors, bool snapshot) {
    std::string preview = listPreview(selectors, [](const KeySelector& selector) { return selector.toString(); });
    return execute(Command(Operation::GET_KEYS, readArgs(preview, snapshot)), [&](PendingCommand& handle) {
        std::vector<Key> keys = inner_->getKeys(selectors, snapshot);
        int64_t bytes = 0;
        for (const auto& key : keys) {
            bytes += static_cast<int64_t>(key.size());
        }
        handle.setResultBytes(bytes);
        handle.setResult(listPreview(keys, [](const Key& key) { return Utils::printableKey(key); }));
        return keys;
    });
}

std::vector<KeyValue> LoggedTransaction::getRange(const KeySelector& begin, const KeySelector& end,
                                                  const RangeOptions& options, bool snapshot) {
    std::vector<std::string> args{begin.toString(), end.toString()};
    std::string option_text = options.toString();
    if (!option_text.empty()) {
        args.push_back(option_text);
    }
    if (snapshot) {
        args.push_back("snapshot");
    }
    return execute(Command(Operation::GET_RANGE, std::move(args)), [&](PendingCommand& handle) {
        std::vector<KeyValue> items = inner_->getRange(begin, end, options, snapshot);
        handle.setResultBytes(rangeBytes(items));
        handle.setResult(std::to_string(items.size()) + " results");
        return items;
    });
}

void LoggedTransaction::set(const Key& key, const Value& value) {
    Command command(Operation::SET, {Utils::printableKey(key), Utils::printableValue(value)});
    command.argument_bytes = static_cast<int64_t>(key.size() + value.size());
    execute(std::move(command), [&](PendingCommand&) { inner_->set(key, value); });
}

void LoggedTransaction::clear(const Key& key) {
    Command command(Operation::CLEAR, {Utils::printableKey(key)});
    command.argument_bytes = static_cast<int64_t>(key.size());
    execute(std::move(command), [&](PendingCommand&) { inner_->clear(key); });
}

void LoggedTransaction::clearRange(const Key& begin, const Key& end) {
    Command command(Operation::CLEAR_RANGE, {Utils::printableKey(begin), Utils::printableKey(end)});
    command.argument_bytes = static_cast<int64_t>(begin.size() + end.size());
    execute(std::move(command), [&](PendingCommand&) { inner_->clearRange(begin, end); });
}

void LoggedTransaction::atomicOp(const Key& key, const Value& param, MutationType type) {
    Command command(Operation::ATOMIC, {Utils::mutationTypeToString(type), Utils::printableKey(key),
                                        Utils::printableValue(param)});
    command.argument_bytes = static_cast<int64_t>(key.size() + param.size());
    execute(std::move(command), [&](PendingCommand&) { inner_->atomicOp(key, param, type); });
}

void LoggedTransaction::addConflictRange(const Key& begin, const Key& end, ConflictRangeType type) {
    Command command(Operation::ADD_CONFLICT_RANGE, {type == ConflictRangeType::READ ? "read" : "write",
                                                    Utils::printableKey(begin), Utils::printableKey(end)});
    execute(std::move(command), [&](PendingCommand&) { inner_->addConflictRange(begin, end, type); });
}

std::shared_future<void> LoggedTransaction::watch(const Key& key) {
    return execute(Command(Operation::WATCH, {Utils::printableKey(key)}),
                   [&](PendingCommand&) { return inner_->watch(key); });
}

void LoggedTransaction::commit() {
    log_.addCommitAttempt(inner_->getApproximateSize());
    execute(Command(Operation::COMMIT), [this](PendingCommand& handle) {
        inner_->commit();
        Version version = inner_->getCommittedVersion();
        if (version != NO_VERSION) {
            handle.setResult("v" + std::to_string(version));
        }
    });
    Version version = inner_->getCommittedVersion();
    if (version != NO_VERSION) {
        log_.setCommittedVersion(version);
    }
    log_.stop();
}

void LoggedTransaction::onError(ErrorCode code) {
    Command command(Operation::ON_ERROR, {Utils::errorCodeToString(code) + " (" +
                                          std::to_string(static_cast<int>(code)) + ")"});
    execute(std::move(command), [&](PendingCommand&) { inner_->onError(code); });
}

void LoggedTransaction::reset() {
    log_.record(Command(Operation::RESET));
    inner_->reset();
}

void LoggedTransaction::cancel() {
    log_.record(Command(Operation::CANCEL));
    inner_->cancel();
}

void LoggedTransaction::annotate(const std::string& message) {
    log_.record(Command(Operation::LOG, {message}), false);
}

std::future<std::optional<Value>> LoggedTransaction::getAsync(const Key& key, bool snapshot) {
    if (pool_ == nullptr) {
        return std::async(std::launch::deferred, [this, key, snapshot]() { return get(key, snapshot); });
    }
    return pool_->submit([this, key, snapshot]() { return get(key, snapshot); });
}

std::future<std::vector<KeyValue>> LoggedTransaction::getRangeAsync(const KeySelector& begin, const KeySelector& end,
                                                                     const RangeOptions& options, bool snapshot) {
    if (pool_ == nullptr) {
        return std::async(std::launch::deferred,
                          [this, begin, end, options, snapshot]() { return getRange(begin, end, options, snapshot); });
    }
    return pool_->submit([this, begin, end, options, snapshot]() { return getRange(begin, end, options, snapshot); });
}

} // namespace txlog
