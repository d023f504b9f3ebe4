#pragma once

#include "txlog_transaction.hpp"
#include "../log/txlog_event_log.hpp"
#include "../txlog_worker_pool.hpp"
#include <atomic>
#include <functional>
#include <memory>
#include <type_traits>

namespace txlog {

// 事务结束时接收完整的日志
using LogHandler = std::function<void(const EventLog&)>;

// 把每个调用记录到EventLog中再转发给内部事务
// 异步读取返回的future必须在事务销毁前完成
class LoggedTransaction : public ITransaction {
public:
    LoggedTransaction(std::unique_ptr<ITransaction> inner,
                      WorkerThreadPool* pool,
                      LogHandler on_completed,
                      const IClock& clock = SteadyClock::getInstance());

    // 停止日志并交给回调（如果还没有交过）
    ~LoggedTransaction() override;

    LoggedTransaction(const LoggedTransaction&) = delete;
    LoggedTransaction& operator=(const LoggedTransaction&) = delete;

    TransactionID getId() const override { return inner_->getId(); }
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
    Version getCommittedVersion() const override { return inner_->getCommittedVersion(); }
    int64_t getApproximateSize() const override { return inner_->getApproximateSize(); }

    void onError(ErrorCode code) override;
    void reset() override;
    void cancel() override;
    int getRetryCount() const override { return inner_->getRetryCount(); }

    // 在日志中插入一条注释，不计入操作数
    void annotate(const std::string& message);

    // 在线程池中执行读取，多个并发读取共享同一个步号
    std::future<std::optional<Value>> getAsync(const Key& key, bool snapshot = false);
    std::future<std::vector<KeyValue>> getRangeAsync(const KeySelector& begin, const KeySelector& end,
                                                     const RangeOptions& options = RangeOptions(),
                                                     bool snapshot = false);

    // 停止日志并调用回调，只生效一次
    void finish();

    const EventLog& log() const { return log_; }
    ITransaction& inner() { return *inner_; }

private:
    // begin/end包裹一次调用，内部抛出的错误记录到命令上后重新抛出
    template<typename Fn>
    auto execute(Command command, Fn&& fn) -> std::invoke_result_t<Fn, PendingCommand&> {
        using R = std::invoke_result_t<Fn, PendingCommand&>;
        PendingCommand handle = log_.begin(std::move(command));
        try {
            if constexpr (std::is_void_v<R>) {
                fn(handle);
                log_.end(std::move(handle));
            } else {
                R result = fn(handle);
                log_.end(std::move(handle));
                return result;
            }
        } catch (const TransactionError& e) {
            log_.end(std::move(handle), e.toOperationError());
            throw;
        } catch (const std::exception& e) {
            log_.end(std::move(handle), OperationError(ErrorCode::INTERNAL_ERROR, e.what()));
            throw;
        }
    }

    std::unique_ptr<ITransaction> inner_;
    WorkerThreadPool* pool_;
    LogHandler on_completed_;
    EventLog log_;
    std::atomic<bool> finished_{false};
};

} // namespace txlog
