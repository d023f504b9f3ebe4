#pragma once

#include "../txlog_options.hpp"
#include "../txlog_logger.hpp"
#include "../txlog_worker_pool.hpp"
#include "../storage/txlog_memory_storage.hpp"
#include "txlog_memory_transaction.hpp"
#include "txlog_logged_transaction.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <type_traits>

namespace txlog {

// 数据库实例，持有存储、配置和工作线程池
class Database {
public:
    explicit Database(const DatabaseOptions& options = DatabaseOptions(),
                      const IClock& clock = SteadyClock::getInstance());
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    // 不记录日志的事务
    std::unique_ptr<ITransaction> createTransaction();

    // 记录日志的事务，销毁时把日志交给日志回调
    std::unique_ptr<LoggedTransaction> beginTransaction();

    // 安装事务完成时的回调，传入空函数表示移除
    void setLogHandler(LogHandler handler);

    // 执行body并提交，遇到可重试错误时调用onError后重新执行
    template<typename Fn>
    auto run(Fn&& body) -> std::invoke_result_t<Fn, LoggedTransaction&> {
        using R = std::invoke_result_t<Fn, LoggedTransaction&>;
        auto tr = beginTransaction();
        while (true) {
            try {
                if constexpr (std::is_void_v<R>) {
                    body(*tr);
                    tr->commit();
                    return;
                } else {
                    R result = body(*tr);
                    tr->commit();
                    return result;
                }
            } catch (const TransactionError& e) {
                TXLOG_LOG_DEBUG("事务 #", tr->getId(), " 执行失败: [", Utils::errorCodeToString(e.code()), "] ",
                                e.what());
                // 不可重试或超过重试次数时抛出
                retryOrThrow(*tr, e.code());
            }
        }
    }

    // 只读的重试循环，不提交
    template<typename Fn>
    auto read(Fn&& body) -> std::invoke_result_t<Fn, LoggedTransaction&> {
        using R = std::invoke_result_t<Fn, LoggedTransaction&>;
        auto tr = beginTransaction();
        while (true) {
            try {
                if constexpr (std::is_void_v<R>) {
                    body(*tr);
                    tr->finish();
                    return;
                } else {
                    R result = body(*tr);
                    tr->finish();
                    return result;
                }
            } catch (const TransactionError& e) {
                TXLOG_LOG_DEBUG("只读事务 #", tr->getId(), " 执行失败: [", Utils::errorCodeToString(e.code()), "] ",
                                e.what());
                retryOrThrow(*tr, e.code());
            }
        }
    }

    const DatabaseOptions& getOptions() const { return options_; }
    MemoryStorage& getStorage() { return storage_; }
    WorkerThreadPool& getWorkerPool() { return *worker_pool_; }

    // 已经交给回调的事务日志数量
    uint64_t getCompletedTransactions() const { return completed_transactions_.load(); }

private:
    void retryOrThrow(LoggedTransaction& tr, ErrorCode code);

    // 所有记录日志的事务结束时调用
    void onTransactionCompleted(const EventLog& log);

    DatabaseOptions options_;
    const IClock& clock_;
    MemoryStorage storage_;
    std::unique_ptr<WorkerThreadPool> worker_pool_;

    std::mutex handler_mutex_;
    LogHandler log_handler_;
    std::atomic<uint64_t> completed_transactions_{0};
};

} // namespace txlog
