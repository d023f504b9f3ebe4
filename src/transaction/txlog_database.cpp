#include "transaction/txlog_database.hpp"
#include <chrono>

namespace txlog {

Database::Database(const DatabaseOptions& options, const IClock& clock)
    : options_(options),
      clock_(clock),
      worker_pool_(std::make_unique<WorkerThreadPool>(options.worker_threads)) {
    TXLOG_LOG_INFO("数据库已打开: ", options_.toString());
}

Database::~Database() {
    worker_pool_->stop();
    StorageStats stats = storage_.getStats();
    TXLOG_LOG_DEBUG("数据库已关闭，提交事务数: ", stats.committed_transactions, ", 冲突数: ", stats.conflicts);
}

std::unique_ptr<ITransaction> Database::createTransaction() {
    return std::make_unique<MemoryTransaction>(storage_, options_.toTransactionOptions());
}

std::unique_ptr<LoggedTransaction> Database::beginTransaction() {
    return std::make_unique<LoggedTransaction>(createTransaction(), worker_pool_.get(),
                                               [this](const EventLog& log) { onTransactionCompleted(log); },
                                               clock_);
}

void Database::setLogHandler(LogHandler handler) {
    std::lock_guard<std::mutex> lock(handler_mutex_);
    log_handler_ = std::move(handler);
}

void Database::retryOrThrow(LoggedTransaction& tr, ErrorCode code) {
    try {
        tr.onError(code);
    } catch (const TransactionError& e) {
        TXLOG_LOG_WARNING("事务 #", tr.getId(), " 放弃重试: [", Utils::errorCodeToString(e.code()), "] ", e.what());
        throw;
    }
}

void Database::onTransactionCompleted(const EventLog& log) {
    completed_transactions_.fetch_add(1);

    if (options_.trace_transactions &&
        log.totalDuration() >= std::chrono::milliseconds(options_.trace_threshold_ms)) {
        TXLOG_LOG_INFO("慢事务 #", log.id(), "\n", log.getTimingsReport(options_.trace_show_commands));
    }

    LogHandler handler;
    {
        std::lock_guard<std::mutex> lock(handler_mutex_);
        handler = log_handler_;
    }
    if (handler) {
        handler(log);
    }
}

} // namespace txlog
