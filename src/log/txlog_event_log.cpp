#include "log/txlog_event_log.hpp"
#include "log/txlog_timeline.hpp"
#include "txlog_logger.hpp"
#include <algorithm>

namespace txlog {

PendingCommand::~PendingCommand() {
    drop();
}

void PendingCommand::drop() {
    if (command_ != nullptr) {
        // 命令保持进行中状态，报表中画到事务结束
        TXLOG_LOG_DEBUG("命令 ", Utils::operationToString(op_), " (step ", step_, ") 未调用end就被丢弃");
        release();
    }
}

PendingCommand::PendingCommand(PendingCommand&& other) noexcept
    : log_(other.log_), command_(other.command_), step_(other.step_), op_(other.op_),
      result_bytes_(std::move(other.result_bytes_)), result_(std::move(other.result_)) {
    other.release();
}

PendingCommand& PendingCommand::operator=(PendingCommand&& other) noexcept {
    if (this != &other) {
        drop();
        log_ = other.log_;
        command_ = other.command_;
        step_ = other.step_;
        op_ = other.op_;
        result_bytes_ = std::move(other.result_bytes_);
        result_ = std::move(other.result_);
        other.release();
    }
    return *this;
}

EventLog::EventLog(const IClock& clock) : clock_(clock) {
    start_ticks_.store(clock_.ticks());
    started_wall_.store(toWall(clock_.wallNow()));
}

void EventLog::start(TransactionID transaction_id) {
    id_.store(transaction_id);
    started_wall_.store(toWall(clock_.wallNow()));
    start_ticks_.store(clock_.ticks());
}

void EventLog::stop() {
    bool expected = false;
    if (!stopping_.compare_exchange_strong(expected, true)) {
        return;
    }
    stop_ticks_.store(clock_.ticks());
    stopped_wall_.store(toWall(clock_.wallNow()));
    completed_.store(true, std::memory_order_release);
}

Duration EventLog::currentOffset() const {
    return Clock::toDuration(clock_.ticks() - start_ticks_.load(), clock_.ticksPerSecond());
}

void EventLog::record(Command command, bool count_as_operation) {
    Duration offset = currentOffset();

    command.start_offset = offset;
    command.end_offset = offset;
    command.end_step.reset();
    command.context_id = Utils::currentContextId();

    auto owned = std::make_unique<Command>(std::move(command));
    std::lock_guard<std::mutex> lock(ledger_mutex_);
    owned->step = counters_.step.load();
    if (count_as_operation) {
        counters_.operations.fetch_add(1);
    }
    ledger_.push_back(std::move(owned));
}

PendingCommand EventLog::begin(Command command) {
    Duration offset = currentOffset();

    command.start_offset = offset;
    command.end_offset.reset();
    command.end_step.reset();
    command.context_id = Utils::currentContextId();

    Operation op = command.op;
    auto owned = std::make_unique<Command>(std::move(command));
    Command* raw = owned.get();
    int step = 0;
    {
        // 计数器和命令列表一起更新，快照里两者一致
        std::lock_guard<std::mutex> lock(ledger_mutex_);
        step = counters_.step.load();
        raw->step = step;
        if (raw->argument_bytes) {
            counters_.write_size.fetch_add(*raw->argument_bytes);
        }
        counters_.operations.fetch_add(1);
        ledger_.push_back(std::move(owned));
    }
    return PendingCommand(this, raw, step, op);
}

void EventLog::end(PendingCommand&& handle, std::optional<OperationError> error) {
    if (!handle.valid()) {
        TXLOG_LOG_WARNING("事务 #", id(), ": end() 收到无效的命令句柄，已忽略");
        return;
    }
    if (handle.log_ != this) {
        TXLOG_LOG_WARNING("事务 #", id(), ": end() 收到属于其他日志的命令句柄，已忽略");
        return;
    }

    Duration offset = currentOffset();

    {
        std::lock_guard<std::mutex> lock(ledger_mutex_);
        int step = counters_.step.fetch_add(1) + 1;
        Command* cmd = handle.command_;
        cmd->end_offset = std::max(offset, cmd->start_offset);
        cmd->end_step = step;
        cmd->error = std::move(error);
        if (handle.result_bytes_) {
            cmd->result_bytes = handle.result_bytes_;
        }
        if (!handle.result_.empty()) {
            cmd->result = std::move(handle.result_);
        }
        if (handle.result_bytes_) {
            counters_.read_size.fetch_add(*handle.result_bytes_);
        }
    }
    handle.release();
}

void EventLog::addCommitAttempt(int64_t commit_size) {
    std::lock_guard<std::mutex> lock(ledger_mutex_);
    counters_.commit_size.store(commit_size);
    counters_.total_commit_size.fetch_add(commit_size);
    counters_.attempts.fetch_add(1);
}

void EventLog::setCommittedVersion(Version version) {
    committed_version_.store(version);
    committed_wall_.store(toWall(clock_.wallNow()));
}

Duration EventLog::totalDuration() const {
    return durationUntil(completed());
}

Duration EventLog::durationUntil(bool is_completed) const {
    if (!is_completed) {
        return currentOffset();
    }
    return Clock::toDuration(stop_ticks_.load() - start_ticks_.load(), clock_.ticksPerSecond());
}

Timestamp EventLog::startedAt() const {
    return fromWall(started_wall_.load());
}

std::optional<Timestamp> EventLog::stoppedAt() const {
    if (!completed()) {
        return std::nullopt;
    }
    return fromWall(stopped_wall_.load());
}

std::optional<Timestamp> EventLog::committedAt() const {
    if (committed_version_.load() == NO_VERSION) {
        return std::nullopt;
    }
    return fromWall(committed_wall_.load());
}

size_t EventLog::commandCount() const {
    std::lock_guard<std::mutex> lock(ledger_mutex_);
    return ledger_.size();
}

EventLogSnapshot EventLog::snapshot() const {
    EventLogSnapshot snap;
    {
        std::lock_guard<std::mutex> lock(ledger_mutex_);
        snap.commands.reserve(ledger_.size());
        for (const auto& cmd : ledger_) {
            snap.commands.push_back(*cmd);
        }
        snap.operations = operations();
        snap.step = step();
        snap.read_size = readSize();
        snap.write_size = writeSize();
        snap.commit_size = commitSize();
        snap.total_commit_size = totalCommitSize();
        snap.attempts = attempts();
    }
    snap.id = id();

    // completed_只读一次，结束时间和总耗时都由它决定
    snap.completed = completed();
    snap.total_duration = durationUntil(snap.completed);
    snap.started_at = startedAt();
    if (snap.completed) {
        snap.stopped_at = fromWall(stopped_wall_.load());
    }
    snap.committed_at = committedAt();
    snap.committed_version = committedVersion();
    return snap;
}

std::string EventLog::getCommandsReport() const {
    return TimelineRenderer::renderCommands(snapshot());
}

std::string EventLog::getTimingsReport(bool show_commands) const {
    return TimelineRenderer::render(snapshot(), show_commands);
}

} // namespace txlog
