#pragma once

#include "../txlog_core.hpp"
#include "txlog_clock.hpp"
#include "txlog_command.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace txlog {

class EventLog;

// begin()返回的句柄，只能移动，必须交还给同一个EventLog::end()
// 句柄不能比创建它的EventLog活得更久
class PendingCommand {
public:
    PendingCommand() : log_(nullptr), command_(nullptr), step_(0), op_(Operation::INVALID) {}
    ~PendingCommand();

    PendingCommand(PendingCommand&& other) noexcept;
    PendingCommand& operator=(PendingCommand&& other) noexcept;

    PendingCommand(const PendingCommand&) = delete;
    PendingCommand& operator=(const PendingCommand&) = delete;

    bool valid() const { return command_ != nullptr; }

    // begin时读取到的步号
    int step() const { return step_; }
    Operation op() const { return op_; }

    // 结果在end()时一起写入命令
    void setResultBytes(int64_t bytes) { result_bytes_ = bytes; }
    void setResult(std::string result) { result_ = std::move(result); }

private:
    friend class EventLog;

    PendingCommand(EventLog* log, Command* command, int step, Operation op)
        : log_(log), command_(command), step_(step), op_(op) {}

    void release() {
        log_ = nullptr;
        command_ = nullptr;
    }

    // 丢弃尚未end的命令，命令保持进行中
    void drop();

    EventLog* log_;
    Command* command_;
    int step_;
    Operation op_;
    std::optional<int64_t> result_bytes_;
    std::string result_;
};

// 某一时刻事务日志的拷贝，报表只读取快照
struct EventLogSnapshot {
    TransactionID id = NO_TX;
    std::vector<Command> commands;
    int operations = 0;
    int step = 0;
    int64_t read_size = 0;
    int64_t write_size = 0;
    int64_t commit_size = 0;
    int64_t total_commit_size = 0;
    int attempts = 0;
    bool completed = false;
    Duration total_duration = Duration::zero();
    Timestamp started_at;
    std::optional<Timestamp> stopped_at;
    std::optional<Timestamp> committed_at;
    Version committed_version = NO_VERSION;
};

// 单个逻辑事务（可能多次重试）的操作日志
// record/begin/end可以被多个线程并发调用
class EventLog {
public:
    explicit EventLog(const IClock& clock = SteadyClock::getInstance());
    ~EventLog() = default;

    EventLog(const EventLog&) = delete;
    EventLog& operator=(const EventLog&) = delete;
    EventLog(EventLog&&) = delete;
    EventLog& operator=(EventLog&&) = delete;

    // 记录开始时间和事务ID；再次调用会重置计时
    void start(TransactionID transaction_id);

    // 幂等，只有第一次调用记录结束时间
    void stop();

    // 瞬时操作，不推进步号
    void record(Command command, bool count_as_operation = true);

    // 耗时操作的开始，返回的句柄交给end()
    PendingCommand begin(Command command);

    // 耗时操作的结束，推进步号，并记录错误和读取字节数
    void end(PendingCommand&& handle, std::optional<OperationError> error = std::nullopt);

    // 每次提交尝试调用一次（包括随后重试的）
    void addCommitAttempt(int64_t commit_size);

    void setCommittedVersion(Version version);

    // 命令列表报表
    std::string getCommandsReport() const;

    // 时间轴报表
    std::string getTimingsReport(bool show_commands = false) const;

    EventLogSnapshot snapshot() const;

    TransactionID id() const { return id_.load(); }
    int operations() const { return counters_.operations.load(); }
    int step() const { return counters_.step.load(); }
    int64_t readSize() const { return counters_.read_size.load(); }
    int64_t writeSize() const { return counters_.write_size.load(); }
    int64_t commitSize() const { return counters_.commit_size.load(); }
    int64_t totalCommitSize() const { return counters_.total_commit_size.load(); }
    int attempts() const { return counters_.attempts.load(); }
    bool completed() const { return completed_.load(std::memory_order_acquire); }
    Version committedVersion() const { return committed_version_.load(); }

    Duration totalDuration() const;
    Timestamp startedAt() const;
    std::optional<Timestamp> stoppedAt() const;
    std::optional<Timestamp> committedAt() const;
    size_t commandCount() const;

private:
    // 相对开始时间的偏移
    Duration currentOffset() const;
    Duration durationUntil(bool is_completed) const;

    static Timestamp::rep toWall(Timestamp ts) { return ts.time_since_epoch().count(); }
    static Timestamp fromWall(Timestamp::rep rep) { return Timestamp(Timestamp::duration(rep)); }

    // 计数器在ledger_mutex_内修改，快照时与命令列表一致；单独读取不需要加锁
    struct Counters {
        std::atomic<int> step{0};
        std::atomic<int> operations{0};
        std::atomic<int64_t> read_size{0};
        std::atomic<int64_t> write_size{0};
        std::atomic<int64_t> commit_size{0};
        std::atomic<int64_t> total_commit_size{0};
        std::atomic<int> attempts{0};
    };

    const IClock& clock_;
    std::atomic<TransactionID> id_{NO_TX};
    std::atomic<int64_t> start_ticks_{0};
    std::atomic<int64_t> stop_ticks_{0};
    std::atomic<Timestamp::rep> started_wall_{0};
    std::atomic<Timestamp::rep> stopped_wall_{0};
    std::atomic<Timestamp::rep> committed_wall_{0};
    std::atomic<Version> committed_version_{NO_VERSION};
    std::atomic<bool> stopping_{false};
    std::atomic<bool> completed_{false};
    Counters counters_;

    // 只在追加、结束和拷贝时短暂持有
    mutable std::mutex ledger_mutex_;
    std::vector<std::unique_ptr<Command>> ledger_;
};

} // namespace txlog
