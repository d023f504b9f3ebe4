#include "log/txlog_event_log.hpp"
#include "transaction/txlog_database.hpp"
#include <benchmark/benchmark.h>
#include <memory>
#include <string>

using namespace std;

namespace txlog {

// 单线程begin/end一条命令的开销
static void BM_EventLogBeginEnd(benchmark::State& state) {
    EventLog log;
    log.start(1);
    for (auto _ : state) {
        Command command(Operation::GET, {"'bench_key'"});
        PendingCommand handle = log.begin(std::move(command));
        handle.setResultBytes(8);
        log.end(std::move(handle));
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_EventLogBeginEnd);

// 多线程并发记录到同一个日志
class SharedEventLogBenchmark : public ::benchmark::Fixture {
public:
    void SetUp(const ::benchmark::State& state) override {
        if (state.thread_index() == 0) {
            log_ = make_unique<EventLog>();
            log_->start(2);
        }
    }

    void TearDown(const ::benchmark::State& state) override {
        if (state.thread_index() == 0) {
            log_.reset();
        }
    }

protected:
    unique_ptr<EventLog> log_;
};

BENCHMARK_DEFINE_F(SharedEventLogBenchmark, BM_ConcurrentBeginEnd)(benchmark::State& state) {
    for (auto _ : state) {
        PendingCommand handle = log_->begin(Command(Operation::SET));
        log_->end(std::move(handle));
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK_REGISTER_F(SharedEventLogBenchmark, BM_ConcurrentBeginEnd)->Threads(1)->Threads(4)->Threads(8);

// 渲染包含大量命令的时间轴报表
static void BM_TimingsReport(benchmark::State& state) {
    EventLog log;
    log.start(3);
    for (int64_t i = 0; i < state.range(0); ++i) {
        PendingCommand handle = log.begin(Command(Operation::GET, {"'key_" + to_string(i) + "'"}));
        handle.setResultBytes(16);
        log.end(std::move(handle));
    }
    log.stop();

    for (auto _ : state) {
        benchmark::DoNotOptimize(log.getTimingsReport(true));
    }
}
BENCHMARK(BM_TimingsReport)->Arg(10)->Arg(100)->Arg(1000);

// 带日志的完整读写事务
static void BM_LoggedTransaction(benchmark::State& state) {
    Logger::getInstance().setConsoleOutput(false);
    Database db;
    int64_t i = 0;
    for (auto _ : state) {
        string key = "bench_key_" + to_string(i++ % 1000);
        db.run([&key](LoggedTransaction& tr) {
            tr.get(key);
            tr.set(key, "value");
        });
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_LoggedTransaction);

} // namespace txlog
