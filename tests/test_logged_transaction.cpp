#include <gtest/gtest.h>
#include "transaction/txlog_logged_transaction.hpp"
#include "transaction/txlog_memory_transaction.hpp"
#include "test_clock_helpers.hpp"

using namespace txlog;

class LoggedTransactionTest : public ::testing::Test {
protected:
    MemoryStorage storage_;
    ManualClock clock_;
    int handled_ = 0;
    std::string last_report_;

    std::unique_ptr<LoggedTransaction> begin(WorkerThreadPool* pool = nullptr) {
        TransactionOptions options;
        options.initial_retry_delay_ms = 0;
        options.max_retry_delay_ms = 0;
        return std::make_unique<LoggedTransaction>(
            std::make_unique<MemoryTransaction>(storage_, options), pool,
            [this](const EventLog& log) {
                ++handled_;
                last_report_ = log.getCommandsReport();
            },
            clock_);
    }
};

TEST_F(LoggedTransactionTest, RecordsEachCall) {
    auto tr = begin();
    tr->set("a", "1");
    EXPECT_EQ(tr->get("a"), std::optional<Value>("1"));
    EXPECT_FALSE(tr->get("b", true).has_value());
    tr->commit();

    EventLogSnapshot snap = tr->log().snapshot();
    ASSERT_EQ(snap.commands.size(), 4u);
    EXPECT_EQ(snap.commands[0].toString(), "Set('a', '1')");
    EXPECT_EQ(snap.commands[1].toString(), "Get('a') => '1'");
    EXPECT_EQ(snap.commands[2].toString(), "Get('b', snapshot) => <null>");
    EXPECT_EQ(snap.commands[3].toString(), "Commit() => v1");

    EXPECT_EQ(tr->log().operations(), 4);
    EXPECT_EQ(tr->log().writeSize(), 2);
    EXPECT_EQ(tr->log().readSize(), 1);
    EXPECT_EQ(tr->log().attempts(), 1);
    EXPECT_EQ(tr->log().commitSize(), 2);
    EXPECT_EQ(tr->log().committedVersion(), 1);
    EXPECT_TRUE(tr->log().completed());
}

TEST_F(LoggedTransactionTest, RangeAndSelectorArguments) {
    auto seed = begin();
    seed->set("a", "1");
    seed->set("b", "22");
    seed->commit();

    auto tr = begin();
    auto items = tr->getRange(KeySelector::firstGreaterOrEqual("a"), KeySelector::firstGreaterOrEqual("z"),
                              RangeOptions(5, true));
    ASSERT_EQ(items.size(), 2u);
    EXPECT_EQ(tr->getKey(KeySelector::firstGreaterThan("a")), "b");

    EventLogSnapshot snap = tr->log().snapshot();
    ASSERT_EQ(snap.commands.size(), 2u);
    EXPECT_EQ(snap.commands[0].toString(), "GetRange(fGE{'a'}, fGE{'z'}, limit=5, reverse) => 2 results");
    EXPECT_EQ(snap.commands[1].toString(), "GetKey(fGT{'a'}) => 'b'");
    EXPECT_EQ(tr->log().readSize(), 1 + 1 + 1 + 2 + 1);
}

TEST_F(LoggedTransactionTest, FailedOperationKeepsError) {
    auto tr = begin();
    EXPECT_THROW(tr->set(Key(MAX_KEY_SIZE + 1, 'k'), "v"), TransactionError);

    EventLogSnapshot snap = tr->log().snapshot();
    ASSERT_EQ(snap.commands.size(), 1u);
    ASSERT_TRUE(snap.commands[0].failed());
    EXPECT_EQ(snap.commands[0].error->code, ErrorCode::KEY_TOO_LARGE);
    EXPECT_FALSE(snap.commands[0].isOpen());
}

TEST_F(LoggedTransactionTest, AnnotationIsNotCounted) {
    auto tr = begin();
    tr->annotate("loading users");
    tr->set("a", "1");

    EXPECT_EQ(tr->log().operations(), 1);
    EXPECT_EQ(tr->log().commandCount(), 2u);
    EXPECT_EQ(tr->log().snapshot().commands[0].toString(), "// loading users");
}

TEST_F(LoggedTransactionTest, OnErrorIsRecorded) {
    auto tr = begin();
    tr->set("a", "1");
    tr->onError(ErrorCode::NOT_COMMITTED);
    EXPECT_EQ(tr->getRetryCount(), 1);
    EXPECT_THROW(tr->onError(ErrorCode::READ_ONLY), TransactionError);

    EventLogSnapshot snap = tr->log().snapshot();
    ASSERT_EQ(snap.commands.size(), 3u);
    EXPECT_EQ(snap.commands[1].toString(), "OnError(not_committed (1020))");
    EXPECT_TRUE(snap.commands[2].failed());
}

TEST_F(LoggedTransactionTest, HandlerCalledOnce) {
    {
        auto tr = begin();
        tr->set("a", "1");
        tr->commit();
        EXPECT_EQ(handled_, 0);
        tr->finish();
        EXPECT_EQ(handled_, 1);
        tr->finish();
    }
    EXPECT_EQ(handled_, 1);
    EXPECT_NE(last_report_.find("Set('a', '1')"), std::string::npos);
}

TEST_F(LoggedTransactionTest, DestructorDeliversLog) {
    {
        auto tr = begin();
        tr->get("a");
    }
    EXPECT_EQ(handled_, 1);
    EXPECT_NE(last_report_.find("Get('a') => <null>"), std::string::npos);
}

TEST_F(LoggedTransactionTest, HandlerExceptionIsContained) {
    auto tr = std::make_unique<LoggedTransaction>(
        std::make_unique<MemoryTransaction>(storage_), nullptr,
        [](const EventLog&) { throw std::runtime_error("handler failed"); }, clock_);
    EXPECT_NO_THROW(tr->finish());
}

TEST_F(LoggedTransactionTest, ResetAndCancelAreInstant) {
    auto tr = begin();
    tr->cancel();
    EXPECT_THROW(tr->get("a"), TransactionError);
    tr->reset();
    EXPECT_NO_THROW(tr->get("a"));

    EXPECT_EQ(tr->log().step(), 2);
    EventLogSnapshot snap = tr->log().snapshot();
    ASSERT_EQ(snap.commands.size(), 4u);
    EXPECT_EQ(snap.commands[0].op, Operation::CANCEL);
    EXPECT_EQ(snap.commands[0].duration(), Duration::zero());
    EXPECT_EQ(snap.commands[2].op, Operation::RESET);
}

TEST_F(LoggedTransactionTest, AsyncReadsOnWorkerPool) {
    auto seed = begin();
    seed->set("x", "10");
    seed->set("y", "20");
    seed->commit();

    WorkerThreadPool pool(2);
    auto tr = begin(&pool);
    auto x = tr->getAsync("x");
    auto y = tr->getAsync("y");
    auto range = tr->getRangeAsync(KeySelector::firstGreaterOrEqual("x"), KeySelector::firstGreaterOrEqual("z"));

    EXPECT_EQ(x.get(), std::optional<Value>("10"));
    EXPECT_EQ(y.get(), std::optional<Value>("20"));
    EXPECT_EQ(range.get().size(), 2u);
    EXPECT_EQ(tr->log().operations(), 3);
    EXPECT_EQ(tr->log().step(), 3);
    pool.stop();
}

TEST_F(LoggedTransactionTest, AsyncReadsWithoutPoolAreDeferred) {
    auto tr = begin();
    auto value = tr->getAsync("missing");
    EXPECT_EQ(tr->log().operations(), 0);
    EXPECT_FALSE(value.get().has_value());
    EXPECT_EQ(tr->log().operations(), 1);
}
