#include <gtest/gtest.h>
#include "storage/txlog_memory_storage.hpp"
#include <chrono>
#include <thread>

using namespace txlog;

class MemoryStorageTest : public ::testing::Test {
protected:
    MemoryStorage storage_;

    Version put(const Key& key, const Value& value) {
        Version v = storage_.getReadVersion();
        return storage_.commit(v, {}, {KeyRange::single(key)}, {Mutation::set(key, value)});
    }
};

TEST_F(MemoryStorageTest, CommitCreatesNewVersion) {
    EXPECT_EQ(storage_.getReadVersion(), 0);
    Version v1 = put("a", "1");
    EXPECT_EQ(v1, 1);
    Version v2 = put("a", "2");
    EXPECT_EQ(v2, 2);

    EXPECT_EQ(storage_.read("a", v2), std::optional<Value>("2"));
    EXPECT_EQ(storage_.read("a", v1), std::optional<Value>("1"));
    EXPECT_FALSE(storage_.read("a", 0).has_value());
    EXPECT_FALSE(storage_.read("missing", v2).has_value());
}

TEST_F(MemoryStorageTest, ReadingFutureVersionFails) {
    put("a", "1");
    try {
        storage_.read("a", 5);
        FAIL() << "expected future_version";
    } catch (const TransactionError& e) {
        EXPECT_EQ(e.code(), ErrorCode::FUTURE_VERSION);
    }
}

TEST_F(MemoryStorageTest, ReadRangeAtVersion) {
    put("a", "1");
    put("b", "2");
    Version before_c = storage_.getReadVersion();
    put("c", "3");

    auto all = storage_.readRange("a", "z", storage_.getReadVersion());
    EXPECT_EQ(all.size(), 3u);
    auto older = storage_.readRange("a", "z", before_c);
    EXPECT_EQ(older.size(), 2u);
    auto partial = storage_.readRange("b", "c", storage_.getReadVersion());
    ASSERT_EQ(partial.size(), 1u);
    EXPECT_EQ(partial.begin()->first, "b");
    EXPECT_TRUE(storage_.readRange("c", "a", storage_.getReadVersion()).empty());
}

TEST_F(MemoryStorageTest, ConflictingCommitIsRejected) {
    put("x", "1");
    Version read_version = storage_.getReadVersion();

    // 另一个事务在读取之后写入
    put("x", "2");

    try {
        storage_.commit(read_version, {KeyRange::single("x")}, {KeyRange::single("y")}, {Mutation::set("y", "1")});
        FAIL() << "expected not_committed";
    } catch (const TransactionError& e) {
        EXPECT_EQ(e.code(), ErrorCode::NOT_COMMITTED);
    }
    EXPECT_FALSE(storage_.read("y", storage_.getReadVersion()).has_value());
    EXPECT_EQ(storage_.getStats().conflicts, 1u);
}

TEST_F(MemoryStorageTest, DisjointWritesDoNotConflict) {
    put("x", "1");
    Version read_version = storage_.getReadVersion();
    put("other", "2");

    Version v = storage_.commit(read_version, {KeyRange::single("x")}, {KeyRange::single("x")},
                                {Mutation::set("x", "3")});
    EXPECT_EQ(storage_.read("x", v), std::optional<Value>("3"));
}

TEST_F(MemoryStorageTest, ClearAndClearRange) {
    put("a", "1");
    put("b", "2");
    put("c", "3");
    Version before = storage_.getReadVersion();

    Version v = storage_.commit(before, {}, {KeyRange("a", "c")},
                                {Mutation::clearRange("a", "c"), Mutation::clear("c")});
    EXPECT_TRUE(storage_.readRange("", KEYSPACE_END, v).empty());
    EXPECT_EQ(storage_.readRange("", KEYSPACE_END, before).size(), 3u);
    EXPECT_EQ(storage_.getStats().live_keys, 0u);
}

TEST_F(MemoryStorageTest, HistoryWindowRejectsOldReadVersions) {
    MemoryStorage small(2);
    for (int i = 0; i < 5; ++i) {
        Version v = small.getReadVersion();
        small.commit(v, {}, {KeyRange::single("k")}, {Mutation::set("k", std::to_string(i))});
    }
    try {
        small.commit(1, {KeyRange::single("k")}, {}, {Mutation::set("z", "1")});
        FAIL() << "expected transaction_too_old";
    } catch (const TransactionError& e) {
        EXPECT_EQ(e.code(), ErrorCode::TRANSACTION_TOO_OLD);
    }
}

TEST_F(MemoryStorageTest, AtomicAddWithCarry) {
    EXPECT_EQ(MemoryStorage::applyAtomic(MutationType::ADD, Value("\x01", 1), Value("\x02", 1)), Value("\x03", 1));
    EXPECT_EQ(MemoryStorage::applyAtomic(MutationType::ADD, Value("\xff\x00", 2), Value("\x01\x00", 2)),
              Value("\x00\x01", 2));
    // 不存在的值按0处理
    EXPECT_EQ(MemoryStorage::applyAtomic(MutationType::ADD, std::nullopt, Value("\x05\x00", 2)),
              Value("\x05\x00", 2));
}

TEST_F(MemoryStorageTest, AtomicBitwiseAndMinMax) {
    const Value a("\x0c", 1);
    const Value b("\x0a", 1);
    EXPECT_EQ(MemoryStorage::applyAtomic(MutationType::BIT_AND, a, b), Value("\x08", 1));
    EXPECT_EQ(MemoryStorage::applyAtomic(MutationType::BIT_OR, a, b), Value("\x0e", 1));
    EXPECT_EQ(MemoryStorage::applyAtomic(MutationType::BIT_XOR, a, b), Value("\x06", 1));
    EXPECT_EQ(MemoryStorage::applyAtomic(MutationType::BIT_AND, std::nullopt, b), b);

    // 小端比较: 0x0100 > 0x00ff
    const Value big("\x00\x01", 2);
    const Value small("\xff\x00", 2);
    EXPECT_EQ(MemoryStorage::applyAtomic(MutationType::MAX, small, big), big);
    EXPECT_EQ(MemoryStorage::applyAtomic(MutationType::MIN, big, small), small);
    EXPECT_EQ(MemoryStorage::applyAtomic(MutationType::MIN, std::nullopt, big), big);
}

TEST_F(MemoryStorageTest, AppendIfFits) {
    EXPECT_EQ(MemoryStorage::applyAtomic(MutationType::APPEND_IF_FITS, Value("ab"), Value("cd")), "abcd");
    Value large(MAX_VALUE_SIZE, 'x');
    EXPECT_EQ(MemoryStorage::applyAtomic(MutationType::APPEND_IF_FITS, large, Value("y")), large);
}

TEST_F(MemoryStorageTest, AtomicMutationAppliesToStoredValue) {
    put("counter", Value("\x01\x00", 2));
    Version v = storage_.commit(storage_.getReadVersion(), {}, {KeyRange::single("counter")},
                                {Mutation::atomic("counter", Value("\x02\x00", 2), MutationType::ADD)});
    EXPECT_EQ(storage_.read("counter", v), std::optional<Value>(Value("\x03\x00", 2)));
}

TEST_F(MemoryStorageTest, WatchFiresOnChange) {
    put("w", "1");
    std::shared_future<void> watch = storage_.watch("w", Value("1"));
    EXPECT_EQ(watch.wait_for(std::chrono::milliseconds(0)), std::future_status::timeout);

    // 写入相同的值不触发
    put("w", "1");
    EXPECT_EQ(watch.wait_for(std::chrono::milliseconds(0)), std::future_status::timeout);

    put("w", "2");
    EXPECT_EQ(watch.wait_for(std::chrono::seconds(1)), std::future_status::ready);
}

TEST_F(MemoryStorageTest, WatchOnStaleValueFiresImmediately) {
    put("w", "2");
    std::shared_future<void> watch = storage_.watch("w", Value("1"));
    EXPECT_EQ(watch.wait_for(std::chrono::milliseconds(0)), std::future_status::ready);
}

TEST_F(MemoryStorageTest, StatsCountCommits) {
    put("a", "1");
    put("b", "2");
    StorageStats stats = storage_.getStats();
    EXPECT_EQ(stats.committed_transactions, 2u);
    EXPECT_EQ(stats.live_keys, 2u);
    EXPECT_EQ(stats.version, 2);
}

TEST_F(MemoryStorageTest, TransactionIdsAreUnique) {
    TransactionID a = storage_.nextTransactionId();
    TransactionID b = storage_.nextTransactionId();
    EXPECT_NE(a, b);
    EXPECT_NE(a, NO_TX);
}
