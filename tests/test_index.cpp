#include <gtest/gtest.h>
#include "index/txlog_index.hpp"
#include "transaction/txlog_memory_transaction.hpp"

using namespace txlog;

using CityIndex = Index<int64_t, std::optional<std::string>>;

class IndexTest : public ::testing::Test {
protected:
    MemoryStorage storage_;
    Subspace root_{"app"};
    CityIndex by_city_{"by_city", root_.sub("by_city")};

    std::unique_ptr<MemoryTransaction> begin() {
        return std::make_unique<MemoryTransaction>(storage_);
    }

    void populate() {
        auto tr = begin();
        by_city_.add(*tr, 1, std::string("Berlin"));
        by_city_.add(*tr, 2, std::string("Paris"));
        by_city_.add(*tr, 3, std::string("Paris"));
        by_city_.add(*tr, 4, std::string("Tokyo"));
        by_city_.add(*tr, 5, std::nullopt);
        tr->commit();
    }
};

TEST_F(IndexTest, LookupByValue) {
    populate();
    auto tr = begin();
    EXPECT_EQ(by_city_.lookup(*tr, std::string("Paris")), (std::vector<int64_t>{2, 3}));
    EXPECT_EQ(by_city_.lookup(*tr, std::string("Paris"), true), (std::vector<int64_t>{3, 2}));
    EXPECT_EQ(by_city_.lookup(*tr, std::string("Berlin")), (std::vector<int64_t>{1}));
    EXPECT_TRUE(by_city_.lookup(*tr, std::string("Rome")).empty());
}

TEST_F(IndexTest, PrefixValuesAreNotMixed) {
    auto tr = begin();
    by_city_.add(*tr, 1, std::string("Par"));
    by_city_.add(*tr, 2, std::string("Paris"));
    EXPECT_EQ(by_city_.lookup(*tr, std::string("Par")), (std::vector<int64_t>{1}));
}

TEST_F(IndexTest, NullValuesAreSkippedByDefault) {
    populate();
    auto tr = begin();
    EXPECT_TRUE(by_city_.lookup(*tr, std::nullopt).empty());

    CityIndex with_nulls("with_nulls", root_.sub("with_nulls"), true);
    EXPECT_TRUE(with_nulls.add(*tr, 9, std::nullopt));
    EXPECT_EQ(with_nulls.lookup(*tr, std::nullopt), (std::vector<int64_t>{9}));
}

TEST_F(IndexTest, UpdateMovesEntry) {
    populate();
    auto tr = begin();
    EXPECT_FALSE(by_city_.update(*tr, 1, std::string("Berlin"), std::string("Berlin")));
    EXPECT_TRUE(by_city_.update(*tr, 1, std::string("Tokyo"), std::string("Berlin")));
    tr->commit();

    auto check = begin();
    EXPECT_TRUE(by_city_.lookup(*check, std::string("Berlin")).empty());
    EXPECT_EQ(by_city_.lookup(*check, std::string("Tokyo")), (std::vector<int64_t>{1, 4}));
}

TEST_F(IndexTest, UpdateFromNullAddsEntry) {
    populate();
    auto tr = begin();
    EXPECT_TRUE(by_city_.update(*tr, 5, std::string("Berlin"), std::nullopt));
    EXPECT_EQ(by_city_.lookup(*tr, std::string("Berlin")), (std::vector<int64_t>{1, 5}));
}

TEST_F(IndexTest, RemoveEntry) {
    populate();
    auto tr = begin();
    by_city_.remove(*tr, 2, std::string("Paris"));
    EXPECT_EQ(by_city_.lookup(*tr, std::string("Paris")), (std::vector<int64_t>{3}));
}

TEST_F(IndexTest, RangeLookups) {
    populate();
    auto tr = begin();
    EXPECT_EQ(by_city_.lookupGreaterThan(*tr, std::string("Paris"), false), (std::vector<int64_t>{4}));
    EXPECT_EQ(by_city_.lookupGreaterThan(*tr, std::string("Paris"), true), (std::vector<int64_t>{2, 3, 4}));
    EXPECT_EQ(by_city_.lookupLessThan(*tr, std::string("Paris"), false), (std::vector<int64_t>{1}));
    EXPECT_EQ(by_city_.lookupLessThan(*tr, std::string("Paris"), true), (std::vector<int64_t>{1, 2, 3}));
    EXPECT_EQ(by_city_.lookupLessThan(*tr, std::string("Paris"), true, true), (std::vector<int64_t>{3, 2, 1}));
}

TEST_F(IndexTest, CorruptEntryIsReported) {
    auto tr = begin();
    tr->set(root_.sub("by_city").pack(std::string("Paris")) + "garbage", Value());
    try {
        by_city_.lookup(*tr, std::string("Paris"));
        FAIL() << "expected internal_error";
    } catch (const TransactionError& e) {
        EXPECT_EQ(e.code(), ErrorCode::INTERNAL_ERROR);
    }
}

TEST_F(IndexTest, Naming) {
    EXPECT_EQ(by_city_.getName(), "by_city");
    EXPECT_EQ(by_city_.toString(), "Index[by_city]");
    EXPECT_FALSE(by_city_.indexNullValues());
}
