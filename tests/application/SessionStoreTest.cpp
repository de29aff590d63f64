#include <gtest/gtest.h>

#include "application/SessionStore.hpp"

using namespace session;
using session::application::SessionStore;

namespace {

domain::SessionRecord makeRecord(const std::string& userId) {
    domain::SessionRecord record;
    record.userId = userId;
    record.username = userId + "_name";
    return record;
}

} // namespace

class SessionStoreTest : public ::testing::Test {
protected:
    SessionStore store_;
};

// ============================================
// INSERT / FIND
// ============================================

TEST_F(SessionStoreTest, Insert_AddsRecordAndIndex) {
    EXPECT_TRUE(store_.insert("t1", makeRecord("u1")));

    ASSERT_NE(store_.find("t1"), nullptr);
    EXPECT_EQ(store_.find("t1")->userId, "u1");
    EXPECT_EQ(store_.size(), 1u);
    EXPECT_EQ(store_.userCount(), 1u);
    EXPECT_EQ(store_.tokensForUser("u1"), std::vector<std::string>{"t1"});
    EXPECT_TRUE(store_.isConsistent());
}

TEST_F(SessionStoreTest, Insert_DuplicateTokenRejected) {
    store_.insert("t1", makeRecord("u1"));

    EXPECT_FALSE(store_.insert("t1", makeRecord("u2")));

    EXPECT_EQ(store_.find("t1")->userId, "u1");
    EXPECT_EQ(store_.userCount(), 1u);
    EXPECT_TRUE(store_.tokensForUser("u2").empty());
}

TEST_F(SessionStoreTest, Find_UnknownToken) {
    EXPECT_EQ(store_.find("missing"), nullptr);
    EXPECT_FALSE(store_.contains("missing"));
}

TEST_F(SessionStoreTest, TokensForUser_PreservesInsertionOrder) {
    store_.insert("a", makeRecord("u1"));
    store_.insert("b", makeRecord("u1"));
    store_.insert("c", makeRecord("u1"));

    std::vector<std::string> expected{"a", "b", "c"};
    EXPECT_EQ(store_.tokensForUser("u1"), expected);
}

// ============================================
// REMOVE
// ============================================

TEST_F(SessionStoreTest, Remove_DropsEmptyUserEntry) {
    store_.insert("t1", makeRecord("u1"));

    EXPECT_TRUE(store_.remove("t1"));

    EXPECT_EQ(store_.size(), 0u);
    EXPECT_EQ(store_.userCount(), 0u);
    EXPECT_TRUE(store_.tokensForUser("u1").empty());
    EXPECT_TRUE(store_.isConsistent());
}

TEST_F(SessionStoreTest, Remove_KeepsOtherTokensOfUser) {
    store_.insert("a", makeRecord("u1"));
    store_.insert("b", makeRecord("u1"));
    store_.insert("c", makeRecord("u1"));

    store_.remove("b");

    std::vector<std::string> expected{"a", "c"};
    EXPECT_EQ(store_.tokensForUser("u1"), expected);
    EXPECT_EQ(store_.userCount(), 1u);
    EXPECT_TRUE(store_.isConsistent());
}

TEST_F(SessionStoreTest, Remove_UnknownTokenIsNoop) {
    store_.insert("t1", makeRecord("u1"));

    EXPECT_FALSE(store_.remove("other"));
    EXPECT_FALSE(store_.remove(""));

    EXPECT_EQ(store_.size(), 1u);
}

TEST_F(SessionStoreTest, Remove_Twice) {
    store_.insert("t1", makeRecord("u1"));

    EXPECT_TRUE(store_.remove("t1"));
    EXPECT_FALSE(store_.remove("t1"));
    EXPECT_TRUE(store_.isConsistent());
}

// ============================================
// CONSISTENCY
// ============================================

TEST_F(SessionStoreTest, IsConsistent_AfterChurn) {
    for (int i = 0; i < 50; ++i) {
        store_.insert("t" + std::to_string(i), makeRecord("u" + std::to_string(i % 7)));
    }
    for (int i = 0; i < 50; i += 3) {
        store_.remove("t" + std::to_string(i));
    }

    EXPECT_TRUE(store_.isConsistent());

    std::size_t indexed = 0;
    for (int u = 0; u < 7; ++u) {
        indexed += store_.tokensForUser("u" + std::to_string(u)).size();
    }
    EXPECT_EQ(indexed, store_.size());
}

TEST_F(SessionStoreTest, IsConsistent_DetectsUserIdChangedBehindIndex) {
    store_.insert("t1", makeRecord("u1"));

    store_.find("t1")->userId = "u2";

    EXPECT_FALSE(store_.isConsistent());
}

TEST_F(SessionStoreTest, Clear) {
    store_.insert("a", makeRecord("u1"));
    store_.insert("b", makeRecord("u2"));

    store_.clear();

    EXPECT_EQ(store_.size(), 0u);
    EXPECT_EQ(store_.userCount(), 0u);
    EXPECT_TRUE(store_.isConsistent());
}
