#include <gtest/gtest.h>
#include "StatementEvents.hpp"
#include <memory>
#include <stdexcept>

using namespace dbscope;

class StatementEventsTest : public ::testing::Test {
protected:
    StatementEvents events_;
};

TEST_F(StatementEventsTest, ListenersReceiveTextAndParams) {
    std::string seenSql;
    Params seenParams;
    ListenerToken token = events_.subscribe([&](const std::string& sql, const Params& params) {
        seenSql = sql;
        seenParams = params;
    });

    events_.notify("SELECT * FROM books WHERE id = ?", {int64_t{9}});

    EXPECT_EQ(seenSql, "SELECT * FROM books WHERE id = ?");
    ASSERT_EQ(seenParams.size(), 1u);
    EXPECT_EQ(std::get<int64_t>(seenParams[0]), 9);
}

TEST_F(StatementEventsTest, RemoveRunsExactlyOnce) {
    int calls = 0;
    ListenerToken token = events_.subscribe([&](const std::string&, const Params&) { ++calls; });
    ListenerToken other = events_.subscribe([](const std::string&, const Params&) {});
    EXPECT_EQ(events_.listenerCount(), 2u);

    token.remove();
    token.remove();

    EXPECT_FALSE(token.active());
    EXPECT_EQ(events_.listenerCount(), 1u);

    events_.notify("SELECT 1", {});
    EXPECT_EQ(calls, 0);
}

TEST_F(StatementEventsTest, DestructorRemovesListener) {
    {
        ListenerToken token = events_.subscribe([](const std::string&, const Params&) {});
        EXPECT_EQ(events_.listenerCount(), 1u);
    }
    EXPECT_EQ(events_.listenerCount(), 0u);
}

TEST_F(StatementEventsTest, MovedTokenKeepsRegistration) {
    ListenerToken first = events_.subscribe([](const std::string&, const Params&) {});
    ListenerToken second = std::move(first);

    EXPECT_FALSE(first.active());
    EXPECT_TRUE(second.active());
    EXPECT_EQ(events_.listenerCount(), 1u);

    second.remove();
    EXPECT_EQ(events_.listenerCount(), 0u);
}

TEST_F(StatementEventsTest, TokenMayOutliveHub) {
    ListenerToken token;
    {
        StatementEvents local;
        token = local.subscribe([](const std::string&, const Params&) {});
    }
    token.remove();

    EXPECT_FALSE(token.active());
}

TEST_F(StatementEventsTest, ThrowingListenerDoesNotStopOthers) {
    int calls = 0;
    ListenerToken bad = events_.subscribe([](const std::string&, const Params&) {
        throw std::runtime_error("listener failure");
    });
    ListenerToken good = events_.subscribe([&](const std::string&, const Params&) { ++calls; });

    EXPECT_NO_THROW(events_.notify("DELETE FROM t", {}));
    EXPECT_EQ(calls, 1);
}

TEST_F(StatementEventsTest, ListenerMayUnsubscribeDuringNotify) {
    auto token = std::make_shared<ListenerToken>();
    int calls = 0;
    *token = events_.subscribe([&, token](const std::string&, const Params&) {
        ++calls;
        token->remove();
    });

    events_.notify("SELECT 1", {});
    events_.notify("SELECT 2", {});

    EXPECT_EQ(calls, 1);
    EXPECT_EQ(events_.listenerCount(), 0u);
}
