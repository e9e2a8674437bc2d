#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "DatabaseManager.hpp"
#include "ErrorHandler.hpp"
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <filesystem>
#include <stdexcept>

using namespace dbscope;
using namespace std::chrono_literals;

namespace net = boost::asio;

class AsyncScopeTest : public ::testing::Test {
protected:
    void SetUp() override {
        tempDir_ = std::filesystem::temp_directory_path() /
                   (std::string("dbscope_async_") +
                    ::testing::UnitTest::GetInstance()->current_test_info()->name());
        std::filesystem::create_directories(tempDir_);

        EngineConfig config;
        config.url = "sqlite:///" + (tempDir_ / "library.db").string();
        config.pool_size = 1;
        config.max_overflow = 0;
        config.pool_timeout = 500ms;
        db_ = std::make_unique<DatabaseManager>(config);

        db_->transaction([](Session& s) {
            s.execute("CREATE TABLE books (id INTEGER PRIMARY KEY, title TEXT NOT NULL)");
        });
    }

    void TearDown() override {
        db_.reset();
        std::filesystem::remove_all(tempDir_);
    }

    // Run one coroutine to completion; its exception escapes io.run()
    template<typename Func>
    void runAsync(Func func) {
        net::io_context io;
        net::co_spawn(io, std::move(func), [](std::exception_ptr e) {
            if (e) std::rethrow_exception(e);
        });
        io.run();
    }

    int64_t bookCount() {
        return db_->session([](Session& s) {
            return s.execute("SELECT COUNT(*) FROM books").getInt(0, 0).value_or(-1);
        });
    }

    std::filesystem::path tempDir_;
    std::unique_ptr<DatabaseManager> db_;
};

TEST_F(AsyncScopeTest, TransactionCommitsOnSuccess) {
    runAsync([this]() -> net::awaitable<void> {
        co_await db_->asyncTransaction([](AsyncSession& s) -> net::awaitable<void> {
            co_await s.execute("INSERT INTO books(title) VALUES (?)", {std::string("Dune")});
        });
    });

    EXPECT_EQ(bookCount(), 1);
}

TEST_F(AsyncScopeTest, TransactionReturnsValue) {
    int64_t id = 0;
    runAsync([&]() -> net::awaitable<void> {
        id = co_await db_->asyncTransaction([](AsyncSession& s) -> net::awaitable<int64_t> {
            QueryResult r = co_await s.execute("INSERT INTO books(title) VALUES (?)",
                                               {std::string("Solaris")});
            co_return r.lastInsertId;
        });
    });

    EXPECT_GT(id, 0);
    EXPECT_EQ(bookCount(), 1);
}

TEST_F(AsyncScopeTest, TransactionRollsBackAndRethrows) {
    EXPECT_THROW(runAsync([this]() -> net::awaitable<void> {
        co_await db_->asyncTransaction([](AsyncSession& s) -> net::awaitable<void> {
            co_await s.execute("INSERT INTO books(title) VALUES (?)", {std::string("Lost")});
            throw std::invalid_argument("caller failure");
        });
    }), std::invalid_argument);

    EXPECT_EQ(bookCount(), 0);
    EXPECT_EQ(db_->asyncEngine()->status().checked_out, 0u);
}

TEST_F(AsyncScopeTest, BareScopeDoesNotCommit) {
    runAsync([this]() -> net::awaitable<void> {
        co_await db_->asyncSession([](AsyncSession& s) -> net::awaitable<void> {
            co_await s.execute("INSERT INTO books(title) VALUES (?)", {std::string("Draft")});
        });
    });

    EXPECT_EQ(bookCount(), 0);
}

TEST_F(AsyncScopeTest, BareScopeExplicitCommit) {
    runAsync([this]() -> net::awaitable<void> {
        co_await db_->asyncSession([](AsyncSession& s) -> net::awaitable<void> {
            co_await s.execute("INSERT INTO books(title) VALUES (?)", {std::string("Final")});
            co_await s.commit();
        });
    });

    EXPECT_EQ(bookCount(), 1);
}

TEST_F(AsyncScopeTest, UseAfterCloseThrows) {
    EXPECT_THROW(runAsync([this]() -> net::awaitable<void> {
        AsyncSession s = co_await db_->sessions().openAsyncSession();
        co_await s.close();
        co_await s.execute("SELECT 1");
    }), SessionStateError);
}

TEST_F(AsyncScopeTest, StandaloneTransactionDisposesEngine) {
    std::shared_ptr<AsyncEngine> used;
    runAsync([&]() -> net::awaitable<void> {
        co_await db_->asyncStandaloneTransaction([&](AsyncSession& s) -> net::awaitable<void> {
            used = db_->asyncEngine();
            co_await s.execute("INSERT INTO books(title) VALUES (?)", {std::string("Once")});
        });
    });

    ASSERT_NE(used, nullptr);
    EXPECT_TRUE(used->isDisposed());
    EXPECT_EQ(db_->registry().state(EngineMode::NonBlocking), EngineState::Uninitialized);
    EXPECT_EQ(bookCount(), 1);
}

TEST_F(AsyncScopeTest, SecondSessionWaitsForConnection) {
    std::vector<std::string> order;
    net::io_context io;

    auto first = [&]() -> net::awaitable<void> {
        co_await db_->asyncTransaction([&](AsyncSession& s) -> net::awaitable<void> {
            order.push_back("first");
            co_await s.execute("INSERT INTO books(title) VALUES (?)", {std::string("A")});
        });
    };
    auto second = [&]() -> net::awaitable<void> {
        co_await db_->asyncTransaction([&](AsyncSession& s) -> net::awaitable<void> {
            order.push_back("second");
            co_await s.execute("INSERT INTO books(title) VALUES (?)", {std::string("B")});
        });
    };

    auto rethrow = [](std::exception_ptr e) {
        if (e) std::rethrow_exception(e);
    };
    net::co_spawn(io, first, rethrow);
    net::co_spawn(io, second, rethrow);
    io.run();

    EXPECT_THAT(order, ::testing::ElementsAre("first", "second"));
    EXPECT_EQ(bookCount(), 2);
}

TEST_F(AsyncScopeTest, ExecutedStatementsAreAnnounced) {
    std::vector<std::string> seen;
    auto engine = db_->asyncEngine();
    ListenerToken token = engine->events().subscribe([&](const std::string& sql, const Params&) {
        seen.push_back(sql);
    });

    runAsync([this]() -> net::awaitable<void> {
        co_await db_->asyncTransaction([](AsyncSession& s) -> net::awaitable<void> {
            co_await s.execute("SELECT COUNT(*) FROM books");
        });
    });

    EXPECT_THAT(seen, ::testing::ElementsAre("SELECT COUNT(*) FROM books"));
}

TEST_F(AsyncScopeTest, TransactionOnSaturatedPoolTimesOut) {
    bool exhausted = false;
    runAsync([&]() -> net::awaitable<void> {
        AsyncSession held = co_await db_->sessions().openAsyncSession();
        try {
            co_await db_->asyncTransaction([](AsyncSession&) -> net::awaitable<void> { co_return; });
        } catch (const PoolExhaustedError&) {
            exhausted = true;
        }
        co_await held.close();
    });

    EXPECT_TRUE(exhausted);
    EXPECT_EQ(db_->asyncEngine()->status().checked_out, 0u);
    EXPECT_EQ(db_->asyncEngine()->status().waiting, 0u);
}

TEST_F(AsyncScopeTest, DestroyedCoroutinesReleaseConnectionAndWaiter) {
    auto engine = db_->asyncEngine();
    {
        net::io_context io;

        // Holds the only connection with uncommitted work, then parks
        auto holder = [this]() -> net::awaitable<void> {
            co_await db_->asyncTransaction([](AsyncSession& s) -> net::awaitable<void> {
                co_await s.execute("INSERT INTO books(title) VALUES (?)", {std::string("Abandoned")});
                net::steady_timer pause(co_await net::this_coro::executor, 10s);
                co_await pause.async_wait(net::use_awaitable);
            });
        };
        // Suspends in acquire behind the holder
        auto queued = [this]() -> net::awaitable<void> {
            co_await db_->asyncTransaction([](AsyncSession& s) -> net::awaitable<void> {
                co_await s.execute("INSERT INTO books(title) VALUES (?)", {std::string("Never")});
            });
        };

        net::co_spawn(io, holder, net::detached);
        net::co_spawn(io, queued, net::detached);
        io.run_for(200ms);

        PoolStatus during = engine->status();
        EXPECT_EQ(during.checked_out, 1u);
        EXPECT_EQ(during.waiting, 1u);
    }

    PoolStatus after = engine->status();
    EXPECT_EQ(after.checked_out, 0u);
    EXPECT_EQ(after.waiting, 0u);
    EXPECT_EQ(bookCount(), 0);
}
