#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "QueryAnalyzer.hpp"
#include "DatabaseManager.hpp"
#include "ErrorHandler.hpp"
#include <condition_variable>
#include <filesystem>
#include <mutex>
#include <sstream>
#include <thread>

using namespace dbscope;
using namespace std::chrono_literals;

class QueryAnalyzerTest : public ::testing::Test {
protected:
    void SetUp() override {
        tempDir_ = std::filesystem::temp_directory_path() /
                   (std::string("dbscope_analyzer_") +
                    ::testing::UnitTest::GetInstance()->current_test_info()->name());
        std::filesystem::create_directories(tempDir_);

        EngineConfig config;
        config.url = "sqlite:///" + (tempDir_ / "library.db").string();
        db_ = std::make_unique<DatabaseManager>(config);

        db_->transaction([](Session& s) {
            s.execute("CREATE TABLE authors (id INTEGER PRIMARY KEY, name TEXT)");
            s.execute("CREATE TABLE books (id INTEGER PRIMARY KEY, author_id INTEGER, title TEXT)");
            for (int64_t i = 1; i <= 5; ++i) {
                s.execute("INSERT INTO authors(id, name) VALUES (?, ?)",
                          {i, std::string("author ") + std::to_string(i)});
                s.execute("INSERT INTO books(author_id, title) VALUES (?, ?)",
                          {i, std::string("book ") + std::to_string(i)});
            }
        });
    }

    void TearDown() override {
        db_.reset();
        std::filesystem::remove_all(tempDir_);
    }

    // One query for the authors, then one per author for their books
    void loadAuthorsWithBooks() {
        db_->session([](Session& s) {
            QueryResult authors = s.execute("SELECT id, name FROM authors ORDER BY id");
            for (size_t row = 0; row < authors.rowCount(); ++row) {
                s.execute("SELECT title FROM books WHERE author_id = ?",
                          {authors.getInt(row, 0).value_or(0)});
            }
        });
    }

    std::filesystem::path tempDir_;
    std::unique_ptr<DatabaseManager> db_;
};

TEST_F(QueryAnalyzerTest, DetectsOneQueryPerRow) {
    QueryAnalyzer analyzer(db_->engine());
    analyzer.capture([this]() { loadAuthorsWithBooks(); }, "authors with books");

    AnalysisReport report = analyzer.analyze();

    EXPECT_EQ(report.totalCount, 6u);
    EXPECT_EQ(report.selectCount, 6u);
    EXPECT_TRUE(report.potentialNPlusOne);
    ASSERT_EQ(report.repeatedPatterns.size(), 1u);
    EXPECT_EQ(report.repeatedPatterns[0].pattern, "SELECT title FROM books WHERE author_id = ?");
    EXPECT_THAT(report.repeatedPatterns[0].indices, ::testing::ElementsAre(1, 2, 3, 4, 5));
}

TEST_F(QueryAnalyzerTest, TwoIdenticalSelectsStayUnderThreshold) {
    QueryAnalyzer analyzer(db_->engine());
    analyzer.capture([this]() {
        db_->session([](Session& s) {
            s.execute("SELECT * FROM authors");
            s.execute("SELECT * FROM authors");
        });
    });

    AnalysisReport report = analyzer.analyze();

    EXPECT_EQ(report.repeatedPatterns.size(), 1u);
    EXPECT_FALSE(report.potentialNPlusOne);
}

TEST_F(QueryAnalyzerTest, ThresholdIsConfigurable) {
    AnalyzerConfig config;
    config.select_threshold = 1;
    QueryAnalyzer analyzer(db_->engine(), config);
    analyzer.capture([this]() {
        db_->session([](Session& s) {
            s.execute("SELECT * FROM authors");
            s.execute("SELECT * FROM authors");
        });
    });

    EXPECT_TRUE(analyzer.analyze().potentialNPlusOne);
}

TEST_F(QueryAnalyzerTest, NumericLiteralsShareOnePattern) {
    QueryAnalyzer analyzer(db_->engine());
    analyzer.capture([this]() {
        db_->session([](Session& s) {
            s.execute("SELECT title FROM books WHERE author_id = 1");
            s.execute("SELECT title FROM books WHERE author_id = 2");
            s.execute("SELECT title FROM books WHERE author_id = 3");
        });
    });

    AnalysisReport report = analyzer.analyze();

    ASSERT_EQ(report.repeatedPatterns.size(), 1u);
    EXPECT_EQ(report.repeatedPatterns[0].count(), 3u);
    EXPECT_TRUE(report.potentialNPlusOne);
}

TEST_F(QueryAnalyzerTest, DistinctSelectsAreNotFlagged) {
    QueryAnalyzer analyzer(db_->engine());
    analyzer.capture([this]() {
        db_->session([](Session& s) {
            s.execute("SELECT * FROM authors");
            s.execute("SELECT * FROM books");
            s.execute("SELECT a.name, b.title FROM authors a JOIN books b ON b.author_id = a.id");
        });
    });

    AnalysisReport report = analyzer.analyze();

    EXPECT_EQ(report.selectCount, 3u);
    EXPECT_TRUE(report.repeatedPatterns.empty());
    EXPECT_FALSE(report.potentialNPlusOne);
}

TEST_F(QueryAnalyzerTest, StatementsAreNormalizedAndClassified) {
    QueryAnalyzer analyzer(db_->engine());
    analyzer.capture([this]() {
        db_->transaction([](Session& s) {
            s.execute("SELECT *\n   FROM   authors");
            s.execute("insert into books(author_id, title) values (?, ?)", {int64_t{1}, std::string("x")});
            s.execute("UPDATE books SET title = ? WHERE id = ?", {std::string("y"), int64_t{1}});
            s.execute("DELETE FROM books WHERE id = ?", {int64_t{2}});
            s.execute("PRAGMA user_version");
        });
    });

    auto statements = analyzer.statements();
    ASSERT_EQ(statements.size(), 5u);
    EXPECT_EQ(statements[0].text, "SELECT * FROM authors");
    EXPECT_EQ(statements[0].kind, StatementKind::Select);
    EXPECT_EQ(statements[1].kind, StatementKind::Insert);
    EXPECT_EQ(statements[1].params.size(), 2u);
    EXPECT_EQ(statements[2].kind, StatementKind::Update);
    EXPECT_EQ(statements[3].kind, StatementKind::Delete);
    EXPECT_EQ(statements[4].kind, StatementKind::Unknown);
    EXPECT_EQ(statements[4].index, 4u);

    auto stats = analyzer.stats();
    EXPECT_EQ(stats[StatementKind::Select], 1u);
    EXPECT_EQ(stats[StatementKind::Unknown], 1u);
}

TEST_F(QueryAnalyzerTest, OnlyTheCaptureWindowIsRecorded) {
    QueryAnalyzer analyzer(db_->engine());
    auto engine = db_->engine();

    db_->session([](Session& s) { s.execute("SELECT 1"); });
    {
        CaptureHandle handle = analyzer.beginCapture("window");
        EXPECT_TRUE(analyzer.capturing());
        EXPECT_EQ(engine->events().listenerCount(), 1u);
        db_->session([](Session& s) { s.execute("SELECT 2"); });
    }
    db_->session([](Session& s) { s.execute("SELECT 3"); });

    EXPECT_FALSE(analyzer.capturing());
    EXPECT_EQ(engine->events().listenerCount(), 0u);
    ASSERT_EQ(analyzer.statements().size(), 1u);
    EXPECT_EQ(analyzer.statements()[0].text, "SELECT 2");
}

TEST_F(QueryAnalyzerTest, FailedStatementsAreNotRecorded) {
    QueryAnalyzer analyzer(db_->engine());
    analyzer.capture([this]() {
        EXPECT_THROW(db_->session([](Session& s) { s.execute("SELECT * FROM missing_table"); }),
                     StatementError);
    });

    EXPECT_TRUE(analyzer.statements().empty());
}

TEST_F(QueryAnalyzerTest, CaptureEndsWhenBodyThrows) {
    QueryAnalyzer analyzer(db_->engine());

    EXPECT_THROW(analyzer.capture([]() { throw std::runtime_error("boom"); }), std::runtime_error);
    EXPECT_FALSE(analyzer.capturing());
    EXPECT_EQ(db_->engine()->events().listenerCount(), 0u);
}

TEST_F(QueryAnalyzerTest, NewCaptureClearsBufferAndSupersedesOld) {
    QueryAnalyzer analyzer(db_->engine());
    CaptureHandle first = analyzer.beginCapture("first");
    db_->session([](Session& s) { s.execute("SELECT 1"); });

    CaptureHandle second = analyzer.beginCapture("second");
    EXPECT_TRUE(analyzer.statements().empty());
    EXPECT_EQ(db_->engine()->events().listenerCount(), 1u);

    // The stale handle must not end the newer window
    first.end();
    EXPECT_TRUE(analyzer.capturing());

    db_->session([](Session& s) { s.execute("SELECT 2"); });
    second.end();

    ASSERT_EQ(analyzer.statements().size(), 1u);
    EXPECT_EQ(analyzer.label(), "second");
}

TEST_F(QueryAnalyzerTest, LabelIsReadWhileCaptureRestartsOnAnotherThread) {
    QueryAnalyzer analyzer(db_->engine());
    CaptureHandle handle = analyzer.beginCapture("label 0");

    std::thread restarter([&analyzer]() {
        for (int i = 1; i <= 200; ++i) {
            CaptureHandle next = analyzer.beginCapture("label " + std::to_string(i));
        }
    });
    for (int i = 0; i < 200; ++i) {
        std::string label = analyzer.label();
        EXPECT_THAT(label, ::testing::StartsWith("label "));
        EXPECT_THAT(analyzer.toJson()["label"].get<std::string>(), ::testing::StartsWith("label "));
    }
    restarter.join();

    EXPECT_EQ(analyzer.label(), "label 200");
}

TEST_F(QueryAnalyzerTest, AnalyzerDestroyedDuringDeliveryOnAnotherThread) {
    auto engine = db_->engine();

    // Subscribed first, so it runs before the analyzer's listener and holds
    // the delivery until the analyzer is gone
    std::mutex gateMutex;
    std::condition_variable gateCv;
    bool delivering = false;
    bool released = false;
    ListenerToken gate = engine->events().subscribe([&](const std::string&, const Params&) {
        std::unique_lock<std::mutex> lock(gateMutex);
        delivering = true;
        gateCv.notify_all();
        gateCv.wait(lock, [&] { return released; });
    });

    auto analyzer = std::make_unique<QueryAnalyzer>(engine);
    CaptureHandle handle = analyzer->beginCapture("short lived");

    std::thread worker([this]() {
        db_->session([](Session& s) { s.execute("SELECT COUNT(*) FROM authors"); });
    });

    {
        std::unique_lock<std::mutex> lock(gateMutex);
        gateCv.wait(lock, [&] { return delivering; });
    }
    handle.end();
    analyzer.reset();
    {
        std::lock_guard<std::mutex> lock(gateMutex);
        released = true;
    }
    gateCv.notify_all();
    worker.join();

    EXPECT_EQ(engine->events().listenerCount(), 1u);
}

TEST_F(QueryAnalyzerTest, TextReportFlagsProblem) {
    QueryAnalyzer analyzer(db_->engine());
    analyzer.capture([this]() { loadAuthorsWithBooks(); }, "authors with books");

    std::ostringstream out;
    analyzer.printReport(out, true);
    std::string text = out.str();

    EXPECT_THAT(text, ::testing::HasSubstr("Query Analysis Report"));
    EXPECT_THAT(text, ::testing::HasSubstr("Target: authors with books"));
    EXPECT_THAT(text, ::testing::HasSubstr("Total Queries: 6"));
    EXPECT_THAT(text, ::testing::HasSubstr("Potential N+1 problem detected"));
    EXPECT_THAT(text, ::testing::HasSubstr("Pattern (repeated 5 times)"));
    EXPECT_THAT(text, ::testing::HasSubstr("All Captured Queries"));
}

TEST_F(QueryAnalyzerTest, TextReportWithoutProblem) {
    QueryAnalyzer analyzer(db_->engine());
    analyzer.capture([this]() {
        db_->session([](Session& s) { s.execute("SELECT * FROM authors"); });
    });

    std::ostringstream out;
    analyzer.printReport(out);

    EXPECT_THAT(out.str(), ::testing::HasSubstr("No obvious N+1 problems detected"));
    EXPECT_THAT(out.str(), ::testing::Not(::testing::HasSubstr("All Captured Queries")));
}

TEST_F(QueryAnalyzerTest, JsonReport) {
    QueryAnalyzer analyzer(db_->engine());
    analyzer.capture([this]() { loadAuthorsWithBooks(); }, "json");

    nlohmann::json report = analyzer.toJson();

    EXPECT_EQ(report["label"], "json");
    EXPECT_EQ(report["total_queries"], 6);
    EXPECT_EQ(report["select_queries"], 6);
    EXPECT_TRUE(report["potential_n_plus_1"].get<bool>());
    EXPECT_EQ(report["query_stats"]["SELECT"], 6);
    ASSERT_EQ(report["repeated_queries"].size(), 1u);
    EXPECT_EQ(report["repeated_queries"][0]["count"], 5);
    EXPECT_EQ(report["queries"][1]["parameters"][0], 1);
    EXPECT_EQ(report["queries"][0]["parameters"].size(), 0u);
}

// Classification helpers
TEST(QueryAnalyzerStaticTest, Classify) {
    EXPECT_EQ(QueryAnalyzer::classify("select 1"), StatementKind::Select);
    EXPECT_EQ(QueryAnalyzer::classify("DELETE FROM t"), StatementKind::Delete);
    EXPECT_EQ(QueryAnalyzer::classify("WITH x AS (SELECT 1) SELECT * FROM x"), StatementKind::Unknown);
    EXPECT_EQ(QueryAnalyzer::classify(""), StatementKind::Unknown);
}

TEST(QueryAnalyzerStaticTest, PatternReplacesNumbers) {
    EXPECT_EQ(QueryAnalyzer::patternOf("SELECT * FROM t2 WHERE id = 17 LIMIT 10"),
              "SELECT * FROM t2 WHERE id = ? LIMIT ?");
}

TEST(QueryAnalyzerStaticTest, KindNames) {
    EXPECT_EQ(kindToString(StatementKind::Select), "SELECT");
    EXPECT_EQ(kindToString(StatementKind::Unknown), "UNKNOWN");
}
