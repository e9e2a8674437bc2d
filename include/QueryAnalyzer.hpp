#pragma once

/**
 * @file QueryAnalyzer.hpp
 * @brief Captures the statements an engine executes and flags N+1 patterns.
 *
 * While a capture window is open the analyzer listens on the engine's
 * StatementEvents hub and records every statement, normalized, with its
 * kind and parameters. analyze() groups SELECTs by shape (numeric literals
 * replaced with `?`). A shape seen more than once is a repeated pattern;
 * repeated patterns together with more SELECTs than the configured
 * threshold suggest one query per related row.
 *
 * Usage:
 * @code
 *   QueryAnalyzer analyzer(db.engine());
 *   analyzer.capture([&] { loadAuthorsWithBooks(db); });
 *   analyzer.printReport(std::cout);
 * @endcode
 */

#include "Config.hpp"
#include "Engine.hpp"
#include "StatementEvents.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>
#include <vector>

namespace dbscope {

enum class StatementKind {
    Select,
    Insert,
    Update,
    Delete,
    Unknown
};

std::string kindToString(StatementKind kind);

struct CapturedStatement {
    std::string text;  // whitespace-normalized
    StatementKind kind = StatementKind::Unknown;
    Params params;
    size_t index = 0;  // position in the capture window
};

struct RepeatedPattern {
    std::string pattern;
    std::vector<size_t> indices;

    size_t count() const { return indices.size(); }
};

struct AnalysisReport {
    size_t totalCount = 0;
    size_t selectCount = 0;
    std::map<StatementKind, size_t> countsByKind;
    bool potentialNPlusOne = false;
    std::vector<RepeatedPattern> repeatedPatterns;  // first-occurrence order
};

class QueryAnalyzer;

namespace detail {
// Window state shared with the engine listener. A delivery that already took
// its snapshot keeps this alive even after the analyzer is gone.
struct CaptureBuffer {
    mutable std::mutex mutex;
    std::vector<CapturedStatement> statements;
    std::string label;
    uint64_t window = 0;
    bool open = false;

    void record(uint64_t window, const std::string& sql, const Params& params);
};
}  // namespace detail

/**
 * @class CaptureHandle
 * @brief Ends its capture window when destroyed.
 *
 * A handle whose window was already superseded by a newer beginCapture()
 * does nothing.
 */
class CaptureHandle {
public:
    CaptureHandle() = default;
    CaptureHandle(QueryAnalyzer* analyzer, uint64_t window);
    ~CaptureHandle();

    CaptureHandle(const CaptureHandle&) = delete;
    CaptureHandle& operator=(const CaptureHandle&) = delete;

    CaptureHandle(CaptureHandle&& other) noexcept;
    CaptureHandle& operator=(CaptureHandle&& other) noexcept;

    void end();

private:
    QueryAnalyzer* m_analyzer = nullptr;
    uint64_t m_window = 0;
};

class QueryAnalyzer {
public:
    explicit QueryAnalyzer(std::shared_ptr<EngineBase> engine, AnalyzerConfig config = {});
    ~QueryAnalyzer();

    QueryAnalyzer(const QueryAnalyzer&) = delete;
    QueryAnalyzer& operator=(const QueryAnalyzer&) = delete;

    /**
     * @brief Open a capture window.
     *
     * Clears the buffer and subscribes to the engine. An open window on this
     * analyzer is ended first; nested captures are not supported.
     */
    [[nodiscard]] CaptureHandle beginCapture(std::string label = "");

    // Unsubscribe and freeze the buffer. Idempotent.
    void endCapture();

    // Run `fn` inside a capture window that ends on every exit path
    template<typename Func>
    auto capture(Func&& fn, std::string label = "") {
        CaptureHandle handle = beginCapture(std::move(label));
        return fn();
    }

    bool capturing() const;
    std::string label() const;

    std::vector<CapturedStatement> statements() const;
    std::map<StatementKind, size_t> stats() const;

    AnalysisReport analyze() const;

    void printReport(std::ostream& out, bool verbose = false) const;
    nlohmann::json toJson() const;

    // Classification helpers, usable without an engine
    static StatementKind classify(const std::string& normalized);
    static std::string patternOf(const std::string& normalized);

private:
    friend class CaptureHandle;

    void endCapture(uint64_t window);

    std::shared_ptr<EngineBase> m_engine;
    AnalyzerConfig m_config;
    std::shared_ptr<detail::CaptureBuffer> m_buffer;
    ListenerToken m_token;  // guarded by m_buffer->mutex
};

}  // namespace dbscope
