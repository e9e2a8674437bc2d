#include "QueryAnalyzer.hpp"
#include "SqlText.hpp"
#include <spdlog/spdlog.h>
#include <unordered_map>

namespace dbscope {

namespace {

const size_t kPatternDisplayWidth = 100;
const size_t kStatementDisplayWidth = 200;
const size_t kPatternsShown = 3;

std::string truncate(const std::string& text, size_t width) {
    if (text.size() <= width) return text;
    return text.substr(0, width) + "...";
}

nlohmann::json valueToJson(const Value& value) {
    if (const auto* i = std::get_if<int64_t>(&value)) return *i;
    if (const auto* d = std::get_if<double>(&value)) return *d;
    if (const auto* s = std::get_if<std::string>(&value)) return *s;
    return nullptr;
}

}  // namespace

std::string kindToString(StatementKind kind) {
    switch (kind) {
        case StatementKind::Select: return "SELECT";
        case StatementKind::Insert: return "INSERT";
        case StatementKind::Update: return "UPDATE";
        case StatementKind::Delete: return "DELETE";
        default: return "UNKNOWN";
    }
}

// ============================================================================
// CaptureHandle
// ============================================================================

CaptureHandle::CaptureHandle(QueryAnalyzer* analyzer, uint64_t window)
    : m_analyzer(analyzer), m_window(window) {
}

CaptureHandle::~CaptureHandle() {
    end();
}

CaptureHandle::CaptureHandle(CaptureHandle&& other) noexcept
    : m_analyzer(other.m_analyzer), m_window(other.m_window) {
    other.m_analyzer = nullptr;
}

CaptureHandle& CaptureHandle::operator=(CaptureHandle&& other) noexcept {
    if (this != &other) {
        end();
        m_analyzer = other.m_analyzer;
        m_window = other.m_window;
        other.m_analyzer = nullptr;
    }
    return *this;
}

void CaptureHandle::end() {
    if (m_analyzer) {
        m_analyzer->endCapture(m_window);
        m_analyzer = nullptr;
    }
}

// ============================================================================
// Capture window
// ============================================================================

QueryAnalyzer::QueryAnalyzer(std::shared_ptr<EngineBase> engine, AnalyzerConfig config)
    : m_engine(std::move(engine))
    , m_config(config)
    , m_buffer(std::make_shared<detail::CaptureBuffer>()) {
}

QueryAnalyzer::~QueryAnalyzer() {
    endCapture();
}

CaptureHandle QueryAnalyzer::beginCapture(std::string label) {
    std::lock_guard<std::mutex> lock(m_buffer->mutex);
    if (m_buffer->open) {
        spdlog::debug("Capture '{}' superseded by a new capture", m_buffer->label);
        m_token.remove();
    }

    m_buffer->statements.clear();
    m_buffer->label = std::move(label);
    m_buffer->open = true;
    uint64_t window = ++m_buffer->window;

    m_token = m_engine->events().subscribe(
        [buffer = m_buffer, window](const std::string& sql, const Params& params) {
            buffer->record(window, sql, params);
        });
    return CaptureHandle(this, window);
}

void QueryAnalyzer::endCapture() {
    std::lock_guard<std::mutex> lock(m_buffer->mutex);
    if (!m_buffer->open) return;
    m_token.remove();
    m_buffer->open = false;
}

void QueryAnalyzer::endCapture(uint64_t window) {
    std::lock_guard<std::mutex> lock(m_buffer->mutex);
    if (!m_buffer->open || window != m_buffer->window) return;
    m_token.remove();
    m_buffer->open = false;
}

bool QueryAnalyzer::capturing() const {
    std::lock_guard<std::mutex> lock(m_buffer->mutex);
    return m_buffer->open;
}

std::string QueryAnalyzer::label() const {
    std::lock_guard<std::mutex> lock(m_buffer->mutex);
    return m_buffer->label;
}

void detail::CaptureBuffer::record(uint64_t from, const std::string& sql, const Params& params) {
    CapturedStatement stmt;
    stmt.text = SqlText::normalizeWhitespace(sql);
    stmt.kind = QueryAnalyzer::classify(stmt.text);
    stmt.params = params;

    std::lock_guard<std::mutex> lock(mutex);
    // A notification already in flight when the window closed is dropped
    if (!open || from != window) return;
    stmt.index = statements.size();
    statements.push_back(std::move(stmt));
}

// ============================================================================
// Classification
// ============================================================================

StatementKind QueryAnalyzer::classify(const std::string& normalized) {
    std::string keyword = SqlText::leadingKeyword(normalized);
    if (keyword == "SELECT") return StatementKind::Select;
    if (keyword == "INSERT") return StatementKind::Insert;
    if (keyword == "UPDATE") return StatementKind::Update;
    if (keyword == "DELETE") return StatementKind::Delete;
    return StatementKind::Unknown;
}

std::string QueryAnalyzer::patternOf(const std::string& normalized) {
    return SqlText::replaceNumericLiterals(normalized);
}

// ============================================================================
// Analysis
// ============================================================================

std::vector<CapturedStatement> QueryAnalyzer::statements() const {
    std::lock_guard<std::mutex> lock(m_buffer->mutex);
    return m_buffer->statements;
}

std::map<StatementKind, size_t> QueryAnalyzer::stats() const {
    std::lock_guard<std::mutex> lock(m_buffer->mutex);
    std::map<StatementKind, size_t> counts;
    for (const auto& stmt : m_buffer->statements) {
        ++counts[stmt.kind];
    }
    return counts;
}

AnalysisReport QueryAnalyzer::analyze() const {
    std::vector<CapturedStatement> captured = statements();

    AnalysisReport report;
    report.totalCount = captured.size();

    // Groups in order of first occurrence
    std::vector<RepeatedPattern> groups;
    std::unordered_map<std::string, size_t> groupIndex;

    for (const auto& stmt : captured) {
        ++report.countsByKind[stmt.kind];
        if (stmt.kind != StatementKind::Select) continue;

        ++report.selectCount;
        std::string pattern = patternOf(stmt.text);
        auto it = groupIndex.find(pattern);
        if (it == groupIndex.end()) {
            groupIndex.emplace(pattern, groups.size());
            groups.push_back(RepeatedPattern{pattern, {stmt.index}});
        } else {
            groups[it->second].indices.push_back(stmt.index);
        }
    }

    for (auto& group : groups) {
        if (group.count() >= 2) {
            report.repeatedPatterns.push_back(std::move(group));
        }
    }

    report.potentialNPlusOne = !report.repeatedPatterns.empty() &&
                               report.selectCount > m_config.select_threshold;
    return report;
}

void QueryAnalyzer::printReport(std::ostream& out, bool verbose) const {
    AnalysisReport report = analyze();
    const std::string target = label();
    const std::string rule(70, '=');

    out << "\n" << rule << "\n";
    out << "Query Analysis Report\n";
    out << rule << "\n";

    if (!target.empty()) {
        out << "\nTarget: " << target << "\n";
    }

    out << "\nTotal Queries: " << report.totalCount << "\n";
    out << "\nQuery Type Breakdown:\n";
    for (const auto& [kind, count] : report.countsByKind) {
        out << "  " << kindToString(kind) << ": " << count << "\n";
    }

    if (report.potentialNPlusOne) {
        out << "\nWARNING: Potential N+1 problem detected\n";
        out << "   Found " << report.repeatedPatterns.size() << " repeated query pattern(s)\n";
        out << "\nRepeated Query Patterns:\n";
        size_t shown = 0;
        for (const auto& group : report.repeatedPatterns) {
            if (shown++ == kPatternsShown) break;
            out << "\n  Pattern (repeated " << group.count() << " times):\n";
            out << "    " << truncate(group.pattern, kPatternDisplayWidth) << "\n";
        }
    } else {
        out << "\nNo obvious N+1 problems detected\n";
    }

    if (verbose) {
        std::vector<CapturedStatement> captured = statements();
        if (!captured.empty()) {
            const std::string thin(70, '-');
            out << "\n" << thin << "\nAll Captured Queries:\n" << thin << "\n";
            for (const auto& stmt : captured) {
                out << "\n" << (stmt.index + 1) << ". [" << kindToString(stmt.kind) << "]\n";
                out << "   " << truncate(stmt.text, kStatementDisplayWidth) << "\n";
            }
        }
    }

    out << "\n" << rule << "\n\n";
}

nlohmann::json QueryAnalyzer::toJson() const {
    AnalysisReport report = analyze();

    nlohmann::json stats = nlohmann::json::object();
    for (const auto& [kind, count] : report.countsByKind) {
        stats[kindToString(kind)] = count;
    }

    nlohmann::json repeated = nlohmann::json::array();
    for (const auto& group : report.repeatedPatterns) {
        repeated.push_back({
            {"pattern", group.pattern},
            {"count", group.count()},
            {"indices", group.indices},
        });
    }

    nlohmann::json queries = nlohmann::json::array();
    for (const auto& stmt : statements()) {
        nlohmann::json params = nlohmann::json::array();
        for (const auto& value : stmt.params) {
            params.push_back(valueToJson(value));
        }
        queries.push_back({
            {"index", stmt.index},
            {"type", kindToString(stmt.kind)},
            {"statement", stmt.text},
            {"parameters", params},
        });
    }

    return {
        {"label", label()},
        {"total_queries", report.totalCount},
        {"select_queries", report.selectCount},
        {"potential_n_plus_1", report.potentialNPlusOne},
        {"query_stats", stats},
        {"repeated_queries", repeated},
        {"queries", queries},
    };
}

}  // namespace dbscope
