#include "Engine.hpp"
#include "ErrorHandler.hpp"
#include <spdlog/spdlog.h>

namespace dbscope {

namespace net = boost::asio;

namespace {

// Run `step` and report any failure other than a bad scheme as a construction error
template<typename Step>
auto constructionStep(const std::string& redactedUri, Step&& step) -> decltype(step()) {
    try {
        return step();
    } catch (const UnsupportedSchemeError&) {
        throw;
    } catch (const EngineConstructionError&) {
        throw;
    } catch (const DatabaseError& e) {
        throw EngineConstructionError("Cannot create engine for " + redactedUri + ": " + e.what());
    }
}

DatabaseUrl parseEngineUrl(const std::string& uri) {
    return constructionStep("database URL", [&uri]() { return UriTranslator::parse(uri); });
}

}  // namespace

// ============================================================================
// EngineBase
// ============================================================================

EngineBase::EngineBase(EngineMode mode, std::string uri, EngineConfig config)
    : m_mode(mode)
    , m_uri(std::move(uri))
    , m_url(parseEngineUrl(m_uri))
    , m_config(std::move(config)) {
}

ConnectionFactory EngineBase::makeFactory() const {
    return constructionStep(m_url.redacted(), [this]() { return Driver::makeFactory(m_url); });
}

PoolOptions EngineBase::poolOptions() const {
    PoolOptions options;
    options.pool_size = m_config.pool_size;
    options.max_overflow = m_config.max_overflow;
    options.timeout = m_config.pool_timeout;
    options.recycle = m_config.pool_recycle;
    options.pre_ping = m_config.pool_pre_ping;
    return options;
}

void EngineBase::dispose() {
    if (m_pool->isDisposed()) {
        return;
    }
    size_t checkedOut = m_pool->dispose();
    if (checkedOut > 0) {
        spdlog::warn("Disposed {} engine for {} with {} connection(s) still checked out",
                     modeToString(m_mode), m_url.redacted(), checkedOut);
    } else {
        spdlog::info("Disposed {} engine for {}", modeToString(m_mode), m_url.redacted());
    }
}

// ============================================================================
// Engine
// ============================================================================

Engine::Engine(std::string uri, EngineConfig config)
    : EngineBase(EngineMode::Blocking, std::move(uri), std::move(config)) {
    m_queue = QueuePool::create(makeFactory(), poolOptions());
    attachPool(m_queue);

    // Surface unreachable databases now rather than at first use
    constructionStep(url().redacted(), [this]() { m_queue->acquire().release(); });

    spdlog::info("Created blocking engine for {} (pool_size={}, max_overflow={})",
                 url().redacted(), poolSize(), maxOverflow());
}

PooledConnection Engine::connect() {
    return m_queue->acquire();
}

std::vector<std::string> Engine::tableNames() {
    PooledConnection conn = connect();
    return conn->tableNames();
}

// ============================================================================
// AsyncEngine
// ============================================================================

AsyncEngine::AsyncEngine(std::string uri, EngineConfig config)
    : EngineBase(EngineMode::NonBlocking, std::move(uri), std::move(config)) {
    if (!UriTranslator::isAsync(this->uri())) {
        throw EngineConstructionError("Non-blocking engine needs a '+" +
                                      UriTranslator::asyncDriver(url().family) +
                                      "' URI, got " + url().redacted());
    }

    m_queue = AsyncQueuePool::create(makeFactory(), poolOptions());
    attachPool(m_queue);

    // No coroutine context here: the first connection is opened directly
    constructionStep(url().redacted(), [this]() {
        auto grant = m_queue->tryAcquire();
        grant.release();
    });

    spdlog::info("Created non-blocking engine for {} (pool_size={}, max_overflow={})",
                 url().redacted(), poolSize(), maxOverflow());
}

net::awaitable<PooledConnection> AsyncEngine::connect() {
    return m_queue->acquire();
}

net::awaitable<std::vector<std::string>> AsyncEngine::tableNames() {
    PooledConnection conn = co_await connect();
    co_return conn->tableNames();
}

}  // namespace dbscope
