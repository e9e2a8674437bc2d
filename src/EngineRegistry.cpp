#include "EngineRegistry.hpp"
#include "ErrorHandler.hpp"
#include <spdlog/spdlog.h>

namespace dbscope {

std::string stateToString(EngineState state) {
    return state == EngineState::Ready ? "READY" : "UNINITIALIZED";
}

EngineRegistry::EngineRegistry(EngineConfig config) : m_config(std::move(config)) {
    m_blocking.factory = [](const std::string& uri, const EngineConfig& cfg) {
        return std::make_shared<Engine>(uri, cfg);
    };
    m_async.factory = [](const std::string& uri, const EngineConfig& cfg) {
        return std::make_shared<AsyncEngine>(uri, cfg);
    };
}

EngineRegistry::~EngineRegistry() {
    disposeAll();
}

std::shared_ptr<Engine> EngineRegistry::getEngine() {
    std::lock_guard<std::mutex> lock(m_blocking.mutex);
    if (m_blocking.engine) {
        return m_blocking.engine;
    }

    // Configuration is read once per construction
    EngineConfig cfg = config();
    std::string uri = cfg.resolvedUrl();

    spdlog::debug("Building blocking engine");
    m_blocking.engine = m_blocking.factory(uri, cfg);
    return m_blocking.engine;
}

std::shared_ptr<AsyncEngine> EngineRegistry::getAsyncEngine() {
    std::lock_guard<std::mutex> lock(m_async.mutex);
    if (m_async.engine) {
        return m_async.engine;
    }

    EngineConfig cfg = config();
    std::string uri = UriTranslator::toAsync(cfg.resolvedUrl());

    spdlog::debug("Building non-blocking engine");
    m_async.engine = m_async.factory(uri, cfg);
    return m_async.engine;
}

void EngineRegistry::dispose(EngineMode mode) {
    // Take the handle out under the lock, close the pool outside it
    std::shared_ptr<EngineBase> engine;
    if (mode == EngineMode::Blocking) {
        std::lock_guard<std::mutex> lock(m_blocking.mutex);
        engine = std::move(m_blocking.engine);
        m_blocking.engine.reset();
    } else {
        std::lock_guard<std::mutex> lock(m_async.mutex);
        engine = std::move(m_async.engine);
        m_async.engine.reset();
    }

    if (engine) {
        engine->dispose();
    }
}

void EngineRegistry::disposeAll() {
    dispose(EngineMode::Blocking);
    dispose(EngineMode::NonBlocking);
}

EngineState EngineRegistry::state(EngineMode mode) const {
    if (mode == EngineMode::Blocking) {
        std::lock_guard<std::mutex> lock(m_blocking.mutex);
        return m_blocking.engine ? EngineState::Ready : EngineState::Uninitialized;
    }
    std::lock_guard<std::mutex> lock(m_async.mutex);
    return m_async.engine ? EngineState::Ready : EngineState::Uninitialized;
}

void EngineRegistry::setConfig(EngineConfig config) {
    std::lock_guard<std::mutex> lock(m_configMutex);
    m_config = std::move(config);
}

EngineConfig EngineRegistry::config() const {
    std::lock_guard<std::mutex> lock(m_configMutex);
    return m_config;
}

void EngineRegistry::setEngineFactory(EngineFactory factory) {
    std::lock_guard<std::mutex> lock(m_blocking.mutex);
    m_blocking.factory = std::move(factory);
}

void EngineRegistry::setAsyncEngineFactory(AsyncEngineFactory factory) {
    std::lock_guard<std::mutex> lock(m_async.mutex);
    m_async.factory = std::move(factory);
}

}  // namespace dbscope
