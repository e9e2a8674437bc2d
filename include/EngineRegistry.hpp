#pragma once

/**
 * @file EngineRegistry.hpp
 * @brief Lazily built, explicitly disposed engines: one per execution mode.
 *
 * State per mode: UNINITIALIZED -> READY -> (dispose) -> UNINITIALIZED.
 * The first caller of getEngine()/getAsyncEngine() builds the engine under
 * the mode's mutex; concurrent first callers wait and receive the same
 * handle. A failed construction leaves the mode UNINITIALIZED so the next
 * call tries again.
 */

#include "Config.hpp"
#include "Engine.hpp"
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace dbscope {

enum class EngineState {
    Uninitialized,
    Ready
};

std::string stateToString(EngineState state);

using EngineFactory = std::function<std::shared_ptr<Engine>(const std::string& uri, const EngineConfig&)>;
using AsyncEngineFactory =
    std::function<std::shared_ptr<AsyncEngine>(const std::string& uri, const EngineConfig&)>;

class EngineRegistry {
public:
    explicit EngineRegistry(EngineConfig config = {});
    ~EngineRegistry();

    EngineRegistry(const EngineRegistry&) = delete;
    EngineRegistry& operator=(const EngineRegistry&) = delete;

    /**
     * @brief Return the blocking engine, building it on first demand.
     * @throws UnsupportedSchemeError for an unknown URL scheme.
     * @throws EngineConstructionError when the database cannot be reached.
     */
    std::shared_ptr<Engine> getEngine();

    /**
     * @brief Return the non-blocking engine, building it on first demand.
     *
     * The blocking URL is translated with UriTranslator::toAsync().
     */
    std::shared_ptr<AsyncEngine> getAsyncEngine();

    // Close the mode's pool if READY; no-op otherwise
    void dispose(EngineMode mode);
    void disposeAll();

    EngineState state(EngineMode mode) const;

    // Applies to engines built after the call
    void setConfig(EngineConfig config);
    EngineConfig config() const;

    // Replace how engines are built (tests, instrumentation)
    void setEngineFactory(EngineFactory factory);
    void setAsyncEngineFactory(AsyncEngineFactory factory);

private:
    template<typename EngineT, typename FactoryT>
    struct Slot {
        mutable std::mutex mutex;
        std::shared_ptr<EngineT> engine;
        FactoryT factory;
    };

    mutable std::mutex m_configMutex;
    EngineConfig m_config;

    Slot<Engine, EngineFactory> m_blocking;
    Slot<AsyncEngine, AsyncEngineFactory> m_async;
};

}  // namespace dbscope
