#pragma once

/**
 * NamespaceContext.hpp
 *
 * Everything engine instances of one namespace share: the catalog, the
 * scheduler, the listeners, the serialized operation executor, the
 * transfer pool and the network monitor.
 *
 * Contexts live in a process-wide registry. The first instance opening a
 * namespace creates its context with its own configuration; later
 * instances of the same namespace join it. The context shuts down when
 * the last instance releases it.
 */

#include "CatalogStore.hpp"
#include "ControlPlane.hpp"
#include "EngineConfiguration.hpp"
#include "ListenerCoordinator.hpp"
#include "NetworkGate.hpp"
#include "Scheduler.hpp"
#include "StateMachine.hpp"
#include "../core/ThreadPool.hpp"

#include <condition_variable>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <type_traits>

namespace downlink::engine {

class NamespaceContext {
public:
    /**
     * Join the context of a namespace, creating it if needed
     * @throws core::EngineException InvalidRequest (no transport),
     *         StorageUnavailable (catalog cannot be opened)
     */
    static std::shared_ptr<NamespaceContext> acquire(const EngineConfiguration& configuration);

    /**
     * Drop one reference. The last one shuts the context down before
     * another instance can reopen the namespace. Releasing from one of
     * the context's own threads hands the shutdown to a separate thread.
     */
    static void release(std::shared_ptr<NamespaceContext> context);

    ~NamespaceContext();

    NamespaceContext(const NamespaceContext&) = delete;
    NamespaceContext& operator=(const NamespaceContext&) = delete;

    /**
     * Run fn on the namespace executor with the namespace mutex held
     * @return Future for fn's result or exception
     */
    template<typename F>
    auto post(F&& fn) -> std::future<std::invoke_result_t<std::decay_t<F>&>> {
        using ReturnType = std::invoke_result_t<std::decay_t<F>&>;

        return m_executor->submit([this, fn = std::forward<F>(fn)]() mutable -> ReturnType {
            std::lock_guard<std::mutex> lock(m_mutex);
            return fn();
        });
    }

    const std::string& nameSpace() const { return m_configuration.nameSpace; }
    const EngineConfiguration& configuration() const { return m_configuration; }

    // Accessors for code running through post()
    CatalogStore& catalog() { return *m_catalog; }
    ControlPlane& controlPlane() { return *m_controlPlane; }
    Scheduler& scheduler() { return *m_scheduler; }

    ListenerCoordinator& listeners() { return m_listeners; }
    const std::shared_ptr<Transport>& transport() const { return m_configuration.transport; }

    /**
     * Whether the calling thread belongs to this context
     */
    bool isOwnThread() const;

private:
    /**
     * Wake-up channel of the monitor thread, shared with the connectivity
     * change handler so the handler never references the context itself
     */
    struct MonitorSignal {
        std::mutex mutex;
        std::condition_variable condition;
        bool pending{false};
        bool stop{false};

        void notify();
    };

    explicit NamespaceContext(const EngineConfiguration& configuration);

    void monitorLoop();
    void shutdown();

private:
    EngineConfiguration m_configuration;

    std::mutex m_mutex;
    ListenerCoordinator m_listeners;

    std::unique_ptr<CatalogStore> m_catalog;
    std::unique_ptr<NetworkGate> m_gate;
    std::unique_ptr<StateMachine> m_stateMachine;
    std::unique_ptr<core::ThreadPool> m_transferPool;
    std::unique_ptr<Scheduler> m_scheduler;
    std::unique_ptr<ControlPlane> m_controlPlane;
    std::unique_ptr<core::ThreadPool> m_executor;

    std::shared_ptr<MonitorSignal> m_signal;
    std::thread m_monitor;
};

} // namespace downlink::engine
