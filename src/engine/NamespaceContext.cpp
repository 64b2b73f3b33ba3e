/**
 * NamespaceContext.cpp
 *
 * Namespace registry, context start-up and shutdown, network monitor.
 */

#include "NamespaceContext.hpp"
#include "../core/EngineException.hpp"
#include "../core/Logger.hpp"

#include <chrono>
#include <map>

namespace downlink::engine {

using core::EngineException;
using core::ErrorCode;

namespace {

struct Registry {
    std::mutex mutex;
    std::map<std::string, std::weak_ptr<NamespaceContext>> contexts;
};

Registry& registry() {
    static Registry instance;
    return instance;
}

} // namespace

//=============================================================================
// Registry
//=============================================================================

std::shared_ptr<NamespaceContext> NamespaceContext::acquire(const EngineConfiguration& configuration) {
    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    auto& slot = reg.contexts[configuration.nameSpace];
    if (auto existing = slot.lock()) {
        LOG_DEBUG("Joining namespace {}", configuration.nameSpace);
        return existing;
    }

    std::shared_ptr<NamespaceContext> context(new NamespaceContext(configuration.withDefaults()));
    slot = context;
    return context;
}

void NamespaceContext::release(std::shared_ptr<NamespaceContext> context) {
    if (!context) return;

    if (context->isOwnThread()) {
        // Shutdown joins the context's threads; it cannot run on one of them
        std::thread([context = std::move(context)]() mutable {
            release(std::move(context));
        }).detach();
        return;
    }

    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    if (context.use_count() == 1) {
        std::string nameSpace = context->nameSpace();
        context.reset();

        auto it = reg.contexts.find(nameSpace);
        if (it != reg.contexts.end() && it->second.expired()) {
            reg.contexts.erase(it);
        }
    } else {
        context.reset();
    }
}

//=============================================================================
// Lifecycle
//=============================================================================

NamespaceContext::NamespaceContext(const EngineConfiguration& configuration)
    : m_configuration(configuration)
    , m_signal(std::make_shared<MonitorSignal>()) {

    if (!m_configuration.transport) {
        throw EngineException(ErrorCode::InvalidRequest,
            "namespace " + m_configuration.nameSpace + " has no transport configured");
    }
    if (m_configuration.downloadConcurrentLimit < 0) {
        throw EngineException(ErrorCode::InvalidConcurrentLimit,
            "concurrent limit must not be negative, got " +
            std::to_string(m_configuration.downloadConcurrentLimit));
    }

    std::unique_ptr<CatalogPersistence> persistence;
    try {
        persistence = m_configuration.persistenceFactory(m_configuration.nameSpace);
    } catch (const EngineException&) {
        throw;
    } catch (const std::exception& e) {
        throw EngineException(ErrorCode::StorageUnavailable, e.what());
    }
    if (!persistence) {
        throw EngineException(ErrorCode::StorageUnavailable,
            "no persistence for namespace " + m_configuration.nameSpace);
    }

    m_catalog = std::make_unique<CatalogStore>(std::move(persistence), m_configuration.nameSpace);
    m_catalog->open();

    m_gate = std::make_unique<NetworkGate>(m_configuration.connectivity, m_configuration.globalNetworkType);
    m_stateMachine = std::make_unique<StateMachine>(*m_catalog, m_listeners);
    m_transferPool = std::make_unique<core::ThreadPool>(0, m_configuration.nameSpace + ".transfers");

    SchedulerSettings settings;
    settings.concurrentLimit = m_configuration.downloadConcurrentLimit;
    settings.progressReportingIntervalMs = m_configuration.progressReportingIntervalMs;

    m_scheduler = std::make_unique<Scheduler>(m_mutex, *m_catalog, *m_stateMachine, *m_gate, m_listeners,
                                              m_configuration.transport, m_configuration.fileSystem,
                                              *m_transferPool, settings);
    m_controlPlane = std::make_unique<ControlPlane>(*m_catalog, *m_stateMachine, *m_scheduler, *m_gate,
                                                    m_listeners, m_configuration.fileSystem,
                                                    m_configuration.autoRetryMaxAttempts);
    m_executor = std::make_unique<core::ThreadPool>(1, m_configuration.nameSpace + ".executor");

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto& download : m_catalog->getByStatus(models::Status::Queued)) {
            m_scheduler->enqueue(download);
        }
        m_scheduler->admit();
    }

    if (m_configuration.connectivity) {
        std::weak_ptr<MonitorSignal> signal = m_signal;
        m_configuration.connectivity->setChangeHandler([signal]() {
            if (auto s = signal.lock()) {
                s->notify();
            }
        });
    }

    m_monitor = std::thread([this] { monitorLoop(); });

    LOG_INFO("Namespace {} opened ({} downloads, limit {})",
             m_configuration.nameSpace, m_catalog->size(), m_configuration.downloadConcurrentLimit);
}

NamespaceContext::~NamespaceContext() {
    shutdown();
}

void NamespaceContext::shutdown() {
    // Operations already posted still complete
    if (m_executor) {
        m_executor->shutdown();
    }

    {
        std::lock_guard<std::mutex> lock(m_signal->mutex);
        m_signal->stop = true;
    }
    m_signal->condition.notify_all();
    if (m_monitor.joinable()) {
        m_monitor.join();
    }

    if (m_scheduler) {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_scheduler->shutdown(lock);
    }

    if (m_transferPool) {
        m_transferPool->shutdown();
    }

    LOG_INFO("Namespace {} closed", m_configuration.nameSpace);
}

bool NamespaceContext::isOwnThread() const {
    if (m_monitor.get_id() == std::this_thread::get_id()) {
        return true;
    }
    return (m_executor && m_executor->isWorkerThread()) ||
           (m_transferPool && m_transferPool->isWorkerThread());
}

//=============================================================================
// Network monitor
//=============================================================================

void NamespaceContext::MonitorSignal::notify() {
    {
        std::lock_guard<std::mutex> lock(mutex);
        pending = true;
    }
    condition.notify_all();
}

void NamespaceContext::monitorLoop() {
    const auto interval = std::chrono::milliseconds(m_configuration.networkCheckIntervalMs);

    while (true) {
        {
            std::unique_lock<std::mutex> lock(m_signal->mutex);
            auto wake = [this] { return m_signal->stop || m_signal->pending; };

            if (interval.count() > 0) {
                m_signal->condition.wait_for(lock, interval, wake);
            } else {
                m_signal->condition.wait(lock, wake);
            }

            if (m_signal->stop) {
                return;
            }
            m_signal->pending = false;
        }

        std::lock_guard<std::mutex> lock(m_mutex);
        try {
            m_controlPlane->onNetworkCheck();
        } catch (const std::exception& e) {
            LOG_WARN("Network check of namespace {} failed: {}", m_configuration.nameSpace, e.what());
        }
    }
}

} // namespace downlink::engine
