#pragma once

/**
 * ListenerCoordinator.hpp
 *
 * Fan-out of download events to the listeners attached to a namespace.
 * Delivery is synchronous and in registration order; a listener that throws
 * is logged and skipped.
 */

#include "DownloadListener.hpp"
#include "../core/Logger.hpp"

#include <memory>
#include <mutex>
#include <vector>
#include <atomic>
#include <cstdint>

namespace downlink::engine {

using DownloadListenerPtr = std::shared_ptr<DownloadListener>;

class ListenerCoordinator {
public:
    ListenerCoordinator() = default;

    ListenerCoordinator(const ListenerCoordinator&) = delete;
    ListenerCoordinator& operator=(const ListenerCoordinator&) = delete;

    /**
     * Attach a listener
     * @param listener Listener to attach
     * @param ownerId Engine instance that attached it
     * @return false if this listener is already attached
     */
    bool add(const DownloadListenerPtr& listener, uint64_t ownerId);

    /**
     * Detach a listener
     * @return true if it was attached
     */
    bool remove(const DownloadListenerPtr& listener);

    /**
     * Detach every listener attached by one engine instance
     */
    void removeOwner(uint64_t ownerId);

    size_t size() const;

    /**
     * Invoke fn(listener) on every attached listener
     * @param event Event name used when logging listener failures
     */
    template<typename F>
    void dispatch(const char* event, F&& fn) const {
        std::vector<DownloadListenerPtr> listeners;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            listeners.reserve(m_entries.size());
            for (const auto& entry : m_entries) {
                listeners.push_back(entry.listener);
            }
        }

        for (const auto& listener : listeners) {
            invoke(event, *listener, fn);
        }
    }

    /**
     * Deliver the event matching a download's new status
     * @param download Download after the transition
     * @param from Status before the transition
     */
    void notifyStatus(const models::Download& download, models::Status from) const;

    /**
     * Deliver one synthetic event describing a download's current status
     * to a single listener (notify-on-attach)
     */
    void replay(DownloadListener& listener, const models::Download& download) const;

private:
    template<typename F>
    static void invoke(const char* event, DownloadListener& listener, F& fn) {
        try {
            fn(listener);
        } catch (const std::exception& e) {
            LOG_WARN("Listener failed during {}: {}", event, e.what());
        } catch (...) {
            LOG_WARN("Listener failed during {} with a non-standard exception", event);
        }
    }

    struct Entry {
        DownloadListenerPtr listener;
        uint64_t ownerId;
    };

    mutable std::mutex m_mutex;
    std::vector<Entry> m_entries;
};

} // namespace downlink::engine
