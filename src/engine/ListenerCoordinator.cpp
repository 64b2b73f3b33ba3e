/**
 * ListenerCoordinator.cpp
 *
 * Listener registration, replay and status-to-event mapping.
 */

#include "ListenerCoordinator.hpp"

#include <algorithm>

namespace downlink::engine {

using models::Download;
using models::Status;

bool ListenerCoordinator::add(const DownloadListenerPtr& listener, uint64_t ownerId) {
    if (!listener) return false;

    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = std::find_if(m_entries.begin(), m_entries.end(),
        [&](const Entry& entry) { return entry.listener == listener; });
    if (it != m_entries.end()) {
        return false;
    }

    m_entries.push_back({listener, ownerId});
    return true;
}

bool ListenerCoordinator::remove(const DownloadListenerPtr& listener) {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto before = m_entries.size();
    m_entries.erase(
        std::remove_if(m_entries.begin(), m_entries.end(),
            [&](const Entry& entry) { return entry.listener == listener; }),
        m_entries.end()
    );
    return m_entries.size() != before;
}

void ListenerCoordinator::removeOwner(uint64_t ownerId) {
    std::lock_guard<std::mutex> lock(m_mutex);

    m_entries.erase(
        std::remove_if(m_entries.begin(), m_entries.end(),
            [ownerId](const Entry& entry) { return entry.ownerId == ownerId; }),
        m_entries.end()
    );
}

size_t ListenerCoordinator::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_entries.size();
}

void ListenerCoordinator::notifyStatus(const Download& download, Status from) const {
    switch (download.status) {
        case Status::Added:
            dispatch("added", [&](DownloadListener& l) { l.onAdded(download); });
            break;
        case Status::Queued:
            if (from == Status::Paused || from == Status::Added) {
                dispatch("resumed", [&](DownloadListener& l) { l.onResumed(download); });
            } else {
                dispatch("queued", [&](DownloadListener& l) { l.onQueued(download, false); });
            }
            break;
        case Status::Paused:
            dispatch("paused", [&](DownloadListener& l) { l.onPaused(download); });
            break;
        case Status::Completed:
            dispatch("completed", [&](DownloadListener& l) { l.onCompleted(download); });
            break;
        case Status::Failed:
            dispatch("error", [&](DownloadListener& l) { l.onError(download, download.error); });
            break;
        case Status::Cancelled:
            dispatch("cancelled", [&](DownloadListener& l) { l.onCancelled(download); });
            break;
        case Status::Removed:
            dispatch("removed", [&](DownloadListener& l) { l.onRemoved(download); });
            break;
        case Status::Deleted:
            dispatch("deleted", [&](DownloadListener& l) { l.onDeleted(download); });
            break;
        case Status::Downloading:
        case Status::None:
            // onStarted is reported by the transfer itself
            break;
    }
}

void ListenerCoordinator::replay(DownloadListener& listener, const Download& download) const {
    auto fn = [&](DownloadListener& l) {
        switch (download.status) {
            case Status::Added:       l.onAdded(download); break;
            case Status::Queued:      l.onQueued(download, false); break;
            case Status::Downloading: l.onProgress(download, -1, 0); break;
            case Status::Paused:      l.onPaused(download); break;
            case Status::Completed:   l.onCompleted(download); break;
            case Status::Failed:      l.onError(download, download.error); break;
            case Status::Cancelled:   l.onCancelled(download); break;
            case Status::Removed:     l.onRemoved(download); break;
            case Status::Deleted:     l.onDeleted(download); break;
            case Status::None:        break;
        }
    };
    invoke("replay", listener, fn);
}

} // namespace downlink::engine
