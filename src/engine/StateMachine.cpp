/**
 * StateMachine.cpp
 */

#include "StateMachine.hpp"
#include "../core/Logger.hpp"

namespace downlink::engine {

using models::Download;
using models::DownloadError;
using models::Status;

StateMachine::StateMachine(CatalogStore& catalog, ListenerCoordinator& listeners)
    : m_catalog(catalog)
    , m_listeners(listeners) {
}

bool StateMachine::canTransition(Status from, Status to) {
    if (from == to) return false;

    switch (from) {
        case Status::None:
            return to == Status::Added || to == Status::Queued;

        case Status::Added:
            return to == Status::Queued || to == Status::Paused || to == Status::Cancelled ||
                   to == Status::Removed || to == Status::Deleted;

        case Status::Queued:
            return to == Status::Downloading || to == Status::Paused || to == Status::Cancelled ||
                   to == Status::Removed || to == Status::Deleted;

        case Status::Downloading:
            return to == Status::Paused || to == Status::Completed || to == Status::Failed ||
                   to == Status::Cancelled || to == Status::Queued ||
                   to == Status::Removed || to == Status::Deleted;

        case Status::Paused:
            return to == Status::Queued || to == Status::Cancelled ||
                   to == Status::Removed || to == Status::Deleted;

        case Status::Completed:
            return to == Status::Removed || to == Status::Deleted;

        case Status::Cancelled:
        case Status::Failed:
            return to == Status::Queued || to == Status::Removed || to == Status::Deleted;

        case Status::Removed:
        case Status::Deleted:
            return false;
    }
    return false;
}

bool StateMachine::isTerminal(Status status) {
    return status == Status::Removed || status == Status::Deleted;
}

bool StateMachine::apply(Download& download, Status to, DownloadError error) {
    if (!canTransition(download.status, to)) {
        return false;
    }

    download.status = to;
    switch (to) {
        case Status::Failed:
        case Status::Paused:
            download.error = error;
            break;
        case Status::Removed:
        case Status::Deleted:
            break;
        default:
            download.error = DownloadError::None;
            break;
    }
    return true;
}

bool StateMachine::transition(Download& download, Status to, DownloadError error) {
    const Download before = download;

    if (!apply(download, to, error)) {
        LOG_DEBUG("Ignoring transition {} -> {} for download {}",
                  models::toString(before.status), models::toString(to), download.id);
        return false;
    }

    try {
        if (isTerminal(to)) {
            m_catalog.erase(download.id);
        } else {
            m_catalog.update(download);
        }
    } catch (...) {
        download = before;
        throw;
    }

    LOG_DEBUG("Download {}: {} -> {}", download.id,
              models::toString(before.status), models::toString(to));

    m_listeners.notifyStatus(download, before.status);
    return true;
}

void StateMachine::admitNew(Download& download, bool start) {
    const Download fresh = download;

    apply(download, Status::Added);
    const Download added = download;
    if (start) {
        apply(download, Status::Queued);
    }

    try {
        m_catalog.insert(download);
    } catch (...) {
        download = fresh;
        throw;
    }

    m_listeners.notifyStatus(added, Status::None);
    if (start) {
        // A fresh row is reported as queued, not resumed
        m_listeners.dispatch("queued", [&](DownloadListener& l) { l.onQueued(download, false); });
    }
}

} // namespace downlink::engine
