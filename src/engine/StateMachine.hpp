#pragma once

/**
 * StateMachine.hpp
 *
 * Legal status edges of a download and the single place where a row's
 * status changes: apply the edge, persist the row, notify the listeners.
 */

#include "CatalogStore.hpp"
#include "ListenerCoordinator.hpp"
#include "../models/Models.hpp"

namespace downlink::engine {

class StateMachine {
public:
    StateMachine(CatalogStore& catalog, ListenerCoordinator& listeners);

    /**
     * Whether from -> to is an edge of the lifecycle
     */
    static bool canTransition(models::Status from, models::Status to);

    /**
     * REMOVED and DELETED
     */
    static bool isTerminal(models::Status status);

    /**
     * Change a row's status in memory only
     * @param download Row to change
     * @param to Target status
     * @param error Error recorded with the new status
     * @return false (row untouched) if the edge is illegal
     */
    static bool apply(models::Download& download, models::Status to,
                      models::DownloadError error = models::DownloadError::None);

    /**
     * Apply an edge, write it to the catalog and notify the listeners.
     * REMOVED and DELETED drop the row from the catalog.
     * @return false if the edge is illegal
     * @throws core::EngineException StorageUnavailable (row left unchanged)
     */
    bool transition(models::Download& download, models::Status to,
                    models::DownloadError error = models::DownloadError::None);

    /**
     * Bring a fresh row in: NONE -> ADDED, then ADDED -> QUEUED unless it
     * waits for an explicit resume. One catalog write.
     * @param download Fresh row (status NONE), updated in place
     * @param start Whether to queue it immediately
     */
    void admitNew(models::Download& download, bool start);

private:
    CatalogStore& m_catalog;
    ListenerCoordinator& m_listeners;
};

} // namespace downlink::engine
