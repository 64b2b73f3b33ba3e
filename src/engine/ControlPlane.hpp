#pragma once

/**
 * ControlPlane.hpp
 *
 * Request intake and the operations that mutate downloads: pause, resume,
 * cancel, retry, remove, delete, freeze, limit and network changes.
 *
 * All methods expect the caller to hold the namespace mutex. Batch methods
 * skip ids that are absent or whose status the operation does not apply
 * to; they stop at the first storage failure, leaving the rows already
 * processed committed, and rethrow it.
 */

#include "CatalogStore.hpp"
#include "Collaborators.hpp"
#include "ListenerCoordinator.hpp"
#include "NetworkGate.hpp"
#include "Scheduler.hpp"
#include "StateMachine.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <set>
#include <vector>

namespace downlink::engine {

class ControlPlane {
public:
    /**
     * @param defaultAutoRetryMaxAttempts Used for requests that set no retry limit
     */
    ControlPlane(CatalogStore& catalog,
                 StateMachine& stateMachine,
                 Scheduler& scheduler,
                 NetworkGate& gate,
                 ListenerCoordinator& listeners,
                 std::shared_ptr<FileSystem> fileSystem,
                 int defaultAutoRetryMaxAttempts);

    ControlPlane(const ControlPlane&) = delete;
    ControlPlane& operator=(const ControlPlane&) = delete;

    /**
     * Bring a request into the catalog according to its enqueue action
     * @return The request as stored (its file differs under IncrementFileName)
     * @throws core::EngineException DuplicateRequest, InvalidRequest, StorageUnavailable
     */
    models::Request enqueue(const models::Request& request);

    /**
     * Enqueue several requests. Rejected requests (duplicate or invalid)
     * are logged and left out of the result.
     */
    std::vector<models::Request> enqueue(const std::vector<models::Request>& requests);

    std::vector<models::Download> pause(const std::vector<int>& ids);
    std::vector<models::Download> resume(const std::vector<int>& ids);
    std::vector<models::Download> cancel(const std::vector<int>& ids);
    std::vector<models::Download> retry(const std::vector<int>& ids);
    std::vector<models::Download> remove(const std::vector<int>& ids);

    /**
     * Remove the rows and delete their files. The file of a transferring
     * download is deleted once its worker has drained.
     */
    std::vector<models::Download> deleteDownloads(const std::vector<int>& ids);

    /**
     * Pause every transfer and stop admissions
     * @return true (frozen)
     */
    bool freeze();

    /**
     * Restore admissions. Downloads paused by freeze go back to QUEUED and
     * wait for a slot like any other queued download.
     * @return true (not frozen)
     */
    bool unfreeze();

    /**
     * @throws core::EngineException InvalidConcurrentLimit for a negative limit
     */
    void setConcurrentLimit(int limit);

    void setGlobalNetworkType(models::NetworkType type);

    /**
     * Rewrite the request of a download. A new url or file restarts it
     * from zero under the new id; other changes merge into the row and
     * restart an active transfer from QUEUED.
     * @return Updated download, empty if id is unknown
     * @throws core::EngineException DuplicateRequest, InvalidRequest, StorageUnavailable
     */
    std::optional<models::Download> updateRequest(int id, const models::Request& request);

    /**
     * Adopt a file completed elsewhere as a COMPLETED row, replacing any
     * download of the same file
     */
    models::Download addCompletedDownload(const models::CompletedDownload& completed);
    std::vector<models::Download> addCompletedDownloads(const std::vector<models::CompletedDownload>& completed);

    /**
     * Re-evaluate the network: pause transfers that lost their network,
     * requeue downloads paused for lack of network once it is back, admit.
     */
    void onNetworkCheck();

    static std::vector<int> idsOf(const std::vector<models::Download>& downloads);

private:
    using RowAction = std::function<bool(models::Download&)>;

    /**
     * Run action on each present row; rows for which it returns true are
     * collected. Admission runs afterwards, also when a row throws.
     */
    std::vector<models::Download> forEach(const std::vector<int>& ids, const RowAction& action);

    models::Request intake(const models::Request& request);
    void dropForReplacement(const models::Download& existing);
    bool fileExists(const std::string& path) const;

private:
    CatalogStore& m_catalog;
    StateMachine& m_stateMachine;
    Scheduler& m_scheduler;
    NetworkGate& m_gate;
    ListenerCoordinator& m_listeners;
    std::shared_ptr<FileSystem> m_fileSystem;
    int m_defaultAutoRetryMaxAttempts;

    std::set<int> m_pausedByFreeze;
};

} // namespace downlink::engine
