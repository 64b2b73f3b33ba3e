#pragma once

/**
 * DownloadEngine.hpp
 *
 * Public surface of the download engine. Every operation returns a
 * std::future delivering exactly one value or one core::EngineException.
 * Operations run in order on the namespace executor; the calling thread
 * never blocks.
 *
 * Instances with the same namespace share one catalog, scheduler and
 * listener set. After close() every operation fails with EngineClosed.
 */

#include "DownloadListener.hpp"
#include "EngineConfiguration.hpp"
#include "ListenerCoordinator.hpp"
#include "../models/Models.hpp"

#include <atomic>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace downlink::engine {

class NamespaceContext;

using DownloadList = std::vector<models::Download>;
using OptionalDownload = std::optional<models::Download>;

class DownloadEngine {
public:
    /**
     * Open an instance on the configured namespace
     * @throws core::EngineException InvalidRequest, InvalidConcurrentLimit, StorageUnavailable
     */
    explicit DownloadEngine(const EngineConfiguration& configuration);

    /**
     * Destructor - closes the instance
     */
    ~DownloadEngine();

    // Disable copy
    DownloadEngine(const DownloadEngine&) = delete;
    DownloadEngine& operator=(const DownloadEngine&) = delete;

    // -- Intake --

    /**
     * Enqueue a request
     * @return The request as stored
     */
    std::future<models::Request> enqueue(const models::Request& request);

    /**
     * Enqueue several requests; duplicates and invalid requests are skipped
     * @return The requests stored
     */
    std::future<std::vector<models::Request>> enqueue(const std::vector<models::Request>& requests);

    /**
     * Rewrite the request of an existing download
     * @param id Download id
     * @param request New request
     * @return Updated download, empty if id is unknown
     */
    std::future<OptionalDownload> updateRequest(int id, const models::Request& request);

    std::future<models::Download> addCompletedDownload(const models::CompletedDownload& completed);
    std::future<DownloadList> addCompletedDownloads(const std::vector<models::CompletedDownload>& completed);

    // -- Pause / resume / freeze --

    std::future<DownloadList> pause(const std::vector<int>& ids);
    std::future<OptionalDownload> pause(int id);
    std::future<DownloadList> pauseGroup(int groupId);

    std::future<DownloadList> resume(const std::vector<int>& ids);
    std::future<OptionalDownload> resume(int id);
    std::future<DownloadList> resumeGroup(int groupId);

    /**
     * Pause every transfer and hold admissions
     */
    std::future<bool> freeze();

    /**
     * Restore admissions; frozen downloads stay paused until resumed
     */
    std::future<bool> unfreeze();

    // -- Remove (catalog only) --

    std::future<DownloadList> remove(const std::vector<int>& ids);
    std::future<OptionalDownload> remove(int id);
    std::future<DownloadList> removeGroup(int groupId);
    std::future<DownloadList> removeAll();
    std::future<DownloadList> removeAllWithStatus(models::Status status);
    std::future<DownloadList> removeAllInGroupWithStatus(int groupId, models::Status status);

    // -- Delete (catalog and file) --

    std::future<DownloadList> deleteDownloads(const std::vector<int>& ids);
    std::future<OptionalDownload> deleteDownload(int id);
    std::future<DownloadList> deleteGroup(int groupId);
    std::future<DownloadList> deleteAll();
    std::future<DownloadList> deleteAllWithStatus(models::Status status);
    std::future<DownloadList> deleteAllInGroupWithStatus(int groupId, models::Status status);

    // -- Cancel / retry --

    std::future<DownloadList> cancel(const std::vector<int>& ids);
    std::future<OptionalDownload> cancel(int id);
    std::future<DownloadList> cancelGroup(int groupId);
    std::future<DownloadList> cancelAll();

    std::future<DownloadList> retry(const std::vector<int>& ids);
    std::future<OptionalDownload> retry(int id);

    // -- Queries --

    std::future<DownloadList> getDownloads();
    std::future<DownloadList> getDownloads(const std::vector<int>& ids);
    std::future<OptionalDownload> getDownload(int id);
    std::future<DownloadList> getDownloadsInGroup(int groupId);
    std::future<DownloadList> getDownloadsWithStatus(models::Status status);
    std::future<DownloadList> getDownloadsInGroupWithStatus(int groupId, models::Status status);
    std::future<DownloadList> getDownloadsByRequestIdentifier(int64_t identifier);
    std::future<std::vector<models::DownloadBlock>> getDownloadBlocks(int id);

    /**
     * Content length of a request
     * @param request Request to size
     * @param fromServer Ask the server when the catalog does not know it
     * @return Length in bytes, -1 if unknown
     */
    std::future<int64_t> getContentLengthForRequest(const models::Request& request, bool fromServer);

    // -- Listeners --

    /**
     * Attach a listener to the namespace
     * @param listener Listener to attach
     * @param notifyOnAttach Replay the current status of every download to it
     * @return false if it was already attached
     */
    std::future<bool> addListener(const DownloadListenerPtr& listener, bool notifyOnAttach);

    /**
     * Detach a listener
     * @return false if it was not attached
     */
    std::future<bool> removeListener(const DownloadListenerPtr& listener);

    // -- Settings --

    std::future<void> setGlobalNetworkType(models::NetworkType type);

    /**
     * @param limit Any non-negative value; 0 holds new admissions
     */
    std::future<void> setDownloadConcurrentLimit(int limit);

    /**
     * Switch log output on or off
     */
    void enableLogging(bool enabled);

    // -- Lifecycle --

    bool isClosed() const { return m_closed.load(); }
    const std::string& getNamespace() const { return m_nameSpace; }

    /**
     * Detach this instance's listeners and release the namespace. Idempotent.
     */
    void close();

private:
    template<typename F>
    auto run(F&& fn) -> std::future<std::invoke_result_t<std::decay_t<F>&, NamespaceContext&>>;

    template<typename T>
    std::future<T> closedFuture() const;

    static OptionalDownload first(const DownloadList& downloads);

private:
    std::string m_nameSpace;
    uint64_t m_instanceId;

    mutable std::mutex m_mutex;
    std::shared_ptr<NamespaceContext> m_context;
    std::atomic<bool> m_closed{false};
};

} // namespace downlink::engine
