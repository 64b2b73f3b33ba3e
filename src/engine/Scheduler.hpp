#pragma once

/**
 * Scheduler.hpp
 *
 * Priority-ordered admission of QUEUED downloads into at most `limit`
 * concurrent transfers. The scheduler is the only component that moves a
 * download from QUEUED to DOWNLOADING.
 *
 * Every public method expects the caller to hold the namespace mutex.
 * Transfers run on the transfer pool and take the mutex themselves to
 * report progress and outcomes.
 */

#include "CatalogStore.hpp"
#include "Collaborators.hpp"
#include "ListenerCoordinator.hpp"
#include "NetworkGate.hpp"
#include "StateMachine.hpp"
#include "../core/ThreadPool.hpp"

#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <vector>

namespace downlink::engine {

struct SchedulerSettings {
    int concurrentLimit{1};
    int64_t progressReportingIntervalMs{2000};
};

class Scheduler {
public:
    Scheduler(std::mutex& mutex,
              CatalogStore& catalog,
              StateMachine& stateMachine,
              NetworkGate& gate,
              ListenerCoordinator& listeners,
              std::shared_ptr<Transport> transport,
              std::shared_ptr<FileSystem> fileSystem,
              core::ThreadPool& transferPool,
              const SchedulerSettings& settings);

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    /**
     * Put a QUEUED row in the waiting set (no-op for other statuses).
     * Admission happens on the next admit().
     */
    void enqueue(const models::Download& download);

    /**
     * Start transfers while capacity, freeze state and network allow
     */
    void admit();

    /**
     * Interrupt the transfer of a download. Its capacity is released at
     * once; the worker keeps draining until the transport returns.
     * @return false if the download has no active transfer
     */
    bool interrupt(int id);

    /**
     * Run fn once the worker of a draining download has returned,
     * or right away if nothing is draining for that id
     */
    void runAfterDrain(int id, std::function<void()> fn);

    bool isActive(int id) const { return m_active.count(id) != 0; }
    bool isDraining(int id) const { return m_draining.count(id) != 0; }
    size_t activeCount() const { return m_active.size(); }
    std::vector<int> activeIds() const;

    void setConcurrentLimit(int limit) { m_limit = limit; }
    int concurrentLimit() const { return m_limit; }

    void setFrozen(bool frozen) { m_frozen = frozen; }
    bool isFrozen() const { return m_frozen; }

    /**
     * Forget the network-wait notification of a download so it is
     * reported again the next time it is held back
     */
    void clearNetworkWait(int id) { m_networkWaitNotified.erase(id); }

    /**
     * Interrupt every transfer, wait for all workers to drain and put the
     * interrupted rows back to QUEUED. No admission happens afterwards.
     * @param lock Held lock on the namespace mutex, released while waiting
     */
    void shutdown(std::unique_lock<std::mutex>& lock);

private:
    class ProgressSink;

    struct WaitKey {
        int priority;
        uint64_t sequence;
        int id;

        bool operator<(const WaitKey& other) const {
            if (priority != other.priority) return priority > other.priority;
            if (sequence != other.sequence) return sequence < other.sequence;
            return id < other.id;
        }
    };

    struct Ticket {
        std::shared_ptr<TransferControl> control;
        uint64_t generation;
    };

    /**
     * @return false if the download could not be started and stays QUEUED
     */
    bool start(const models::Download& download);
    void runTransfer(int id, uint64_t generation,
                     std::shared_ptr<TransferControl> control,
                     TransferRequest request);
    void finishCurrent(int id, const TransferResult& result, const ProgressSink& sink);
    void finishDrained(int id, uint64_t sequence, const ProgressSink& sink);
    std::vector<std::function<void()>> takeAfterDrain(int id);
    void releaseDrained(int id);
    void fail(models::Download& download, models::DownloadError error);
    void settle(models::Download& download, models::Status to,
                models::DownloadError error = models::DownloadError::None);
    bool isCurrent(int id, uint64_t generation) const;

private:
    std::mutex& m_mutex;
    CatalogStore& m_catalog;
    StateMachine& m_stateMachine;
    NetworkGate& m_gate;
    ListenerCoordinator& m_listeners;
    std::shared_ptr<Transport> m_transport;
    std::shared_ptr<FileSystem> m_fileSystem;
    core::ThreadPool& m_transferPool;

    int m_limit;
    int64_t m_progressIntervalMs;
    bool m_frozen{false};
    bool m_shuttingDown{false};

    std::set<WaitKey> m_waiting;
    std::map<int, Ticket> m_active;
    std::set<int> m_draining;
    std::multimap<int, std::function<void()>> m_afterDrain;
    std::set<int> m_networkWaitNotified;
    uint64_t m_nextGeneration{1};

    std::condition_variable m_drainCondition;
};

} // namespace downlink::engine
