/**
 * Scheduler.cpp
 *
 * Admission loop, transfer workers and outcome handling.
 */

#include "Scheduler.hpp"
#include "../core/EngineException.hpp"
#include "../core/Logger.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>

namespace downlink::engine {

using core::EngineException;
using models::Download;
using models::DownloadBlock;
using models::DownloadError;
using models::Status;

namespace {

bool equalsIgnoreCase(const std::string& a, const std::string& b) {
    return a.size() == b.size() &&
        std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
            return std::tolower(static_cast<unsigned char>(x)) ==
                   std::tolower(static_cast<unsigned char>(y));
        });
}

} // namespace

//=============================================================================
// ProgressSink
//=============================================================================

/**
 * Receives the callbacks of one transfer. Progress is kept in memory on
 * every report; persisted and announced at most once per reporting interval.
 * A sink whose transfer was interrupted only remembers the last state, which
 * the scheduler records once the worker has drained.
 */
class Scheduler::ProgressSink : public TransferSink {
public:
    ProgressSink(Scheduler& scheduler, int id, uint64_t generation)
        : m_scheduler(scheduler)
        , m_id(id)
        , m_generation(generation)
        , m_lastReport(std::chrono::steady_clock::now()) {
    }

    void onStarted(int64_t total, const std::vector<DownloadBlock>& blocks) override {
        m_total = total;
        m_blocks = blocks;

        std::lock_guard<std::mutex> lock(m_scheduler.m_mutex);
        if (!m_scheduler.isCurrent(m_id, m_generation)) return;

        const Download* row = m_scheduler.m_catalog.find(m_id);
        if (!row) return;

        Download download = *row;
        download.total = total;
        persist(download, blocks);

        m_scheduler.m_listeners.dispatch("started", [&](DownloadListener& l) {
            l.onStarted(download, blocks, static_cast<int>(blocks.size()));
        });
    }

    void onProgress(int64_t downloaded, int64_t total,
                    const std::vector<DownloadBlock>& blocks) override {
        m_downloaded = downloaded;
        m_total = total;
        m_blocks = blocks;
        m_hasProgress = true;

        std::lock_guard<std::mutex> lock(m_scheduler.m_mutex);
        if (!m_scheduler.isCurrent(m_id, m_generation)) return;

        const Download* row = m_scheduler.m_catalog.find(m_id);
        if (!row) return;

        Download download = *row;
        download.downloaded = downloaded;
        download.total = total;

        auto now = std::chrono::steady_clock::now();
        auto elapsedMs = std::chrono::duration_cast<std::chrono::milliseconds>(now - m_lastReport).count();

        if (elapsedMs < m_scheduler.m_progressIntervalMs) {
            m_scheduler.m_catalog.updateInMemory(download);
            return;
        }

        if (elapsedMs > 0) {
            m_bytesPerSecond = std::max<int64_t>(0, (downloaded - m_lastBytes) * 1000 / elapsedMs);
        }
        int64_t etaMillis = -1;
        if (total > 0 && m_bytesPerSecond > 0) {
            etaMillis = std::max<int64_t>(0, total - downloaded) * 1000 / m_bytesPerSecond;
        }

        m_lastReport = now;
        m_lastBytes = downloaded;

        persist(download, blocks);

        const int64_t bytesPerSecond = m_bytesPerSecond;
        m_scheduler.m_listeners.dispatch("progress", [&](DownloadListener& l) {
            l.onProgress(download, etaMillis, bytesPerSecond);
        });
        for (const auto& block : blocks) {
            m_scheduler.m_listeners.dispatch("block", [&](DownloadListener& l) {
                l.onBlockUpdated(download, block, static_cast<int>(blocks.size()));
            });
        }
    }

    bool hasProgress() const { return m_hasProgress; }
    int64_t downloaded() const { return m_downloaded; }
    int64_t total() const { return m_total; }
    const std::vector<DownloadBlock>& blocks() const { return m_blocks; }

private:
    void persist(const Download& download, const std::vector<DownloadBlock>& blocks) {
        auto& catalog = m_scheduler.m_catalog;
        try {
            catalog.update(download);
            if (!blocks.empty()) {
                catalog.putBlocks(m_id, blocks);
            }
        } catch (const EngineException& e) {
            LOG_WARN("Progress of download {} kept in memory only: {}", m_id, e.what());
            catalog.updateInMemory(download);
        }
    }

    Scheduler& m_scheduler;
    int m_id;
    uint64_t m_generation;

    bool m_hasProgress{false};
    int64_t m_downloaded{0};
    int64_t m_total{-1};
    std::vector<DownloadBlock> m_blocks;

    std::chrono::steady_clock::time_point m_lastReport;
    int64_t m_lastBytes{0};
    int64_t m_bytesPerSecond{0};
};

//=============================================================================
// Scheduler
//=============================================================================

Scheduler::Scheduler(std::mutex& mutex,
                     CatalogStore& catalog,
                     StateMachine& stateMachine,
                     NetworkGate& gate,
                     ListenerCoordinator& listeners,
                     std::shared_ptr<Transport> transport,
                     std::shared_ptr<FileSystem> fileSystem,
                     core::ThreadPool& transferPool,
                     const SchedulerSettings& settings)
    : m_mutex(mutex)
    , m_catalog(catalog)
    , m_stateMachine(stateMachine)
    , m_gate(gate)
    , m_listeners(listeners)
    , m_transport(std::move(transport))
    , m_fileSystem(std::move(fileSystem))
    , m_transferPool(transferPool)
    , m_limit(settings.concurrentLimit)
    , m_progressIntervalMs(settings.progressReportingIntervalMs) {
}

void Scheduler::enqueue(const Download& download) {
    if (download.status != Status::Queued) {
        return;
    }
    m_waiting.insert({static_cast<int>(download.priority), download.sequence, download.id});
}

void Scheduler::admit() {
    if (m_frozen || m_shuttingDown) {
        return;
    }

    auto it = m_waiting.begin();
    while (it != m_waiting.end() && static_cast<int>(m_active.size()) < m_limit) {
        const Download* row = m_catalog.find(it->id);

        // Keys go stale when a row leaves QUEUED or is re-keyed
        if (!row || row->status != Status::Queued || row->sequence != it->sequence ||
            static_cast<int>(row->priority) != it->priority) {
            it = m_waiting.erase(it);
            continue;
        }

        if (m_draining.count(row->id) || m_active.count(row->id)) {
            ++it;
            continue;
        }

        if (!m_gate.isPermitted(*row)) {
            if (m_networkWaitNotified.insert(row->id).second) {
                Download waiting = *row;
                LOG_DEBUG("Download {} waits for network {}", waiting.id,
                          models::toString(m_gate.effectiveType(waiting)));
                m_listeners.dispatch("waiting_network", [&](DownloadListener& l) {
                    l.onWaitingNetwork(waiting);
                });
            }
            ++it;
            continue;
        }

        Download next = *row;
        if (!start(next)) {
            // Still QUEUED and keeps its place; retried on the next admit()
            break;
        }
        it = m_waiting.erase(it);
    }
}

bool Scheduler::start(const Download& download) {
    Download row = download;

    try {
        if (!m_stateMachine.transition(row, Status::Downloading)) {
            return true;
        }
    } catch (const EngineException& e) {
        LOG_ERROR("Cannot start download {}: {}", row.id, e.what());
        return false;
    }

    auto control = std::make_shared<TransferControl>();
    uint64_t generation = m_nextGeneration++;
    m_active[row.id] = Ticket{control, generation};
    m_networkWaitNotified.erase(row.id);

    TransferRequest request{row, m_catalog.getBlocks(row.id)};

    LOG_INFO("Starting download {}: {} -> {}", row.id, row.url, row.file);

    m_transferPool.ensureWorkers(m_active.size() + m_draining.size());
    try {
        m_transferPool.submit([this, id = row.id, generation, control, request]() {
            runTransfer(id, generation, control, request);
        });
    } catch (const std::runtime_error& e) {
        LOG_ERROR("Cannot run download {}: {}", row.id, e.what());
        m_active.erase(row.id);
        settle(row, Status::Queued);
        return false;
    }
    return true;
}

void Scheduler::runTransfer(int id, uint64_t generation,
                            std::shared_ptr<TransferControl> control,
                            TransferRequest request) {
    ProgressSink sink(*this, id, generation);

    TransferResult result;
    try {
        result = m_transport->execute(request, sink, *control);
    } catch (const std::exception& e) {
        LOG_ERROR("Transport failed for download {}: {}", id, e.what());
        result = TransferResult{TransferOutcome::Failed, DownloadError::Unknown, e.what()};
    } catch (...) {
        LOG_ERROR("Transport failed for download {} with a non-standard exception", id);
        result = TransferResult{TransferOutcome::Failed, DownloadError::Unknown, "unknown"};
    }

    std::vector<std::function<void()>> deferred;
    {
        std::lock_guard<std::mutex> lock(m_mutex);

        if (isCurrent(id, generation)) {
            m_active.erase(id);
            finishCurrent(id, result, sink);
        } else {
            finishDrained(id, request.download.sequence, sink);
            deferred = takeAfterDrain(id);
            if (deferred.empty()) {
                releaseDrained(id);
            }
        }

        admit();
    }

    // The id stays draining until its tasks are done, so a new transfer
    // for it cannot start while they still touch its file
    while (!deferred.empty()) {
        for (auto& fn : deferred) {
            try {
                fn();
            } catch (const std::exception& e) {
                LOG_WARN("Post-transfer task for download {} failed: {}", id, e.what());
            }
        }

        std::lock_guard<std::mutex> lock(m_mutex);
        deferred = takeAfterDrain(id);
        if (deferred.empty()) {
            releaseDrained(id);
            admit();
        }
    }
}

void Scheduler::finishCurrent(int id, const TransferResult& result, const ProgressSink& sink) {
    const Download* row = m_catalog.find(id);
    if (!row) {
        return;
    }

    Download download = *row;
    if (sink.hasProgress()) {
        download.downloaded = sink.downloaded();
        if (sink.total() >= 0) download.total = sink.total();
    }

    if (!sink.blocks().empty()) {
        try {
            m_catalog.putBlocks(id, sink.blocks());
        } catch (const EngineException& e) {
            LOG_WARN("Blocks of download {} not persisted: {}", id, e.what());
        }
    }

    switch (result.outcome) {
        case TransferOutcome::Completed: {
            if (download.total < 0) {
                download.total = download.downloaded;
            }

            if (download.total > 0 && download.downloaded != download.total) {
                LOG_WARN("Download {} ended at {} of {} bytes", id, download.downloaded, download.total);
                fail(download, DownloadError::ContentLengthMismatch);
                return;
            }

            if (!download.checksum.empty()) {
                std::string actual;
                try {
                    actual = m_fileSystem ? m_fileSystem->sha1(download.file) : std::string();
                } catch (const std::exception& e) {
                    LOG_WARN("Cannot hash {}: {}", download.file, e.what());
                }

                if (!equalsIgnoreCase(actual, download.checksum)) {
                    LOG_WARN("Checksum mismatch for download {}: expected {}, got {}",
                             id, download.checksum, actual.empty() ? "<unreadable>" : actual);
                    fail(download, DownloadError::ChecksumMismatch);
                    return;
                }
            }

            settle(download, Status::Completed);
            LOG_INFO("Download {} completed: {} ({} bytes)", id, download.file, download.downloaded);
            break;
        }

        case TransferOutcome::Failed:
            LOG_WARN("Download {} failed: {} {}", id, models::toString(result.error), result.message);
            fail(download, result.error == DownloadError::None ? DownloadError::Unknown : result.error);
            break;

        case TransferOutcome::Interrupted:
            LOG_WARN("Transport stopped download {} without being interrupted", id);
            fail(download, DownloadError::Unknown);
            break;
    }
}

void Scheduler::finishDrained(int id, uint64_t sequence, const ProgressSink& sink) {
    // Record the bytes written after the interruption, unless the row was
    // dropped or replaced by a newer incarnation
    const Download* row = m_catalog.find(id);
    if (row && row->sequence == sequence && sink.hasProgress() && row->status != Status::Downloading) {
        Download download = *row;
        download.downloaded = sink.downloaded();
        if (sink.total() >= 0) download.total = sink.total();

        try {
            m_catalog.update(download);
            if (!sink.blocks().empty()) {
                m_catalog.putBlocks(id, sink.blocks());
            }
        } catch (const EngineException& e) {
            LOG_WARN("Final progress of download {} kept in memory only: {}", id, e.what());
            m_catalog.updateInMemory(download);
        }
    }
}

std::vector<std::function<void()>> Scheduler::takeAfterDrain(int id) {
    std::vector<std::function<void()>> tasks;
    auto range = m_afterDrain.equal_range(id);
    for (auto it = range.first; it != range.second; ++it) {
        tasks.push_back(std::move(it->second));
    }
    m_afterDrain.erase(range.first, range.second);
    return tasks;
}

void Scheduler::releaseDrained(int id) {
    m_draining.erase(id);
    LOG_DEBUG("Download {} drained", id);
    m_drainCondition.notify_all();
}

void Scheduler::fail(Download& download, DownloadError error) {
    if (error == DownloadError::NoNetworkConnection) {
        // Resumes by itself once the network is back
        settle(download, Status::Paused, error);
        return;
    }

    if (download.autoRetryAttempts < download.autoRetryMaxAttempts) {
        ++download.autoRetryAttempts;
        LOG_INFO("Retrying download {} ({}/{})", download.id,
                 download.autoRetryAttempts, download.autoRetryMaxAttempts);
        settle(download, Status::Queued);
        enqueue(download);
        return;
    }

    settle(download, Status::Failed, error);
}

void Scheduler::settle(Download& download, Status to, DownloadError error) {
    try {
        m_stateMachine.transition(download, to, error);
    } catch (const EngineException& e) {
        LOG_ERROR("Download {} is {} in memory only: {}", download.id, models::toString(to), e.what());

        Status from = download.status;
        if (StateMachine::apply(download, to, error)) {
            m_catalog.updateInMemory(download);
            m_listeners.notifyStatus(download, from);
        }
    }
}

bool Scheduler::interrupt(int id) {
    auto it = m_active.find(id);
    if (it == m_active.end()) {
        return false;
    }

    it->second.control->interrupt();
    m_active.erase(it);
    m_draining.insert(id);
    return true;
}

void Scheduler::runAfterDrain(int id, std::function<void()> fn) {
    if (m_draining.count(id)) {
        m_afterDrain.emplace(id, std::move(fn));
        return;
    }

    try {
        fn();
    } catch (const std::exception& e) {
        LOG_WARN("Task for download {} failed: {}", id, e.what());
    }
}

std::vector<int> Scheduler::activeIds() const {
    std::vector<int> ids;
    ids.reserve(m_active.size());
    for (const auto& [id, ticket] : m_active) {
        ids.push_back(id);
    }
    return ids;
}

bool Scheduler::isCurrent(int id, uint64_t generation) const {
    auto it = m_active.find(id);
    return it != m_active.end() && it->second.generation == generation;
}

void Scheduler::shutdown(std::unique_lock<std::mutex>& lock) {
    m_shuttingDown = true;

    for (int id : activeIds()) {
        interrupt(id);

        const Download* row = m_catalog.find(id);
        if (row && row->status == Status::Downloading) {
            Download download = *row;
            settle(download, Status::Queued);
        }
    }

    m_drainCondition.wait(lock, [this] { return m_draining.empty(); });
    m_waiting.clear();

    LOG_DEBUG("Scheduler of namespace {} stopped", m_catalog.nameSpace());
}

} // namespace downlink::engine
