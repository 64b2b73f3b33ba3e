#pragma once

// Fakes and helpers shared by the engine tests.

#include "core/EngineException.hpp"
#include "engine/CatalogPersistence.hpp"
#include "engine/Collaborators.hpp"
#include "engine/DownloadEngine.hpp"
#include "engine/DownloadListener.hpp"
#include "engine/EngineConfiguration.hpp"
#include "models/Models.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace downlink::test {

/**
 * Poll a condition until it holds or the timeout expires
 */
inline bool waitUntil(const std::function<bool()>& condition,
                      std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return condition();
}

/**
 * Error code carried by a failed future, empty if it succeeded
 */
template<typename T>
std::optional<core::ErrorCode> errorOf(std::future<T> future) {
    try {
        future.get();
    } catch (const core::EngineException& e) {
        return e.code();
    }
    return std::nullopt;
}

inline std::string uniqueNamespace(const std::string& prefix) {
    static std::atomic<int> counter{0};
    return "test." + prefix + "." + std::to_string(++counter);
}

/**
 * Scratch directory under the working directory, removed on scope exit
 */
class TempDirectory {
public:
    explicit TempDirectory(const std::string& name)
        : m_path(std::filesystem::current_path() / ("downlink_test_" + name)) {
        std::error_code ec;
        std::filesystem::remove_all(m_path, ec);
        std::filesystem::create_directories(m_path);
    }

    ~TempDirectory() {
        std::error_code ec;
        std::filesystem::remove_all(m_path, ec);
    }

    TempDirectory(const TempDirectory&) = delete;
    TempDirectory& operator=(const TempDirectory&) = delete;

    const std::filesystem::path& path() const { return m_path; }

private:
    std::filesystem::path m_path;
};

//=============================================================================
// FakeTransport
//=============================================================================

/**
 * Scriptable transport. Hold transfers report 250 bytes, then wait for
 * release() or an interruption.
 */
class FakeTransport : public engine::Transport {
public:
    enum class Mode { Hold, Complete, Fail };

    void setMode(Mode mode) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_mode = mode;
    }

    void setFailure(models::DownloadError error) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_failure = error;
    }

    void setTotal(int64_t total) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_total = total;
    }

    void setRemoteLength(int64_t length) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_remoteLength = length;
    }

    void release(int id) {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_released.insert(id);
        }
        m_condition.notify_all();
    }

    /**
     * Let every held transfer finish, and future ones complete at once
     */
    void releaseAll() {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_mode = Mode::Complete;
            m_releaseAll = true;
        }
        m_condition.notify_all();
    }

    engine::TransferResult execute(const engine::TransferRequest& request,
                                   engine::TransferSink& sink,
                                   const engine::TransferControl& control) override {
        const int id = request.download.id;
        Mode mode;
        int64_t total;
        models::DownloadError failure;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_starts.push_back(id);
            m_startBytes.push_back(request.download.downloaded);
            ++m_executions[id];
            ++m_running;
            m_maxRunning = std::max(m_maxRunning, m_running);
            mode = m_mode;
            total = m_total;
            failure = m_failure;
        }

        models::DownloadBlock block;
        block.downloadId = id;
        block.startByte = 0;
        block.endByte = total;
        block.downloadedBytes = request.download.downloaded;

        sink.onStarted(total, {block});

        engine::TransferResult result;
        if (mode == Mode::Complete) {
            block.downloadedBytes = total;
            sink.onProgress(total, total, {block});
            result.outcome = engine::TransferOutcome::Completed;
        } else if (mode == Mode::Fail) {
            result.outcome = engine::TransferOutcome::Failed;
            result.error = failure;
            result.message = "scripted failure";
        } else {
            block.downloadedBytes = std::min(total, request.download.downloaded + 250);
            sink.onProgress(block.downloadedBytes, total, {block});

            bool released = false;
            {
                std::unique_lock<std::mutex> lock(m_mutex);
                while (!control.isInterrupted()) {
                    if (m_releaseAll || m_released.erase(id)) {
                        released = true;
                        break;
                    }
                    m_condition.wait_for(lock, std::chrono::milliseconds(5));
                }
            }

            if (released) {
                block.downloadedBytes = total;
                sink.onProgress(total, total, {block});
                result.outcome = engine::TransferOutcome::Completed;
            } else {
                result.outcome = engine::TransferOutcome::Interrupted;
            }
        }

        std::lock_guard<std::mutex> lock(m_mutex);
        --m_running;
        return result;
    }

    int64_t fetchContentLength(const models::Request& /*request*/) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_remoteLength;
    }

    std::vector<int> starts() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_starts;
    }

    std::vector<int64_t> startBytes() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_startBytes;
    }

    int executions(int id) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_executions.find(id);
        return it == m_executions.end() ? 0 : it->second;
    }

    int running() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_running;
    }

    int maxRunning() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_maxRunning;
    }

private:
    mutable std::mutex m_mutex;
    std::condition_variable m_condition;

    Mode m_mode{Mode::Hold};
    models::DownloadError m_failure{models::DownloadError::HttpError};
    int64_t m_total{1000};
    int64_t m_remoteLength{-1};

    std::set<int> m_released;
    bool m_releaseAll{false};

    std::vector<int> m_starts;
    std::vector<int64_t> m_startBytes;
    std::map<int, int> m_executions;
    int m_running{0};
    int m_maxRunning{0};
};

//=============================================================================
// FakeConnectivity
//=============================================================================

class FakeConnectivity : public engine::Connectivity {
public:
    bool isNetworkAvailable(models::NetworkType type) const override {
        std::lock_guard<std::mutex> lock(m_mutex);
        switch (type) {
            case models::NetworkType::WifiOnly:  return m_wifi;
            case models::NetworkType::Unmetered: return m_unmetered;
            default:                             return m_any;
        }
    }

    void setChangeHandler(std::function<void()> handler) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_handler = std::move(handler);
    }

    /**
     * Change availability and fire the change handler
     */
    void setAvailable(bool any, bool wifi, bool unmetered) {
        std::function<void()> handler;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_any = any;
            m_wifi = wifi;
            m_unmetered = unmetered;
            handler = m_handler;
        }
        if (handler) {
            handler();
        }
    }

private:
    mutable std::mutex m_mutex;
    bool m_any{true};
    bool m_wifi{true};
    bool m_unmetered{true};
    std::function<void()> m_handler;
};

//=============================================================================
// FakeFileSystem
//=============================================================================

class FakeFileSystem : public engine::FileSystem {
public:
    void addFile(const std::string& path, const std::string& sha1 = "") {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_files.insert(path);
        m_hashes[path] = sha1;
    }

    void setHash(const std::string& path, const std::string& sha1) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_hashes[path] = sha1;
    }

    bool exists(const std::string& path) const override {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_files.count(path) != 0;
    }

    /**
     * Called with each deleted path, before the deletion is recorded
     */
    void setDeleteHook(std::function<void(const std::string&)> hook) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_deleteHook = std::move(hook);
    }

    bool deleteFile(const std::string& path) override {
        std::function<void(const std::string&)> hook;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            hook = m_deleteHook;
        }
        if (hook) {
            hook(path);
        }

        std::lock_guard<std::mutex> lock(m_mutex);
        m_deleted.push_back(path);
        return m_files.erase(path) != 0;
    }

    std::string sha1(const std::string& path) const override {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_hashes.find(path);
        return it == m_hashes.end() ? std::string() : it->second;
    }

    std::vector<std::string> deleted() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_deleted;
    }

private:
    mutable std::mutex m_mutex;
    std::set<std::string> m_files;
    std::map<std::string, std::string> m_hashes;
    std::vector<std::string> m_deleted;
    std::function<void(const std::string&)> m_deleteHook;
};

//=============================================================================
// In-memory persistence
//=============================================================================

/**
 * Rows of one namespace, kept across engine instances
 */
struct MemoryStore {
    std::mutex mutex;
    std::map<int, models::Download> rows;
    std::map<int, std::vector<models::DownloadBlock>> blocks;
    std::atomic<bool> failWrites{false};
};

class MemoryCatalogPersistence : public engine::CatalogPersistence {
public:
    explicit MemoryCatalogPersistence(std::shared_ptr<MemoryStore> store)
        : m_store(std::move(store)) {}

    engine::CatalogSnapshot load() override {
        std::lock_guard<std::mutex> lock(m_store->mutex);
        engine::CatalogSnapshot snapshot;
        for (const auto& [id, download] : m_store->rows) {
            snapshot.downloads.push_back(download);
        }
        snapshot.blocks = m_store->blocks;
        return snapshot;
    }

    void putDownload(const models::Download& download) override {
        check();
        std::lock_guard<std::mutex> lock(m_store->mutex);
        m_store->rows[download.id] = download;
    }

    void eraseDownload(int id) override {
        check();
        std::lock_guard<std::mutex> lock(m_store->mutex);
        m_store->rows.erase(id);
        m_store->blocks.erase(id);
    }

    void putBlocks(int downloadId, const std::vector<models::DownloadBlock>& blocks) override {
        check();
        std::lock_guard<std::mutex> lock(m_store->mutex);
        m_store->blocks[downloadId] = blocks;
    }

private:
    void check() const {
        if (m_store->failWrites) {
            throw core::EngineException(core::ErrorCode::StorageUnavailable, "memory store is read-only");
        }
    }

    std::shared_ptr<MemoryStore> m_store;
};

//=============================================================================
// RecordingListener
//=============================================================================

class RecordingListener : public engine::DownloadListener {
public:
    void onAdded(const models::Download& d) override { record("added", d.id); }
    void onQueued(const models::Download& d, bool) override { record("queued", d.id); }
    void onWaitingNetwork(const models::Download& d) override { record("waiting_network", d.id); }
    void onStarted(const models::Download& d, const std::vector<models::DownloadBlock>&, int) override {
        record("started", d.id);
    }
    void onPaused(const models::Download& d) override { record("paused", d.id); }
    void onResumed(const models::Download& d) override { record("resumed", d.id); }
    void onCompleted(const models::Download& d) override { record("completed", d.id); }
    void onError(const models::Download& d, models::DownloadError) override { record("error", d.id); }
    void onCancelled(const models::Download& d) override { record("cancelled", d.id); }
    void onRemoved(const models::Download& d) override { record("removed", d.id); }
    void onDeleted(const models::Download& d) override { record("deleted", d.id); }

    int count(const std::string& event, int id) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return static_cast<int>(std::count(m_events.begin(), m_events.end(), std::make_pair(event, id)));
    }

    std::vector<std::pair<std::string, int>> events() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_events;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_events.clear();
    }

private:
    void record(const std::string& event, int id) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_events.emplace_back(event, id);
    }

    mutable std::mutex m_mutex;
    std::vector<std::pair<std::string, int>> m_events;
};

//=============================================================================
// EngineHarness
//=============================================================================

/**
 * Engine configuration wired to fakes, with immediate progress reports and
 * no network polling
 */
struct EngineHarness {
    std::shared_ptr<FakeTransport> transport = std::make_shared<FakeTransport>();
    std::shared_ptr<FakeConnectivity> connectivity = std::make_shared<FakeConnectivity>();
    std::shared_ptr<FakeFileSystem> fileSystem = std::make_shared<FakeFileSystem>();
    std::shared_ptr<MemoryStore> store = std::make_shared<MemoryStore>();
    engine::EngineConfiguration config;

    explicit EngineHarness(const std::string& name, int limit = 1) {
        config.nameSpace = uniqueNamespace(name);
        config.downloadConcurrentLimit = limit;
        config.progressReportingIntervalMs = 0;
        config.networkCheckIntervalMs = 0;
        config.loggingEnabled = false;
        config.transport = transport;
        config.connectivity = connectivity;
        config.fileSystem = fileSystem;

        auto shared = store;
        config.persistenceFactory = [shared](const std::string&) {
            return std::unique_ptr<engine::CatalogPersistence>(
                std::make_unique<MemoryCatalogPersistence>(shared));
        };
    }

    std::unique_ptr<engine::DownloadEngine> open() const {
        return std::make_unique<engine::DownloadEngine>(config);
    }
};

inline models::Request makeRequest(const std::string& name,
                                   models::Priority priority = models::Priority::Normal,
                                   int groupId = 0) {
    models::Request request("https://example.com/files/" + name, "/downloads/" + name);
    request.priority = priority;
    request.groupId = groupId;
    return request;
}

inline std::optional<models::Status> statusOf(engine::DownloadEngine& engine, int id) {
    auto download = engine.getDownload(id).get();
    if (!download) {
        return std::nullopt;
    }
    return download->status;
}

inline bool waitForStatus(engine::DownloadEngine& engine, int id, models::Status status) {
    return waitUntil([&] { return statusOf(engine, id) == status; });
}

} // namespace downlink::test
