#pragma once

/**
 * Collaborators.hpp
 *
 * Interfaces the engine consumes: byte transfer, connectivity and
 * file system access. Persistence lives in CatalogPersistence.hpp.
 */

#include "../models/Models.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace downlink::engine {

/**
 * Interruption flag shared between the scheduler and a running transfer
 */
class TransferControl {
public:
    bool isInterrupted() const { return m_interrupted.load(); }
    void interrupt() { m_interrupted = true; }

private:
    std::atomic<bool> m_interrupted{false};
};

/**
 * Transfer outcome
 */
enum class TransferOutcome {
    Completed,
    Failed,
    Interrupted
};

struct TransferResult {
    TransferOutcome outcome{TransferOutcome::Failed};
    models::DownloadError error{models::DownloadError::None};
    std::string message;
};

/**
 * What a transfer receives: a snapshot of the row and its persisted blocks.
 * `download.downloaded` and the blocks describe where to resume.
 */
struct TransferRequest {
    models::Download download;
    std::vector<models::DownloadBlock> blocks;
};

/**
 * Progress callbacks invoked by a Transport from its worker thread
 */
class TransferSink {
public:
    virtual ~TransferSink() = default;

    /**
     * Connection established
     * @param total Content length, -1 if unknown
     * @param blocks Block layout for this transfer
     */
    virtual void onStarted(int64_t total, const std::vector<models::DownloadBlock>& blocks) = 0;

    /**
     * Bytes written
     * @param downloaded Total bytes on disk for the download
     * @param total Content length, -1 if unknown
     * @param blocks Current block state
     */
    virtual void onProgress(int64_t downloaded, int64_t total,
                            const std::vector<models::DownloadBlock>& blocks) = 0;
};

/**
 * Performs the byte transfer for one download
 */
class Transport {
public:
    virtual ~Transport() = default;

    /**
     * Run a transfer to its end. Must return promptly with
     * TransferOutcome::Interrupted once control.isInterrupted() is set.
     */
    virtual TransferResult execute(const TransferRequest& request,
                                   TransferSink& sink,
                                   const TransferControl& control) = 0;

    /**
     * Ask the server for the content length of a request
     * @return Content length, -1 if it cannot be determined
     */
    virtual int64_t fetchContentLength(const models::Request& request) = 0;
};

/**
 * Answers "is network type X currently available"
 */
class Connectivity {
public:
    virtual ~Connectivity() = default;

    virtual bool isNetworkAvailable(models::NetworkType type) const = 0;

    /**
     * Register a callback fired when availability may have changed.
     * Implementations that cannot detect changes may ignore it; the engine
     * also polls.
     */
    virtual void setChangeHandler(std::function<void()> handler) = 0;
};

/**
 * File system access needed by delete operations and checksum checks
 */
class FileSystem {
public:
    virtual ~FileSystem() = default;

    virtual bool exists(const std::string& path) const = 0;
    virtual bool deleteFile(const std::string& path) = 0;

    /**
     * SHA1 of the file content as lowercase hex, empty if unreadable
     */
    virtual std::string sha1(const std::string& path) const = 0;
};

} // namespace downlink::engine
