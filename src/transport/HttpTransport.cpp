/**
 * HttpTransport.cpp
 *
 * HTTP transfers with cpr: a HEAD request for length and range support,
 * then one GET per block written straight into the destination file.
 */

#include "HttpTransport.hpp"
#include "../core/Config.hpp"
#include "../core/Logger.hpp"
#include "../utils/FileUtils.hpp"

#include <cpr/cpr.h>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <future>
#include <mutex>

namespace downlink::transport {

using core::Logger;
using engine::TransferControl;
using engine::TransferOutcome;
using engine::TransferRequest;
using engine::TransferResult;
using engine::TransferSink;
using models::Download;
using models::DownloadBlock;
using models::DownloadError;

namespace {

TransferResult completed() {
    TransferResult result;
    result.outcome = TransferOutcome::Completed;
    return result;
}

TransferResult interrupted() {
    TransferResult result;
    result.outcome = TransferOutcome::Interrupted;
    return result;
}

TransferResult failed(DownloadError error, std::string message) {
    TransferResult result;
    result.outcome = TransferOutcome::Failed;
    result.error = error;
    result.message = std::move(message);
    return result;
}

cpr::Header makeHeader(const models::Headers& headers) {
    cpr::Header header;
    for (const auto& [key, value] : headers) {
        header[key] = value;
    }
    return header;
}

/**
 * Status code of the last "HTTP/x y" line (redirects send several)
 */
int parseStatusLine(const std::string& line) {
    if (line.compare(0, 5, "HTTP/") != 0) {
        return 0;
    }
    auto space = line.find(' ');
    if (space == std::string::npos) {
        return 0;
    }
    try {
        return std::stoi(line.substr(space + 1, 3));
    } catch (const std::exception&) {
        return 0;
    }
}

char lowerAscii(char c) {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

} // namespace

bool HttpTransport::acceptsByteRanges(std::string acceptRanges) {
    std::transform(acceptRanges.begin(), acceptRanges.end(), acceptRanges.begin(), lowerAscii);
    return acceptRanges.find("bytes") != std::string::npos;
}

// -- HttpOptions --

HttpOptions HttpOptions::fromConfig(const core::Config& config) {
    HttpOptions options;
    options.timeoutMs = config.get<int>("transport.timeoutMs", options.timeoutMs);
    options.connectTimeoutMs = config.get<int>("transport.connectTimeoutMs", options.connectTimeoutMs);
    options.userAgent = config.get<std::string>("transport.userAgent", options.userAgent);
    options.segments = std::max(1, config.get<int>("transport.segments", options.segments));
    return options;
}

// -- Progress --

/**
 * Block state shared by the block requests of one transfer. Reports to the
 * sink are serialized here.
 */
class HttpTransport::Progress {
public:
    Progress(TransferSink& sink, int64_t total, std::vector<DownloadBlock> blocks)
        : m_sink(sink), m_total(total), m_blocks(std::move(blocks)) {
        for (const auto& block : m_blocks) {
            m_downloaded += block.downloadedBytes;
        }
    }

    DownloadBlock block(size_t index) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_blocks[index];
    }

    size_t blockCount() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_blocks.size();
    }

    void add(size_t index, int64_t bytes) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_blocks[index].downloadedBytes += bytes;
        m_downloaded += bytes;
        m_sink.onProgress(m_downloaded, m_total, m_blocks);
    }

    void started() {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_sink.onStarted(m_total, m_blocks);
        m_sink.onProgress(m_downloaded, m_total, m_blocks);
    }

    /**
     * Final report; an open-ended block is closed at what was received
     */
    void finish() {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (auto& block : m_blocks) {
            if (block.endByte < 0) {
                block.endByte = block.startByte + block.downloadedBytes;
            }
        }
        m_sink.onProgress(m_downloaded, m_total, m_blocks);
    }

    int64_t downloaded() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_downloaded;
    }

    int64_t total() const { return m_total; }

private:
    TransferSink& m_sink;
    const int64_t m_total;

    mutable std::mutex m_mutex;
    std::vector<DownloadBlock> m_blocks;
    int64_t m_downloaded{0};
};

// -- HttpTransport --

HttpTransport::HttpTransport(HttpOptions options)
    : m_options(std::move(options)) {
    m_options.segments = std::max(1, m_options.segments);
}

std::vector<DownloadBlock> HttpTransport::splitBlocks(int downloadId, int64_t total, int count) {
    std::vector<DownloadBlock> blocks;
    if (total <= 0 || count < 1) {
        return blocks;
    }

    const int64_t size = total / count;
    for (int i = 0; i < count; ++i) {
        DownloadBlock block;
        block.downloadId = downloadId;
        block.blockPosition = i;
        block.startByte = size * i;
        block.endByte = (i == count - 1) ? total : size * (i + 1);
        blocks.push_back(block);
    }
    return blocks;
}

int64_t HttpTransport::fetchContentLength(const models::Request& request) {
    cpr::Response response = cpr::Head(
        cpr::Url{request.url},
        makeHeader(request.headers),
        cpr::Timeout{m_options.timeoutMs},
        cpr::ConnectTimeout{m_options.connectTimeoutMs},
        cpr::UserAgent{m_options.userAgent}
    );

    if (response.error.code != cpr::ErrorCode::OK) {
        LOG_DEBUG("HEAD {} failed: {}", request.url, response.error.message);
        return -1;
    }
    if (response.status_code < 200 || response.status_code >= 300) {
        LOG_DEBUG("HEAD {} returned HTTP {}", request.url, response.status_code);
        return -1;
    }

    auto it = response.header.find("Content-Length");
    if (it == response.header.end()) {
        return -1;
    }
    try {
        return std::stoll(it->second);
    } catch (const std::exception&) {
        return -1;
    }
}

HttpTransport::RemoteInfo HttpTransport::queryRemote(const Download& download) const {
    RemoteInfo result;

    cpr::Response response = cpr::Head(
        cpr::Url{download.url},
        makeHeader(download.headers),
        cpr::Timeout{m_options.timeoutMs},
        cpr::ConnectTimeout{m_options.connectTimeoutMs},
        cpr::UserAgent{m_options.userAgent}
    );

    // Some servers refuse HEAD; the GET decides in that case
    if (response.error.code != cpr::ErrorCode::OK) {
        LOG_DEBUG("HEAD {} failed: {}", download.url, response.error.message);
        return result;
    }

    result.reachable = true;
    result.statusCode = static_cast<int>(response.status_code);
    if (result.statusCode < 200 || result.statusCode >= 300) {
        return result;
    }

    auto length = response.header.find("Content-Length");
    if (length != response.header.end()) {
        try {
            result.contentLength = std::stoll(length->second);
        } catch (const std::exception&) {
            result.contentLength = -1;
        }
    }

    auto ranges = response.header.find("Accept-Ranges");
    result.acceptsRanges = ranges != response.header.end() && acceptsByteRanges(ranges->second);
    return result;
}

std::vector<DownloadBlock> HttpTransport::planBlocks(const TransferRequest& request,
                                                     const RemoteInfo& remote,
                                                     int64_t fileSize) const {
    const Download& download = request.download;
    const int64_t total = remote.contentLength > 0 ? remote.contentLength : -1;
    const bool canResume = remote.acceptsRanges && total > 0 && download.total == total && fileSize > 0;

    // Persisted layout still valid: resume every block where it stopped
    if (canResume && !request.blocks.empty() && request.blocks.back().endByte == total) {
        bool contiguous = request.blocks.front().startByte == 0;
        for (size_t i = 1; contiguous && i < request.blocks.size(); ++i) {
            contiguous = request.blocks[i].startByte == request.blocks[i - 1].endByte;
        }

        if (contiguous) {
            std::vector<DownloadBlock> blocks = request.blocks;
            for (auto& block : blocks) {
                int64_t onDisk = std::max<int64_t>(0, fileSize - block.startByte);
                block.downloadedBytes = std::clamp<int64_t>(block.downloadedBytes, 0,
                                                            std::min(block.length(), onDisk));
            }
            return blocks;
        }
    }

    if (canResume && download.downloaded > 0) {
        auto blocks = splitBlocks(download.id, total, 1);
        blocks.front().downloadedBytes = std::min(download.downloaded, fileSize);
        return blocks;
    }

    if (remote.acceptsRanges && total > 0 && m_options.segments > 1) {
        int64_t bySize = std::max<int64_t>(1, total / std::max<int64_t>(1, m_options.minSegmentBytes));
        int count = static_cast<int>(std::min<int64_t>(m_options.segments, bySize));
        if (count > 1) {
            return splitBlocks(download.id, total, count);
        }
    }

    DownloadBlock block;
    block.downloadId = download.id;
    block.endByte = total > 0 ? total : -1;
    return {block};
}

TransferResult HttpTransport::execute(const TransferRequest& request,
                                      TransferSink& sink,
                                      const TransferControl& control) {
    const Download& download = request.download;

    std::filesystem::path target(download.file);
    if (target.has_parent_path() && !utils::FileUtils::createDirectories(target.parent_path())) {
        return failed(DownloadError::WriteFailed, "cannot create directory " + target.parent_path().string());
    }

    RemoteInfo info = queryRemote(download);
    if (control.isInterrupted()) {
        return interrupted();
    }

    int64_t fileSize = utils::FileUtils::getFileSize(target);
    std::vector<DownloadBlock> blocks = planBlocks(request, info, fileSize);

    int64_t alreadyOnDisk = 0;
    for (const auto& block : blocks) {
        alreadyOnDisk += block.downloadedBytes;
    }

    // Starting over: the file must not keep bytes from an earlier attempt
    if (alreadyOnDisk == 0 || fileSize < 0) {
        std::ofstream create(target, std::ios::binary | std::ios::trunc);
        if (!create.is_open()) {
            return failed(DownloadError::WriteFailed, "cannot open " + download.file);
        }
    }

    const bool ranged = info.acceptsRanges && info.contentLength > 0;
    Progress progress(sink, info.contentLength > 0 ? info.contentLength : -1, std::move(blocks));
    progress.started();

    LOG_DEBUG("Transfer of download {} starts at {} bytes in {} block(s)",
              download.id, progress.downloaded(), progress.blockCount());

    std::vector<TransferResult> results(progress.blockCount());
    if (results.size() == 1) {
        results[0] = fetchBlock(download, 0, ranged, progress, control);
    } else {
        std::vector<std::future<TransferResult>> pending;
        for (size_t i = 0; i < results.size(); ++i) {
            pending.push_back(std::async(std::launch::async, [this, &download, i, ranged, &progress, &control]() {
                return fetchBlock(download, i, ranged, progress, control);
            }));
        }
        for (size_t i = 0; i < pending.size(); ++i) {
            results[i] = pending[i].get();
        }
    }

    progress.finish();

    if (control.isInterrupted()) {
        return interrupted();
    }
    for (const auto& result : results) {
        if (result.outcome != TransferOutcome::Completed) {
            return result;
        }
    }

    if (progress.total() > 0 && progress.downloaded() != progress.total()) {
        return failed(DownloadError::ContentLengthMismatch,
                      "received " + std::to_string(progress.downloaded()) + " of " +
                      std::to_string(progress.total()) + " bytes");
    }
    return completed();
}

TransferResult HttpTransport::fetchBlock(const Download& download,
                                         size_t blockIndex,
                                         bool ranged,
                                         Progress& progress,
                                         const TransferControl& control) const {
    const DownloadBlock block = progress.block(blockIndex);
    const int64_t from = block.startByte + block.downloadedBytes;

    if (block.endByte >= 0 && from >= block.endByte) {
        return completed();
    }
    if (control.isInterrupted()) {
        return interrupted();
    }

    std::ofstream file(download.file, std::ios::in | std::ios::out | std::ios::binary);
    if (!file.is_open()) {
        return failed(DownloadError::WriteFailed, "cannot open " + download.file);
    }
    file.seekp(from);

    cpr::Header header = makeHeader(download.headers);
    if (ranged) {
        std::string range = "bytes=" + std::to_string(from) + "-";
        if (block.endByte > 0) {
            range += std::to_string(block.endByte - 1);
        }
        header["Range"] = range;
    }

    // 206 is the only acceptable answer once bytes are skipped
    auto acceptable = [from](int status) {
        return from > 0 ? status == 206 : (status >= 200 && status < 300);
    };

    int status = 0;
    cpr::cpr_off_t counted = 0;

    cpr::Response response = cpr::Download(
        file,
        cpr::Url{download.url},
        header,
        cpr::Timeout{m_options.timeoutMs},
        cpr::ConnectTimeout{m_options.connectTimeoutMs},
        cpr::UserAgent{m_options.userAgent},
        cpr::HeaderCallback([&](const auto& line, intptr_t /*userdata*/) -> bool {
            int parsed = parseStatusLine(std::string(line));
            if (parsed != 0) {
                status = parsed;
            }
            return true;
        }),
        cpr::ProgressCallback([&](cpr::cpr_off_t /*downloadTotal*/, cpr::cpr_off_t downloadNow,
                                  cpr::cpr_off_t /*uploadTotal*/, cpr::cpr_off_t /*uploadNow*/,
                                  intptr_t /*userdata*/) -> bool {
            if (control.isInterrupted()) {
                return false;
            }
            if (downloadNow > counted) {
                // Body of an error answer must not count as progress
                if (!acceptable(status)) {
                    return false;
                }
                progress.add(blockIndex, downloadNow - counted);
                counted = downloadNow;
            }
            return true;
        })
    );

    file.flush();
    const bool writeOk = static_cast<bool>(file);
    file.close();

    if (control.isInterrupted()) {
        return interrupted();
    }

    int code = status != 0 ? status : static_cast<int>(response.status_code);
    if (code != 0 && !acceptable(code)) {
        if (code == 200 && from > 0) {
            return failed(DownloadError::HttpError, "server ignored the range request for " + download.url);
        }
        return failed(DownloadError::HttpError, "HTTP " + std::to_string(code) + " for " + download.url);
    }

    if (response.error.code == cpr::ErrorCode::OPERATION_TIMEDOUT) {
        return failed(DownloadError::ConnectionTimedOut, response.error.message);
    }
    if (response.error.code != cpr::ErrorCode::OK) {
        return failed(DownloadError::RequestNotSuccessful, response.error.message);
    }
    if (!writeOk) {
        return failed(DownloadError::WriteFailed, "cannot write " + download.file);
    }

    Logger::instance().trace("Block {} of download {} done", block.blockPosition, download.id);
    return completed();
}

} // namespace downlink::transport
