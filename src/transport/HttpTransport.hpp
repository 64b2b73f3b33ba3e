// Downlink - HTTP Transport
// Byte transfer over HTTP(S) using cpr

#pragma once

#include "../engine/Collaborators.hpp"
#include "../models/Models.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace downlink::core {
class Config;
}

namespace downlink::transport {

/**
 * @brief HTTP transport options
 */
struct HttpOptions {
    int timeoutMs{30000};
    int connectTimeoutMs{10000};
    std::string userAgent{"Downlink/1.0"};

    // Parallel ranged requests for one download (1 = single stream)
    int segments{1};

    // Smallest segment worth a separate request
    int64_t minSegmentBytes{1024 * 1024};

    /**
     * Read the transport.* keys of a configuration
     */
    static HttpOptions fromConfig(const core::Config& config);
};

/**
 * @brief Transport collaborator downloading with HTTP GET
 *
 * Resumes with Range requests when the server accepts byte ranges and the
 * file on disk still holds the bytes already counted. With segments > 1 and
 * a known length, the file is split into blocks fetched in parallel; each
 * block resumes on its own.
 */
class HttpTransport : public engine::Transport {
public:
    explicit HttpTransport(HttpOptions options = {});

    engine::TransferResult execute(const engine::TransferRequest& request,
                                   engine::TransferSink& sink,
                                   const engine::TransferControl& control) override;

    /**
     * HEAD request for the Content-Length
     * @return Length in bytes, -1 if the server does not tell
     */
    int64_t fetchContentLength(const models::Request& request) override;

    const HttpOptions& options() const { return m_options; }

    /**
     * Split a length into `count` contiguous blocks
     */
    static std::vector<models::DownloadBlock> splitBlocks(int downloadId, int64_t total, int count);

    /**
     * Whether an Accept-Ranges header value allows byte ranges
     */
    static bool acceptsByteRanges(std::string acceptRanges);

private:
    struct RemoteInfo {
        bool reachable{false};
        int statusCode{0};
        int64_t contentLength{-1};
        bool acceptsRanges{false};
    };

    class Progress;

    RemoteInfo queryRemote(const models::Download& download) const;

    std::vector<models::DownloadBlock> planBlocks(const engine::TransferRequest& request,
                                                  const RemoteInfo& remote,
                                                  int64_t fileSize) const;

    engine::TransferResult fetchBlock(const models::Download& download,
                                      size_t blockIndex,
                                      bool ranged,
                                      Progress& progress,
                                      const engine::TransferControl& control) const;

private:
    HttpOptions m_options;
};

} // namespace downlink::transport
