// Downlink - Data Models
// Requests, downloads and their persisted blocks

#pragma once

#include <string>
#include <vector>
#include <map>
#include <cstdint>
#include <optional>
#include <nlohmann/json.hpp>

namespace downlink::models {

using json = nlohmann::json;

using Headers = std::map<std::string, std::string>;
using Extras = std::map<std::string, std::string>;

//=============================================================================
// Enumerations
//=============================================================================

/**
 * Download lifecycle status. Numeric values are persisted.
 */
enum class Status {
    None = 0,
    Queued = 1,
    Downloading = 2,
    Paused = 3,
    Completed = 4,
    Cancelled = 5,
    Failed = 6,
    Removed = 7,
    Deleted = 8,
    Added = 9
};

enum class Priority {
    Low = -1,
    Normal = 0,
    High = 1
};

/**
 * Network requirement. GlobalOff is only meaningful as the engine-wide
 * override and means "no override".
 */
enum class NetworkType {
    GlobalOff = -1,
    All = 0,
    WifiOnly = 1,
    Unmetered = 2
};

/**
 * Resolution of a destination-file collision at enqueue time
 */
enum class EnqueueAction {
    ReplaceExisting = 0,
    IncrementFileName = 1,
    DoNotEnqueueIfExisting = 2,
    UpdateAccordingly = 3
};

/**
 * Error recorded on a download by its transfer
 */
enum class DownloadError {
    None = 0,
    Unknown,
    ConnectionTimedOut,
    HttpError,
    NoNetworkConnection,
    NoStorageSpace,
    WriteFailed,
    ContentLengthMismatch,
    ChecksumMismatch,
    RequestNotSuccessful
};

const char* toString(Status status);
const char* toString(Priority priority);
const char* toString(NetworkType type);
const char* toString(EnqueueAction action);
const char* toString(DownloadError error);

std::optional<Status> parseStatus(const std::string& name);
std::optional<NetworkType> parseNetworkType(const std::string& name);

//=============================================================================
// Request
//=============================================================================

struct Request {
    int id{0};
    std::string url;
    std::string file;
    int groupId{0};
    Priority priority{Priority::Normal};
    NetworkType networkType{NetworkType::All};
    std::string tag;
    int64_t identifier{0};
    EnqueueAction enqueueAction{EnqueueAction::UpdateAccordingly};
    Headers headers;
    Extras extras;
    bool downloadOnEnqueue{true};
    int autoRetryMaxAttempts{0};

    // Expected SHA1 of the finished file (optional, lowercase hex)
    std::string checksum;

    Request() = default;

    /**
     * Constructor with URL and destination; derives the id
     */
    Request(std::string url_, std::string file_);

    /**
     * Stable id for a url/file pair, identical across processes
     */
    static int makeId(const std::string& url, const std::string& file);

    json toJson() const;
    static Request fromJson(const json& j);
};

//=============================================================================
// Download
//=============================================================================

struct Download {
    int id{0};
    std::string nameSpace;
    std::string url;
    std::string file;
    int groupId{0};
    Priority priority{Priority::Normal};
    NetworkType networkType{NetworkType::All};
    std::string tag;
    int64_t identifier{0};
    EnqueueAction enqueueAction{EnqueueAction::UpdateAccordingly};
    Headers headers;
    Extras extras;
    bool downloadOnEnqueue{true};
    std::string checksum;

    Status status{Status::None};
    DownloadError error{DownloadError::None};
    int64_t downloaded{0};
    int64_t total{-1};

    // Milliseconds since epoch
    int64_t created{0};

    // Enqueue order, FIFO key inside one priority
    uint64_t sequence{0};

    int autoRetryMaxAttempts{0};
    int autoRetryAttempts{0};

    /**
     * Progress in percent, -1 when the total is unknown
     */
    int progress() const;

    Request toRequest() const;

    /**
     * Build a fresh row (status None, no progress) from a request
     */
    static Download fromRequest(const Request& request, const std::string& nameSpace);

    json toJson() const;
    static Download fromJson(const json& j);
};

//=============================================================================
// DownloadBlock
//=============================================================================

struct DownloadBlock {
    int downloadId{0};
    int blockPosition{0};
    int64_t startByte{0};
    int64_t endByte{0};
    int64_t downloadedBytes{0};

    int64_t length() const { return endByte - startByte; }
    int progress() const;

    json toJson() const;
    static DownloadBlock fromJson(const json& j);
};

//=============================================================================
// CompletedDownload
//=============================================================================

struct CompletedDownload {
    std::string url;
    std::string file;
    int groupId{0};
    int64_t fileByteSize{0};
    int64_t identifier{0};
    Headers headers;
    std::string tag;
    Extras extras;

    // Milliseconds since epoch, 0 = now
    int64_t created{0};
};

int64_t nowMillis();

} // namespace downlink::models
