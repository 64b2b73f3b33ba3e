/**
 * Models.cpp
 *
 * Enum names, JSON conversion and request/download helpers.
 */

#include "Models.hpp"
#include "../utils/HashUtils.hpp"

#include <chrono>

namespace downlink::models {

//=============================================================================
// Enumerations
//=============================================================================

const char* toString(Status status) {
    switch (status) {
        case Status::None:        return "none";
        case Status::Queued:      return "queued";
        case Status::Downloading: return "downloading";
        case Status::Paused:      return "paused";
        case Status::Completed:   return "completed";
        case Status::Cancelled:   return "cancelled";
        case Status::Failed:      return "failed";
        case Status::Removed:     return "removed";
        case Status::Deleted:     return "deleted";
        case Status::Added:       return "added";
    }
    return "unknown";
}

const char* toString(Priority priority) {
    switch (priority) {
        case Priority::Low:    return "low";
        case Priority::Normal: return "normal";
        case Priority::High:   return "high";
    }
    return "unknown";
}

const char* toString(NetworkType type) {
    switch (type) {
        case NetworkType::GlobalOff: return "global_off";
        case NetworkType::All:       return "all";
        case NetworkType::WifiOnly:  return "wifi_only";
        case NetworkType::Unmetered: return "unmetered";
    }
    return "unknown";
}

const char* toString(EnqueueAction action) {
    switch (action) {
        case EnqueueAction::ReplaceExisting:        return "replace_existing";
        case EnqueueAction::IncrementFileName:      return "increment_file_name";
        case EnqueueAction::DoNotEnqueueIfExisting: return "do_not_enqueue_if_existing";
        case EnqueueAction::UpdateAccordingly:      return "update_accordingly";
    }
    return "unknown";
}

const char* toString(DownloadError error) {
    switch (error) {
        case DownloadError::None:                  return "none";
        case DownloadError::Unknown:               return "unknown";
        case DownloadError::ConnectionTimedOut:    return "connection_timed_out";
        case DownloadError::HttpError:             return "http_error";
        case DownloadError::NoNetworkConnection:   return "no_network_connection";
        case DownloadError::NoStorageSpace:        return "no_storage_space";
        case DownloadError::WriteFailed:           return "write_failed";
        case DownloadError::ContentLengthMismatch: return "content_length_mismatch";
        case DownloadError::ChecksumMismatch:      return "checksum_mismatch";
        case DownloadError::RequestNotSuccessful:  return "request_not_successful";
    }
    return "unknown";
}

std::optional<Status> parseStatus(const std::string& name) {
    for (int value = 0; value <= static_cast<int>(Status::Added); ++value) {
        auto status = static_cast<Status>(value);
        if (name == toString(status)) {
            return status;
        }
    }
    return std::nullopt;
}

std::optional<NetworkType> parseNetworkType(const std::string& name) {
    for (auto type : {NetworkType::GlobalOff, NetworkType::All,
                      NetworkType::WifiOnly, NetworkType::Unmetered}) {
        if (name == toString(type)) {
            return type;
        }
    }
    return std::nullopt;
}

int64_t nowMillis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

//=============================================================================
// Request
//=============================================================================

Request::Request(std::string url_, std::string file_)
    : id(makeId(url_, file_))
    , url(std::move(url_))
    , file(std::move(file_)) {}

int Request::makeId(const std::string& url, const std::string& file) {
    int id = utils::HashUtils::sha1Int31(url + '\n' + file);
    return id == 0 ? 1 : id;
}

json Request::toJson() const {
    return {
        {"id", id},
        {"url", url},
        {"file", file},
        {"groupId", groupId},
        {"priority", static_cast<int>(priority)},
        {"networkType", static_cast<int>(networkType)},
        {"tag", tag},
        {"identifier", identifier},
        {"enqueueAction", static_cast<int>(enqueueAction)},
        {"headers", headers},
        {"extras", extras},
        {"downloadOnEnqueue", downloadOnEnqueue},
        {"autoRetryMaxAttempts", autoRetryMaxAttempts},
        {"checksum", checksum}
    };
}

Request Request::fromJson(const json& j) {
    Request request(j.value("url", ""), j.value("file", ""));
    request.id = j.value("id", request.id);
    request.groupId = j.value("groupId", 0);
    request.priority = static_cast<Priority>(j.value("priority", 0));
    request.networkType = static_cast<NetworkType>(j.value("networkType", 0));
    request.tag = j.value("tag", "");
    request.identifier = j.value("identifier", int64_t(0));
    request.enqueueAction = static_cast<EnqueueAction>(
        j.value("enqueueAction", static_cast<int>(EnqueueAction::UpdateAccordingly)));
    request.headers = j.value("headers", Headers{});
    request.extras = j.value("extras", Extras{});
    request.downloadOnEnqueue = j.value("downloadOnEnqueue", true);
    request.autoRetryMaxAttempts = j.value("autoRetryMaxAttempts", 0);
    request.checksum = j.value("checksum", "");
    return request;
}

//=============================================================================
// Download
//=============================================================================

int Download::progress() const {
    if (total <= 0) {
        return status == Status::Completed ? 100 : -1;
    }
    if (downloaded >= total) {
        return 100;
    }
    return static_cast<int>((downloaded * 100) / total);
}

Request Download::toRequest() const {
    Request request(url, file);
    request.id = id;
    request.groupId = groupId;
    request.priority = priority;
    request.networkType = networkType;
    request.tag = tag;
    request.identifier = identifier;
    request.enqueueAction = enqueueAction;
    request.headers = headers;
    request.extras = extras;
    request.downloadOnEnqueue = downloadOnEnqueue;
    request.autoRetryMaxAttempts = autoRetryMaxAttempts;
    request.checksum = checksum;
    return request;
}

Download Download::fromRequest(const Request& request, const std::string& nameSpace) {
    Download download;
    download.id = request.id;
    download.nameSpace = nameSpace;
    download.url = request.url;
    download.file = request.file;
    download.groupId = request.groupId;
    download.priority = request.priority;
    download.networkType = request.networkType;
    download.tag = request.tag;
    download.identifier = request.identifier;
    download.enqueueAction = request.enqueueAction;
    download.headers = request.headers;
    download.extras = request.extras;
    download.downloadOnEnqueue = request.downloadOnEnqueue;
    download.checksum = request.checksum;
    download.autoRetryMaxAttempts = request.autoRetryMaxAttempts;
    download.created = nowMillis();
    return download;
}

json Download::toJson() const {
    return {
        {"id", id},
        {"namespace", nameSpace},
        {"url", url},
        {"file", file},
        {"groupId", groupId},
        {"priority", static_cast<int>(priority)},
        {"networkType", static_cast<int>(networkType)},
        {"tag", tag},
        {"identifier", identifier},
        {"enqueueAction", static_cast<int>(enqueueAction)},
        {"headers", headers},
        {"extras", extras},
        {"downloadOnEnqueue", downloadOnEnqueue},
        {"checksum", checksum},
        {"status", static_cast<int>(status)},
        {"error", static_cast<int>(error)},
        {"downloaded", downloaded},
        {"total", total},
        {"created", created},
        {"sequence", sequence},
        {"autoRetryMaxAttempts", autoRetryMaxAttempts},
        {"autoRetryAttempts", autoRetryAttempts}
    };
}

Download Download::fromJson(const json& j) {
    Download download;
    download.id = j.value("id", 0);
    download.nameSpace = j.value("namespace", "");
    download.url = j.value("url", "");
    download.file = j.value("file", "");
    download.groupId = j.value("groupId", 0);
    download.priority = static_cast<Priority>(j.value("priority", 0));
    download.networkType = static_cast<NetworkType>(j.value("networkType", 0));
    download.tag = j.value("tag", "");
    download.identifier = j.value("identifier", int64_t(0));
    download.enqueueAction = static_cast<EnqueueAction>(
        j.value("enqueueAction", static_cast<int>(EnqueueAction::UpdateAccordingly)));
    download.headers = j.value("headers", Headers{});
    download.extras = j.value("extras", Extras{});
    download.downloadOnEnqueue = j.value("downloadOnEnqueue", true);
    download.checksum = j.value("checksum", "");
    download.status = static_cast<Status>(j.value("status", 0));
    download.error = static_cast<DownloadError>(j.value("error", 0));
    download.downloaded = j.value("downloaded", int64_t(0));
    download.total = j.value("total", int64_t(-1));
    download.created = j.value("created", int64_t(0));
    download.sequence = j.value("sequence", uint64_t(0));
    download.autoRetryMaxAttempts = j.value("autoRetryMaxAttempts", 0);
    download.autoRetryAttempts = j.value("autoRetryAttempts", 0);
    return download;
}

//=============================================================================
// DownloadBlock
//=============================================================================

int DownloadBlock::progress() const {
    int64_t size = length();
    if (size <= 0) {
        return -1;
    }
    if (downloadedBytes >= size) {
        return 100;
    }
    return static_cast<int>((downloadedBytes * 100) / size);
}

json DownloadBlock::toJson() const {
    return {
        {"downloadId", downloadId},
        {"blockPosition", blockPosition},
        {"startByte", startByte},
        {"endByte", endByte},
        {"downloadedBytes", downloadedBytes}
    };
}

DownloadBlock DownloadBlock::fromJson(const json& j) {
    DownloadBlock block;
    block.downloadId = j.value("downloadId", 0);
    block.blockPosition = j.value("blockPosition", 0);
    block.startByte = j.value("startByte", int64_t(0));
    block.endByte = j.value("endByte", int64_t(0));
    block.downloadedBytes = j.value("downloadedBytes", int64_t(0));
    return block;
}

} // namespace downlink::models
