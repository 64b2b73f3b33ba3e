/**
 * ControlPlane.cpp
 */

#include "ControlPlane.hpp"
#include "../core/EngineException.hpp"
#include "../core/Logger.hpp"

#include <set>

namespace downlink::engine {

using core::EngineException;
using core::ErrorCode;
using models::CompletedDownload;
using models::Download;
using models::DownloadError;
using models::Request;
using models::Status;

ControlPlane::ControlPlane(CatalogStore& catalog,
                           StateMachine& stateMachine,
                           Scheduler& scheduler,
                           NetworkGate& gate,
                           ListenerCoordinator& listeners,
                           std::shared_ptr<FileSystem> fileSystem,
                           int defaultAutoRetryMaxAttempts)
    : m_catalog(catalog)
    , m_stateMachine(stateMachine)
    , m_scheduler(scheduler)
    , m_gate(gate)
    , m_listeners(listeners)
    , m_fileSystem(std::move(fileSystem))
    , m_defaultAutoRetryMaxAttempts(defaultAutoRetryMaxAttempts) {
}

std::vector<int> ControlPlane::idsOf(const std::vector<Download>& downloads) {
    std::vector<int> ids;
    ids.reserve(downloads.size());
    for (const auto& download : downloads) {
        ids.push_back(download.id);
    }
    return ids;
}

//=============================================================================
// Intake
//=============================================================================

Request ControlPlane::enqueue(const Request& request) {
    Request stored;
    try {
        stored = intake(request);
    } catch (const EngineException&) {
        m_scheduler.admit();
        throw;
    }

    m_scheduler.admit();
    return stored;
}

std::vector<Request> ControlPlane::enqueue(const std::vector<Request>& requests) {
    std::vector<Request> stored;
    stored.reserve(requests.size());

    try {
        for (const auto& request : requests) {
            try {
                stored.push_back(intake(request));
            } catch (const EngineException& e) {
                if (e.code() == ErrorCode::StorageUnavailable) {
                    throw;
                }
                LOG_WARN("Request for {} rejected: {}", request.file, e.what());
            }
        }
    } catch (const EngineException&) {
        m_scheduler.admit();
        throw;
    }

    m_scheduler.admit();
    return stored;
}

Request ControlPlane::intake(const Request& request) {
    IntakePlan plan = m_catalog.planIntake(request, [this](const std::string& path) {
        return fileExists(path);
    });

    Download& download = plan.download;

    if (plan.kind == IntakePlan::Kind::Merge) {
        m_catalog.update(download);
        m_scheduler.enqueue(download);
        LOG_DEBUG("Merged request into download {}", download.id);
        return download.toRequest();
    }

    if (plan.kind == IntakePlan::Kind::Replace) {
        dropForReplacement(*plan.replaced);
    }

    if (download.autoRetryMaxAttempts == 0) {
        download.autoRetryMaxAttempts = m_defaultAutoRetryMaxAttempts;
    }
    download.sequence = m_catalog.nextSequence();

    m_stateMachine.admitNew(download, download.downloadOnEnqueue);
    m_scheduler.enqueue(download);

    LOG_DEBUG("Enqueued download {}: {} -> {}", download.id, download.url, download.file);
    return download.toRequest();
}

void ControlPlane::dropForReplacement(const Download& existing) {
    Download row = existing;
    if (m_stateMachine.transition(row, Status::Removed)) {
        m_scheduler.interrupt(row.id);
    }
}

bool ControlPlane::fileExists(const std::string& path) const {
    if (!m_fileSystem) {
        return false;
    }

    try {
        return m_fileSystem->exists(path);
    } catch (const std::exception& e) {
        LOG_WARN("Cannot check {}: {}", path, e.what());
        return false;
    }
}

//=============================================================================
// Batch operations
//=============================================================================

std::vector<Download> ControlPlane::forEach(const std::vector<int>& ids, const RowAction& action) {
    std::vector<Download> affected;

    try {
        for (int id : ids) {
            auto row = m_catalog.get(id);
            if (!row) {
                continue;
            }
            if (action(*row)) {
                affected.push_back(*row);
            }
        }
    } catch (const EngineException&) {
        m_scheduler.admit();
        throw;
    }

    m_scheduler.admit();
    return affected;
}

std::vector<Download> ControlPlane::pause(const std::vector<int>& ids) {
    return forEach(ids, [this](Download& download) {
        if (download.status != Status::Queued && download.status != Status::Downloading) {
            return false;
        }
        if (!m_stateMachine.transition(download, Status::Paused)) {
            return false;
        }
        m_scheduler.interrupt(download.id);
        return true;
    });
}

std::vector<Download> ControlPlane::resume(const std::vector<int>& ids) {
    return forEach(ids, [this](Download& download) {
        if (download.status != Status::Paused && download.status != Status::Added) {
            return false;
        }
        if (!m_stateMachine.transition(download, Status::Queued)) {
            return false;
        }
        m_scheduler.clearNetworkWait(download.id);
        m_scheduler.enqueue(download);
        return true;
    });
}

std::vector<Download> ControlPlane::cancel(const std::vector<int>& ids) {
    return forEach(ids, [this](Download& download) {
        switch (download.status) {
            case Status::Added:
            case Status::Queued:
            case Status::Downloading:
            case Status::Paused:
                break;
            default:
                return false;
        }
        if (!m_stateMachine.transition(download, Status::Cancelled)) {
            return false;
        }
        m_scheduler.interrupt(download.id);
        return true;
    });
}

std::vector<Download> ControlPlane::retry(const std::vector<int>& ids) {
    return forEach(ids, [this](Download& download) {
        if (download.status != Status::Failed && download.status != Status::Cancelled) {
            return false;
        }
        download.autoRetryAttempts = 0;
        if (!m_stateMachine.transition(download, Status::Queued)) {
            return false;
        }
        m_scheduler.clearNetworkWait(download.id);
        m_scheduler.enqueue(download);
        return true;
    });
}

std::vector<Download> ControlPlane::remove(const std::vector<int>& ids) {
    return forEach(ids, [this](Download& download) {
        if (!m_stateMachine.transition(download, Status::Removed)) {
            return false;
        }
        m_scheduler.interrupt(download.id);
        return true;
    });
}

std::vector<Download> ControlPlane::deleteDownloads(const std::vector<int>& ids) {
    return forEach(ids, [this](Download& download) {
        if (!m_stateMachine.transition(download, Status::Deleted)) {
            return false;
        }
        m_scheduler.interrupt(download.id);

        auto fileSystem = m_fileSystem;
        const std::string file = download.file;
        const int id = download.id;
        m_scheduler.runAfterDrain(id, [fileSystem, file, id]() {
            if (fileSystem && !fileSystem->deleteFile(file)) {
                LOG_DEBUG("No file deleted for download {}: {}", id, file);
            }
        });
        return true;
    });
}

//=============================================================================
// Freeze, limit and network
//=============================================================================

bool ControlPlane::freeze() {
    m_scheduler.setFrozen(true);

    for (int id : m_scheduler.activeIds()) {
        auto row = m_catalog.get(id);
        if (!row) continue;

        try {
            if (m_stateMachine.transition(*row, Status::Paused)) {
                m_scheduler.interrupt(id);
                m_pausedByFreeze.insert(id);
            }
        } catch (const EngineException& e) {
            LOG_ERROR("Cannot pause download {} on freeze: {}", id, e.what());
        }
    }

    LOG_INFO("Namespace {} frozen", m_catalog.nameSpace());
    return m_scheduler.isFrozen();
}

bool ControlPlane::unfreeze() {
    m_scheduler.setFrozen(false);

    // Downloads paused by the freeze compete again as QUEUED, unless they
    // were resumed, cancelled or dropped in between
    std::set<int> paused;
    paused.swap(m_pausedByFreeze);
    for (int id : paused) {
        auto row = m_catalog.get(id);
        if (!row || row->status != Status::Paused) continue;

        try {
            if (m_stateMachine.transition(*row, Status::Queued)) {
                m_scheduler.enqueue(*row);
            }
        } catch (const EngineException& e) {
            LOG_ERROR("Cannot requeue download {} on unfreeze: {}", id, e.what());
        }
    }

    m_scheduler.admit();

    LOG_INFO("Namespace {} unfrozen", m_catalog.nameSpace());
    return !m_scheduler.isFrozen();
}

void ControlPlane::setConcurrentLimit(int limit) {
    if (limit < 0) {
        throw EngineException(ErrorCode::InvalidConcurrentLimit,
            "concurrent limit must not be negative, got " + std::to_string(limit));
    }

    m_scheduler.setConcurrentLimit(limit);
    LOG_INFO("Namespace {}: concurrent limit set to {}", m_catalog.nameSpace(), limit);
    m_scheduler.admit();
}

void ControlPlane::setGlobalNetworkType(models::NetworkType type) {
    m_gate.setGlobalNetworkType(type);
    LOG_INFO("Namespace {}: global network type set to {}", m_catalog.nameSpace(), models::toString(type));
    onNetworkCheck();
}

void ControlPlane::onNetworkCheck() {
    for (int id : m_scheduler.activeIds()) {
        auto row = m_catalog.get(id);
        if (!row || m_gate.isPermitted(*row)) continue;

        try {
            if (m_stateMachine.transition(*row, Status::Paused, DownloadError::NoNetworkConnection)) {
                m_scheduler.interrupt(id);
                LOG_INFO("Download {} paused: network {} unavailable", id,
                         models::toString(m_gate.effectiveType(*row)));
            }
        } catch (const EngineException& e) {
            LOG_ERROR("Cannot pause download {} after network loss: {}", id, e.what());
        }
    }

    for (auto& row : m_catalog.getByStatus(Status::Paused)) {
        if (row.error != DownloadError::NoNetworkConnection || !m_gate.isPermitted(row)) continue;

        try {
            if (m_stateMachine.transition(row, Status::Queued)) {
                m_scheduler.clearNetworkWait(row.id);
                m_scheduler.enqueue(row);
                LOG_INFO("Download {} requeued: network is back", row.id);
            }
        } catch (const EngineException& e) {
            LOG_ERROR("Cannot requeue download {}: {}", row.id, e.what());
        }
    }

    m_scheduler.admit();
}

//=============================================================================
// Request updates and adoption
//=============================================================================

std::optional<Download> ControlPlane::updateRequest(int id, const Request& request) {
    auto row = m_catalog.get(id);
    if (!row) {
        return std::nullopt;
    }

    if (request.url.empty() || request.file.empty()) {
        throw EngineException(ErrorCode::InvalidRequest, "request needs both a url and a file");
    }

    Download current = *row;

    if (request.url != current.url || request.file != current.file) {
        Request relocated = request;
        relocated.id = Request::makeId(request.url, request.file);

        auto byFile = m_catalog.findByFile(request.file);
        if ((relocated.id != id && m_catalog.contains(relocated.id)) || (byFile && byFile->id != id)) {
            throw EngineException(ErrorCode::DuplicateRequest,
                "another download already targets " + request.file);
        }

        Download fresh = Download::fromRequest(relocated, m_catalog.nameSpace());
        if (fresh.autoRetryMaxAttempts == 0) {
            fresh.autoRetryMaxAttempts = m_defaultAutoRetryMaxAttempts;
        }

        try {
            dropForReplacement(current);
            fresh.sequence = m_catalog.nextSequence();
            m_stateMachine.admitNew(fresh, fresh.downloadOnEnqueue);
        } catch (const EngineException&) {
            m_scheduler.admit();
            throw;
        }

        m_scheduler.enqueue(fresh);
        m_scheduler.admit();

        LOG_INFO("Download {} moved to {} as download {}", id, fresh.file, fresh.id);
        return fresh;
    }

    CatalogStore::mergeRequest(current, request);

    if (m_scheduler.isActive(id)) {
        // Restart so the transfer picks up the new headers
        m_stateMachine.transition(current, Status::Queued);
        m_scheduler.interrupt(id);
    } else {
        m_catalog.update(current);
    }

    m_scheduler.enqueue(current);
    m_scheduler.admit();
    return current;
}

Download ControlPlane::addCompletedDownload(const CompletedDownload& completed) {
    if (completed.url.empty() || completed.file.empty()) {
        throw EngineException(ErrorCode::InvalidRequest, "completed download needs both a url and a file");
    }

    Download download;
    download.id = Request::makeId(completed.url, completed.file);
    download.nameSpace = m_catalog.nameSpace();
    download.url = completed.url;
    download.file = completed.file;
    download.groupId = completed.groupId;
    download.identifier = completed.identifier;
    download.headers = completed.headers;
    download.tag = completed.tag;
    download.extras = completed.extras;
    download.status = Status::Completed;
    download.downloaded = completed.fileByteSize;
    download.total = completed.fileByteSize;
    download.created = completed.created != 0 ? completed.created : models::nowMillis();

    std::set<int> replaced;
    if (auto byId = m_catalog.get(download.id)) {
        replaced.insert(byId->id);
    }
    if (auto byFile = m_catalog.findByFile(download.file)) {
        replaced.insert(byFile->id);
    }

    try {
        for (int id : replaced) {
            if (auto row = m_catalog.get(id)) {
                dropForReplacement(*row);
            }
        }

        download.sequence = m_catalog.nextSequence();
        m_catalog.insert(download);
    } catch (const EngineException&) {
        m_scheduler.admit();
        throw;
    }

    m_listeners.dispatch("completed", [&](DownloadListener& l) { l.onCompleted(download); });
    LOG_INFO("Adopted completed download {}: {}", download.id, download.file);

    m_scheduler.admit();
    return download;
}

std::vector<Download> ControlPlane::addCompletedDownloads(const std::vector<CompletedDownload>& completed) {
    std::vector<Download> adopted;
    adopted.reserve(completed.size());

    for (const auto& entry : completed) {
        adopted.push_back(addCompletedDownload(entry));
    }
    return adopted;
}

} // namespace downlink::engine
