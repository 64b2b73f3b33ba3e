/**
 * CatalogStore.cpp
 *
 * Query layer and write-through for the download catalog.
 */

#include "CatalogStore.hpp"
#include "../core/EngineException.hpp"
#include "../core/Logger.hpp"

#include <algorithm>
#include <filesystem>

namespace downlink::engine {

using core::EngineException;
using core::ErrorCode;
using models::Download;
using models::DownloadBlock;
using models::EnqueueAction;
using models::Request;
using models::Status;

CatalogStore::CatalogStore(std::unique_ptr<CatalogPersistence> persistence, std::string nameSpace)
    : m_persistence(std::move(persistence))
    , m_nameSpace(std::move(nameSpace)) {
}

size_t CatalogStore::open() {
    CatalogSnapshot snapshot = m_persistence->load();

    m_rows.clear();
    m_blocks.clear();
    m_nextSequence = 1;

    size_t recovered = 0;
    for (auto& download : snapshot.downloads) {
        if (download.status == Status::Downloading) {
            download.status = Status::Queued;
            m_persistence->putDownload(download);
            ++recovered;
        }

        m_nextSequence = std::max(m_nextSequence, download.sequence + 1);
        m_rows[download.id] = std::move(download);
    }

    for (auto& [id, blocks] : snapshot.blocks) {
        if (m_rows.count(id)) {
            m_blocks[id] = std::move(blocks);
        }
    }

    if (recovered > 0) {
        LOG_INFO("Namespace {}: {} interrupted downloads requeued", m_nameSpace, recovered);
    }
    LOG_DEBUG("Namespace {}: catalog opened with {} downloads", m_nameSpace, m_rows.size());

    return recovered;
}

std::optional<Download> CatalogStore::get(int id) const {
    auto it = m_rows.find(id);
    if (it == m_rows.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<Download> CatalogStore::get(const std::vector<int>& ids) const {
    std::vector<Download> result;
    result.reserve(ids.size());

    for (int id : ids) {
        auto it = m_rows.find(id);
        if (it != m_rows.end()) {
            result.push_back(it->second);
        }
    }
    return result;
}

std::vector<Download> CatalogStore::getAll() const {
    return select([](const Download&) { return true; });
}

std::vector<Download> CatalogStore::getByGroup(int groupId) const {
    return select([groupId](const Download& d) { return d.groupId == groupId; });
}

std::vector<Download> CatalogStore::getByStatus(Status status) const {
    return select([status](const Download& d) { return d.status == status; });
}

std::vector<Download> CatalogStore::getByGroupAndStatus(int groupId, Status status) const {
    return select([groupId, status](const Download& d) {
        return d.groupId == groupId && d.status == status;
    });
}

std::vector<Download> CatalogStore::getByIdentifier(int64_t identifier) const {
    return select([identifier](const Download& d) { return d.identifier == identifier; });
}

std::optional<Download> CatalogStore::findByFile(const std::string& file) const {
    for (const auto& [id, download] : m_rows) {
        if (download.file == file) {
            return download;
        }
    }
    return std::nullopt;
}

std::vector<Download> CatalogStore::select(const std::function<bool(const Download&)>& predicate) const {
    std::vector<Download> rows;
    for (const auto& [id, download] : m_rows) {
        if (predicate(download)) {
            rows.push_back(download);
        }
    }
    return sorted(std::move(rows));
}

const Download* CatalogStore::find(int id) const {
    auto it = m_rows.find(id);
    return it == m_rows.end() ? nullptr : &it->second;
}

std::vector<DownloadBlock> CatalogStore::getBlocks(int id) const {
    auto it = m_blocks.find(id);
    if (it == m_blocks.end()) {
        return {};
    }
    return it->second;
}

IntakePlan CatalogStore::planIntake(const Request& request,
                                    const std::function<bool(const std::string&)>& fileExists) const {
    if (request.url.empty() || request.file.empty()) {
        throw EngineException(ErrorCode::InvalidRequest, "request needs both a url and a file");
    }

    IntakePlan plan;
    plan.download = Download::fromRequest(request, m_nameSpace);
    if (plan.download.id == 0) {
        plan.download.id = Request::makeId(request.url, request.file);
    }

    std::optional<Download> existing = get(plan.download.id);
    if (!existing) {
        existing = findByFile(request.file);
    }

    if (!existing) {
        plan.kind = IntakePlan::Kind::Insert;
        return plan;
    }

    switch (request.enqueueAction) {
        case EnqueueAction::ReplaceExisting:
            plan.kind = IntakePlan::Kind::Replace;
            plan.replaced = existing;
            break;

        case EnqueueAction::DoNotEnqueueIfExisting:
            throw EngineException(ErrorCode::DuplicateRequest,
                "a download for " + existing->file + " already exists (id " +
                std::to_string(existing->id) + ")");

        case EnqueueAction::IncrementFileName: {
            std::string file = nextFreeFileName(request.file, fileExists);
            plan.kind = IntakePlan::Kind::Insert;
            plan.download.file = file;
            plan.download.id = Request::makeId(request.url, file);
            if (contains(plan.download.id)) {
                throw EngineException(ErrorCode::DuplicateRequest,
                    "id " + std::to_string(plan.download.id) + " is already catalogued");
            }
            break;
        }

        case EnqueueAction::UpdateAccordingly:
            plan.kind = IntakePlan::Kind::Merge;
            plan.download = *existing;
            mergeRequest(plan.download, request);
            break;
    }

    return plan;
}

std::string CatalogStore::nextFreeFileName(const std::string& file,
                                           const std::function<bool(const std::string&)>& fileExists) const {
    std::filesystem::path path(file);
    std::string stem = path.stem().string();
    std::string extension = path.extension().string();
    std::filesystem::path parent = path.parent_path();

    for (int n = 1;; ++n) {
        std::string candidate = (parent / (stem + " (" + std::to_string(n) + ")" + extension)).string();
        if (!findByFile(candidate) && !(fileExists && fileExists(candidate))) {
            return candidate;
        }
    }
}

void CatalogStore::mergeRequest(Download& download, const Request& request) {
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
}

void CatalogStore::insert(const Download& download) {
    m_persistence->putDownload(download);
    m_rows[download.id] = download;
}

void CatalogStore::update(const Download& download) {
    m_persistence->putDownload(download);
    m_rows[download.id] = download;
}

void CatalogStore::erase(int id) {
    m_persistence->eraseDownload(id);
    m_rows.erase(id);
    m_blocks.erase(id);
}

void CatalogStore::putBlocks(int id, const std::vector<DownloadBlock>& blocks) {
    m_persistence->putBlocks(id, blocks);
    m_blocks[id] = blocks;
}

void CatalogStore::updateInMemory(const Download& download) {
    m_rows[download.id] = download;
}

std::vector<Download> CatalogStore::sorted(std::vector<Download> rows) const {
    std::sort(rows.begin(), rows.end(), [](const Download& a, const Download& b) {
        if (a.sequence != b.sequence) return a.sequence < b.sequence;
        return a.id < b.id;
    });
    return rows;
}

} // namespace downlink::engine
