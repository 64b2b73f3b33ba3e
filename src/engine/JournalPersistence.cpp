/**
 * JournalPersistence.cpp
 *
 * JSON-lines journal for the download catalog.
 */

#include "JournalPersistence.hpp"
#include "../core/EngineException.hpp"
#include "../core/Logger.hpp"

#include <cctype>
#include <string>

namespace downlink::engine {

using json = nlohmann::json;
using core::EngineException;
using core::ErrorCode;
using models::Download;
using models::DownloadBlock;

namespace {

json blocksToJson(const std::vector<DownloadBlock>& blocks) {
    json array = json::array();
    for (const auto& block : blocks) {
        array.push_back(block.toJson());
    }
    return array;
}

} // namespace

JournalPersistence::JournalPersistence(std::filesystem::path directory,
                                       const std::string& nameSpace,
                                       size_t compactThreshold)
    : m_directory(std::move(directory))
    , m_path(m_directory / fileNameFor(nameSpace))
    , m_compactThreshold(compactThreshold) {
}

JournalPersistence::~JournalPersistence() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_out.is_open()) {
        m_out.flush();
        m_out.close();
    }
}

std::string JournalPersistence::fileNameFor(const std::string& nameSpace) {
    std::string name;
    name.reserve(nameSpace.size());
    for (char c : nameSpace) {
        unsigned char uc = static_cast<unsigned char>(c);
        name += (std::isalnum(uc) || c == '.' || c == '-' || c == '_') ? c : '_';
    }
    if (name.empty()) {
        name = "_";
    }
    return name + ".journal";
}

CatalogSnapshot JournalPersistence::load() {
    std::lock_guard<std::mutex> lock(m_mutex);

    m_rows.clear();
    m_blocks.clear();

    std::error_code ec;
    std::filesystem::create_directories(m_directory, ec);
    if (ec) {
        throw EngineException(ErrorCode::StorageUnavailable,
            "cannot create catalog directory " + m_directory.string() + ": " + ec.message());
    }

    if (std::filesystem::exists(m_path)) {
        std::ifstream in(m_path);
        if (!in.is_open()) {
            throw EngineException(ErrorCode::StorageUnavailable,
                "cannot read journal " + m_path.string());
        }

        std::string line;
        size_t lineNumber = 0;
        size_t skipped = 0;
        while (std::getline(in, line)) {
            ++lineNumber;
            if (line.empty()) continue;

            try {
                apply(json::parse(line));
            } catch (const json::exception& e) {
                ++skipped;
                LOG_WARN("Skipping unreadable journal line {} in {}: {}",
                         lineNumber, m_path.string(), e.what());
            }
        }

        LOG_DEBUG("Loaded {} downloads from {} ({} lines skipped)",
                  m_rows.size(), m_path.string(), skipped);
    }

    compact();
    m_loaded = true;

    CatalogSnapshot snapshot;
    snapshot.downloads.reserve(m_rows.size());
    for (const auto& [id, download] : m_rows) {
        snapshot.downloads.push_back(download);
    }
    snapshot.blocks = m_blocks;
    return snapshot;
}

void JournalPersistence::putDownload(const Download& download) {
    std::lock_guard<std::mutex> lock(m_mutex);

    append({{"op", "put"}, {"download", download.toJson()}});
    m_rows[download.id] = download;
}

void JournalPersistence::eraseDownload(int id) {
    std::lock_guard<std::mutex> lock(m_mutex);

    append({{"op", "erase"}, {"id", id}});
    m_rows.erase(id);
    m_blocks.erase(id);
}

void JournalPersistence::putBlocks(int downloadId, const std::vector<DownloadBlock>& blocks) {
    std::lock_guard<std::mutex> lock(m_mutex);

    append({{"op", "blocks"}, {"id", downloadId}, {"blocks", blocksToJson(blocks)}});
    m_blocks[downloadId] = blocks;
}

void JournalPersistence::apply(const json& entry) {
    const std::string op = entry.at("op").get<std::string>();

    if (op == "put") {
        Download download = Download::fromJson(entry.at("download"));
        m_rows[download.id] = download;
    } else if (op == "erase") {
        int id = entry.at("id").get<int>();
        m_rows.erase(id);
        m_blocks.erase(id);
    } else if (op == "blocks") {
        int id = entry.at("id").get<int>();
        std::vector<DownloadBlock> blocks;
        for (const auto& b : entry.at("blocks")) {
            blocks.push_back(DownloadBlock::fromJson(b));
        }
        m_blocks[id] = std::move(blocks);
    } else {
        LOG_WARN("Unknown journal operation '{}'", op);
    }
}

void JournalPersistence::append(const json& entry) {
    if (!m_loaded) {
        throw EngineException(ErrorCode::StorageUnavailable,
            "journal " + m_path.string() + " written before load");
    }

    if (!m_out.is_open()) {
        openForAppend();
    }

    m_out << entry.dump() << '\n';
    m_out.flush();

    if (!m_out.good()) {
        m_out.close();
        throw EngineException(ErrorCode::StorageUnavailable,
            "cannot append to journal " + m_path.string());
    }

    if (++m_appendedLines >= m_compactThreshold && m_compactThreshold > 0) {
        try {
            compact();
        } catch (const EngineException& e) {
            // The appended line is already durable; compaction retries later
            LOG_WARN("Journal compaction failed: {}", e.what());
        }
    }
}

void JournalPersistence::compact() {
    if (m_out.is_open()) {
        m_out.close();
    }

    auto tmpPath = m_path;
    tmpPath += ".tmp";

    {
        std::ofstream tmp(tmpPath, std::ios::trunc);
        if (!tmp.is_open()) {
            throw EngineException(ErrorCode::StorageUnavailable,
                "cannot write journal snapshot " + tmpPath.string());
        }

        for (const auto& [id, download] : m_rows) {
            tmp << json{{"op", "put"}, {"download", download.toJson()}}.dump() << '\n';
            auto it = m_blocks.find(id);
            if (it != m_blocks.end()) {
                tmp << json{{"op", "blocks"}, {"id", id}, {"blocks", blocksToJson(it->second)}}.dump() << '\n';
            }
        }

        tmp.flush();
        if (!tmp.good()) {
            throw EngineException(ErrorCode::StorageUnavailable,
                "cannot write journal snapshot " + tmpPath.string());
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmpPath, m_path, ec);
    if (ec) {
        throw EngineException(ErrorCode::StorageUnavailable,
            "cannot replace journal " + m_path.string() + ": " + ec.message());
    }

    m_appendedLines = 0;
    openForAppend();
}

void JournalPersistence::openForAppend() {
    m_out.open(m_path, std::ios::app);
    if (!m_out.is_open()) {
        throw EngineException(ErrorCode::StorageUnavailable,
            "cannot open journal " + m_path.string());
    }
}

} // namespace downlink::engine
