#pragma once

/**
 * JournalPersistence.hpp
 *
 * Catalog persistence as an append-only JSON-lines journal, one file per
 * namespace. Each change is one flushed line, so a crash loses at most the
 * line being written; an unreadable trailing line is skipped on load.
 * The journal is rewritten as a compact snapshot on load and whenever it
 * grows past the compaction threshold.
 */

#include "CatalogPersistence.hpp"

#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <map>
#include <mutex>

namespace downlink::engine {

class JournalPersistence : public CatalogPersistence {
public:
    /**
     * @param directory Directory holding the journals
     * @param nameSpace Namespace whose catalog this journal stores
     * @param compactThreshold Appended lines that trigger a compaction
     */
    JournalPersistence(std::filesystem::path directory,
                       const std::string& nameSpace,
                       size_t compactThreshold);
    ~JournalPersistence() override;

    JournalPersistence(const JournalPersistence&) = delete;
    JournalPersistence& operator=(const JournalPersistence&) = delete;

    CatalogSnapshot load() override;

    void putDownload(const models::Download& download) override;
    void eraseDownload(int id) override;
    void putBlocks(int downloadId, const std::vector<models::DownloadBlock>& blocks) override;

    const std::filesystem::path& path() const { return m_path; }

    /**
     * Journal file name for a namespace (unsafe characters replaced)
     */
    static std::string fileNameFor(const std::string& nameSpace);

private:
    void apply(const nlohmann::json& entry);
    void append(const nlohmann::json& entry);
    void compact();
    void openForAppend();

private:
    std::filesystem::path m_directory;
    std::filesystem::path m_path;
    size_t m_compactThreshold;

    std::map<int, models::Download> m_rows;
    std::map<int, std::vector<models::DownloadBlock>> m_blocks;

    std::ofstream m_out;
    size_t m_appendedLines{0};
    bool m_loaded{false};

    std::mutex m_mutex;
};

} // namespace downlink::engine
