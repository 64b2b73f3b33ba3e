#pragma once

/**
 * CatalogStore.hpp
 *
 * In-memory table of the downloads of one namespace, written through to a
 * CatalogPersistence. Not thread-safe: callers hold the namespace mutex.
 */

#include "CatalogPersistence.hpp"
#include "../models/Models.hpp"

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace downlink::engine {

/**
 * How an incoming request lands in the catalog
 */
struct IntakePlan {
    enum class Kind {
        Insert,     // no collision, new row
        Replace,    // prior row is dropped, new row inserted
        Merge       // mutable fields merged into the existing row
    };

    Kind kind{Kind::Insert};

    // Row to insert (Insert/Replace) or the merged row (Merge)
    models::Download download;

    // Row being replaced (Replace only)
    std::optional<models::Download> replaced;
};

class CatalogStore {
public:
    /**
     * @param persistence Durable storage
     * @param nameSpace Namespace stamped on created rows
     */
    CatalogStore(std::unique_ptr<CatalogPersistence> persistence, std::string nameSpace);

    CatalogStore(const CatalogStore&) = delete;
    CatalogStore& operator=(const CatalogStore&) = delete;

    /**
     * Load the persisted rows. Rows left DOWNLOADING by a previous process
     * are put back to QUEUED.
     * @return Number of recovered rows
     */
    size_t open();

    const std::string& nameSpace() const { return m_nameSpace; }

    // Queries (copies)
    std::optional<models::Download> get(int id) const;
    std::vector<models::Download> get(const std::vector<int>& ids) const;
    std::vector<models::Download> getAll() const;
    std::vector<models::Download> getByGroup(int groupId) const;
    std::vector<models::Download> getByStatus(models::Status status) const;
    std::vector<models::Download> getByGroupAndStatus(int groupId, models::Status status) const;
    std::vector<models::Download> getByIdentifier(int64_t identifier) const;
    std::optional<models::Download> findByFile(const std::string& file) const;

    /**
     * Rows matching a predicate, in enqueue order
     */
    std::vector<models::Download> select(const std::function<bool(const models::Download&)>& predicate) const;

    /**
     * Live row, nullptr if absent. Valid until the next write.
     */
    const models::Download* find(int id) const;

    bool contains(int id) const { return m_rows.count(id) != 0; }
    size_t size() const { return m_rows.size(); }

    std::vector<models::DownloadBlock> getBlocks(int id) const;

    /**
     * Decide how a request enters the catalog according to its enqueue
     * action. Writes nothing.
     * @param request Incoming request
     * @param fileExists Tells whether a path is taken on disk
     * @throws core::EngineException InvalidRequest, DuplicateRequest
     */
    IntakePlan planIntake(const models::Request& request,
                          const std::function<bool(const std::string&)>& fileExists) const;

    /**
     * First "name (n).ext" variant of a file path that is neither catalogued
     * nor present on disk
     */
    std::string nextFreeFileName(const std::string& file,
                                 const std::function<bool(const std::string&)>& fileExists) const;

    /**
     * Copy the mutable request fields into a row. Id, url, file, status
     * and progress are left as they are.
     */
    static void mergeRequest(models::Download& download, const models::Request& request);

    uint64_t nextSequence() { return m_nextSequence++; }

    // Writes. Each persists first and changes memory only on success;
    // a persistence failure throws core::EngineException(StorageUnavailable).
    void insert(const models::Download& download);
    void update(const models::Download& download);
    void erase(int id);
    void putBlocks(int id, const std::vector<models::DownloadBlock>& blocks);

    /**
     * Change a row in memory only (progress between persisted reports)
     */
    void updateInMemory(const models::Download& download);

private:
    std::vector<models::Download> sorted(std::vector<models::Download> rows) const;

private:
    std::unique_ptr<CatalogPersistence> m_persistence;
    std::string m_nameSpace;

    std::map<int, models::Download> m_rows;
    std::map<int, std::vector<models::DownloadBlock>> m_blocks;

    uint64_t m_nextSequence{1};
};

} // namespace downlink::engine
