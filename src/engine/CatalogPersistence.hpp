#pragma once

/**
 * CatalogPersistence.hpp
 *
 * Durable storage for download rows and their blocks.
 * Every method either commits the whole change or throws
 * core::EngineException(StorageUnavailable).
 */

#include "../models/Models.hpp"

#include <map>
#include <memory>
#include <string>
#include <vector>
#include <functional>

namespace downlink::engine {

struct CatalogSnapshot {
    std::vector<models::Download> downloads;
    std::map<int, std::vector<models::DownloadBlock>> blocks;
};

class CatalogPersistence {
public:
    virtual ~CatalogPersistence() = default;

    virtual CatalogSnapshot load() = 0;

    virtual void putDownload(const models::Download& download) = 0;
    virtual void eraseDownload(int id) = 0;
    virtual void putBlocks(int downloadId, const std::vector<models::DownloadBlock>& blocks) = 0;
};

/**
 * Creates the persistence of a namespace
 */
using PersistenceFactory = std::function<std::unique_ptr<CatalogPersistence>(const std::string& nameSpace)>;

} // namespace downlink::engine
