#pragma once

/**
 * EngineConfiguration.hpp
 *
 * Settings and collaborators of an engine instance.
 */

#include "CatalogPersistence.hpp"
#include "Collaborators.hpp"
#include "../models/Models.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace downlink::core {
class Config;
}

namespace downlink::engine {

struct EngineConfiguration {
    std::string nameSpace{"downlink.default"};
    int downloadConcurrentLimit{1};

    // GlobalOff = each download's own network type applies
    models::NetworkType globalNetworkType{models::NetworkType::GlobalOff};

    int64_t progressReportingIntervalMs{2000};
    int64_t networkCheckIntervalMs{5000};

    // Retry limit for requests that set none
    int autoRetryMaxAttempts{0};

    // Journal directory, empty = the user data directory
    std::string catalogDirectory;
    size_t compactThreshold{1000};

    bool loggingEnabled{true};

    // Collaborators. A missing connectivity, file system or persistence
    // is replaced by the local default; a transport is required.
    std::shared_ptr<Transport> transport;
    std::shared_ptr<Connectivity> connectivity;
    std::shared_ptr<FileSystem> fileSystem;
    PersistenceFactory persistenceFactory;

    /**
     * Read the engine.* keys of a configuration. Collaborators stay unset.
     */
    static EngineConfiguration fromConfig(const core::Config& config);

    /**
     * Copy with the local default collaborators filled in
     */
    EngineConfiguration withDefaults() const;
};

} // namespace downlink::engine
