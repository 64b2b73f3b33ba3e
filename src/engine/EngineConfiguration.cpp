/**
 * EngineConfiguration.cpp
 *
 * Engine settings read from the configuration file.
 */

#include "EngineConfiguration.hpp"
#include "JournalPersistence.hpp"
#include "../core/Config.hpp"
#include "../core/Logger.hpp"
#include "../utils/FileUtils.hpp"
#include "../utils/PathUtils.hpp"
#include "../utils/SysfsConnectivity.hpp"

namespace downlink::engine {

EngineConfiguration EngineConfiguration::fromConfig(const core::Config& config) {
    EngineConfiguration result;

    result.nameSpace = config.get<std::string>("engine.namespace", result.nameSpace);
    result.downloadConcurrentLimit = config.get<int>("engine.concurrentLimit", result.downloadConcurrentLimit);

    std::string networkType = config.get<std::string>("engine.globalNetworkType", "global_off");
    if (auto parsed = models::parseNetworkType(networkType)) {
        result.globalNetworkType = *parsed;
    } else {
        LOG_WARN("Unknown network type '{}' in configuration, using global_off", networkType);
    }

    result.progressReportingIntervalMs = config.get<int64_t>("engine.progressReportingIntervalMs",
                                                             result.progressReportingIntervalMs);
    result.networkCheckIntervalMs = config.get<int64_t>("engine.networkCheckIntervalMs",
                                                        result.networkCheckIntervalMs);
    result.autoRetryMaxAttempts = config.get<int>("engine.autoRetryMaxAttempts", result.autoRetryMaxAttempts);
    result.catalogDirectory = config.get<std::string>("engine.catalogDirectory", result.catalogDirectory);
    result.compactThreshold = config.get<size_t>("engine.compactThreshold", result.compactThreshold);
    result.loggingEnabled = config.get<bool>("logging.enabled", result.loggingEnabled);

    return result;
}

EngineConfiguration EngineConfiguration::withDefaults() const {
    EngineConfiguration result = *this;

    if (!result.connectivity) {
        result.connectivity = std::make_shared<utils::SysfsConnectivity>();
    }
    if (!result.fileSystem) {
        result.fileSystem = std::make_shared<utils::LocalFileSystem>();
    }
    if (!result.persistenceFactory) {
        std::filesystem::path directory = result.catalogDirectory.empty()
            ? utils::PathUtils::getCatalogPath()
            : std::filesystem::path(result.catalogDirectory);
        size_t threshold = result.compactThreshold;

        result.persistenceFactory = [directory, threshold](const std::string& nameSpace) {
            return std::unique_ptr<CatalogPersistence>(
                std::make_unique<JournalPersistence>(directory, nameSpace, threshold));
        };
    }

    return result;
}

} // namespace downlink::engine
