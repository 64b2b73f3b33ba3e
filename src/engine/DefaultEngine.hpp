#pragma once

/**
 * DefaultEngine.hpp
 *
 * Process-wide default engine instance, built from a configuration set
 * once by the application.
 */

#include "DownloadEngine.hpp"
#include "EngineConfiguration.hpp"

#include <memory>
#include <optional>

namespace downlink::engine {

class DefaultEngine {
public:
    /**
     * Set the configuration used by getInstance(). An existing default
     * instance keeps running with its configuration until closed.
     */
    static void setConfiguration(const EngineConfiguration& configuration);

    static std::optional<EngineConfiguration> getConfiguration();

    /**
     * The default instance, created on first use and recreated after it
     * was closed
     * @throws core::EngineException GlobalConfigurationNotSet
     */
    static std::shared_ptr<DownloadEngine> getInstance();

    /**
     * A separate instance, never the default one
     */
    static std::shared_ptr<DownloadEngine> newInstance(const EngineConfiguration& configuration);

    /**
     * Close the default instance and forget the configuration
     */
    static void reset();

private:
    DefaultEngine() = delete;
};

} // namespace downlink::engine
