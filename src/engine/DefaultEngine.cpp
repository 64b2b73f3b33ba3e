/**
 * DefaultEngine.cpp
 *
 * Process-wide default configuration and engine instance.
 */

#include "DefaultEngine.hpp"
#include "../core/EngineException.hpp"
#include "../core/Logger.hpp"

#include <mutex>

namespace downlink::engine {

namespace {

struct DefaultState {
    std::mutex mutex;
    std::optional<EngineConfiguration> configuration;
    std::shared_ptr<DownloadEngine> instance;
};

DefaultState& state() {
    static DefaultState instance;
    return instance;
}

} // namespace

void DefaultEngine::setConfiguration(const EngineConfiguration& configuration) {
    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    s.configuration = configuration;
}

std::optional<EngineConfiguration> DefaultEngine::getConfiguration() {
    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    return s.configuration;
}

std::shared_ptr<DownloadEngine> DefaultEngine::getInstance() {
    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);

    if (!s.configuration) {
        throw core::EngineException(core::ErrorCode::GlobalConfigurationNotSet,
                                    "set a configuration before requesting the default engine");
    }

    if (!s.instance || s.instance->isClosed()) {
        s.instance = std::make_shared<DownloadEngine>(*s.configuration);
        LOG_DEBUG("Default engine created on namespace {}", s.configuration->nameSpace);
    }
    return s.instance;
}

std::shared_ptr<DownloadEngine> DefaultEngine::newInstance(const EngineConfiguration& configuration) {
    return std::make_shared<DownloadEngine>(configuration);
}

void DefaultEngine::reset() {
    std::shared_ptr<DownloadEngine> instance;
    {
        auto& s = state();
        std::lock_guard<std::mutex> lock(s.mutex);
        instance = std::move(s.instance);
        s.configuration.reset();
    }

    if (instance) {
        instance->close();
    }
}

} // namespace downlink::engine
