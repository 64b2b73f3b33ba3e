/**
 * NetworkGate.cpp
 *
 * Network type checks against the connectivity collaborator.
 */

#include "NetworkGate.hpp"
#include "../core/Logger.hpp"

namespace downlink::engine {

using models::NetworkType;

NetworkGate::NetworkGate(std::shared_ptr<Connectivity> connectivity, NetworkType globalType)
    : m_connectivity(std::move(connectivity))
    , m_globalType(globalType) {
}

NetworkType NetworkGate::effectiveType(const models::Download& download) const {
    if (m_globalType != NetworkType::GlobalOff) {
        return m_globalType;
    }
    return download.networkType == NetworkType::GlobalOff ? NetworkType::All : download.networkType;
}

bool NetworkGate::isPermitted(const models::Download& download) const {
    if (!m_connectivity) {
        return true;
    }

    NetworkType type = effectiveType(download);
    try {
        return m_connectivity->isNetworkAvailable(type);
    } catch (const std::exception& e) {
        LOG_WARN("Connectivity check for {} failed: {}", models::toString(type), e.what());
        return false;
    }
}

} // namespace downlink::engine
