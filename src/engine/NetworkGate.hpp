#pragma once

/**
 * NetworkGate.hpp
 *
 * Decides whether a download may transfer on the network currently
 * available. The global override, when set, replaces each download's own
 * requirement during evaluation without changing the stored value.
 */

#include "Collaborators.hpp"
#include "../models/Models.hpp"

#include <memory>

namespace downlink::engine {

class NetworkGate {
public:
    /**
     * @param connectivity Availability provider (nullptr = always available)
     * @param globalType Global override, GlobalOff for none
     */
    NetworkGate(std::shared_ptr<Connectivity> connectivity, models::NetworkType globalType);

    void setGlobalNetworkType(models::NetworkType type) { m_globalType = type; }
    models::NetworkType globalNetworkType() const { return m_globalType; }

    /**
     * Requirement that applies to a download right now
     */
    models::NetworkType effectiveType(const models::Download& download) const;

    bool isPermitted(const models::Download& download) const;

private:
    std::shared_ptr<Connectivity> m_connectivity;
    models::NetworkType m_globalType;
};

} // namespace downlink::engine
