/**
 * SysfsConnectivity.cpp
 *
 * Network interface probing through /sys/class/net.
 */

#include "SysfsConnectivity.hpp"
#include "PlatformUtils.hpp"

namespace downlink::utils {

using models::NetworkType;

SysfsConnectivity::SysfsConnectivity(std::filesystem::path sysfsRoot)
    : m_root(std::move(sysfsRoot)) {
}

bool SysfsConnectivity::isNetworkAvailable(NetworkType type) const {
    for (const auto& iface : PlatformUtils::listNetworkInterfaces(m_root)) {
        if (!iface.up || iface.loopback) continue;

        switch (type) {
            case NetworkType::GlobalOff:
            case NetworkType::All:
                return true;
            case NetworkType::WifiOnly:
                if (iface.wireless) return true;
                break;
            case NetworkType::Unmetered:
                if (!iface.metered) return true;
                break;
        }
    }
    return false;
}

void SysfsConnectivity::setChangeHandler(std::function<void()> handler) {
    std::lock_guard<std::mutex> lock(m_handlerMutex);
    m_handler = std::move(handler);
}

void SysfsConnectivity::notifyChanged() {
    std::function<void()> handler;
    {
        std::lock_guard<std::mutex> lock(m_handlerMutex);
        handler = m_handler;
    }
    if (handler) {
        handler();
    }
}

} // namespace downlink::utils
