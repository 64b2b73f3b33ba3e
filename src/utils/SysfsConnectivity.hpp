#pragma once

/**
 * SysfsConnectivity.hpp
 *
 * Connectivity provider reading the Linux network class directory.
 * Wi-Fi means an up wireless interface; unmetered means an up interface
 * that is not a cellular or point-to-point link.
 */

#include "../engine/Collaborators.hpp"

#include <filesystem>
#include <functional>
#include <mutex>

namespace downlink::utils {

class SysfsConnectivity : public engine::Connectivity {
public:
    explicit SysfsConnectivity(std::filesystem::path sysfsRoot = "/sys/class/net");

    bool isNetworkAvailable(models::NetworkType type) const override;

    /**
     * Sysfs offers no change notification; the handler is kept and fired
     * by notifyChanged() only. The engine polls in any case.
     */
    void setChangeHandler(std::function<void()> handler) override;

    /**
     * Fire the change handler (for callers that learn about changes from
     * elsewhere, such as netlink)
     */
    void notifyChanged();

private:
    std::filesystem::path m_root;

    std::mutex m_handlerMutex;
    std::function<void()> m_handler;
};

} // namespace downlink::utils
