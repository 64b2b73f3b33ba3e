// Downlink - Platform Utilities
// System and network interface information

#pragma once

#include <string>
#include <vector>
#include <filesystem>

namespace downlink::utils {

/**
 * @brief Operating system type
 */
enum class OS {
    Windows,
    macOS,
    Linux,
    Unknown
};

/**
 * @brief Network interface as seen by the kernel
 */
struct NetworkInterface {
    std::string name;
    bool up{false};
    bool wireless{false};
    bool loopback{false};

    // Cellular modems and point-to-point links
    bool metered{false};
};

/**
 * @brief Platform-specific utilities
 */
class PlatformUtils {
public:
    // OS detection
    static OS getOS();
    static std::string getOSName();
    static std::string getHostname();

    /**
     * List the interfaces under a sysfs net class directory
     * @param sysfsRoot Usually /sys/class/net
     * @return Interfaces found, empty where sysfs is unavailable
     */
    static std::vector<NetworkInterface> listNetworkInterfaces(
        const std::filesystem::path& sysfsRoot = "/sys/class/net");
};

} // namespace downlink::utils
