/**
 * PlatformUtils.cpp
 *
 * Cross-platform system utilities.
 */

#include "PlatformUtils.hpp"

#include <fstream>
#include <algorithm>

#ifdef _WIN32
#include <windows.h>
#else
#include <unistd.h>
#endif

namespace downlink::utils {

namespace fs = std::filesystem;

namespace {

std::string readFirstLine(const fs::path& path) {
    std::ifstream file(path);
    std::string line;
    if (file.is_open()) {
        std::getline(file, line);
    }
    return line;
}

bool startsWith(const std::string& str, const std::string& prefix) {
    return str.compare(0, prefix.size(), prefix) == 0;
}

} // namespace

OS PlatformUtils::getOS() {
#ifdef _WIN32
    return OS::Windows;
#elif defined(__APPLE__)
    return OS::macOS;
#elif defined(__linux__)
    return OS::Linux;
#else
    return OS::Unknown;
#endif
}

std::string PlatformUtils::getOSName() {
    switch (getOS()) {
        case OS::Windows: return "Windows";
        case OS::macOS: return "macOS";
        case OS::Linux: return "Linux";
        default: return "Unknown";
    }
}

std::string PlatformUtils::getHostname() {
#ifdef _WIN32
    char buffer[256];
    DWORD size = sizeof(buffer);
    return GetComputerNameA(buffer, &size) ? std::string(buffer, size) : "";
#else
    char buffer[256];
    return gethostname(buffer, sizeof(buffer)) == 0 ? std::string(buffer) : "";
#endif
}

std::vector<NetworkInterface> PlatformUtils::listNetworkInterfaces(const fs::path& sysfsRoot) {
    std::vector<NetworkInterface> interfaces;

    std::error_code ec;
    if (!fs::is_directory(sysfsRoot, ec)) {
        return interfaces;
    }

    for (const auto& entry : fs::directory_iterator(sysfsRoot, ec)) {
        NetworkInterface iface;
        iface.name = entry.path().filename().string();

        // operstate is "up", "down", "unknown" (some virtual links report
        // unknown while passing traffic)
        std::string state = readFirstLine(entry.path() / "operstate");
        iface.up = state == "up" || (state == "unknown" && readFirstLine(entry.path() / "carrier") == "1");

        iface.wireless = fs::exists(entry.path() / "wireless", ec) || fs::exists(entry.path() / "phy80211", ec);
        iface.loopback = iface.name == "lo" || readFirstLine(entry.path() / "type") == "772";
        iface.metered = startsWith(iface.name, "wwan") || startsWith(iface.name, "ppp") ||
                        startsWith(iface.name, "rmnet");

        interfaces.push_back(std::move(iface));
    }

    std::sort(interfaces.begin(), interfaces.end(),
        [](const NetworkInterface& a, const NetworkInterface& b) { return a.name < b.name; });
    return interfaces;
}

} // namespace downlink::utils
