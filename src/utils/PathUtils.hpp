#pragma once

#include <filesystem>
#include <string>
#include <cstdlib>

namespace downlink::utils {

namespace fs = std::filesystem;

class PathUtils {
public:
    static fs::path getAppDataPath() {
#ifdef _WIN32
        const char* appData = std::getenv("APPDATA");
        return appData ? fs::path(appData) : fs::current_path();
#elif defined(__APPLE__)
        const char* home = std::getenv("HOME");
        return home ? fs::path(home) / "Library" / "Application Support" : fs::current_path();
#else
        const char* dataHome = std::getenv("XDG_DATA_HOME");
        if (dataHome && *dataHome) {
            return fs::path(dataHome);
        }
        const char* home = std::getenv("HOME");
        return home ? fs::path(home) / ".local" / "share" : fs::current_path();
#endif
    }

    static fs::path getDataPath() {
        return getAppDataPath() / "Downlink";
    }

    static fs::path getConfigPath() {
        return getDataPath() / "config.json";
    }

    static fs::path getCatalogPath() {
        return getDataPath() / "catalog";
    }

    static fs::path getDownloadsPath() {
#ifdef _WIN32
        const char* profile = std::getenv("USERPROFILE");
        return profile ? fs::path(profile) / "Downloads" : fs::current_path();
#else
        const char* home = std::getenv("HOME");
        return home ? fs::path(home) / "Downloads" : fs::current_path();
#endif
    }
};

} // namespace downlink::utils
