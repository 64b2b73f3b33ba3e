// Downlink - File Utilities
// File system helpers and the local FileSystem collaborator

#pragma once

#include "../engine/Collaborators.hpp"

#include <string>
#include <filesystem>
#include <optional>

namespace fs = std::filesystem;

namespace downlink::utils {

/**
 * @brief File and directory utilities
 */
class FileUtils {
public:
    // Directory operations
    static bool createDirectories(const fs::path& path);
    static bool directoryExists(const fs::path& path);

    // File operations
    static bool fileExists(const fs::path& path);
    static bool deleteFile(const fs::path& path);
    static int64_t getFileSize(const fs::path& path);

    // Read/Write operations
    static std::optional<std::string> readFile(const fs::path& path);
    static bool writeFile(const fs::path& path, const std::string& content);

    // Hash operations
    static std::string calculateSHA1(const fs::path& path);
    static bool verifySHA1(const fs::path& path, const std::string& expectedHash);

    /**
     * File name part of a URL path, without query or fragment
     * @return Empty when the URL has no usable file name
     */
    static std::string fileNameFromUrl(const std::string& url);
};

/**
 * @brief FileSystem collaborator backed by the local disk
 */
class LocalFileSystem : public engine::FileSystem {
public:
    bool exists(const std::string& path) const override;
    bool deleteFile(const std::string& path) override;
    std::string sha1(const std::string& path) const override;
};

} // namespace downlink::utils
