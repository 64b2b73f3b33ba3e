/**
 * FileUtils.cpp
 *
 * File system helpers.
 */

#include "FileUtils.hpp"
#include "HashUtils.hpp"

#include <fstream>
#include <algorithm>
#include <cctype>

namespace downlink::utils {

// -- Directory operations --

bool FileUtils::createDirectories(const fs::path& path) {
    if (path.empty()) return true;
    std::error_code ec;
    fs::create_directories(path, ec);
    return !ec && fs::is_directory(path, ec);
}

bool FileUtils::directoryExists(const fs::path& path) { std::error_code ec; return fs::is_directory(path, ec); }

// -- File operations --

bool FileUtils::fileExists(const fs::path& path) { std::error_code ec; return fs::is_regular_file(path, ec); }

bool FileUtils::deleteFile(const fs::path& path) { std::error_code ec; return fs::remove(path, ec); }

int64_t FileUtils::getFileSize(const fs::path& path) {
    std::error_code ec;
    auto size = fs::file_size(path, ec);
    return ec ? -1 : static_cast<int64_t>(size);
}

// -- Read/Write --

std::optional<std::string> FileUtils::readFile(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) return std::nullopt;
    return std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
}

bool FileUtils::writeFile(const fs::path& path, const std::string& content) {
    createDirectories(path.parent_path());
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) return false;
    file << content;
    return file.good();
}

// -- Hash --

std::string FileUtils::calculateSHA1(const fs::path& path) { return HashUtils::sha1File(path.string()); }

bool FileUtils::verifySHA1(const fs::path& path, const std::string& expectedHash) {
    std::string actual = calculateSHA1(path);
    std::string expected = expectedHash;
    std::transform(expected.begin(), expected.end(), expected.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return !actual.empty() && actual == expected;
}

std::string FileUtils::fileNameFromUrl(const std::string& url) {
    std::string path = url.substr(0, url.find_first_of("?#"));

    auto scheme = path.find("://");
    if (scheme != std::string::npos) {
        auto slash = path.find('/', scheme + 3);
        if (slash == std::string::npos) return "";
        path = path.substr(slash);
    }

    auto lastSlash = path.find_last_of('/');
    std::string name = lastSlash == std::string::npos ? path : path.substr(lastSlash + 1);
    if (name == "." || name == "..") return "";
    return name;
}

// -- LocalFileSystem --

bool LocalFileSystem::exists(const std::string& path) const {
    return FileUtils::fileExists(path);
}

bool LocalFileSystem::deleteFile(const std::string& path) {
    return FileUtils::deleteFile(path);
}

std::string LocalFileSystem::sha1(const std::string& path) const {
    return FileUtils::calculateSHA1(path);
}

} // namespace downlink::utils
