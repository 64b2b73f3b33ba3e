#pragma once

#include <string>
#include <cstdint>
#include <fstream>
#include <openssl/sha.h>
#include <openssl/evp.h>
#include <sstream>
#include <iomanip>

namespace downlink::utils {

class HashUtils {
public:
    /**
     * SHA1 of a file's content as lowercase hex, empty on I/O failure
     */
    static std::string sha1File(const std::string& filePath) {
        std::ifstream file(filePath, std::ios::binary);
        if (!file.is_open()) return "";

        EVP_MD_CTX* ctx = EVP_MD_CTX_new();
        if (!ctx) return "";

        if (EVP_DigestInit_ex(ctx, EVP_sha1(), nullptr) != 1) {
            EVP_MD_CTX_free(ctx);
            return "";
        }

        char buffer[8192];
        while (file.read(buffer, sizeof(buffer)) || file.gcount() > 0) {
            EVP_DigestUpdate(ctx, buffer, static_cast<size_t>(file.gcount()));
        }

        unsigned char hash[EVP_MAX_MD_SIZE];
        unsigned int hashLen = 0;
        EVP_DigestFinal_ex(ctx, hash, &hashLen);
        EVP_MD_CTX_free(ctx);

        return toHex(hash, hashLen);
    }

    static std::string sha1String(const std::string& data) {
        unsigned char hash[SHA_DIGEST_LENGTH];
        SHA1(reinterpret_cast<const unsigned char*>(data.data()), data.size(), hash);
        return toHex(hash, SHA_DIGEST_LENGTH);
    }

    /**
     * Positive 31-bit integer taken from the leading bytes of the data's SHA1
     */
    static int32_t sha1Int31(const std::string& data) {
        unsigned char hash[SHA_DIGEST_LENGTH];
        SHA1(reinterpret_cast<const unsigned char*>(data.data()), data.size(), hash);

        uint32_t value = (static_cast<uint32_t>(hash[0]) << 24) |
                         (static_cast<uint32_t>(hash[1]) << 16) |
                         (static_cast<uint32_t>(hash[2]) << 8) |
                         static_cast<uint32_t>(hash[3]);
        return static_cast<int32_t>(value & 0x7fffffffu);
    }

private:
    static std::string toHex(const unsigned char* hash, unsigned int length) {
        std::ostringstream oss;
        for (unsigned int i = 0; i < length; ++i) {
            oss << std::hex << std::setfill('0') << std::setw(2) << static_cast<int>(hash[i]);
        }
        return oss.str();
    }
};

} // namespace downlink::utils
