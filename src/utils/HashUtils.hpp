#pragma once

#include <cctype>
#include <string>
#include <fstream>
#include <openssl/evp.h>
#include <sstream>
#include <iomanip>

namespace tapedeck::utils {

class HashUtils {
public:
    /**
     * Lowercase hex SHA-1 of a file, empty string if it cannot be read
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
            if (EVP_DigestUpdate(ctx, buffer, static_cast<size_t>(file.gcount())) != 1) {
                EVP_MD_CTX_free(ctx);
                return "";
            }
        }

        unsigned char hash[EVP_MAX_MD_SIZE];
        unsigned int hashLen = 0;
        int finalized = EVP_DigestFinal_ex(ctx, hash, &hashLen);
        EVP_MD_CTX_free(ctx);
        if (finalized != 1) return "";

        std::ostringstream oss;
        for (unsigned int i = 0; i < hashLen; ++i) {
            oss << std::hex << std::setfill('0') << std::setw(2) << static_cast<int>(hash[i]);
        }
        return oss.str();
    }

    /**
     * Compare a file against an expected hex digest (case-insensitive)
     */
    static bool matchesSha1(const std::string& filePath, const std::string& expected) {
        auto actual = sha1File(filePath);
        if (actual.empty() || actual.size() != expected.size()) return false;
        for (size_t i = 0; i < actual.size(); ++i) {
            if (actual[i] != static_cast<char>(std::tolower(static_cast<unsigned char>(expected[i])))) {
                return false;
            }
        }
        return true;
    }
};

} // namespace tapedeck::utils
