// src/Utils/Crypto.cpp
#include <JdkManager/Utils/Crypto.hpp>
#include <JdkManager/Utils/Logger.hpp>

#include <openssl/evp.h>
#include <cctype>
#include <fstream>
#include <vector>
#include <iomanip>
#include <sstream>

namespace JdkManager::Utils {

    static std::string bytesToHexString(const unsigned char *bytes, size_t len) {
        std::ostringstream ss;
        ss << std::hex << std::setfill('0');
        for (size_t i = 0; i < len; ++i) {
            ss << std::setw(2) << static_cast<int>(bytes[i]);
        }
        return ss.str();
    }

    std::string calculateFileDigest(const std::string &filePath, const std::string &algorithm) {
        JDKM_LOG_TRACE("[Crypto] Calculating {} for file: {}", algorithm, filePath);

        const EVP_MD *md = EVP_get_digestbyname(algorithm.c_str());
        if (md == nullptr) {
            JDKM_LOG_ERROR("[Crypto] Unknown digest algorithm: {}", algorithm);
            return "";
        }

        std::ifstream file(filePath, std::ios::binary);
        if (!file.is_open()) {
            JDKM_LOG_ERROR("[Crypto] Could not open file for {} calculation: {}", algorithm, filePath);
            return "";
        }

        EVP_MD_CTX *mdctx = EVP_MD_CTX_new();
        if (mdctx == nullptr) {
            JDKM_LOG_ERROR("[Crypto] EVP_MD_CTX_new failed for {} on file: {}", algorithm, filePath);
            return "";
        }

        if (1 != EVP_DigestInit_ex(mdctx, md, nullptr)) {
            JDKM_LOG_ERROR("[Crypto] EVP_DigestInit_ex for {} failed on file: {}", algorithm, filePath);
            EVP_MD_CTX_free(mdctx);
            return "";
        }

        constexpr size_t bufferSize = 64 * 1024;
        std::vector<char> buffer(bufferSize);

        while (file.good()) {
            file.read(buffer.data(), bufferSize);
            std::streamsize bytesRead = file.gcount();
            if (bytesRead > 0) {
                if (1 != EVP_DigestUpdate(mdctx, buffer.data(), static_cast<size_t>(bytesRead))) {
                    JDKM_LOG_ERROR("[Crypto] EVP_DigestUpdate failed for {} on file: {}", algorithm, filePath);
                    EVP_MD_CTX_free(mdctx);
                    return "";
                }
            }
        }
        if (file.bad()) {
            JDKM_LOG_ERROR("[Crypto] Read error while hashing file: {}", filePath);
            EVP_MD_CTX_free(mdctx);
            return "";
        }

        unsigned char hash[EVP_MAX_MD_SIZE];
        unsigned int hashLen = 0;

        if (1 != EVP_DigestFinal_ex(mdctx, hash, &hashLen)) {
            JDKM_LOG_ERROR("[Crypto] EVP_DigestFinal_ex failed for {} on file: {}", algorithm, filePath);
            EVP_MD_CTX_free(mdctx);
            return "";
        }
        EVP_MD_CTX_free(mdctx);

        std::string hexHash = bytesToHexString(hash, hashLen);
        JDKM_LOG_TRACE("[Crypto] {} for {}: {}", algorithm, filePath, hexHash);
        return hexHash;
    }

    std::string calculateFileSHA256(const std::string &filePath) {
        return calculateFileDigest(filePath, "sha256");
    }

    bool digestsEqual(const std::string &lhs, const std::string &rhs) {
        if (lhs.size() != rhs.size()) {
            return false;
        }
        for (size_t i = 0; i < lhs.size(); ++i) {
            if (std::tolower(static_cast<unsigned char>(lhs[i])) != std::tolower(static_cast<unsigned char>(rhs[i]))) {
                return false;
            }
        }
        return true;
    }

} // namespace JdkManager::Utils
