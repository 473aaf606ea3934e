// include/JdkManager/Utils/Crypto.hpp
#ifndef JDKM_CRYPTO_UTIL_HPP
#define JDKM_CRYPTO_UTIL_HPP

#include <string>

namespace JdkManager {
    namespace Utils {

        /**
         * @brief Calculates a digest of a file with any algorithm OpenSSL knows by name.
         * @param filePath The path to the file.
         * @param algorithm OpenSSL digest name, e.g. "sha256" or "sha1".
         * @return Lower-case hex digest. Empty string on error (file unreadable, unknown algorithm, OpenSSL error).
         */
        std::string calculateFileDigest(const std::string& filePath, const std::string& algorithm);

        /**
         * @brief Calculates the SHA256 hash of a given file. This is the digest the release registry publishes.
         * @return A hex-encoded string of the hash, or an empty string on error.
         */
        std::string calculateFileSHA256(const std::string& filePath);

        // Case-insensitive comparison of two hex digests
        bool digestsEqual(const std::string& lhs, const std::string& rhs);

    } // namespace Utils
} // namespace JdkManager

#endif // JDKM_CRYPTO_UTIL_HPP
