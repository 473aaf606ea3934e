// include/JdkManager/Config.hpp
#ifndef JDKM_CONFIG_HPP
#define JDKM_CONFIG_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace JdkManager {
    using json = nlohmann::json;

    struct Config {
        std::filesystem::path workDir;
        std::filesystem::path downloadPath; // Flat, one archive per acquisition
        std::filesystem::path unpackPath;   // One subdirectory per installed feature version
        std::filesystem::path backupPath;
        std::filesystem::path installRoot;  // Root scanned for local runtimes, defaults to unpackPath
        std::filesystem::path logDir;

        std::string registryBaseUrl = "https://api.adoptium.net/v3";
        std::string userAgent = "jdkm/0.1";
        unsigned int maxConcurrentRequests = 4;
        int requestTimeoutMs = 30000;
        std::optional<std::filesystem::path> caBundlePath;

        // Cross-platform resolution without a matching host
        std::optional<std::string> osOverride;
        std::optional<std::string> archOverride;

        explicit Config(const std::filesystem::path& work = defaultWorkDir());

        // Re-derives every root from a new working directory.
        void setWorkDir(const std::filesystem::path& work);

        // Overrides individual roots. Empty paths leave the current value untouched.
        Config& withRoots(const std::filesystem::path& download,
                          const std::filesystem::path& unpack,
                          const std::filesystem::path& backup = {});

        // Creates download, unpack and backup roots if missing. Throws std::filesystem::filesystem_error.
        void ensureDirectories() const;

        static std::filesystem::path defaultWorkDir();

        // Keys absent from the object keep their defaults.
        static Config from_json(const json& j);
        // Throws JdkManagerError when the file is missing or not valid JSON.
        static Config loadFromFile(const std::filesystem::path& file);
    };
}
#endif // JDKM_CONFIG_HPP
