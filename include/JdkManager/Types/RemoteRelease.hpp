// include/JdkManager/Types/RemoteRelease.hpp
#ifndef JDKM_REMOTE_RELEASE_HPP
#define JDKM_REMOTE_RELEASE_HPP

#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>

namespace JdkManager {
    using json = nlohmann::json;

    // One downloadable binary for the current platform, as published by the registry.
    struct RemoteRelease {
        unsigned int featureVersion = 0;
        std::string releaseName;       // e.g. "jdk-21.0.3+9"
        std::string packageName;       // archive file name, e.g. "OpenJDK21U-jdk_x64_linux_hotspot_21.0.3_9.tar.gz"
        std::string downloadUrl;
        std::string checksum;          // hex SHA-256, may be empty
        std::uint64_t sizeBytes = 0;
        std::string arch;              // registry vocabulary
        std::string os;                // registry vocabulary

        // Parses one element of the "assets/latest" array.
        // Throws json::exception when release_name or binary.package.{link,size} are missing.
        static RemoteRelease from_json(unsigned int featureVersion, const json& asset,
                                       const std::string& arch, const std::string& os);

        json to_json() const;
    };
}

#endif // JDKM_REMOTE_RELEASE_HPP
