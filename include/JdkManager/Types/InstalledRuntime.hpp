// include/JdkManager/Types/InstalledRuntime.hpp
#ifndef JDKM_INSTALLED_RUNTIME_HPP
#define JDKM_INSTALLED_RUNTIME_HPP

#include <filesystem>
#include <string>
#include <nlohmann/json.hpp>

namespace JdkManager {
    using json = nlohmann::json;

    // One local installation found by a scan. Identity is installRoot.
    struct InstalledRuntime {
        unsigned int featureVersion = 0;     // e.g. 8, 11, 17, 21
        std::string folderName;              // e.g. "jdk-21.0.3+9" or "8_x86_64_windows"
        std::filesystem::path installRoot;
        std::filesystem::path binDir;
        std::filesystem::path executablePath;
        std::string arch;                    // folder vocabulary: x86_64, x86, aarch64, arm
        std::string os;                      // windows, linux, mac, android
        bool isValid = false;                // executable exists and is a regular file

        bool operator==(const InstalledRuntime& other) const;
        bool operator!=(const InstalledRuntime& other) const { return !(*this == other); }

        json to_json() const;
    };
}

#endif // JDKM_INSTALLED_RUNTIME_HPP
