// include/JdkManager/Types/InstallPlan.hpp
#ifndef JDKM_INSTALL_PLAN_HPP
#define JDKM_INSTALL_PLAN_HPP

#include <filesystem>
#include <string>
#include <nlohmann/json.hpp>

namespace JdkManager {
    using json = nlohmann::json;

    // Where a feature version comes from and where it lands. Termux installs through its
    // package manager, every other platform through a registry archive.
    struct InstallPlan {
        bool isTermux = false;
        std::string version;

        // Termux
        std::string packageName;      // openjdk-<N>
        std::string installCommand;   // pkg install openjdk-<N>
        std::filesystem::path javaPath;
        bool installed = false;

        // Standard
        std::string url;
        std::string fileName;         // Java-<N>-<arch><ext>
        std::filesystem::path downloadPath;
        std::filesystem::path unpackPath;
        std::filesystem::path javaBinPath;

        json to_json() const;
    };
}

#endif // JDKM_INSTALL_PLAN_HPP
