// src/Config.cpp
#include <JdkManager/Config.hpp>
#include <JdkManager/Errors.hpp>
#include <JdkManager/Utils/Logger.hpp>

#include <fstream>

namespace JdkManager {

Config::Config(const std::filesystem::path& work) {
    setWorkDir(work);
}

std::filesystem::path Config::defaultWorkDir() {
    std::error_code ec;
    std::filesystem::path cwd = std::filesystem::current_path(ec);
    if (ec) {
        cwd = ".";
    }
    return cwd / "temp";
}

void Config::setWorkDir(const std::filesystem::path& work) {
    workDir = work;
    downloadPath = workDir / "downloads";
    unpackPath = workDir / "unpacked";
    backupPath = workDir / "backups";
    installRoot = unpackPath;
    logDir = workDir / "logs";
}

Config& Config::withRoots(const std::filesystem::path& download,
                          const std::filesystem::path& unpack,
                          const std::filesystem::path& backup) {
    const bool installFollowsUnpack = installRoot == unpackPath;
    if (!download.empty()) downloadPath = download;
    if (!unpack.empty()) unpackPath = unpack;
    if (!backup.empty()) backupPath = backup;
    if (installFollowsUnpack) {
        installRoot = unpackPath;
    }
    return *this;
}

void Config::ensureDirectories() const {
    auto create_dir_if_not_exists = [](const std::filesystem::path& p, const std::string& name) {
        if (!std::filesystem::exists(p)) {
            std::filesystem::create_directories(p);
            JDKM_LOG_DEBUG("Created {} directory: {}", name, p.string());
        }
    };

    create_dir_if_not_exists(downloadPath, "download");
    create_dir_if_not_exists(unpackPath, "unpack");
    create_dir_if_not_exists(backupPath, "backup");
}

Config Config::from_json(const json& j) {
    Config config(j.contains("workDir") ? std::filesystem::path(j.at("workDir").get<std::string>()) : defaultWorkDir());

    if (j.contains("downloadPath")) config.downloadPath = j.at("downloadPath").get<std::string>();
    if (j.contains("unpackPath")) {
        config.unpackPath = j.at("unpackPath").get<std::string>();
        config.installRoot = config.unpackPath;
    }
    if (j.contains("backupPath")) config.backupPath = j.at("backupPath").get<std::string>();
    if (j.contains("installRoot")) config.installRoot = j.at("installRoot").get<std::string>();
    if (j.contains("logDir")) config.logDir = j.at("logDir").get<std::string>();

    if (j.contains("registryBaseUrl")) config.registryBaseUrl = j.at("registryBaseUrl").get<std::string>();
    if (j.contains("userAgent")) config.userAgent = j.at("userAgent").get<std::string>();
    if (j.contains("maxConcurrentRequests")) {
        config.maxConcurrentRequests = j.at("maxConcurrentRequests").get<unsigned int>();
        if (config.maxConcurrentRequests == 0) {
            config.maxConcurrentRequests = 1;
        }
    }
    if (j.contains("requestTimeoutMs")) config.requestTimeoutMs = j.at("requestTimeoutMs").get<int>();
    if (j.contains("caBundlePath")) config.caBundlePath = std::filesystem::path(j.at("caBundlePath").get<std::string>());

    if (j.contains("os")) config.osOverride = j.at("os").get<std::string>();
    if (j.contains("arch")) config.archOverride = j.at("arch").get<std::string>();

    return config;
}

Config Config::loadFromFile(const std::filesystem::path& file) {
    std::ifstream in(file);
    if (!in.is_open()) {
        throw JdkManagerError("Cannot open config file: " + file.string());
    }
    try {
        return from_json(json::parse(in));
    } catch (const json::exception& e) {
        throw JdkManagerError("Invalid config file " + file.string() + ": " + e.what());
    }
}

} // namespace JdkManager
