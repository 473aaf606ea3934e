// src/RemoteRelease.cpp
#include <JdkManager/Types/RemoteRelease.hpp>

namespace JdkManager {

RemoteRelease RemoteRelease::from_json(unsigned int featureVersion, const json& asset,
                                       const std::string& arch, const std::string& os) {
    RemoteRelease release;
    release.featureVersion = featureVersion;
    release.releaseName = asset.at("release_name").get<std::string>();

    const json& package = asset.at("binary").at("package");
    release.downloadUrl = package.at("link").get<std::string>();
    release.sizeBytes = package.at("size").get<std::uint64_t>();
    if (package.contains("name") && package.at("name").is_string()) {
        release.packageName = package.at("name").get<std::string>();
    }
    if (package.contains("checksum") && package.at("checksum").is_string()) {
        release.checksum = package.at("checksum").get<std::string>();
    }

    release.arch = arch;
    release.os = os;
    return release;
}

json RemoteRelease::to_json() const {
    return json{
        {"featureVersion", featureVersion},
        {"releaseName", releaseName},
        {"packageName", packageName},
        {"downloadUrl", downloadUrl},
        {"checksum", checksum},
        {"sizeBytes", sizeBytes},
        {"arch", arch},
        {"os", os}
    };
}

} // namespace JdkManager
