// src/ResolvedCatalog.cpp
#include <JdkManager/Types/ResolvedCatalog.hpp>

#include <algorithm>

namespace JdkManager {

bool ResolvedCatalog::isInstalled(unsigned int featureVersion) const {
    return std::find(installedVersions.begin(), installedVersions.end(), featureVersion) != installedVersions.end();
}

bool ResolvedCatalog::isAvailable(unsigned int featureVersion) const {
    return std::binary_search(available.begin(), available.end(), featureVersion);
}

json ResolvedCatalog::to_json() const {
    json j;
    j["available"] = available;
    j["longTermSupport"] = longTermSupport;
    j["releases"] = json::array();
    for (const auto& release : releases) {
        j["releases"].push_back(release.to_json());
    }
    j["installed"] = json::array();
    for (const auto& runtime : installed) {
        j["installed"].push_back(runtime.to_json());
    }
    j["installedVersions"] = installedVersions;
    return j;
}

} // namespace JdkManager
