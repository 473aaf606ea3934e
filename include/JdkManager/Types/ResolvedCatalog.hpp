// include/JdkManager/Types/ResolvedCatalog.hpp
#ifndef JDKM_RESOLVED_CATALOG_HPP
#define JDKM_RESOLVED_CATALOG_HPP

#include <JdkManager/Types/InstalledRuntime.hpp>
#include <JdkManager/Types/RemoteRelease.hpp>
#include <vector>

namespace JdkManager {

    // Remote and local view of every known feature version in one structure.
    struct ResolvedCatalog {
        std::vector<unsigned int> available;         // sorted, distinct
        std::vector<unsigned int> longTermSupport;   // subset of available
        std::vector<RemoteRelease> releases;         // published for the current platform/arch
        std::vector<InstalledRuntime> installed;
        std::vector<unsigned int> installedVersions; // distinct, derived from installed

        bool isInstalled(unsigned int featureVersion) const;
        bool isAvailable(unsigned int featureVersion) const;

        json to_json() const;
    };
}

#endif // JDKM_RESOLVED_CATALOG_HPP
