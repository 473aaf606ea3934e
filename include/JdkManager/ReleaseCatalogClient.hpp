// include/JdkManager/ReleaseCatalogClient.hpp
#ifndef JDKM_RELEASE_CATALOG_CLIENT_HPP
#define JDKM_RELEASE_CATALOG_CLIENT_HPP

#include <JdkManager/Config.hpp>
#include <JdkManager/PlatformProfile.hpp>
#include <JdkManager/ReleaseResolver.hpp>
#include <JdkManager/RuntimeScanner.hpp>
#include <JdkManager/Types/ResolvedCatalog.hpp>
#include <optional>
#include <spdlog/logger.h>
#include <vector>

namespace JdkManager {

    class HttpManager; // Forward declaration

    class ReleaseCatalogClient {
    public:
        ReleaseCatalogClient(const Config& config, const PlatformProfile& profile,
                             HttpManager& httpManager, const RuntimeScanner& scanner);

        // Available feature versions, their latest GA binary for this platform and the
        // matching local installations. Throws RegistryUnavailableError when the
        // available-releases endpoint fails.
        ResolvedCatalog fetchCatalog();

        // Latest GA binary of one feature version, nullopt when it is not published
        // for this platform or the registry does not answer for it.
        std::optional<RemoteRelease> fetchLatestRelease(unsigned int featureVersion);

        // Exact match on featureVersion. Never throws.
        static std::optional<RemoteRelease> filter(const std::vector<RemoteRelease>& releases, unsigned int featureVersion);

        struct AvailableReleases {
            std::vector<unsigned int> available;
            unsigned int mostRecentLts = 0;
        };
        AvailableReleases fetchAvailableReleases();

    private:
        const Config& m_config;
        const PlatformProfile& m_profile;
        HttpManager& m_httpManager;
        const RuntimeScanner& m_scanner;
        std::shared_ptr<spdlog::logger> m_logger;

        std::vector<RemoteRelease> fetchReleases(const std::vector<unsigned int>& featureVersions);
    };

} // namespace JdkManager

#endif // JDKM_RELEASE_CATALOG_CLIENT_HPP
