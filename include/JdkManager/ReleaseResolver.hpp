// include/JdkManager/ReleaseResolver.hpp
#ifndef JDKM_RELEASE_RESOLVER_HPP
#define JDKM_RELEASE_RESOLVER_HPP

#include <JdkManager/RuntimeScanner.hpp>
#include <filesystem>
#include <optional>
#include <vector>

namespace JdkManager {

    struct ResolveOptions {
        bool requireSameArch = true;
        bool requireSameOS = true;
        bool requireValid = true;

        static ResolveOptions any() { return {false, false, false}; }
    };

    class ReleaseResolver {
    public:
        explicit ReleaseResolver(const RuntimeScanner& scanner);

        // Lenient scan of rootDir, then select(). Never throws.
        std::optional<InstalledRuntime> findLocal(const std::filesystem::path& rootDir,
                                                  unsigned int featureVersion,
                                                  const ResolveOptions& options = {}) const;

        // Filters in order: version, validity, arch (cpuArch), OS (osFamily). First match in scan order.
        static std::optional<InstalledRuntime> select(const std::vector<InstalledRuntime>& scanned,
                                                      unsigned int featureVersion,
                                                      const ResolveOptions& options,
                                                      const PlatformProfile& profile);

    private:
        const RuntimeScanner& m_scanner;
    };

} // namespace JdkManager

#endif // JDKM_RELEASE_RESOLVER_HPP
