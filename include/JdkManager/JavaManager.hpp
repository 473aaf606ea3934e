// include/JdkManager/JavaManager.hpp
#ifndef JDKM_JAVA_MANAGER_HPP
#define JDKM_JAVA_MANAGER_HPP

#include <JdkManager/AcquisitionPipeline.hpp>
#include <JdkManager/Config.hpp>
#include <JdkManager/JobRunner.hpp>
#include <JdkManager/PlatformProfile.hpp>
#include <JdkManager/ReleaseCatalogClient.hpp>
#include <JdkManager/ReleaseResolver.hpp>
#include <JdkManager/RuntimeScanner.hpp>
#include <JdkManager/Types/InstallPlan.hpp>
#include <filesystem>
#include <optional>
#include <set>
#include <spdlog/logger.h>
#include <string>
#include <vector>

namespace JdkManager {

    class HttpManager; // Forward declaration

    class JavaManager {
    public:
        static constexpr const char* kTermuxJavaPath = "/data/data/com.termux/files/usr/bin/";
        static constexpr const char* kTermuxJvmRoot = "/data/data/com.termux/files/usr/lib/jvm";

        JavaManager(const Config& config, const PlatformProfile& profile,
                    HttpManager& httpManager, IJobRunner& jobRunner);

        // Strict scan of the unpack root.
        std::vector<InstalledRuntime> installations() const;

        std::optional<InstalledRuntime> findInstalled(unsigned int featureVersion,
                                                      const ResolveOptions& options = {}) const;

        ResolvedCatalog catalog();

        // Where a version would come from and where it would land. Does not touch the network.
        InstallPlan describe(unsigned int featureVersion) const;

        // Local lookup first, registry download otherwise. On Termux nothing is downloaded:
        // the package command is logged and only the Termux JVM directory is consulted.
        // Throws RegistryUnavailableError, IntegrityVerificationError or JdkManagerError.
        std::optional<InstalledRuntime> ensureRuntime(unsigned int featureVersion);

        // Logs job lifecycle events ("task:created", "task:progress", ...). An empty set logs all of them.
        void enableEventLogging(const std::set<std::string>& eventNames = {});

        bool cancel() { return m_pipeline.cancel(); }

        const RuntimeScanner& scanner() const { return m_scanner; }

    private:
        const Config& m_config;
        const PlatformProfile& m_profile;
        IJobRunner& m_jobRunner;
        RuntimeScanner m_scanner;
        ReleaseResolver m_resolver;
        ReleaseCatalogClient m_catalogClient;
        AcquisitionPipeline m_pipeline;
        std::shared_ptr<spdlog::logger> m_logger;

        InstallPlan describeTermux(unsigned int featureVersion) const;
        std::filesystem::path findJavaBinDir(const std::filesystem::path& unpackPath) const;
    };

} // namespace JdkManager

#endif // JDKM_JAVA_MANAGER_HPP
