// src/ReleaseResolver.cpp
#include <JdkManager/ReleaseResolver.hpp>

namespace JdkManager {

ReleaseResolver::ReleaseResolver(const RuntimeScanner& scanner) : m_scanner(scanner) {}

std::optional<InstalledRuntime> ReleaseResolver::findLocal(const std::filesystem::path& rootDir,
                                                           unsigned int featureVersion,
                                                           const ResolveOptions& options) const {
    return select(m_scanner.scanLenient(rootDir), featureVersion, options, m_scanner.profile());
}

std::optional<InstalledRuntime> ReleaseResolver::select(const std::vector<InstalledRuntime>& scanned,
                                                        unsigned int featureVersion,
                                                        const ResolveOptions& options,
                                                        const PlatformProfile& profile) {
    for (const auto& runtime : scanned) {
        if (runtime.featureVersion != featureVersion) continue;
        if (options.requireValid && !runtime.isValid) continue;
        if (options.requireSameArch && runtime.arch != profile.cpuArch) continue;
        if (options.requireSameOS && runtime.os != profile.osFamily) continue;
        return runtime;
    }
    return std::nullopt;
}

} // namespace JdkManager
