// include/JdkManager/PlatformProfile.hpp
#ifndef JDKM_PLATFORM_PROFILE_HPP
#define JDKM_PLATFORM_PROFILE_HPP

#include <JdkManager/Utils/OS.hpp>
#include <optional>
#include <string>

namespace JdkManager {

    // Immutable description of the host (or of an overridden host). Built once per run and
    // handed by reference to every component, so nothing reads process-wide platform state ad hoc.
    struct PlatformProfile {
        Utils::OperatingSystem os = Utils::OperatingSystem::UNKNOWN;
        Utils::Architecture architecture = Utils::Architecture::UNKNOWN;

        std::string osFamily;          // windows | linux | mac | android
        std::string registryOs;        // "os" query value for the release registry
        std::string archToken;         // registry vocabulary, e.g. aarch64, x64
        std::string cpuArch;           // on-disk folder vocabulary, e.g. aarch64, x86_64
        std::string archiveExt;        // .zip or .tar.gz
        std::string executableSuffix;  // .exe on Windows

        std::string executableName() const { return "java" + executableSuffix; }

        bool isWindows() const { return os == Utils::OperatingSystem::WINDOWS; }
        bool isMacOS() const { return os == Utils::OperatingSystem::MACOS; }
        bool isAndroid() const { return os == Utils::OperatingSystem::ANDROID_TERMUX; }

        // Reads the host. Throws UnsupportedPlatformError when OS or CPU has no mapping.
        static PlatformProfile resolve();

        // Throws UnsupportedPlatformError for UNKNOWN values.
        static PlatformProfile make(Utils::OperatingSystem os, Utils::Architecture arch);

        // Host values where no override is given, parsed tokens otherwise.
        static PlatformProfile fromOverrides(const std::optional<std::string>& os,
                                             const std::optional<std::string>& arch);
    };

} // namespace JdkManager

#endif // JDKM_PLATFORM_PROFILE_HPP
