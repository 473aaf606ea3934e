// src/PlatformProfile.cpp
#include <JdkManager/PlatformProfile.hpp>
#include <JdkManager/Errors.hpp>

namespace JdkManager {

PlatformProfile PlatformProfile::resolve() {
    return make(Utils::getCurrentOS(), Utils::getCurrentArch());
}

PlatformProfile PlatformProfile::make(Utils::OperatingSystem os, Utils::Architecture arch) {
    PlatformProfile profile;
    profile.os = os;
    profile.architecture = arch;
    profile.osFamily = Utils::getOSFamilyName(os);
    profile.registryOs = Utils::getOSStringForAdoptium(os);
    if (profile.osFamily.empty() || profile.registryOs.empty()) {
        throw UnsupportedPlatformError("Unsupported platform: no mapping for the operating system");
    }

    profile.archToken = Utils::getArchStringForAdoptium(arch);
    profile.cpuArch = Utils::getArchStringForFolders(arch);
    if (profile.archToken.empty() || profile.cpuArch.empty()) {
        throw UnsupportedPlatformError("Unsupported architecture: no mapping for the CPU on " + profile.osFamily);
    }

    if (os == Utils::OperatingSystem::WINDOWS) {
        profile.archiveExt = ".zip";
        profile.executableSuffix = ".exe";
    } else {
        profile.archiveExt = ".tar.gz";
    }
    return profile;
}

PlatformProfile PlatformProfile::fromOverrides(const std::optional<std::string>& os,
                                               const std::optional<std::string>& arch) {
    Utils::OperatingSystem targetOs = Utils::getCurrentOS();
    Utils::Architecture targetArch = Utils::getCurrentArch();

    if (os && !os->empty()) {
        targetOs = Utils::parseOperatingSystem(*os);
        if (targetOs == Utils::OperatingSystem::UNKNOWN) {
            throw UnsupportedPlatformError("Unsupported platform override: " + *os);
        }
    }
    if (arch && !arch->empty()) {
        targetArch = Utils::parseArchitecture(*arch);
        if (targetArch == Utils::Architecture::UNKNOWN) {
            throw UnsupportedPlatformError("Unsupported architecture override: " + *arch);
        }
    }
    return make(targetOs, targetArch);
}

} // namespace JdkManager
