// src/Utils/OS.cpp
#include <JdkManager/Utils/OS.hpp>

#include <algorithm>
#include <cctype>
#include <filesystem>

namespace JdkManager {
namespace Utils {

namespace {
    constexpr const char* kTermuxPrefix = "/data/data/com.termux";

    std::string toLower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    }
}

bool isTermux() {
    #if defined(__ANDROID__)
        return true;
    #else
        std::error_code ec;
        return std::filesystem::exists(kTermuxPrefix, ec);
    #endif
}

OperatingSystem getCurrentOS() {
    #if defined(_WIN32) || defined(_WIN64)
        return OperatingSystem::WINDOWS;
    #elif defined(__APPLE__) || defined(__MACH__)
        return OperatingSystem::MACOS;
    #elif defined(__ANDROID__)
        return OperatingSystem::ANDROID_TERMUX;
    #elif defined(__linux__)
        return isTermux() ? OperatingSystem::ANDROID_TERMUX : OperatingSystem::LINUX;
    #else
        return OperatingSystem::UNKNOWN;
    #endif
}

Architecture getCurrentArch() {
    #if defined(_M_AMD64) || defined(__amd64__) || defined(__x86_64__)
        return Architecture::X64;
    #elif defined(_M_IX86) || defined(__i386__)
        return Architecture::X86;
    #elif defined(__aarch64__) || defined(_M_ARM64)
        return Architecture::ARM64;
    #elif defined(__arm__) || defined(_M_ARM)
        return Architecture::ARM32;
    #else
        return Architecture::UNKNOWN;
    #endif
}

std::string getOSFamilyName(OperatingSystem os) {
    switch (os) {
        case OperatingSystem::WINDOWS: return "windows";
        case OperatingSystem::MACOS: return "mac";
        case OperatingSystem::LINUX: return "linux";
        case OperatingSystem::ANDROID_TERMUX: return "android";
        default: return "";
    }
}

std::string getOSStringForAdoptium(OperatingSystem os) {
    switch (os) {
        case OperatingSystem::WINDOWS: return "windows";
        case OperatingSystem::MACOS: return "mac";
        case OperatingSystem::LINUX: return "linux";
        case OperatingSystem::ANDROID_TERMUX: return "linux";
        default: return "";
    }
}

std::string getArchStringForAdoptium(Architecture arch) {
    switch (arch) {
        case Architecture::X64: return "x64";
        case Architecture::X86: return "x86"; // Adoptium uses x86 for 32-bit builds
        case Architecture::ARM64: return "aarch64";
        case Architecture::ARM32: return "arm";
        default: return "";
    }
}

std::string getArchStringForFolders(Architecture arch) {
    switch (arch) {
        case Architecture::X64: return "x86_64";
        case Architecture::X86: return "x86";
        case Architecture::ARM64: return "aarch64";
        case Architecture::ARM32: return "arm";
        default: return "";
    }
}

OperatingSystem parseOperatingSystem(const std::string& name) {
    const std::string n = toLower(name);
    if (n == "windows" || n == "win" || n == "win32") return OperatingSystem::WINDOWS;
    if (n == "mac" || n == "macos" || n == "darwin" || n == "osx") return OperatingSystem::MACOS;
    if (n == "linux") return OperatingSystem::LINUX;
    if (n == "android" || n == "termux") return OperatingSystem::ANDROID_TERMUX;
    return OperatingSystem::UNKNOWN;
}

Architecture parseArchitecture(const std::string& name) {
    const std::string n = toLower(name);
    if (n == "x64" || n == "x86_64" || n == "amd64") return Architecture::X64;
    if (n == "x86" || n == "x32" || n == "i386" || n == "i686" || n == "ia32") return Architecture::X86;
    if (n == "aarch64" || n == "arm64") return Architecture::ARM64;
    if (n == "arm" || n == "arm32" || n == "armv7" || n == "armv7l") return Architecture::ARM32;
    return Architecture::UNKNOWN;
}

} // namespace Utils
} // namespace JdkManager
