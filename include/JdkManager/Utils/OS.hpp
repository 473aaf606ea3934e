// include/JdkManager/Utils/OS.hpp
#ifndef JDKM_OS_UTIL_HPP
#define JDKM_OS_UTIL_HPP

#include <string>

namespace JdkManager {
    namespace Utils {

        enum class OperatingSystem {
            WINDOWS,
            MACOS,
            LINUX,
            ANDROID_TERMUX, // Android or a Termux userland
            UNKNOWN
        };

        enum class Architecture {
            X86,        // 32-bit x86
            X64,        // 64-bit x86_64/amd64
            ARM64,      // 64-bit ARM (aarch64)
            ARM32,      // 32-bit ARM
            UNKNOWN
        };

        OperatingSystem getCurrentOS();
        Architecture getCurrentArch();

        // True on Android builds or when the Termux prefix exists on disk
        bool isTermux();

        // windows | linux | mac | android, empty for UNKNOWN
        std::string getOSFamilyName(OperatingSystem os);

        // Adoptium API vocabulary. Android resolves to the linux builds.
        std::string getOSStringForAdoptium(OperatingSystem os);
        std::string getArchStringForAdoptium(Architecture arch);

        // Vocabulary of vendor folder names on disk (x86_64, x86, aarch64, arm).
        // Deliberately separate from the Adoptium table: the two are allowed to diverge.
        std::string getArchStringForFolders(Architecture arch);

        // Accept the common spellings of both vocabularies; UNKNOWN when nothing matches
        OperatingSystem parseOperatingSystem(const std::string& name);
        Architecture parseArchitecture(const std::string& name);

    } // namespace Utils
} // namespace JdkManager

#endif // JDKM_OS_UTIL_HPP
