// include/JdkManager/RuntimeScanner.hpp
#ifndef JDKM_RUNTIME_SCANNER_HPP
#define JDKM_RUNTIME_SCANNER_HPP

#include <JdkManager/FolderNameRules.hpp>
#include <JdkManager/PlatformProfile.hpp>
#include <JdkManager/Types/InstalledRuntime.hpp>
#include <filesystem>
#include <memory>
#include <optional>
#include <spdlog/logger.h>
#include <vector>

namespace JdkManager {

    // Finds Java installations below a directory by looking for the java executable and
    // inferring metadata from the enclosing folder names. Holds no mutable state, so
    // independent roots may be scanned from several threads at once.
    class RuntimeScanner {
    public:
        explicit RuntimeScanner(const PlatformProfile& profile,
                                const FolderNameRules& rules = FolderNameRules::defaults());

        // Installations with an executable, sorted by featureVersion descending.
        // Never throws; a missing or unreadable root yields an empty list.
        std::vector<InstalledRuntime> scan(const std::filesystem::path& rootDir) const;

        // scan() plus directories that match the naming rules but lack an executable
        // (reported with isValid == false).
        std::vector<InstalledRuntime> scanLenient(const std::filesystem::path& rootDir) const;

        // Directory holding the java executable for a version root: bin/ or Contents/Home/bin/.
        std::filesystem::path resolveBinDir(const std::filesystem::path& installRoot) const;

        const PlatformProfile& profile() const { return m_profile; }

    private:
        PlatformProfile m_profile;
        FolderNameRules m_rules;
        std::shared_ptr<spdlog::logger> m_logger;

        std::vector<InstalledRuntime> scanImpl(const std::filesystem::path& rootDir, bool lenient) const;

        void findExecutables(const std::filesystem::path& dir, std::vector<std::filesystem::path>& out) const;
        void findDirectories(const std::filesystem::path& dir, std::vector<std::filesystem::path>& out) const;
        std::vector<std::filesystem::directory_entry> listDirectory(const std::filesystem::path& dir) const;

        std::optional<InstalledRuntime> inferFromExecutable(const std::filesystem::path& executable) const;
        InstalledRuntime inferFromDirectory(const std::filesystem::path& dir, unsigned int featureVersion) const;
    };

} // namespace JdkManager

#endif // JDKM_RUNTIME_SCANNER_HPP
