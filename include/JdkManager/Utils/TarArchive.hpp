// include/JdkManager/Utils/TarArchive.hpp
#ifndef JDKM_TAR_ARCHIVE_UTIL_HPP
#define JDKM_TAR_ARCHIVE_UTIL_HPP

#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <spdlog/logger.h>

namespace JdkManager::Utils {

    // Tarball extraction (.tar.gz, .tgz, .tar) through libarchive. Linux, macOS and
    // Android runtimes ship this way. Permissions and symlinks inside the archive are kept.
    class TarArchive {
    public:
        explicit TarArchive(const std::filesystem::path &archivePath);

        // Extracts every entry below outputDirectory. Returns false on the first error or
        // when shouldContinue returns false.
        bool extractAll(const std::filesystem::path &outputDirectory,
                        const std::function<bool()> &shouldContinue = {});

        std::string getLastError() const { return m_lastErrorMsg; }

        static bool handles(const std::filesystem::path &archivePath);

    private:
        std::filesystem::path m_archivePath;
        std::shared_ptr<spdlog::logger> m_logger;
        std::string m_lastErrorMsg;

        void fail(const std::string &message);
    };

} // namespace JdkManager::Utils

#endif // JDKM_TAR_ARCHIVE_UTIL_HPP
