// include/JdkManager/Utils/ZipFile.hpp
#ifndef JDKM_ZIP_FILE_UTIL_HPP
#define JDKM_ZIP_FILE_UTIL_HPP

#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <spdlog/logger.h>

namespace JdkManager::Utils {

    // Zip extraction through minizip-ng. Windows runtimes ship as .zip.
    class ZipFile {
    public:
        explicit ZipFile(const std::filesystem::path &archivePath);
        ~ZipFile();

        ZipFile(const ZipFile &) = delete;
        ZipFile &operator=(const ZipFile &) = delete;

        // Attempts to open the zip file. Returns true on success.
        bool open();

        // Extracts every entry below outputDirectory. Stops early (returning false) when
        // shouldContinue returns false. Entries that would land outside outputDirectory are rejected.
        bool extractAll(const std::filesystem::path &outputDirectory,
                        const std::function<bool()> &shouldContinue = {});

        std::string getLastError() const;

    private:
        std::filesystem::path m_archivePath;
        void *m_zipReader; // Opaque pointer to mz_zip_reader
        bool m_opened = false;
        std::shared_ptr<spdlog::logger> m_logger;
        std::string m_lastErrorMsg;

        bool ensureDirectoryExists(const std::filesystem::path &path);
        void logMzError(int32_t err, const std::string &context);
    };

} // namespace JdkManager::Utils

#endif // JDKM_ZIP_FILE_UTIL_HPP
