// src/Utils/ZipFile.cpp
#include <JdkManager/Utils/Logger.hpp>
#include <JdkManager/Utils/PathSafety.hpp>
#include <JdkManager/Utils/ZipFile.hpp>

extern "C" {
    #include <mz.h>
    #include <mz_zip.h>
    #include <mz_zip_rw.h>
}

namespace JdkManager::Utils {

    ZipFile::ZipFile(const std::filesystem::path &archivePath) : m_archivePath(archivePath), m_zipReader(nullptr) {
        m_logger = Logger::GetOrCreateLogger("ZipFile");
        m_zipReader = mz_zip_reader_create();
        if (!m_zipReader) {
            m_lastErrorMsg = "Failed to create zip reader instance.";
            m_logger->error("[{}] {}", m_archivePath.filename().string(), m_lastErrorMsg);
        }
    }

    ZipFile::~ZipFile() {
        if (m_zipReader) {
            if (m_opened) {
                mz_zip_reader_close(m_zipReader);
            }
            mz_zip_reader_delete(&m_zipReader);
            m_logger->trace("[{}] Zip reader deleted.", m_archivePath.filename().string());
        }
    }

    void ZipFile::logMzError(int32_t err, const std::string &context) {
        m_lastErrorMsg = context + ": minizip-ng error " + std::to_string(err);
        m_logger->error("[{}] {}", m_archivePath.filename().string(), m_lastErrorMsg);
    }

    bool ZipFile::open() {
        if (!m_zipReader) {
            m_lastErrorMsg = "Zip reader was not created.";
            return false;
        }
        if (m_opened) {
            return true;
        }

        m_logger->debug("[{}] Opening archive...", m_archivePath.filename().string());
        int32_t err = mz_zip_reader_open_file(m_zipReader, m_archivePath.string().c_str());
        if (err != MZ_OK) {
            logMzError(err, "Failed to open zip file");
            return false;
        }
        m_opened = true;
        return true;
    }

    std::string ZipFile::getLastError() const { return m_lastErrorMsg; }

    bool ZipFile::ensureDirectoryExists(const std::filesystem::path &path) {
        if (path.empty()) {
            return true;
        }
        std::error_code ec;
        if (std::filesystem::is_directory(path, ec)) {
            return true;
        }
        if (!std::filesystem::create_directories(path, ec) && ec) {
            m_lastErrorMsg = "Failed to create directory " + path.string() + ": " + ec.message();
            m_logger->error("[{}] {}", m_archivePath.filename().string(), m_lastErrorMsg);
            return false;
        }
        return true;
    }

    bool ZipFile::extractAll(const std::filesystem::path &outputDirectory, const std::function<bool()> &shouldContinue) {
        if (!open()) {
            return false;
        }

        m_logger->info("[{}] Starting extraction to: {}", m_archivePath.filename().string(), outputDirectory.string());
        if (!ensureDirectoryExists(outputDirectory)) {
            return false;
        }

        int32_t err = mz_zip_reader_goto_first_entry(m_zipReader);
        if (err != MZ_OK && err != MZ_END_OF_LIST) {
            logMzError(err, "Failed to go to first entry");
            return false;
        }

        while (err == MZ_OK) {
            if (shouldContinue && !shouldContinue()) {
                m_lastErrorMsg = "Extraction cancelled";
                m_logger->warn("[{}] {}", m_archivePath.filename().string(), m_lastErrorMsg);
                return false;
            }

            // Owned by the reader, valid until the next goto
            mz_zip_file *file_info = nullptr;
            err = mz_zip_reader_entry_get_info(m_zipReader, &file_info);
            if (err != MZ_OK || file_info == nullptr) {
                logMzError(err, "Failed to get entry info");
                return false;
            }

            const std::string entryName = file_info->filename ? file_info->filename : "";
            if (!isSafeRelativePath(entryName)) {
                m_lastErrorMsg = "Refusing unsafe entry path: " + entryName;
                m_logger->error("[{}] {}", m_archivePath.filename().string(), m_lastErrorMsg);
                return false;
            }
            std::filesystem::path output_path = outputDirectory / std::filesystem::path(entryName);

            if (mz_zip_reader_entry_is_dir(m_zipReader) == MZ_OK) {
                if (!ensureDirectoryExists(output_path)) {
                    return false;
                }
            } else {
                if (!ensureDirectoryExists(output_path.parent_path())) {
                    return false;
                }
                m_logger->trace("[{}] Extracting file to: {}", m_archivePath.filename().string(), output_path.string());
                err = mz_zip_reader_entry_save_file(m_zipReader, output_path.string().c_str());
                if (err != MZ_OK) {
                    logMzError(err, "Failed to save entry " + entryName + " to " + output_path.string());
                    return false;
                }
            }

            err = mz_zip_reader_goto_next_entry(m_zipReader);
        }

        if (err != MZ_END_OF_LIST) {
            logMzError(err, "An error occurred during entry traversal");
            return false;
        }
        m_logger->info("[{}] Finished extracting all entries.", m_archivePath.filename().string());
        return true;
    }

} // namespace JdkManager::Utils
