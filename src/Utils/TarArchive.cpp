// src/Utils/TarArchive.cpp
#include <JdkManager/Utils/Logger.hpp>
#include <JdkManager/Utils/PathSafety.hpp>
#include <JdkManager/Utils/TarArchive.hpp>

#include <archive.h>
#include <archive_entry.h>

namespace JdkManager::Utils {

namespace {
    struct ArchiveReadDeleter {
        void operator()(archive* a) const {
            if (a) archive_read_free(a);
        }
    };
    struct ArchiveWriteDeleter {
        void operator()(archive* a) const {
            if (a) archive_write_free(a);
        }
    };

    bool endsWith(const std::string& s, const std::string& suffix) {
        return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
    }

    std::string errorString(archive* a) {
        const char* msg = archive_error_string(a);
        return msg ? msg : "unknown libarchive error";
    }

    // Copies one entry's data blocks from the reader to the disk writer
    int copyData(archive* ar, archive* aw, std::string& error) {
        const void* buff = nullptr;
        size_t size = 0;
        la_int64_t offset = 0;

        while (true) {
            int r = archive_read_data_block(ar, &buff, &size, &offset);
            if (r == ARCHIVE_EOF) {
                return ARCHIVE_OK;
            }
            if (r == ARCHIVE_RETRY) {
                continue;
            }
            if (r < ARCHIVE_WARN) {
                error = "archive_read_data_block: " + errorString(ar);
                return r;
            }
            if (archive_write_data_block(aw, buff, size, offset) < ARCHIVE_WARN) {
                error = "archive_write_data_block: " + errorString(aw);
                return ARCHIVE_FATAL;
            }
        }
    }
}

TarArchive::TarArchive(const std::filesystem::path &archivePath) : m_archivePath(archivePath) {
    m_logger = Logger::GetOrCreateLogger("TarArchive");
}

bool TarArchive::handles(const std::filesystem::path &archivePath) {
    const std::string name = archivePath.filename().string();
    return endsWith(name, ".tar.gz") || endsWith(name, ".tgz") || endsWith(name, ".tar");
}

void TarArchive::fail(const std::string &message) {
    m_lastErrorMsg = message;
    m_logger->error("[{}] {}", m_archivePath.filename().string(), m_lastErrorMsg);
}

bool TarArchive::extractAll(const std::filesystem::path &outputDirectory, const std::function<bool()> &shouldContinue) {
    std::error_code ec;
    std::filesystem::create_directories(outputDirectory, ec);
    if (ec) {
        fail("Failed to create directory " + outputDirectory.string() + ": " + ec.message());
        return false;
    }

    std::unique_ptr<archive, ArchiveReadDeleter> reader(archive_read_new());
    std::unique_ptr<archive, ArchiveWriteDeleter> writer(archive_write_disk_new());
    if (!reader || !writer) {
        fail("Failed to allocate libarchive handles");
        return false;
    }

    archive_read_support_format_tar(reader.get());
    archive_read_support_format_gnutar(reader.get());
    archive_read_support_filter_gzip(reader.get());
    archive_read_support_filter_none(reader.get());

    archive_write_disk_set_options(writer.get(),
        ARCHIVE_EXTRACT_TIME | ARCHIVE_EXTRACT_PERM |
        ARCHIVE_EXTRACT_SECURE_NODOTDOT | ARCHIVE_EXTRACT_SECURE_SYMLINKS);
    archive_write_disk_set_standard_lookup(writer.get());

    if (archive_read_open_filename(reader.get(), m_archivePath.string().c_str(), 64 * 1024) != ARCHIVE_OK) {
        fail("Failed to open archive: " + errorString(reader.get()));
        return false;
    }

    m_logger->info("[{}] Starting extraction to: {}", m_archivePath.filename().string(), outputDirectory.string());

    size_t entries = 0;
    archive_entry* entry = nullptr;
    while (true) {
        if (shouldContinue && !shouldContinue()) {
            fail("Extraction cancelled");
            return false;
        }

        int r = archive_read_next_header(reader.get(), &entry);
        if (r == ARCHIVE_EOF) {
            break;
        }
        if (r < ARCHIVE_WARN) {
            fail("archive_read_next_header: " + errorString(reader.get()));
            return false;
        }

        const char* rawName = archive_entry_pathname(entry);
        std::string entryName = rawName ? rawName : "";
        while (entryName.rfind("./", 0) == 0) entryName.erase(0, 2);
        if (entryName.empty()) {
            continue; // the "./" root entry
        }
        if (!isSafeRelativePath(entryName)) {
            fail("Refusing unsafe entry path: " + entryName);
            return false;
        }

        const std::filesystem::path target = outputDirectory / std::filesystem::path(entryName);
        archive_entry_set_pathname(entry, target.string().c_str());

        // Hard links inside the archive are relative to the archive root as well
        if (const char* hardlink = archive_entry_hardlink(entry)) {
            std::string linkName = hardlink;
            while (linkName.rfind("./", 0) == 0) linkName.erase(0, 2);
            if (!isSafeRelativePath(linkName)) {
                fail("Refusing unsafe hard link: " + linkName);
                return false;
            }
            archive_entry_set_hardlink(entry, (outputDirectory / linkName).string().c_str());
        }

        if (archive_write_header(writer.get(), entry) < ARCHIVE_WARN) {
            fail("archive_write_header: " + errorString(writer.get()));
            return false;
        }
        if (archive_entry_size(entry) > 0) {
            std::string error;
            if (copyData(reader.get(), writer.get(), error) != ARCHIVE_OK) {
                fail(error);
                return false;
            }
        }
        if (archive_write_finish_entry(writer.get()) < ARCHIVE_WARN) {
            fail("archive_write_finish_entry: " + errorString(writer.get()));
            return false;
        }
        ++entries;
    }

    if (archive_write_close(writer.get()) != ARCHIVE_OK) {
        fail("archive_write_close: " + errorString(writer.get()));
        return false;
    }
    m_logger->info("[{}] Finished extracting {} entries.", m_archivePath.filename().string(), entries);
    return true;
}

} // namespace JdkManager::Utils
