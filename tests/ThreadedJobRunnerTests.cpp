#include <gtest/gtest.h>
#include <JdkManager/ThreadedJobRunner.hpp>
#include <JdkManager/Utils/TarArchive.hpp>
#include "Fakes.hpp"

#include <archive.h>
#include <archive_entry.h>

extern "C" {
    #include <mz.h>
    #include <mz_zip.h>
    #include <mz_zip_rw.h>
}

#include <atomic>
#include <ctime>
#include <utility>

using JdkManager::Config;
using JdkManager::JobEvent;
using JdkManager::JobNotification;
using JdkManager::JobSpec;
using JdkManager::JobStatus;
using JdkManager::ThreadedJobRunner;

namespace {

// Writes a gzip-compressed tarball. Entries ending in '/' become directories.
void writeTarball(const std::filesystem::path& file,
                  const std::vector<std::pair<std::string, std::string>>& entries) {
    archive* a = archive_write_new();
    archive_write_add_filter_gzip(a);
    archive_write_set_format_pax_restricted(a);
    ASSERT_EQ(archive_write_open_filename(a, file.string().c_str()), ARCHIVE_OK);

    for (const auto& [name, content] : entries) {
        archive_entry* entry = archive_entry_new();
        archive_entry_set_pathname(entry, name.c_str());
        if (!name.empty() && name.back() == '/') {
            archive_entry_set_filetype(entry, AE_IFDIR);
            archive_entry_set_perm(entry, 0755);
            archive_entry_set_size(entry, 0);
            archive_write_header(a, entry);
        } else {
            archive_entry_set_filetype(entry, AE_IFREG);
            archive_entry_set_perm(entry, 0755);
            archive_entry_set_size(entry, static_cast<la_int64_t>(content.size()));
            archive_write_header(a, entry);
            archive_write_data(a, content.data(), content.size());
        }
        archive_entry_free(entry);
    }
    archive_write_close(a);
    archive_write_free(a);
}

// Writes a stored (uncompressed) zip with minizip-ng.
void writeZip(const std::filesystem::path& file,
              const std::vector<std::pair<std::string, std::string>>& entries) {
    void* writer = mz_zip_writer_create();
    ASSERT_NE(writer, nullptr);
    ASSERT_EQ(mz_zip_writer_open_file(writer, file.string().c_str(), 0, 0), MZ_OK);

    for (const auto& [name, content] : entries) {
        mz_zip_file info = {};
        info.version_madeby = MZ_VERSION_MADEBY;
        info.compression_method = MZ_COMPRESS_METHOD_STORE;
        info.filename = name.c_str();
        info.modified_date = std::time(nullptr);
        info.flag = MZ_ZIP_FLAG_UTF8;
        std::string data = content;
        EXPECT_EQ(mz_zip_writer_add_buffer(writer, data.data(), static_cast<int32_t>(data.size()), &info), MZ_OK)
            << name;
    }
    EXPECT_EQ(mz_zip_writer_close(writer), MZ_OK);
    mz_zip_writer_delete(&writer);
}

class ThreadedJobRunnerTest : public ::testing::Test {
protected:
    testutil::TemporaryDirectory tmp;
    Config config{tmp.Path()};
    testutil::FakeHttpManager http{config};
};

TEST_F(ThreadedJobRunnerTest, EventNames) {
    EXPECT_EQ(JdkManager::toString(JobEvent::Created), "task:created");
    EXPECT_EQ(JdkManager::toString(JobEvent::Started), "task:started");
    EXPECT_EQ(JdkManager::toString(JobEvent::Progress), "task:progress");
    EXPECT_EQ(JdkManager::toString(JobEvent::Completed), "task:completed");
    EXPECT_EQ(JdkManager::toString(JobEvent::Failed), "task:failed");
}

TEST_F(ThreadedJobRunnerTest, DownloadWritesIntoDownloadRoot) {
    http.respond("https://dl.test/jdk.tar.gz", 200, "payload");
    ThreadedJobRunner runner(config, http);

    std::mutex eventsMutex;
    std::vector<JobEvent> events;
    runner.setEventListener([&](const JobNotification& n) {
        std::lock_guard<std::mutex> lock(eventsMutex);
        events.push_back(n.event);
    });

    auto handle = runner.submit(JobSpec::download("https://dl.test/jdk.tar.gz", "Java-17-x64.tar.gz"));
    auto result = runner.awaitCompletion(handle);

    ASSERT_TRUE(result.ok()) << result.error;
    EXPECT_EQ(result.outputPath, config.downloadPath / "Java-17-x64.tar.gz");
    EXPECT_EQ(testutil::readFile(result.outputPath), "payload");

    std::lock_guard<std::mutex> lock(eventsMutex);
    ASSERT_GE(events.size(), 3u);
    EXPECT_EQ(events.front(), JobEvent::Created);
    EXPECT_EQ(events[1], JobEvent::Started);
    EXPECT_EQ(events.back(), JobEvent::Completed);
}

TEST_F(ThreadedJobRunnerTest, DownloadRefusesFileNameOutsideDownloadRoot) {
    http.respond("https://dl.test/jdk.tar.gz", 200, "payload");
    ThreadedJobRunner runner(config, http);

    for (const std::string fileName : {"../escape.tar.gz", "nested/jdk.tar.gz", "/tmp/jdk.tar.gz", ""}) {
        auto result = runner.awaitCompletion(runner.submit(JobSpec::download("https://dl.test/jdk.tar.gz", fileName)));
        EXPECT_EQ(result.status, JobStatus::Failed) << fileName;
        EXPECT_NE(result.error.find("Refusing unsafe download file name"), std::string::npos) << result.error;
    }
    EXPECT_TRUE(http.requested().empty());
    EXPECT_FALSE(std::filesystem::exists(tmp.Path() / "escape.tar.gz"));
    EXPECT_FALSE(std::filesystem::exists(config.downloadPath / "nested"));
}

TEST_F(ThreadedJobRunnerTest, FailedDownloadReportsError) {
    ThreadedJobRunner runner(config, http);
    auto result = runner.awaitCompletion(runner.submit(JobSpec::download("https://dl.test/missing", "missing.zip")));
    EXPECT_EQ(result.status, JobStatus::Failed);
    EXPECT_FALSE(result.error.empty());
    EXPECT_FALSE(std::filesystem::exists(config.downloadPath / "missing.zip"));
}

TEST_F(ThreadedJobRunnerTest, CancelledFromProgressCallback) {
    http.respond("https://dl.test/big", 200, "0123456789");
    ThreadedJobRunner runner(config, http);
    runner.setEventListener([&runner](const JobNotification& n) {
        if (n.event == JobEvent::Progress) {
            runner.cancel(JdkManager::JobHandle{n.jobId});
        }
    });

    auto result = runner.awaitCompletion(runner.submit(JobSpec::download("https://dl.test/big", "big.tar.gz")));
    EXPECT_EQ(result.status, JobStatus::Cancelled);
    EXPECT_FALSE(std::filesystem::exists(config.downloadPath / "big.tar.gz"));
}

TEST_F(ThreadedJobRunnerTest, UnknownHandleFails) {
    ThreadedJobRunner runner(config, http);
    EXPECT_FALSE(runner.cancel(JdkManager::JobHandle{"nope"}));
    auto result = runner.awaitCompletion(JdkManager::JobHandle{"nope"});
    EXPECT_FALSE(result.ok());
}

TEST_F(ThreadedJobRunnerTest, UnpacksTarball) {
    const auto archive = tmp.Path() / "OpenJDK17U.tar.gz";
    writeTarball(archive, {
        {"jdk-17.0.2+8/", ""},
        {"jdk-17.0.2+8/bin/", ""},
        {"jdk-17.0.2+8/bin/java", "#!/bin/sh\n"},
        {"jdk-17.0.2+8/release", "JAVA_VERSION=\"17.0.2\"\n"},
    });

    ThreadedJobRunner runner(config, http);
    const auto destination = tmp.Path() / "out";
    auto result = runner.awaitCompletion(runner.submit(JobSpec::unpack(archive, destination)));

    ASSERT_TRUE(result.ok()) << result.error;
    EXPECT_EQ(testutil::readFile(destination / "jdk-17.0.2+8" / "release"), "JAVA_VERSION=\"17.0.2\"\n");
    const auto java = destination / "jdk-17.0.2+8" / "bin" / "java";
    ASSERT_TRUE(std::filesystem::is_regular_file(java));
    EXPECT_NE(std::filesystem::status(java).permissions() & std::filesystem::perms::owner_exec,
              std::filesystem::perms::none);
}

TEST_F(ThreadedJobRunnerTest, RejectsEntriesEscapingDestination) {
    const auto archive = tmp.Path() / "evil.tar.gz";
    writeTarball(archive, {{"../escaped.txt", "gotcha"}});

    ThreadedJobRunner runner(config, http);
    auto result = runner.awaitCompletion(runner.submit(JobSpec::unpack(archive, tmp.Path() / "out")));

    EXPECT_EQ(result.status, JobStatus::Failed);
    EXPECT_FALSE(std::filesystem::exists(tmp.Path() / "escaped.txt"));
}

TEST_F(ThreadedJobRunnerTest, UnpacksZip) {
    const auto archive = tmp.Path() / "OpenJDK17U-jdk_x64_windows_hotspot_17.0.2_8.zip";
    // No directory entries: parents are created from the nested file names
    writeZip(archive, {
        {"jdk-17.0.2+8/bin/java", "#!/bin/sh\n"},
        {"jdk-17.0.2+8/release", "JAVA_VERSION=\"17.0.2\"\n"},
    });

    ThreadedJobRunner runner(config, http);
    const auto destination = tmp.Path() / "out";
    auto result = runner.awaitCompletion(runner.submit(JobSpec::unpack(archive, destination)));

    ASSERT_TRUE(result.ok()) << result.error;
    EXPECT_EQ(result.outputPath, destination);
    EXPECT_EQ(testutil::readFile(destination / "jdk-17.0.2+8" / "bin" / "java"), "#!/bin/sh\n");
    EXPECT_EQ(testutil::readFile(destination / "jdk-17.0.2+8" / "release"), "JAVA_VERSION=\"17.0.2\"\n");
}

TEST_F(ThreadedJobRunnerTest, RejectsZipEntriesEscapingDestination) {
    const auto archive = tmp.Path() / "evil.zip";
    writeZip(archive, {{"../escaped.txt", "gotcha"}});

    ThreadedJobRunner runner(config, http);
    auto result = runner.awaitCompletion(runner.submit(JobSpec::unpack(archive, tmp.Path() / "out")));

    EXPECT_EQ(result.status, JobStatus::Failed);
    EXPECT_NE(result.error.find("Refusing unsafe entry path"), std::string::npos) << result.error;
    EXPECT_FALSE(std::filesystem::exists(tmp.Path() / "escaped.txt"));
}

TEST_F(ThreadedJobRunnerTest, UnsupportedArchiveType) {
    const auto archive = tmp.Path() / "jdk.rar";
    testutil::writeFile(archive, "not an archive");

    ThreadedJobRunner runner(config, http);
    auto result = runner.awaitCompletion(runner.submit(JobSpec::unpack(archive, tmp.Path() / "out")));
    EXPECT_EQ(result.status, JobStatus::Failed);
    EXPECT_NE(result.error.find("Unsupported archive type"), std::string::npos);
}

TEST_F(ThreadedJobRunnerTest, CorruptZipFails) {
    const auto archive = tmp.Path() / "OpenJDK17U-jdk_x64_windows.zip";
    testutil::writeFile(archive, "PK but not really");

    ThreadedJobRunner runner(config, http);
    auto result = runner.awaitCompletion(runner.submit(JobSpec::unpack(archive, tmp.Path() / "out")));
    EXPECT_EQ(result.status, JobStatus::Failed);
    EXPECT_FALSE(result.error.empty());
}

TEST(TarArchiveTest, HandledExtensions) {
    EXPECT_TRUE(JdkManager::Utils::TarArchive::handles("OpenJDK21U-jdk_x64_linux.tar.gz"));
    EXPECT_TRUE(JdkManager::Utils::TarArchive::handles("jdk.tgz"));
    EXPECT_FALSE(JdkManager::Utils::TarArchive::handles("jdk.zip"));
}

} // namespace
