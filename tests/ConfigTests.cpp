#include <gtest/gtest.h>
#include <JdkManager/Config.hpp>
#include <JdkManager/Errors.hpp>
#include "TestUtils.hpp"

using JdkManager::Config;

namespace {

TEST(ConfigTest, RootsDeriveFromWorkDir) {
    Config config("/srv/jdkm");
    EXPECT_EQ(config.downloadPath, std::filesystem::path("/srv/jdkm/downloads"));
    EXPECT_EQ(config.unpackPath, std::filesystem::path("/srv/jdkm/unpacked"));
    EXPECT_EQ(config.backupPath, std::filesystem::path("/srv/jdkm/backups"));
    EXPECT_EQ(config.installRoot, config.unpackPath);
    EXPECT_EQ(config.maxConcurrentRequests, 4u);
}

TEST(ConfigTest, DefaultWorkDirIsTempUnderCwd) {
    EXPECT_EQ(Config::defaultWorkDir(), std::filesystem::current_path() / "temp");
}

TEST(ConfigTest, WithRootsOverridesOnlyGivenPaths) {
    Config config("/srv/jdkm");
    config.withRoots("/data/dl", "");
    EXPECT_EQ(config.downloadPath, std::filesystem::path("/data/dl"));
    EXPECT_EQ(config.unpackPath, std::filesystem::path("/srv/jdkm/unpacked"));

    config.withRoots("", "/data/jdks");
    EXPECT_EQ(config.installRoot, std::filesystem::path("/data/jdks"));

    // Reset
    config.setWorkDir("/srv/jdkm");
    EXPECT_EQ(config.downloadPath, std::filesystem::path("/srv/jdkm/downloads"));
}

TEST(ConfigTest, FromJsonKeepsDefaultsForMissingKeys) {
    auto config = Config::from_json(JdkManager::json{
        {"workDir", "/opt/jdkm"},
        {"installRoot", "/usr/lib/jvm"},
        {"maxConcurrentRequests", 0},
        {"os", "mac"}
    });
    EXPECT_EQ(config.unpackPath, std::filesystem::path("/opt/jdkm/unpacked"));
    EXPECT_EQ(config.installRoot, std::filesystem::path("/usr/lib/jvm"));
    EXPECT_EQ(config.maxConcurrentRequests, 1u);
    EXPECT_EQ(config.registryBaseUrl, "https://api.adoptium.net/v3");
    ASSERT_TRUE(config.osOverride.has_value());
    EXPECT_EQ(*config.osOverride, "mac");
    EXPECT_FALSE(config.archOverride.has_value());
}

TEST(ConfigTest, LoadFromFileErrors) {
    testutil::TemporaryDirectory tmp;
    EXPECT_THROW(Config::loadFromFile(tmp.Path() / "missing.json"), JdkManager::JdkManagerError);

    testutil::writeFile(tmp.Path() / "broken.json", "{ not json");
    EXPECT_THROW(Config::loadFromFile(tmp.Path() / "broken.json"), JdkManager::JdkManagerError);

    testutil::writeFile(tmp.Path() / "ok.json", R"({"registryBaseUrl": "https://mirror.test/v3"})");
    EXPECT_EQ(Config::loadFromFile(tmp.Path() / "ok.json").registryBaseUrl, "https://mirror.test/v3");
}

TEST(ConfigTest, EnsureDirectoriesCreatesRoots) {
    testutil::TemporaryDirectory tmp;
    Config config(tmp.Path() / "work");
    config.ensureDirectories();
    EXPECT_TRUE(std::filesystem::is_directory(config.downloadPath));
    EXPECT_TRUE(std::filesystem::is_directory(config.unpackPath));
    EXPECT_TRUE(std::filesystem::is_directory(config.backupPath));
}

} // namespace
