#include <gtest/gtest.h>
#include <JdkManager/AcquisitionPipeline.hpp>
#include <JdkManager/Errors.hpp>
#include "Fakes.hpp"

using JdkManager::AcquisitionPipeline;
using JdkManager::Config;
using JdkManager::JobKind;
using JdkManager::JobStatus;
using JdkManager::RemoteRelease;

namespace {

// sha256("abc")
const std::string kAbcSha256 = "BA7816BF8F01CFEA414140DE5DAE2223B00361A396177A9CB410FF61F20015AD";

class IntegrityTest : public ::testing::Test {
protected:
    testutil::TemporaryDirectory tmp;
    std::filesystem::path artifact;

    void SetUp() override {
        artifact = tmp.Path() / "OpenJDK17.tar.gz";
        testutil::writeFile(artifact, "abc");
    }
};

TEST_F(IntegrityTest, MatchingSizeAndChecksumPass) {
    auto verdict = AcquisitionPipeline::verify(artifact, 3, kAbcSha256);
    EXPECT_TRUE(verdict.passed);
    EXPECT_TRUE(verdict.reason.empty());
    EXPECT_TRUE(std::filesystem::exists(artifact));
}

TEST_F(IntegrityTest, EmptyChecksumSkipsHashing) {
    EXPECT_TRUE(AcquisitionPipeline::verify(artifact, 3, "").passed);
}

TEST_F(IntegrityTest, MutatedByteFailsChecksumAndRemovesArtifact) {
    testutil::writeFile(artifact, "abd");
    auto verdict = AcquisitionPipeline::verify(artifact, 3, kAbcSha256);
    EXPECT_FALSE(verdict.passed);
    EXPECT_EQ(verdict.reason, "checksum mismatch");
    EXPECT_FALSE(std::filesystem::exists(artifact));
}

TEST_F(IntegrityTest, SizeMismatchShortCircuits) {
    // A checksum that could never match proves the size check decided
    auto verdict = AcquisitionPipeline::verify(artifact, 4, "not-a-digest");
    EXPECT_FALSE(verdict.passed);
    EXPECT_EQ(verdict.reason, "size mismatch");
    EXPECT_FALSE(std::filesystem::exists(artifact));
}

TEST_F(IntegrityTest, MissingArtifact) {
    auto verdict = AcquisitionPipeline::verify(tmp.Path() / "nothing.zip", 3, kAbcSha256);
    EXPECT_FALSE(verdict.passed);
    EXPECT_EQ(verdict.reason, "artifact missing");
}

class AcquisitionPipelineTest : public ::testing::Test {
protected:
    testutil::TemporaryDirectory tmp;
    Config config{tmp.Path()};
    testutil::FakeJobRunner runner{config.downloadPath};
    RemoteRelease release;

    void SetUp() override {
        release.featureVersion = 17;
        release.releaseName = "jdk-17.0.2+8";
        release.packageName = "OpenJDK17U-jdk_x64_linux_hotspot_17.0.2_8.tar.gz";
        release.downloadUrl = "https://dl.test/OpenJDK17U.tar.gz";
        release.checksum = kAbcSha256;
        release.sizeBytes = 3;
        runner.payload = "abc";
    }

    std::vector<std::filesystem::path> unpackRootEntries() const {
        std::vector<std::filesystem::path> entries;
        std::error_code ec;
        for (std::filesystem::directory_iterator it(config.unpackPath, ec), end; !ec && it != end; it.increment(ec)) {
            entries.push_back(it->path().filename());
        }
        return entries;
    }
};

TEST_F(AcquisitionPipelineTest, SuccessfulAcquisitionExtractsIntoVersionFolder) {
    AcquisitionPipeline pipeline(config, runner);
    auto outcome = pipeline.acquire(release);

    ASSERT_TRUE(outcome.succeeded()) << outcome.error << outcome.verdict.reason;
    EXPECT_NO_THROW(outcome.throwIfFailed());
    EXPECT_EQ(outcome.artifactPath, config.downloadPath / release.packageName);
    EXPECT_EQ(*outcome.extractionDestination, config.unpackPath / "jdk-17");
    EXPECT_TRUE(std::filesystem::exists(config.unpackPath / "jdk-17" / "jdk-17.0.2+8" / "bin" / "java"));

    ASSERT_EQ(runner.submitted.size(), 2u);
    EXPECT_EQ(runner.submitted[0].kind, JobKind::Download);
    EXPECT_EQ(runner.submitted[0].url, release.downloadUrl);
    EXPECT_EQ(runner.submitted[1].kind, JobKind::Unpack);
    EXPECT_EQ(runner.submitted[1].archivePath, outcome.artifactPath);

    // Only the final folder remains, no staging leftovers
    EXPECT_EQ(unpackRootEntries(), (std::vector<std::filesystem::path>{"jdk-17"}));
}

TEST_F(AcquisitionPipelineTest, ExplicitFileNameIsUsed) {
    AcquisitionPipeline pipeline(config, runner);
    auto outcome = pipeline.acquire(release, "Java-17-x64.tar.gz");
    EXPECT_TRUE(outcome.succeeded());
    EXPECT_EQ(runner.submitted[0].fileName, "Java-17-x64.tar.gz");
}

TEST_F(AcquisitionPipelineTest, UnsafeArtifactNameTouchesNothing) {
    const auto outside = tmp.Path() / "keep.tar.gz";
    testutil::writeFile(outside, "precious");
    release.packageName = "../keep.tar.gz";

    AcquisitionPipeline pipeline(config, runner);
    auto outcome = pipeline.acquire(release);

    EXPECT_FALSE(outcome.succeeded());
    EXPECT_NE(outcome.error.find("refusing unsafe artifact name"), std::string::npos) << outcome.error;
    EXPECT_TRUE(runner.submitted.empty());
    EXPECT_EQ(testutil::readFile(outside), "precious");
}

TEST_F(AcquisitionPipelineTest, ChecksumMismatchNeverExtracts) {
    runner.payload = "abd";
    AcquisitionPipeline pipeline(config, runner);
    auto outcome = pipeline.acquire(release);

    EXPECT_FALSE(outcome.succeeded());
    EXPECT_EQ(outcome.verdict.reason, "checksum mismatch");
    EXPECT_FALSE(outcome.extractionDestination.has_value());
    EXPECT_FALSE(std::filesystem::exists(outcome.artifactPath));
    ASSERT_EQ(runner.submitted.size(), 1u);
    EXPECT_THROW(outcome.throwIfFailed(), JdkManager::IntegrityVerificationError);
}

TEST_F(AcquisitionPipelineTest, SizeMismatchNeverExtracts) {
    release.sizeBytes = 4;
    AcquisitionPipeline pipeline(config, runner);
    auto outcome = pipeline.acquire(release);

    EXPECT_EQ(outcome.verdict.reason, "size mismatch");
    EXPECT_FALSE(std::filesystem::exists(outcome.artifactPath));
    EXPECT_EQ(runner.submitted.size(), 1u);
}

TEST_F(AcquisitionPipelineTest, FailedDownloadRemovesPartialFile) {
    runner.downloadStatus = JobStatus::Failed;
    AcquisitionPipeline pipeline(config, runner);
    auto outcome = pipeline.acquire(release);

    EXPECT_FALSE(outcome.verdict.passed);
    EXPECT_FALSE(outcome.error.empty());
    EXPECT_FALSE(std::filesystem::exists(outcome.artifactPath));
    EXPECT_EQ(runner.submitted.size(), 1u);
    EXPECT_THROW(outcome.throwIfFailed(), JdkManager::JdkManagerError);
}

TEST_F(AcquisitionPipelineTest, CancelledDownloadLeavesNothingBehind) {
    runner.downloadStatus = JobStatus::Cancelled;
    AcquisitionPipeline pipeline(config, runner);
    auto outcome = pipeline.acquire(release);

    EXPECT_EQ(outcome.verdict.reason, "download cancelled");
    EXPECT_FALSE(std::filesystem::exists(outcome.artifactPath));
    EXPECT_TRUE(unpackRootEntries().empty());
}

TEST_F(AcquisitionPipelineTest, FailedExtractionKeepsPreviousInstall) {
    testutil::makeRuntime(config.unpackPath / "jdk-17", "jdk-17.0.1+12");
    runner.unpackStatus = JobStatus::Failed;

    AcquisitionPipeline pipeline(config, runner);
    auto outcome = pipeline.acquire(release);

    EXPECT_TRUE(outcome.verdict.passed);
    EXPECT_FALSE(outcome.succeeded());
    EXPECT_FALSE(outcome.error.empty());
    EXPECT_TRUE(std::filesystem::exists(config.unpackPath / "jdk-17" / "jdk-17.0.1+12" / "bin" / "java"));
    EXPECT_EQ(unpackRootEntries(), (std::vector<std::filesystem::path>{"jdk-17"}));
}

TEST_F(AcquisitionPipelineTest, ReacquisitionReplacesPreviousInstall) {
    testutil::makeRuntime(config.unpackPath / "jdk-17", "jdk-17.0.1+12");

    AcquisitionPipeline pipeline(config, runner);
    auto outcome = pipeline.acquire(release);

    ASSERT_TRUE(outcome.succeeded());
    EXPECT_FALSE(std::filesystem::exists(config.unpackPath / "jdk-17" / "jdk-17.0.1+12"));
    EXPECT_TRUE(std::filesystem::exists(config.unpackPath / "jdk-17" / "jdk-17.0.2+8" / "bin" / "java"));
    // The old install was moved aside and then discarded
    EXPECT_EQ(unpackRootEntries(), (std::vector<std::filesystem::path>{"jdk-17"}));
}

TEST_F(AcquisitionPipelineTest, FailedSwapRestoresPreviousInstall) {
    testutil::makeRuntime(config.unpackPath / "jdk-17", "jdk-17.0.1+12");
    // Losing the staging folder makes the final rename fail
    runner.afterUnpack = [](const JdkManager::JobSpec& spec) {
        std::filesystem::remove_all(spec.destination);
    };

    AcquisitionPipeline pipeline(config, runner);
    auto outcome = pipeline.acquire(release);

    EXPECT_TRUE(outcome.verdict.passed);
    EXPECT_FALSE(outcome.succeeded());
    EXPECT_NE(outcome.error.find("failed to move extraction"), std::string::npos) << outcome.error;
    EXPECT_FALSE(outcome.extractionDestination.has_value());
    EXPECT_TRUE(std::filesystem::exists(config.unpackPath / "jdk-17" / "jdk-17.0.1+12" / "bin" / "java"));
    EXPECT_EQ(unpackRootEntries(), (std::vector<std::filesystem::path>{"jdk-17"}));
}

TEST_F(AcquisitionPipelineTest, CancelReachesJobInFlight) {
    AcquisitionPipeline pipeline(config, runner);
    std::vector<bool> cancelResults;
    runner.onAwait = [&](const JdkManager::JobHandle& /*handle*/) {
        if (cancelResults.empty()) {
            cancelResults.push_back(pipeline.cancel());
        }
    };

    pipeline.acquire(release);

    ASSERT_EQ(cancelResults.size(), 1u);
    EXPECT_TRUE(cancelResults.front());
    EXPECT_EQ(runner.cancelled, (std::vector<std::string>{"job-1"}));
    // Nothing is in flight once acquire() has returned
    EXPECT_FALSE(pipeline.cancel());
}

TEST_F(AcquisitionPipelineTest, ArtifactLocksAreReleasedAfterUse) {
    testutil::CapturedLog log("AcquisitionPipeline");
    AcquisitionPipeline pipeline(config, runner);

    ASSERT_TRUE(pipeline.acquire(release, "first.tar.gz").succeeded());
    ASSERT_TRUE(pipeline.acquire(release, "second.tar.gz").succeeded());

    const std::string text = log.text();
    EXPECT_NE(text.find("Holding artifact lock for first.tar.gz (1 active)"), std::string::npos) << text;
    EXPECT_NE(text.find("Holding artifact lock for second.tar.gz (1 active)"), std::string::npos) << text;
}

TEST(AcquisitionOutcomeTest, JsonReportsVerdict) {
    JdkManager::AcquisitionOutcome outcome;
    outcome.release.featureVersion = 21;
    outcome.verdict = JdkManager::VerificationVerdict::fail("size mismatch");
    auto j = outcome.to_json();
    EXPECT_FALSE(j.at("verified").get<bool>());
    EXPECT_EQ(j.at("reason").get<std::string>(), "size mismatch");
    EXPECT_FALSE(j.at("succeeded").get<bool>());
    EXPECT_FALSE(j.contains("extractionDestination"));
}

} // namespace
