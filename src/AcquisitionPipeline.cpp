// src/AcquisitionPipeline.cpp
#include <JdkManager/AcquisitionPipeline.hpp>
#include <JdkManager/Utils/Crypto.hpp>
#include <JdkManager/Utils/Logger.hpp>
#include <JdkManager/Utils/PathSafety.hpp>

#include <atomic>
#include <map>
#include <memory>

namespace JdkManager {

namespace {
    // Serialises acquisitions writing the same artifact name within this process.
    // A registry entry lives only while some acquisition holds or waits for it.
    class ArtifactLock {
    public:
        explicit ArtifactLock(std::string fileName) : m_fileName(std::move(fileName)) {
            {
                std::lock_guard<std::mutex> lock(registryMutex());
                auto& entry = registry()[m_fileName];
                if (!entry) {
                    entry = std::make_shared<Entry>();
                }
                ++entry->users;
                m_entry = entry;
            }
            m_entry->mutex.lock();
        }

        ~ArtifactLock() {
            m_entry->mutex.unlock();
            std::lock_guard<std::mutex> lock(registryMutex());
            if (--m_entry->users == 0) {
                registry().erase(m_fileName);
            }
        }

        ArtifactLock(const ArtifactLock&) = delete;
        ArtifactLock& operator=(const ArtifactLock&) = delete;

        static std::size_t activeCount() {
            std::lock_guard<std::mutex> lock(registryMutex());
            return registry().size();
        }

    private:
        struct Entry {
            std::mutex mutex;
            std::size_t users = 0; // guarded by registryMutex()
        };

        static std::mutex& registryMutex() {
            static std::mutex mutex;
            return mutex;
        }

        static std::map<std::string, std::shared_ptr<Entry>>& registry() {
            static std::map<std::string, std::shared_ptr<Entry>> entries;
            return entries;
        }

        std::string m_fileName;
        std::shared_ptr<Entry> m_entry;
    };

    std::string fileNameFromUrl(const std::string& url) {
        std::string path = url.substr(0, url.find_first_of("?#"));
        auto slash = path.find_last_of('/');
        return slash == std::string::npos ? path : path.substr(slash + 1);
    }

    void removeArtifact(const std::filesystem::path& artifact) {
        std::error_code ec;
        std::filesystem::remove(artifact, ec);
        if (ec) {
            Utils::Logger::GetOrCreateLogger("AcquisitionPipeline")
                ->warn("Failed to remove artifact {}: {}", artifact.string(), ec.message());
        }
    }
}

AcquisitionPipeline::AcquisitionPipeline(const Config& config, IJobRunner& jobRunner)
    : m_config(config), m_jobRunner(jobRunner) {
    m_logger = Utils::Logger::GetOrCreateLogger("AcquisitionPipeline");
}

std::filesystem::path AcquisitionPipeline::destinationFor(const RemoteRelease& release) const {
    std::filesystem::path destination = m_config.unpackPath / ("jdk-" + std::to_string(release.featureVersion));
    return std::filesystem::absolute(destination).lexically_normal();
}

JobResult AcquisitionPipeline::runJob(const JobSpec& spec) {
    JobHandle handle = m_jobRunner.submit(spec);
    {
        std::lock_guard<std::mutex> lock(m_inFlightMutex);
        m_inFlight.emplace(handle.jobId, handle);
    }
    JobResult result = m_jobRunner.awaitCompletion(handle);
    {
        std::lock_guard<std::mutex> lock(m_inFlightMutex);
        m_inFlight.erase(handle.jobId);
    }
    return result;
}

bool AcquisitionPipeline::cancel() {
    std::lock_guard<std::mutex> lock(m_inFlightMutex);
    bool cancelled = false;
    for (const auto& [jobId, handle] : m_inFlight) {
        if (m_jobRunner.cancel(handle)) {
            cancelled = true;
        }
    }
    return cancelled;
}

AcquisitionOutcome AcquisitionPipeline::acquire(const RemoteRelease& release, const std::string& destinationFileName) {
    AcquisitionOutcome outcome;
    outcome.release = release;

    std::string fileName = destinationFileName;
    if (fileName.empty()) {
        fileName = release.packageName.empty() ? fileNameFromUrl(release.downloadUrl) : release.packageName;
    }
    if (!Utils::isSafeRelativePath(fileName) || std::filesystem::path(fileName).has_parent_path()) {
        outcome.error = "refusing unsafe artifact name: " + fileName;
        outcome.verdict = VerificationVerdict::fail(outcome.error);
        m_logger->error("Acquisition of Java {} failed: {}", release.featureVersion, outcome.error);
        return outcome;
    }
    outcome.artifactPath = std::filesystem::absolute(m_jobRunner.downloadRoot() / fileName).lexically_normal();

    ArtifactLock nameLock(fileName);
    m_logger->debug("Holding artifact lock for {} ({} active)", fileName, ArtifactLock::activeCount());

    m_logger->info("Acquiring Java {} ({}) from {}", release.featureVersion, release.releaseName, release.downloadUrl);
    JobResult download = runJob(JobSpec::download(release.downloadUrl, fileName));
    if (!download.ok()) {
        removeArtifact(outcome.artifactPath);
        if (download.status == JobStatus::Cancelled) {
            outcome.verdict = VerificationVerdict::fail("download cancelled");
            outcome.error = "download cancelled";
        } else {
            outcome.verdict = VerificationVerdict::fail("download failed: " + download.error);
            outcome.error = "download failed: " + download.error;
        }
        m_logger->error("Acquisition of Java {} failed: {}", release.featureVersion, outcome.error);
        return outcome;
    }
    if (!download.outputPath.empty()) {
        outcome.artifactPath = std::filesystem::absolute(download.outputPath).lexically_normal();
    }

    outcome.verdict = verify(outcome.artifactPath, release.sizeBytes, release.checksum);
    if (!outcome.verdict.passed) {
        m_logger->error("Verification of {} failed: {}", outcome.artifactPath.string(), outcome.verdict.reason);
        return outcome;
    }
    m_logger->info("Verified {}", outcome.artifactPath.filename().string());

    extract(outcome);
    return outcome;
}

bool AcquisitionPipeline::extract(AcquisitionOutcome& outcome) {
    static std::atomic<unsigned long> stagingCounter{0};

    const std::string attempt = std::to_string(++stagingCounter);
    const std::filesystem::path destination = destinationFor(outcome.release);
    const std::filesystem::path staging = destination.parent_path() /
        ("." + destination.filename().string() + "-staging-" + attempt);

    std::error_code ec;
    std::filesystem::remove_all(staging, ec);
    std::filesystem::create_directories(staging, ec);
    if (ec) {
        outcome.error = "failed to create " + staging.string() + ": " + ec.message();
        m_logger->error("{}", outcome.error);
        return false;
    }

    JobResult unpack = runJob(JobSpec::unpack(outcome.artifactPath, staging));
    if (!unpack.ok()) {
        std::filesystem::remove_all(staging, ec);
        outcome.error = unpack.status == JobStatus::Cancelled ? "extraction cancelled" : "extraction failed: " + unpack.error;
        m_logger->error("Extraction of {} failed: {}", outcome.artifactPath.string(), outcome.error);
        return false;
    }

    // An existing install is moved aside, not deleted, until the new one is in place.
    std::filesystem::path previous;
    if (std::filesystem::exists(std::filesystem::symlink_status(destination, ec))) {
        previous = destination.parent_path() /
            ("." + destination.filename().string() + "-previous-" + attempt);
        std::filesystem::remove_all(previous, ec);
        std::filesystem::rename(destination, previous, ec);
        if (ec) {
            outcome.error = "failed to replace " + destination.string() + ": " + ec.message();
            std::filesystem::remove_all(staging, ec);
            m_logger->error("{}", outcome.error);
            return false;
        }
    }

    std::filesystem::rename(staging, destination, ec);
    if (ec) {
        outcome.error = "failed to move extraction into " + destination.string() + ": " + ec.message();
        std::filesystem::remove_all(staging, ec);
        if (!previous.empty()) {
            std::filesystem::rename(previous, destination, ec);
            if (ec) {
                m_logger->error("Failed to restore previous install {}: {}", previous.string(), ec.message());
            }
        }
        m_logger->error("{}", outcome.error);
        return false;
    }

    if (!previous.empty()) {
        std::filesystem::remove_all(previous, ec);
        if (ec) {
            m_logger->warn("Failed to remove previous install {}: {}", previous.string(), ec.message());
        }
    }

    outcome.extractionDestination = destination;
    m_logger->info("Java {} extracted to {}", outcome.release.featureVersion, destination.string());
    return true;
}

VerificationVerdict AcquisitionPipeline::verify(const std::filesystem::path& artifact,
                                                std::uint64_t expectedSize,
                                                const std::string& expectedChecksum) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(artifact, ec)) {
        return VerificationVerdict::fail("artifact missing");
    }

    const auto actualSize = std::filesystem::file_size(artifact, ec);
    if (ec || actualSize != expectedSize) {
        removeArtifact(artifact);
        return VerificationVerdict::fail("size mismatch");
    }

    if (!expectedChecksum.empty()) {
        const std::string actual = Utils::calculateFileSHA256(artifact.string());
        if (actual.empty() || !Utils::digestsEqual(actual, expectedChecksum)) {
            removeArtifact(artifact);
            return VerificationVerdict::fail("checksum mismatch");
        }
    }
    return VerificationVerdict::pass();
}

} // namespace JdkManager
