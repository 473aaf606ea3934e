// include/JdkManager/AcquisitionPipeline.hpp
#ifndef JDKM_ACQUISITION_PIPELINE_HPP
#define JDKM_ACQUISITION_PIPELINE_HPP

#include <JdkManager/Config.hpp>
#include <JdkManager/JobRunner.hpp>
#include <JdkManager/Types/AcquisitionOutcome.hpp>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <spdlog/logger.h>
#include <string>

namespace JdkManager {

    // Download -> verify -> extract for a single release. Only one job is outstanding per
    // acquire() call, but concurrent acquire() calls may share one pipeline; extraction is
    // never attempted for an artifact that failed verification.
    class AcquisitionPipeline {
    public:
        AcquisitionPipeline(const Config& config, IJobRunner& jobRunner);

        // destinationFileName defaults to the release's package name (or the last URL segment).
        // Extracts into <unpack root>/jdk-<N>.
        AcquisitionOutcome acquire(const RemoteRelease& release, const std::string& destinationFileName = "");

        // Size first, then SHA-256 when expectedChecksum is non-empty. A failing artifact is deleted.
        static VerificationVerdict verify(const std::filesystem::path& artifact,
                                          std::uint64_t expectedSize,
                                          const std::string& expectedChecksum);

        // Cancels every job this pipeline has in flight. False when none was cancelled.
        bool cancel();

        std::filesystem::path destinationFor(const RemoteRelease& release) const;

    private:
        const Config& m_config;
        IJobRunner& m_jobRunner;
        std::shared_ptr<spdlog::logger> m_logger;

        std::mutex m_inFlightMutex;
        std::map<std::string, JobHandle> m_inFlight; // by job id

        JobResult runJob(const JobSpec& spec);
        bool extract(AcquisitionOutcome& outcome);
    };

} // namespace JdkManager

#endif // JDKM_ACQUISITION_PIPELINE_HPP
