// include/JdkManager/JobRunner.hpp
#ifndef JDKM_JOB_RUNNER_HPP
#define JDKM_JOB_RUNNER_HPP

#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>

namespace JdkManager {

    enum class JobKind {
        Download,
        Unpack
    };

    enum class JobEvent {
        Created,
        Started,
        Progress,
        Completed,
        Failed,
        Cancelled
    };

    std::string toString(JobKind kind);
    // "task:created", "task:started", ...
    std::string toString(JobEvent event);

    struct JobSpec {
        JobKind kind = JobKind::Download;

        // Download: saved as <download root>/<fileName>
        std::string url;
        std::string fileName;

        // Unpack
        std::filesystem::path archivePath;
        std::filesystem::path destination;

        static JobSpec download(const std::string& url, const std::string& fileName);
        static JobSpec unpack(const std::filesystem::path& archivePath, const std::filesystem::path& destination);
    };

    struct JobHandle {
        std::string jobId;
    };

    enum class JobStatus {
        Succeeded,
        Failed,
        Cancelled
    };

    struct JobResult {
        JobStatus status = JobStatus::Failed;
        std::filesystem::path outputPath; // downloaded file or unpack destination
        std::string error;

        bool ok() const { return status == JobStatus::Succeeded; }
    };

    struct JobNotification {
        std::string jobId;
        JobKind kind = JobKind::Download;
        JobEvent event = JobEvent::Created;
        std::uint64_t bytesDone = 0;
        std::uint64_t bytesTotal = 0;
        std::string message;
    };

    using JobEventListener = std::function<void(const JobNotification&)>;

    // Asynchronous byte-level work (downloads, archive extraction). Callers only ever
    // submit, await and cancel; how jobs are queued and executed is up to the implementation.
    class IJobRunner {
    public:
        virtual ~IJobRunner() = default;

        // Returns immediately; the job runs in the background.
        virtual JobHandle submit(const JobSpec& spec) = 0;

        // Blocks until the job has finished. Each handle may be awaited once.
        virtual JobResult awaitCompletion(const JobHandle& handle) = 0;

        // Requests cancellation. Returns false for unknown or already finished jobs.
        virtual bool cancel(const JobHandle& handle) = 0;

        // Listener may be called from worker threads.
        virtual void setEventListener(JobEventListener listener) = 0;

        virtual std::filesystem::path downloadRoot() const = 0;
    };

} // namespace JdkManager

#endif // JDKM_JOB_RUNNER_HPP
