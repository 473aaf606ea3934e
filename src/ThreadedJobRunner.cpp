// src/ThreadedJobRunner.cpp
#include <JdkManager/ThreadedJobRunner.hpp>
#include <JdkManager/HttpManager.hpp>
#include <JdkManager/Utils/Logger.hpp>
#include <JdkManager/Utils/PathSafety.hpp>
#include <JdkManager/Utils/TarArchive.hpp>
#include <JdkManager/Utils/ZipFile.hpp>

#include <chrono>

namespace JdkManager {

std::string toString(JobKind kind) {
    switch (kind) {
        case JobKind::Download: return "download";
        case JobKind::Unpack: return "unpack";
    }
    return "unknown";
}

std::string toString(JobEvent event) {
    switch (event) {
        case JobEvent::Created: return "task:created";
        case JobEvent::Started: return "task:started";
        case JobEvent::Progress: return "task:progress";
        case JobEvent::Completed: return "task:completed";
        case JobEvent::Failed: return "task:failed";
        case JobEvent::Cancelled: return "task:cancelled";
    }
    return "task:unknown";
}

JobSpec JobSpec::download(const std::string& url, const std::string& fileName) {
    JobSpec spec;
    spec.kind = JobKind::Download;
    spec.url = url;
    spec.fileName = fileName;
    return spec;
}

JobSpec JobSpec::unpack(const std::filesystem::path& archivePath, const std::filesystem::path& destination) {
    JobSpec spec;
    spec.kind = JobKind::Unpack;
    spec.archivePath = archivePath;
    spec.destination = destination;
    return spec;
}

ThreadedJobRunner::ThreadedJobRunner(const Config& config, HttpManager& httpManager)
    : m_config(config), m_httpManager(httpManager) {
    m_logger = Utils::Logger::GetOrCreateLogger("JobRunner");
}

ThreadedJobRunner::~ThreadedJobRunner() {
    std::map<std::string, std::shared_ptr<Job>> remaining;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        remaining.swap(m_jobs);
    }
    for (auto& [id, job] : remaining) {
        job->cancelRequested = true;
        if (job->worker.joinable()) {
            job->worker.join();
        }
    }
}

void ThreadedJobRunner::setEventListener(JobEventListener listener) {
    std::lock_guard<std::mutex> lock(m_listenerMutex);
    m_listener = std::move(listener);
}

void ThreadedJobRunner::emit(const JobNotification& notification) {
    JobEventListener listener;
    {
        std::lock_guard<std::mutex> lock(m_listenerMutex);
        listener = m_listener;
    }
    if (listener) {
        listener(notification);
    }
}

JobHandle ThreadedJobRunner::submit(const JobSpec& spec) {
    auto job = std::make_shared<Job>();
    job->spec = spec;
    job->result = job->promise.get_future().share();

    std::string jobId;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        jobId = toString(spec.kind) + "-" + std::to_string(m_nextId++);
        m_jobs.emplace(jobId, job);
    }

    m_logger->debug("Job {} created.", jobId);
    emit({jobId, spec.kind, JobEvent::Created, 0, 0, ""});

    job->worker = std::thread([this, jobId, job] { run(jobId, job); });
    return JobHandle{jobId};
}

JobResult ThreadedJobRunner::awaitCompletion(const JobHandle& handle) {
    std::shared_ptr<Job> job;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_jobs.find(handle.jobId);
        if (it == m_jobs.end()) {
            JobResult unknown;
            unknown.error = "Unknown job id: " + handle.jobId;
            return unknown;
        }
        job = it->second;
    }

    JobResult result = job->result.get();
    if (job->worker.joinable()) {
        job->worker.join();
    }
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_jobs.erase(handle.jobId);
    }
    return result;
}

bool ThreadedJobRunner::cancel(const JobHandle& handle) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_jobs.find(handle.jobId);
    if (it == m_jobs.end()) {
        return false;
    }
    if (it->second->result.wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
        return false;
    }
    it->second->cancelRequested = true;
    m_logger->info("Cancellation requested for job {}.", handle.jobId);
    return true;
}

void ThreadedJobRunner::run(const std::string& jobId, const std::shared_ptr<Job>& job) {
    emit({jobId, job->spec.kind, JobEvent::Started, 0, 0, ""});

    JobResult result;
    try {
        result = job->spec.kind == JobKind::Download ? runDownload(jobId, *job) : runUnpack(jobId, *job);
    } catch (const std::exception& e) {
        result.status = JobStatus::Failed;
        result.error = e.what();
    }

    if (result.status != JobStatus::Succeeded && job->cancelRequested) {
        result.status = JobStatus::Cancelled;
    }

    switch (result.status) {
        case JobStatus::Succeeded:
            m_logger->debug("Job {} completed: {}", jobId, result.outputPath.string());
            emit({jobId, job->spec.kind, JobEvent::Completed, 0, 0, result.outputPath.string()});
            break;
        case JobStatus::Cancelled:
            m_logger->warn("Job {} cancelled.", jobId);
            emit({jobId, job->spec.kind, JobEvent::Cancelled, 0, 0, result.error});
            break;
        case JobStatus::Failed:
            m_logger->error("Job {} failed: {}", jobId, result.error);
            emit({jobId, job->spec.kind, JobEvent::Failed, 0, 0, result.error});
            break;
    }
    job->promise.set_value(std::move(result));
}

JobResult ThreadedJobRunner::runDownload(const std::string& jobId, Job& job) {
    JobResult result;
    // The file must land directly inside the download root
    if (!Utils::isSafeRelativePath(job.spec.fileName) ||
        std::filesystem::path(job.spec.fileName).has_parent_path()) {
        result.error = "Refusing unsafe download file name: " + job.spec.fileName;
        m_logger->error("Job {}: {}", jobId, result.error);
        return result;
    }
    result.outputPath = m_config.downloadPath / job.spec.fileName;

    std::error_code ec;
    std::filesystem::create_directories(m_config.downloadPath, ec);
    if (ec) {
        result.error = "Failed to create download directory " + m_config.downloadPath.string() + ": " + ec.message();
        return result;
    }

    JobKind kind = job.spec.kind;
    cpr::Response response = m_httpManager.Download(result.outputPath, cpr::Url{job.spec.url},
        [this, &job, &jobId, kind](std::uint64_t done, std::uint64_t total) {
            emit({jobId, kind, JobEvent::Progress, done, total, ""});
            return !job.cancelRequested.load();
        });

    if (!HttpManager::isSuccess(response)) {
        // HttpManager removes partial files, but an aborted callback can race the final write.
        std::filesystem::remove(result.outputPath, ec);
        result.error = "Failed to download Java release: status " + std::to_string(response.status_code) +
                       (response.error.message.empty() ? "" : " (" + response.error.message + ")");
        return result;
    }
    result.status = JobStatus::Succeeded;
    return result;
}

JobResult ThreadedJobRunner::runUnpack(const std::string& jobId, Job& job) {
    JobResult result;
    std::error_code ec;
    std::filesystem::path destination = std::filesystem::weakly_canonical(std::filesystem::absolute(job.spec.destination), ec);
    if (ec) {
        destination = job.spec.destination;
    }
    result.outputPath = destination;

    auto shouldContinue = [&job] { return !job.cancelRequested.load(); };
    const std::string archiveName = job.spec.archivePath.filename().string();

    m_logger->info("Job {}: extracting {} to {}", jobId, archiveName, destination.string());
    if (Utils::TarArchive::handles(job.spec.archivePath)) {
        Utils::TarArchive tarball(job.spec.archivePath);
        if (!tarball.extractAll(destination, shouldContinue)) {
            result.error = tarball.getLastError();
            return result;
        }
    } else if (job.spec.archivePath.extension() == ".zip") {
        Utils::ZipFile zip(job.spec.archivePath);
        if (!zip.extractAll(destination, shouldContinue)) {
            result.error = zip.getLastError();
            return result;
        }
    } else {
        result.error = "Unsupported archive type: " + archiveName;
        return result;
    }

    result.status = JobStatus::Succeeded;
    return result;
}

} // namespace JdkManager
