// include/JdkManager/ThreadedJobRunner.hpp
#ifndef JDKM_THREADED_JOB_RUNNER_HPP
#define JDKM_THREADED_JOB_RUNNER_HPP

#include <JdkManager/Config.hpp>
#include <JdkManager/JobRunner.hpp>
#include <atomic>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <spdlog/logger.h>
#include <thread>

namespace JdkManager {

    class HttpManager; // Forward declaration

    // One worker thread per job. Downloads go through HttpManager, extraction picks
    // minizip-ng for .zip and libarchive for tarballs.
    class ThreadedJobRunner : public IJobRunner {
    public:
        ThreadedJobRunner(const Config& config, HttpManager& httpManager);
        ~ThreadedJobRunner() override;

        JobHandle submit(const JobSpec& spec) override;
        JobResult awaitCompletion(const JobHandle& handle) override;
        bool cancel(const JobHandle& handle) override;
        void setEventListener(JobEventListener listener) override;
        std::filesystem::path downloadRoot() const override { return m_config.downloadPath; }

    private:
        struct Job {
            JobSpec spec;
            std::atomic<bool> cancelRequested{false};
            std::promise<JobResult> promise;
            std::shared_future<JobResult> result;
            std::thread worker;
        };

        const Config& m_config;
        HttpManager& m_httpManager;
        std::shared_ptr<spdlog::logger> m_logger;

        std::mutex m_mutex;
        std::map<std::string, std::shared_ptr<Job>> m_jobs;
        std::uint64_t m_nextId = 1;

        std::mutex m_listenerMutex;
        JobEventListener m_listener;

        void run(const std::string& jobId, const std::shared_ptr<Job>& job);
        JobResult runDownload(const std::string& jobId, Job& job);
        JobResult runUnpack(const std::string& jobId, Job& job);
        void emit(const JobNotification& notification);
    };

} // namespace JdkManager

#endif // JDKM_THREADED_JOB_RUNNER_HPP
