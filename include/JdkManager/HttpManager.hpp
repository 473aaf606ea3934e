// include/JdkManager/HttpManager.hpp
#ifndef JDKM_HTTP_MANAGER_HPP
#define JDKM_HTTP_MANAGER_HPP

#include <JdkManager/Config.hpp>
#include <cpr/cpr.h>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <spdlog/logger.h>

namespace JdkManager {

    class HttpManager {
    public:
        // Called with (bytes received, total bytes or 0 when unknown). Returning false aborts the transfer.
        using ProgressFn = std::function<bool(std::uint64_t, std::uint64_t)>;

        explicit HttpManager(const Config& config);
        virtual ~HttpManager();

        HttpManager(const HttpManager&) = delete;
        HttpManager& operator=(const HttpManager&) = delete;

        virtual cpr::Response Get(const cpr::Url& url, const cpr::Parameters& parameters = {});

        // Download to a specified filepath. A failed or aborted transfer leaves no file behind.
        virtual cpr::Response Download(const std::filesystem::path& filepath, const cpr::Url& url,
                                       const ProgressFn& onProgress = {});

        static bool isSuccess(const cpr::Response& response);

    private:
        cpr::SslOptions m_sslOptions;
        cpr::UserAgent m_userAgent;
        cpr::Timeout m_timeout;
        std::shared_ptr<spdlog::logger> m_logger;

        // A new session per request keeps concurrent callers independent
        cpr::Session CreateSession() const;
    };

} // namespace JdkManager

#endif // JDKM_HTTP_MANAGER_HPP
