// src/HttpManager.cpp
#include <JdkManager/HttpManager.hpp>
#include <JdkManager/Utils/Logger.hpp>
#include <fstream>

namespace JdkManager {

HttpManager::HttpManager(const Config& config)
    : m_userAgent(config.userAgent), m_timeout(config.requestTimeoutMs) {
    m_logger = Utils::Logger::GetOrCreateLogger("HttpManager");

    if (config.caBundlePath && !config.caBundlePath->empty()) {
        m_logger->debug("Configuring SslOptions with CA bundle {}.", config.caBundlePath->string());
        m_sslOptions = cpr::Ssl(
            cpr::ssl::CaInfo{config.caBundlePath->string()},
            cpr::ssl::VerifyHost{true},
            cpr::ssl::VerifyPeer{true}
        );
    } else {
        m_sslOptions = cpr::Ssl(
            cpr::ssl::VerifyHost{true},
            cpr::ssl::VerifyPeer{true}
        );
    }
    m_logger->trace("HttpManager initialized.");
}

HttpManager::~HttpManager() = default;

bool HttpManager::isSuccess(const cpr::Response& response) {
    return response.error.code == cpr::ErrorCode::OK && response.status_code >= 200 && response.status_code < 300;
}

cpr::Session HttpManager::CreateSession() const {
    cpr::Session session;
    session.SetSslOptions(m_sslOptions);
    session.SetUserAgent(m_userAgent);
    return session;
}

cpr::Response HttpManager::Get(const cpr::Url& url, const cpr::Parameters& parameters) {
    m_logger->trace("GET: {}", url.str());
    cpr::Session session = CreateSession();
    session.SetUrl(url);
    session.SetParameters(parameters);
    session.SetTimeout(m_timeout);
    cpr::Response response = session.Get();
    if (!isSuccess(response)) {
        m_logger->debug("GET {} failed. Status: {}, Error: \"{}\"", url.str(), response.status_code, response.error.message);
    }
    return response;
}

cpr::Response HttpManager::Download(const std::filesystem::path& filepath, const cpr::Url& url, const ProgressFn& onProgress) {
    m_logger->info("DOWNLOAD to file: {} -> {}", url.str(), filepath.string());
    std::ofstream file_stream(filepath, std::ios::binary | std::ios::trunc);
    if (!file_stream) {
        cpr::Response r_fail;
        r_fail.error.code = cpr::ErrorCode::UNKNOWN_ERROR;
        r_fail.error.message = "HttpManager::Download: Failed to open file for writing: " + filepath.string();
        r_fail.status_code = 0;
        m_logger->error("{}", r_fail.error.message);
        return r_fail;
    }

    cpr::Session session = CreateSession();
    session.SetUrl(url);
    // Archives are large; only the connection phase is bounded.
    session.SetConnectTimeout(cpr::ConnectTimeout{m_timeout.ms});
    if (onProgress) {
        session.SetProgressCallback(cpr::ProgressCallback{
            [&onProgress](auto downloadTotal, auto downloadNow, auto, auto, intptr_t) -> bool {
                return onProgress(static_cast<std::uint64_t>(downloadNow), static_cast<std::uint64_t>(downloadTotal));
            }});
    }

    cpr::Response response = session.Download(file_stream);
    file_stream.close();

    if (!isSuccess(response) || file_stream.fail()) {
        m_logger->error("Download to file failed for {}. Status: {}, Error: \"{}\", CPR Error Code: {}",
            url.str(), response.status_code, response.error.message, static_cast<int>(response.error.code));
        if (std::filesystem::exists(filepath)) {
            std::error_code ec;
            std::filesystem::remove(filepath, ec);
            if (ec) {
                m_logger->warn("Failed to remove partially downloaded file {}: {}", filepath.string(), ec.message());
            } else {
                m_logger->info("Removed partially downloaded file: {}", filepath.string());
            }
        }
        if (response.error.code == cpr::ErrorCode::OK && isSuccess(response)) {
            response.error.code = cpr::ErrorCode::UNKNOWN_ERROR;
            response.error.message = "Failed to write " + filepath.string();
        }
    } else {
        m_logger->info("Download to file successful for {} to {}. Size: {}", url.str(), filepath.string(), response.downloaded_bytes);
    }
    return response;
}

} // namespace JdkManager
