// src/ReleaseCatalogClient.cpp
#include <JdkManager/ReleaseCatalogClient.hpp>
#include <JdkManager/Errors.hpp>
#include <JdkManager/HttpManager.hpp>
#include <JdkManager/Utils/Logger.hpp>

#include <nlohmann/json.hpp>
#include <algorithm>
#include <future>
#include <set>

namespace JdkManager {

ReleaseCatalogClient::ReleaseCatalogClient(const Config& config, const PlatformProfile& profile,
                                           HttpManager& httpManager, const RuntimeScanner& scanner)
    : m_config(config), m_profile(profile), m_httpManager(httpManager), m_scanner(scanner) {
    m_logger = Utils::Logger::GetOrCreateLogger("ReleaseCatalog");
}

ReleaseCatalogClient::AvailableReleases ReleaseCatalogClient::fetchAvailableReleases() {
    const std::string url = m_config.registryBaseUrl + "/info/available_releases";
    m_logger->info("Fetching available releases from: {}", url);

    cpr::Response response = m_httpManager.Get(cpr::Url{url});
    if (!HttpManager::isSuccess(response)) {
        m_logger->error("Failed to fetch available releases. Status: {}, URL: {}, Error: {}",
                        response.status_code, url, response.error.message);
        throw RegistryUnavailableError("Adoptium API error: " + std::to_string(response.status_code) +
                                       (response.error.message.empty() ? "" : " (" + response.error.message + ")"),
                                       response.status_code);
    }

    AvailableReleases result;
    try {
        nlohmann::json body = nlohmann::json::parse(response.text);
        result.available = body.at("available_releases").get<std::vector<unsigned int>>();
        result.mostRecentLts = body.at("most_recent_lts").get<unsigned int>();
    } catch (const nlohmann::json::exception& e) {
        m_logger->error("Failed to parse available releases: {}", e.what());
        throw RegistryUnavailableError(std::string("Malformed available_releases response: ") + e.what(), response.status_code);
    }

    std::sort(result.available.begin(), result.available.end());
    result.available.erase(std::unique(result.available.begin(), result.available.end()), result.available.end());
    m_logger->debug("Registry knows {} feature version(s), most recent LTS {}.", result.available.size(), result.mostRecentLts);
    return result;
}

std::optional<RemoteRelease> ReleaseCatalogClient::fetchLatestRelease(unsigned int featureVersion) {
    const std::string url = m_config.registryBaseUrl + "/assets/latest/" + std::to_string(featureVersion) + "/hotspot";
    cpr::Parameters params = {
        {"os", m_profile.registryOs},
        {"architecture", m_profile.archToken},
        {"image_type", "jdk"},
        {"project", "jdk"}
    };

    cpr::Response response = m_httpManager.Get(cpr::Url{url}, params);
    if (!HttpManager::isSuccess(response)) {
        m_logger->debug("No binary for Java {} on {}/{} (status {}).", featureVersion, m_profile.registryOs, m_profile.archToken, response.status_code);
        return std::nullopt;
    }

    try {
        nlohmann::json payload = nlohmann::json::parse(response.text);
        if (!payload.is_array() || payload.empty()) {
            m_logger->debug("Java {} is not published for {}/{}.", featureVersion, m_profile.registryOs, m_profile.archToken);
            return std::nullopt;
        }
        return RemoteRelease::from_json(featureVersion, payload.front(), m_profile.archToken, m_profile.registryOs);
    } catch (const nlohmann::json::exception& e) {
        m_logger->warn("Ignoring malformed asset response for Java {}: {}", featureVersion, e.what());
        return std::nullopt;
    }
}

std::vector<RemoteRelease> ReleaseCatalogClient::fetchReleases(const std::vector<unsigned int>& featureVersions) {
    std::vector<RemoteRelease> releases;
    const size_t batchSize = std::max<size_t>(1, m_config.maxConcurrentRequests);

    for (size_t start = 0; start < featureVersions.size(); start += batchSize) {
        const size_t end = std::min(featureVersions.size(), start + batchSize);
        std::vector<std::future<std::optional<RemoteRelease>>> batch;
        for (size_t i = start; i < end; ++i) {
            const unsigned int feature = featureVersions[i];
            batch.push_back(std::async(std::launch::async, [this, feature] { return fetchLatestRelease(feature); }));
        }
        for (auto& pending : batch) {
            std::optional<RemoteRelease> release = pending.get();
            if (release) {
                releases.push_back(std::move(*release));
            }
        }
    }
    return releases;
}

ResolvedCatalog ReleaseCatalogClient::fetchCatalog() {
    AvailableReleases available = fetchAvailableReleases();

    ResolvedCatalog catalog;
    catalog.available = available.available;
    for (unsigned int v : catalog.available) {
        if (v <= available.mostRecentLts) {
            catalog.longTermSupport.push_back(v);
        }
    }
    catalog.releases = fetchReleases(catalog.available);
    m_logger->info("{} of {} feature version(s) are published for {}/{}.",
                   catalog.releases.size(), catalog.available.size(), m_profile.registryOs, m_profile.archToken);

    std::set<unsigned int> knownVersions(catalog.available.begin(), catalog.available.end());
    for (const auto& release : catalog.releases) {
        knownVersions.insert(release.featureVersion);
    }

    // One scan serves every version lookup
    const std::vector<InstalledRuntime> scanned = m_scanner.scanLenient(m_config.installRoot);
    for (unsigned int v : knownVersions) {
        std::optional<InstalledRuntime> local = ReleaseResolver::select(scanned, v, ResolveOptions{}, m_profile);
        if (local) {
            catalog.installed.push_back(*local);
            catalog.installedVersions.push_back(local->featureVersion);
        }
    }
    return catalog;
}

std::optional<RemoteRelease> ReleaseCatalogClient::filter(const std::vector<RemoteRelease>& releases, unsigned int featureVersion) {
    auto it = std::find_if(releases.begin(), releases.end(),
                           [featureVersion](const RemoteRelease& r) { return r.featureVersion == featureVersion; });
    if (it == releases.end()) {
        return std::nullopt;
    }
    return *it;
}

} // namespace JdkManager
