// src/JavaManager.cpp
#include <JdkManager/JavaManager.hpp>
#include <JdkManager/HttpManager.hpp>
#include <JdkManager/Utils/Logger.hpp>

#include <algorithm>

namespace JdkManager {

JavaManager::JavaManager(const Config& config, const PlatformProfile& profile,
                         HttpManager& httpManager, IJobRunner& jobRunner)
    : m_config(config),
      m_profile(profile),
      m_jobRunner(jobRunner),
      m_scanner(profile),
      m_resolver(m_scanner),
      m_catalogClient(config, profile, httpManager, m_scanner),
      m_pipeline(config, jobRunner) {
    m_logger = Utils::Logger::GetOrCreateLogger("JavaManager");
    m_logger->trace("Initialized for {}/{}", m_profile.osFamily, m_profile.cpuArch);
}

std::vector<InstalledRuntime> JavaManager::installations() const {
    return m_scanner.scan(m_config.unpackPath);
}

std::optional<InstalledRuntime> JavaManager::findInstalled(unsigned int featureVersion, const ResolveOptions& options) const {
    return m_resolver.findLocal(m_config.installRoot, featureVersion, options);
}

ResolvedCatalog JavaManager::catalog() {
    return m_catalogClient.fetchCatalog();
}

InstallPlan JavaManager::describeTermux(unsigned int featureVersion) const {
    InstallPlan plan;
    plan.isTermux = true;
    plan.version = std::to_string(featureVersion);
    plan.packageName = "openjdk-" + plan.version;
    plan.installCommand = "pkg install " + plan.packageName;
    plan.javaPath = kTermuxJavaPath;

    auto runtimes = m_scanner.scan(kTermuxJvmRoot);
    plan.installed = std::any_of(runtimes.begin(), runtimes.end(), [featureVersion](const InstalledRuntime& r) {
        return r.featureVersion == featureVersion;
    });
    return plan;
}

std::filesystem::path JavaManager::findJavaBinDir(const std::filesystem::path& unpackPath) const {
    std::error_code ec;
    if (std::filesystem::is_directory(unpackPath / "bin", ec)) {
        return unpackPath / "bin";
    }

    std::vector<std::filesystem::path> entries;
    for (std::filesystem::directory_iterator it(unpackPath, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->is_directory(ec)) {
            entries.push_back(it->path());
        }
    }
    std::sort(entries.begin(), entries.end());

    if (m_profile.isMacOS() && !entries.empty()) {
        std::filesystem::path macBin = entries.front() / "Contents" / "Home" / "bin";
        if (std::filesystem::is_directory(macBin, ec)) {
            return macBin;
        }
    }
    for (const auto& entry : entries) {
        if (entry.filename().string().rfind("jdk-", 0) == 0) {
            return m_scanner.resolveBinDir(entry);
        }
    }
    return unpackPath / "bin";
}

InstallPlan JavaManager::describe(unsigned int featureVersion) const {
    if (m_profile.isAndroid()) {
        return describeTermux(featureVersion);
    }

    InstallPlan plan;
    plan.version = std::to_string(featureVersion);
    plan.url = m_config.registryBaseUrl + "/binary/latest/" + plan.version + "/ga/" + m_profile.registryOs + "/" +
               m_profile.archToken + "/jdk/hotspot/normal/eclipse?project=jdk";
    plan.fileName = "Java-" + plan.version + "-" + m_profile.archToken + m_profile.archiveExt;
    plan.downloadPath = m_config.downloadPath / plan.fileName;
    plan.unpackPath = m_config.unpackPath / ("jdk-" + plan.version);
    plan.javaBinPath = findJavaBinDir(plan.unpackPath);
    return plan;
}

std::optional<InstalledRuntime> JavaManager::ensureRuntime(unsigned int featureVersion) {
    if (m_profile.isAndroid()) {
        InstallPlan plan = describeTermux(featureVersion);
        if (!plan.installed) {
            m_logger->warn("Java {} is not installed. Run: {}", featureVersion, plan.installCommand);
            return std::nullopt;
        }
        auto found = m_resolver.findLocal(kTermuxJvmRoot, featureVersion, ResolveOptions::any());
        if (found && found->isValid) {
            return found;
        }
        return std::nullopt;
    }

    if (auto local = findInstalled(featureVersion)) {
        m_logger->info("Java {} already installed at {}", featureVersion, local->installRoot.string());
        return local;
    }

    m_logger->info("Java {} not found under {}. Looking it up in the registry.", featureVersion, m_config.installRoot.string());
    ResolvedCatalog resolved = m_catalogClient.fetchCatalog();
    std::optional<RemoteRelease> release = ReleaseCatalogClient::filter(resolved.releases, featureVersion);
    if (!release) {
        m_logger->warn("Java {} is not published for {}/{}.", featureVersion, m_profile.registryOs, m_profile.archToken);
        return std::nullopt;
    }

    AcquisitionOutcome outcome = m_pipeline.acquire(*release);
    outcome.throwIfFailed();

    auto installed = m_resolver.findLocal(*outcome.extractionDestination, featureVersion, ResolveOptions{false, false, true});
    if (!installed) {
        m_logger->error("Extracted Java {} into {} but no executable was found.", featureVersion,
                        outcome.extractionDestination->string());
    }
    return installed;
}

void JavaManager::enableEventLogging(const std::set<std::string>& eventNames) {
    auto logger = Utils::Logger::GetOrCreateLogger("Jobs");
    m_jobRunner.setEventListener([logger, eventNames](const JobNotification& n) {
        const std::string name = toString(n.event);
        if (!eventNames.empty() && eventNames.count(name) == 0) {
            return;
        }
        if (n.event == JobEvent::Progress) {
            logger->trace("{} {} {}/{} bytes", name, n.jobId, n.bytesDone, n.bytesTotal);
        } else if (n.event == JobEvent::Failed) {
            logger->error("{} {} ({}) {}", name, n.jobId, toString(n.kind), n.message);
        } else {
            logger->info("{} {} ({}) {}", name, n.jobId, toString(n.kind), n.message);
        }
    });
}

} // namespace JdkManager
