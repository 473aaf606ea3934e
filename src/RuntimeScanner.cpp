// src/RuntimeScanner.cpp
#include <JdkManager/RuntimeScanner.hpp>
#include <JdkManager/Utils/Logger.hpp>

#include <algorithm>
#include <set>

namespace JdkManager {

namespace {
    // Ancestors inspected above the bin directory's parent (covers Contents/Home/bin)
    constexpr int kExtraAncestorLevels = 3;

    bool isHidden(const std::filesystem::path& p) {
        const std::string name = p.filename().string();
        return !name.empty() && name.front() == '.';
    }

    // Key under which two discovery paths count as the same installation
    std::string identityKey(const std::filesystem::path& installRoot) {
        std::error_code ec;
        std::filesystem::path canonical = std::filesystem::weakly_canonical(installRoot, ec);
        if (ec) {
            canonical = installRoot.lexically_normal();
        }
        return canonical.string();
    }
}

RuntimeScanner::RuntimeScanner(const PlatformProfile& profile, const FolderNameRules& rules)
    : m_profile(profile), m_rules(rules) {
    m_logger = Utils::Logger::GetOrCreateLogger("RuntimeScanner");
}

std::vector<InstalledRuntime> RuntimeScanner::scan(const std::filesystem::path& rootDir) const {
    return scanImpl(rootDir, false);
}

std::vector<InstalledRuntime> RuntimeScanner::scanLenient(const std::filesystem::path& rootDir) const {
    return scanImpl(rootDir, true);
}

std::vector<std::filesystem::directory_entry> RuntimeScanner::listDirectory(const std::filesystem::path& dir) const {
    std::vector<std::filesystem::directory_entry> entries;
    std::error_code ec;
    std::filesystem::directory_iterator it(dir, ec);
    if (ec) {
        m_logger->warn("Cannot read directory {}: {}", dir.string(), ec.message());
        return entries;
    }
    for (std::filesystem::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            m_logger->warn("Error iterating directory {}: {}", dir.string(), ec.message());
            break;
        }
        entries.push_back(*it);
    }
    // Directory order is filesystem dependent; sorting keeps "first found wins" deterministic.
    std::sort(entries.begin(), entries.end(),
              [](const auto& a, const auto& b) { return a.path().filename() < b.path().filename(); });
    return entries;
}

void RuntimeScanner::findExecutables(const std::filesystem::path& dir, std::vector<std::filesystem::path>& out) const {
    const std::string executableName = m_profile.executableName();
    for (const auto& entry : listDirectory(dir)) {
        std::error_code ec;
        // symlink_status: links are neither followed nor reported
        const auto status = entry.symlink_status(ec);
        if (ec) {
            m_logger->warn("Cannot stat {}: {}", entry.path().string(), ec.message());
            continue;
        }
        if (std::filesystem::is_directory(status)) {
            if (isHidden(entry.path())) continue;
            findExecutables(entry.path(), out);
        } else if (std::filesystem::is_regular_file(status) && entry.path().filename() == executableName) {
            out.push_back(entry.path());
        }
    }
}

void RuntimeScanner::findDirectories(const std::filesystem::path& dir, std::vector<std::filesystem::path>& out) const {
    for (const auto& entry : listDirectory(dir)) {
        std::error_code ec;
        const auto status = entry.symlink_status(ec);
        if (ec || !std::filesystem::is_directory(status) || isHidden(entry.path())) {
            continue;
        }
        out.push_back(entry.path());
        findDirectories(entry.path(), out);
    }
}

std::filesystem::path RuntimeScanner::resolveBinDir(const std::filesystem::path& installRoot) const {
    std::error_code ec;
    std::filesystem::path macBin = installRoot / "Contents" / "Home" / "bin";
    if (std::filesystem::is_directory(macBin, ec)) {
        return macBin;
    }
    return installRoot / "bin";
}

std::optional<InstalledRuntime> RuntimeScanner::inferFromExecutable(const std::filesystem::path& executable) const {
    const std::filesystem::path binDir = executable.parent_path();
    std::filesystem::path installRoot = binDir.parent_path();
    std::optional<unsigned int> featureVersion = m_rules.extractFeatureVersion(installRoot.filename().string());

    if (!featureVersion) {
        std::filesystem::path candidate = installRoot;
        for (int i = 0; i < kExtraAncestorLevels && candidate.has_relative_path(); ++i) {
            candidate = candidate.parent_path();
            featureVersion = m_rules.extractFeatureVersion(candidate.filename().string());
            if (featureVersion) {
                installRoot = candidate;
                break;
            }
        }
    }

    if (!featureVersion) {
        m_logger->trace("No version pattern above {}, skipping.", executable.string());
        return std::nullopt;
    }

    InstalledRuntime runtime;
    runtime.featureVersion = *featureVersion;
    runtime.folderName = installRoot.filename().string();
    runtime.installRoot = installRoot;
    runtime.binDir = binDir;
    runtime.executablePath = executable;
    FolderTraits traits = extractArchAndOS(runtime.folderName, m_profile);
    runtime.arch = traits.arch;
    runtime.os = traits.os;
    runtime.isValid = true;
    return runtime;
}

InstalledRuntime RuntimeScanner::inferFromDirectory(const std::filesystem::path& dir, unsigned int featureVersion) const {
    InstalledRuntime runtime;
    runtime.featureVersion = featureVersion;
    runtime.folderName = dir.filename().string();
    runtime.installRoot = dir;
    runtime.binDir = resolveBinDir(dir);
    runtime.executablePath = runtime.binDir / m_profile.executableName();
    FolderTraits traits = extractArchAndOS(runtime.folderName, m_profile);
    runtime.arch = traits.arch;
    runtime.os = traits.os;

    std::error_code ec;
    runtime.isValid = std::filesystem::is_regular_file(runtime.executablePath, ec);
    return runtime;
}

std::vector<InstalledRuntime> RuntimeScanner::scanImpl(const std::filesystem::path& rootDir, bool lenient) const {
    std::error_code ec;
    std::filesystem::path root = std::filesystem::absolute(rootDir, ec);
    if (ec) {
        root = rootDir;
    }
    if (!std::filesystem::is_directory(root, ec)) {
        m_logger->warn("Base path does not exist or is not a directory: {}", root.string());
        return {};
    }

    m_logger->debug("Scanning for Java installations in {} ({})", root.string(), lenient ? "lenient" : "strict");

    std::vector<InstalledRuntime> found;
    std::set<std::string> seen;

    try {
        std::vector<std::filesystem::path> executables;
        findExecutables(root, executables);
        for (const auto& executable : executables) {
            std::optional<InstalledRuntime> runtime = inferFromExecutable(executable);
            if (!runtime) continue;
            if (!seen.insert(identityKey(runtime->installRoot)).second) {
                m_logger->trace("Duplicate installation root {}, keeping the first one.", runtime->installRoot.string());
                continue;
            }
            found.push_back(std::move(*runtime));
        }

        if (lenient) {
            std::vector<std::filesystem::path> directories;
            findDirectories(root, directories);
            for (const auto& dir : directories) {
                std::optional<unsigned int> featureVersion = m_rules.extractFeatureVersion(dir.filename().string());
                if (!featureVersion) continue;
                if (!seen.insert(identityKey(dir)).second) continue;

                InstalledRuntime runtime = inferFromDirectory(dir, *featureVersion);
                if (!runtime.isValid) {
                    m_logger->info("Java {} at {} has no executable, reporting it as invalid.", runtime.featureVersion, dir.string());
                }
                found.push_back(std::move(runtime));
            }
        }
    } catch (const std::exception& e) {
        // Allocation failures or path conversion errors; report what was found so far.
        m_logger->error("Error scanning Java installations in {}: {}", root.string(), e.what());
    }

    std::stable_sort(found.begin(), found.end(),
                     [](const InstalledRuntime& a, const InstalledRuntime& b) { return a.featureVersion > b.featureVersion; });

    m_logger->debug("Scan of {} complete. Found {} installation(s).", root.string(), found.size());
    return found;
}

} // namespace JdkManager
