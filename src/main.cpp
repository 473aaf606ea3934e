// src/main.cpp
#include <JdkManager/Config.hpp>
#include <JdkManager/Errors.hpp>
#include <JdkManager/HttpManager.hpp>
#include <JdkManager/JavaManager.hpp>
#include <JdkManager/PlatformProfile.hpp>
#include <JdkManager/ThreadedJobRunner.hpp>
#include <JdkManager/Utils/Logger.hpp>
#include <spdlog/spdlog.h> // For spdlog::shutdown()
#include <CLI/CLI.hpp>

#include <nlohmann/json.hpp>
#include <filesystem>
#include <iostream> // JSON results go to stdout
#include <optional>
#include <string>
#include <vector>

using json = nlohmann::json;

namespace {

    struct CliOptions {
        std::string command;
        unsigned int featureVersion = 0;
        bool lenient = false;
        bool verbose = false;
        std::string configFile;
        std::string workDir;
        std::string installRoot;
        std::string downloadRoot;
        std::string unpackRoot;
        std::string os;
        std::string arch;
    };

    CLI::App* addVersionCommand(CLI::App& app, const std::string& name, const std::string& description, CliOptions& options) {
        CLI::App* cmd = app.add_subcommand(name, description);
        cmd->add_option("version", options.featureVersion, "Java feature version, e.g. 17")
            ->required()
            ->check(CLI::PositiveNumber);
        return cmd;
    }

    JdkManager::Config buildConfig(const CliOptions& options) {
        JdkManager::Config config = !options.configFile.empty() ? JdkManager::Config::loadFromFile(options.configFile)
                                                                : JdkManager::Config{};
        if (!options.workDir.empty()) {
            config.setWorkDir(options.workDir);
        }
        config.withRoots(options.downloadRoot, options.unpackRoot);
        if (!options.installRoot.empty()) {
            config.installRoot = options.installRoot;
        }
        if (!options.os.empty()) config.osOverride = options.os;
        if (!options.arch.empty()) config.archOverride = options.arch;
        return config;
    }

    json toJsonArray(const std::vector<JdkManager::InstalledRuntime>& runtimes) {
        json list = json::array();
        for (const auto& runtime : runtimes) {
            list.push_back(runtime.to_json());
        }
        return list;
    }

    int runCommand(const CliOptions& options, JdkManager::Config& config) {
        JdkManager::PlatformProfile profile = JdkManager::PlatformProfile::fromOverrides(config.osOverride, config.archOverride);
        JDKM_LOG_DEBUG("Platform: {} / {} (registry {} / {})", profile.osFamily, profile.cpuArch, profile.registryOs, profile.archToken);

        JdkManager::HttpManager httpManager(config);
        JdkManager::ThreadedJobRunner jobRunner(config, httpManager);
        JdkManager::JavaManager javaManager(config, profile, httpManager, jobRunner);
        if (options.verbose) {
            javaManager.enableEventLogging({"task:created", "task:completed", "task:failed", "task:cancelled"});
        }

        if (options.command == "scan") {
            auto runtimes = options.lenient ? javaManager.scanner().scanLenient(config.installRoot)
                                            : javaManager.scanner().scan(config.installRoot);
            std::cout << toJsonArray(runtimes).dump(2) << std::endl;
            return 0;
        }

        if (options.command == "catalog") {
            std::cout << javaManager.catalog().to_json().dump(2) << std::endl;
            return 0;
        }

        if (options.command == "find" || options.command == "info" || options.command == "install") {
            const unsigned int version = options.featureVersion;

            if (options.command == "info") {
                std::cout << javaManager.describe(version).to_json().dump(2) << std::endl;
                return 0;
            }

            std::optional<JdkManager::InstalledRuntime> runtime;
            if (options.command == "find") {
                runtime = javaManager.findInstalled(version);
            } else {
                config.ensureDirectories();
                runtime = javaManager.ensureRuntime(version);
            }
            if (!runtime) {
                JDKM_LOG_WARN("No Java {} runtime available.", version);
                std::cout << "null" << std::endl;
                return 1;
            }
            std::cout << runtime->to_json().dump(2) << std::endl;
            return 0;
        }

        std::cerr << "Unknown command: " << options.command << "\n";
        return 2;
    }
}

int main(int argc, char* argv[]) {
    CLI::App app{"jdkm - Java runtime discovery and installation"};
    app.require_subcommand(1);
    app.fallthrough(); // global options may follow the subcommand

    CliOptions options;
    app.add_option("--config", options.configFile, "JSON configuration file")->check(CLI::ExistingFile);
    app.add_option("--work-dir", options.workDir, "Base directory for downloads/, unpacked/, backups/ and logs/");
    app.add_option("--install-root", options.installRoot, "Directory scanned for local runtimes");
    app.add_option("--download-root", options.downloadRoot, "Directory for downloaded archives");
    app.add_option("--unpack-root", options.unpackRoot, "Directory runtimes are unpacked into");
    app.add_option("--os", options.os, "Target OS instead of the host")
        ->check(CLI::IsMember({"windows", "linux", "mac", "macos", "darwin", "android", "termux"}, CLI::ignore_case));
    app.add_option("--arch", options.arch, "Target architecture instead of the host")
        ->check(CLI::IsMember({"x64", "x86_64", "amd64", "x86", "x32", "i386", "i686", "aarch64", "arm64", "arm", "arm32", "armv7"}, CLI::ignore_case));
    app.add_flag("-v,--verbose", options.verbose, "Debug output and job events on stderr");

    CLI::App* scanCmd = app.add_subcommand("scan", "List Java installations under the install root");
    scanCmd->add_flag("--lenient", options.lenient, "Also report version folders without an executable");
    app.add_subcommand("catalog", "Available, LTS, published and installed versions");
    addVersionCommand(app, "find", "Find an installed runtime of a feature version", options);
    addVersionCommand(app, "info", "Where a feature version would be downloaded from and unpacked to", options);
    addVersionCommand(app, "install", "Download, verify and unpack a feature version unless already installed", options);

    CLI11_PARSE(app, argc, argv);
    options.command = app.get_subcommands().front()->get_name();

    try {
        JdkManager::Config config = buildConfig(options);
        JdkManager::Utils::Logger::Init(config.logDir, "jdkm.log",
                                        options.verbose ? spdlog::level::debug : spdlog::level::warn,
                                        spdlog::level::trace);
        JDKM_LOG_INFO("jdkm v0.1 starting, command '{}'", options.command);
        JDKM_LOG_DEBUG("Work directory: {}", config.workDir.string());
        JDKM_LOG_DEBUG("Install root: {}", config.installRoot.string());

        int exitCode = runCommand(options, config);
        spdlog::shutdown();
        return exitCode;
    } catch (const JdkManager::UnsupportedPlatformError& e) {
        JDKM_LOG_CRITICAL("Unsupported platform: {}", e.what());
    } catch (const JdkManager::RegistryUnavailableError& e) {
        JDKM_LOG_CRITICAL("Release registry unavailable: {}", e.what());
    } catch (const JdkManager::IntegrityVerificationError& e) {
        JDKM_LOG_CRITICAL("Integrity verification failed: {}", e.what());
    } catch (const std::exception& e) {
        JDKM_LOG_CRITICAL("{}", e.what());
    }
    spdlog::shutdown();
    return 1;
}
