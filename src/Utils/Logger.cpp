// src/Utils/Logger.cpp
#include <JdkManager/Utils/Logger.hpp>
#include <iostream> // For errors raised before a logger exists

namespace JdkManager {
namespace Utils {

    std::shared_ptr<spdlog::logger> Logger::s_CoreLogger;
    std::vector<spdlog::sink_ptr> Logger::s_GlobalSinks;

    void Logger::Init(const std::filesystem::path& logDir,
                      const std::string& logFileName,
                      spdlog::level::level_enum consoleLevel,
                      spdlog::level::level_enum fileLevel) {
        try {
            s_GlobalSinks.clear();

            auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            console_sink->set_level(consoleLevel);
            console_sink->set_pattern("%^[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v%$");
            s_GlobalSinks.push_back(console_sink);

            if (!logDir.empty() && !logFileName.empty()) {
                if (!std::filesystem::exists(logDir)) {
                    std::filesystem::create_directories(logDir);
                }
                std::filesystem::path logFilePath = logDir / logFileName;
                auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(logFilePath.string(), 1024 * 1024 * 5, 3);
                file_sink->set_level(fileLevel);
                file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");
                s_GlobalSinks.push_back(file_sink);
            }

            // Re-initialisation drops every named logger so they pick up the new sinks.
            spdlog::drop_all();

            s_CoreLogger = std::make_shared<spdlog::logger>("Core", s_GlobalSinks.begin(), s_GlobalSinks.end());
            spdlog::register_logger(s_CoreLogger);
            s_CoreLogger->set_level(spdlog::level::trace);
            s_CoreLogger->flush_on(spdlog::level::warn);

            s_CoreLogger->debug("Logger initialized. Console level: {}, File level: {}",
                                spdlog::level::to_string_view(consoleLevel),
                                spdlog::level::to_string_view(fileLevel));

        } catch (const spdlog::spdlog_ex& ex) {
            std::cerr << "Log initialization failed: " << ex.what() << std::endl;
            s_CoreLogger = spdlog::stderr_color_mt("Core_Fallback");
            s_CoreLogger->set_level(spdlog::level::err);
            s_CoreLogger->error("LOGGER INITIALIZATION FAILED. USING FALLBACK CONSOLE LOGGER.");
        } catch (const std::exception& ex) {
            std::cerr << "Log file system setup failed: " << ex.what() << std::endl;
            s_CoreLogger = spdlog::stderr_color_mt("Core_FS_Fallback");
            s_CoreLogger->set_level(spdlog::level::err);
            s_CoreLogger->error("LOGGER FILE SYSTEM SETUP FAILED. USING FALLBACK CONSOLE LOGGER.");
        }
    }

    std::shared_ptr<spdlog::logger>& Logger::GetCoreLogger() {
        if (!s_CoreLogger) {
            // Library use without an explicit Init(): console only, warnings and up.
            Init("", "", spdlog::level::warn, spdlog::level::trace);
        }
        return s_CoreLogger;
    }

    std::shared_ptr<spdlog::logger> Logger::GetOrCreateLogger(const std::string& name) {
        if (s_GlobalSinks.empty()) {
            GetCoreLogger();
        }
        auto logger = spdlog::get(name);
        if (!logger) {
            if (s_GlobalSinks.empty()) {
                // Init() fell back to a standalone logger and left no shared sinks.
                logger = spdlog::stderr_color_mt(name);
            } else {
                logger = std::make_shared<spdlog::logger>(name, s_GlobalSinks.begin(), s_GlobalSinks.end());
                spdlog::register_logger(logger);
            }
            logger->set_level(spdlog::level::trace); // Sinks do the filtering
            logger->flush_on(spdlog::level::warn);
        }
        return logger;
    }

    void Logger::SetLevel(const std::string& loggerName, spdlog::level::level_enum level) {
        auto logger = spdlog::get(loggerName);
        if (logger) {
            logger->set_level(level);
        } else {
            GetCoreLogger()->warn("Attempted to set level for non-existent logger: {}", loggerName);
        }
    }

    void Logger::SetConsoleLevel(spdlog::level::level_enum level) {
        if (s_GlobalSinks.empty()) {
            GetCoreLogger();
        }
        if (!s_GlobalSinks.empty()) {
            s_GlobalSinks.front()->set_level(level);
        }
    }

} // namespace Utils
} // namespace JdkManager
