// include/JdkManager/Utils/Logger.hpp
#ifndef JDKM_LOGGER_UTIL_HPP
#define JDKM_LOGGER_UTIL_HPP

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <memory>
#include <vector>
#include <filesystem>
#include <string>

namespace JdkManager::Utils {

    class Logger {
    public:
        // Call this once at the beginning of your application.
        // An empty logDir disables the rotating file sink.
        static void Init(const std::filesystem::path &logDir = "",
                         const std::string &logFileName = "jdkm.log",
                         spdlog::level::level_enum consoleLevel = spdlog::level::info,
                         spdlog::level::level_enum fileLevel = spdlog::level::trace);

        // Get the default core logger (main.cpp and free utility functions)
        static std::shared_ptr<spdlog::logger> &GetCoreLogger();

        // Get or create a named logger sharing the sinks created by Init()
        static std::shared_ptr<spdlog::logger> GetOrCreateLogger(const std::string &name);

        static void SetLevel(const std::string &loggerName, spdlog::level::level_enum level);

        // Changes the threshold of the console sink for every logger at once
        static void SetConsoleLevel(spdlog::level::level_enum level);

    private:
        static std::vector<spdlog::sink_ptr> s_GlobalSinks;
        static std::shared_ptr<spdlog::logger> s_CoreLogger;
    };

} // namespace JdkManager::Utils

#define JDKM_LOG_TRACE(...)    if(auto& logger = ::JdkManager::Utils::Logger::GetCoreLogger(); logger) { logger->trace(__VA_ARGS__); }
#define JDKM_LOG_DEBUG(...)    if(auto& logger = ::JdkManager::Utils::Logger::GetCoreLogger(); logger) { logger->debug(__VA_ARGS__); }
#define JDKM_LOG_INFO(...)     if(auto& logger = ::JdkManager::Utils::Logger::GetCoreLogger(); logger) { logger->info(__VA_ARGS__); }
#define JDKM_LOG_WARN(...)     if(auto& logger = ::JdkManager::Utils::Logger::GetCoreLogger(); logger) { logger->warn(__VA_ARGS__); }
#define JDKM_LOG_ERROR(...)    if(auto& logger = ::JdkManager::Utils::Logger::GetCoreLogger(); logger) { logger->error(__VA_ARGS__); }
#define JDKM_LOG_CRITICAL(...) if(auto& logger = ::JdkManager::Utils::Logger::GetCoreLogger(); logger) { logger->critical(__VA_ARGS__); }

#endif // JDKM_LOGGER_UTIL_HPP
