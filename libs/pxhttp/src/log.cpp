#include "log.hpp"
#include <shared_mutex>
#include <iostream>
#include <cctype>
#include <optional>
#include "spdlog/sinks/rotating_file_sink.h"
#include "spdlog/sinks/stdout_color_sinks.h"

namespace
{

std::optional<spdlog::level::level_enum> parseLevel(std::string levelName)
{
    for (auto& ch : levelName)
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    if (levelName == "error" || levelName == "err")
        return spdlog::level::err;
    if (levelName == "warning" || levelName == "warn")
        return spdlog::level::warn;
    if (levelName == "info")
        return spdlog::level::info;
    if (levelName == "debug" || levelName == "dbg")
        return spdlog::level::debug;
    if (levelName == "trace")
        return spdlog::level::trace;
    if (levelName == "off")
        return spdlog::level::off;
    return {};
}

}

spdlog::logger& pxhttp::log()
{
    static std::shared_ptr<spdlog::logger> proxyLogger;
    static std::shared_mutex loggerAccess;

    {
        // Check if the logger is already initialized - read-only lock
        std::shared_lock<std::shared_mutex> readLock(loggerAccess);
        if (proxyLogger)
            return *proxyLogger;
    }

    {
        std::lock_guard<std::shared_mutex> writeLock(loggerAccess);

        // Check again, another thread might have initialized now
        if (proxyLogger)
            return *proxyLogger;

        auto getEnvSafe = [](char const* env){
            auto value = std::getenv(env);
            if (value)
                return std::string(value);
            return std::string();
        };
        std::string logLevel = getEnvSafe("AUTHPX_LOG_LEVEL");
        std::string logFile = getEnvSafe("AUTHPX_LOG_FILE");
        std::string logFileMaxSize = getEnvSafe("AUTHPX_LOG_FILE_MAXSIZE");
        uint64_t logFileMaxSizeInt = 1024ull*1024*1024; // 1GB

        // File logger on demand, otherwise console logger
        if (!logFile.empty()) {
            std::cerr << "Logging proxy events to '" << logFile << "'!" << std::endl;
            if (!logFileMaxSize.empty()) {
                try {
                    logFileMaxSizeInt = std::stoull(logFileMaxSize);
                }
                catch (std::exception& e) {
                    std::cerr << "Could not parse value of AUTHPX_LOG_FILE_MAXSIZE." << std::endl;
                }
            }
            proxyLogger = spdlog::rotating_logger_mt("authpx", logFile, logFileMaxSizeInt, 2);
        }
        else
            proxyLogger = spdlog::stderr_color_mt("authpx");

        proxyLogger->set_level(spdlog::level::info);
        if (auto level = parseLevel(logLevel))
            proxyLogger->set_level(*level);
    }

    return *proxyLogger;
}

bool pxhttp::setLogLevel(std::string const& levelName)
{
    auto level = parseLevel(levelName);
    if (!level)
        return false;
    log().set_level(*level);
    return true;
}

std::string pxhttp::redact(std::string_view secret)
{
    if (secret.empty())
        return {};
    // Short values would be mostly revealed by a prefix.
    if (secret.size() < 16)
        return "***";
    return std::string(secret.substr(0, 4)) + "***";
}
