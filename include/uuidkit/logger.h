/**
 * @file logger.h
 * @brief Default spdlog logger for processes embedding uuidkit
 *
 * uuidkit never creates loggers of its own: sources call spdlog::info,
 * spdlog::debug and friends, which go to whatever default logger is
 * installed. Applications that want uuidkit output formatted consistently
 * call Logger::initialize (or initializeFromConfig) once at startup.
 */

#pragma once

#include "uuidkit/config_manager.h"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <cstddef>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace uuidkit {

class Logger {
public:
    /// Rotation threshold of the file sink
    static constexpr size_t LOG_FILE_MAX_BYTES = 10 * 1024 * 1024;
    /// Rotated files kept next to the active one
    static constexpr size_t LOG_FILE_MAX_FILES = 3;

    /**
     * @brief Replace the spdlog default logger
     *
     * Console output is colored; the optional file sink rotates at
     * LOG_FILE_MAX_BYTES. Sink creation errors are reported on stderr and
     * leave the previous default logger in place.
     *
     * @param loggerName Shown as [name] on every line
     * @param logLevel Name accepted by parseLevel()
     * @param logToFile Add the rotating file sink
     * @param logFile Path for the file sink (ignored when empty)
     */
    static void initialize(
        const std::string& loggerName,
        const std::string& logLevel = "info",
        bool logToFile = false,
        const std::string& logFile = ""
    ) {
        try {
            std::vector<spdlog::sink_ptr> sinks;

            auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            console->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
            sinks.push_back(console);

            bool withFile = logToFile && !logFile.empty();
            if (withFile) {
                auto file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    logFile, LOG_FILE_MAX_BYTES, LOG_FILE_MAX_FILES);
                file->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");
                sinks.push_back(file);
            }

            auto logger = std::make_shared<spdlog::logger>(loggerName, sinks.begin(), sinks.end());
            logger->set_level(parseLevel(logLevel));

            spdlog::set_default_logger(logger);
            spdlog::flush_on(spdlog::level::warn);

            spdlog::debug("Default logger '{}' installed (level={}, file={})",
                          loggerName, logLevel, withFile ? logFile : "none");
        } catch (const spdlog::spdlog_ex& ex) {
            std::cerr << "uuidkit: cannot install logger '" << loggerName << "': "
                      << ex.what() << std::endl;
        }
    }

    /// Same as initialize() with the level taken from UUIDKIT_LOG_LEVEL
    static void initializeFromConfig(const std::string& loggerName) {
        initialize(loggerName,
                   ConfigManager::getInstance().getString(ConfigManager::LOG_LEVEL, "info"));
    }

    static void setLevel(const std::string& level) {
        spdlog::set_level(parseLevel(level));
    }

    static void flush() {
        spdlog::default_logger()->flush();
    }

    /// trace, debug, info, warn, error, critical or off; anything else is info
    static spdlog::level::level_enum parseLevel(const std::string& level) {
        if (level == "trace") return spdlog::level::trace;
        if (level == "debug") return spdlog::level::debug;
        if (level == "warn") return spdlog::level::warn;
        if (level == "error") return spdlog::level::err;
        if (level == "critical") return spdlog::level::critical;
        if (level == "off") return spdlog::level::off;
        return spdlog::level::info;
    }
};

} // namespace uuidkit
