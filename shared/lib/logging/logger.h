/**
 * @file logger.h
 * @brief Structured Logging Wrapper
 *
 * Wraps spdlog with the standard sink layout and pattern used by the
 * cert-sync service and its tests.
 */

#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <algorithm>
#include <cctype>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace certsync::common {

/**
 * @brief Logger initialization and configuration
 */
class Logger {
public:
    /**
     * @brief Initialize logger for service
     * @param serviceName Service name (e.g., "cert-sync")
     * @param logLevel Log level, case-insensitive (trace, debug, info, warn|warning, error, critical)
     * @param logToFile Enable file logging
     * @param logFile Log file path
     */
    static void initialize(
        const std::string& serviceName,
        const std::string& logLevel = "info",
        bool logToFile = false,
        const std::string& logFile = ""
    ) {
        try {
            std::vector<spdlog::sink_ptr> sinks;

            auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            consoleSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
            sinks.push_back(consoleSink);

            if (logToFile && !logFile.empty()) {
                auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    logFile, 1024 * 1024 * 10, 3  // 10MB, 3 files
                );
                fileSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");
                sinks.push_back(fileSink);
            }

            auto logger = std::make_shared<spdlog::logger>(serviceName, sinks.begin(), sinks.end());
            logger->set_level(parseLevel(logLevel));

            spdlog::set_default_logger(logger);
            spdlog::flush_on(spdlog::level::warn);

            spdlog::info("Logger initialized: service={}, level={}, file={}",
                        serviceName, logLevel, logToFile ? logFile : "none");

        } catch (const spdlog::spdlog_ex& ex) {
            std::cerr << "Logger initialization failed: " << ex.what() << std::endl;
        }
    }

    /**
     * @brief Map a level name to spdlog's enum, info when unknown
     */
    static spdlog::level::level_enum parseLevel(std::string level) {
        std::transform(level.begin(), level.end(), level.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        if (level == "trace") return spdlog::level::trace;
        if (level == "debug") return spdlog::level::debug;
        if (level == "warn" || level == "warning") return spdlog::level::warn;
        if (level == "error") return spdlog::level::err;
        if (level == "critical") return spdlog::level::critical;
        return spdlog::level::info;
    }

    static void flush() {
        spdlog::default_logger()->flush();
    }
};

} // namespace certsync::common
