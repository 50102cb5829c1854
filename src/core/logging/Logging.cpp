#include "core/logging/Logging.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <filesystem>
#include <iostream>
#include <memory>
#include <vector>

namespace whispr {
namespace core {
namespace logging {

void initializeLogging(const cache::CacheConfig& config) {
    try {
        const auto level = spdlog::level::from_str(config.logLevel);

        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
        std::vector<spdlog::sink_ptr> sinks{console_sink};

        if (config.logToFile) {
            std::filesystem::create_directories(config.logDirectory);
            auto logPath = (std::filesystem::path(config.logDirectory) / "audiocache.log").string();
            auto rotating_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                logPath, LOG_FILE_MAX_SIZE, LOG_FILE_COUNT);
            rotating_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
            sinks.push_back(rotating_sink);
        }

        auto logger = std::make_shared<spdlog::logger>(LOGGER_NAME, sinks.begin(), sinks.end());
        logger->set_level(level);
        logger->flush_on(spdlog::level::warn);
        spdlog::drop(LOGGER_NAME);
        spdlog::set_default_logger(logger);
        spdlog::debug("Логирование инициализировано: level={}, logToFile={}", config.logLevel, config.logToFile);
    } catch (const std::exception& e) {
        std::cerr << "Ошибка инициализации логгера: " << e.what() << std::endl;
    }
}

} // namespace logging
} // namespace core
} // namespace whispr
