#include "utils/logger.hpp"
#include <cstdio>

namespace lolc::utils {

std::shared_ptr<spdlog::logger> Logger::s_logger;

void Logger::init(const std::string& logFile, spdlog::level::level_enum consoleLevel) {
    try {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_level(consoleLevel);
        console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
        
        // 5MB, 3 files
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            logFile, 1024 * 1024 * 5, 3);
        file_sink->set_level(spdlog::level::trace);
        file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
        
        s_logger = std::make_shared<spdlog::logger>("lolc",
            spdlog::sinks_init_list{console_sink, file_sink});
        
        s_logger->set_level(spdlog::level::trace);
        s_logger->flush_on(spdlog::level::warn);
        
        spdlog::register_logger(s_logger);
        spdlog::set_default_logger(s_logger);
        
        s_logger->info("Logger initialized");
    }
    catch (const spdlog::spdlog_ex& ex) {
        std::fprintf(stderr, "Logger init failed: %s\n", ex.what());
    }
}

void Logger::shutdown() {
    if (s_logger) {
        s_logger->info("Logger shutting down");
        s_logger->flush();
    }
    s_logger.reset();
    spdlog::shutdown();
}

} // namespace lolc::utils
