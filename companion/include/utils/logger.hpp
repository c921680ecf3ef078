#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <memory>
#include <string>

namespace lolc::utils {

/**
 * Logger utility
 * 
 * Provides a centralized logging interface using spdlog.
 * Until init() is called, messages go to spdlog's default logger.
 */
class Logger {
public:
    static void init(const std::string& logFile = "lol-companion.log",
                     spdlog::level::level_enum consoleLevel = spdlog::level::debug);
    static void shutdown();
    
    static std::shared_ptr<spdlog::logger> get() {
        return s_logger ? s_logger : spdlog::default_logger();
    }
    
    // Convenience logging functions
    template<typename... Args>
    static void trace(fmt::format_string<Args...> fmt, Args&&... args) {
        get()->trace(fmt, std::forward<Args>(args)...);
    }
    
    template<typename... Args>
    static void debug(fmt::format_string<Args...> fmt, Args&&... args) {
        get()->debug(fmt, std::forward<Args>(args)...);
    }
    
    template<typename... Args>
    static void info(fmt::format_string<Args...> fmt, Args&&... args) {
        get()->info(fmt, std::forward<Args>(args)...);
    }
    
    template<typename... Args>
    static void warn(fmt::format_string<Args...> fmt, Args&&... args) {
        get()->warn(fmt, std::forward<Args>(args)...);
    }
    
    template<typename... Args>
    static void error(fmt::format_string<Args...> fmt, Args&&... args) {
        get()->error(fmt, std::forward<Args>(args)...);
    }
    
    template<typename... Args>
    static void critical(fmt::format_string<Args...> fmt, Args&&... args) {
        get()->critical(fmt, std::forward<Args>(args)...);
    }
    
private:
    static std::shared_ptr<spdlog::logger> s_logger;
};

#define LOG_TRACE(...) lolc::utils::Logger::trace(__VA_ARGS__)
#define LOG_DEBUG(...) lolc::utils::Logger::debug(__VA_ARGS__)
#define LOG_INFO(...)  lolc::utils::Logger::info(__VA_ARGS__)
#define LOG_WARN(...)  lolc::utils::Logger::warn(__VA_ARGS__)
#define LOG_ERROR(...) lolc::utils::Logger::error(__VA_ARGS__)
#define LOG_CRITICAL(...) lolc::utils::Logger::critical(__VA_ARGS__)

} // namespace lolc::utils
