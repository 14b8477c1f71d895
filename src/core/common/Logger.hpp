#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <fmt/core.h>
#include <memory>
#include <string>

namespace Swarmcast {

class Logger {
public:
    enum class Level {
        Trace = 0,
        Debug = 1,
        Info = 2,
        Warn = 3,
        Error = 4,
        Critical = 5
    };

    static Logger& instance();

    /**
     * @brief Attach the console and rotating file sinks
     * @param logFilePath Rotating log file; empty for console only
     * @param level Minimum level emitted
     */
    void initialize(const std::string& logFilePath = "swarmcast.log",
                    Level level = Level::Info);

    void setLevel(Level level);

    /// Parses "trace".."critical"; unknown names map to Info
    static Level levelFromString(const std::string& name);

    template<typename... Args>
    void trace(fmt::format_string<Args...> format, Args&&... args) {
        logger_->trace(format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void debug(fmt::format_string<Args...> format, Args&&... args) {
        logger_->debug(format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void info(fmt::format_string<Args...> format, Args&&... args) {
        logger_->info(format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warn(fmt::format_string<Args...> format, Args&&... args) {
        logger_->warn(format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void error(fmt::format_string<Args...> format, Args&&... args) {
        logger_->error(format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void critical(fmt::format_string<Args...> format, Args&&... args) {
        logger_->critical(format, std::forward<Args>(args)...);
    }

private:
    Logger();
    std::shared_ptr<spdlog::logger> logger_;
};

// Convenience macros
#define SWARMCAST_TRACE(...) Swarmcast::Logger::instance().trace(__VA_ARGS__)
#define SWARMCAST_DEBUG(...) Swarmcast::Logger::instance().debug(__VA_ARGS__)
#define SWARMCAST_INFO(...) Swarmcast::Logger::instance().info(__VA_ARGS__)
#define SWARMCAST_WARN(...) Swarmcast::Logger::instance().warn(__VA_ARGS__)
#define SWARMCAST_ERROR(...) Swarmcast::Logger::instance().error(__VA_ARGS__)
#define SWARMCAST_CRITICAL(...) Swarmcast::Logger::instance().critical(__VA_ARGS__)

} // namespace Swarmcast
