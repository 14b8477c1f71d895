#include "Logger.hpp"
#include <spdlog/pattern_formatter.h>

#include <algorithm>
#include <cctype>
#include <vector>

namespace Swarmcast {

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

// Console-only until initialize() runs, so early log calls never hit a null logger
Logger::Logger()
    : logger_(std::make_shared<spdlog::logger>(
          "swarmcast_bootstrap", std::make_shared<spdlog::sinks::stdout_color_sink_mt>())) {
    logger_->set_pattern("[%H:%M:%S] [%^%l%$] [%t] %v");
}

void Logger::initialize(const std::string& logFilePath, Level level) {
    try {
        std::vector<spdlog::sink_ptr> sinks;

        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_pattern("[%H:%M:%S] [%^%l%$] [%t] %v");
        sinks.push_back(console_sink);

        if (!logFilePath.empty()) {
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                logFilePath, 1024 * 1024 * 5, 3); // 5MB, 3 files
            file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%f] [%l] [%t] %v");
            sinks.push_back(file_sink);
        }

        auto logger = std::make_shared<spdlog::logger>("swarmcast", sinks.begin(), sinks.end());
        spdlog::drop("swarmcast");
        spdlog::register_logger(logger);
        logger_ = logger;

        setLevel(level);

        SWARMCAST_INFO("Logger initialized with file: {}",
                       logFilePath.empty() ? std::string("<none>") : logFilePath);

    } catch (const spdlog::spdlog_ex& ex) {
        // Keep the console logger
        logger_->error("Logger initialization failed: {}", ex.what());
    }
}

void Logger::setLevel(Level level) {
    if (logger_) {
        logger_->set_level(static_cast<spdlog::level::level_enum>(level));
        logger_->flush_on(spdlog::level::warn);
    }
}

Logger::Level Logger::levelFromString(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "trace") return Level::Trace;
    if (lower == "debug") return Level::Debug;
    if (lower == "warn" || lower == "warning") return Level::Warn;
    if (lower == "error") return Level::Error;
    if (lower == "critical") return Level::Critical;
    return Level::Info;
}

} // namespace Swarmcast
