#include "core/logging/logger.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <vector>

namespace salvo {

std::shared_ptr<spdlog::logger> Logger::s_logger;

namespace {

spdlog::level::level_enum toSpdlog(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return spdlog::level::trace;
        case LogLevel::Debug:    return spdlog::level::debug;
        case LogLevel::Info:     return spdlog::level::info;
        case LogLevel::Warn:     return spdlog::level::warn;
        case LogLevel::Error:    return spdlog::level::err;
        case LogLevel::Critical: return spdlog::level::critical;
        case LogLevel::Off:      return spdlog::level::off;
    }
    return spdlog::level::info;
}

constexpr size_t MAX_LOG_FILE_SIZE = 5 * 1024 * 1024;
constexpr size_t MAX_LOG_FILES = 3;

} // namespace

void Logger::initialize(const std::string& logFile, LogLevel consoleLevel, LogLevel fileLevel) {
    auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    consoleSink->set_level(toSpdlog(consoleLevel));
    consoleSink->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");

    std::vector<spdlog::sink_ptr> sinks{consoleSink};
    std::string fileError;

    if (!logFile.empty()) {
        try {
            auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                logFile, MAX_LOG_FILE_SIZE, MAX_LOG_FILES);
            fileSink->set_level(toSpdlog(fileLevel));
            fileSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
            sinks.push_back(fileSink);
        } catch (const spdlog::spdlog_ex& ex) {
            fileError = ex.what();
        }
    }

    s_logger = std::make_shared<spdlog::logger>("salvo", sinks.begin(), sinks.end());
    s_logger->set_level(spdlog::level::trace);
    s_logger->flush_on(spdlog::level::warn);

    if (!fileError.empty()) {
        s_logger->warn("Could not open log file '{}': {}", logFile, fileError);
    }
}

void Logger::shutdown() {
    if (s_logger) {
        s_logger->flush();
    }
    s_logger.reset();
    spdlog::shutdown();
}

spdlog::logger& Logger::get() {
    if (!s_logger) {
        s_logger = std::make_shared<spdlog::logger>(
            "salvo", std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        s_logger->set_level(spdlog::level::info);
    }
    return *s_logger;
}

} // namespace salvo
