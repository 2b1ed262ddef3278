#pragma once

/**
 * @file logger.hpp
 * @brief Logging facade over spdlog
 */

#include "core/types.hpp"

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace salvo {

enum class LogLevel : u8 {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Critical,
    Off
};

/**
 * @brief Process-wide logger
 *
 * Until initialize() is called, messages go to a plain console logger so
 * tests and tools can log without setup.
 */
class Logger {
public:
    /// Create console + rotating file sinks
    static void initialize(const std::string& logFile,
                           LogLevel consoleLevel = LogLevel::Info,
                           LogLevel fileLevel = LogLevel::Debug);

    /// Flush and drop all sinks
    static void shutdown();

    /// Get the active logger (never null)
    static spdlog::logger& get();

private:
    static std::shared_ptr<spdlog::logger> s_logger;
};

} // namespace salvo

#define LOG_TRACE(...)    ::salvo::Logger::get().trace(__VA_ARGS__)
#define LOG_DEBUG(...)    ::salvo::Logger::get().debug(__VA_ARGS__)
#define LOG_INFO(...)     ::salvo::Logger::get().info(__VA_ARGS__)
#define LOG_WARN(...)     ::salvo::Logger::get().warn(__VA_ARGS__)
#define LOG_ERROR(...)    ::salvo::Logger::get().error(__VA_ARGS__)
#define LOG_CRITICAL(...) ::salvo::Logger::get().critical(__VA_ARGS__)
