/**
 * @file Log.hpp
 * @brief Tagged, level-filtered logging for the library and its tools.
 *
 * Everything logs through the static Log façade; the sink is an ILogger
 * the host application may replace (the default prints
 * `[LEVEL][tag] message` to stderr).  Hot paths call Log::enabled() before
 * formatting a message.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef RDX_CORE_LOG_HPP
    #define RDX_CORE_LOG_HPP

    #include "Types.hpp"

    #include <string_view>

namespace rdx::core {

/**
 * @brief Severity levels for log messages.
 */
enum class LogLevel : u8 {
    kDebug = 0,
    kInfo,
    kWarn,
    kError,
    kFatal
};

/**
 * @brief Destination of log records.  Called from worker threads, so
 *        implementations must be thread-safe.
 */
class ILogger {
public:
    virtual ~ILogger() = default;

    /**
     * @brief Write a log entry.
     * @param level   Severity.
     * @param tag     Subsystem tag (e.g. "JOB", "TUNE", "rdx").
     * @param message Formatted message body.
     */
    virtual void write(LogLevel level, std::string_view tag, std::string_view message) = 0;
};

/**
 * @brief Process-wide logger.  Tags in use: "rdx" (engine, default),
 *        "JOB" (job system), "TUNE" (tuning files).
 */
class Log final {
public:
    Log() = delete;

    static void setLogger(ILogger *logger);
    static void setMinLevel(LogLevel level);

    /// @brief True if a message at @p level would reach the sink.
    [[nodiscard]] static bool enabled(LogLevel level);

    static void debug(std::string_view tag, std::string_view msg);
    static void info (std::string_view tag, std::string_view msg);
    static void warn (std::string_view tag, std::string_view msg);
    static void error(std::string_view tag, std::string_view msg);
    static void fatal(std::string_view tag, std::string_view msg);

    static void debug(std::string_view msg) { debug("rdx", msg); }
    static void info (std::string_view msg) { info ("rdx", msg); }
    static void warn (std::string_view msg) { warn ("rdx", msg); }
    static void error(std::string_view msg) { error("rdx", msg); }
    static void fatal(std::string_view msg) { fatal("rdx", msg); }
};

} // namespace rdx::core

#endif // RDX_CORE_LOG_HPP
