/**
 * @file Log.hpp
 * @brief Tagged logging façade shared by every hop subsystem.
 *
 * Messages carry a severity and a subsystem tag ("cluster", "net", "delta",
 * "migration", "liveness", "node").  They are dropped below the minimum
 * level, otherwise handed to the installed ILogger.  The default sink
 * prints `[time][LEVEL][tag] message` on stderr.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef HOP_CORE_LOG_HPP
    #define HOP_CORE_LOG_HPP

    #include "Types.hpp"

    #include <string_view>

namespace hop::core {

/**
 * @brief Severity levels, ordered from chattiest to most severe.
 */
enum class LogLevel : u8 {
    kDebug = 0,
    kInfo,
    kWarn,
    kError,
    kFatal
};

/// @brief Fixed-width upper-case name ("DEBUG", "INFO ", ...).
[[nodiscard]] std::string_view toString(LogLevel level) noexcept;

/**
 * @brief Destination of log lines.
 *
 * Called concurrently from the execution thread, transport workers and
 * liveness timers: implementations serialise their own output.
 */
class ILogger {
public:
    virtual ~ILogger() = default;

    /**
     * @param level   Severity (already filtered).
     * @param tag     Subsystem tag.
     * @param message Preformatted body, no trailing newline.
     */
    virtual void write(LogLevel level, std::string_view tag, std::string_view message) = 0;
};

/**
 * @brief Static façade.  Messages are usually built with std::format.
 */
class Log final {
public:
    Log() = delete;

    /// @brief Installs @p logger (null restores the stderr sink).
    /// @return The previously installed logger.
    static ILogger *setLogger(ILogger *logger);
    static void setMinLevel(LogLevel level);
    [[nodiscard]] static LogLevel minLevel();

    /// @brief True when a message at @p level would be written.
    [[nodiscard]] static bool enabled(LogLevel level);

    static void debug(std::string_view tag, std::string_view msg);
    static void info (std::string_view tag, std::string_view msg);
    static void warn (std::string_view tag, std::string_view msg);
    static void error(std::string_view tag, std::string_view msg);
    static void fatal(std::string_view tag, std::string_view msg);
};

/**
 * @brief Installs a logger for the lifetime of the scope, then restores
 *        the previous one.
 */
class ScopedLogger final {
public:
    explicit ScopedLogger(ILogger &logger) : _previous(Log::setLogger(&logger)) {}
    ~ScopedLogger() { Log::setLogger(_previous); }

    ScopedLogger(const ScopedLogger &) = delete;
    ScopedLogger &operator=(const ScopedLogger &) = delete;

private:
    ILogger *_previous;
};

} // namespace hop::core

#endif // HOP_CORE_LOG_HPP
