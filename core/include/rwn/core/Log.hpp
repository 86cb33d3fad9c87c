/**
 * @file Log.hpp
 * @brief Minimal logging facade with runtime severity filtering.
 *
 * Provides a static Log class backed by an injectable ILogger interface.
 * The default implementation writes to stderr.  Tests install a capturing
 * logger through Log::setLogger().
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-03-14
 * @copyright MIT License
 */
#pragma once

#ifndef RWN_CORE_LOG_HPP
    #define RWN_CORE_LOG_HPP

    #include "Types.hpp"

    #include <string_view>

namespace rwn::core {

/**
 * @brief Severity levels for log messages.
 */
enum class LogLevel : u8
{
    kDebug = 0,
    kInfo,
    kWarn,
    kError,
    kFatal
};

/**
 * @brief Abstract sink for log messages.
 */
class ILogger
{
public:
    virtual ~ILogger() = default;

    /**
     * @brief Write a log entry.
     * @param level   Severity.
     * @param tag     Subsystem tag (e.g. "P2PSession", "PeerProtocol").
     * @param message Formatted message body.
     */
    virtual void write(LogLevel level, std::string_view tag, std::string_view message) = 0;
};

/**
 * @brief Static logging facade used throughout the engine.
 *
 * All methods are thread-safe provided the installed ILogger is thread-safe.
 */
class Log final
{
public:
    Log() = delete;

    static void setLogger(ILogger *logger);
    static void setMinLevel(LogLevel level);
    [[nodiscard]] static LogLevel minLevel();

    /// @brief Parses "debug", "info", "warn", "error" or "fatal".
    /// @return True when @p name was recognised and applied.
    static bool setMinLevel(std::string_view name);

    static void debug(std::string_view tag, std::string_view msg);
    static void info (std::string_view tag, std::string_view msg);
    static void warn (std::string_view tag, std::string_view msg);
    static void error(std::string_view tag, std::string_view msg);
    static void fatal(std::string_view tag, std::string_view msg);

    static void debug(std::string_view msg) { debug("rwn", msg); }
    static void info (std::string_view msg) { info ("rwn", msg); }
    static void warn (std::string_view msg) { warn ("rwn", msg); }
    static void error(std::string_view msg) { error("rwn", msg); }
    static void fatal(std::string_view msg) { fatal("rwn", msg); }
};

} // namespace rwn::core

#endif // RWN_CORE_LOG_HPP
