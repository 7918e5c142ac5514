// SPDX-License-Identifier: BSD-2-Clause

#pragma once
/**
 * @file Log.h
 * @brief Thread-safe leveled logger shared by workers, observer and correlator.
 *
 * Usage:
 *   pathspider::Logger::init({ .level = LogLevel::INFO,
 *                              .mode  = LogMode::Console });
 *
 *   PSLOG_INFO("probing %s:%u", ip.c_str(), port);
 *
 * Levels: TRACE < DEBUG < INFO < WARN < ERROR
 * Modes : Console, File, Silent
 */

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <mutex>
#include <string>

namespace pathspider {

/**
 * @brief Logging severity levels in increasing order.
 */
enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO  = 2,
    WARN  = 3,
    ERROR = 4
};

/**
 * @brief Output backends supported by the logger.
 */
enum class LogMode {
    Console,  ///< Colored lines on stderr.
    File,     ///< Append to LoggerConfig::file_path.
    Silent    ///< Discard everything.
};

struct LoggerConfig {
    LogLevel level = LogLevel::INFO;
    LogMode  mode  = LogMode::Console;
    std::string file_path{};              ///< Used when mode == File.
};

/**
 * @brief Map a config string ("trace", "debug", ...) to a level; unknown -> INFO.
 */
LogLevel parse_log_level(const std::string& text);

/**
 * @brief Map a config string ("console", "file", "silent") to a mode; unknown -> Silent.
 */
LogMode parse_log_mode(const std::string& text);

/**
 * @brief Process-wide logger with printf-style helpers.
 *
 * The minimum level lives in an atomic so worker threads can filter without
 * locking; emission itself is serialised by a mutex so lines never interleave.
 */
class Logger {
public:
    /**
     * @brief Initialise the backend and minimum level.
     *
     * If mode == File and the file cannot be opened the logger falls back to
     * the console. Calling init() again reconfigures from scratch.
     */
    static void init(const LoggerConfig& cfg);

    static void set_level(LogLevel lvl);
    static LogLevel level();

    /**
     * @brief Emit a formatted line. Safe to call from any thread.
     */
    static void log(LogLevel lvl, const char* fmt, ...);

private:
    static void vlog(LogLevel lvl, const char* fmt, va_list ap);
    static const char* level_str(LogLevel lvl);

    static std::mutex mtx_;
    static std::atomic<int> level_;
    static LogMode mode_;
    static FILE* file_;
};

// Level check first so disabled levels never format their arguments.
#define PSLOG_ENABLED(lvl) \
    (static_cast<int>(pathspider::Logger::level()) <= static_cast<int>(pathspider::LogLevel::lvl))

#define PSLOG_AT(lvl, fmt, ...) \
    do { \
        if (PSLOG_ENABLED(lvl)) pathspider::Logger::log(pathspider::LogLevel::lvl, fmt, ##__VA_ARGS__); \
    } while (0)

#define PSLOG_TRACE(fmt, ...) PSLOG_AT(TRACE, fmt, ##__VA_ARGS__)
#define PSLOG_DEBUG(fmt, ...) PSLOG_AT(DEBUG, fmt, ##__VA_ARGS__)
#define PSLOG_INFO(fmt, ...)  PSLOG_AT(INFO, fmt, ##__VA_ARGS__)
#define PSLOG_WARN(fmt, ...)  PSLOG_AT(WARN, fmt, ##__VA_ARGS__)
#define PSLOG_ERROR(fmt, ...) PSLOG_AT(ERROR, fmt, ##__VA_ARGS__)

} // namespace pathspider
