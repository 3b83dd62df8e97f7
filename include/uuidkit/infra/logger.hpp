/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file logger.hpp
 * @brief Thread-safe diagnostic logging facility for UuidKit.
 *
 * @details
 * Declares the `Logger` class used by the extension entry point, the SQL
 * callback error path and the shell. Writes are serialized so that messages
 * from concurrent SQLite connections never interleave.
 */

#pragma once

#include <atomic>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace uuidkit::infra {

/**
 * @enum LogLevel
 * @brief Severity hierarchy for diagnostic messages.
 */
enum class LogLevel {
    TRACE, ///< Granular execution flow details.
    DEBUG, ///< Per-statement diagnostics (e.g., SQL text executed by the shell).
    INFO,  ///< Nominal operational events (e.g., session opened).
    WARN,  ///< Non-blocking anomalies.
    ERROR, ///< Recoverable failures (e.g., a function registration was rejected).
    FATAL  ///< Environment faults (e.g., the entropy source failed).
};

/**
 * @class Logger
 * @brief A static utility class providing process-wide logging.
 */
class Logger {
  public:
    /**
     * @brief Writes a formatted diagnostic message to the console.
     *
     * Messages below the current threshold (see `set_level`) are dropped.
     *
     * **Stream Routing Logic:**
     * - `TRACE`, `DEBUG`, `INFO`: `std::cout`.
     * - `WARN`, `ERROR`, `FATAL`: `std::cerr`.
     *
     * @param level The severity classification of the message.
     * @param message The content payload to be logged.
     *
     * @code
     * uuidkit::infra::Logger::log(LogLevel::ERROR, "Extension: failed to register uuid7/0");
     * @endcode
     */
    static void log(LogLevel level, const std::string& message);

    /// Sets the minimum severity that reaches the console. Default: `INFO`.
    static void set_level(LogLevel level);

    /// Returns the current minimum severity.
    static LogLevel level();

    /**
     * @brief Parses a case-insensitive level name.
     *
     * @param name One of `trace`, `debug`, `info`, `warn`, `error`, `fatal`.
     * @return std::optional<LogLevel> The level, or empty for unknown names.
     */
    static std::optional<LogLevel> parse_level(std::string_view name);

  private:
    /// Guards `std::cout`/`std::cerr` and `std::localtime`.
    static std::mutex mutex_;

    /// Current threshold, readable without taking `mutex_`.
    static std::atomic<LogLevel> level_;
};

} // namespace uuidkit::infra
