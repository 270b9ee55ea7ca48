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
 * @brief Console logging facility for the nodeboot entrypoint.
 *
 * @details
 * Declares the `Logger` class, the single reporting interface used by every
 * bootstrap stage. Informational output goes to `stdout` and problems go to
 * `stderr`, so the container runtime can separate the two streams. Output is
 * serialized by a mutex and filtered by a process-wide minimum level.
 */

#pragma once

#include <mutex>
#include <optional>
#include <string>

namespace nodeboot::infra {

/**
 * @enum LogLevel
 * @brief Severity hierarchy for diagnostic messages.
 */
enum class LogLevel {
    TRACE, ///< Command lines and per-iteration details.
    DEBUG, ///< Decisions taken by the pipeline (markers found, arguments added).
    INFO,  ///< Stage progress (validating, initializing, handing off).
    WARN,  ///< Tolerated anomalies (missing recovery helper, empty root password).
    ERROR, ///< Failures reported right before a fatal exit.
    FATAL  ///< The error that terminates the entrypoint.
};

/**
 * @class Logger
 * @brief Static, thread-safe console logger.
 *
 * @details
 * Each entry carries a timestamp and a four-letter severity tag.
 *
 * **Stream Routing Logic:**
 * - `TRACE`, `DEBUG`, `INFO`: `std::cout`.
 * - `WARN`, `ERROR`, `FATAL`: `std::cerr`.
 *
 * ANSI colors are emitted only when the target stream is a terminal; a
 * container log collector gets plain text.
 */
class Logger {
  public:
    /**
     * @brief Writes a message if `level` passes the current threshold.
     *
     * @code
     * nodeboot::infra::Logger::log(LogLevel::INFO, "Validating configuration...");
     * @endcode
     */
    static void log(LogLevel level, const std::string& message);

    /// @brief Sets the minimum level that is written. Defaults to `INFO`.
    static void set_level(LogLevel level);

    /// @brief Returns the current minimum level.
    static LogLevel level();

    /// @brief True when messages of `level` would be written.
    static bool enabled(LogLevel level);

    /**
     * @brief Parses a level name (`trace`, `debug`, `info`, `warn`, `error`, `fatal`).
     *
     * Matching is case-insensitive. Returns an empty optional for unknown names.
     */
    static std::optional<LogLevel> parse_level(const std::string& name);

  private:
    /// @brief Serializes writes to `std::cout` and `std::cerr`.
    static std::mutex mutex_;

    static LogLevel threshold_;
};

} // namespace nodeboot::infra
