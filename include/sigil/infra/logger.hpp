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
 * @brief Thread-safe diagnostic logging facility for Sigil.
 *
 * @details
 * Centralized reporting interface shared by the identity bootstrap and the
 * command-line front end. Output is serialized through a single mutex so that
 * concurrent writers never interleave, and a process-wide threshold filters
 * out chatter below the configured severity.
 */

#pragma once

#include <mutex>
#include <string>

namespace sigil::infra {

/**
 * @enum LogLevel
 * @brief Severity hierarchy for diagnostic messages, lowest first.
 */
enum class LogLevel {
    TRACE, ///< Granular execution flow details.
    DEBUG, ///< Diagnostic information (e.g. which identity source answered).
    INFO,  ///< Nominal operational events.
    WARN,  ///< Degraded but usable state (e.g. random machine id fallback).
    ERROR, ///< Recoverable failures.
    FATAL  ///< Failures that terminate the process.
};

/**
 * @class Logger
 * @brief A static utility class providing system-wide logging capabilities.
 */
class Logger {
  public:
    /**
     * @brief Writes a formatted diagnostic message to the console.
     *
     * Messages below the current threshold are discarded before the lock is
     * taken. `TRACE`, `DEBUG` and `INFO` go to `std::cout`; `WARN` and above
     * go to `std::cerr`.
     *
     * @param level The severity classification of the message.
     * @param message The content payload to be logged.
     *
     * @code
     * sigil::infra::Logger::log(LogLevel::WARN, "Identity: falling back to random machine id");
     * @endcode
     */
    static void log(LogLevel level, const std::string& message);

    /// Sets the minimum severity that will be emitted.
    static void set_level(LogLevel level);

    /// Returns the minimum severity currently emitted.
    static LogLevel level();

    /**
     * @brief Parses a case-insensitive level name.
     *
     * Accepts `trace`, `debug`, `info`, `warn`/`warning`, `error` and `fatal`.
     *
     * @throws std::invalid_argument if the name is not recognised.
     */
    static LogLevel parse_level(const std::string& name);

  private:
    /// Guards `std::cout`/`std::cerr` and the threshold.
    static std::mutex mutex_;

    /// Current emission threshold.
    static LogLevel level_;
};

} // namespace sigil::infra
