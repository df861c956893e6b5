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
 * @brief Thread-safe diagnostic logging facility for NaturalDB.
 *
 * @details
 * This header declares the `Logger` class, the single reporting channel used by
 * the storage layer, the query engine and the request dispatcher. Output is
 * serialized through one mutex so entries from concurrent threads never
 * interleave. Entries below the configured threshold are dropped before any
 * formatting happens, and every accepted entry can additionally be appended to
 * a plain-text log file.
 */

#pragma once

#include <mutex>
#include <optional>
#include <string>

namespace naturaldb::infra {

/**
 * @enum LogLevel
 * @brief Defines the severity hierarchy for diagnostic messages.
 */
enum class LogLevel {
    TRACE, ///< Per-file and per-record execution detail.
    DEBUG, ///< Diagnostic information intended for development.
    INFO,  ///< Nominal operational events (table created, import finished).
    WARN,  ///< Recovered anomalies (identifier sanitized, record missing).
    ERROR, ///< Failed operations that were reported back to the caller.
    FATAL  ///< Failures that end the process.
};

/**
 * @brief Parses a level name ("TRACE", "debug", "WARNING", ...).
 * @return The matching level, or `std::nullopt` for an unknown name.
 */
std::optional<LogLevel> parse_log_level(const std::string& name);

/**
 * @class Logger
 * @brief A static utility class providing process-wide logging.
 */
class Logger {
  public:
    /**
     * @brief Writes a formatted diagnostic message.
     *
     * The console entry carries a timestamp, a colour-coded severity tag and the
     * payload. `TRACE`, `DEBUG` and `INFO` go to `std::cout`; `WARN` and above go
     * to `std::cerr`. When a log file is configured the same entry, without
     * colour codes, is appended to it.
     *
     * @param level The severity classification of the message.
     * @param message The content payload to be logged.
     *
     * @code
     * naturaldb::infra::Logger::log(LogLevel::INFO, "Engine: table 'Products' created.");
     * @endcode
     */
    static void log(LogLevel level, const std::string& message);

    /// @brief Drops every subsequent message below @p level.
    static void set_level(LogLevel level);

    static LogLevel level();

    /**
     * @brief Mirrors accepted entries to @p path (append mode).
     *
     * Passing an empty string disables the file sink.
     */
    static void set_file(const std::string& path);

    /**
     * @brief Sends every console entry to `std::cerr` when @p enabled.
     *
     * Used when `std::cout` carries program output (the request loop writes
     * one response per line there).
     */
    static void set_stderr_only(bool enabled);

  private:
    /// @brief Guards the console streams, the threshold and the file path.
    static std::mutex mutex_;

    static LogLevel threshold_;
    static std::string file_path_;
    static bool stderr_only_;
};

} // namespace naturaldb::infra
