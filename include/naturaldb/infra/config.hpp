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
 * @file config.hpp
 * @brief Runtime configuration: data directory, logging and record layout.
 *
 * @details
 * Values are resolved in three layers, later layers winning:
 * 1. Built-in defaults.
 * 2. Process environment, optionally pre-seeded from a `.env` file.
 * 3. Command line arguments applied by the executable.
 *
 * | Variable                    | Field             | Default  |
 * |-----------------------------|-------------------|----------|
 * | `NATURALDB_DATA_PATH`       | `data_path`       | `./data` |
 * | `LOG_LEVEL`                 | `log_level`       | `INFO`   |
 * | `NATURALDB_LOG_FILE`        | `log_file`        | (none)   |
 * | `NATURALDB_PRETTY`          | `pretty_records`  | `true`   |
 * | `NATURALDB_MAX_NAME_LENGTH` | `max_name_length` | `80`     |
 */

#pragma once

#include "naturaldb/infra/logger.hpp"

#include <cstddef>
#include <string>

namespace naturaldb::infra {

struct Config {
    std::string data_path = "./data";
    LogLevel log_level = LogLevel::INFO;
    std::string log_file;
    bool pretty_records = true;
    std::size_t max_name_length = 80;

    /**
     * @brief Builds a configuration from the process environment.
     *
     * Unparseable values are reported at `WARN` and the default is kept.
     */
    static Config from_env();

    /**
     * @brief Seeds the process environment from a `KEY=VALUE` file.
     *
     * Blank lines and lines starting with `#` are skipped. Surrounding single or
     * double quotes are removed from values. A variable that is already set in
     * the environment is left untouched.
     *
     * @param path Location of the file.
     * @return std::size_t Number of variables that were set; 0 if the file is absent.
     */
    static std::size_t load_env_file(const std::string& path);

    /// @brief Pushes `log_level` and `log_file` into the global Logger.
    void apply_logging() const;
};

} // namespace naturaldb::infra
