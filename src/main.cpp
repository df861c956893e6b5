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
 * @file main.cpp
 * @brief Application Entry Point (Bootstrap).
 *
 * @details
 * This file contains the `main` function which orchestrates the startup sequence:
 * 1. Configuration (`.env` file, process environment, command line).
 * 2. Logging setup. Log lines go to stderr so stdout carries only responses.
 * 3. Engine and dispatcher initialization.
 * 4. Request loop: one JSON request per stdin line, one JSON response per stdout line.
 */

#include "naturaldb/api/handler.hpp"
#include "naturaldb/infra/config.hpp"
#include "naturaldb/infra/logger.hpp"
#include "naturaldb/query/query_engine.hpp"

#include <iostream>
#include <stdexcept>
#include <string>

using naturaldb::infra::LogLevel;
using naturaldb::infra::Logger;

/**
 * @brief Prints usage instructions to stdout.
 */
void print_help(const char* binary_name)
{
    std::cout << "Usage: " << binary_name << " [DATA_PATH] [USER] [DATABASE]\n"
              << "Reads one JSON request per line from stdin and prints one JSON response per line.\n"
              << "Options:\n"
              << "  DATA_PATH   Root directory of the store (Default: $NATURALDB_DATA_PATH or ./data)\n"
              << "  USER        Owner of the database (Default: default)\n"
              << "  DATABASE    Database to open, created when missing (Default: main)\n"
              << "  --help      Show this help message\n"
              << "Environment:\n"
              << "  NATURALDB_DATA_PATH, LOG_LEVEL, NATURALDB_LOG_FILE, NATURALDB_PRETTY,\n"
              << "  NATURALDB_MAX_NAME_LENGTH (also read from ./.env)\n"
              << "Example request:\n"
              << "  {\"op\": \"insert\", \"args\": {\"table\": \"users\", \"data\": {\"name\": \"Ada\"}}}\n";
}

/**
 * @brief Main Execution Entry Point.
 */
int main(int argc, char* argv[])
{
    // 0. Argument Pre-check
    if (argc > 1 && std::string(argv[1]) == "--help") {
        print_help(argv[0]);
        return 0;
    }

    try {
        // 1. Configuration: .env seeds the environment, argv overrides both
        naturaldb::infra::Config::load_env_file(".env");
        naturaldb::infra::Config config = naturaldb::infra::Config::from_env();

        std::string user_id = "default";
        std::string database_name = "main";

        if (argc > 1)
            config.data_path = argv[1];
        if (argc > 2)
            user_id = argv[2];
        if (argc > 3)
            database_name = argv[3];

        // 2. Logging
        Logger::set_stderr_only(true);
        config.apply_logging();

        Logger::log(LogLevel::INFO, "System: Booting NaturalDB...");
        Logger::log(LogLevel::INFO, "Config: Data path set to '" + config.data_path + "'");
        Logger::log(LogLevel::INFO,
                    "Config: Serving database '" + database_name + "' of user '" + user_id + "'");

        // 3. Engine and dispatcher
        naturaldb::query::QueryEngine engine(config, naturaldb::storage::User{user_id, user_id},
                                             naturaldb::storage::Database{database_name});
        naturaldb::api::Handler handler(engine);

        // 4. Request loop (ends at EOF)
        std::string line;
        std::size_t served = 0;
        while (std::getline(std::cin, line)) {
            if (line.find_first_not_of(" \t\r") == std::string::npos) {
                continue;
            }
            std::cout << handler.process(line) << std::endl;
            served++;
        }

        Logger::log(LogLevel::INFO, "System: Served " + std::to_string(served) + " request(s).");

    } catch (const std::exception& e) {
        Logger::log(LogLevel::FATAL, "System: Critical Failure: " + std::string(e.what()));
        return 1;
    }

    Logger::log(LogLevel::INFO, "System: Shutdown complete.");
    return 0;
}
