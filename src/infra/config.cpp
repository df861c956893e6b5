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
 * @file config.cpp
 * @brief Environment and `.env` file handling.
 */

#include "naturaldb/infra/config.hpp"

#include "naturaldb/infra/string.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <optional>
#include <stdexcept>

namespace naturaldb::infra {

namespace {

std::optional<std::string> env(const char* key)
{
    const char* value = std::getenv(key);
    if (value == nullptr) {
        return std::nullopt;
    }
    return std::string(value);
}

std::optional<bool> parse_bool(std::string text)
{
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (text == "1" || text == "true" || text == "yes" || text == "on") {
        return true;
    }
    if (text == "0" || text == "false" || text == "no" || text == "off") {
        return false;
    }
    return std::nullopt;
}

std::string unquote(const std::string& value)
{
    if (value.size() >= 2) {
        char first = value.front();
        char last = value.back();
        if ((first == '"' && last == '"') || (first == '\'' && last == '\'')) {
            return value.substr(1, value.size() - 2);
        }
    }
    return value;
}

} // namespace

Config Config::from_env()
{
    Config config;

    if (auto path = env("NATURALDB_DATA_PATH"); path && !path->empty()) {
        config.data_path = *path;
    }

    if (auto level = env("LOG_LEVEL")) {
        if (auto parsed = parse_log_level(*level)) {
            config.log_level = *parsed;
        } else {
            Logger::log(LogLevel::WARN, "Config: unknown LOG_LEVEL '" + *level + "', using INFO");
        }
    }

    if (auto file = env("NATURALDB_LOG_FILE")) {
        config.log_file = *file;
    }

    if (auto pretty = env("NATURALDB_PRETTY")) {
        if (auto parsed = parse_bool(*pretty)) {
            config.pretty_records = *parsed;
        } else {
            Logger::log(LogLevel::WARN,
                        "Config: NATURALDB_PRETTY expects a boolean, got '" + *pretty + "'");
        }
    }

    if (auto length = env("NATURALDB_MAX_NAME_LENGTH")) {
        try {
            long parsed = std::stol(*length);
            if (parsed <= 0) {
                throw std::out_of_range("non-positive");
            }
            config.max_name_length = static_cast<std::size_t>(parsed);
        } catch (const std::logic_error&) {
            Logger::log(LogLevel::WARN,
                        "Config: NATURALDB_MAX_NAME_LENGTH must be a positive integer, got '" +
                            *length + "'");
        }
    }

    return config;
}

std::size_t Config::load_env_file(const std::string& path)
{
    std::ifstream file(path);
    if (!file.is_open()) {
        return 0;
    }

    std::size_t loaded = 0;
    std::string line;
    while (std::getline(file, line)) {
        line = String::trim(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }

        auto eq = line.find('=');
        if (eq == std::string::npos) {
            continue;
        }

        std::string key = String::trim(line.substr(0, eq));
        std::string value = unquote(String::trim(line.substr(eq + 1)));
        if (key.empty() || std::getenv(key.c_str()) != nullptr) {
            continue;
        }

        if (::setenv(key.c_str(), value.c_str(), 0) == 0) {
            loaded++;
        }
    }

    Logger::log(LogLevel::DEBUG,
                "Config: loaded " + std::to_string(loaded) + " variable(s) from '" + path + "'");
    return loaded;
}

void Config::apply_logging() const
{
    Logger::set_level(log_level);
    Logger::set_file(log_file);
}

} // namespace naturaldb::infra
