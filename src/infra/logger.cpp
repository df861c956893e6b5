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
 * @file logger.cpp
 * @brief Implementation of the thread-safe diagnostic logging utility.
 */

#include "naturaldb/infra/logger.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>

namespace naturaldb::infra {

std::mutex Logger::mutex_;
LogLevel Logger::threshold_ = LogLevel::INFO;
std::string Logger::file_path_;
bool Logger::stderr_only_ = false;

namespace {

const char* tag(LogLevel level)
{
    switch (level) {
    case LogLevel::TRACE:
        return "[TRCE]";
    case LogLevel::DEBUG:
        return "[DBUG]";
    case LogLevel::INFO:
        return "[INFO]";
    case LogLevel::WARN:
        return "[WARN]";
    case LogLevel::ERROR:
        return "[FAIL]";
    case LogLevel::FATAL:
        return "[CRIT]";
    }
    return "[INFO]";
}

const char* colour(LogLevel level)
{
    switch (level) {
    case LogLevel::TRACE:
        return "\033[90m";
    case LogLevel::DEBUG:
        return "\033[36m";
    case LogLevel::INFO:
        return "\033[32m";
    case LogLevel::WARN:
        return "\033[33m";
    case LogLevel::ERROR:
        return "\033[31m";
    case LogLevel::FATAL:
        return "\033[1;31m";
    }
    return "\033[0m";
}

} // namespace

std::optional<LogLevel> parse_log_level(const std::string& name)
{
    std::string upper(name);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "TRACE")
        return LogLevel::TRACE;
    if (upper == "DEBUG")
        return LogLevel::DEBUG;
    if (upper == "INFO")
        return LogLevel::INFO;
    if (upper == "WARN" || upper == "WARNING")
        return LogLevel::WARN;
    if (upper == "ERROR")
        return LogLevel::ERROR;
    if (upper == "FATAL" || upper == "CRITICAL")
        return LogLevel::FATAL;
    return std::nullopt;
}

void Logger::set_level(LogLevel level)
{
    std::lock_guard<std::mutex> lock(mutex_);
    threshold_ = level;
}

LogLevel Logger::level()
{
    std::lock_guard<std::mutex> lock(mutex_);
    return threshold_;
}

void Logger::set_file(const std::string& path)
{
    std::lock_guard<std::mutex> lock(mutex_);
    file_path_ = path;
}

void Logger::set_stderr_only(bool enabled)
{
    std::lock_guard<std::mutex> lock(mutex_);
    stderr_only_ = enabled;
}

/**
 * @brief Dispatches a formatted log entry to the console and the optional file sink.
 *
 * The whole entry is written under one lock, so the timestamp, tag and payload
 * of concurrent callers never mix.
 */
void Logger::log(LogLevel level, const std::string& message)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (level < threshold_) {
        return;
    }

    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);

    // Mutex protects std::localtime's internal static buffer.
    std::tm local = *std::localtime(&time);

    auto& stream = (stderr_only_ || level >= LogLevel::WARN) ? std::cerr : std::cout;
    stream << "[" << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << "] " << colour(level)
           << tag(level) << " " << message << "\033[0m" << std::endl;

    if (!file_path_.empty()) {
        std::ofstream file(file_path_, std::ios::app);
        if (file.is_open()) {
            file << "[" << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << "] " << tag(level)
                 << " " << message << "\n";
        }
    }
}

} // namespace naturaldb::infra
