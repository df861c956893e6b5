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
 * @file string.cpp
 * @brief Implementation of trimming and identifier sanitization.
 */

#include "naturaldb/infra/string.hpp"

#include "naturaldb/infra/logger.hpp"

#include <cctype>
#include <iterator>

namespace naturaldb::infra {

/**
 * @note The `static_cast<unsigned char>` prevents undefined behaviour in
 * `std::isspace` for bytes with the high bit set on signed-char platforms.
 */
std::string String::trim(const std::string& s)
{
    auto start = s.begin();
    while (start != s.end() && std::isspace(static_cast<unsigned char>(*start))) {
        start++;
    }

    if (start == s.end()) {
        return "";
    }

    auto end = s.end();
    do {
        end--;
    } while (std::distance(start, end) > 0 && std::isspace(static_cast<unsigned char>(*end)));

    return std::string(start, end + 1);
}

bool String::is_safe_char(char c)
{
    // Locale-independent: bytes >= 0x80 (UTF-8 continuation or lead bytes) are unsafe.
    if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9')) {
        return true;
    }
    return c == ' ' || c == '_' || c == '-';
}

std::string String::sanitize(const std::string& name, std::size_t max_length)
{
    std::string out;
    out.reserve(name.size());
    for (char c : name) {
        if (is_safe_char(c)) {
            out.push_back(c);
        }
    }

    if (out.size() != name.size()) {
        Logger::log(LogLevel::WARN, "Sanitize: identifier '" + name + "' rewritten to '" + out + "'");
    }

    if (out.empty()) {
        out = kFallbackName;
        Logger::log(LogLevel::WARN, "Sanitize: identifier '" + name + "' has no usable characters, using '" +
                                        out + "'");
    }

    if (out.size() > max_length) {
        out.resize(max_length);
        Logger::log(LogLevel::WARN, "Sanitize: identifier truncated to " +
                                        std::to_string(max_length) + " characters: '" + out + "'");
    }
    return out;
}

} // namespace naturaldb::infra
