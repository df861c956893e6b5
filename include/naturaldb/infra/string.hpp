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
 * @file string.hpp
 * @brief String primitives: whitespace trimming and identifier sanitization.
 *
 * @details
 * `String::sanitize` is the only gate between user-supplied names (user ids,
 * database, table and record names) and the filesystem. Every path segment the
 * storage layer builds goes through it.
 */

#pragma once

#include <cstddef>
#include <string>

namespace naturaldb::infra {

/**
 * @class String
 * @brief A static container for text processing algorithms.
 */
class String {
  public:
    /// @brief Default upper bound on a sanitized identifier, in bytes.
    static constexpr std::size_t kMaxNameLength = 80;

    /// @brief Segment used when nothing of an identifier survives sanitization.
    static constexpr const char* kFallbackName = "unnamed";

    /**
     * @brief Trims leading and trailing whitespace from a string.
     *
     * @param s The source string to process.
     * @return std::string The trimmed copy; empty if @p s is blank.
     *
     * @code
     * std::string clean = naturaldb::infra::String::trim("  KEY=value \n"); // "KEY=value"
     * @endcode
     */
    static std::string trim(const std::string& s);

    /**
     * @brief Turns an arbitrary identifier into a filesystem-safe path segment.
     *
     * Only ASCII letters, digits, space, `_` and `-` survive; every other byte is
     * dropped. The result is then cut to @p max_length bytes. Both adjustments
     * are reported at `WARN` level but are not errors.
     *
     * The transform is idempotent: `sanitize(sanitize(s)) == sanitize(s)`, and the
     * output can never contain `/` or `.`, so it cannot escape its parent.
     *
     * @param name The raw identifier.
     * @param max_length Upper bound on the returned length.
     * @return std::string The sanitized segment.
     *
     * An identifier with no usable characters becomes `kFallbackName`, so an
     * empty segment never collapses a path onto its parent.
     *
     * @code
     * String::sanitize("../etc/passwd"); // "etcpasswd"
     * String::sanitize("order #42");     // "order 42"
     * String::sanitize("../");           // "unnamed"
     * @endcode
     */
    static std::string sanitize(const std::string& name, std::size_t max_length = kMaxNameLength);

    /// @brief True when @p c belongs to the identifier alphabet kept by `sanitize`.
    static bool is_safe_char(char c);
};

} // namespace naturaldb::infra
