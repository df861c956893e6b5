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
 * @file parser.hpp
 * @brief Recursive-descent JSON parser.
 *
 * @details
 * Accepts RFC 8259 JSON with one restriction: integer literals must fit in a
 * signed 64-bit integer. The parser never guesses. Every deviation from the
 * grammar raises `infra::JsonParseError` carrying the offending byte offset and
 * a `ParseErrorKind`.
 *
 * **Operational Logic:**
 * 1. Whitespace (space, tab, CR, LF) is skipped between tokens.
 * 2. A literal without `.`, `e` or `E` becomes `Value::Type::INTEGER`; any
 *    other number becomes `Value::Type::FLOAT`.
 * 3. `\uXXXX` escapes are decoded to UTF-8. Surrogate pairs are combined;
 *    lone surrogates are rejected.
 * 4. Duplicate object keys keep the position of the first occurrence and the
 *    value of the last.
 * 5. After the root value only whitespace may follow.
 */

#pragma once

#include "naturaldb/json/value.hpp"

#include <string>

namespace naturaldb::json {

class Parser {
  public:
    /// @brief Containers nested deeper than this are rejected.
    static constexpr int kMaxDepth = 512;

    /**
     * @brief Parses a complete JSON text.
     * @throws infra::JsonParseError on any grammar violation.
     *
     * @code
     * auto doc = naturaldb::json::Parser::parse(R"({"name": "Alice", "age": 30})");
     * doc.as_object().get("age")->as_int(); // 30
     * @endcode
     */
    static Value parse(const std::string& text);

    /**
     * @brief Reads @p path and parses its contents.
     * @throws infra::StorageError if the file cannot be read.
     * @throws infra::JsonParseError if the contents are not valid JSON.
     */
    static Value parse_file(const std::string& path);
};

} // namespace naturaldb::json
