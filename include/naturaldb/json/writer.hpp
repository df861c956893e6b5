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
 * @file writer.hpp
 * @brief JSON serializer, the inverse of `Parser`.
 *
 * @details
 * Two layouts are produced:
 * - **Compact** (no indent): `{"a":1,"b":[true,null]}`.
 * - **Pretty** (indent `n`): one member or element per line, `n` spaces per
 *   level, `": "` after keys, closers on their own line. Empty containers stay
 *   on one line as `{}` and `[]`.
 *
 * For every value the parser can produce, `Parser::parse(Writer::write(v)) == v`.
 */

#pragma once

#include "naturaldb/json/value.hpp"

#include <optional>
#include <string>

namespace naturaldb::json {

class Writer {
  public:
    /**
     * @brief Serializes @p value.
     *
     * @param value The document to write.
     * @param indent Spaces per nesting level; `std::nullopt` for compact output.
     * @return std::string The JSON text, without trailing newline.
     *
     * @throws infra::InvalidArgumentError if a float is NaN or infinite.
     */
    static std::string write(const Value& value, std::optional<int> indent = std::nullopt);

    /// @brief Writes @p text as a quoted, escaped JSON string literal.
    static std::string quote(const std::string& text);
};

} // namespace naturaldb::json
