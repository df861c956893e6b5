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
 * @file join.hpp
 * @brief Hash joins between two record lists.
 *
 * @details
 * **Operational Logic:**
 * 1. Build: hash every right record by the canonical key of its join field.
 * 2. Probe: look up each left record's key and emit one merged row per match.
 * 3. Merge: copy the left members (with `left_prefix`), then the right members
 *    (with `right_prefix`). A right key that collides with a left key
 *    overwrites the value in place.
 *
 * Keys match under the filter equality, so `1` joins `1.0`. Records whose join
 * field is absent or null never match. Output order follows the left list,
 * then the right list within each left record.
 */

#pragma once

#include "naturaldb/json/value.hpp"
#include "naturaldb/storage/entities.hpp"

#include <string>
#include <vector>

namespace naturaldb::query {

enum class JoinType { INNER, LEFT };

/// @throws infra::InvalidArgumentError for names other than "inner" and "left".
JoinType parse_join_type(const std::string& name);
const char* to_string(JoinType type);

class JoinOperations {
  public:
    /// @brief Rows for matching pairs only.
    static std::vector<json::Object> inner_join(const std::vector<storage::Record>& left,
                                                const std::vector<storage::Record>& right,
                                                const std::string& left_field,
                                                const std::string& right_field,
                                                const std::string& left_prefix = "",
                                                const std::string& right_prefix = "");

    /// @brief Matching pairs, plus one left-only row per unmatched left record.
    static std::vector<json::Object> left_join(const std::vector<storage::Record>& left,
                                               const std::vector<storage::Record>& right,
                                               const std::string& left_field,
                                               const std::string& right_field,
                                               const std::string& left_prefix = "",
                                               const std::string& right_prefix = "");

    static std::vector<json::Object> join(JoinType type, const std::vector<storage::Record>& left,
                                          const std::vector<storage::Record>& right,
                                          const std::string& left_field,
                                          const std::string& right_field,
                                          const std::string& left_prefix = "",
                                          const std::string& right_prefix = "");
};

} // namespace naturaldb::query
