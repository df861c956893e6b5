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
 * @file table_query.hpp
 * @brief Chainable query builder over one table's records.
 *
 * @details
 * A `TableQuery` holds a snapshot of records. Fluent methods return a new
 * builder and never modify the receiver, so a partially built query can be
 * reused as the base of several others. Terminal methods return data.
 *
 * @code
 * auto names = engine.table("users")
 *                  .where("age", 25, FilterOp::GT)
 *                  .order_by("age", false)
 *                  .limit(2)
 *                  .select({"name", "age"});
 * @endcode
 */

#pragma once

#include "naturaldb/query/operations.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace naturaldb::query {

class TableQuery {
  public:
    TableQuery() = default;
    explicit TableQuery(std::vector<Record> records);

    // --- Fluent ---
    TableQuery filter(const Predicate& predicate) const;
    TableQuery filter_by(const std::string& field, const json::Value& value,
                         FilterOp op = FilterOp::EQ) const;

    /// @throws infra::InvalidArgumentError if @p op is not a known operator name.
    TableQuery filter_by(const std::string& field, const json::Value& value,
                         const std::string& op) const;

    TableQuery where(const std::string& field, const json::Value& value,
                     FilterOp op = FilterOp::EQ) const;
    TableQuery where(const std::string& field, const json::Value& value,
                     const std::string& op) const;

    TableQuery sort(const std::string& field, bool ascending = true) const;
    TableQuery order_by(const std::string& field, bool ascending = true) const;

    TableQuery limit(std::size_t count, std::size_t offset = 0) const;
    TableQuery skip(std::size_t offset) const;

    // --- Terminal ---
    const std::vector<Record>& all() const { return records_; }
    const std::vector<Record>& execute() const { return records_; }

    std::optional<Record> first() const;
    std::optional<Record> last() const;
    std::size_t count() const { return records_.size(); }

    std::vector<json::Object> select(const std::vector<std::string>& fields) const;
    std::vector<json::Object> project(const std::vector<std::string>& fields) const;

    /// @brief The `data` object of every record, in order.
    std::vector<json::Object> to_dict() const;

    Groups group_by(const std::string& field) const;

  private:
    std::vector<Record> records_;
};

} // namespace naturaldb::query
