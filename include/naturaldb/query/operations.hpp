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
 * @file operations.hpp
 * @brief Stateless in-memory query primitives over record lists.
 *
 * @details
 * Every operation takes a list of records and returns a new list (or a
 * derived value). Nothing here touches storage. The query engine loads a
 * table, then chains these primitives.
 *
 * **Field addressing:** fields are named with dot paths (`specs.storage`).
 * Each segment descends into a nested object. A path that leaves the
 * document, or crosses a non-object, yields "no value".
 *
 * **Comparison rules:**
 * - Equality is structural. Integers and floats compare numerically, so
 *   `1 == 1.0`. Object member order is irrelevant for equality.
 * - Ordering exists only between two numbers, two strings (bytewise) or two
 *   booleans (`false < true`). Any other pairing is incomparable.
 * - A field with no value matches only `ne`.
 */

#pragma once

#include "naturaldb/json/value.hpp"
#include "naturaldb/storage/entities.hpp"

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace naturaldb::query {

using storage::Record;

enum class FilterOp { EQ, NE, GT, GTE, LT, LTE, CONTAINS };

/// @throws infra::InvalidArgumentError for names other than eq/ne/gt/gte/lt/lte/contains.
FilterOp parse_operator(const std::string& name);
const char* to_string(FilterOp op);

enum class AggregateOp { COUNT, SUM, AVG, MIN, MAX };

/// @throws infra::InvalidArgumentError for names other than count/sum/avg/min/max.
AggregateOp parse_aggregate(const std::string& name);
const char* to_string(AggregateOp op);

/// @brief One `field <op> value` test.
struct Condition {
    std::string field;
    FilterOp op = FilterOp::EQ;
    json::Value value;
};

using Predicate = std::function<bool(const Record&)>;

/// @brief Buckets in first-seen order of their key.
using Groups = std::vector<std::pair<json::Value, std::vector<Record>>>;

class QueryOperations {
  public:
    // ========================================================================
    // Field access
    // ========================================================================

    /// @brief Value at dot path @p path, or `nullptr` when it does not exist.
    static const json::Value* get_field(const json::Object& data, const std::string& path);

    /**
     * @brief Stores @p value at dot path @p path, creating intermediate objects.
     *
     * An intermediate member that exists but is not an object is replaced.
     */
    static void set_field(json::Object& data, const std::string& path, json::Value value);

    // ========================================================================
    // Comparison
    // ========================================================================

    /// @brief Structural equality with numeric comparison of int and float.
    static bool values_equal(const json::Value& a, const json::Value& b);

    /**
     * @brief Three-way ordering of two values.
     * @return negative, zero or positive; `std::nullopt` when incomparable.
     */
    static std::optional<int> compare_values(const json::Value& a, const json::Value& b);

    /**
     * @brief Canonical text of a value; equal under `values_equal` means equal text.
     *
     * Numbers are normalized (an integral float prints as its integer) and
     * object members are sorted by key. Used as the hash key for grouping and
     * joining.
     */
    static std::string canonical_key(const json::Value& value);

    /// @brief Text used by `contains`: raw text for strings, compact JSON otherwise.
    static std::string to_text(const json::Value& value);

    /**
     * @brief Evaluates `field <op> value` for one field value.
     * @param field The field value, `nullptr` when the field is absent.
     */
    static bool compare(const json::Value* field, const json::Value& value, FilterOp op);

    /// @brief Evaluates @p condition against one document.
    static bool matches(const json::Object& data, const Condition& condition);

    // ========================================================================
    // Operations
    // ========================================================================

    static std::vector<Record> filter(const std::vector<Record>& records, const Predicate& predicate);

    /**
     * @brief Keeps records whose @p field satisfies `<op> value`.
     *
     * @code
     * auto adults = QueryOperations::filter_by_field(users, "age", 18, FilterOp::GTE);
     * @endcode
     */
    static std::vector<Record> filter_by_field(const std::vector<Record>& records,
                                               const std::string& field, const json::Value& value,
                                               FilterOp op = FilterOp::EQ);

    /// @brief Keeps records that satisfy every condition.
    static std::vector<Record> filter_all(const std::vector<Record>& records,
                                          const std::vector<Condition>& conditions);

    /**
     * @brief Extracts @p fields from each record.
     *
     * A dot path is re-nested in the output (`specs.ram` becomes
     * `{"specs": {"ram": ...}}`). A missing field is projected as `null`.
     */
    static std::vector<json::Object> project(const std::vector<Record>& records,
                                             const std::vector<std::string>& fields);

    /**
     * @brief Partitions records by the value of @p field.
     *
     * Every record lands in exactly one bucket; records without the field
     * share the `null` bucket. Keys equal under `values_equal` share a bucket.
     */
    static Groups group_by(const std::vector<Record>& records, const std::string& field);

    /**
     * @brief Folds @p field over @p records.
     *
     * - `COUNT`: number of records.
     * - `SUM`: integer when every numeric input is an integer, float otherwise.
     * - `AVG`: always a float.
     * - `MIN` / `MAX`: over the numbers if any are present, else over the strings.
     *
     * Null and absent values are skipped. With nothing left to fold the result
     * is `null` (except `COUNT`). A float `SUM` or `AVG` that overflows to
     * infinity is also `null`.
     */
    static json::Value aggregate(const std::vector<Record>& records, const std::string& field,
                                 AggregateOp op);

    /**
     * @brief Stable sort on @p field.
     *
     * Absent and null values come last in both directions. Values of different
     * kinds are ranked bool < number < string < array < object.
     */
    static std::vector<Record> sort(const std::vector<Record>& records, const std::string& field,
                                    bool ascending = true);

    /// @brief The slice `[offset, offset + count)`, clamped to the list.
    static std::vector<Record> limit(const std::vector<Record>& records, std::size_t count,
                                     std::size_t offset = 0);
};

} // namespace naturaldb::query
