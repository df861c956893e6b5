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
 * @file operations.cpp
 * @brief Implementation of filtering, projection, grouping, aggregation and sorting.
 */

#include "naturaldb/query/operations.hpp"

#include "naturaldb/infra/errors.hpp"
#include "naturaldb/json/writer.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <limits>
#include <unordered_map>

namespace naturaldb::query {

using json::Value;

namespace {

std::vector<std::string> split_path(const std::string& path)
{
    std::vector<std::string> parts;
    std::size_t start = 0;
    while (true) {
        std::size_t dot = path.find('.', start);
        if (dot == std::string::npos) {
            parts.push_back(path.substr(start));
            break;
        }
        parts.push_back(path.substr(start, dot - start));
        start = dot + 1;
    }
    return parts;
}

bool is_missing(const Value* v)
{
    return v == nullptr || v->is_null();
}

/// @brief Sort rank of a present, non-null value.
int kind_rank(const Value& v)
{
    switch (v.type()) {
    case Value::Type::BOOLEAN:
        return 0;
    case Value::Type::INTEGER:
    case Value::Type::FLOAT:
        return 1;
    case Value::Type::STRING:
        return 2;
    case Value::Type::ARRAY:
        return 3;
    default:
        return 4;
    }
}

int sign(int c)
{
    return (c > 0) - (c < 0);
}

bool checked_add(std::int64_t a, std::int64_t b, std::int64_t& out)
{
    if ((b > 0 && a > std::numeric_limits<std::int64_t>::max() - b) ||
        (b < 0 && a < std::numeric_limits<std::int64_t>::min() - b)) {
        return false;
    }
    out = a + b;
    return true;
}

} // namespace

// ============================================================================
// Operator names
// ============================================================================

FilterOp parse_operator(const std::string& name)
{
    if (name == "eq")
        return FilterOp::EQ;
    if (name == "ne")
        return FilterOp::NE;
    if (name == "gt")
        return FilterOp::GT;
    if (name == "gte")
        return FilterOp::GTE;
    if (name == "lt")
        return FilterOp::LT;
    if (name == "lte")
        return FilterOp::LTE;
    if (name == "contains")
        return FilterOp::CONTAINS;
    throw infra::InvalidArgumentError("Unsupported operator: '" + name + "'");
}

const char* to_string(FilterOp op)
{
    switch (op) {
    case FilterOp::EQ:
        return "eq";
    case FilterOp::NE:
        return "ne";
    case FilterOp::GT:
        return "gt";
    case FilterOp::GTE:
        return "gte";
    case FilterOp::LT:
        return "lt";
    case FilterOp::LTE:
        return "lte";
    case FilterOp::CONTAINS:
        return "contains";
    }
    return "eq";
}

AggregateOp parse_aggregate(const std::string& name)
{
    if (name == "count")
        return AggregateOp::COUNT;
    if (name == "sum")
        return AggregateOp::SUM;
    if (name == "avg")
        return AggregateOp::AVG;
    if (name == "min")
        return AggregateOp::MIN;
    if (name == "max")
        return AggregateOp::MAX;
    throw infra::InvalidArgumentError("Unsupported aggregation: '" + name + "'");
}

const char* to_string(AggregateOp op)
{
    switch (op) {
    case AggregateOp::COUNT:
        return "count";
    case AggregateOp::SUM:
        return "sum";
    case AggregateOp::AVG:
        return "avg";
    case AggregateOp::MIN:
        return "min";
    case AggregateOp::MAX:
        return "max";
    }
    return "count";
}

// ============================================================================
// Field access
// ============================================================================

const Value* QueryOperations::get_field(const json::Object& data, const std::string& path)
{
    const json::Object* current = &data;
    const Value* found = nullptr;

    for (const auto& part : split_path(path)) {
        if (current == nullptr) {
            return nullptr;
        }
        found = current->get(part);
        if (found == nullptr) {
            return nullptr;
        }
        current = found->is_object() ? &found->as_object() : nullptr;
    }
    return found;
}

void QueryOperations::set_field(json::Object& data, const std::string& path, Value value)
{
    std::vector<std::string> parts = split_path(path);
    json::Object* current = &data;

    for (std::size_t i = 0; i + 1 < parts.size(); ++i) {
        Value& next = (*current)[parts[i]];
        if (!next.is_object()) {
            next = Value(json::Object{});
        }
        current = &next.as_object();
    }
    current->set(parts.back(), std::move(value));
}

// ============================================================================
// Comparison
// ============================================================================

bool QueryOperations::values_equal(const Value& a, const Value& b)
{
    if (a.is_number() && b.is_number()) {
        if (a.is_int() && b.is_int()) {
            return a.as_int() == b.as_int();
        }
        return a.as_double() == b.as_double();
    }
    if (a.type() != b.type()) {
        return false;
    }

    if (a.is_array()) {
        const auto& x = a.as_array();
        const auto& y = b.as_array();
        if (x.size() != y.size()) {
            return false;
        }
        for (std::size_t i = 0; i < x.size(); ++i) {
            if (!values_equal(x[i], y[i])) {
                return false;
            }
        }
        return true;
    }

    if (a.is_object()) {
        const auto& x = a.as_object();
        const auto& y = b.as_object();
        if (x.size() != y.size()) {
            return false;
        }
        for (const auto& [key, member] : x) {
            const Value* other = y.get(key);
            if (other == nullptr || !values_equal(member, *other)) {
                return false;
            }
        }
        return true;
    }

    return a == b;
}

std::optional<int> QueryOperations::compare_values(const Value& a, const Value& b)
{
    if (a.is_number() && b.is_number()) {
        if (a.is_int() && b.is_int()) {
            std::int64_t x = a.as_int();
            std::int64_t y = b.as_int();
            return (x > y) - (x < y);
        }
        double x = a.as_double();
        double y = b.as_double();
        return (x > y) - (x < y);
    }
    if (a.is_string() && b.is_string()) {
        return sign(a.as_string().compare(b.as_string()));
    }
    if (a.is_bool() && b.is_bool()) {
        return static_cast<int>(a.as_bool()) - static_cast<int>(b.as_bool());
    }
    return std::nullopt;
}

std::string QueryOperations::canonical_key(const Value& value)
{
    switch (value.type()) {
    case Value::Type::NUL:
        return "null";
    case Value::Type::BOOLEAN:
        return value.as_bool() ? "true" : "false";
    case Value::Type::INTEGER:
        return std::to_string(value.as_int());
    case Value::Type::FLOAT: {
        double d = value.as_double();
        if (std::isfinite(d) && std::trunc(d) == d && std::fabs(d) < 9.2e18) {
            return std::to_string(static_cast<std::int64_t>(d));
        }
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%.17g", d);
        return buf;
    }
    case Value::Type::STRING:
        return json::Writer::quote(value.as_string());
    case Value::Type::ARRAY: {
        std::string out = "[";
        bool first = true;
        for (const auto& item : value.as_array()) {
            if (!first) {
                out += ",";
            }
            first = false;
            out += canonical_key(item);
        }
        return out + "]";
    }
    case Value::Type::OBJECT: {
        std::vector<const json::Object::Member*> members;
        for (const auto& member : value.as_object()) {
            members.push_back(&member);
        }
        std::sort(members.begin(), members.end(),
                  [](const json::Object::Member* x, const json::Object::Member* y) {
                      return x->first < y->first;
                  });

        std::string out = "{";
        bool first = true;
        for (const auto* member : members) {
            if (!first) {
                out += ",";
            }
            first = false;
            out += json::Writer::quote(member->first) + ":" + canonical_key(member->second);
        }
        return out + "}";
    }
    }
    return "null";
}

std::string QueryOperations::to_text(const Value& value)
{
    if (value.is_string()) {
        return value.as_string();
    }
    return json::Writer::write(value);
}

/**
 * @brief Applies one operator to a field value.
 *
 * `gte` and `lte` are evaluated as `gt || eq` and `lt || eq`. Two equal
 * arrays therefore satisfy `gte` although they have no ordering.
 */
bool QueryOperations::compare(const Value* field, const Value& value, FilterOp op)
{
    if (field == nullptr) {
        return op == FilterOp::NE;
    }

    switch (op) {
    case FilterOp::EQ:
        return values_equal(*field, value);
    case FilterOp::NE:
        return !values_equal(*field, value);
    case FilterOp::CONTAINS:
        return to_text(*field).find(to_text(value)) != std::string::npos;
    default:
        break;
    }

    std::optional<int> order = compare_values(*field, value);
    bool eq = values_equal(*field, value);
    switch (op) {
    case FilterOp::GT:
        return order && *order > 0;
    case FilterOp::GTE:
        return (order && *order > 0) || eq;
    case FilterOp::LT:
        return order && *order < 0;
    case FilterOp::LTE:
        return (order && *order < 0) || eq;
    default:
        return false;
    }
}

bool QueryOperations::matches(const json::Object& data, const Condition& condition)
{
    return compare(get_field(data, condition.field), condition.value, condition.op);
}

// ============================================================================
// Operations
// ============================================================================

std::vector<Record> QueryOperations::filter(const std::vector<Record>& records,
                                            const Predicate& predicate)
{
    std::vector<Record> out;
    for (const auto& record : records) {
        if (predicate(record)) {
            out.push_back(record);
        }
    }
    return out;
}

std::vector<Record> QueryOperations::filter_by_field(const std::vector<Record>& records,
                                                     const std::string& field,
                                                     const Value& value, FilterOp op)
{
    return filter(records, [&](const Record& record) {
        return compare(get_field(record.data, field), value, op);
    });
}

std::vector<Record> QueryOperations::filter_all(const std::vector<Record>& records,
                                                const std::vector<Condition>& conditions)
{
    return filter(records, [&](const Record& record) {
        return std::all_of(conditions.begin(), conditions.end(),
                           [&](const Condition& c) { return matches(record.data, c); });
    });
}

std::vector<json::Object> QueryOperations::project(const std::vector<Record>& records,
                                                   const std::vector<std::string>& fields)
{
    std::vector<json::Object> out;
    out.reserve(records.size());
    for (const auto& record : records) {
        json::Object row;
        for (const auto& field : fields) {
            const Value* v = get_field(record.data, field);
            set_field(row, field, v ? *v : Value());
        }
        out.push_back(std::move(row));
    }
    return out;
}

Groups QueryOperations::group_by(const std::vector<Record>& records, const std::string& field)
{
    Groups groups;
    std::unordered_map<std::string, std::size_t> slots;

    for (const auto& record : records) {
        const Value* v = get_field(record.data, field);
        Value key = v ? *v : Value();

        auto [it, inserted] = slots.emplace(canonical_key(key), groups.size());
        if (inserted) {
            groups.emplace_back(std::move(key), std::vector<Record>{});
        }
        groups[it->second].second.push_back(record);
    }
    return groups;
}

/**
 * @brief Folds one field across a record list.
 *
 * **Operational Logic:**
 * 1. `COUNT` returns the list size without looking at @p field.
 * 2. Collect the present, non-null values of @p field.
 * 3. `SUM`/`AVG` keep the numbers. `SUM` accumulates in `int64_t` while every
 *    input is an integer and the sum does not overflow, else in `double`.
 *    `AVG` divides each term before adding it. A float result that is not
 *    finite becomes `null`, since JSON cannot carry it.
 * 4. `MIN`/`MAX` pick the numbers, or the strings when there are no numbers,
 *    and return the extreme element as stored (its kind is preserved).
 */
Value QueryOperations::aggregate(const std::vector<Record>& records, const std::string& field,
                                 AggregateOp op)
{
    if (op == AggregateOp::COUNT) {
        return Value(static_cast<std::int64_t>(records.size()));
    }

    std::vector<Value> numbers;
    std::vector<Value> strings;
    for (const auto& record : records) {
        const Value* v = get_field(record.data, field);
        if (is_missing(v)) {
            continue;
        }
        if (v->is_number()) {
            numbers.push_back(*v);
        } else if (v->is_string()) {
            strings.push_back(*v);
        }
    }

    if (op == AggregateOp::SUM || op == AggregateOp::AVG) {
        if (numbers.empty()) {
            return Value();
        }

        if (op == AggregateOp::AVG) {
            double count = static_cast<double>(numbers.size());
            double mean = 0.0;
            for (const auto& n : numbers) {
                mean += n.as_double() / count;
            }
            return std::isfinite(mean) ? Value(mean) : Value();
        }

        bool integral = true;
        std::int64_t int_sum = 0;
        double float_sum = 0.0;
        for (const auto& n : numbers) {
            float_sum += n.as_double();
            if (integral && (!n.is_int() || !checked_add(int_sum, n.as_int(), int_sum))) {
                integral = false;
            }
        }

        if (integral) {
            return Value(int_sum);
        }
        return std::isfinite(float_sum) ? Value(float_sum) : Value();
    }

    const std::vector<Value>& pool = numbers.empty() ? strings : numbers;
    if (pool.empty()) {
        return Value();
    }

    auto less = [](const Value& a, const Value& b) { return *compare_values(a, b) < 0; };
    if (op == AggregateOp::MIN) {
        return *std::min_element(pool.begin(), pool.end(), less);
    }
    return *std::max_element(pool.begin(), pool.end(), less);
}

std::vector<Record> QueryOperations::sort(const std::vector<Record>& records,
                                          const std::string& field, bool ascending)
{
    std::vector<Record> out(records);

    std::stable_sort(out.begin(), out.end(), [&](const Record& x, const Record& y) {
        const Value* a = get_field(x.data, field);
        const Value* b = get_field(y.data, field);

        bool a_missing = is_missing(a);
        bool b_missing = is_missing(b);
        if (a_missing || b_missing) {
            return !a_missing && b_missing;
        }

        int c;
        int ra = kind_rank(*a);
        int rb = kind_rank(*b);
        if (ra != rb) {
            c = ra - rb;
        } else if (auto order = compare_values(*a, *b)) {
            c = *order;
        } else {
            c = sign(canonical_key(*a).compare(canonical_key(*b)));
        }
        return ascending ? c < 0 : c > 0;
    });
    return out;
}

std::vector<Record> QueryOperations::limit(const std::vector<Record>& records, std::size_t count,
                                           std::size_t offset)
{
    if (offset >= records.size()) {
        return {};
    }
    std::size_t end = offset + std::min(count, records.size() - offset);
    return std::vector<Record>(records.begin() + static_cast<std::ptrdiff_t>(offset),
                               records.begin() + static_cast<std::ptrdiff_t>(end));
}

} // namespace naturaldb::query
