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
 * @file join.cpp
 * @brief Implementation of the inner and left hash joins.
 */

#include "naturaldb/query/join.hpp"

#include "naturaldb/infra/errors.hpp"
#include "naturaldb/query/operations.hpp"

#include <unordered_map>

namespace naturaldb::query {

using storage::Record;

namespace {

using Buckets = std::unordered_map<std::string, std::vector<const Record*>>;

Buckets build(const std::vector<Record>& right, const std::string& field)
{
    Buckets buckets;
    for (const auto& record : right) {
        const json::Value* key = QueryOperations::get_field(record.data, field);
        if (key == nullptr || key->is_null()) {
            continue;
        }
        buckets[QueryOperations::canonical_key(*key)].push_back(&record);
    }
    return buckets;
}

void copy_prefixed(json::Object& out, const json::Object& source, const std::string& prefix)
{
    for (const auto& [key, value] : source) {
        out.set(prefix + key, value);
    }
}

std::vector<json::Object> hash_join(const std::vector<Record>& left, const std::vector<Record>& right,
                                    const std::string& left_field, const std::string& right_field,
                                    const std::string& left_prefix, const std::string& right_prefix,
                                    bool keep_unmatched)
{
    Buckets buckets = build(right, right_field);
    std::vector<json::Object> rows;

    for (const auto& l : left) {
        const std::vector<const Record*>* matches = nullptr;

        const json::Value* key = QueryOperations::get_field(l.data, left_field);
        if (key != nullptr && !key->is_null()) {
            auto it = buckets.find(QueryOperations::canonical_key(*key));
            if (it != buckets.end()) {
                matches = &it->second;
            }
        }

        if (matches == nullptr) {
            if (keep_unmatched) {
                json::Object row;
                copy_prefixed(row, l.data, left_prefix);
                rows.push_back(std::move(row));
            }
            continue;
        }

        for (const Record* r : *matches) {
            json::Object row;
            copy_prefixed(row, l.data, left_prefix);
            copy_prefixed(row, r->data, right_prefix);
            rows.push_back(std::move(row));
        }
    }
    return rows;
}

} // namespace

JoinType parse_join_type(const std::string& name)
{
    if (name == "inner") {
        return JoinType::INNER;
    }
    if (name == "left") {
        return JoinType::LEFT;
    }
    throw infra::InvalidArgumentError("Unsupported join type: '" + name + "'");
}

const char* to_string(JoinType type)
{
    return type == JoinType::LEFT ? "left" : "inner";
}

std::vector<json::Object> JoinOperations::inner_join(const std::vector<Record>& left,
                                                     const std::vector<Record>& right,
                                                     const std::string& left_field,
                                                     const std::string& right_field,
                                                     const std::string& left_prefix,
                                                     const std::string& right_prefix)
{
    return hash_join(left, right, left_field, right_field, left_prefix, right_prefix, false);
}

std::vector<json::Object> JoinOperations::left_join(const std::vector<Record>& left,
                                                    const std::vector<Record>& right,
                                                    const std::string& left_field,
                                                    const std::string& right_field,
                                                    const std::string& left_prefix,
                                                    const std::string& right_prefix)
{
    return hash_join(left, right, left_field, right_field, left_prefix, right_prefix, true);
}

std::vector<json::Object> JoinOperations::join(JoinType type, const std::vector<Record>& left,
                                               const std::vector<Record>& right,
                                               const std::string& left_field,
                                               const std::string& right_field,
                                               const std::string& left_prefix,
                                               const std::string& right_prefix)
{
    if (type == JoinType::LEFT) {
        return left_join(left, right, left_field, right_field, left_prefix, right_prefix);
    }
    return inner_join(left, right, left_field, right_field, left_prefix, right_prefix);
}

} // namespace naturaldb::query
