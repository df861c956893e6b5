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
 * @file table_query.cpp
 * @brief Implementation of the chainable query builder.
 */

#include "naturaldb/query/table_query.hpp"

#include <utility>

namespace naturaldb::query {

TableQuery::TableQuery(std::vector<Record> records) : records_(std::move(records)) {}

TableQuery TableQuery::filter(const Predicate& predicate) const
{
    return TableQuery(QueryOperations::filter(records_, predicate));
}

TableQuery TableQuery::filter_by(const std::string& field, const json::Value& value,
                                 FilterOp op) const
{
    return TableQuery(QueryOperations::filter_by_field(records_, field, value, op));
}

TableQuery TableQuery::filter_by(const std::string& field, const json::Value& value,
                                 const std::string& op) const
{
    return filter_by(field, value, parse_operator(op));
}

TableQuery TableQuery::where(const std::string& field, const json::Value& value, FilterOp op) const
{
    return filter_by(field, value, op);
}

TableQuery TableQuery::where(const std::string& field, const json::Value& value,
                             const std::string& op) const
{
    return filter_by(field, value, parse_operator(op));
}

TableQuery TableQuery::sort(const std::string& field, bool ascending) const
{
    return TableQuery(QueryOperations::sort(records_, field, ascending));
}

TableQuery TableQuery::order_by(const std::string& field, bool ascending) const
{
    return sort(field, ascending);
}

TableQuery TableQuery::limit(std::size_t count, std::size_t offset) const
{
    return TableQuery(QueryOperations::limit(records_, count, offset));
}

TableQuery TableQuery::skip(std::size_t offset) const
{
    if (offset >= records_.size()) {
        return TableQuery();
    }
    return TableQuery(QueryOperations::limit(records_, records_.size() - offset, offset));
}

std::optional<Record> TableQuery::first() const
{
    if (records_.empty()) {
        return std::nullopt;
    }
    return records_.front();
}

std::optional<Record> TableQuery::last() const
{
    if (records_.empty()) {
        return std::nullopt;
    }
    return records_.back();
}

std::vector<json::Object> TableQuery::select(const std::vector<std::string>& fields) const
{
    return QueryOperations::project(records_, fields);
}

std::vector<json::Object> TableQuery::project(const std::vector<std::string>& fields) const
{
    return QueryOperations::project(records_, fields);
}

std::vector<json::Object> TableQuery::to_dict() const
{
    std::vector<json::Object> out;
    out.reserve(records_.size());
    for (const auto& record : records_) {
        out.push_back(record.data);
    }
    return out;
}

Groups TableQuery::group_by(const std::string& field) const
{
    return QueryOperations::group_by(records_, field);
}

} // namespace naturaldb::query
