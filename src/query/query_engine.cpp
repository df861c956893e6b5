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
 * @file query_engine.cpp
 * @brief Implementation of the CRUD and query facade.
 */

#include "naturaldb/query/query_engine.hpp"

#include "naturaldb/infra/errors.hpp"
#include "naturaldb/infra/id_generator.hpp"
#include "naturaldb/infra/logger.hpp"
#include "naturaldb/json/parser.hpp"
#include "naturaldb/json/writer.hpp"

namespace naturaldb::query {

using infra::ErrorCode;
using infra::LogLevel;
using infra::Logger;
using storage::Record;

namespace {

/**
 * @brief Runs @p body and folds library errors into a `Result`.
 *
 * `InvalidArgumentError` is rethrown: it signals a malformed call, not a data
 * condition.
 */
template <typename T, typename Body>
Result<T> guarded(const std::string& operation, Body&& body)
{
    try {
        return Result<T>::success(body());
    } catch (const infra::InvalidArgumentError&) {
        throw;
    } catch (const infra::Error& e) {
        bool missing = e.code() == ErrorCode::TABLE_NOT_FOUND ||
                       e.code() == ErrorCode::RECORD_NOT_FOUND;
        Logger::log(missing ? LogLevel::WARN : LogLevel::ERROR,
                    "QueryEngine: " + operation + " failed: " + e.what());
        return Result<T>::failure(e);
    }
}

storage::StorageContext make_context(const infra::Config& config,
                                     std::shared_ptr<infra::LockManager> locks)
{
    if (!locks) {
        locks = std::make_shared<infra::LockManager>();
    }
    return storage::StorageContext{std::make_shared<storage::FileSystem>(std::move(locks)),
                                   storage::Paths(config.data_path, config.max_name_length),
                                   config.pretty_records};
}

infra::Config config_for(const std::string& base_dir)
{
    infra::Config config;
    config.data_path = base_dir;
    return config;
}

/// @brief Id of an imported element: its `id` member as text, else @p fallback.
std::string import_id(json::Object& data, const std::string& fallback)
{
    const json::Value* id = data.get("id");
    if (id == nullptr || id->is_null()) {
        data.set("id", fallback);
        return fallback;
    }
    return QueryOperations::to_text(*id);
}

} // namespace

QueryEngine::QueryEngine(const infra::Config& config, storage::User user,
                         storage::Database database, std::shared_ptr<infra::LockManager> locks)
    : ctx_(make_context(config, std::move(locks))), user_(std::move(user)),
      database_(std::move(database))
{
    storage::Storage root(ctx_);
    if (!root.database_exists(user_, database_)) {
        root.create_database(user_, database_);
    }
    db_ = std::make_unique<storage::DatabaseStorage>(ctx_, user_, database_);

    Logger::log(LogLevel::DEBUG, "QueryEngine: bound to '" + user_.id + "/" + database_.name +
                                     "' under '" + ctx_.paths.base() + "'.");
}

QueryEngine::QueryEngine(const std::string& base_dir, storage::User user,
                         storage::Database database, std::shared_ptr<infra::LockManager> locks)
    : QueryEngine(config_for(base_dir), std::move(user), std::move(database), std::move(locks))
{
}

storage::TableStorage QueryEngine::open_table(const std::string& table)
{
    if (!db_->table_exists(table)) {
        throw infra::TableNotFoundError(table);
    }
    return storage::TableStorage(ctx_, user_, database_, table);
}

std::vector<Record> QueryEngine::load_records(const std::string& table)
{
    auto all = open_table(table).load_all_records();

    std::vector<Record> records;
    records.reserve(all.size());
    for (auto& entry : all) {
        records.push_back(std::move(entry.second));
    }
    return records;
}

// ============================================================================
// Schema
// ============================================================================

Result<bool> QueryEngine::create_table(const Table& table)
{
    return guarded<bool>("create_table", [&] {
        if (db_->table_exists(table.name)) {
            Logger::log(LogLevel::DEBUG, "QueryEngine: table '" + table.name + "' already exists.");
            return false;
        }
        db_->create_table(table);
        return true;
    });
}

Result<bool> QueryEngine::drop_table(const std::string& table)
{
    return guarded<bool>("drop_table", [&] {
        if (!db_->table_exists(table)) {
            throw infra::TableNotFoundError(table);
        }
        db_->delete_table(table);
        return true;
    });
}

Result<std::vector<std::string>> QueryEngine::list_tables()
{
    return guarded<std::vector<std::string>>("list_tables", [&] { return db_->list_tables(); });
}

// ============================================================================
// Records
// ============================================================================

Result<bool> QueryEngine::insert(const std::string& table, Record record)
{
    return guarded<bool>("insert", [&] {
        if (record.id.empty()) {
            record.id = infra::IdGenerator::generate();
        }
        if (!db_->table_exists(table)) {
            Table definition;
            definition.name = table;
            db_->create_table(definition);
        }
        storage::TableStorage(ctx_, user_, database_, table).save_record(record);
        return true;
    });
}

Result<Record> QueryEngine::find_by_id(const std::string& table, const std::string& record_id)
{
    return guarded<Record>("find_by_id", [&] { return open_table(table).load_record(record_id); });
}

Result<std::vector<Record>> QueryEngine::find_all(const std::string& table)
{
    return guarded<std::vector<Record>>("find_all", [&] { return load_records(table); });
}

Result<bool> QueryEngine::update(const std::string& table, const Record& record)
{
    return guarded<bool>("update", [&] {
        auto table_storage = open_table(table);
        if (!table_storage.record_exists(record.id)) {
            throw infra::RecordNotFoundError(table, record.id);
        }
        table_storage.save_record(record);
        return true;
    });
}

Result<bool> QueryEngine::remove(const std::string& table, const std::string& record_id)
{
    return guarded<bool>("delete", [&] {
        auto table_storage = open_table(table);
        if (!table_storage.record_exists(record_id)) {
            throw infra::RecordNotFoundError(table, record_id);
        }
        table_storage.delete_record(record_id);
        return true;
    });
}

Result<std::size_t> QueryEngine::count(const std::string& table)
{
    return guarded<std::size_t>("count", [&] { return open_table(table).size(); });
}

// ============================================================================
// Queries
// ============================================================================

Result<std::vector<Record>> QueryEngine::filter(const std::string& table, const std::string& field,
                                                const json::Value& value, FilterOp op)
{
    return guarded<std::vector<Record>>("filter", [&] {
        return QueryOperations::filter_by_field(load_records(table), field, value, op);
    });
}

Result<std::vector<Record>> QueryEngine::filter(const std::string& table, const std::string& field,
                                                const json::Value& value, const std::string& op)
{
    return filter(table, field, value, parse_operator(op));
}

Result<std::vector<json::Object>> QueryEngine::project(const std::string& table,
                                                       const std::vector<std::string>& fields,
                                                       const std::vector<Condition>& conditions)
{
    return guarded<std::vector<json::Object>>("project", [&] {
        auto records = QueryOperations::filter_all(load_records(table), conditions);
        return QueryOperations::project(records, fields);
    });
}

Result<std::vector<json::Object>>
QueryEngine::rename(const std::string& table,
                    const std::vector<std::pair<std::string, std::string>>& mapping,
                    const std::vector<Condition>& conditions)
{
    return guarded<std::vector<json::Object>>("rename", [&] {
        auto records = QueryOperations::filter_all(load_records(table), conditions);

        std::vector<json::Object> rows;
        rows.reserve(records.size());
        for (const auto& record : records) {
            json::Object row;
            for (const auto& [from, to] : mapping) {
                const json::Value* v = QueryOperations::get_field(record.data, from);
                QueryOperations::set_field(row, to, v ? *v : json::Value());
            }
            rows.push_back(std::move(row));
        }
        return rows;
    });
}

Result<Groups> QueryEngine::group_by(const std::string& table, const std::string& field)
{
    return guarded<Groups>("group_by", [&] {
        return QueryOperations::group_by(load_records(table), field);
    });
}

Result<std::vector<GroupSummary>> QueryEngine::group_by(const std::string& table,
                                                        const std::string& field,
                                                        const std::vector<Aggregation>& aggregations)
{
    return guarded<std::vector<GroupSummary>>("group_by", [&] {
        std::vector<GroupSummary> summaries;
        for (const auto& [key, members] : QueryOperations::group_by(load_records(table), field)) {
            GroupSummary summary;
            summary.key = key;
            summary.count = members.size();
            for (const auto& agg : aggregations) {
                summary.values.set(std::string(to_string(agg.op)) + "_" + agg.field,
                                   QueryOperations::aggregate(members, agg.field, agg.op));
            }
            summaries.push_back(std::move(summary));
        }
        return summaries;
    });
}

Result<std::vector<Record>> QueryEngine::sort(const std::string& table, const std::string& field,
                                              bool ascending, std::optional<std::size_t> limit)
{
    return guarded<std::vector<Record>>("sort", [&] {
        auto sorted = QueryOperations::sort(load_records(table), field, ascending);
        if (limit && *limit > 0) {
            sorted = QueryOperations::limit(sorted, *limit);
        }
        return sorted;
    });
}

Result<std::vector<json::Object>> QueryEngine::join(const std::string& left_table,
                                                    const std::string& right_table,
                                                    const std::string& left_field,
                                                    const std::string& right_field, JoinType type,
                                                    const std::string& left_prefix,
                                                    const std::string& right_prefix)
{
    return guarded<std::vector<json::Object>>("join", [&] {
        return JoinOperations::join(type, load_records(left_table), load_records(right_table),
                                    left_field, right_field, left_prefix, right_prefix);
    });
}

TableQuery QueryEngine::table(const std::string& table)
{
    if (!db_->table_exists(table)) {
        return TableQuery();
    }

    auto records = find_all(table);
    if (!records) {
        return TableQuery();
    }
    return TableQuery(std::move(records.value()));
}

// ============================================================================
// Import / export
// ============================================================================

/**
 * @brief Imports a JSON document into a table.
 *
 * **Operational Logic:**
 * 1. Parse the file. Parse and read failures end the import before anything
 *    is written.
 * 2. Validate the shape: an object, or an array whose elements are all objects.
 * 3. Resolve ids and upsert each record, creating the table if needed.
 */
Result<std::size_t> QueryEngine::import_from_json_file(const std::string& table,
                                                       const std::string& path)
{
    return guarded<std::size_t>("import_from_json_file", [&] {
        json::Value root = json::Parser::parse_file(path);

        std::vector<Record> records;
        if (root.is_object()) {
            Record record;
            record.data = root.as_object();
            record.id = import_id(record.data, "1");
            records.push_back(std::move(record));
        } else if (root.is_array()) {
            const auto& items = root.as_array();
            for (std::size_t i = 0; i < items.size(); ++i) {
                if (!items[i].is_object()) {
                    throw infra::ValidationError("Element " + std::to_string(i) + " of '" + path +
                                                 "' is not a JSON object");
                }
                Record record;
                record.data = items[i].as_object();
                record.id = import_id(record.data, std::to_string(i + 1));
                records.push_back(std::move(record));
            }
        } else {
            throw infra::ValidationError("'" + path + "' must hold a JSON object or array, found " +
                                         json::type_name(root.type()));
        }

        if (!db_->table_exists(table)) {
            Table definition;
            definition.name = table;
            db_->create_table(definition);
        }

        storage::TableStorage table_storage(ctx_, user_, database_, table);
        for (const auto& record : records) {
            table_storage.save_record(record);
        }

        Logger::log(LogLevel::INFO, "QueryEngine: imported " + std::to_string(records.size()) +
                                        " record(s) into '" + table + "' from '" + path + "'.");
        return records.size();
    });
}

Result<std::size_t> QueryEngine::export_to_json_file(const std::string& table,
                                                     const std::string& path, bool pretty)
{
    return guarded<std::size_t>("export_to_json_file", [&] {
        auto records = load_records(table);

        json::Array rows;
        rows.reserve(records.size());
        for (auto& record : records) {
            rows.emplace_back(std::move(record.data));
        }

        std::optional<int> indent;
        if (pretty) {
            indent = 2;
        }
        ctx_.fs->create_file(path, json::Writer::write(json::Value(std::move(rows)), indent));

        Logger::log(LogLevel::INFO, "QueryEngine: exported " + std::to_string(records.size()) +
                                        " record(s) from '" + table + "' to '" + path + "'.");
        return records.size();
    });
}

} // namespace naturaldb::query
