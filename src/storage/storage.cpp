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
 * @file storage.cpp
 * @brief Implementation of the user/database/table/record hierarchy.
 */

#include "naturaldb/storage/storage.hpp"

#include "naturaldb/infra/errors.hpp"
#include "naturaldb/infra/logger.hpp"
#include "naturaldb/json/parser.hpp"
#include "naturaldb/json/writer.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

namespace naturaldb::storage {

using infra::LogLevel;
using infra::Logger;

namespace {

constexpr int kMetadataIndent = 2;

/**
 * @brief Parses a file that must hold a JSON object.
 * @throws infra::StorageError naming @p operation and @p path otherwise.
 */
json::Object parse_object(const std::string& content, const std::string& operation,
                          const std::string& path)
{
    json::Value value;
    try {
        value = json::Parser::parse(content);
    } catch (const infra::JsonParseError& e) {
        throw infra::StorageError(operation, path, std::string("corrupt JSON: ") + e.what());
    }
    if (!value.is_object()) {
        throw infra::StorageError(operation, path,
                                  std::string("expected a JSON object, found ") +
                                      json::type_name(value.type()));
    }
    return std::move(value.as_object());
}

std::string write_metadata(const json::Object& metadata)
{
    return json::Writer::write(json::Value(metadata), kMetadataIndent);
}

/// @brief Entries of @p path that are folders.
std::vector<std::string> list_folders(FileSystem& fs, const std::string& path)
{
    std::vector<std::string> all = fs.list_files(path, true);
    std::vector<std::string> files = fs.list_files(path, false);

    std::vector<std::string> folders;
    std::set_difference(all.begin(), all.end(), files.begin(), files.end(),
                        std::back_inserter(folders));
    return folders;
}

bool ends_with(const std::string& s, const std::string& suffix)
{
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

json::Object table_metadata(const Table& table)
{
    json::Object meta;
    meta.set("name", table.name);

    if (table.keys) {
        json::Array keys;
        for (const auto& key : *table.keys) {
            keys.emplace_back(key);
        }
        meta.set("keys", std::move(keys));
    } else {
        meta.set("keys", nullptr);
    }

    json::Object indexes;
    for (const auto& [name, index] : table.indexes) {
        json::Array fields;
        for (const auto& field : index.fields) {
            fields.emplace_back(field);
        }
        indexes.set(name, json::Object{{"name", index.name}, {"fields", std::move(fields)}});
    }
    meta.set("indexes", std::move(indexes));
    return meta;
}

// ============================================================================
// Storage
// ============================================================================

Storage::Storage(StorageContext context) : ctx_(std::move(context)) {}

void Storage::create_user(const User& user)
{
    ctx_.fs->create_folder(ctx_.paths.user(user));
    Logger::log(LogLevel::DEBUG, "Storage: user '" + user.id + "' ready.");
}

void Storage::delete_user(const User& user)
{
    ctx_.fs->delete_folder(ctx_.paths.user(user));
    Logger::log(LogLevel::INFO, "Storage: user '" + user.id + "' deleted.");
}

bool Storage::user_exists(const User& user)
{
    return ctx_.fs->exists(ctx_.paths.user(user));
}

void Storage::create_database(const User& user, const Database& database)
{
    std::string path = ctx_.paths.database(user, database);
    ctx_.fs->create_folder(path);

    json::Object meta{{"name", database.name}, {"tables", json::Array{}}};
    ctx_.fs->create_file(path + "/" + Paths::kMetadataFile, write_metadata(meta), false);
    Logger::log(LogLevel::INFO, "Storage: database '" + database.name + "' created.");
}

void Storage::delete_database(const User& user, const Database& database)
{
    ctx_.fs->delete_folder(ctx_.paths.database(user, database));
    Logger::log(LogLevel::INFO, "Storage: database '" + database.name + "' deleted.");
}

bool Storage::database_exists(const User& user, const Database& database)
{
    return ctx_.fs->exists(ctx_.paths.database(user, database) + "/" + Paths::kMetadataFile);
}

std::vector<std::string> Storage::list_databases(const User& user)
{
    return list_folders(*ctx_.fs, ctx_.paths.user(user));
}

// ============================================================================
// DatabaseStorage
// ============================================================================

DatabaseStorage::DatabaseStorage(StorageContext context, User user, Database database)
    : ctx_(std::move(context)), user_(std::move(user)), database_(std::move(database))
{
    base_path_ = ctx_.paths.database(user_, database_);
    ctx_.fs->create_folder(base_path_);
}

std::string DatabaseStorage::metadata_path() const
{
    return base_path_ + "/" + Paths::kMetadataFile;
}

json::Object DatabaseStorage::metadata()
{
    auto content = ctx_.fs->read_file(metadata_path());
    if (!content) {
        return json::Object{{"name", database_.name}, {"tables", json::Array{}}};
    }
    return parse_object(*content, "read_database_metadata", metadata_path());
}

void DatabaseStorage::set_metadata(const json::Object& metadata)
{
    ctx_.fs->create_file(metadata_path(), write_metadata(metadata), false);
}

std::string DatabaseStorage::table_path(const std::string& table) const
{
    return ctx_.paths.table(user_, database_, table);
}

/**
 * @brief Creates a table and registers it in the database metadata.
 *
 * **Operational Logic:**
 * 1. Create `<db>/<table>/` and write its metadata file.
 * 2. Append the sanitized table name to `tables` in `<db>/metadata.json`
 *    unless it is already listed.
 *
 * The `tables` update holds the write lock on the database folder for the
 * whole read-modify-write. The two files are written one after the other; a
 * crash in between leaves a table folder that `list_tables` still reports.
 */
void DatabaseStorage::create_table(const Table& table)
{
    std::string path = table_path(table.name);
    ctx_.fs->create_folder(path);
    ctx_.fs->create_file(path + "/" + Paths::kMetadataFile, write_metadata(table_metadata(table)),
                         false);

    std::string segment = ctx_.paths.segment(table.name);

    // The metadata file path is locked by each read and write below, so the
    // read-modify-write is serialized on the database folder instead.
    infra::WriteLock lock(*ctx_.fs->locks(), base_path_);
    json::Object meta = metadata();
    json::Value* tables = meta.get("tables");
    if (tables == nullptr || !tables->is_array()) {
        meta.set("tables", json::Array{});
        tables = meta.get("tables");
    }

    auto& list = tables->as_array();
    bool listed = std::any_of(list.begin(), list.end(), [&](const json::Value& v) {
        return v.is_string() && v.as_string() == segment;
    });
    if (!listed) {
        list.emplace_back(segment);
        set_metadata(meta);
    }

    Logger::log(LogLevel::INFO, "Storage: table '" + segment + "' created in '" +
                                    database_.name + "'.");
}

void DatabaseStorage::delete_table(const std::string& table)
{
    ctx_.fs->delete_folder(table_path(table));

    std::string segment = ctx_.paths.segment(table);

    infra::WriteLock lock(*ctx_.fs->locks(), base_path_);
    json::Object meta = metadata();
    json::Value* tables = meta.get("tables");
    if (tables != nullptr && tables->is_array()) {
        auto& list = tables->as_array();
        auto before = list.size();
        list.erase(std::remove_if(list.begin(), list.end(),
                                  [&](const json::Value& v) {
                                      return v.is_string() && v.as_string() == segment;
                                  }),
                   list.end());
        if (list.size() != before) {
            set_metadata(meta);
        }
    }

    Logger::log(LogLevel::INFO, "Storage: table '" + segment + "' deleted from '" +
                                    database_.name + "'.");
}

bool DatabaseStorage::table_exists(const std::string& table)
{
    return ctx_.fs->exists(table_path(table));
}

std::vector<std::string> DatabaseStorage::list_tables()
{
    return list_folders(*ctx_.fs, base_path_);
}

std::size_t DatabaseStorage::size()
{
    json::Object meta = metadata();
    const json::Value* tables = meta.get("tables");
    if (tables == nullptr || !tables->is_array()) {
        return 0;
    }
    return tables->as_array().size();
}

// ============================================================================
// TableStorage
// ============================================================================

TableStorage::TableStorage(StorageContext context, User user, Database database, std::string table)
    : ctx_(std::move(context)), user_(std::move(user)), database_(std::move(database)),
      table_(std::move(table))
{
    base_path_ = ctx_.paths.table(user_, database_, table_);
    ctx_.fs->create_folder(base_path_);
}

std::string TableStorage::record_path(const std::string& record_id) const
{
    return ctx_.paths.record(user_, database_, table_, record_id);
}

json::Object TableStorage::metadata()
{
    std::string path = base_path_ + "/" + Paths::kMetadataFile;
    auto content = ctx_.fs->read_file(path);
    if (!content) {
        return json::Object{{"name", table_}, {"indexes", json::Object{}}};
    }
    return parse_object(*content, "read_table_metadata", path);
}

void TableStorage::set_metadata(const json::Object& metadata)
{
    ctx_.fs->create_file(base_path_ + "/" + Paths::kMetadataFile, write_metadata(metadata), false);
}

void TableStorage::save_record(const Record& record)
{
    if (ctx_.paths.segment(record.id) + Paths::kRecordExtension == Paths::kMetadataFile) {
        throw infra::ValidationError("Record id '" + record.id + "' is reserved");
    }

    std::optional<int> indent;
    if (ctx_.pretty_records) {
        indent = 2;
    }
    ctx_.fs->create_file(record_path(record.id), json::Writer::write(json::Value(record.data), indent),
                         false);
    Logger::log(LogLevel::TRACE, "Storage: saved record '" + record.id + "' in '" + table_ + "'.");
}

Record TableStorage::load_record(const std::string& record_id)
{
    std::string path = record_path(record_id);
    auto content = ctx_.fs->read_file(path);
    if (!content) {
        throw infra::RecordNotFoundError(table_, record_id);
    }

    Record record;
    record.id = ctx_.paths.segment(record_id);
    record.data = parse_object(*content, "load_record", path);
    return record;
}

void TableStorage::delete_record(const std::string& record_id)
{
    ctx_.fs->delete_file(record_path(record_id));
}

bool TableStorage::record_exists(const std::string& record_id)
{
    return ctx_.fs->exists(record_path(record_id));
}

std::vector<std::string> TableStorage::list_records()
{
    const std::string extension = Paths::kRecordExtension;

    std::vector<std::string> ids;
    for (const auto& name : ctx_.fs->list_files(base_path_, false)) {
        if (name == Paths::kMetadataFile || !ends_with(name, extension)) {
            continue;
        }
        ids.push_back(name.substr(0, name.size() - extension.size()));
    }
    return ids;
}

std::map<std::string, Record> TableStorage::load_all_records()
{
    std::map<std::string, Record> records;
    for (const auto& id : list_records()) {
        records.emplace(id, load_record(id));
    }
    return records;
}

std::size_t TableStorage::size()
{
    return list_records().size();
}

} // namespace naturaldb::storage
