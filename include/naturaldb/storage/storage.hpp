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
 * @file storage.hpp
 * @brief The three levels of the on-disk hierarchy: users/databases, tables, records.
 *
 * @details
 * The layout is fixed:
 * @code
 * <base>/<user>/<db>/metadata.json              {"name": s, "tables": [s]}
 * <base>/<user>/<db>/<table>/metadata.json      {"name": s, "keys": [s]|null, "indexes": {...}}
 * <base>/<user>/<db>/<table>/<record>.json      record data object
 * @endcode
 *
 * - `Storage` creates and removes user and database folders.
 * - `DatabaseStorage` manages the tables of one database and its metadata.
 * - `TableStorage` manages the record files of one table.
 *
 * All disk access goes through the shared `FileSystem`, so every operation is
 * guarded by the per-path locks of the injected `LockManager`.
 */

#pragma once

#include "naturaldb/json/value.hpp"
#include "naturaldb/storage/entities.hpp"
#include "naturaldb/storage/file_system.hpp"
#include "naturaldb/storage/paths.hpp"

#include <cstddef>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace naturaldb::storage {

/**
 * @struct StorageContext
 * @brief Everything a storage object needs besides its own address.
 */
struct StorageContext {
    std::shared_ptr<FileSystem> fs;
    Paths paths;
    bool pretty_records = true; ///< Indent record files with 2 spaces; compact otherwise.
};

/// @brief Serializes table metadata to `{"name", "keys", "indexes"}`.
json::Object table_metadata(const Table& table);

class Storage {
  public:
    explicit Storage(StorageContext context);

    void create_user(const User& user);
    void delete_user(const User& user);
    bool user_exists(const User& user);

    /// @brief Creates the database folder and writes `{"name", "tables": []}`.
    void create_database(const User& user, const Database& database);

    /// @brief Removes the database folder recursively. No-op when absent.
    void delete_database(const User& user, const Database& database);
    bool database_exists(const User& user, const Database& database);

    /// @brief Names of the database folders owned by @p user, sorted.
    std::vector<std::string> list_databases(const User& user);

  private:
    StorageContext ctx_;
};

class DatabaseStorage {
  public:
    /// @brief Binds to one database and creates its folder if needed.
    DatabaseStorage(StorageContext context, User user, Database database);

    /**
     * @brief Contents of the database `metadata.json`.
     *
     * Returns `{"name": <db>, "tables": []}` when the file is absent.
     * @throws infra::StorageError when the file exists but is not a JSON object.
     */
    json::Object metadata();
    void set_metadata(const json::Object& metadata);

    /**
     * @brief Creates the table folder and metadata, then lists the table in
     *        the database metadata.
     */
    void create_table(const Table& table);

    /// @brief Removes the table folder and its entry in the database metadata.
    void delete_table(const std::string& table);

    bool table_exists(const std::string& table);
    std::string table_path(const std::string& table) const;

    /// @brief Names of the table folders, sorted.
    std::vector<std::string> list_tables();

    /// @brief Number of tables recorded in the database metadata.
    std::size_t size();

    const User& user() const { return user_; }
    const Database& database() const { return database_; }
    const StorageContext& context() const { return ctx_; }

  private:
    StorageContext ctx_;
    User user_;
    Database database_;
    std::string base_path_;

    std::string metadata_path() const;
};

class TableStorage {
  public:
    /// @brief Binds to one table and creates its folder if needed.
    TableStorage(StorageContext context, User user, Database database, std::string table);

    /// @brief Table `metadata.json`, or `{"name": <table>, "indexes": {}}` when absent.
    json::Object metadata();
    void set_metadata(const json::Object& metadata);

    /**
     * @brief Writes `record.data` to `<table>/<id>.json`, replacing any previous file.
     * @throws infra::StorageError when the table folder no longer exists.
     */
    void save_record(const Record& record);

    /**
     * @brief Reads one record.
     * @throws infra::RecordNotFoundError when no file exists for @p record_id.
     * @throws infra::StorageError when the file is not a JSON object.
     */
    Record load_record(const std::string& record_id);

    /// @brief Removes the record file. No-op when absent.
    void delete_record(const std::string& record_id);

    bool record_exists(const std::string& record_id);

    /// @brief Record ids (file names without `.json`, metadata excluded), sorted.
    std::vector<std::string> list_records();

    /// @brief Every record of the table keyed by id.
    std::map<std::string, Record> load_all_records();

    std::size_t size();

    const std::string& name() const { return table_; }
    const std::string& path() const { return base_path_; }

  private:
    StorageContext ctx_;
    User user_;
    Database database_;
    std::string table_;
    std::string base_path_;

    std::string record_path(const std::string& record_id) const;
};

} // namespace naturaldb::storage
