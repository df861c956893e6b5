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
 * @file query_engine.hpp
 * @brief CRUD and query facade over one user's database.
 *
 * @details
 * The `QueryEngine` is the entry point for every consumer (request handler,
 * command line, tests). It binds a `(user, database)` pair, creates the
 * database on first use, and resolves table names to `TableStorage` objects on
 * demand.
 *
 * **Error model:**
 * Every operation returns `infra::Result<T>`. Storage and validation failures
 * are caught at this boundary, logged (`WARN` for missing tables or records,
 * `ERROR` otherwise) and returned as a failed result carrying the error code.
 * Malformed query arguments (`infra::InvalidArgumentError`) are not data
 * problems and propagate to the caller unchanged.
 *
 * **Cost model:**
 * Each query loads the whole table into memory before filtering. There is no
 * index lookup and no streaming.
 */

#pragma once

#include "naturaldb/infra/config.hpp"
#include "naturaldb/infra/lock_manager.hpp"
#include "naturaldb/infra/result.hpp"
#include "naturaldb/query/join.hpp"
#include "naturaldb/query/operations.hpp"
#include "naturaldb/query/table_query.hpp"
#include "naturaldb/storage/storage.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace naturaldb::query {

using infra::Result;
using storage::Table;

/// @brief One aggregation applied per group: `op(field)`.
struct Aggregation {
    std::string field;
    AggregateOp op = AggregateOp::COUNT;
};

/// @brief One group of `group_by` with aggregations.
struct GroupSummary {
    json::Value key;
    std::size_t count = 0;
    json::Object values; ///< `"<op>_<field>"` to aggregated value.
};

class QueryEngine {
  public:
    /**
     * @brief Binds to @p database of @p user under `config.data_path`.
     *
     * @param config Data path, record layout and name length limit.
     * @param user Owner of the database.
     * @param database Database to open; created when missing.
     * @param locks Shared lock registry. A private one is created when null.
     *
     * @throws infra::ValidationError if a name sanitizes to nothing.
     * @throws infra::StorageError if the database folder cannot be created.
     */
    QueryEngine(const infra::Config& config, storage::User user, storage::Database database,
                std::shared_ptr<infra::LockManager> locks = nullptr);

    /// @brief Same as above with default configuration rooted at @p base_dir.
    QueryEngine(const std::string& base_dir, storage::User user, storage::Database database,
                std::shared_ptr<infra::LockManager> locks = nullptr);

    // ========================================================================
    // Schema
    // ========================================================================

    /// @brief Creates @p table. The value is `false` if it already existed.
    Result<bool> create_table(const Table& table);

    /// @brief Removes a table and all of its records.
    Result<bool> drop_table(const std::string& table);

    Result<std::vector<std::string>> list_tables();

    // ========================================================================
    // Records
    // ========================================================================

    /**
     * @brief Writes @p record, replacing any record with the same id.
     *
     * The table is created when missing. An empty id is replaced by a fresh
     * UUID.
     */
    Result<bool> insert(const std::string& table, storage::Record record);

    Result<storage::Record> find_by_id(const std::string& table, const std::string& record_id);
    Result<std::vector<storage::Record>> find_all(const std::string& table);

    /// @brief Replaces an existing record. Fails with `RECORD_NOT_FOUND` otherwise.
    Result<bool> update(const std::string& table, const storage::Record& record);

    /// @brief Deletes an existing record. Fails with `RECORD_NOT_FOUND` otherwise.
    Result<bool> remove(const std::string& table, const std::string& record_id);

    Result<std::size_t> count(const std::string& table);

    // ========================================================================
    // Queries
    // ========================================================================

    Result<std::vector<storage::Record>> filter(const std::string& table, const std::string& field,
                                                const json::Value& value,
                                                FilterOp op = FilterOp::EQ);

    /// @throws infra::InvalidArgumentError if @p op is not a known operator name.
    Result<std::vector<storage::Record>> filter(const std::string& table, const std::string& field,
                                                const json::Value& value, const std::string& op);

    /// @brief Projects @p fields of the records that satisfy every condition.
    Result<std::vector<json::Object>> project(const std::string& table,
                                              const std::vector<std::string>& fields,
                                              const std::vector<Condition>& conditions = {});

    /**
     * @brief Renames fields of the records that satisfy every condition.
     *
     * Each output row holds only the target names of @p mapping, in mapping
     * order. A missing source field yields `null`.
     */
    Result<std::vector<json::Object>>
    rename(const std::string& table, const std::vector<std::pair<std::string, std::string>>& mapping,
           const std::vector<Condition>& conditions = {});

    Result<Groups> group_by(const std::string& table, const std::string& field);

    Result<std::vector<GroupSummary>> group_by(const std::string& table, const std::string& field,
                                               const std::vector<Aggregation>& aggregations);

    /// @brief Records of @p table ordered by @p field. A @p limit of 0 means no limit.
    Result<std::vector<storage::Record>> sort(const std::string& table, const std::string& field,
                                              bool ascending = true,
                                              std::optional<std::size_t> limit = std::nullopt);

    Result<std::vector<json::Object>> join(const std::string& left_table,
                                           const std::string& right_table,
                                           const std::string& left_field,
                                           const std::string& right_field,
                                           JoinType type = JoinType::INNER,
                                           const std::string& left_prefix = "",
                                           const std::string& right_prefix = "");

    /**
     * @brief Starts a chainable query over @p table.
     *
     * A missing table yields an empty builder. A table that cannot be read is
     * logged and also yields an empty builder.
     */
    TableQuery table(const std::string& table);

    // ========================================================================
    // Import / export
    // ========================================================================

    /**
     * @brief Loads records from a JSON file into @p table.
     *
     * A root object becomes one record; a root array of objects becomes one
     * record per element. The id comes from the `id` member; when it is absent
     * the id is `"1"` for a root object and the 1-based position for an array
     * element, and it is written back into the record as `id`.
     *
     * @return Number of records written.
     */
    Result<std::size_t> import_from_json_file(const std::string& table, const std::string& path);

    /// @brief Writes the `data` of every record of @p table as a JSON array.
    Result<std::size_t> export_to_json_file(const std::string& table, const std::string& path,
                                            bool pretty = true);

    const storage::User& user() const { return user_; }
    const storage::Database& database() const { return database_; }
    storage::DatabaseStorage& database_storage() { return *db_; }

  private:
    storage::StorageContext ctx_;
    storage::User user_;
    storage::Database database_;
    std::unique_ptr<storage::DatabaseStorage> db_;

    /// @throws infra::TableNotFoundError when @p table has no folder.
    storage::TableStorage open_table(const std::string& table);

    std::vector<storage::Record> load_records(const std::string& table);
};

} // namespace naturaldb::query
