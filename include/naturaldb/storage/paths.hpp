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
 * @file paths.hpp
 * @brief Maps (user, database, table, record) tuples to filesystem paths.
 *
 * @details
 * Every user-supplied name is passed through `infra::String::sanitize` before
 * it becomes a path segment, so no combination of names can address anything
 * outside the base directory.
 */

#pragma once

#include "naturaldb/infra/string.hpp"
#include "naturaldb/storage/entities.hpp"

#include <cstddef>
#include <string>

namespace naturaldb::storage {

class Paths {
  public:
    /// @brief Name of the metadata file in database and table folders.
    static constexpr const char* kMetadataFile = "metadata.json";

    /// @brief Extension of record files.
    static constexpr const char* kRecordExtension = ".json";

    explicit Paths(std::string base, std::size_t max_name_length = infra::String::kMaxNameLength);

    /// @brief Sanitizes @p name with this layout's length limit.
    std::string segment(const std::string& name) const;

    std::string user(const User& user) const;
    std::string database(const User& user, const Database& database) const;
    std::string table(const User& user, const Database& database, const std::string& table) const;
    std::string record(const User& user, const Database& database, const std::string& table,
                       const std::string& record_id) const;

    const std::string& base() const { return base_; }
    std::size_t max_name_length() const { return max_name_length_; }

  private:
    std::string base_;
    std::size_t max_name_length_;
};

} // namespace naturaldb::storage
