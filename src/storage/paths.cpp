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
 * @file paths.cpp
 * @brief Path construction for the storage hierarchy.
 */

#include "naturaldb/storage/paths.hpp"

#include <utility>

namespace naturaldb::storage {

Paths::Paths(std::string base, std::size_t max_name_length)
    : base_(std::move(base)), max_name_length_(max_name_length)
{
    // "data/" and "data" must address the same tree.
    while (base_.size() > 1 && base_.back() == '/') {
        base_.pop_back();
    }
}

std::string Paths::segment(const std::string& name) const
{
    return infra::String::sanitize(name, max_name_length_);
}

std::string Paths::user(const User& user) const
{
    return base_ + "/" + segment(user.id);
}

std::string Paths::database(const User& user, const Database& database) const
{
    return this->user(user) + "/" + segment(database.name);
}

std::string Paths::table(const User& user, const Database& database, const std::string& table) const
{
    return this->database(user, database) + "/" + segment(table);
}

std::string Paths::record(const User& user, const Database& database, const std::string& table,
                          const std::string& record_id) const
{
    return this->table(user, database, table) + "/" + segment(record_id) + kRecordExtension;
}

} // namespace naturaldb::storage
