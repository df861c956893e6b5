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
 * @file entities.hpp
 * @brief Plain data types addressed by the storage hierarchy.
 *
 * @details
 * The hierarchy on disk is `<base>/<user>/<database>/<table>/<record>.json`.
 * These structs carry the names used to build each segment plus the payload
 * of a record. They hold no behaviour.
 */

#pragma once

#include "naturaldb/json/value.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace naturaldb::storage {

/// @brief Owner of a directory tree. `id` names the directory.
struct User {
    std::string id;
    std::string name;
};

struct Database {
    std::string name;
};

/// @brief Declared index. Stored in table metadata; never consulted by queries.
struct Index {
    std::string name;
    std::vector<std::string> fields;
};

struct Table {
    std::string name;
    std::map<std::string, Index> indexes;
    std::optional<std::vector<std::string>> keys;
};

/**
 * @brief A single document.
 *
 * `id` is the file name without `.json`; it is not required to appear inside
 * `data`.
 */
struct Record {
    std::string id;
    json::Object data;
};

} // namespace naturaldb::storage
