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
 * @file id_generator.hpp
 * @brief Random record identifiers.
 *
 * @details
 * Records inserted through the query engine without an id receive a Version 4
 * UUID. The canonical 36-character form contains only hex digits and `-`, so
 * it passes sanitization unchanged and can be used directly as a file name.
 */

#pragma once

#include <string>

namespace naturaldb::infra {

/**
 * @class IdGenerator
 * @brief Stateless producer of RFC 4122 Version 4 UUID strings.
 */
class IdGenerator {
  public:
    /**
     * @brief Generates a random UUID in the form `xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx`.
     *
     * `y` is one of `8`, `9`, `a`, `b`. Safe to call from several threads.
     *
     * @code
     * std::string record_id = naturaldb::infra::IdGenerator::generate();
     * @endcode
     */
    static std::string generate();

    /// @brief True when @p id has the shape `generate()` produces.
    static bool is_uuid(const std::string& id);
};

} // namespace naturaldb::infra
