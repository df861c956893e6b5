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
 * @file file_system.hpp
 * @brief Locked filesystem primitives used by the storage hierarchy.
 *
 * @details
 * `FileSystem` is the only component that touches the disk. Each call takes the
 * reader or writer lock for its target path from the shared `LockManager` and
 * holds it for the whole operation, so a reader never observes a half-written
 * file produced by another thread of the same process.
 *
 * Absence is not an error: reading a missing file yields `std::nullopt`,
 * deleting a missing file or folder does nothing and listing a missing folder
 * returns an empty list. Genuine I/O failures are raised as
 * `infra::StorageError` naming the operation and the path.
 */

#pragma once

#include "naturaldb/infra/lock_manager.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace naturaldb::storage {

class FileSystem {
  public:
    explicit FileSystem(std::shared_ptr<infra::LockManager> locks);

    /**
     * @brief Writes @p content to @p path, replacing any previous file.
     *
     * **Operational Logic:**
     * 1. Take the write lock on @p path.
     * 2. Create missing parent directories when @p recursive is set; otherwise a
     *    missing parent is an error.
     * 3. Write the bytes to `<path>.tmp`, flush and close.
     * 4. Rename the temporary file over @p path.
     *
     * @throws infra::StorageError on any I/O failure. The temporary file is
     *         removed on failure.
     */
    void create_file(const std::string& path, const std::string& content, bool recursive = true);

    /// @brief Contents of @p path, or `std::nullopt` when it does not exist.
    std::optional<std::string> read_file(const std::string& path);

    void delete_file(const std::string& path);

    /// @brief Creates @p path and any missing parents. Existing folders are fine.
    void create_folder(const std::string& path);

    /// @brief Removes @p path and everything beneath it.
    void delete_folder(const std::string& path);

    /**
     * @brief Names of the entries directly inside @p path, sorted bytewise.
     * @param include_folders When false, only regular files are listed.
     */
    std::vector<std::string> list_files(const std::string& path, bool include_folders = true);

    bool exists(const std::string& path);

    const std::shared_ptr<infra::LockManager>& locks() const { return locks_; }

  private:
    std::shared_ptr<infra::LockManager> locks_;
};

} // namespace naturaldb::storage
