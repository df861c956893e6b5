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
 * @file lock_manager.hpp
 * @brief Registry of per-path reader/writer locks.
 *
 * @details
 * Every file and directory the storage layer touches is guarded by a
 * reader/writer lock keyed by its literal path string. Locks are created on
 * first use and are never removed, so a reference handed out by the registry
 * stays valid for the lifetime of the manager.
 *
 * **Guarantees:**
 * - Any number of readers may hold a path at once while no writer holds it.
 * - A writer holds a path exclusively.
 * - Two different path strings never contend.
 *
 * The manager is an ordinary object. Components receive it through a
 * `std::shared_ptr`, and tests build isolated instances. The locks are
 * in-process only; separate processes sharing a data directory are not
 * coordinated, and acquisition has no timeout.
 */

#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace naturaldb::infra {

/**
 * @class LockManager
 * @brief Lazily populated map from path string to `std::shared_mutex`.
 */
class LockManager {
  public:
    LockManager() = default;
    LockManager(const LockManager&) = delete;
    LockManager& operator=(const LockManager&) = delete;

    /// @brief Blocks until a shared hold on @p path is granted.
    void acquire_read(const std::string& path);

    /// @brief Releases a shared hold previously taken by this thread.
    void release_read(const std::string& path);

    /// @brief Blocks until an exclusive hold on @p path is granted.
    void acquire_write(const std::string& path);

    /// @brief Releases an exclusive hold previously taken by this thread.
    void release_write(const std::string& path);

    /// @brief Number of distinct paths that have been locked so far.
    std::size_t size() const;

  private:
    std::shared_mutex& get_lock(const std::string& path);

    /// @brief Guards `locks_` during lookup and insertion only.
    mutable std::mutex registry_mutex_;

    /// @brief Append-only registry; `unique_ptr` keeps each mutex address stable.
    std::unordered_map<std::string, std::unique_ptr<std::shared_mutex>> locks_;
};

/**
 * @class ReadLock
 * @brief RAII shared hold on one path.
 */
class ReadLock {
  public:
    ReadLock(LockManager& manager, std::string path);
    ~ReadLock();

    ReadLock(const ReadLock&) = delete;
    ReadLock& operator=(const ReadLock&) = delete;

  private:
    LockManager& manager_;
    std::string path_;
};

/**
 * @class WriteLock
 * @brief RAII exclusive hold on one path.
 */
class WriteLock {
  public:
    WriteLock(LockManager& manager, std::string path);
    ~WriteLock();

    WriteLock(const WriteLock&) = delete;
    WriteLock& operator=(const WriteLock&) = delete;

  private:
    LockManager& manager_;
    std::string path_;
};

} // namespace naturaldb::infra
