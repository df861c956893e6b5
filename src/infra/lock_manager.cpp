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
 * @file lock_manager.cpp
 * @brief Implementation of the per-path reader/writer lock registry.
 */

#include "naturaldb/infra/lock_manager.hpp"

#include <utility>

namespace naturaldb::infra {

/**
 * @brief Returns the lock for @p path, creating it on first request.
 *
 * Only the registry lookup runs under `registry_mutex_`. The caller blocks on
 * the returned per-path lock after the registry mutex is released, so a
 * writer waiting on one path never stalls lookups for other paths.
 */
std::shared_mutex& LockManager::get_lock(const std::string& path)
{
    std::lock_guard<std::mutex> guard(registry_mutex_);
    auto& slot = locks_[path];
    if (!slot) {
        slot = std::make_unique<std::shared_mutex>();
    }
    return *slot;
}

void LockManager::acquire_read(const std::string& path)
{
    get_lock(path).lock_shared();
}

void LockManager::release_read(const std::string& path)
{
    get_lock(path).unlock_shared();
}

void LockManager::acquire_write(const std::string& path)
{
    get_lock(path).lock();
}

void LockManager::release_write(const std::string& path)
{
    get_lock(path).unlock();
}

std::size_t LockManager::size() const
{
    std::lock_guard<std::mutex> guard(registry_mutex_);
    return locks_.size();
}

ReadLock::ReadLock(LockManager& manager, std::string path)
    : manager_(manager), path_(std::move(path))
{
    manager_.acquire_read(path_);
}

ReadLock::~ReadLock()
{
    manager_.release_read(path_);
}

WriteLock::WriteLock(LockManager& manager, std::string path)
    : manager_(manager), path_(std::move(path))
{
    manager_.acquire_write(path_);
}

WriteLock::~WriteLock()
{
    manager_.release_write(path_);
}

} // namespace naturaldb::infra
