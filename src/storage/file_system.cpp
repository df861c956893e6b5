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
 * @file file_system.cpp
 * @brief Implementation of the locked filesystem primitives.
 */

#include "naturaldb/storage/file_system.hpp"

#include "naturaldb/infra/errors.hpp"
#include "naturaldb/infra/logger.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace naturaldb::storage {

using infra::LogLevel;
using infra::Logger;
using infra::ReadLock;
using infra::StorageError;
using infra::WriteLock;

FileSystem::FileSystem(std::shared_ptr<infra::LockManager> locks) : locks_(std::move(locks))
{
    if (!locks_) {
        locks_ = std::make_shared<infra::LockManager>();
    }
}

void FileSystem::create_file(const std::string& path, const std::string& content, bool recursive)
{
    WriteLock lock(*locks_, path);

    std::error_code ec;
    fs::path target(path);
    fs::path parent = target.parent_path();
    if (!parent.empty() && !fs::exists(parent, ec)) {
        if (!recursive) {
            throw StorageError("create_file", path, "parent directory does not exist");
        }
        fs::create_directories(parent, ec);
        if (ec) {
            throw StorageError("create_file", path, ec.message());
        }
    }

    std::string temp_path = path + ".tmp";
    {
        std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            throw StorageError("create_file", path, "cannot open temporary file");
        }
        file.write(content.data(), static_cast<std::streamsize>(content.size()));
        file.flush();
        if (!file.good()) {
            file.close();
            fs::remove(temp_path, ec);
            throw StorageError("create_file", path, "write failed");
        }
    }

    fs::rename(temp_path, target, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(temp_path, ignored);
        throw StorageError("create_file", path, ec.message());
    }

    Logger::log(LogLevel::TRACE, "FileSystem: wrote " + std::to_string(content.size()) +
                                     " bytes to '" + path + "'");
}

std::optional<std::string> FileSystem::read_file(const std::string& path)
{
    ReadLock lock(*locks_, path);

    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return std::nullopt;
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw StorageError("read_file", path, "cannot open file");
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        throw StorageError("read_file", path, "read failed");
    }
    return buffer.str();
}

void FileSystem::delete_file(const std::string& path)
{
    WriteLock lock(*locks_, path);

    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        throw StorageError("delete_file", path, ec.message());
    }
}

void FileSystem::create_folder(const std::string& path)
{
    WriteLock lock(*locks_, path);

    std::error_code ec;
    fs::create_directories(path, ec);
    if (ec) {
        throw StorageError("create_folder", path, ec.message());
    }
}

void FileSystem::delete_folder(const std::string& path)
{
    WriteLock lock(*locks_, path);

    std::error_code ec;
    fs::remove_all(path, ec);
    if (ec) {
        throw StorageError("delete_folder", path, ec.message());
    }
}

std::vector<std::string> FileSystem::list_files(const std::string& path, bool include_folders)
{
    ReadLock lock(*locks_, path);

    std::vector<std::string> names;
    std::error_code ec;
    if (!fs::is_directory(path, ec)) {
        return names;
    }

    fs::directory_iterator it(path, ec);
    for (; !ec && it != fs::directory_iterator(); it.increment(ec)) {
        const fs::directory_entry& entry = *it;
        if (!include_folders) {
            bool regular = entry.is_regular_file(ec);
            if (ec) {
                throw StorageError("list_files", entry.path().string(), ec.message());
            }
            if (!regular) {
                continue;
            }
        }
        names.push_back(entry.path().filename().string());
    }
    if (ec) {
        throw StorageError("list_files", path, ec.message());
    }

    std::sort(names.begin(), names.end());
    return names;
}

bool FileSystem::exists(const std::string& path)
{
    ReadLock lock(*locks_, path);
    std::error_code ec;
    return fs::exists(path, ec);
}

} // namespace naturaldb::storage
