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
 * @file infra_test.cpp
 * @brief Unit tests for shared infrastructure primitives.
 *
 * @details
 * Covers the IdGenerator, the String helpers (trim and identifier
 * sanitization), the per-path LockManager and the Config loader.
 */

#include "framework.hpp"
#include "test_dir.hpp"

#include "naturaldb/infra/config.hpp"
#include "naturaldb/infra/errors.hpp"
#include "naturaldb/infra/id_generator.hpp"
#include "naturaldb/infra/lock_manager.hpp"
#include "naturaldb/infra/string.hpp"

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <set>
#include <string>
#include <thread>
#include <vector>

using naturaldb::infra::IdGenerator;
using naturaldb::infra::String;

/**
 * @brief Validates RFC 4122 compliance for UUID character count.
 *
 * A standard Version 4 UUID must represent 128 bits of data as 32 hexadecimal
 * characters and 4 hyphens, resulting in a fixed length of 36 characters.
 */
void test_uuid_length()
{
    std::string id = IdGenerator::generate();
    // Canonical format: 8-4-4-4-12 = 36 characters.
    ASSERT_EQ(id.length(), static_cast<size_t>(36));
    ASSERT_TRUE(IdGenerator::is_uuid(id));
}

/**
 * @brief Verifies that sequential invocations produce non-colliding identifiers.
 */
void test_uuid_uniqueness()
{
    std::set<std::string> seen;
    for (int i = 0; i < 1000; i++) {
        seen.insert(IdGenerator::generate());
    }
    ASSERT_EQ(seen.size(), static_cast<size_t>(1000));
}

void test_uuid_shape_check()
{
    ASSERT_TRUE(IdGenerator::is_uuid("123e4567-e89b-42d3-a456-426614174000"));
    // Version nibble must be 4.
    ASSERT_FALSE(IdGenerator::is_uuid("123e4567-e89b-12d3-a456-426614174000"));
    // Variant nibble must be 8, 9, a or b.
    ASSERT_FALSE(IdGenerator::is_uuid("123e4567-e89b-42d3-c456-426614174000"));
    ASSERT_FALSE(IdGenerator::is_uuid("123E4567-E89B-42D3-A456-426614174000"));
    ASSERT_FALSE(IdGenerator::is_uuid("not-a-uuid"));
    ASSERT_FALSE(IdGenerator::is_uuid(""));
}

/**
 * @brief Tests the `String::trim` algorithm with nominal input.
 *
 * Scenarios verified:
 * - Elimination of leading/trailing space characters.
 * - Integrity of internal whitespace.
 */
void test_string_trim()
{
    std::string dirty = "   hello naturaldb   ";
    std::string clean = String::trim(dirty);

    ASSERT_EQ(clean, std::string("hello naturaldb"));
}

/**
 * @brief Strings made only of whitespace collapse into an empty string.
 */
void test_string_trim_empty()
{
    std::string empty = "  \t\n  \r ";
    std::string result = String::trim(empty);

    ASSERT_EQ(result, std::string(""));
    ASSERT_EQ(result.length(), static_cast<size_t>(0));
}

/**
 * @brief Path separators, dots and punctuation are dropped; the safe alphabet survives.
 */
void test_sanitize_alphabet()
{
    ASSERT_EQ(String::sanitize("../etc/passwd"), std::string("etcpasswd"));
    ASSERT_EQ(String::sanitize("order #42"), std::string("order 42"));
    ASSERT_EQ(String::sanitize("My_Table-01"), std::string("My_Table-01"));
    ASSERT_EQ(String::sanitize("caf\xc3\xa9"), std::string("caf"));

    std::string out = String::sanitize("a/b\\c.d:e*f?g\"h<i>j|k");
    for (char c : out) {
        ASSERT_TRUE(String::is_safe_char(c));
    }
    ASSERT_EQ(out, std::string("abcdefghijk"));
}

void test_sanitize_idempotent()
{
    const std::vector<std::string> inputs = {"users", "../../x", "a b  c", "t@b!e", "x.json"};
    for (const auto& s : inputs) {
        std::string once = String::sanitize(s);
        ASSERT_EQ(String::sanitize(once), once);
    }
}

void test_sanitize_truncates()
{
    std::string long_name(200, 'a');
    ASSERT_EQ(String::sanitize(long_name).size(), String::kMaxNameLength);
    ASSERT_EQ(String::sanitize(long_name, 10), std::string(10, 'a'));
}

/**
 * @brief Identifiers with no usable characters map to the fallback segment.
 */
void test_sanitize_empty_fallback()
{
    ASSERT_EQ(String::sanitize(""), std::string(String::kFallbackName));
    ASSERT_EQ(String::sanitize("../.."), std::string("unnamed"));
    ASSERT_EQ(String::sanitize("@@@"), std::string("unnamed"));
    ASSERT_EQ(String::sanitize(String::sanitize("../")), String::sanitize("../"));

    // The fallback is cut like any other name.
    ASSERT_EQ(String::sanitize("...", 3), std::string("unn"));
    ASSERT_EQ(String::sanitize(String::sanitize("...", 3), 3), std::string("unn"));
}

/**
 * @brief A writer excludes readers of the same path but not of other paths.
 */
void test_lock_manager_exclusion()
{
    using naturaldb::infra::LockManager;
    using naturaldb::infra::ReadLock;
    using naturaldb::infra::WriteLock;

    LockManager locks;
    std::atomic<bool> reader_done{false};
    std::atomic<bool> other_done{false};
    std::thread reader;
    std::thread other;

    {
        WriteLock hold(locks, "/data/a.json");

        reader = std::thread([&]() {
            ReadLock r(locks, "/data/a.json");
            reader_done = true;
        });
        other = std::thread([&]() {
            ReadLock r(locks, "/data/b.json");
            other_done = true;
        });

        other.join();
        ASSERT_TRUE(other_done.load());

        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        ASSERT_FALSE(reader_done.load());
    }

    reader.join();
    ASSERT_TRUE(reader_done.load());
    ASSERT_EQ(locks.size(), static_cast<size_t>(2));
}

/**
 * @brief Concurrent readers on one path proceed together.
 */
void test_lock_manager_shared_readers()
{
    using naturaldb::infra::LockManager;
    using naturaldb::infra::ReadLock;

    LockManager locks;
    ReadLock first(locks, "/data/t");

    std::atomic<bool> second_done{false};
    std::thread t([&]() {
        ReadLock second(locks, "/data/t");
        second_done = true;
    });
    t.join();

    ASSERT_TRUE(second_done.load());
    ASSERT_EQ(locks.size(), static_cast<size_t>(1));
}

/**
 * @brief `.env` values seed the environment without overriding what is already set.
 */
void test_config_env_file()
{
    naturaldb::test::TestDirManager dir("./infra_test_env");
    std::filesystem::create_directories(dir.path);

    ::unsetenv("NATURALDB_DATA_PATH");
    ::unsetenv("NATURALDB_PRETTY");
    ::setenv("NATURALDB_MAX_NAME_LENGTH", "12", 1);

    {
        std::ofstream out(dir.file(".env"));
        out << "# comment\n"
            << "\n"
            << "NATURALDB_DATA_PATH = \"/tmp/naturaldb store\"\n"
            << "NATURALDB_PRETTY='off'\n"
            << "NATURALDB_MAX_NAME_LENGTH=99\n"
            << "MALFORMED LINE\n";
    }

    ASSERT_EQ(naturaldb::infra::Config::load_env_file(dir.file(".env")), static_cast<size_t>(2));

    auto config = naturaldb::infra::Config::from_env();
    ASSERT_EQ(config.data_path, std::string("/tmp/naturaldb store"));
    ASSERT_FALSE(config.pretty_records);
    ASSERT_EQ(config.max_name_length, static_cast<size_t>(12));

    ::unsetenv("NATURALDB_DATA_PATH");
    ::unsetenv("NATURALDB_PRETTY");
    ::unsetenv("NATURALDB_MAX_NAME_LENGTH");

    ASSERT_EQ(naturaldb::infra::Config::load_env_file(dir.file("missing.env")), static_cast<size_t>(0));
}

void test_config_defaults_on_bad_values()
{
    ::unsetenv("NATURALDB_DATA_PATH");
    ::setenv("NATURALDB_PRETTY", "maybe", 1);
    ::setenv("NATURALDB_MAX_NAME_LENGTH", "-3", 1);

    auto config = naturaldb::infra::Config::from_env();
    ASSERT_EQ(config.data_path, std::string("./data"));
    ASSERT_TRUE(config.pretty_records);
    ASSERT_EQ(config.max_name_length, static_cast<size_t>(80));

    ::unsetenv("NATURALDB_PRETTY");
    ::unsetenv("NATURALDB_MAX_NAME_LENGTH");
}
