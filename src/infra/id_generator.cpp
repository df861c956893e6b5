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
 * @file id_generator.cpp
 * @brief Version 4 UUID generation.
 */

#include "naturaldb/infra/id_generator.hpp"

#include <cstdint>
#include <iomanip>
#include <random>
#include <sstream>

namespace naturaldb::infra {

/**
 * @brief Draws 128 random bits and formats them as a Version 4 UUID.
 *
 * Each thread owns its own engine, so no lock is taken. The version nibble is
 * forced to `4` and the two variant bits to `10`.
 */
std::string IdGenerator::generate()
{
    static thread_local std::random_device device;
    static thread_local std::mt19937_64 engine(device());
    static thread_local std::uniform_int_distribution<std::uint64_t> bits;

    std::uint64_t high = bits(engine);
    std::uint64_t low = bits(engine);

    std::ostringstream out;
    out << std::hex << std::setfill('0');
    out << std::setw(8) << static_cast<std::uint32_t>(high >> 32) << "-";
    out << std::setw(4) << static_cast<std::uint16_t>((high >> 16) & 0xFFFF) << "-";
    out << std::setw(4) << ((high & 0x0FFF) | 0x4000) << "-";
    out << std::setw(4) << (((low >> 48) & 0x3FFF) | 0x8000) << "-";
    out << std::setw(12) << (low & 0xFFFFFFFFFFFFULL);
    return out.str();
}

bool IdGenerator::is_uuid(const std::string& id)
{
    if (id.size() != 36) {
        return false;
    }
    for (std::size_t i = 0; i < id.size(); ++i) {
        char c = id[i];
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            if (c != '-') {
                return false;
            }
            continue;
        }
        bool hex = (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
        if (!hex) {
            return false;
        }
    }
    if (id[14] != '4') {
        return false;
    }
    char variant = id[19];
    return variant == '8' || variant == '9' || variant == 'a' || variant == 'b';
}

} // namespace naturaldb::infra
