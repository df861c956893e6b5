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
 * @file value.cpp
 * @brief Object member management and typed Value accessors.
 */

#include "naturaldb/json/value.hpp"

#include "naturaldb/infra/errors.hpp"

#include <algorithm>

namespace naturaldb::json {

namespace {

[[noreturn]] void mismatch(const char* expected, Value::Type actual)
{
    throw infra::InvalidArgumentError(std::string("Expected JSON ") + expected + ", got " +
                                      type_name(actual));
}

} // namespace

const char* type_name(Value::Type type)
{
    switch (type) {
    case Value::Type::NUL:
        return "null";
    case Value::Type::BOOLEAN:
        return "boolean";
    case Value::Type::INTEGER:
        return "integer";
    case Value::Type::FLOAT:
        return "float";
    case Value::Type::STRING:
        return "string";
    case Value::Type::ARRAY:
        return "array";
    case Value::Type::OBJECT:
        return "object";
    }
    return "unknown";
}

// ============================================================================
// Object
// ============================================================================

Object::Object(std::initializer_list<Member> members)
{
    for (const auto& member : members) {
        set(member.first, member.second);
    }
}

const Value* Object::get(const std::string& key) const
{
    for (const auto& member : members_) {
        if (member.first == key) {
            return &member.second;
        }
    }
    return nullptr;
}

Value* Object::get(const std::string& key)
{
    for (auto& member : members_) {
        if (member.first == key) {
            return &member.second;
        }
    }
    return nullptr;
}

bool Object::contains(const std::string& key) const
{
    return get(key) != nullptr;
}

void Object::set(const std::string& key, Value value)
{
    if (Value* existing = get(key)) {
        *existing = std::move(value);
        return;
    }
    members_.emplace_back(key, std::move(value));
}

bool Object::erase(const std::string& key)
{
    auto it = std::find_if(members_.begin(), members_.end(),
                           [&](const Member& member) { return member.first == key; });
    if (it == members_.end()) {
        return false;
    }
    members_.erase(it);
    return true;
}

Value& Object::operator[](const std::string& key)
{
    if (Value* existing = get(key)) {
        return *existing;
    }
    members_.emplace_back(key, Value());
    return members_.back().second;
}

bool Object::operator==(const Object& other) const
{
    return members_ == other.members_;
}

// ============================================================================
// Value
// ============================================================================

bool Value::as_bool() const
{
    if (!is_bool()) {
        mismatch("boolean", type());
    }
    return std::get<bool>(data_);
}

std::int64_t Value::as_int() const
{
    if (!is_int()) {
        mismatch("integer", type());
    }
    return std::get<std::int64_t>(data_);
}

double Value::as_double() const
{
    if (is_int()) {
        return static_cast<double>(std::get<std::int64_t>(data_));
    }
    if (!is_float()) {
        mismatch("number", type());
    }
    return std::get<double>(data_);
}

const std::string& Value::as_string() const
{
    if (!is_string()) {
        mismatch("string", type());
    }
    return std::get<std::string>(data_);
}

const Array& Value::as_array() const
{
    if (!is_array()) {
        mismatch("array", type());
    }
    return std::get<Array>(data_);
}

Array& Value::as_array()
{
    if (!is_array()) {
        mismatch("array", type());
    }
    return std::get<Array>(data_);
}

const Object& Value::as_object() const
{
    if (!is_object()) {
        mismatch("object", type());
    }
    return std::get<Object>(data_);
}

Object& Value::as_object()
{
    if (!is_object()) {
        mismatch("object", type());
    }
    return std::get<Object>(data_);
}

} // namespace naturaldb::json
