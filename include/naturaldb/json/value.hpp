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
 * @file value.hpp
 * @brief In-memory JSON document model.
 *
 * @details
 * `Value` is a tagged union over the seven JSON kinds. Numbers keep the kind
 * the parser saw: a literal without fraction or exponent is an `INTEGER`
 * (`int64_t`), anything else is a `FLOAT` (`double`). Objects preserve the
 * insertion order of their members, which is also the order the writer emits.
 *
 * Equality on `Value` is strict: `1` and `1.0` are different values and
 * member order matters. Query-level comparisons that treat numbers
 * numerically live in the query layer.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace naturaldb::json {

class Value;

using Array = std::vector<Value>;

/**
 * @class Object
 * @brief Insertion-ordered string to Value map.
 *
 * Lookups are linear. Documents stored by NaturalDB are small, and order
 * preservation is what the on-disk format requires.
 */
class Object {
  public:
    using Member = std::pair<std::string, Value>;
    using iterator = std::vector<Member>::iterator;
    using const_iterator = std::vector<Member>::const_iterator;

    Object() = default;
    Object(std::initializer_list<Member> members);

    /// @brief Pointer to the member value, or `nullptr` when @p key is absent.
    const Value* get(const std::string& key) const;
    Value* get(const std::string& key);

    bool contains(const std::string& key) const;

    /**
     * @brief Inserts or replaces a member.
     *
     * An existing key keeps its position and receives the new value. A new key
     * is appended.
     */
    void set(const std::string& key, Value value);

    /// @brief Removes @p key. Returns false when it was not present.
    bool erase(const std::string& key);

    /// @brief Accessor that appends a `null` member when @p key is absent.
    Value& operator[](const std::string& key);

    std::size_t size() const noexcept { return members_.size(); }
    bool empty() const noexcept { return members_.empty(); }

    iterator begin() { return members_.begin(); }
    iterator end() { return members_.end(); }
    const_iterator begin() const { return members_.begin(); }
    const_iterator end() const { return members_.end(); }

    bool operator==(const Object& other) const;
    bool operator!=(const Object& other) const { return !(*this == other); }

  private:
    std::vector<Member> members_;
};

/**
 * @class Value
 * @brief A single JSON value of any kind.
 */
class Value {
  public:
    enum class Type { NUL, BOOLEAN, INTEGER, FLOAT, STRING, ARRAY, OBJECT };

    Value() : data_(nullptr) {}
    Value(std::nullptr_t) : data_(nullptr) {}
    Value(bool b) : data_(b) {}
    Value(double d) : data_(d) {}
    Value(const char* s) : data_(std::string(s)) {}
    Value(std::string s) : data_(std::move(s)) {}
    Value(Array a) : data_(std::move(a)) {}
    Value(Object o) : data_(std::move(o)) {}

    /// @brief Any integral type other than `bool` becomes an `INTEGER`.
    template <typename T,
              typename std::enable_if<std::is_integral<T>::value && !std::is_same<T, bool>::value,
                                      int>::type = 0>
    Value(T i) : data_(static_cast<std::int64_t>(i))
    {
    }

    Type type() const noexcept { return static_cast<Type>(data_.index()); }

    bool is_null() const noexcept { return type() == Type::NUL; }
    bool is_bool() const noexcept { return type() == Type::BOOLEAN; }
    bool is_int() const noexcept { return type() == Type::INTEGER; }
    bool is_float() const noexcept { return type() == Type::FLOAT; }
    bool is_number() const noexcept { return is_int() || is_float(); }
    bool is_string() const noexcept { return type() == Type::STRING; }
    bool is_array() const noexcept { return type() == Type::ARRAY; }
    bool is_object() const noexcept { return type() == Type::OBJECT; }

    /**
     * @name Typed accessors
     * Each throws `InvalidArgumentError` when the value holds another kind.
     * `as_double` also accepts an `INTEGER`.
     * @{
     */
    bool as_bool() const;
    std::int64_t as_int() const;
    double as_double() const;
    const std::string& as_string() const;
    const Array& as_array() const;
    Array& as_array();
    const Object& as_object() const;
    Object& as_object();
    /** @} */

    bool operator==(const Value& other) const { return data_ == other.data_; }
    bool operator!=(const Value& other) const { return !(*this == other); }

  private:
    std::variant<std::nullptr_t, bool, std::int64_t, double, std::string, Array, Object> data_;
};

/// @brief Lower-case kind name used in diagnostics ("null", "integer", ...).
const char* type_name(Value::Type type);

} // namespace naturaldb::json
