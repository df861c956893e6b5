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
 * @file result.hpp
 * @brief Success-or-error return type used by the query facade.
 *
 * @details
 * `Result<T>` carries either a value or an `ErrorCode` plus message. It is
 * explicitly convertible to `bool`, so a call site written against a plain
 * boolean return (`if (engine.insert(...))`) keeps working while the cause of
 * a failure stays observable through `code()` and `message()`.
 */

#pragma once

#include "naturaldb/infra/errors.hpp"

#include <optional>
#include <string>
#include <utility>

namespace naturaldb::infra {

template <typename T> class Result {
  public:
    /// @brief Builds a successful result holding @p value.
    static Result success(T value)
    {
        Result r;
        r.value_ = std::move(value);
        r.code_ = ErrorCode::OK;
        return r;
    }

    /// @brief Builds a failed result.
    static Result failure(ErrorCode code, std::string message)
    {
        Result r;
        r.code_ = code;
        r.message_ = std::move(message);
        return r;
    }

    /// @brief Builds a failed result from a caught exception.
    static Result failure(const Error& error) { return failure(error.code(), error.what()); }

    bool ok() const noexcept { return code_ == ErrorCode::OK; }
    explicit operator bool() const noexcept { return ok(); }

    ErrorCode code() const noexcept { return code_; }
    const std::string& message() const noexcept { return message_; }

    /**
     * @brief Accesses the carried value.
     * @throws Error (with the stored code) if the result is a failure.
     */
    const T& value() const
    {
        if (!value_) {
            throw Error(code_, "Result accessed without a value: " + message_);
        }
        return *value_;
    }

    T& value()
    {
        if (!value_) {
            throw Error(code_, "Result accessed without a value: " + message_);
        }
        return *value_;
    }

    /// @brief Returns the value, or @p fallback if the operation failed.
    T value_or(T fallback) const { return value_ ? *value_ : std::move(fallback); }

  private:
    Result() = default;

    std::optional<T> value_;
    ErrorCode code_ = ErrorCode::INTERNAL;
    std::string message_;
};

} // namespace naturaldb::infra
