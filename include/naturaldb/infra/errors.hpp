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
 * @file errors.hpp
 * @brief Typed exception hierarchy shared by every NaturalDB subsystem.
 *
 * @details
 * The codec and the storage hierarchy report failures by throwing one of the
 * classes below. The query facade catches them at its boundary and folds them
 * into a `Result<T>` (see result.hpp), so callers can tell a missing table
 * from a corrupted record without parsing log output.
 */

#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace naturaldb::infra {

/**
 * @enum ErrorCode
 * @brief Machine-readable failure classification.
 */
enum class ErrorCode {
    OK,
    VALIDATION,         ///< Identifier or document shape rejected.
    STORAGE,            ///< Filesystem failure or corrupted file content.
    TABLE_NOT_FOUND,    ///< Addressed table directory does not exist.
    RECORD_NOT_FOUND,   ///< Addressed record file does not exist.
    RECORD_EXISTS,      ///< Reserved for a strict-insert variant (not built).
    LOCK_TIMEOUT,       ///< Reserved for a timeout-bearing lock variant (not built).
    JSON_PARSE,         ///< Text is not valid JSON.
    INVALID_ARGUMENT,   ///< Unknown operator, aggregation or join type.
    INTERNAL            ///< Anything else.
};

/**
 * @brief Returns the stable upper-case name of an error code (e.g. "TABLE_NOT_FOUND").
 */
const char* to_string(ErrorCode code);

/**
 * @class Error
 * @brief Root of the NaturalDB exception hierarchy.
 */
class Error : public std::runtime_error {
  public:
    Error(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code)
    {
    }

    ErrorCode code() const noexcept { return code_; }

  private:
    ErrorCode code_;
};

/// @brief An identifier or document failed validation.
class ValidationError : public Error {
  public:
    explicit ValidationError(const std::string& message) : Error(ErrorCode::VALIDATION, message) {}
};

/**
 * @class StorageError
 * @brief A filesystem operation failed or a file holds unusable content.
 */
class StorageError : public Error {
  public:
    StorageError(const std::string& operation, const std::string& path, const std::string& reason)
        : Error(ErrorCode::STORAGE, operation + " '" + path + "': " + reason), operation_(operation),
          path_(path)
    {
    }

    const std::string& operation() const noexcept { return operation_; }
    const std::string& path() const noexcept { return path_; }

  private:
    std::string operation_;
    std::string path_;
};

class TableNotFoundError : public Error {
  public:
    explicit TableNotFoundError(const std::string& table)
        : Error(ErrorCode::TABLE_NOT_FOUND, "Table '" + table + "' not found"), table_(table)
    {
    }

    const std::string& table() const noexcept { return table_; }

  private:
    std::string table_;
};

class RecordNotFoundError : public Error {
  public:
    RecordNotFoundError(const std::string& table, const std::string& record_id)
        : Error(ErrorCode::RECORD_NOT_FOUND,
                "Record '" + record_id + "' not found in table '" + table + "'"),
          table_(table), record_id_(record_id)
    {
    }

    const std::string& table() const noexcept { return table_; }
    const std::string& record_id() const noexcept { return record_id_; }

  private:
    std::string table_;
    std::string record_id_;
};

/**
 * @enum ParseErrorKind
 * @brief The grammar rule a JSON document violated.
 */
enum class ParseErrorKind {
    EMPTY_INPUT,
    UNEXPECTED_CHARACTER,
    UNEXPECTED_END,
    INVALID_LITERAL,
    INVALID_NUMBER,
    NUMBER_OUT_OF_RANGE,
    INVALID_ESCAPE,
    INVALID_UNICODE,
    CONTROL_CHARACTER,
    UNTERMINATED_STRING,
    UNTERMINATED_ARRAY,
    UNTERMINATED_OBJECT,
    TRAILING_COMMA,
    EXPECTED_KEY,
    EXPECTED_COLON,
    TRAILING_CONTENT,
    NESTING_TOO_DEEP
};

const char* to_string(ParseErrorKind kind);

/**
 * @class JsonParseError
 * @brief Raised by the JSON parser with the violated rule and the offending offset.
 */
class JsonParseError : public Error {
  public:
    JsonParseError(ParseErrorKind kind, std::size_t position, const std::string& detail)
        : Error(ErrorCode::JSON_PARSE, std::string(to_string(kind)) + " at position " +
                                           std::to_string(position) + ": " + detail),
          kind_(kind), position_(position)
    {
    }

    ParseErrorKind kind() const noexcept { return kind_; }
    std::size_t position() const noexcept { return position_; }

  private:
    ParseErrorKind kind_;
    std::size_t position_;
};

/// @brief A query argument (operator, aggregation, join type) is not recognised.
class InvalidArgumentError : public Error {
  public:
    explicit InvalidArgumentError(const std::string& message)
        : Error(ErrorCode::INVALID_ARGUMENT, message)
    {
    }
};

} // namespace naturaldb::infra
