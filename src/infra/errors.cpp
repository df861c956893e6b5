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
 * @file errors.cpp
 * @brief String tables for error codes and parse error kinds.
 */

#include "naturaldb/infra/errors.hpp"

namespace naturaldb::infra {

const char* to_string(ErrorCode code)
{
    switch (code) {
    case ErrorCode::OK:
        return "OK";
    case ErrorCode::VALIDATION:
        return "VALIDATION";
    case ErrorCode::STORAGE:
        return "STORAGE";
    case ErrorCode::TABLE_NOT_FOUND:
        return "TABLE_NOT_FOUND";
    case ErrorCode::RECORD_NOT_FOUND:
        return "RECORD_NOT_FOUND";
    case ErrorCode::RECORD_EXISTS:
        return "RECORD_EXISTS";
    case ErrorCode::LOCK_TIMEOUT:
        return "LOCK_TIMEOUT";
    case ErrorCode::JSON_PARSE:
        return "JSON_PARSE";
    case ErrorCode::INVALID_ARGUMENT:
        return "INVALID_ARGUMENT";
    case ErrorCode::INTERNAL:
        return "INTERNAL";
    }
    return "INTERNAL";
}

const char* to_string(ParseErrorKind kind)
{
    switch (kind) {
    case ParseErrorKind::EMPTY_INPUT:
        return "empty input";
    case ParseErrorKind::UNEXPECTED_CHARACTER:
        return "unexpected character";
    case ParseErrorKind::UNEXPECTED_END:
        return "unexpected end of input";
    case ParseErrorKind::INVALID_LITERAL:
        return "invalid literal";
    case ParseErrorKind::INVALID_NUMBER:
        return "invalid number";
    case ParseErrorKind::NUMBER_OUT_OF_RANGE:
        return "number out of range";
    case ParseErrorKind::INVALID_ESCAPE:
        return "invalid escape sequence";
    case ParseErrorKind::INVALID_UNICODE:
        return "invalid unicode escape";
    case ParseErrorKind::CONTROL_CHARACTER:
        return "unescaped control character";
    case ParseErrorKind::UNTERMINATED_STRING:
        return "unterminated string";
    case ParseErrorKind::UNTERMINATED_ARRAY:
        return "unterminated array";
    case ParseErrorKind::UNTERMINATED_OBJECT:
        return "unterminated object";
    case ParseErrorKind::TRAILING_COMMA:
        return "trailing comma";
    case ParseErrorKind::EXPECTED_KEY:
        return "expected string key";
    case ParseErrorKind::EXPECTED_COLON:
        return "expected ':' after key";
    case ParseErrorKind::TRAILING_CONTENT:
        return "trailing content";
    case ParseErrorKind::NESTING_TOO_DEEP:
        return "nesting too deep";
    }
    return "parse error";
}

} // namespace naturaldb::infra
