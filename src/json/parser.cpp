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
 * @file parser.cpp
 * @brief Implementation of the recursive-descent JSON parser.
 */

#include "naturaldb/json/parser.hpp"

#include "naturaldb/infra/errors.hpp"

#include <cerrno>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace naturaldb::json {

using infra::JsonParseError;
using infra::ParseErrorKind;

namespace {

/**
 * @class Cursor
 * @brief Single-pass reader over the input text.
 *
 * Holds the current byte offset and the container depth. Every `parse_*`
 * method starts at the first byte of its production and leaves `pos_` on the
 * first byte after it.
 */
class Cursor {
  public:
    explicit Cursor(const std::string& text) : text_(text) {}

    Value parse_document()
    {
        skip_whitespace();
        if (at_end()) {
            fail(ParseErrorKind::EMPTY_INPUT, "no JSON value found");
        }

        Value root = parse_value();

        skip_whitespace();
        if (!at_end()) {
            fail(ParseErrorKind::TRAILING_CONTENT,
                 std::string("unexpected '") + peek() + "' after the root value");
        }
        return root;
    }

  private:
    const std::string& text_;
    std::size_t pos_ = 0;
    int depth_ = 0;

    bool at_end() const { return pos_ >= text_.size(); }
    char peek() const { return text_[pos_]; }

    [[noreturn]] void fail(ParseErrorKind kind, const std::string& detail) const
    {
        throw JsonParseError(kind, pos_, detail);
    }

    void skip_whitespace()
    {
        while (!at_end()) {
            char c = peek();
            if (c != ' ' && c != '\t' && c != '\n' && c != '\r') {
                break;
            }
            pos_++;
        }
    }

    Value parse_value()
    {
        if (at_end()) {
            fail(ParseErrorKind::UNEXPECTED_END, "expected a value");
        }

        char c = peek();
        switch (c) {
        case '{':
            return parse_object();
        case '[':
            return parse_array();
        case '"':
            return Value(parse_string());
        case 't':
            expect_literal("true");
            return Value(true);
        case 'f':
            expect_literal("false");
            return Value(false);
        case 'n':
            expect_literal("null");
            return Value(nullptr);
        default:
            break;
        }

        if (c == '-' || (c >= '0' && c <= '9')) {
            return parse_number();
        }
        fail(ParseErrorKind::UNEXPECTED_CHARACTER, std::string("unexpected '") + c + "'");
    }

    void expect_literal(const char* word)
    {
        std::size_t start = pos_;
        for (const char* p = word; *p != '\0'; ++p) {
            if (at_end() || peek() != *p) {
                pos_ = start;
                fail(ParseErrorKind::INVALID_LITERAL, std::string("expected '") + word + "'");
            }
            pos_++;
        }
    }

    void enter()
    {
        if (++depth_ > Parser::kMaxDepth) {
            fail(ParseErrorKind::NESTING_TOO_DEEP,
                 "more than " + std::to_string(Parser::kMaxDepth) + " nested containers");
        }
    }

    // ------------------------------------------------------------------------
    // Numbers
    // ------------------------------------------------------------------------

    bool digit_at(std::size_t i) const
    {
        return i < text_.size() && text_[i] >= '0' && text_[i] <= '9';
    }

    Value parse_number()
    {
        std::size_t start = pos_;
        bool is_float = false;

        if (peek() == '-') {
            pos_++;
        }

        if (!digit_at(pos_)) {
            fail(ParseErrorKind::INVALID_NUMBER, "expected digit");
        }
        if (peek() == '0') {
            pos_++;
            if (digit_at(pos_)) {
                fail(ParseErrorKind::INVALID_NUMBER, "leading zeros are not allowed");
            }
        } else {
            while (digit_at(pos_)) {
                pos_++;
            }
        }

        if (!at_end() && peek() == '.') {
            is_float = true;
            pos_++;
            if (!digit_at(pos_)) {
                fail(ParseErrorKind::INVALID_NUMBER, "expected digit after '.'");
            }
            while (digit_at(pos_)) {
                pos_++;
            }
        }

        if (!at_end() && (peek() == 'e' || peek() == 'E')) {
            is_float = true;
            pos_++;
            if (!at_end() && (peek() == '+' || peek() == '-')) {
                pos_++;
            }
            if (!digit_at(pos_)) {
                fail(ParseErrorKind::INVALID_NUMBER, "expected digit in exponent");
            }
            while (digit_at(pos_)) {
                pos_++;
            }
        }

        // A number glued to another '.', digit or exponent ("1.2.3", "1e5e2") is
        // one malformed token, not a number followed by garbage.
        if (!at_end() && (peek() == '.' || peek() == 'e' || peek() == 'E')) {
            fail(ParseErrorKind::INVALID_NUMBER, "malformed number");
        }

        std::string token = text_.substr(start, pos_ - start);
        errno = 0;
        if (is_float) {
            double d = std::strtod(token.c_str(), nullptr);
            if (errno == ERANGE && std::isinf(d)) {
                pos_ = start;
                fail(ParseErrorKind::NUMBER_OUT_OF_RANGE, token + " does not fit in a double");
            }
            return Value(d);
        }

        long long i = std::strtoll(token.c_str(), nullptr, 10);
        if (errno == ERANGE) {
            pos_ = start;
            fail(ParseErrorKind::NUMBER_OUT_OF_RANGE, token + " does not fit in a 64-bit integer");
        }
        return Value(static_cast<std::int64_t>(i));
    }

    // ------------------------------------------------------------------------
    // Strings
    // ------------------------------------------------------------------------

    static void append_utf8(std::string& out, std::uint32_t cp)
    {
        if (cp < 0x80) {
            out.push_back(static_cast<char>(cp));
        } else if (cp < 0x800) {
            out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else if (cp < 0x10000) {
            out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else {
            out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }
    }

    /// @brief Reads the four hex digits following `\u`.
    std::uint32_t parse_hex4()
    {
        if (pos_ + 4 > text_.size()) {
            fail(ParseErrorKind::INVALID_UNICODE, "\\u needs four hex digits");
        }
        std::uint32_t cp = 0;
        for (int i = 0; i < 4; ++i) {
            char c = text_[pos_];
            cp <<= 4;
            if (c >= '0' && c <= '9') {
                cp |= static_cast<std::uint32_t>(c - '0');
            } else if (c >= 'a' && c <= 'f') {
                cp |= static_cast<std::uint32_t>(c - 'a' + 10);
            } else if (c >= 'A' && c <= 'F') {
                cp |= static_cast<std::uint32_t>(c - 'A' + 10);
            } else {
                fail(ParseErrorKind::INVALID_UNICODE, std::string("'") + c + "' is not a hex digit");
            }
            pos_++;
        }
        return cp;
    }

    void parse_unicode_escape(std::string& out)
    {
        std::uint32_t cp = parse_hex4();

        if (cp >= 0xDC00 && cp <= 0xDFFF) {
            fail(ParseErrorKind::INVALID_UNICODE, "unpaired low surrogate");
        }

        if (cp >= 0xD800 && cp <= 0xDBFF) {
            if (pos_ + 1 >= text_.size() || text_[pos_] != '\\' || text_[pos_ + 1] != 'u') {
                fail(ParseErrorKind::INVALID_UNICODE, "high surrogate without a low surrogate");
            }
            pos_ += 2;
            std::uint32_t low = parse_hex4();
            if (low < 0xDC00 || low > 0xDFFF) {
                fail(ParseErrorKind::INVALID_UNICODE, "high surrogate without a low surrogate");
            }
            cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
        }

        append_utf8(out, cp);
    }

    std::string parse_string()
    {
        std::size_t start = pos_;
        pos_++; // opening quote

        std::string out;
        while (true) {
            if (at_end()) {
                pos_ = start;
                fail(ParseErrorKind::UNTERMINATED_STRING, "missing closing '\"'");
            }

            char c = peek();
            if (c == '"') {
                pos_++;
                return out;
            }
            if (static_cast<unsigned char>(c) < 0x20) {
                fail(ParseErrorKind::CONTROL_CHARACTER, "control characters must be escaped");
            }
            if (c != '\\') {
                out.push_back(c);
                pos_++;
                continue;
            }

            pos_++;
            if (at_end()) {
                pos_ = start;
                fail(ParseErrorKind::UNTERMINATED_STRING, "input ends inside an escape");
            }

            char esc = peek();
            pos_++;
            switch (esc) {
            case '"':
                out.push_back('"');
                break;
            case '\\':
                out.push_back('\\');
                break;
            case '/':
                out.push_back('/');
                break;
            case 'b':
                out.push_back('\b');
                break;
            case 'f':
                out.push_back('\f');
                break;
            case 'n':
                out.push_back('\n');
                break;
            case 'r':
                out.push_back('\r');
                break;
            case 't':
                out.push_back('\t');
                break;
            case 'u':
                parse_unicode_escape(out);
                break;
            default:
                pos_--;
                fail(ParseErrorKind::INVALID_ESCAPE, std::string("\\") + esc);
            }
        }
    }

    // ------------------------------------------------------------------------
    // Containers
    // ------------------------------------------------------------------------

    Value parse_array()
    {
        enter();
        pos_++; // '['

        Array items;
        skip_whitespace();
        if (!at_end() && peek() == ']') {
            pos_++;
            depth_--;
            return Value(std::move(items));
        }

        while (true) {
            skip_whitespace();
            if (at_end()) {
                fail(ParseErrorKind::UNTERMINATED_ARRAY, "missing ']'");
            }
            items.push_back(parse_value());

            skip_whitespace();
            if (at_end()) {
                fail(ParseErrorKind::UNTERMINATED_ARRAY, "missing ']'");
            }

            char c = peek();
            if (c == ']') {
                pos_++;
                break;
            }
            if (c != ',') {
                fail(ParseErrorKind::UNEXPECTED_CHARACTER,
                     std::string("expected ',' or ']', got '") + c + "'");
            }
            pos_++;

            skip_whitespace();
            if (!at_end() && peek() == ']') {
                fail(ParseErrorKind::TRAILING_COMMA, "',' before ']'");
            }
        }

        depth_--;
        return Value(std::move(items));
    }

    Value parse_object()
    {
        enter();
        pos_++; // '{'

        Object members;
        skip_whitespace();
        if (!at_end() && peek() == '}') {
            pos_++;
            depth_--;
            return Value(std::move(members));
        }

        while (true) {
            skip_whitespace();
            if (at_end()) {
                fail(ParseErrorKind::UNTERMINATED_OBJECT, "missing '}'");
            }
            if (peek() != '"') {
                fail(ParseErrorKind::EXPECTED_KEY, std::string("got '") + peek() + "'");
            }
            std::string key = parse_string();

            skip_whitespace();
            if (at_end()) {
                fail(ParseErrorKind::UNTERMINATED_OBJECT, "missing '}'");
            }
            if (peek() != ':') {
                fail(ParseErrorKind::EXPECTED_COLON, "after key '" + key + "'");
            }
            pos_++;

            skip_whitespace();
            if (at_end()) {
                fail(ParseErrorKind::UNTERMINATED_OBJECT, "missing value for key '" + key + "'");
            }
            members.set(key, parse_value());

            skip_whitespace();
            if (at_end()) {
                fail(ParseErrorKind::UNTERMINATED_OBJECT, "missing '}'");
            }

            char c = peek();
            if (c == '}') {
                pos_++;
                break;
            }
            if (c != ',') {
                fail(ParseErrorKind::UNEXPECTED_CHARACTER,
                     std::string("expected ',' or '}', got '") + c + "'");
            }
            pos_++;

            skip_whitespace();
            if (!at_end() && peek() == '}') {
                fail(ParseErrorKind::TRAILING_COMMA, "',' before '}'");
            }
        }

        depth_--;
        return Value(std::move(members));
    }
};

} // namespace

Value Parser::parse(const std::string& text)
{
    Cursor cursor(text);
    return cursor.parse_document();
}

Value Parser::parse_file(const std::string& path)
{
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw infra::StorageError("read", path, "cannot open file");
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        throw infra::StorageError("read", path, "I/O error");
    }
    return parse(buffer.str());
}

} // namespace naturaldb::json
