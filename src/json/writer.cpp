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
 * @file writer.cpp
 * @brief Implementation of the compact and pretty JSON serializer.
 */

#include "naturaldb/json/writer.hpp"

#include "naturaldb/infra/errors.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>

namespace naturaldb::json {

namespace {

void write_escaped(std::string& out, const std::string& text)
{
    static const char* hex = "0123456789abcdef";

    out.push_back('"');
    for (char c : text) {
        switch (c) {
        case '"':
            out += "\\\"";
            break;
        case '\\':
            out += "\\\\";
            break;
        case '\b':
            out += "\\b";
            break;
        case '\f':
            out += "\\f";
            break;
        case '\n':
            out += "\\n";
            break;
        case '\r':
            out += "\\r";
            break;
        case '\t':
            out += "\\t";
            break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                unsigned char u = static_cast<unsigned char>(c);
                out += "\\u00";
                out.push_back(hex[u >> 4]);
                out.push_back(hex[u & 0x0F]);
            } else {
                out.push_back(c);
            }
        }
    }
    out.push_back('"');
}

/**
 * @brief Formats a double with the fewest significant digits that read back exactly.
 *
 * 15 digits cover most values; the rest need 17. The result always carries a
 * `.` or an exponent so the parser reads it back as a float.
 */
void write_double(std::string& out, double d)
{
    if (!std::isfinite(d)) {
        throw infra::InvalidArgumentError("JSON cannot represent NaN or infinite numbers");
    }

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.15g", d);
    if (std::strtod(buf, nullptr) != d) {
        std::snprintf(buf, sizeof(buf), "%.17g", d);
    }

    std::string text(buf);
    if (text.find_first_of(".eE") == std::string::npos) {
        text += ".0";
    }
    out += text;
}

class Emitter {
  public:
    Emitter(std::string& out, std::optional<int> indent) : out_(out), indent_(indent) {}

    void emit(const Value& value, int level)
    {
        switch (value.type()) {
        case Value::Type::NUL:
            out_ += "null";
            break;
        case Value::Type::BOOLEAN:
            out_ += value.as_bool() ? "true" : "false";
            break;
        case Value::Type::INTEGER:
            out_ += std::to_string(value.as_int());
            break;
        case Value::Type::FLOAT:
            write_double(out_, value.as_double());
            break;
        case Value::Type::STRING:
            write_escaped(out_, value.as_string());
            break;
        case Value::Type::ARRAY:
            emit_array(value.as_array(), level);
            break;
        case Value::Type::OBJECT:
            emit_object(value.as_object(), level);
            break;
        }
    }

  private:
    std::string& out_;
    std::optional<int> indent_;

    void newline(int level)
    {
        if (!indent_) {
            return;
        }
        out_.push_back('\n');
        out_.append(static_cast<std::size_t>(*indent_ * level), ' ');
    }

    void emit_array(const Array& items, int level)
    {
        if (items.empty()) {
            out_ += "[]";
            return;
        }

        out_.push_back('[');
        bool first = true;
        for (const auto& item : items) {
            if (!first) {
                out_.push_back(',');
            }
            first = false;
            newline(level + 1);
            emit(item, level + 1);
        }
        newline(level);
        out_.push_back(']');
    }

    void emit_object(const Object& members, int level)
    {
        if (members.empty()) {
            out_ += "{}";
            return;
        }

        out_.push_back('{');
        bool first = true;
        for (const auto& [key, member] : members) {
            if (!first) {
                out_.push_back(',');
            }
            first = false;
            newline(level + 1);
            write_escaped(out_, key);
            out_ += indent_ ? ": " : ":";
            emit(member, level + 1);
        }
        newline(level);
        out_.push_back('}');
    }
};

} // namespace

std::string Writer::write(const Value& value, std::optional<int> indent)
{
    if (indent && *indent < 0) {
        throw infra::InvalidArgumentError("JSON indent must not be negative");
    }

    std::string out;
    Emitter emitter(out, indent);
    emitter.emit(value, 0);
    return out;
}

std::string Writer::quote(const std::string& text)
{
    std::string out;
    write_escaped(out, text);
    return out;
}

} // namespace naturaldb::json
