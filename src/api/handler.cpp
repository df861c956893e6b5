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
 * @file handler.cpp
 * @brief Operation table and request pipeline of the JSON dispatcher.
 *
 * @details
 * Every request goes through the same stages:
 * 1. **Ingest**: parse the raw text with the NaturalDB codec.
 * 2. **Resolve**: look up `op` in the operation table.
 * 3. **Validate**: check presence and JSON kind of each declared parameter.
 * 4. **Confirm**: hold back sensitive operations until `"confirm": true`.
 * 5. **Execute**: run the entry against the engine.
 * 6. **Respond**: wrap the result or the error into the response envelope.
 */

#include "naturaldb/api/handler.hpp"

#include "naturaldb/infra/errors.hpp"
#include "naturaldb/infra/id_generator.hpp"
#include "naturaldb/infra/logger.hpp"
#include "naturaldb/json/parser.hpp"
#include "naturaldb/json/writer.hpp"

#include <utility>

namespace naturaldb::api {

using infra::ErrorCode;
using infra::LogLevel;
using infra::Logger;
using json::Value;
using query::QueryEngine;
using storage::Record;

namespace {

// ============================================================================
// Response envelope
// ============================================================================

Value ok(Value data)
{
    return json::Object{{"status", "ok"}, {"data", std::move(data)}};
}

Value error(ErrorCode code, const std::string& message)
{
    return json::Object{{"status", "error"}, {"code", infra::to_string(code)}, {"message", message}};
}

Value confirmation_required(const std::string& op, const json::Object& args)
{
    return json::Object{{"status", "confirmation_required"}, {"op", op}, {"args", args}};
}

// ============================================================================
// Argument and result marshaling
// ============================================================================

/// @brief Converts a failed `Result` back into the error it carried.
template <typename T> T unwrap(infra::Result<T> result)
{
    if (!result) {
        throw infra::Error(result.code(), result.message());
    }
    return std::move(result.value());
}

bool matches_type(const Value& v, ParamType type)
{
    switch (type) {
    case ParamType::STRING:
        return v.is_string();
    case ParamType::INTEGER:
        return v.is_int();
    case ParamType::NUMBER:
        return v.is_number();
    case ParamType::BOOLEAN:
        return v.is_bool();
    case ParamType::OBJECT:
        return v.is_object();
    case ParamType::ARRAY:
        return v.is_array();
    case ParamType::ANY:
        return true;
    }
    return false;
}

const std::string& str(const json::Object& args, const std::string& name)
{
    return args.get(name)->as_string();
}

std::string str_or(const json::Object& args, const std::string& name, const std::string& fallback)
{
    const Value* v = args.get(name);
    return (v != nullptr && v->is_string()) ? v->as_string() : fallback;
}

bool bool_or(const json::Object& args, const std::string& name, bool fallback)
{
    const Value* v = args.get(name);
    return (v != nullptr && v->is_bool()) ? v->as_bool() : fallback;
}

std::size_t count_arg(const json::Object& args, const std::string& name)
{
    std::int64_t n = args.get(name)->as_int();
    if (n < 0) {
        throw infra::InvalidArgumentError("'" + name + "' must not be negative");
    }
    return static_cast<std::size_t>(n);
}

std::vector<std::string> string_list(const Value& list, const std::string& name)
{
    std::vector<std::string> out;
    for (const auto& item : list.as_array()) {
        if (!item.is_string()) {
            throw infra::ValidationError("'" + name + "' must be an array of strings");
        }
        out.push_back(item.as_string());
    }
    return out;
}

/// @brief Reads `[{"field", "operator"?, "value"}]`.
std::vector<query::Condition> conditions_arg(const Value* list)
{
    std::vector<query::Condition> out;
    if (list == nullptr || list->is_null()) {
        return out;
    }

    for (const auto& item : list->as_array()) {
        if (!item.is_object()) {
            throw infra::ValidationError("each condition must be an object");
        }
        const auto& c = item.as_object();
        const Value* field = c.get("field");
        if (field == nullptr || !field->is_string()) {
            throw infra::ValidationError("condition is missing a string 'field'");
        }

        query::Condition condition;
        condition.field = field->as_string();
        condition.op = query::parse_operator(str_or(c, "operator", "eq"));
        if (const Value* v = c.get("value")) {
            condition.value = *v;
        }
        out.push_back(std::move(condition));
    }
    return out;
}

/// @brief Record id for a write: `id` argument, else `data.id`, else a new UUID.
std::string record_id(const json::Object& args, const json::Object& data)
{
    if (const Value* id = args.get("id"); id != nullptr && !id->is_null()) {
        return query::QueryOperations::to_text(*id);
    }
    if (const Value* id = data.get("id"); id != nullptr && !id->is_null()) {
        return query::QueryOperations::to_text(*id);
    }
    return infra::IdGenerator::generate();
}

Value record_json(const Record& record)
{
    return json::Object{{"id", record.id}, {"data", record.data}};
}

Value records_json(const std::vector<Record>& records)
{
    json::Array out;
    out.reserve(records.size());
    for (const auto& record : records) {
        out.push_back(record_json(record));
    }
    return out;
}

Value objects_json(std::vector<json::Object> rows)
{
    json::Array out;
    out.reserve(rows.size());
    for (auto& row : rows) {
        out.emplace_back(std::move(row));
    }
    return out;
}

// ============================================================================
// Operation table
// ============================================================================

ParamSpec param(std::string name, ParamType type, bool required, std::string description)
{
    return ParamSpec{std::move(name), type, required, std::move(description)};
}

ParamSpec table_param()
{
    return param("table", ParamType::STRING, true, "Table name");
}

std::vector<Operation> build_operations()
{
    std::vector<Operation> ops;

    ops.push_back({"create_table",
                   "Create a table, optionally declaring key fields and indexes.",
                   {table_param(),
                    param("keys", ParamType::ARRAY, false, "Key field names"),
                    param("indexes", ParamType::OBJECT, false, "Index name to list of fields")},
                   false,
                   [](QueryEngine& engine, const json::Object& args) -> Value {
                       storage::Table table;
                       table.name = str(args, "table");
                       if (const Value* keys = args.get("keys")) {
                           table.keys = string_list(*keys, "keys");
                       }
                       if (const Value* indexes = args.get("indexes")) {
                           for (const auto& [name, fields] : indexes->as_object()) {
                               if (!fields.is_array()) {
                                   throw infra::ValidationError("index '" + name +
                                                                "' must list its fields");
                               }
                               table.indexes[name] =
                                   storage::Index{name, string_list(fields, "indexes." + name)};
                           }
                       }
                       return json::Object{{"created", unwrap(engine.create_table(table))}};
                   }});

    ops.push_back({"drop_table",
                   "Delete a table and all of its records.",
                   {table_param()},
                   true,
                   [](QueryEngine& engine, const json::Object& args) -> Value {
                       return json::Object{{"dropped", unwrap(engine.drop_table(str(args, "table")))}};
                   }});

    ops.push_back({"list_tables",
                   "List the tables of the database.",
                   {},
                   false,
                   [](QueryEngine& engine, const json::Object&) -> Value {
                       json::Array names;
                       for (auto& name : unwrap(engine.list_tables())) {
                           names.emplace_back(std::move(name));
                       }
                       return names;
                   }});

    ops.push_back({"insert",
                   "Insert or replace a record. The id defaults to data.id, then to a new UUID.",
                   {table_param(),
                    param("id", ParamType::ANY, false, "Record id"),
                    param("data", ParamType::OBJECT, true, "Record content")},
                   false,
                   [](QueryEngine& engine, const json::Object& args) -> Value {
                       Record record;
                       record.data = args.get("data")->as_object();
                       record.id = record_id(args, record.data);
                       unwrap(engine.insert(str(args, "table"), record));
                       return json::Object{{"id", record.id}};
                   }});

    ops.push_back({"find_by_id",
                   "Fetch one record by id.",
                   {table_param(), param("id", ParamType::ANY, true, "Record id")},
                   false,
                   [](QueryEngine& engine, const json::Object& args) -> Value {
                       std::string id = query::QueryOperations::to_text(*args.get("id"));
                       return record_json(unwrap(engine.find_by_id(str(args, "table"), id)));
                   }});

    ops.push_back({"find_all",
                   "Fetch every record of a table.",
                   {table_param()},
                   false,
                   [](QueryEngine& engine, const json::Object& args) -> Value {
                       return records_json(unwrap(engine.find_all(str(args, "table"))));
                   }});

    ops.push_back({"update",
                   "Replace an existing record.",
                   {table_param(),
                    param("id", ParamType::ANY, true, "Record id"),
                    param("data", ParamType::OBJECT, true, "New record content")},
                   true,
                   [](QueryEngine& engine, const json::Object& args) -> Value {
                       Record record;
                       record.id = query::QueryOperations::to_text(*args.get("id"));
                       record.data = args.get("data")->as_object();
                       return json::Object{{"updated", unwrap(engine.update(str(args, "table"), record))}};
                   }});

    ops.push_back({"delete",
                   "Delete an existing record.",
                   {table_param(), param("id", ParamType::ANY, true, "Record id")},
                   true,
                   [](QueryEngine& engine, const json::Object& args) -> Value {
                       std::string id = query::QueryOperations::to_text(*args.get("id"));
                       return json::Object{{"deleted", unwrap(engine.remove(str(args, "table"), id))}};
                   }});

    ops.push_back({"count",
                   "Number of records in a table.",
                   {table_param()},
                   false,
                   [](QueryEngine& engine, const json::Object& args) -> Value {
                       return unwrap(engine.count(str(args, "table")));
                   }});

    ops.push_back({"filter",
                   "Records whose field satisfies operator/value.",
                   {table_param(),
                    param("field", ParamType::STRING, true, "Dot-path field name"),
                    param("value", ParamType::ANY, true, "Value to compare against"),
                    param("operator", ParamType::STRING, false,
                          "eq, ne, gt, gte, lt, lte or contains (default eq)")},
                   false,
                   [](QueryEngine& engine, const json::Object& args) -> Value {
                       auto op = query::parse_operator(str_or(args, "operator", "eq"));
                       return records_json(unwrap(engine.filter(str(args, "table"), str(args, "field"),
                                                                *args.get("value"), op)));
                   }});

    ops.push_back({"project",
                   "Selected fields of the records matching all conditions.",
                   {table_param(),
                    param("fields", ParamType::ARRAY, true, "Dot-path field names"),
                    param("conditions", ParamType::ARRAY, false,
                          "List of {field, operator, value}")},
                   false,
                   [](QueryEngine& engine, const json::Object& args) -> Value {
                       return objects_json(unwrap(engine.project(
                           str(args, "table"), string_list(*args.get("fields"), "fields"),
                           conditions_arg(args.get("conditions")))));
                   }});

    ops.push_back({"rename",
                   "Records matching all conditions with fields renamed by mapping.",
                   {table_param(),
                    param("mapping", ParamType::OBJECT, true, "Source field to target field"),
                    param("conditions", ParamType::ARRAY, false,
                          "List of {field, operator, value}")},
                   false,
                   [](QueryEngine& engine, const json::Object& args) -> Value {
                       std::vector<std::pair<std::string, std::string>> mapping;
                       for (const auto& [from, to] : args.get("mapping")->as_object()) {
                           if (!to.is_string()) {
                               throw infra::ValidationError("mapping target for '" + from +
                                                            "' must be a string");
                           }
                           mapping.emplace_back(from, to.as_string());
                       }
                       return objects_json(unwrap(engine.rename(
                           str(args, "table"), mapping, conditions_arg(args.get("conditions")))));
                   }});

    ops.push_back({"group_by",
                   "Group records by a field, optionally aggregating other fields per group.",
                   {table_param(),
                    param("field", ParamType::STRING, true, "Dot-path field name"),
                    param("aggregations", ParamType::OBJECT, false,
                          "Field to count, sum, avg, min or max")},
                   false,
                   [](QueryEngine& engine, const json::Object& args) -> Value {
                       std::vector<query::Aggregation> aggregations;
                       if (const Value* aggs = args.get("aggregations")) {
                           for (const auto& [field, op] : aggs->as_object()) {
                               if (!op.is_string()) {
                                   throw infra::ValidationError("aggregation for '" + field +
                                                                "' must be a string");
                               }
                               aggregations.push_back({field, query::parse_aggregate(op.as_string())});
                           }
                       }

                       json::Array groups;
                       for (auto& summary : unwrap(engine.group_by(str(args, "table"),
                                                                   str(args, "field"), aggregations))) {
                           json::Object group{{"key", summary.key}, {"count", summary.count}};
                           for (const auto& [name, value] : summary.values) {
                               group.set(name, value);
                           }
                           groups.emplace_back(std::move(group));
                       }
                       return groups;
                   }});

    ops.push_back({"sort",
                   "Records ordered by a field, optionally truncated.",
                   {table_param(),
                    param("field", ParamType::STRING, true, "Dot-path field name"),
                    param("ascending", ParamType::BOOLEAN, false, "Default true"),
                    param("limit", ParamType::INTEGER, false, "Maximum number of records, 0 for all")},
                   false,
                   [](QueryEngine& engine, const json::Object& args) -> Value {
                       std::optional<std::size_t> limit;
                       if (args.contains("limit")) {
                           limit = count_arg(args, "limit");
                       }
                       return records_json(unwrap(engine.sort(str(args, "table"), str(args, "field"),
                                                              bool_or(args, "ascending", true),
                                                              limit)));
                   }});

    ops.push_back({"join",
                   "Hash join of two tables into flattened rows.",
                   {param("left_table", ParamType::STRING, true, "Left table"),
                    param("right_table", ParamType::STRING, true, "Right table"),
                    param("left_field", ParamType::STRING, true, "Join field of the left table"),
                    param("right_field", ParamType::STRING, true, "Join field of the right table"),
                    param("join_type", ParamType::STRING, false, "inner (default) or left"),
                    param("left_prefix", ParamType::STRING, false, "Prefix for left fields"),
                    param("right_prefix", ParamType::STRING, false, "Prefix for right fields")},
                   false,
                   [](QueryEngine& engine, const json::Object& args) -> Value {
                       auto type = query::parse_join_type(str_or(args, "join_type", "inner"));
                       return objects_json(unwrap(engine.join(
                           str(args, "left_table"), str(args, "right_table"), str(args, "left_field"),
                           str(args, "right_field"), type, str_or(args, "left_prefix", ""),
                           str_or(args, "right_prefix", ""))));
                   }});

    ops.push_back({"query",
                   "Chained query: where conditions, order_by, skip, limit, then select.",
                   {table_param(),
                    param("where", ParamType::ARRAY, false, "List of {field, operator, value}"),
                    param("order_by", ParamType::STRING, false, "Field to sort by"),
                    param("ascending", ParamType::BOOLEAN, false, "Default true"),
                    param("skip", ParamType::INTEGER, false, "Records to skip"),
                    param("limit", ParamType::INTEGER, false, "Maximum number of records"),
                    param("select", ParamType::ARRAY, false, "Fields to project")},
                   false,
                   [](QueryEngine& engine, const json::Object& args) -> Value {
                       std::string table = str(args, "table");
                       if (!engine.database_storage().table_exists(table)) {
                           throw infra::TableNotFoundError(table);
                       }

                       query::TableQuery q = engine.table(table);
                       for (const auto& c : conditions_arg(args.get("where"))) {
                           q = q.where(c.field, c.value, c.op);
                       }
                       if (args.contains("order_by")) {
                           q = q.order_by(str(args, "order_by"), bool_or(args, "ascending", true));
                       }
                       if (args.contains("skip")) {
                           q = q.skip(count_arg(args, "skip"));
                       }
                       if (args.contains("limit")) {
                           q = q.limit(count_arg(args, "limit"));
                       }
                       if (const Value* select = args.get("select")) {
                           return objects_json(q.select(string_list(*select, "select")));
                       }
                       return records_json(q.all());
                   }});

    ops.push_back({"import",
                   "Load records from a JSON file (object or array of objects).",
                   {table_param(), param("path", ParamType::STRING, true, "Source file")},
                   false,
                   [](QueryEngine& engine, const json::Object& args) -> Value {
                       return json::Object{{"imported", unwrap(engine.import_from_json_file(
                                                            str(args, "table"), str(args, "path")))}};
                   }});

    ops.push_back({"export",
                   "Write the records of a table to a JSON file.",
                   {table_param(),
                    param("path", ParamType::STRING, true, "Target file"),
                    param("pretty", ParamType::BOOLEAN, false, "Indent output (default true)")},
                   false,
                   [](QueryEngine& engine, const json::Object& args) -> Value {
                       return json::Object{{"exported", unwrap(engine.export_to_json_file(
                                                            str(args, "table"), str(args, "path"),
                                                            bool_or(args, "pretty", true)))}};
                   }});

    return ops;
}

} // namespace

const char* to_string(ParamType type)
{
    switch (type) {
    case ParamType::STRING:
        return "string";
    case ParamType::INTEGER:
        return "integer";
    case ParamType::NUMBER:
        return "number";
    case ParamType::BOOLEAN:
        return "boolean";
    case ParamType::OBJECT:
        return "object";
    case ParamType::ARRAY:
        return "array";
    case ParamType::ANY:
        return "any";
    }
    return "any";
}

Handler::Handler(QueryEngine& engine) : engine_(engine), operations_(build_operations()) {}

const Operation* Handler::find(const std::string& name) const
{
    for (const auto& op : operations_) {
        if (op.name == name) {
            return &op;
        }
    }
    return nullptr;
}

void Handler::register_operation(Operation operation)
{
    if (operation.name.empty() || operation.name == "describe" || find(operation.name) != nullptr) {
        throw infra::InvalidArgumentError("Operation name '" + operation.name +
                                          "' is empty, reserved or already registered");
    }
    operations_.push_back(std::move(operation));
}

json::Value Handler::describe() const
{
    json::Array out;
    for (const auto& op : operations_) {
        json::Array params;
        for (const auto& p : op.params) {
            params.emplace_back(json::Object{{"name", p.name},
                                             {"type", to_string(p.type)},
                                             {"required", p.required},
                                             {"description", p.description}});
        }
        out.emplace_back(json::Object{{"name", op.name},
                                      {"description", op.description},
                                      {"sensitive", op.sensitive},
                                      {"params", std::move(params)}});
    }
    return out;
}

json::Value Handler::dispatch(const json::Value& request)
{
    if (!request.is_object()) {
        return error(ErrorCode::VALIDATION, "Request must be a JSON object");
    }
    const auto& req = request.as_object();

    const Value* op_name = req.get("op");
    if (op_name == nullptr || !op_name->is_string()) {
        return error(ErrorCode::VALIDATION, "Missing string field 'op'");
    }

    if (op_name->as_string() == "describe") {
        return ok(describe());
    }

    const Operation* op = find(op_name->as_string());
    if (op == nullptr) {
        return error(ErrorCode::INVALID_ARGUMENT, "Unknown operation '" + op_name->as_string() + "'");
    }

    json::Object args;
    if (const Value* a = req.get("args"); a != nullptr && !a->is_null()) {
        if (!a->is_object()) {
            return error(ErrorCode::VALIDATION, "'args' must be a JSON object");
        }
        args = a->as_object();
    }

    for (const auto& p : op->params) {
        const Value* v = args.get(p.name);
        if (v == nullptr || (v->is_null() && p.type != ParamType::ANY)) {
            if (p.required) {
                return error(ErrorCode::VALIDATION, "Missing required argument '" + p.name + "'");
            }
            continue;
        }
        if (!matches_type(*v, p.type)) {
            return error(ErrorCode::VALIDATION, "Argument '" + p.name + "' must be " +
                                                    to_string(p.type) + ", got " +
                                                    json::type_name(v->type()));
        }
    }

    const Value* confirm = req.get("confirm");
    if (op->sensitive && !(confirm != nullptr && confirm->is_bool() && confirm->as_bool())) {
        Logger::log(LogLevel::INFO, "Handler: '" + op->name + "' awaits confirmation.");
        return confirmation_required(op->name, args);
    }

    try {
        return ok(op->run(engine_, args));
    } catch (const infra::Error& e) {
        return error(e.code(), e.what());
    } catch (const std::exception& e) {
        Logger::log(LogLevel::ERROR, "Handler: '" + op->name + "' crashed: " + e.what());
        return error(ErrorCode::INTERNAL, e.what());
    }
}

std::string Handler::process(const std::string& raw_json)
{
    Value response;
    try {
        response = dispatch(json::Parser::parse(raw_json));
    } catch (const infra::JsonParseError& e) {
        response = error(ErrorCode::JSON_PARSE, e.what());
    }

    try {
        return json::Writer::write(response);
    } catch (const infra::Error& e) {
        Logger::log(LogLevel::ERROR, std::string("Handler: response not serializable: ") + e.what());
        return json::Writer::write(error(ErrorCode::INTERNAL, e.what()));
    }
}

} // namespace naturaldb::api
