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
 * @file handler.hpp
 * @brief JSON request dispatcher over the query engine.
 *
 * @details
 * The `Handler` is the function-call surface of NaturalDB. It owns an explicit
 * table of operations; each entry names the operation, describes it, declares
 * its parameters and says whether it needs confirmation. External callers
 * (the line-oriented executable, an HTTP front end, a natural-language agent)
 * send one JSON request per call:
 *
 * @code
 * {"op": "filter", "args": {"table": "users", "field": "age", "value": 30, "operator": "gt"}}
 * @endcode
 *
 * **Response Formats:**
 * - **Success:** `{"status": "ok", "data": <result>}`
 * - **Error:** `{"status": "error", "code": "<ERROR_CODE>", "message": "<description>"}`
 * - **Pending:** `{"status": "confirmation_required", "op": <name>, "args": {...}}` when a
 *   sensitive operation (`update`, `delete`, `drop_table`) arrives without `"confirm": true`.
 */

#pragma once

#include "naturaldb/json/value.hpp"
#include "naturaldb/query/query_engine.hpp"

#include <functional>
#include <string>
#include <vector>

namespace naturaldb::api {

enum class ParamType { STRING, INTEGER, NUMBER, BOOLEAN, OBJECT, ARRAY, ANY };

const char* to_string(ParamType type);

struct ParamSpec {
    std::string name;
    ParamType type = ParamType::STRING;
    bool required = true;
    std::string description;
};

/**
 * @struct Operation
 * @brief One entry of the dispatch table.
 *
 * `run` receives validated arguments and returns the `data` member of the
 * success response. It reports failures by throwing `infra::Error`.
 */
struct Operation {
    std::string name;
    std::string description;
    std::vector<ParamSpec> params;
    bool sensitive = false;
    std::function<json::Value(query::QueryEngine&, const json::Object&)> run;
};

class Handler {
  public:
    explicit Handler(query::QueryEngine& engine);

    /**
     * @brief Processes one raw request and returns the compact JSON response.
     *
     * Never throws for bad input: parse errors, unknown operations and argument
     * problems all come back as error responses.
     */
    std::string process(const std::string& raw_json);

    /// @brief Same as `process` for an already-parsed request.
    json::Value dispatch(const json::Value& request);

    /**
     * @brief The operation table as JSON.
     *
     * An array of `{"name", "description", "sensitive", "params": [{"name",
     * "type", "required", "description"}]}` in registration order.
     */
    json::Value describe() const;

    const std::vector<Operation>& operations() const { return operations_; }

    /// @brief Table entry for @p name, or `nullptr`.
    const Operation* find(const std::string& name) const;

    /**
     * @brief Appends an operation to the table.
     * @throws infra::InvalidArgumentError if the name is empty, `describe`, or
     *         already registered.
     */
    void register_operation(Operation operation);

  private:
    query::QueryEngine& engine_;
    std::vector<Operation> operations_;
};

} // namespace naturaldb::api
