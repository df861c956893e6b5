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
 * @file handler_test.cpp
 * @brief Integration tests for the NaturalDB request dispatcher.
 *
 * @details
 * This file verifies the critical path between the function-call surface
 * (api::Handler) and the QueryEngine. Responses are parsed with cJSON so the
 * wire format is checked by an independent implementation.
 */

#include "framework.hpp"
#include "test_dir.hpp"

#include "naturaldb/api/handler.hpp"
#include "naturaldb/infra/errors.hpp"
#include "naturaldb/query/query_engine.hpp"

#include <cJSON.h>
#include <cstdio>
#include <fstream>
#include <iterator>
#include <limits>
#include <string>

namespace {

/**
 * @brief Singleton provider for the integration test engine.
 *
 * Static order guarantees the directory manager is constructed first and
 * destroyed last.
 */
naturaldb::query::QueryEngine& get_handler_engine()
{
    static naturaldb::test::TestDirManager manager("./handler_test_db");
    static naturaldb::query::QueryEngine engine(manager.path, naturaldb::storage::User{"agent", "Agent"},
                                                naturaldb::storage::Database{"main"});
    return engine;
}

naturaldb::api::Handler& get_handler()
{
    static naturaldb::api::Handler handler(get_handler_engine());
    return handler;
}

/**
 * @class Response
 * @brief Owns a cJSON tree parsed from one handler response.
 */
class Response {
  public:
    explicit Response(const std::string& text) : root_(cJSON_Parse(text.c_str())) {}
    ~Response() { cJSON_Delete(root_); }

    Response(const Response&) = delete;
    Response& operator=(const Response&) = delete;

    bool valid() const { return root_ != nullptr; }

    std::string str(const char* key) const
    {
        cJSON* item = cJSON_GetObjectItemCaseSensitive(root_, key);
        return cJSON_IsString(item) ? std::string(item->valuestring) : std::string();
    }

    std::string status() const { return str("status"); }
    std::string code() const { return str("code"); }

    cJSON* data() const { return cJSON_GetObjectItemCaseSensitive(root_, "data"); }
    cJSON* get(const char* key) const { return cJSON_GetObjectItemCaseSensitive(root_, key); }

  private:
    cJSON* root_;
};

std::string call(const std::string& request)
{
    return get_handler().process(request);
}

} // namespace

/**
 * @brief Validates the "Happy Path" for a record insertion request.
 *
 * **Scenario Execution:**
 * 1. Dispatch an `insert` without an id.
 * 2. Verify that an `ok` response carries the generated id.
 * 3. Fetch the record back with that id.
 */
void test_handle_insert_request()
{
    std::string resp_str = call(
        "{\"op\": \"insert\", \"args\": {\"table\": \"test_col\", \"data\": {\"name\": \"unit_test_entry\"}}}");

    Response resp(resp_str);
    ASSERT_TRUE(resp.valid());

    // Diagnostic logging if assertion fails
    if (resp.status() != "ok") {
        printf("    [DEBUG] Handler Rejection: %s\n", resp.str("message").c_str());
    }
    ASSERT_EQ(resp.status(), std::string("ok"));

    cJSON* id = cJSON_GetObjectItemCaseSensitive(resp.data(), "id");
    ASSERT_TRUE(cJSON_IsString(id));
    std::string record_id = id->valuestring;

    Response found(call("{\"op\": \"find_by_id\", \"args\": {\"table\": \"test_col\", \"id\": \"" +
                        record_id + "\"}}"));
    ASSERT_EQ(found.status(), std::string("ok"));
    cJSON* data = cJSON_GetObjectItemCaseSensitive(found.data(), "data");
    ASSERT_EQ(std::string(cJSON_GetObjectItemCaseSensitive(data, "name")->valuestring),
              std::string("unit_test_entry"));
}

/**
 * @brief Validates robust error handling for syntactically invalid JSON.
 */
void test_handle_invalid_json()
{
    Response resp(call("{ op : \"insert\", args : ... "));
    ASSERT_TRUE(resp.valid());
    ASSERT_EQ(resp.status(), std::string("error"));
    ASSERT_EQ(resp.code(), std::string("JSON_PARSE"));
}

void test_handle_unknown_operation()
{
    Response resp(call("{\"op\": \"teleport\", \"args\": {}}"));
    ASSERT_EQ(resp.status(), std::string("error"));
    ASSERT_EQ(resp.code(), std::string("INVALID_ARGUMENT"));

    Response no_op(call("{\"args\": {}}"));
    ASSERT_EQ(no_op.code(), std::string("VALIDATION"));

    Response not_object(call("[1, 2]"));
    ASSERT_EQ(not_object.code(), std::string("VALIDATION"));
}

/**
 * @brief Parameters are checked for presence and JSON kind before anything runs.
 */
void test_handle_argument_validation()
{
    Response missing(call("{\"op\": \"count\", \"args\": {}}"));
    ASSERT_EQ(missing.code(), std::string("VALIDATION"));

    Response wrong_kind(call("{\"op\": \"count\", \"args\": {\"table\": 5}}"));
    ASSERT_EQ(wrong_kind.code(), std::string("VALIDATION"));

    Response bad_operator(call("{\"op\": \"filter\", \"args\": {\"table\": \"test_col\", "
                               "\"field\": \"name\", \"value\": 1, \"operator\": \"like\"}}"));
    ASSERT_EQ(bad_operator.code(), std::string("INVALID_ARGUMENT"));

    Response missing_table(call("{\"op\": \"find_all\", \"args\": {\"table\": \"nowhere\"}}"));
    ASSERT_EQ(missing_table.code(), std::string("TABLE_NOT_FOUND"));
}

/**
 * @brief Sensitive operations are held back until the request carries `"confirm": true`.
 */
void test_handle_confirmation_flow()
{
    call("{\"op\": \"insert\", \"args\": {\"table\": \"guarded\", \"id\": \"g1\", \"data\": {\"v\": 1}}}");

    std::string request = "{\"op\": \"delete\", \"args\": {\"table\": \"guarded\", \"id\": \"g1\"}}";
    Response pending(call(request));
    ASSERT_EQ(pending.status(), std::string("confirmation_required"));
    ASSERT_EQ(pending.str("op"), std::string("delete"));
    cJSON* args = pending.get("args");
    ASSERT_EQ(std::string(cJSON_GetObjectItemCaseSensitive(args, "id")->valuestring),
              std::string("g1"));

    // Nothing was deleted yet.
    Response count(call("{\"op\": \"count\", \"args\": {\"table\": \"guarded\"}}"));
    ASSERT_EQ(count.data()->valueint, 1);

    Response done(call("{\"op\": \"delete\", \"args\": {\"table\": \"guarded\", \"id\": \"g1\"}, "
                       "\"confirm\": true}"));
    ASSERT_EQ(done.status(), std::string("ok"));
    ASSERT_TRUE(cJSON_IsTrue(cJSON_GetObjectItemCaseSensitive(done.data(), "deleted")));

    Response again(call("{\"op\": \"delete\", \"args\": {\"table\": \"guarded\", \"id\": \"g1\"}, "
                        "\"confirm\": true}"));
    ASSERT_EQ(again.code(), std::string("RECORD_NOT_FOUND"));
}

/**
 * @brief Query operations return their rows in the `data` member.
 */
void test_handle_query_operations()
{
    call("{\"op\": \"insert\", \"args\": {\"table\": \"items\", \"id\": 1, \"data\": {\"name\": \"a\", \"qty\": 5, \"kind\": \"x\"}}}");
    call("{\"op\": \"insert\", \"args\": {\"table\": \"items\", \"data\": {\"id\": 2, \"name\": \"b\", \"qty\": 9, \"kind\": \"x\"}}}");
    call("{\"op\": \"insert\", \"args\": {\"table\": \"items\", \"id\": \"3\", \"data\": {\"name\": \"c\", \"qty\": 1, \"kind\": \"y\"}}}");

    Response filtered(call("{\"op\": \"filter\", \"args\": {\"table\": \"items\", \"field\": \"qty\", "
                           "\"value\": 4, \"operator\": \"gt\"}}"));
    ASSERT_EQ(filtered.status(), std::string("ok"));
    ASSERT_EQ(cJSON_GetArraySize(filtered.data()), 2);

    Response grouped(call("{\"op\": \"group_by\", \"args\": {\"table\": \"items\", \"field\": \"kind\", "
                          "\"aggregations\": {\"qty\": \"sum\"}}}"));
    cJSON* first = cJSON_GetArrayItem(grouped.data(), 0);
    ASSERT_EQ(std::string(cJSON_GetObjectItemCaseSensitive(first, "key")->valuestring),
              std::string("x"));
    ASSERT_EQ(cJSON_GetObjectItemCaseSensitive(first, "count")->valueint, 2);
    ASSERT_EQ(cJSON_GetObjectItemCaseSensitive(first, "sum_qty")->valueint, 14);

    Response chained(call("{\"op\": \"query\", \"args\": {\"table\": \"items\", "
                          "\"where\": [{\"field\": \"kind\", \"value\": \"x\"}], "
                          "\"order_by\": \"qty\", \"ascending\": false, \"limit\": 1, "
                          "\"select\": [\"name\"]}}"));
    ASSERT_EQ(chained.status(), std::string("ok"));
    ASSERT_EQ(cJSON_GetArraySize(chained.data()), 1);
    cJSON* top = cJSON_GetArrayItem(chained.data(), 0);
    ASSERT_EQ(std::string(cJSON_GetObjectItemCaseSensitive(top, "name")->valuestring),
              std::string("b"));

    Response renamed(call("{\"op\": \"rename\", \"args\": {\"table\": \"items\", "
                          "\"mapping\": {\"name\": \"label\"}, "
                          "\"conditions\": [{\"field\": \"qty\", \"operator\": \"lt\", \"value\": 2}]}}"));
    ASSERT_EQ(cJSON_GetArraySize(renamed.data()), 1);
    ASSERT_EQ(std::string(cJSON_GetObjectItemCaseSensitive(cJSON_GetArrayItem(renamed.data(), 0),
                                                           "label")
                              ->valuestring),
              std::string("c"));

    Response negative(call("{\"op\": \"sort\", \"args\": {\"table\": \"items\", \"field\": \"qty\", "
                           "\"limit\": -1}}"));
    ASSERT_EQ(negative.code(), std::string("INVALID_ARGUMENT"));
}

void test_handle_import_export()
{
    // The engine owns the test directory; make sure it exists before writing into it.
    get_handler();
    std::string source = "./handler_test_db/import.json";
    {
        std::ofstream out(source);
        out << "[{\"id\": \"p1\", \"v\": 1}, {\"id\": \"p2\", \"v\": 2}]";
    }

    Response imported(call("{\"op\": \"import\", \"args\": {\"table\": \"io\", \"path\": \"" + source + "\"}}"));
    ASSERT_EQ(imported.status(), std::string("ok"));
    ASSERT_EQ(cJSON_GetObjectItemCaseSensitive(imported.data(), "imported")->valueint, 2);

    Response exported(call("{\"op\": \"export\", \"args\": {\"table\": \"io\", "
                           "\"path\": \"./handler_test_db/export.json\", \"pretty\": false}}"));
    ASSERT_EQ(cJSON_GetObjectItemCaseSensitive(exported.data(), "exported")->valueint, 2);

    std::ifstream in("./handler_test_db/export.json");
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    ASSERT_EQ(text, std::string("[{\"id\":\"p1\",\"v\":1},{\"id\":\"p2\",\"v\":2}]"));
}

/**
 * @brief The describe operation lists every table entry with its parameter schema.
 */
void test_handle_describe()
{
    Response resp(call("{\"op\": \"describe\"}"));
    ASSERT_EQ(resp.status(), std::string("ok"));

    int count = cJSON_GetArraySize(resp.data());
    ASSERT_EQ(count, static_cast<int>(get_handler().operations().size()));

    bool saw_drop = false;
    cJSON* op = nullptr;
    cJSON_ArrayForEach(op, resp.data())
    {
        std::string name = cJSON_GetObjectItemCaseSensitive(op, "name")->valuestring;
        ASSERT_TRUE(cJSON_IsArray(cJSON_GetObjectItemCaseSensitive(op, "params")));
        if (name == "drop_table") {
            saw_drop = true;
            ASSERT_TRUE(cJSON_IsTrue(cJSON_GetObjectItemCaseSensitive(op, "sensitive")));
            cJSON* param = cJSON_GetArrayItem(cJSON_GetObjectItemCaseSensitive(op, "params"), 0);
            ASSERT_EQ(std::string(cJSON_GetObjectItemCaseSensitive(param, "type")->valuestring),
                      std::string("string"));
        }
        if (name == "find_all") {
            ASSERT_TRUE(cJSON_IsFalse(cJSON_GetObjectItemCaseSensitive(op, "sensitive")));
        }
    }
    ASSERT_TRUE(saw_drop);
}

/**
 * @brief Sums that leave the double range come back as null and the server
 * keeps answering.
 */
void test_handle_aggregate_overflow()
{
    call("{\"op\": \"insert\", \"args\": {\"table\": \"huge\", \"id\": \"a\", \"data\": {\"g\": \"a\", \"v\": 1.5e308}}}");
    call("{\"op\": \"insert\", \"args\": {\"table\": \"huge\", \"id\": \"b\", \"data\": {\"g\": \"a\", \"v\": 1.5e308}}}");

    Response summed(call("{\"op\": \"group_by\", \"args\": {\"table\": \"huge\", \"field\": \"g\", "
                         "\"aggregations\": {\"v\": \"sum\"}}}"));
    ASSERT_EQ(summed.status(), std::string("ok"));
    cJSON* group = cJSON_GetArrayItem(summed.data(), 0);
    ASSERT_TRUE(cJSON_IsNull(cJSON_GetObjectItemCaseSensitive(group, "sum_v")));

    Response averaged(call("{\"op\": \"group_by\", \"args\": {\"table\": \"huge\", \"field\": \"g\", "
                           "\"aggregations\": {\"v\": \"avg\"}}}"));
    ASSERT_EQ(averaged.status(), std::string("ok"));
    cJSON* avg = cJSON_GetObjectItemCaseSensitive(cJSON_GetArrayItem(averaged.data(), 0), "avg_v");
    ASSERT_TRUE(cJSON_IsNumber(avg));
    ASSERT_EQ(avg->valuedouble, 1.5e308);

    Response count(call("{\"op\": \"count\", \"args\": {\"table\": \"huge\"}}"));
    ASSERT_EQ(count.data()->valueint, 2);
}

/**
 * @brief A result that cannot be written as JSON becomes an INTERNAL error
 * response instead of an exception.
 */
void test_handle_unserializable_result()
{
    naturaldb::api::Handler handler(get_handler_engine());

    naturaldb::api::Operation broken;
    broken.name = "ratio";
    broken.description = "Returns a value JSON cannot carry.";
    broken.run = [](naturaldb::query::QueryEngine&, const naturaldb::json::Object&) {
        return naturaldb::json::Value(std::numeric_limits<double>::infinity());
    };
    handler.register_operation(broken);

    Response resp(handler.process("{\"op\": \"ratio\", \"args\": {}}"));
    ASSERT_TRUE(resp.valid());
    ASSERT_EQ(resp.status(), std::string("error"));
    ASSERT_EQ(resp.code(), std::string("INTERNAL"));

    // The handler is still usable afterwards.
    Response next(handler.process("{\"op\": \"list_tables\", \"args\": {}}"));
    ASSERT_EQ(next.status(), std::string("ok"));

    ASSERT_THROWS(handler.register_operation(broken), naturaldb::infra::InvalidArgumentError);
}
