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
 * @file operations_test.cpp
 * @brief Unit tests for the in-memory query operations and joins.
 *
 * @details
 * These tests run on record vectors only; nothing touches the filesystem.
 */

#include "framework.hpp"

#include "naturaldb/infra/errors.hpp"
#include "naturaldb/query/join.hpp"
#include "naturaldb/query/operations.hpp"
#include "naturaldb/query/table_query.hpp"

#include <cstdint>
#include <limits>
#include <set>
#include <string>
#include <vector>

using naturaldb::json::Array;
using naturaldb::json::Object;
using naturaldb::json::Value;
using naturaldb::query::AggregateOp;
using naturaldb::query::FilterOp;
using naturaldb::query::JoinOperations;
using naturaldb::query::QueryOperations;
using naturaldb::storage::Record;

namespace {

std::vector<Record> people()
{
    return {
        Record{"1", Object{{"name", "Ana"}, {"age", 30}, {"city", "Lima"}, {"score", 8.5}}},
        Record{"2", Object{{"name", "Ben"}, {"age", 25}, {"city", "Oslo"}}},
        Record{"3", Object{{"name", "Cy"}, {"age", 35}, {"city", "Lima"}, {"score", 6}}},
        Record{"4", Object{{"name", "Di"}, {"city", nullptr}}},
        Record{"5", Object{{"name", "Ed"}, {"age", 30.0}, {"address", Object{{"zip", "0150"}}}}},
    };
}

std::set<std::string> ids(const std::vector<Record>& records)
{
    std::set<std::string> out;
    for (const auto& r : records) {
        out.insert(r.id);
    }
    return out;
}

std::vector<std::string> ordered_ids(const std::vector<Record>& records)
{
    std::vector<std::string> out;
    for (const auto& r : records) {
        out.push_back(r.id);
    }
    return out;
}

} // namespace

void test_operator_names()
{
    ASSERT_TRUE(naturaldb::query::parse_operator("gte") == FilterOp::GTE);
    ASSERT_EQ(std::string(naturaldb::query::to_string(FilterOp::CONTAINS)), std::string("contains"));
    ASSERT_TRUE(naturaldb::query::parse_aggregate("avg") == AggregateOp::AVG);
    ASSERT_THROWS(naturaldb::query::parse_operator("like"), naturaldb::infra::InvalidArgumentError);
    ASSERT_THROWS(naturaldb::query::parse_aggregate("median"),
                  naturaldb::infra::InvalidArgumentError);
    ASSERT_THROWS(naturaldb::query::parse_join_type("outer"), naturaldb::infra::InvalidArgumentError);
}

void test_get_and_set_field()
{
    Object data{{"a", Object{{"b", Object{{"c", 1}}}}}, {"x", 5}};
    ASSERT_EQ(QueryOperations::get_field(data, "a.b.c")->as_int(), static_cast<std::int64_t>(1));
    ASSERT_TRUE(QueryOperations::get_field(data, "a.b.d") == nullptr);
    ASSERT_TRUE(QueryOperations::get_field(data, "x.y") == nullptr);

    QueryOperations::set_field(data, "a.b.d", "new");
    ASSERT_EQ(QueryOperations::get_field(data, "a.b.d")->as_string(), std::string("new"));

    // A scalar on the way is replaced by an object.
    QueryOperations::set_field(data, "x.y", true);
    ASSERT_TRUE(QueryOperations::get_field(data, "x.y")->as_bool());
}

/**
 * @brief Equality is numeric across int/float and order-insensitive for objects.
 */
void test_values_equal()
{
    ASSERT_TRUE(QueryOperations::values_equal(Value(1), Value(1.0)));
    ASSERT_FALSE(QueryOperations::values_equal(Value(1), Value("1")));
    ASSERT_TRUE(QueryOperations::values_equal(Value(Object{{"a", 1}, {"b", 2}}),
                                              Value(Object{{"b", 2.0}, {"a", 1}})));
    ASSERT_FALSE(QueryOperations::values_equal(Value(Array{1, 2}), Value(Array{2, 1})));
    ASSERT_TRUE(QueryOperations::values_equal(Value(), Value(nullptr)));

    // Keys agree with equality.
    ASSERT_EQ(QueryOperations::canonical_key(Value(2)), QueryOperations::canonical_key(Value(2.0)));
    ASSERT_EQ(QueryOperations::canonical_key(Value(Object{{"a", 1}, {"b", 2}})),
              QueryOperations::canonical_key(Value(Object{{"b", 2}, {"a", 1}})));
    ASSERT_NE(QueryOperations::canonical_key(Value(1)), QueryOperations::canonical_key(Value("1")));
}

void test_filter_eq_and_contains()
{
    auto records = people();

    auto lima = QueryOperations::filter_by_field(records, "city", "Lima", FilterOp::EQ);
    ASSERT_TRUE(ids(lima) == (std::set<std::string>{"1", "3"}));

    // 30 matches both the integer and the float field.
    auto thirty = QueryOperations::filter_by_field(records, "age", 30, FilterOp::EQ);
    ASSERT_TRUE(ids(thirty) == (std::set<std::string>{"1", "5"}));

    auto nested = QueryOperations::filter_by_field(records, "address.zip", "0150", FilterOp::EQ);
    ASSERT_TRUE(ids(nested) == (std::set<std::string>{"5"}));

    auto with_e = QueryOperations::filter_by_field(records, "name", "e", FilterOp::CONTAINS);
    ASSERT_TRUE(ids(with_e) == (std::set<std::string>{"2"}));

    // A null field is present and equals null.
    auto null_city = QueryOperations::filter_by_field(records, "city", nullptr, FilterOp::EQ);
    ASSERT_TRUE(ids(null_city) == (std::set<std::string>{"4"}));
}

/**
 * @brief Operator laws: ne = not eq, gte = gt or eq, and lt/eq/gt partition comparable values.
 */
void test_filter_operator_laws()
{
    auto records = people();
    auto all = ids(records);

    for (const Value& pivot : {Value(30), Value(25.5), Value(100)}) {
        auto eq = ids(QueryOperations::filter_by_field(records, "age", pivot, FilterOp::EQ));
        auto ne = ids(QueryOperations::filter_by_field(records, "age", pivot, FilterOp::NE));
        auto gt = ids(QueryOperations::filter_by_field(records, "age", pivot, FilterOp::GT));
        auto gte = ids(QueryOperations::filter_by_field(records, "age", pivot, FilterOp::GTE));
        auto lt = ids(QueryOperations::filter_by_field(records, "age", pivot, FilterOp::LT));
        auto lte = ids(QueryOperations::filter_by_field(records, "age", pivot, FilterOp::LTE));

        std::set<std::string> eq_or_ne = eq;
        eq_or_ne.insert(ne.begin(), ne.end());
        ASSERT_TRUE(eq_or_ne == all);
        ASSERT_EQ(eq.size() + ne.size(), all.size());

        std::set<std::string> gt_or_eq = gt;
        gt_or_eq.insert(eq.begin(), eq.end());
        ASSERT_TRUE(gte == gt_or_eq);

        std::set<std::string> lt_or_eq = lt;
        lt_or_eq.insert(eq.begin(), eq.end());
        ASSERT_TRUE(lte == lt_or_eq);

        // Every record with a numeric age lands in exactly one of lt, eq, gt.
        ASSERT_EQ(lt.size() + eq.size() + gt.size(), static_cast<size_t>(4));
    }

    // A missing field matches only ne.
    auto missing_ne = ids(QueryOperations::filter_by_field(records, "age", 30, FilterOp::NE));
    ASSERT_TRUE(missing_ne.count("4") == 1);
    auto missing_gt = ids(QueryOperations::filter_by_field(records, "age", 0, FilterOp::GT));
    ASSERT_TRUE(missing_gt.count("4") == 0);

    // Strings and numbers never order against each other.
    ASSERT_TRUE(QueryOperations::filter_by_field(records, "name", 1, FilterOp::GT).empty());
}

void test_filter_all_conditions()
{
    std::vector<naturaldb::query::Condition> conditions = {
        {"city", FilterOp::EQ, "Lima"},
        {"age", FilterOp::GT, 31},
    };
    auto out = QueryOperations::filter_all(people(), conditions);
    ASSERT_TRUE(ids(out) == (std::set<std::string>{"3"}));

    ASSERT_EQ(QueryOperations::filter_all(people(), {}).size(), static_cast<size_t>(5));

    auto custom = QueryOperations::filter(people(), [](const Record& r) { return r.id == "2"; });
    ASSERT_EQ(custom.size(), static_cast<size_t>(1));
}

void test_project_fields()
{
    auto rows = QueryOperations::project(people(), {"name", "address.zip"});
    ASSERT_EQ(rows.size(), static_cast<size_t>(5));

    const Object& first = rows[0];
    ASSERT_EQ(first.size(), static_cast<size_t>(2));
    ASSERT_EQ(first.get("name")->as_string(), std::string("Ana"));
    // Missing fields project as null, nested fields keep their nesting.
    ASSERT_TRUE(first.get("address")->as_object().get("zip")->is_null());
    ASSERT_EQ(rows[4].get("address")->as_object().get("zip")->as_string(), std::string("0150"));
}

/**
 * @brief Groups partition the input and appear in first-seen order.
 */
void test_group_by_partition()
{
    auto records = people();
    auto groups = QueryOperations::group_by(records, "city");

    ASSERT_EQ(groups.size(), static_cast<size_t>(3));
    ASSERT_EQ(groups[0].first.as_string(), std::string("Lima"));
    ASSERT_EQ(groups[0].second.size(), static_cast<size_t>(2));
    ASSERT_EQ(groups[1].first.as_string(), std::string("Oslo"));
    // Null and missing share the null group.
    ASSERT_TRUE(groups[2].first.is_null());
    ASSERT_EQ(groups[2].second.size(), static_cast<size_t>(2));

    size_t total = 0;
    std::set<std::string> seen;
    for (const auto& group : groups) {
        total += group.second.size();
        for (const auto& r : group.second) {
            seen.insert(r.id);
        }
    }
    ASSERT_EQ(total, records.size());
    ASSERT_TRUE(seen == ids(records));

    // 30 and 30.0 land in the same group.
    auto by_age = QueryOperations::group_by(records, "age");
    ASSERT_EQ(by_age[0].second.size(), static_cast<size_t>(2));
}

void test_aggregate()
{
    auto records = people();

    ASSERT_EQ(QueryOperations::aggregate(records, "age", AggregateOp::COUNT).as_int(),
              static_cast<std::int64_t>(5));

    // 30 + 25 + 35 + 30.0: one float makes the sum a float.
    Value sum = QueryOperations::aggregate(records, "age", AggregateOp::SUM);
    ASSERT_TRUE(sum.is_float());
    ASSERT_EQ(sum.as_double(), 120.0);

    Value avg = QueryOperations::aggregate(records, "age", AggregateOp::AVG);
    ASSERT_EQ(avg.as_double(), 30.0);

    ASSERT_EQ(QueryOperations::aggregate(records, "age", AggregateOp::MIN).as_int(),
              static_cast<std::int64_t>(25));
    ASSERT_EQ(QueryOperations::aggregate(records, "age", AggregateOp::MAX).as_int(),
              static_cast<std::int64_t>(35));
    ASSERT_EQ(QueryOperations::aggregate(records, "name", AggregateOp::MAX).as_string(),
              std::string("Ed"));

    std::vector<Record> ints = {Record{"a", Object{{"n", 2}}}, Record{"b", Object{{"n", 3}}}};
    Value int_sum = QueryOperations::aggregate(ints, "n", AggregateOp::SUM);
    ASSERT_TRUE(int_sum.is_int());
    ASSERT_EQ(int_sum.as_int(), static_cast<std::int64_t>(5));

    std::vector<Record> huge = {
        Record{"a", Object{{"n", std::numeric_limits<std::int64_t>::max()}}},
        Record{"b", Object{{"n", 1}}}};
    ASSERT_TRUE(QueryOperations::aggregate(huge, "n", AggregateOp::SUM).is_float());

    ASSERT_TRUE(QueryOperations::aggregate(records, "missing", AggregateOp::SUM).is_null());
    ASSERT_TRUE(QueryOperations::aggregate({}, "age", AggregateOp::MAX).is_null());
}

/**
 * @brief Float sums and averages stay representable as JSON.
 */
void test_aggregate_float_overflow()
{
    std::vector<Record> huge{Record{"1", Object{{"v", 1.5e308}}}, Record{"2", Object{{"v", 1.5e308}}}};

    ASSERT_TRUE(QueryOperations::aggregate(huge, "v", AggregateOp::SUM).is_null());
    ASSERT_EQ(QueryOperations::aggregate(huge, "v", AggregateOp::AVG).as_double(), 1.5e308);

    std::vector<Record> mixed{Record{"1", Object{{"v", 1.5e308}}}, Record{"2", Object{{"v", -1.5e308}}}};
    ASSERT_EQ(QueryOperations::aggregate(mixed, "v", AggregateOp::AVG).as_double(), 0.0);
}

/**
 * @brief Sorting is stable and puts missing values last in both directions.
 */
void test_sort_and_limit()
{
    auto records = people();

    auto asc = QueryOperations::sort(records, "age", true);
    ASSERT_TRUE(ordered_ids(asc) == (std::vector<std::string>{"2", "1", "5", "3", "4"}));

    auto desc = QueryOperations::sort(records, "age", false);
    ASSERT_TRUE(ordered_ids(desc) == (std::vector<std::string>{"3", "1", "5", "2", "4"}));

    auto by_name = QueryOperations::sort(records, "name", false);
    ASSERT_EQ(by_name[0].id, std::string("5"));

    // Booleans before numbers before strings.
    std::vector<Record> mixed = {Record{"s", Object{{"v", "x"}}}, Record{"n", Object{{"v", 1}}},
                                 Record{"b", Object{{"v", true}}}};
    auto ranked = QueryOperations::sort(mixed, "v", true);
    ASSERT_TRUE(ordered_ids(ranked) == (std::vector<std::string>{"b", "n", "s"}));

    ASSERT_EQ(QueryOperations::limit(records, 2).size(), static_cast<size_t>(2));
    ASSERT_EQ(QueryOperations::limit(records, 10).size(), static_cast<size_t>(5));
    ASSERT_EQ(QueryOperations::limit(records, 2, 4).size(), static_cast<size_t>(1));
    ASSERT_EQ(QueryOperations::limit(records, 2, 4)[0].id, std::string("5"));
    ASSERT_TRUE(QueryOperations::limit(records, 2, 9).empty());
}

/**
 * @brief Inner joins emit one row per matching pair; left joins keep unmatched left rows.
 */
void test_joins()
{
    std::vector<Record> customers = {
        Record{"c1", Object{{"id", 1}, {"name", "Ana"}}},
        Record{"c2", Object{{"id", 2}, {"name", "Ben"}}},
        Record{"c3", Object{{"id", nullptr}, {"name", "Nil"}}},
    };
    std::vector<Record> orders = {
        Record{"o1", Object{{"customer_id", 1}, {"total", 10}}},
        Record{"o2", Object{{"customer_id", 1.0}, {"total", 20}}},
        Record{"o3", Object{{"customer_id", 9}, {"total", 30}}},
        Record{"o4", Object{{"customer_id", nullptr}, {"total", 40}}},
    };

    auto inner = JoinOperations::inner_join(customers, orders, "id", "customer_id");
    ASSERT_EQ(inner.size(), static_cast<size_t>(2));
    ASSERT_EQ(inner[0].get("name")->as_string(), std::string("Ana"));
    ASSERT_EQ(inner[0].get("total")->as_int(), static_cast<std::int64_t>(10));
    ASSERT_EQ(inner[1].get("total")->as_int(), static_cast<std::int64_t>(20));

    auto left = JoinOperations::left_join(customers, orders, "id", "customer_id");
    ASSERT_EQ(left.size(), static_cast<size_t>(4));
    ASSERT_EQ(left[2].get("name")->as_string(), std::string("Ben"));
    ASSERT_TRUE(left[2].get("total") == nullptr);
    // Null keys never match, even each other.
    ASSERT_EQ(left[3].get("name")->as_string(), std::string("Nil"));
    ASSERT_TRUE(left[3].get("total") == nullptr);

    auto prefixed = JoinOperations::join(naturaldb::query::JoinType::INNER, customers, orders, "id",
                                         "customer_id", "c_", "o_");
    ASSERT_EQ(prefixed[0].get("c_name")->as_string(), std::string("Ana"));
    ASSERT_EQ(prefixed[0].get("o_total")->as_int(), static_cast<std::int64_t>(10));
    ASSERT_TRUE(prefixed[0].get("name") == nullptr);

    // Without prefixes the right side wins on shared names.
    std::vector<Record> a = {Record{"a", Object{{"k", 1}, {"v", "left"}}}};
    std::vector<Record> b = {Record{"b", Object{{"k", 1}, {"v", "right"}}}};
    auto clash = JoinOperations::inner_join(a, b, "k", "k");
    ASSERT_EQ(clash[0].get("v")->as_string(), std::string("right"));
    ASSERT_EQ(clash[0].size(), static_cast<size_t>(2));
}

/**
 * @brief The builder chains without mutating earlier stages.
 */
void test_table_query_chain()
{
    naturaldb::query::TableQuery base(people());

    auto adults = base.where("age", 28, "gte").order_by("age", false);
    ASSERT_EQ(adults.count(), static_cast<size_t>(3));
    ASSERT_EQ(adults.first()->id, std::string("3"));
    ASSERT_EQ(adults.last()->id, std::string("5"));
    ASSERT_EQ(base.count(), static_cast<size_t>(5));

    auto page = base.order_by("name").skip(1).limit(2);
    ASSERT_EQ(page.count(), static_cast<size_t>(2));
    ASSERT_EQ(page.all()[0].id, std::string("2"));

    auto names = base.where("city", "Lima").select({"name"});
    ASSERT_EQ(names.size(), static_cast<size_t>(2));
    ASSERT_EQ(names[1].get("name")->as_string(), std::string("Cy"));

    ASSERT_EQ(base.to_dict()[1].get("name")->as_string(), std::string("Ben"));
    ASSERT_EQ(base.group_by("city").size(), static_cast<size_t>(3));
    ASSERT_TRUE(base.skip(10).execute().empty());
    ASSERT_FALSE(naturaldb::query::TableQuery().first().has_value());

    ASSERT_THROWS(base.where("age", 1, "around"), naturaldb::infra::InvalidArgumentError);
}
