#include <drain/runtime/aggregator.hpp>
#include <drain/runtime/csv.hpp>
#include <drain/runtime/ops.hpp>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <expected>
#include <limits>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace drain;

namespace {

auto col_i64(const runtime::Table& t, const std::string& name) -> std::vector<std::int64_t> {
    const auto* col = t.find(name);
    REQUIRE(col != nullptr);
    const auto* values = std::get_if<Column<std::int64_t>>(col);
    REQUIRE(values != nullptr);
    return {values->begin(), values->end()};
}

auto col_dbl(const runtime::Table& t, const std::string& name) -> std::vector<double> {
    const auto* col = t.find(name);
    REQUIRE(col != nullptr);
    const auto* values = std::get_if<Column<double>>(col);
    REQUIRE(values != nullptr);
    return {values->begin(), values->end()};
}

auto index_str(const runtime::Table& t, const std::string& name) -> std::vector<std::string> {
    const auto* entry = t.find_index(name);
    REQUIRE(entry != nullptr);
    const auto* values = std::get_if<Column<std::string>>(entry->column.get());
    REQUIRE(values != nullptr);
    return {values->begin(), values->end()};
}

auto make_events() -> runtime::Table {
    runtime::Table t;
    t.add_column("city", Column<std::string>{"b", "a", "b", "c", "a"});
    t.add_column("region", Column<std::string>{"n", "s", "n", "n", "n"});
    t.add_column("value", Column<std::int64_t>{1, 2, 3, 4, 5});
    t.add_column("score", Column<double>{1.0, 0.0, 2.0, 0.0, 4.0}, {true, false, true, false, true});
    return t;
}

auto aggregate(const runtime::Table& t, const runtime::Index& index,
               std::vector<runtime::AggSpec> aggs, std::string prefix = {})
    -> std::expected<runtime::Table, std::string> {
    runtime::Aggregator aggregator{std::make_shared<const runtime::Table>(t), std::move(aggs),
                                   std::move(prefix)};
    return aggregator.aggregate(index);
}

}  // namespace

TEST_CASE("Aggregator: groups in order of first appearance", "[runtime][aggregator]") {
    auto t = make_events();
    auto result = aggregate(t, ops::make_index("city"),
                            {ops::make_agg(runtime::AggFunc::Count, "", "n"),
                             ops::make_agg(runtime::AggFunc::Sum, "value", "total")});
    REQUIRE(result.has_value());

    REQUIRE(index_str(*result, "city") == std::vector<std::string>{"b", "a", "c"});
    REQUIRE(col_i64(*result, "n") == std::vector<std::int64_t>{2, 2, 1});
    REQUIRE(col_i64(*result, "total") == std::vector<std::int64_t>{4, 7, 4});
    REQUIRE(result->column_names() == std::vector<std::string>{"n", "total"});
}

TEST_CASE("Aggregator: min, max, first, last", "[runtime][aggregator]") {
    auto t = make_events();
    auto result = aggregate(t, ops::make_index("city"),
                            {ops::make_agg(runtime::AggFunc::Min, "value", "lo"),
                             ops::make_agg(runtime::AggFunc::Max, "value", "hi"),
                             ops::make_agg(runtime::AggFunc::First, "region", "first_region"),
                             ops::make_agg(runtime::AggFunc::Last, "value", "last_value")});
    REQUIRE(result.has_value());

    REQUIRE(col_i64(*result, "lo") == std::vector<std::int64_t>{1, 2, 4});
    REQUIRE(col_i64(*result, "hi") == std::vector<std::int64_t>{3, 5, 4});
    REQUIRE(col_i64(*result, "last_value") == std::vector<std::int64_t>{3, 5, 4});
    const auto* regions = std::get_if<Column<std::string>>(result->find("first_region"));
    REQUIRE(regions != nullptr);
    REQUIRE((*regions)[1] == "s");
}

TEST_CASE("Aggregator: nulls are skipped and empty groups are null", "[runtime][aggregator]") {
    auto t = make_events();
    auto result = aggregate(t, ops::make_index("city"),
                            {ops::make_agg(runtime::AggFunc::Mean, "score", "avg"),
                             ops::make_agg(runtime::AggFunc::Count, "score", "known"),
                             ops::make_agg(runtime::AggFunc::Sum, "score", "total")});
    REQUIRE(result.has_value());

    auto avg = col_dbl(*result, "avg");
    REQUIRE(avg[0] == Catch::Approx(1.5));
    REQUIRE(avg[1] == Catch::Approx(4.0));
    const auto* avg_entry = result->find_entry("avg");
    REQUIRE(avg_entry->validity.has_value());
    REQUIRE(*avg_entry->validity == std::vector<bool>{true, true, false});

    REQUIRE(col_i64(*result, "known") == std::vector<std::int64_t>{2, 1, 0});
    REQUIRE(col_dbl(*result, "total") == std::vector<double>{3.0, 4.0, 0.0});
    REQUIRE_FALSE(result->find_entry("total")->validity.has_value());
}

TEST_CASE("Aggregator: compound index", "[runtime][aggregator]") {
    auto t = make_events();
    auto result = aggregate(t, ops::make_index("place", {"region", "city"}),
                            {ops::make_agg(runtime::AggFunc::Count, "")});
    REQUIRE(result.has_value());

    REQUIRE(index_str(*result, "region") == std::vector<std::string>{"n", "s", "n", "n"});
    REQUIRE(index_str(*result, "city") == std::vector<std::string>{"b", "a", "c", "a"});
    REQUIRE(col_i64(*result, "count") == std::vector<std::int64_t>{2, 1, 1, 1});
}

TEST_CASE("Aggregator: rows with a null key are dropped", "[runtime][aggregator]") {
    runtime::Table t;
    t.add_column("zone", Column<std::int64_t>{1, 2, 1}, {true, false, true});
    auto result = aggregate(t, ops::make_index("zone"), {ops::make_agg(runtime::AggFunc::Count, "")});
    REQUIRE(result.has_value());
    REQUIRE(result->rows() == 1);
    REQUIRE(col_i64(*result, "count") == std::vector<std::int64_t>{2});
}

TEST_CASE("Aggregator: NaN is treated as null", "[runtime][aggregator]") {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    runtime::Table t;
    std::vector<double> keys;
    std::vector<double> values;
    for (int i = 0; i < 1000; ++i) {
        keys.push_back(nan);
        values.push_back(1.0);
    }
    keys.push_back(2.5);
    values.push_back(nan);
    keys.push_back(2.5);
    values.push_back(4.0);
    t.add_column("k", Column<double>{std::move(keys)});
    t.add_column("v", Column<double>{std::move(values)});

    auto result = aggregate(t, ops::make_index("k"),
                            {ops::make_agg(runtime::AggFunc::Count, "", "rows"),
                             ops::make_agg(runtime::AggFunc::Count, "v", "known"),
                             ops::make_agg(runtime::AggFunc::Sum, "v", "total"),
                             ops::make_agg(runtime::AggFunc::Mean, "v", "avg"),
                             ops::make_agg(runtime::AggFunc::Min, "v", "lo")});
    REQUIRE(result.has_value());
    REQUIRE(result->rows() == 1);
    REQUIRE(col_i64(*result, "rows") == std::vector<std::int64_t>{2});
    REQUIRE(col_i64(*result, "known") == std::vector<std::int64_t>{1});
    REQUIRE(col_dbl(*result, "total") == std::vector<double>{4.0});
    REQUIRE(col_dbl(*result, "avg") == std::vector<double>{4.0});
    REQUIRE(col_dbl(*result, "lo") == std::vector<double>{4.0});
}

TEST_CASE("Aggregator: NaN keys read from csv", "[runtime][aggregator]") {
    auto t = runtime::parse_csv_simple("k,v\nnan,1\nNaN,2\n1.5,3\n");
    REQUIRE(t.has_value());
    REQUIRE(std::holds_alternative<Column<double>>(*t->find("k")));
    auto result = aggregate(*t, ops::make_index("k"), {ops::make_agg(runtime::AggFunc::Sum, "v")});
    REQUIRE(result.has_value());
    REQUIRE(col_i64(*result, "sum_v") == std::vector<std::int64_t>{3});
}

TEST_CASE("Aggregator: prefix and default names", "[runtime][aggregator]") {
    auto t = make_events();
    auto result = aggregate(t, ops::make_index("city"),
                            {ops::make_agg(runtime::AggFunc::Sum, "value"),
                             ops::make_agg(runtime::AggFunc::Count, "", "n")},
                            "events");
    REQUIRE(result.has_value());
    REQUIRE(result->column_names() == std::vector<std::string>{"events_sum_value", "events_n"});
}

TEST_CASE("Aggregator: empty source yields an empty result", "[runtime][aggregator]") {
    runtime::Table t;
    t.add_column("city", Column<std::string>{});
    t.add_column("value", Column<std::int64_t>{});
    auto result = aggregate(t, ops::make_index("city"),
                            {ops::make_agg(runtime::AggFunc::Mean, "value", "avg")});
    REQUIRE(result.has_value());
    REQUIRE(result->rows() == 0);
    REQUIRE(result->find("avg") != nullptr);
}

TEST_CASE("Aggregator: errors", "[runtime][aggregator]") {
    auto t = make_events();

    SECTION("missing key column") {
        auto result = aggregate(t, ops::make_index("zip"), {});
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().find("key column not found: zip") != std::string::npos);
    }

    SECTION("missing aggregate column") {
        auto result = aggregate(t, ops::make_index("city"),
                                {ops::make_agg(runtime::AggFunc::Sum, "price")});
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().find("aggregate column not found: price") != std::string::npos);
    }

    SECTION("mean of a string column") {
        auto result = aggregate(t, ops::make_index("city"),
                                {ops::make_agg(runtime::AggFunc::Mean, "region")});
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().find("numeric") != std::string::npos);
    }

    SECTION("ops wrapper throws") {
        REQUIRE_THROWS_AS(ops::aggregate(t, ops::make_index("zip"), {}), std::runtime_error);
    }
}
