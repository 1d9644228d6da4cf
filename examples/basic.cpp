#include <drain/drain.hpp>

#include <fmt/core.h>

auto main() -> int {
    using namespace drain;

    // A small event table: where and when something happened.
    runtime::Table events;
    events.add_column("city", Column<std::string>{"boston", "boston", "austin", "austin", "boston"});
    events.add_column("region", Column<std::string>{"east", "east", "south", "south", "east"});
    events.add_column("date", Column<Date>{ops::date("2019-03-01"), ops::date("2019-11-15"),
                                           ops::date("2019-12-20"), ops::date("2018-06-01"),
                                           ops::date("2020-02-01")});
    events.add_column("value", Column<double>{1.0, 2.0, 3.0, 4.0, 5.0});
    auto input = aggregation::make_table_step(std::move(events));

    std::vector<runtime::AggSpec> aggregates = {
        ops::make_agg(runtime::AggFunc::Count, "", "n"),
        ops::make_agg(runtime::AggFunc::Sum, "value", "total"),
    };

    fmt::print("=== Simple aggregation ===\n");
    auto simple = aggregation::SimpleAggregation::create(
        {.inputs = {input},
         .indexes = aggregation::indexes_from_names({"city", "region"}),
         .aggregates = aggregates});
    if (!simple) {
        fmt::print("error: {}\n", simple.error());
        return 1;
    }
    for (const auto& [name, table] : ops::execute_collect(**simple)) {
        fmt::print("-- {}\n", name);
        runtime::print(table);
    }

    fmt::print("\n=== Spacetime aggregation ===\n");
    auto spacetime = aggregation::SpacetimeAggregation::create(
        {.inputs = {input},
         .spacedeltas = {{.index = ops::make_index("city"), .deltas = ops::deltas({"1y", "all"})}},
         .dates = {ops::date("2020-01-01")},
         .date_column = "date",
         .censor_columns = {},
         .aggregates = aggregates},
        {.parallel = true, .insert_args = {"date", "delta"}});
    if (!spacetime) {
        fmt::print("error: {}\n", spacetime.error());
        return 1;
    }
    fmt::print("{} arguments in {} children\n", (*spacetime)->arguments().size(),
               (*spacetime)->children().size());
    for (const auto& [name, table] : ops::execute_collect(**spacetime)) {
        fmt::print("-- {}\n", name);
        runtime::print(table);
    }

    return 0;
}
