#pragma once
// gen_event_data: synthetic event table for aggregation benchmarks.
//
// Columns: date (Date), city (String), region (String), value (Double),
// resolved (Date, null for open events).

#include <drain/core/column.hpp>
#include <drain/core/time.hpp>
#include <drain/runtime/table.hpp>

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

inline auto gen_event_data(std::int64_t n, drain::Date first, std::int32_t days,
                           std::int64_t cities) -> drain::runtime::Table {
    if (n < 0 || days <= 0 || cities <= 0)
        throw std::invalid_argument("gen_event_data: n must be non-negative, days and cities positive");
    auto rows = static_cast<std::size_t>(n);

    drain::Column<drain::Date> date_col;
    drain::Column<std::string> city_col;
    drain::Column<std::string> region_col;
    drain::Column<double> value_col;
    drain::Column<drain::Date> resolved_col;
    std::vector<bool> resolved_valid;
    date_col.reserve(rows);
    city_col.reserve(rows);
    region_col.reserve(rows);
    value_col.reserve(rows);
    resolved_col.reserve(rows);
    resolved_valid.reserve(rows);

    for (std::size_t i = 0; i < rows; ++i) {
        auto day = static_cast<std::int32_t>(i % static_cast<std::size_t>(days));
        auto city = static_cast<std::int64_t>((i * 7) % static_cast<std::size_t>(cities));
        date_col.push_back(drain::Date{first.days + day});
        city_col.push_back("city_" + std::to_string(city));
        region_col.push_back("region_" + std::to_string(city % 4));
        value_col.push_back(static_cast<double>(i % 100));
        resolved_col.push_back(drain::Date{first.days + day + static_cast<std::int32_t>(i % 30)});
        resolved_valid.push_back(i % 5 != 0);
    }

    drain::runtime::Table t;
    t.add_column("date", std::move(date_col));
    t.add_column("city", std::move(city_col));
    t.add_column("region", std::move(region_col));
    t.add_column("value", std::move(value_col));
    t.add_column("resolved", std::move(resolved_col), std::move(resolved_valid));
    return t;
}
