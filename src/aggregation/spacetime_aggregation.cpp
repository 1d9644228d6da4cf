#include <drain/aggregation/spacetime_aggregation.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <set>

namespace drain::aggregation {

namespace {

auto date_column_of(const runtime::Table& table, const std::string& name, const char* role)
    -> std::expected<const runtime::ColumnEntry*, std::string> {
    const auto* entry = table.find_entry(name);
    if (entry == nullptr) {
        return std::unexpected(fmt::format("{} column not found: {}", role, name));
    }
    if (!std::holds_alternative<Column<Date>>(*entry->column)) {
        return std::unexpected(fmt::format("{} column '{}' is not a date column", role, name));
    }
    return entry;
}

}  // namespace

auto select_window(const runtime::Table& source, const std::string& date_column,
                   const std::map<std::string, std::string>& censor_columns, Date end,
                   const Delta& delta) -> std::expected<runtime::Table, std::string> {
    auto date_entry = date_column_of(source, date_column, "date");
    if (!date_entry) {
        return std::unexpected(date_entry.error());
    }
    const auto& dates = std::get<Column<Date>>(*(*date_entry)->column);
    const Date start = delta.window_start(end);

    std::vector<std::size_t> rows;
    for (std::size_t row = 0; row < dates.size(); ++row) {
        if (runtime::is_null(**date_entry, row)) {
            continue;
        }
        const Date d = dates[row];
        if (d < end && (!delta.bounded() || d >= start)) {
            rows.push_back(row);
        }
    }
    auto window = runtime::take_rows(source, rows);

    for (const auto& [value_column, censor_date_column] : censor_columns) {
        auto censor_entry = date_column_of(window, censor_date_column, "censor date");
        if (!censor_entry) {
            return std::unexpected(censor_entry.error());
        }
        if (window.find_entry(value_column) == nullptr) {
            return std::unexpected(fmt::format("censored column not found: {}", value_column));
        }
        const auto& censor_dates = std::get<Column<Date>>(*(*censor_entry)->column);
        const auto* censor_validity = &(*censor_entry)->validity;

        auto& entry = window.columns[window.positions.at(value_column)];
        std::vector<bool> validity =
            entry.validity.value_or(std::vector<bool>(window.rows(), true));
        for (std::size_t row = 0; row < censor_dates.size(); ++row) {
            bool known = !censor_validity->has_value() || (**censor_validity)[row];
            if (known && censor_dates[row] >= end) {
                validity[row] = false;
            }
        }
        entry.validity = std::move(validity);
    }
    return window;
}

SpacetimeAggregation::SpacetimeAggregation(PrivateTag /*tag*/, SpacetimeAggregationConfig config,
                                           AggregationOptions options)
    : Aggregation(config.inputs, std::move(options)), config_(std::move(config)) {}

auto SpacetimeAggregation::create(SpacetimeAggregationConfig config, AggregationOptions options)
    -> std::expected<std::unique_ptr<SpacetimeAggregation>, std::string> {
    if (config.date_column.empty()) {
        return std::unexpected("spacetime aggregation requires a date column");
    }
    IndexMap index_map;
    for (const auto& spacedelta : config.spacedeltas) {
        const auto& index = spacedelta.index;
        if (index.name.empty()) {
            return std::unexpected("spacedelta index name must not be empty");
        }
        if (index.columns.empty()) {
            return std::unexpected(fmt::format("index '{}' has no key columns", index.name));
        }
        if (!index_map.emplace(index.name, index).second) {
            return std::unexpected(fmt::format("duplicate spacedelta '{}'", index.name));
        }
    }

    std::set<Date> dates;
    for (const auto& date : config.dates) {
        if (!dates.insert(date).second) {
            return std::unexpected(fmt::format("duplicate date '{}'", format_date(date)));
        }
    }

    auto aggregation =
        std::make_unique<SpacetimeAggregation>(PrivateTag{}, std::move(config), std::move(options));
    aggregation->index_map_ = std::move(index_map);
    if (auto status = aggregation->initialize(); !status) {
        return std::unexpected(status.error());
    }
    return aggregation;
}

auto SpacetimeAggregation::arguments() const -> std::vector<Argument> {
    std::vector<Argument> out;
    for (const auto& date : config_.dates) {
        for (const auto& spacedelta : config_.spacedeltas) {
            for (const auto& delta : spacedelta.deltas) {
                out.push_back(Argument{.index = spacedelta.index.name, .date = date, .delta = delta});
            }
        }
    }
    return out;
}

auto SpacetimeAggregation::argument_names() const -> std::vector<std::string_view> {
    return {kDateArg, kDeltaArg, kIndexArg};
}

auto SpacetimeAggregation::parallel_kwargs() const -> std::vector<Overrides> {
    std::vector<Overrides> out;
    out.reserve(config_.dates.size());
    for (const auto& date : config_.dates) {
        out.push_back(Overrides{.spacedeltas = config_.spacedeltas, .dates = {date}});
    }
    return out;
}

auto SpacetimeAggregation::clone_with(Overrides overrides) const
    -> std::expected<std::unique_ptr<SpacetimeAggregation>, std::string> {
    SpacetimeAggregationConfig config = config_;
    config.spacedeltas = std::move(overrides.spacedeltas);
    config.dates = std::move(overrides.dates);
    return create(std::move(config), child_options());
}

auto SpacetimeAggregation::decompose() const -> std::expected<std::vector<Child>, std::string> {
    std::vector<Child> children;
    for (auto& overrides : parallel_kwargs()) {
        auto key = format_date(overrides.dates.front());
        auto child = clone_with(std::move(overrides));
        if (!child) {
            return std::unexpected(child.error());
        }
        children.push_back(Child{.key = std::move(key), .aggregation = std::move(*child)});
    }
    return children;
}

auto SpacetimeAggregation::aggregator_key(const Argument& argument) const -> std::string {
    // The window depends on date and delta only; every index reuses it.
    return fmt::format("{}/{}", format_date(*argument.date), argument.delta->label);
}

auto SpacetimeAggregation::make_aggregator(const Argument& argument) const
    -> std::expected<AggregatorPtr, std::string> {
    const auto& source = inputs().front()->get_result();
    auto window =
        select_window(source, config_.date_column, config_.censor_columns, *argument.date,
                      *argument.delta);
    if (!window) {
        return std::unexpected(window.error());
    }
    spdlog::debug("spacetime aggregation: window {} ending {} selects {} of {} rows",
                  argument.delta->label, format_date(*argument.date), window->rows(),
                  source.rows());
    return std::make_shared<const runtime::Aggregator>(
        std::make_shared<const runtime::Table>(std::move(*window)), config_.aggregates,
        options().prefix);
}

}  // namespace drain::aggregation
