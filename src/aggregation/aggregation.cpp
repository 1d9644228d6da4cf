#include <drain/aggregation/aggregation.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>

namespace drain::aggregation {

namespace {

auto join_names(const std::vector<std::string_view>& names) -> std::string {
    std::string out;
    for (std::size_t i = 0; i < names.size(); ++i) {
        if (i > 0) {
            out.append(", ");
        }
        out.append(names[i]);
    }
    return out;
}

auto format_indexes(const IndexMap& indexes) -> std::string {
    if (indexes.empty()) {
        return "<none>";
    }
    std::vector<std::string_view> names;
    names.reserve(indexes.size());
    for (const auto& entry : indexes) {
        names.emplace_back(entry.first);
    }
    return join_names(names);
}

}  // namespace

Aggregation::Aggregation(std::vector<StepPtr> inputs, AggregationOptions options)
    : inputs_(std::move(inputs)), options_(std::move(options)) {}

auto Aggregation::inserts(std::string_view name) const -> bool {
    return std::ranges::find(options_.insert_args, name) != options_.insert_args.end();
}

auto Aggregation::child_options() const -> AggregationOptions {
    AggregationOptions options = options_;
    options.parallel = false;
    return options;
}

auto Aggregation::initialize() -> std::expected<void, std::string> {
    if (inputs_.empty()) {
        return std::unexpected("aggregation requires at least one input");
    }
    for (const auto& input : inputs_) {
        if (input == nullptr) {
            return std::unexpected("aggregation input is null");
        }
    }

    auto names = argument_names();
    for (const auto& arg : options_.insert_args) {
        if (std::ranges::find(names, std::string_view{arg}) == names.end()) {
            return std::unexpected(fmt::format("unknown insert arg '{}' (expected one of: {})", arg,
                                               join_names(names)));
        }
    }

    if (!options_.parallel) {
        return {};
    }

    auto children = decompose();
    if (!children) {
        return std::unexpected(children.error());
    }
    children_ = std::move(*children);
    spdlog::debug("aggregation: decomposed into {} parallel children", children_.size());
    return {};
}

auto Aggregation::get_aggregator(const Argument& argument, AggregatorCache& cache) const
    -> std::expected<AggregatorPtr, std::string> {
    auto key = aggregator_key(argument);
    if (auto it = cache.find(key); it != cache.end()) {
        return it->second;
    }
    auto aggregator = make_aggregator(argument);
    if (!aggregator) {
        return std::unexpected(aggregator.error());
    }
    spdlog::debug("aggregation: built aggregator for key '{}'", key);
    cache.emplace(std::move(key), *aggregator);
    return *aggregator;
}

auto Aggregation::run(std::vector<Result> child_results) const
    -> std::expected<Result, std::string> {
    if (options_.parallel) {
        if (child_results.size() != children_.size()) {
            return std::unexpected(fmt::format("parallel aggregation expected {} child results, got {}",
                                               children_.size(), child_results.size()));
        }
        std::vector<std::string> keys;
        keys.reserve(children_.size());
        for (const auto& child : children_) {
            keys.push_back(child.key);
        }
        return Result::parallel(options_.concat, std::move(keys), std::move(child_results));
    }

    auto args = arguments();
    spdlog::debug("aggregation: running {} arguments", args.size());

    const auto& index_map = indexes();
    AggregatorCache cache;
    runtime::TableList tables;
    tables.reserve(args.size());
    for (const auto& argument : args) {
        auto index = index_map.find(argument.index);
        if (index == index_map.end()) {
            return std::unexpected(fmt::format("index not found: {} (available: {})",
                                               argument.index, format_indexes(index_map)));
        }
        auto aggregator = get_aggregator(argument, cache);
        if (!aggregator) {
            return std::unexpected(aggregator.error());
        }
        auto table = (*aggregator)->aggregate(index->second);
        if (!table) {
            return std::unexpected(table.error());
        }
        for (auto name : argument.names()) {
            if (inserts(name)) {
                table->set_literal(std::string(name), *argument.value(name));
            }
        }
        tables.push_back(std::move(*table));
    }
    spdlog::debug("aggregation: {} tables from {} aggregators", tables.size(), cache.size());

    return assemble(args, std::move(tables));
}

auto Aggregation::assemble(const std::vector<Argument>& arguments, runtime::TableList tables) const
    -> std::expected<Result, std::string> {
    if (!options_.concat) {
        return Result::disjoint(std::move(tables));
    }

    std::map<std::string, std::vector<const runtime::Table*>> to_concat;
    for (std::size_t i = 0; i < arguments.size(); ++i) {
        to_concat[arguments[i].index].push_back(&tables[i]);
    }

    std::map<std::string, runtime::Table> by_index;
    for (const auto& [name, parts] : to_concat) {
        auto combined = runtime::concat_tables(parts);
        if (!combined) {
            return std::unexpected(combined.error());
        }
        by_index.emplace(name, std::move(*combined));
    }
    return Result::concat(std::move(by_index));
}

auto execute(const Aggregation& aggregation) -> std::expected<Result, std::string> {
    std::vector<Result> child_results;
    child_results.reserve(aggregation.children().size());
    for (const auto& child : aggregation.children()) {
        auto result = execute(*child.aggregation);
        if (!result) {
            return std::unexpected(result.error());
        }
        child_results.push_back(std::move(*result));
    }
    return aggregation.run(std::move(child_results));
}

}  // namespace drain::aggregation
