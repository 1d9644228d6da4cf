#include <drain/aggregation/simple_aggregation.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>

namespace drain::aggregation {

auto indexes_from_names(const std::vector<std::string>& names) -> std::vector<runtime::Index> {
    std::vector<runtime::Index> out;
    out.reserve(names.size());
    for (const auto& name : names) {
        out.push_back(runtime::Index{.name = name, .columns = {name}});
    }
    return out;
}

SimpleAggregation::SimpleAggregation(PrivateTag /*tag*/, SimpleAggregationConfig config,
                                     AggregationOptions options)
    : Aggregation(config.inputs, std::move(options)), config_(std::move(config)) {}

auto SimpleAggregation::create(SimpleAggregationConfig config, AggregationOptions options)
    -> std::expected<std::unique_ptr<SimpleAggregation>, std::string> {
    IndexMap index_map;
    for (const auto& index : config.indexes) {
        if (index.name.empty()) {
            return std::unexpected("index name must not be empty");
        }
        if (index.columns.empty()) {
            return std::unexpected(fmt::format("index '{}' has no key columns", index.name));
        }
        if (!index_map.emplace(index.name, index).second) {
            return std::unexpected(fmt::format("duplicate index '{}'", index.name));
        }
    }

    auto aggregation =
        std::make_unique<SimpleAggregation>(PrivateTag{}, std::move(config), std::move(options));
    aggregation->index_map_ = std::move(index_map);
    if (auto status = aggregation->initialize(); !status) {
        return std::unexpected(status.error());
    }
    return aggregation;
}

auto SimpleAggregation::arguments() const -> std::vector<Argument> {
    std::vector<Argument> out;
    out.reserve(config_.indexes.size());
    for (const auto& index : config_.indexes) {
        out.push_back(Argument{.index = index.name, .date = std::nullopt, .delta = std::nullopt});
    }
    return out;
}

auto SimpleAggregation::argument_names() const -> std::vector<std::string_view> {
    return {kIndexArg};
}

auto SimpleAggregation::parallel_kwargs() const -> std::vector<Overrides> {
    std::vector<Overrides> out;
    out.reserve(config_.indexes.size());
    for (const auto& index : config_.indexes) {
        out.push_back(Overrides{.indexes = {index.name}});
    }
    return out;
}

auto SimpleAggregation::clone_with(const Overrides& overrides) const
    -> std::expected<std::unique_ptr<SimpleAggregation>, std::string> {
    SimpleAggregationConfig config = config_;
    config.indexes.clear();
    for (const auto& name : overrides.indexes) {
        auto it = index_map_.find(name);
        if (it == index_map_.end()) {
            return std::unexpected(fmt::format("cannot restrict to unknown index '{}'", name));
        }
        config.indexes.push_back(it->second);
    }
    return create(std::move(config), child_options());
}

auto SimpleAggregation::decompose() const -> std::expected<std::vector<Child>, std::string> {
    std::vector<Child> children;
    for (const auto& overrides : parallel_kwargs()) {
        auto child = clone_with(overrides);
        if (!child) {
            return std::unexpected(child.error());
        }
        children.push_back(Child{.key = overrides.indexes.front(), .aggregation = std::move(*child)});
    }
    return children;
}

auto SimpleAggregation::aggregator_key(const Argument& /*argument*/) const -> std::string {
    // The aggregates do not depend on the index.
    return {};
}

auto SimpleAggregation::make_aggregator(const Argument& /*argument*/) const
    -> std::expected<AggregatorPtr, std::string> {
    const StepPtr& input = inputs().front();
    // Alias the step's table so the step stays alive as long as the aggregator.
    std::shared_ptr<const runtime::Table> source{input, &input->get_result()};
    spdlog::debug("simple aggregation: source has {} rows", source->rows());
    return std::make_shared<const runtime::Aggregator>(std::move(source), config_.aggregates,
                                                       options().prefix);
}

}  // namespace drain::aggregation
