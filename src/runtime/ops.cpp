#include <drain/runtime/ops.hpp>

#include <stdexcept>

namespace drain::ops {

namespace {

template <typename T>
auto unwrap(std::expected<T, std::string> result) -> T {
    if (!result) {
        throw std::runtime_error(result.error());
    }
    return std::move(*result);
}

}  // namespace

auto aggregate(const runtime::Table& t, const runtime::Index& index,
               const std::vector<runtime::AggSpec>& aggs) -> runtime::Table {
    // The aggregator shares its source; wrap a non-owning pointer since `t`
    // outlives this call.
    runtime::Aggregator aggregator{std::shared_ptr<const runtime::Table>(&t, [](auto*) {}), aggs};
    return unwrap(aggregator.aggregate(index));
}

auto execute(const aggregation::Aggregation& aggregation) -> aggregation::Result {
    return unwrap(aggregation::execute(aggregation));
}

auto execute_collect(const aggregation::Aggregation& aggregation)
    -> std::map<std::string, runtime::Table> {
    return unwrap(aggregation::collect(ops::execute(aggregation)));
}

auto make_agg(runtime::AggFunc func, std::string col_name, std::string alias) -> runtime::AggSpec {
    return runtime::AggSpec{.func = func, .column = std::move(col_name), .alias = std::move(alias)};
}

auto make_index(std::string name, std::vector<std::string> columns) -> runtime::Index {
    if (columns.empty()) {
        columns.push_back(name);
    }
    return runtime::Index{.name = std::move(name), .columns = std::move(columns)};
}

auto date(std::string_view text) -> Date {
    return unwrap(parse_date(text));
}

auto deltas(const std::vector<std::string>& labels) -> std::vector<Delta> {
    std::vector<Delta> out;
    out.reserve(labels.size());
    for (const auto& label : labels) {
        out.push_back(unwrap(parse_delta(label)));
    }
    return out;
}

}  // namespace drain::ops
