#pragma once

#include <drain/aggregation/aggregation.hpp>
#include <drain/runtime/aggregator.hpp>
#include <drain/runtime/table.hpp>

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace drain::ops {

// ─── Convenience wrappers ─────────────────────────────────────────────────────
//  Same semantics as the expected-returning runtime and aggregation entry
//  points, but a failure throws std::runtime_error carrying the message.

[[nodiscard]] auto aggregate(const runtime::Table& t, const runtime::Index& index,
                             const std::vector<runtime::AggSpec>& aggs) -> runtime::Table;

[[nodiscard]] auto execute(const aggregation::Aggregation& aggregation) -> aggregation::Result;

/// Execute and flatten into one table per index name.
[[nodiscard]] auto execute_collect(const aggregation::Aggregation& aggregation)
    -> std::map<std::string, runtime::Table>;

// ─── Builders ─────────────────────────────────────────────────────────────────

[[nodiscard]] auto make_agg(runtime::AggFunc func, std::string col_name, std::string alias = {})
    -> runtime::AggSpec;

[[nodiscard]] auto make_index(std::string name, std::vector<std::string> columns = {})
    -> runtime::Index;

[[nodiscard]] auto date(std::string_view text) -> Date;

[[nodiscard]] auto deltas(const std::vector<std::string>& labels) -> std::vector<Delta>;

}  // namespace drain::ops
