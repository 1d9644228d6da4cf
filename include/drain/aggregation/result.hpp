#pragma once

#include <drain/runtime/table.hpp>

#include <cstdint>
#include <expected>
#include <map>
#include <string>
#include <vector>

namespace drain::aggregation {

enum class ResultKind : std::uint8_t {
    /// One table per argument, in argument order.
    Disjoint,
    /// One concatenated table per index name.
    Concat,
    /// One result per child, in child order.
    ParallelDisjoint,
    /// Child results keyed by the child's partition key.
    ParallelConcat,
};

/// Output of one aggregation run. Which members are populated depends on `kind`.
struct Result {
    ResultKind kind = ResultKind::Disjoint;
    runtime::TableList tables;
    std::map<std::string, runtime::Table> by_index;
    std::vector<std::string> child_keys;
    std::vector<Result> children;

    [[nodiscard]] static auto disjoint(runtime::TableList tables) -> Result;
    [[nodiscard]] static auto concat(std::map<std::string, runtime::Table> by_index) -> Result;
    [[nodiscard]] static auto parallel(bool concat, std::vector<std::string> keys,
                                       std::vector<Result> children) -> Result;

    /// Child result for partition `key` of a ParallelConcat result, or nullptr.
    [[nodiscard]] auto child(const std::string& key) const -> const Result*;
};

/// Flatten a concat-shaped result into one table per index name.
///
/// Concat results are returned as-is; parallel results are flattened
/// recursively, concatenating tables of the same index name in child order.
/// Disjoint leaves carry no index names and are rejected.
[[nodiscard]] auto collect(const Result& result)
    -> std::expected<std::map<std::string, runtime::Table>, std::string>;

[[nodiscard]] auto results_equal(const Result& lhs, const Result& rhs) -> bool;

}  // namespace drain::aggregation
