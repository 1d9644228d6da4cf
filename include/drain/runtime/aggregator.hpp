#pragma once

#include <drain/runtime/table.hpp>

#include <cstdint>
#include <expected>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace drain::runtime {

/// Supported aggregation functions.
enum class AggFunc : std::uint8_t {
    Sum,
    Mean,
    Min,
    Max,
    Count,
    First,
    Last,
};

[[nodiscard]] auto agg_func_name(AggFunc func) noexcept -> std::string_view;

/// Aggregation specification: apply function to column, store as alias.
///
/// `count` with an empty column counts rows; with a column it counts the
/// non-null values of that column. An empty alias becomes `<func>_<column>`.
struct AggSpec {
    AggFunc func = AggFunc::Sum;
    std::string column;
    std::string alias;
};

/// A named grouping key over one or more columns of the source table.
struct Index {
    std::string name;
    std::vector<std::string> columns;
};

/// Computes grouped statistics of one source table.
///
/// The source is shared and never mutated, so one Aggregator can serve many
/// indexes. Groups are emitted in order of first appearance; rows whose key
/// has a null component are dropped. NaN in a double column counts as null.
/// The result's row index holds the key columns, its data columns hold one
/// entry per AggSpec.
class Aggregator {
   public:
    Aggregator(std::shared_ptr<const Table> source, std::vector<AggSpec> aggregates,
               std::string prefix = {});

    [[nodiscard]] auto aggregate(const Index& index) const -> std::expected<Table, std::string>;

    /// Output column name for `spec`, prefix applied.
    [[nodiscard]] auto output_name(const AggSpec& spec) const -> std::string;

   private:
    std::shared_ptr<const Table> source_;
    std::vector<AggSpec> aggregates_;
    std::string prefix_;
};

}  // namespace drain::runtime
