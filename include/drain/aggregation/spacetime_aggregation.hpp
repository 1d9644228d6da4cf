#pragma once

#include <drain/aggregation/aggregation.hpp>
#include <drain/core/time.hpp>

#include <expected>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace drain::aggregation {

/// A spatial index paired with the time windows to aggregate it over.
/// The index name is the argument's `index` value.
struct Spacedelta {
    runtime::Index index;
    std::vector<Delta> deltas;
};

struct SpacetimeAggregationConfig {
    std::vector<StepPtr> inputs;
    /// Aggregated in this order; index names must be unique.
    std::vector<Spacedelta> spacedeltas;
    /// End dates (exclusive) of the aggregation windows.
    std::vector<Date> dates;
    /// Date column of the first input that places each row in time.
    std::string date_column;
    /// Value column -> date column. A value whose date is on or after the end
    /// date is unknown at that date and treated as null.
    std::map<std::string, std::string> censor_columns;
    std::vector<runtime::AggSpec> aggregates;
};

/// Aggregation over space and time.
///
/// Every date is combined with every (index, delta) pair of every spacedelta;
/// index and deltas are assumed independent of the date. For a (date, delta)
/// the aggregator sees the rows with `date - delta <= date_column < date`, so
/// one aggregator is built per (date, delta) and shared by all indexes.
class SpacetimeAggregation final : public Aggregation {
   public:
    /// Parameters a parallel child overrides.
    struct Overrides {
        std::vector<Spacedelta> spacedeltas;
        std::vector<Date> dates;
    };

   private:
    // Restricts construction to `create`.
    struct PrivateTag {
        explicit PrivateTag() = default;
    };

   public:
    SpacetimeAggregation(PrivateTag tag, SpacetimeAggregationConfig config,
                         AggregationOptions options);

    [[nodiscard]] static auto create(SpacetimeAggregationConfig config,
                                     AggregationOptions options = {})
        -> std::expected<std::unique_ptr<SpacetimeAggregation>, std::string>;

    [[nodiscard]] auto arguments() const -> std::vector<Argument> override;
    [[nodiscard]] auto argument_names() const -> std::vector<std::string_view> override;
    [[nodiscard]] auto indexes() const -> const IndexMap& override { return index_map_; }

    /// One override per date, each with every spacedelta.
    [[nodiscard]] auto parallel_kwargs() const -> std::vector<Overrides>;

    [[nodiscard]] auto clone_with(Overrides overrides) const
        -> std::expected<std::unique_ptr<SpacetimeAggregation>, std::string>;

   protected:
    [[nodiscard]] auto decompose() const -> std::expected<std::vector<Child>, std::string> override;
    [[nodiscard]] auto aggregator_key(const Argument& argument) const -> std::string override;
    [[nodiscard]] auto make_aggregator(const Argument& argument) const
        -> std::expected<AggregatorPtr, std::string> override;

   private:

    SpacetimeAggregationConfig config_;
    IndexMap index_map_;
};

/// Rows of `source` inside the window of `delta` ending at `end`, with
/// censored values nulled. Exposed for testing.
[[nodiscard]] auto select_window(const runtime::Table& source, const std::string& date_column,
                                 const std::map<std::string, std::string>& censor_columns,
                                 Date end, const Delta& delta)
    -> std::expected<runtime::Table, std::string>;

}  // namespace drain::aggregation
