#pragma once

#include <drain/aggregation/aggregation.hpp>

#include <expected>
#include <memory>
#include <string>
#include <vector>

namespace drain::aggregation {

struct SimpleAggregationConfig {
    std::vector<StepPtr> inputs;
    /// Aggregated in this order; names must be unique.
    std::vector<runtime::Index> indexes;
    std::vector<runtime::AggSpec> aggregates;
};

/// Index list from bare column names: each name becomes an index grouping on
/// the column of the same name.
[[nodiscard]] auto indexes_from_names(const std::vector<std::string>& names)
    -> std::vector<runtime::Index>;

/// Aggregates the first input once per index. The only argument is the index,
/// so a single Aggregator serves the whole run.
class SimpleAggregation final : public Aggregation {
   public:
    /// Parameters a parallel child overrides.
    struct Overrides {
        std::vector<std::string> indexes;
    };

   private:
    // Restricts construction to `create`.
    struct PrivateTag {
        explicit PrivateTag() = default;
    };

   public:
    SimpleAggregation(PrivateTag tag, SimpleAggregationConfig config, AggregationOptions options);

    [[nodiscard]] static auto create(SimpleAggregationConfig config,
                                     AggregationOptions options = {})
        -> std::expected<std::unique_ptr<SimpleAggregation>, std::string>;

    [[nodiscard]] auto arguments() const -> std::vector<Argument> override;
    [[nodiscard]] auto argument_names() const -> std::vector<std::string_view> override;
    [[nodiscard]] auto indexes() const -> const IndexMap& override { return index_map_; }

    /// One override per index.
    [[nodiscard]] auto parallel_kwargs() const -> std::vector<Overrides>;

    /// A non-parallel copy restricted to `overrides.indexes`.
    [[nodiscard]] auto clone_with(const Overrides& overrides) const
        -> std::expected<std::unique_ptr<SimpleAggregation>, std::string>;

   protected:
    [[nodiscard]] auto decompose() const -> std::expected<std::vector<Child>, std::string> override;
    [[nodiscard]] auto aggregator_key(const Argument& argument) const -> std::string override;
    [[nodiscard]] auto make_aggregator(const Argument& argument) const
        -> std::expected<AggregatorPtr, std::string> override;

   private:

    SimpleAggregationConfig config_;
    IndexMap index_map_;
};

}  // namespace drain::aggregation
