#pragma once

#include <drain/aggregation/argument.hpp>
#include <drain/aggregation/result.hpp>
#include <drain/aggregation/step.hpp>
#include <drain/runtime/aggregator.hpp>

#include <expected>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace drain::aggregation {

/// Index name -> index, the lookup used when running an argument.
using IndexMap = std::map<std::string, runtime::Index>;

/// Options shared by every aggregation variant.
struct AggregationOptions {
    /// Decompose into independent children instead of aggregating directly.
    bool parallel = false;
    /// Concatenate tables of the same index instead of returning them per argument.
    bool concat = true;
    /// Marks the result as a final output for the surrounding framework.
    bool target = false;
    /// Prepended (with '_') to every aggregate output column.
    std::string prefix;
    /// Argument names written into result tables as literal columns.
    std::vector<std::string> insert_args;
};

/// Base of all aggregations: expands arguments, runs one Aggregator per
/// argument and assembles the tables.
///
/// Variants supply the expansion (`arguments`), the parallel decomposition
/// (`decompose`) and the aggregator construction (`make_aggregator`, memoized
/// by `aggregator_key`). Instances are built through the variants' `create`
/// factories and are immutable afterwards; `run` is const and keeps its state
/// local, so children of one parallel parent can run concurrently.
class Aggregation {
   public:
    /// A child created by parallel decomposition, keyed by its partition.
    struct Child {
        std::string key;
        std::unique_ptr<Aggregation> aggregation;
    };

    virtual ~Aggregation() = default;

    Aggregation(const Aggregation&) = delete;
    auto operator=(const Aggregation&) -> Aggregation& = delete;

    /// Arguments this instance is responsible for, in execution order.
    [[nodiscard]] virtual auto arguments() const -> std::vector<Argument> = 0;

    /// Every argument name this variant can produce.
    [[nodiscard]] virtual auto argument_names() const -> std::vector<std::string_view> = 0;

    [[nodiscard]] virtual auto indexes() const -> const IndexMap& = 0;

    /// Run the aggregation.
    ///
    /// A parallel instance aggregates nothing: it forwards `child_results`
    /// (one per child, in child order) as a ParallelDisjoint or ParallelConcat
    /// result. A leaf ignores `child_results` and aggregates every argument.
    [[nodiscard]] auto run(std::vector<Result> child_results = {}) const
        -> std::expected<Result, std::string>;

    [[nodiscard]] auto options() const noexcept -> const AggregationOptions& { return options_; }
    [[nodiscard]] auto inputs() const noexcept -> const std::vector<StepPtr>& { return inputs_; }
    [[nodiscard]] auto children() const noexcept -> const std::vector<Child>& { return children_; }
    [[nodiscard]] auto parallel() const noexcept -> bool { return options_.parallel; }

    /// Whether `name` is written into result tables as a literal column.
    [[nodiscard]] auto inserts(std::string_view name) const -> bool;

   protected:
    using AggregatorPtr = std::shared_ptr<const runtime::Aggregator>;
    using AggregatorCache = std::unordered_map<std::string, AggregatorPtr>;

    Aggregation(std::vector<StepPtr> inputs, AggregationOptions options);

    /// Validate the shared options and, for a parallel instance, create the
    /// children. Called by the variant factories once the instance is complete.
    [[nodiscard]] auto initialize() -> std::expected<void, std::string>;

    /// One child per parallel unit; the children partition `arguments()`.
    [[nodiscard]] virtual auto decompose() const
        -> std::expected<std::vector<Child>, std::string> = 0;

    /// Arguments with equal keys share one Aggregator within a run.
    [[nodiscard]] virtual auto aggregator_key(const Argument& argument) const -> std::string = 0;

    [[nodiscard]] virtual auto make_aggregator(const Argument& argument) const
        -> std::expected<AggregatorPtr, std::string> = 0;

    /// Options for a child: same flags, not parallel.
    [[nodiscard]] auto child_options() const -> AggregationOptions;

   private:
    [[nodiscard]] auto get_aggregator(const Argument& argument, AggregatorCache& cache) const
        -> std::expected<AggregatorPtr, std::string>;
    [[nodiscard]] auto assemble(const std::vector<Argument>& arguments,
                                runtime::TableList tables) const
        -> std::expected<Result, std::string>;

    std::vector<StepPtr> inputs_;
    AggregationOptions options_;
    std::vector<Child> children_;
};

/// Run `aggregation` synchronously: children depth-first in order, then the
/// aggregation itself with their results.
[[nodiscard]] auto execute(const Aggregation& aggregation) -> std::expected<Result, std::string>;

}  // namespace drain::aggregation
