#pragma once

#include <drain/runtime/table.hpp>

#include <memory>
#include <utility>

namespace drain::aggregation {

/// An upstream producer of a materialized table.
///
/// The surrounding pipeline framework resolves and runs steps; by the time an
/// aggregation asks for a result it is expected to be available.
class Step {
   public:
    virtual ~Step() = default;

    [[nodiscard]] virtual auto get_result() const -> const runtime::Table& = 0;
};

using StepPtr = std::shared_ptr<const Step>;

/// A step whose result is a table supplied up front.
class TableStep final : public Step {
   public:
    explicit TableStep(runtime::Table table) : table_(std::move(table)) {}

    [[nodiscard]] auto get_result() const -> const runtime::Table& override { return table_; }

   private:
    runtime::Table table_;
};

[[nodiscard]] inline auto make_table_step(runtime::Table table) -> StepPtr {
    return std::make_shared<const TableStep>(std::move(table));
}

}  // namespace drain::aggregation
