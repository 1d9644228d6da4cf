#pragma once

#include <drain/core/time.hpp>
#include <drain/runtime/table.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace drain::aggregation {

inline constexpr std::string_view kIndexArg = "index";
inline constexpr std::string_view kDateArg = "date";
inline constexpr std::string_view kDeltaArg = "delta";

/// One unit of aggregation work.
///
/// `index` names an entry of the aggregation's index map and is always set.
/// `date` and `delta` are only set by time-aware aggregations.
struct Argument {
    std::string index;
    std::optional<Date> date;
    std::optional<Delta> delta;

    /// Names of the parameters this argument carries, in a fixed order
    /// (date, delta, index).
    [[nodiscard]] auto names() const -> std::vector<std::string_view>;

    /// Value of parameter `name`, or nullopt when the argument does not carry it.
    [[nodiscard]] auto value(std::string_view name) const -> std::optional<runtime::ScalarValue>;

    auto operator==(const Argument& other) const -> bool = default;
};

/// `{date=2020-01-01, delta=1y, index=city}`
[[nodiscard]] auto format_argument(const Argument& argument) -> std::string;

}  // namespace drain::aggregation
