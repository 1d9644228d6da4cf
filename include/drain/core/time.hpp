#pragma once

#include <compare>
#include <cstdint>
#include <expected>
#include <functional>
#include <string>
#include <string_view>

namespace drain {

/// Calendar date in days since 1970-01-01 (Unix epoch).
struct Date {
    std::int32_t days = 0;
    auto operator<=>(const Date&) const = default;
};

/// Parse an ISO `YYYY-MM-DD` date.
[[nodiscard]] auto parse_date(std::string_view text) -> std::expected<Date, std::string>;

/// Format a date as `YYYY-MM-DD`.
[[nodiscard]] auto format_date(Date date) -> std::string;

enum class DeltaUnit : std::uint8_t {
    Day,
    Week,
    Month,
    Year,
    All,
};

/// A named time window ending at an end date.
///
/// Written as `<n>d`, `<n>w`, `<n>m`, `<n>y` or `all`. The label keeps the
/// original spelling so it can be written back into result tables verbatim.
struct Delta {
    std::string label;
    DeltaUnit unit = DeltaUnit::All;
    std::int32_t count = 0;

    /// First date inside the window that ends (exclusively) at `end`.
    /// Unbounded windows return the smallest representable date.
    [[nodiscard]] auto window_start(Date end) const -> Date;

    [[nodiscard]] auto bounded() const noexcept -> bool { return unit != DeltaUnit::All; }

    auto operator==(const Delta& other) const -> bool { return label == other.label; }
};

[[nodiscard]] auto parse_delta(std::string_view text) -> std::expected<Delta, std::string>;

}  // namespace drain

namespace std {

template <>
struct hash<drain::Date> {
    auto operator()(const drain::Date& d) const noexcept -> std::size_t {
        return std::hash<std::int32_t>{}(d.days);
    }
};

}  // namespace std
