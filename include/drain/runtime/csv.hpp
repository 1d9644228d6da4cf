#pragma once

#include <drain/runtime/table.hpp>

#include <expected>
#include <string>
#include <string_view>

namespace drain::runtime {

/// Simple CSV reader (comma-separated, no quotes/escapes).
///
/// Column types are inferred as int, double, ISO date (`YYYY-MM-DD`) or
/// string, in that order of preference. Empty fields are nulls.
[[nodiscard]] auto read_csv_simple(std::string_view path) -> std::expected<Table, std::string>;

/// Same as read_csv_simple, from in-memory text.
[[nodiscard]] auto parse_csv_simple(std::string_view text) -> std::expected<Table, std::string>;

}  // namespace drain::runtime
