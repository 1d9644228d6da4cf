#pragma once

#include <drain/core/column.hpp>
#include <drain/core/time.hpp>

#include <cstdint>
#include <expected>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace drain::runtime {

using ColumnValue =
    std::variant<Column<std::int64_t>, Column<double>, Column<std::string>, Column<Date>>;
using ScalarValue = std::variant<std::int64_t, double, std::string, Date>;

struct ColumnEntry {
    std::string name;
    std::shared_ptr<ColumnValue> column;
    // Validity bitmap: true = valid (not null), false = null.
    // nullopt means every row is valid, the common case, with zero overhead.
    std::optional<std::vector<bool>> validity;
};

/// Returns true if row `row` of `entry` is null.
[[nodiscard]] inline auto is_null(const ColumnEntry& entry, std::size_t row) -> bool {
    return entry.validity.has_value() && !(*entry.validity)[row];
}

[[nodiscard]] auto column_size(const ColumnValue& column) -> std::size_t;

/// Column of `rows` copies of `value`.
[[nodiscard]] auto broadcast(const ScalarValue& value, std::size_t rows) -> ColumnValue;

[[nodiscard]] auto format_scalar(const ScalarValue& value) -> std::string;

/// A columnar table with an optional row index.
///
/// `row_index` holds the key columns identifying each row (the group keys of
/// an aggregate result). It travels with the rows through concatenation and
/// is never renumbered, so duplicate keys are expected after a concat.
struct Table {
    std::vector<ColumnEntry> columns;
    std::unordered_map<std::string, std::size_t> positions;
    std::vector<ColumnEntry> row_index;

    /// Add a column, replacing any existing column of the same name in place.
    void add_column(std::string name, ColumnValue column);
    /// Add a column with an explicit validity bitmap (true = valid, false = null).
    void add_column(std::string name, ColumnValue column, std::vector<bool> validity);
    /// Write `value` into every row of column `name` (replacing an existing column).
    void set_literal(std::string name, const ScalarValue& value);
    void add_index_column(std::string name, ColumnValue column);

    [[nodiscard]] auto find(const std::string& name) -> ColumnValue*;
    [[nodiscard]] auto find(const std::string& name) const -> const ColumnValue*;
    [[nodiscard]] auto find_entry(const std::string& name) const -> const ColumnEntry*;
    [[nodiscard]] auto find_index(const std::string& name) const -> const ColumnEntry*;
    [[nodiscard]] auto rows() const noexcept -> std::size_t;
    [[nodiscard]] auto column_names() const -> std::vector<std::string>;
};

using TableList = std::vector<Table>;

/// Row-wise concatenation. Columns are matched by name and must agree in type;
/// the row index is concatenated as-is. An empty list yields an empty table.
[[nodiscard]] auto concat_tables(const std::vector<const Table*>& tables)
    -> std::expected<Table, std::string>;

/// Rows of `table` at `rows`, row index and validity included.
[[nodiscard]] auto take_rows(const Table& table, const std::vector<std::size_t>& rows) -> Table;

/// Two tables are equal when names, types, values, nulls and row index match.
[[nodiscard]] auto tables_equal(const Table& lhs, const Table& rhs) -> bool;

void print(const Table& table, std::ostream& out = std::cout);

}  // namespace drain::runtime
