#include <drain/runtime/table.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace drain::runtime {

namespace {

auto type_name(const ColumnValue& column) -> const char* {
    switch (column.index()) {
        case 0:
            return "int";
        case 1:
            return "double";
        case 2:
            return "string";
        case 3:
            return "date";
        default:
            return "unknown";
    }
}

auto make_empty_like(const ColumnValue& src) -> ColumnValue {
    return std::visit(
        [](const auto& col) -> ColumnValue {
            using ColType = std::decay_t<decltype(col)>;
            return ColType{};
        },
        src);
}

auto append_column(ColumnValue& dst, const ColumnValue& src) -> void {
    std::visit(
        [&](auto& dst_col) {
            using ColType = std::decay_t<decltype(dst_col)>;
            const auto* src_col = std::get_if<ColType>(&src);
            if (src_col == nullptr) {
                throw std::logic_error("column type mismatch");
            }
            dst_col.append(*src_col);
        },
        dst);
}

auto take_column(const ColumnValue& src, const std::vector<std::size_t>& rows) -> ColumnValue {
    return std::visit([&](const auto& col) -> ColumnValue { return col.take(rows); }, src);
}

auto format_value(const ColumnEntry& entry, std::size_t row) -> std::string {
    if (is_null(entry, row)) {
        return "null";
    }
    return std::visit(
        [row](const auto& c) -> std::string {
            using T = typename std::decay_t<decltype(c)>::value_type;
            if constexpr (std::is_same_v<T, std::string>) {
                return c[row];
            } else if constexpr (std::is_same_v<T, Date>) {
                return format_date(c[row]);
            } else if constexpr (std::is_same_v<T, double>) {
                double v = c[row];
                if (std::isnan(v))
                    return "nan";
                if (std::isinf(v))
                    return v > 0 ? "inf" : "-inf";
                return fmt::format("{:g}", v);
            } else {
                return std::to_string(c[row]);
            }
        },
        *entry.column);
}

struct EntryBuilder {
    std::string name;
    ColumnValue column;
    std::vector<bool> validity;
    bool has_nulls = false;

    void append(const ColumnEntry& src) {
        append_column(column, *src.column);
        auto n = column_size(*src.column);
        if (src.validity.has_value()) {
            has_nulls = true;
            validity.insert(validity.end(), src.validity->begin(), src.validity->end());
        } else {
            validity.insert(validity.end(), n, true);
        }
    }

    [[nodiscard]] auto finish() && -> ColumnEntry {
        ColumnEntry entry{.name = std::move(name),
                          .column = std::make_shared<ColumnValue>(std::move(column)),
                          .validity = std::nullopt};
        if (has_nulls) {
            entry.validity = std::move(validity);
        }
        return entry;
    }
};

// Locate the entry named `name` in `entries`, returning nullptr when absent.
auto find_in(const std::vector<ColumnEntry>& entries, const std::string& name)
    -> const ColumnEntry* {
    auto it = std::ranges::find_if(entries, [&](const ColumnEntry& e) { return e.name == name; });
    return it == entries.end() ? nullptr : &*it;
}

auto concat_entries(const std::vector<const Table*>& tables,
                    std::vector<ColumnEntry> Table::*member, const char* what)
    -> std::expected<std::vector<ColumnEntry>, std::string> {
    const auto& reference = tables.front()->*member;
    std::vector<EntryBuilder> builders;
    builders.reserve(reference.size());
    for (const auto& entry : reference) {
        builders.push_back(EntryBuilder{.name = entry.name,
                                        .column = make_empty_like(*entry.column),
                                        .validity = {},
                                        .has_nulls = false});
    }

    for (std::size_t t = 0; t < tables.size(); ++t) {
        const auto& entries = tables[t]->*member;
        if (entries.size() != reference.size()) {
            return std::unexpected(fmt::format("concat: table {} has {} {} columns, expected {}",
                                               t, entries.size(), what, reference.size()));
        }
        for (auto& builder : builders) {
            const auto* src = find_in(entries, builder.name);
            if (src == nullptr) {
                return std::unexpected(fmt::format("concat: {} column '{}' missing from table {}",
                                                   what, builder.name, t));
            }
            if (src->column->index() != builder.column.index()) {
                return std::unexpected(
                    fmt::format("concat: {} column '{}' type mismatch ({} vs {}) in table {}",
                                what, builder.name, type_name(builder.column),
                                type_name(*src->column), t));
            }
            builder.append(*src);
        }
    }

    std::vector<ColumnEntry> out;
    out.reserve(builders.size());
    for (auto& builder : builders) {
        out.push_back(std::move(builder).finish());
    }
    return out;
}

auto entries_equal(const std::vector<ColumnEntry>& lhs, const std::vector<ColumnEntry>& rhs)
    -> bool {
    if (lhs.size() != rhs.size()) {
        return false;
    }
    for (std::size_t i = 0; i < lhs.size(); ++i) {
        if (lhs[i].name != rhs[i].name || *lhs[i].column != *rhs[i].column ||
            lhs[i].validity != rhs[i].validity) {
            return false;
        }
    }
    return true;
}

}  // namespace

auto column_size(const ColumnValue& column) -> std::size_t {
    return std::visit([](const auto& col) { return col.size(); }, column);
}

auto broadcast(const ScalarValue& value, std::size_t rows) -> ColumnValue {
    return std::visit(
        [rows](const auto& v) -> ColumnValue {
            using T = std::decay_t<decltype(v)>;
            return Column<T>::filled(rows, v);
        },
        value);
}

auto format_scalar(const ScalarValue& value) -> std::string {
    return std::visit(
        [](const auto& v) -> std::string {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::string>) {
                return v;
            } else if constexpr (std::is_same_v<T, Date>) {
                return format_date(v);
            } else {
                return fmt::format("{}", v);
            }
        },
        value);
}

void Table::add_column(std::string name, ColumnValue column) {
    if (auto it = positions.find(name); it != positions.end()) {
        // Reseat the shared_ptr rather than mutating shared data (copy-on-write).
        columns[it->second].column = std::make_shared<ColumnValue>(std::move(column));
        columns[it->second].validity.reset();
        return;
    }
    std::size_t pos = columns.size();
    columns.push_back(ColumnEntry{.name = std::move(name),
                                  .column = std::make_shared<ColumnValue>(std::move(column)),
                                  .validity = std::nullopt});
    positions[columns.back().name] = pos;
}

void Table::add_column(std::string name, ColumnValue column, std::vector<bool> validity) {
    auto key = name;
    add_column(std::move(name), std::move(column));
    columns[positions.at(key)].validity = std::move(validity);
}

void Table::set_literal(std::string name, const ScalarValue& value) {
    add_column(std::move(name), broadcast(value, rows()));
}

void Table::add_index_column(std::string name, ColumnValue column) {
    row_index.push_back(ColumnEntry{.name = std::move(name),
                                    .column = std::make_shared<ColumnValue>(std::move(column)),
                                    .validity = std::nullopt});
}

auto Table::find(const std::string& name) -> ColumnValue* {
    if (auto it = positions.find(name); it != positions.end()) {
        return columns[it->second].column.get();
    }
    return nullptr;
}

auto Table::find(const std::string& name) const -> const ColumnValue* {
    if (auto it = positions.find(name); it != positions.end()) {
        return columns[it->second].column.get();
    }
    return nullptr;
}

auto Table::find_entry(const std::string& name) const -> const ColumnEntry* {
    if (auto it = positions.find(name); it != positions.end()) {
        return &columns[it->second];
    }
    return nullptr;
}

auto Table::find_index(const std::string& name) const -> const ColumnEntry* {
    return find_in(row_index, name);
}

auto Table::rows() const noexcept -> std::size_t {
    if (!row_index.empty()) {
        return column_size(*row_index.front().column);
    }
    if (columns.empty()) {
        return 0;
    }
    return column_size(*columns.front().column);
}

auto Table::column_names() const -> std::vector<std::string> {
    std::vector<std::string> names;
    names.reserve(columns.size());
    for (const auto& entry : columns) {
        names.push_back(entry.name);
    }
    return names;
}

auto concat_tables(const std::vector<const Table*>& tables) -> std::expected<Table, std::string> {
    if (tables.empty()) {
        return Table{};
    }
    if (tables.size() == 1) {
        return *tables.front();
    }

    auto columns = concat_entries(tables, &Table::columns, "data");
    if (!columns) {
        return std::unexpected(columns.error());
    }
    auto row_index = concat_entries(tables, &Table::row_index, "index");
    if (!row_index) {
        return std::unexpected(row_index.error());
    }

    Table out;
    out.columns = std::move(*columns);
    for (std::size_t i = 0; i < out.columns.size(); ++i) {
        out.positions[out.columns[i].name] = i;
    }
    out.row_index = std::move(*row_index);
    return out;
}

auto take_rows(const Table& table, const std::vector<std::size_t>& rows) -> Table {
    auto take_entry = [&](const ColumnEntry& entry) {
        ColumnEntry out{.name = entry.name,
                        .column = std::make_shared<ColumnValue>(take_column(*entry.column, rows)),
                        .validity = std::nullopt};
        if (entry.validity.has_value()) {
            std::vector<bool> validity;
            validity.reserve(rows.size());
            for (auto row : rows) {
                validity.push_back((*entry.validity)[row]);
            }
            out.validity = std::move(validity);
        }
        return out;
    };

    Table out;
    out.positions = table.positions;
    out.columns.reserve(table.columns.size());
    for (const auto& entry : table.columns) {
        out.columns.push_back(take_entry(entry));
    }
    for (const auto& entry : table.row_index) {
        out.row_index.push_back(take_entry(entry));
    }
    return out;
}

auto tables_equal(const Table& lhs, const Table& rhs) -> bool {
    return entries_equal(lhs.columns, rhs.columns) && entries_equal(lhs.row_index, rhs.row_index);
}

void print(const Table& t, std::ostream& out) {
    if (t.columns.empty() && t.row_index.empty()) {
        out << "(empty table)\n";
        return;
    }

    std::size_t rows = t.rows();
    std::vector<const ColumnEntry*> entries;
    for (const auto& entry : t.row_index) {
        entries.push_back(&entry);
    }
    for (const auto& entry : t.columns) {
        entries.push_back(&entry);
    }

    // Collect all cell strings and compute column widths.
    std::vector<std::vector<std::string>> cells(entries.size());
    std::vector<std::size_t> widths(entries.size());
    for (std::size_t c = 0; c < entries.size(); ++c) {
        widths[c] = entries[c]->name.size();
        cells[c].reserve(rows);
        for (std::size_t r = 0; r < rows; ++r) {
            auto s = format_value(*entries[c], r);
            widths[c] = std::max(widths[c], s.size());
            cells[c].push_back(std::move(s));
        }
    }

    // Index columns are separated from data columns by a bar.
    auto separator = [&](std::size_t c) {
        return (c + 1 == t.row_index.size() && !t.columns.empty()) ? " | " : "  ";
    };

    for (std::size_t c = 0; c < entries.size(); ++c) {
        out << fmt::format("{:<{}}", entries[c]->name, widths[c]);
        if (c + 1 < entries.size()) {
            out << separator(c);
        }
    }
    out << '\n';
    for (std::size_t r = 0; r < rows; ++r) {
        for (std::size_t c = 0; c < entries.size(); ++c) {
            out << fmt::format("{:<{}}", cells[c][r], widths[c]);
            if (c + 1 < entries.size()) {
                out << separator(c);
            }
        }
        out << '\n';
    }
}

}  // namespace drain::runtime
