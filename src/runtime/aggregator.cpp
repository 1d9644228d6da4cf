#include <drain/runtime/aggregator.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <cstring>
#include <limits>
#include <optional>
#include <robin_hood.h>
#include <string_view>
#include <type_traits>

namespace drain::runtime {

namespace {

constexpr std::uint32_t kNoGroup = std::numeric_limits<std::uint32_t>::max();

auto format_columns(const Table& table) -> std::string {
    if (table.columns.empty()) {
        return "<none>";
    }
    std::string out;
    for (std::size_t i = 0; i < table.columns.size(); ++i) {
        if (i > 0) {
            out.append(", ");
        }
        out.append(table.columns[i].name);
    }
    return out;
}

// A row is missing when it is null or, in a double column, NaN.
template <typename T>
auto is_missing(const ColumnEntry& entry, const Column<T>& values, std::size_t row) -> bool {
    if (is_null(entry, row)) {
        return true;
    }
    if constexpr (std::is_same_v<T, double>) {
        return std::isnan(values[row]);
    } else {
        return false;
    }
}

auto is_missing(const ColumnEntry& entry, std::size_t row) -> bool {
    return std::visit([&](const auto& col) { return is_missing(entry, col, row); }, *entry.column);
}

struct Grouping {
    std::vector<std::uint32_t> group_ids;  // kNoGroup for rows with a null key
    std::vector<std::size_t> first_rows;   // first source row of each group
};

// Dense per-column codes in order of first appearance; kNoGroup marks
// missing keys.
auto encode_key_column(const ColumnEntry& entry) -> std::vector<std::uint32_t> {
    return std::visit(
        [&](const auto& col) -> std::vector<std::uint32_t> {
            using T = typename std::decay_t<decltype(col)>::value_type;
            using Key = std::conditional_t<std::is_same_v<T, std::string>, std::string_view, T>;
            robin_hood::unordered_flat_map<Key, std::uint32_t> codes;
            std::vector<std::uint32_t> out(col.size(), kNoGroup);
            for (std::size_t row = 0; row < col.size(); ++row) {
                if (is_missing(entry, col, row)) {
                    continue;
                }
                Key key{col[row]};
                auto next = static_cast<std::uint32_t>(codes.size());
                out[row] = codes.try_emplace(key, next).first->second;
            }
            return out;
        },
        *entry.column);
}

auto group_rows(const std::vector<const ColumnEntry*>& keys, std::size_t rows) -> Grouping {
    Grouping grouping;
    grouping.group_ids.assign(rows, kNoGroup);

    std::vector<std::vector<std::uint32_t>> codes;
    codes.reserve(keys.size());
    for (const auto* key : keys) {
        codes.push_back(encode_key_column(*key));
    }

    if (codes.size() == 1) {
        // Single key: codes are already dense and in first-appearance order.
        for (std::size_t row = 0; row < rows; ++row) {
            auto code = codes.front()[row];
            if (code == kNoGroup) {
                continue;
            }
            if (code == grouping.first_rows.size()) {
                grouping.first_rows.push_back(row);
            }
            grouping.group_ids[row] = code;
        }
        return grouping;
    }

    // Compound key: pack the per-column codes into a byte string.
    robin_hood::unordered_flat_map<std::string, std::uint32_t> key_to_gid;
    std::string packed(codes.size() * sizeof(std::uint32_t), '\0');
    for (std::size_t row = 0; row < rows; ++row) {
        bool has_null = false;
        for (std::size_t k = 0; k < codes.size(); ++k) {
            auto code = codes[k][row];
            if (code == kNoGroup) {
                has_null = true;
                break;
            }
            std::memcpy(packed.data() + k * sizeof(std::uint32_t), &code, sizeof(code));
        }
        if (has_null) {
            continue;
        }
        auto gid = static_cast<std::uint32_t>(key_to_gid.size());
        auto [it, inserted] = key_to_gid.try_emplace(packed, gid);
        if (inserted) {
            grouping.first_rows.push_back(row);
        }
        grouping.group_ids[row] = it->second;
    }
    return grouping;
}

struct Reduced {
    ColumnValue column;
    std::optional<std::vector<bool>> validity;
};

auto count_rows(const Grouping& grouping, const ColumnEntry* entry) -> Reduced {
    std::vector<std::int64_t> counts(grouping.first_rows.size(), 0);
    for (std::size_t row = 0; row < grouping.group_ids.size(); ++row) {
        auto gid = grouping.group_ids[row];
        if (gid == kNoGroup || (entry != nullptr && is_missing(*entry, row))) {
            continue;
        }
        ++counts[gid];
    }
    return Reduced{.column = Column<std::int64_t>{std::move(counts)}, .validity = std::nullopt};
}

template <typename T>
auto reduce(const Column<T>& values, const ColumnEntry& entry, const AggSpec& spec,
            const Grouping& grouping) -> std::expected<Reduced, std::string> {
    const std::size_t groups = grouping.first_rows.size();
    const std::size_t rows = grouping.group_ids.size();
    std::vector<bool> seen(groups, false);

    auto finish = [&](auto out, bool nulls_for_empty) -> Reduced {
        using OutT = typename decltype(out)::value_type;
        Reduced reduced{.column = Column<OutT>{std::move(out)}, .validity = std::nullopt};
        if (nulls_for_empty && std::find(seen.begin(), seen.end(), false) != seen.end()) {
            reduced.validity = seen;
        }
        return reduced;
    };

    switch (spec.func) {
        case AggFunc::Sum:
        case AggFunc::Mean: {
            if constexpr (NumericElement<T>) {
                std::vector<T> sums(groups, T{});
                std::vector<std::int64_t> counts(groups, 0);
                for (std::size_t row = 0; row < rows; ++row) {
                    auto gid = grouping.group_ids[row];
                    if (gid == kNoGroup || is_missing(entry, values, row)) {
                        continue;
                    }
                    sums[gid] += values[row];
                    ++counts[gid];
                    seen[gid] = true;
                }
                if (spec.func == AggFunc::Sum) {
                    return finish(std::move(sums), false);
                }
                std::vector<double> means(groups, 0.0);
                for (std::size_t g = 0; g < groups; ++g) {
                    if (counts[g] > 0) {
                        means[g] = static_cast<double>(sums[g]) / static_cast<double>(counts[g]);
                    }
                }
                return finish(std::move(means), true);
            } else {
                return std::unexpected(fmt::format("{}() requires a numeric column, '{}' is not",
                                                   agg_func_name(spec.func), spec.column));
            }
        }
        case AggFunc::Min:
        case AggFunc::Max:
        case AggFunc::First:
        case AggFunc::Last: {
            std::vector<T> out(groups, T{});
            for (std::size_t row = 0; row < rows; ++row) {
                auto gid = grouping.group_ids[row];
                if (gid == kNoGroup || is_missing(entry, values, row)) {
                    continue;
                }
                const T& value = values[row];
                if (!seen[gid]) {
                    out[gid] = value;
                    seen[gid] = true;
                    continue;
                }
                if ((spec.func == AggFunc::Min && value < out[gid]) ||
                    (spec.func == AggFunc::Max && value > out[gid]) ||
                    spec.func == AggFunc::Last) {
                    out[gid] = value;
                }
            }
            return finish(std::move(out), true);
        }
        case AggFunc::Count:
            break;
    }
    return count_rows(grouping, &entry);
}

}  // namespace

auto agg_func_name(AggFunc func) noexcept -> std::string_view {
    switch (func) {
        case AggFunc::Sum:
            return "sum";
        case AggFunc::Mean:
            return "mean";
        case AggFunc::Min:
            return "min";
        case AggFunc::Max:
            return "max";
        case AggFunc::Count:
            return "count";
        case AggFunc::First:
            return "first";
        case AggFunc::Last:
            return "last";
    }
    return "unknown";
}

Aggregator::Aggregator(std::shared_ptr<const Table> source, std::vector<AggSpec> aggregates,
                       std::string prefix)
    : source_(std::move(source)), aggregates_(std::move(aggregates)), prefix_(std::move(prefix)) {}

auto Aggregator::output_name(const AggSpec& spec) const -> std::string {
    std::string name = spec.alias;
    if (name.empty()) {
        name = spec.column.empty() ? std::string(agg_func_name(spec.func))
                                   : fmt::format("{}_{}", agg_func_name(spec.func), spec.column);
    }
    if (prefix_.empty()) {
        return name;
    }
    return fmt::format("{}_{}", prefix_, name);
}

auto Aggregator::aggregate(const Index& index) const -> std::expected<Table, std::string> {
    const Table& input = *source_;
    if (index.columns.empty()) {
        return std::unexpected(fmt::format("index '{}' has no key columns", index.name));
    }

    std::vector<const ColumnEntry*> keys;
    keys.reserve(index.columns.size());
    for (const auto& name : index.columns) {
        const auto* entry = input.find_entry(name);
        if (entry == nullptr) {
            return std::unexpected(fmt::format("index '{}': key column not found: {} (available: {})",
                                               index.name, name, format_columns(input)));
        }
        keys.push_back(entry);
    }

    auto grouping = group_rows(keys, input.rows());

    Table output;
    for (const auto* key : keys) {
        output.add_index_column(
            key->name, std::visit(
                           [&](const auto& col) -> ColumnValue { return col.take(grouping.first_rows); },
                           *key->column));
    }

    for (const auto& spec : aggregates_) {
        std::expected<Reduced, std::string> reduced;
        if (spec.func == AggFunc::Count && spec.column.empty()) {
            reduced = count_rows(grouping, nullptr);
        } else {
            const auto* entry = input.find_entry(spec.column);
            if (entry == nullptr) {
                return std::unexpected(fmt::format("aggregate column not found: {} (available: {})",
                                                   spec.column, format_columns(input)));
            }
            reduced = std::visit(
                [&](const auto& col) { return reduce(col, *entry, spec, grouping); }, *entry->column);
        }
        if (!reduced) {
            return std::unexpected(reduced.error());
        }
        if (reduced->validity.has_value()) {
            output.add_column(output_name(spec), std::move(reduced->column),
                              std::move(*reduced->validity));
        } else {
            output.add_column(output_name(spec), std::move(reduced->column));
        }
    }
    return output;
}

}  // namespace drain::runtime
