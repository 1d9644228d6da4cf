#include <drain/aggregation/result.hpp>

#include <fmt/format.h>

#include <algorithm>

namespace drain::aggregation {

namespace {

using TableParts = std::map<std::string, std::vector<const runtime::Table*>>;

auto gather(const Result& result, TableParts& parts) -> std::expected<void, std::string> {
    switch (result.kind) {
        case ResultKind::Concat:
            for (const auto& [name, table] : result.by_index) {
                parts[name].push_back(&table);
            }
            return {};
        case ResultKind::ParallelDisjoint:
        case ResultKind::ParallelConcat:
            for (const auto& child : result.children) {
                if (auto status = gather(child, parts); !status) {
                    return status;
                }
            }
            return {};
        case ResultKind::Disjoint:
            break;
    }
    return std::unexpected(
        fmt::format("cannot collect a disjoint result of {} tables: tables carry no index name",
                    result.tables.size()));
}

}  // namespace

auto Result::disjoint(runtime::TableList tables) -> Result {
    Result result;
    result.kind = ResultKind::Disjoint;
    result.tables = std::move(tables);
    return result;
}

auto Result::concat(std::map<std::string, runtime::Table> by_index) -> Result {
    Result result;
    result.kind = ResultKind::Concat;
    result.by_index = std::move(by_index);
    return result;
}

auto Result::parallel(bool concat, std::vector<std::string> keys, std::vector<Result> children)
    -> Result {
    Result result;
    result.kind = concat ? ResultKind::ParallelConcat : ResultKind::ParallelDisjoint;
    result.child_keys = std::move(keys);
    result.children = std::move(children);
    return result;
}

auto Result::child(const std::string& key) const -> const Result* {
    if (kind != ResultKind::ParallelConcat) {
        return nullptr;
    }
    auto it = std::ranges::find(child_keys, key);
    if (it == child_keys.end()) {
        return nullptr;
    }
    return &children[static_cast<std::size_t>(it - child_keys.begin())];
}

auto collect(const Result& result)
    -> std::expected<std::map<std::string, runtime::Table>, std::string> {
    if (result.kind == ResultKind::Concat) {
        return result.by_index;
    }

    TableParts parts;
    if (auto status = gather(result, parts); !status) {
        return std::unexpected(status.error());
    }

    std::map<std::string, runtime::Table> out;
    for (const auto& [name, tables] : parts) {
        auto combined = runtime::concat_tables(tables);
        if (!combined) {
            return std::unexpected(fmt::format("index '{}': {}", name, combined.error()));
        }
        out.emplace(name, std::move(*combined));
    }
    return out;
}

auto results_equal(const Result& lhs, const Result& rhs) -> bool {
    if (lhs.kind != rhs.kind || lhs.tables.size() != rhs.tables.size() ||
        lhs.by_index.size() != rhs.by_index.size() || lhs.child_keys != rhs.child_keys ||
        lhs.children.size() != rhs.children.size()) {
        return false;
    }
    for (std::size_t i = 0; i < lhs.tables.size(); ++i) {
        if (!runtime::tables_equal(lhs.tables[i], rhs.tables[i])) {
            return false;
        }
    }
    for (const auto& [name, table] : lhs.by_index) {
        auto it = rhs.by_index.find(name);
        if (it == rhs.by_index.end() || !runtime::tables_equal(table, it->second)) {
            return false;
        }
    }
    for (std::size_t i = 0; i < lhs.children.size(); ++i) {
        if (!results_equal(lhs.children[i], rhs.children[i])) {
            return false;
        }
    }
    return true;
}

}  // namespace drain::aggregation
