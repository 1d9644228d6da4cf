#include <drain/runtime/csv.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace drain::runtime {

namespace {

auto split_line(const std::string& line) -> std::vector<std::string> {
    std::vector<std::string> fields;
    std::string field;
    std::stringstream ss(line);
    while (std::getline(ss, field, ',')) {
        fields.push_back(field);
    }
    if (!line.empty() && line.back() == ',') {
        fields.emplace_back();
    }
    return fields;
}

auto try_parse_int(const std::string& text, std::int64_t& out) -> bool {
    const char* begin = text.data();
    const char* end = text.data() + text.size();
    auto result = std::from_chars(begin, end, out);
    return result.ec == std::errc() && result.ptr == end;
}

auto try_parse_double(const std::string& text, double& out) -> bool {
    char* end = nullptr;
    out = std::strtod(text.c_str(), &end);
    return end != text.c_str() && *end == '\0';
}

auto strip_cr(std::string& line) -> void {
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
}

// Build a typed column from raw fields; `parse` returns false on the first
// field that does not fit the type.
template <typename T, typename Parse>
auto try_build(const std::vector<std::string>& fields, Parse parse)
    -> std::optional<std::pair<Column<T>, std::vector<bool>>> {
    std::vector<T> values;
    std::vector<bool> validity;
    values.reserve(fields.size());
    validity.reserve(fields.size());
    for (const auto& field : fields) {
        if (field.empty()) {
            values.push_back(T{});
            validity.push_back(false);
            continue;
        }
        T value{};
        if (!parse(field, value)) {
            return std::nullopt;
        }
        values.push_back(std::move(value));
        validity.push_back(true);
    }
    return std::pair{Column<T>{std::move(values)}, std::move(validity)};
}

template <typename T>
auto add_typed(Table& table, const std::string& name,
               std::optional<std::pair<Column<T>, std::vector<bool>>> built) -> void {
    auto& [column, validity] = *built;
    if (std::find(validity.begin(), validity.end(), false) == validity.end()) {
        table.add_column(name, std::move(column));
    } else {
        table.add_column(name, std::move(column), std::move(validity));
    }
}

auto read_stream(std::istream& input) -> std::expected<Table, std::string> {
    std::string header_line;
    if (!std::getline(input, header_line)) {
        return std::unexpected("csv is empty");
    }
    strip_cr(header_line);

    auto headers = split_line(header_line);
    if (headers.empty()) {
        return std::unexpected("csv has no headers");
    }

    std::vector<std::vector<std::string>> columns(headers.size());
    std::string line;
    std::size_t line_no = 1;
    while (std::getline(input, line)) {
        ++line_no;
        strip_cr(line);
        if (line.empty()) {
            continue;
        }
        auto fields = split_line(line);
        if (fields.size() != headers.size()) {
            return std::unexpected(fmt::format("csv line {} has {} fields, expected {}", line_no,
                                               fields.size(), headers.size()));
        }
        for (std::size_t i = 0; i < fields.size(); ++i) {
            columns[i].push_back(std::move(fields[i]));
        }
    }

    Table table;
    for (std::size_t i = 0; i < headers.size(); ++i) {
        const auto& fields = columns[i];
        if (auto ints = try_build<std::int64_t>(fields, try_parse_int)) {
            add_typed(table, headers[i], std::move(ints));
        } else if (auto doubles = try_build<double>(fields, try_parse_double)) {
            add_typed(table, headers[i], std::move(doubles));
        } else if (auto dates = try_build<Date>(fields, [](const std::string& text, Date& out) {
                       auto parsed = parse_date(text);
                       if (!parsed) {
                           return false;
                       }
                       out = *parsed;
                       return true;
                   })) {
            add_typed(table, headers[i], std::move(dates));
        } else {
            auto strings = try_build<std::string>(fields, [](const std::string& text,
                                                             std::string& out) {
                out = text;
                return true;
            });
            add_typed(table, headers[i], std::move(strings));
        }
    }
    return table;
}

}  // namespace

auto read_csv_simple(std::string_view path) -> std::expected<Table, std::string> {
    std::ifstream input{std::string(path)};
    if (!input) {
        return std::unexpected("failed to open csv: " + std::string(path));
    }
    return read_stream(input);
}

auto parse_csv_simple(std::string_view text) -> std::expected<Table, std::string> {
    std::istringstream input{std::string(text)};
    return read_stream(input);
}

}  // namespace drain::runtime
