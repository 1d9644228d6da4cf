#include <drain/aggregation/argument.hpp>

#include <fmt/format.h>

namespace drain::aggregation {

auto Argument::names() const -> std::vector<std::string_view> {
    std::vector<std::string_view> out;
    out.reserve(3);
    if (date.has_value()) {
        out.push_back(kDateArg);
    }
    if (delta.has_value()) {
        out.push_back(kDeltaArg);
    }
    out.push_back(kIndexArg);
    return out;
}

auto Argument::value(std::string_view name) const -> std::optional<runtime::ScalarValue> {
    if (name == kIndexArg) {
        return runtime::ScalarValue{index};
    }
    if (name == kDateArg && date.has_value()) {
        return runtime::ScalarValue{*date};
    }
    if (name == kDeltaArg && delta.has_value()) {
        return runtime::ScalarValue{delta->label};
    }
    return std::nullopt;
}

auto format_argument(const Argument& argument) -> std::string {
    std::string out = "{";
    for (auto name : argument.names()) {
        if (out.size() > 1) {
            out.append(", ");
        }
        out.append(fmt::format("{}={}", name, runtime::format_scalar(*argument.value(name))));
    }
    out.push_back('}');
    return out;
}

}  // namespace drain::aggregation
