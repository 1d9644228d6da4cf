#include <drain/core/time.hpp>

#include <fmt/format.h>

#include <charconv>
#include <chrono>
#include <limits>

namespace drain {

namespace {

auto parse_int(std::string_view text, int& out) -> bool {
    const char* begin = text.data();
    const char* end = text.data() + text.size();
    auto result = std::from_chars(begin, end, out);
    return result.ec == std::errc() && result.ptr == end;
}

auto to_date(std::chrono::year_month_day ymd) -> Date {
    return Date{static_cast<std::int32_t>(std::chrono::sys_days{ymd}.time_since_epoch().count())};
}

auto to_ymd(Date date) -> std::chrono::year_month_day {
    return std::chrono::year_month_day{std::chrono::sys_days{std::chrono::days{date.days}}};
}

// Month arithmetic clamps to the last day of the target month (Mar 31 - 1m = Feb 28/29).
auto clamp_day(std::chrono::year_month_day ymd) -> std::chrono::year_month_day {
    if (ymd.ok()) {
        return ymd;
    }
    return std::chrono::year_month_day{std::chrono::year_month_day_last{
        ymd.year(), std::chrono::month_day_last{ymd.month()}}};
}

// Bounds every window so its start stays a valid calendar date for any end
// date parse_date accepts (years 0000-9999).
constexpr int kMaxDeltaYears = 10'000;

constexpr auto max_delta_count(DeltaUnit unit) -> int {
    switch (unit) {
        case DeltaUnit::Day:
            return kMaxDeltaYears * 366;
        case DeltaUnit::Week:
            return kMaxDeltaYears * 366 / 7;
        case DeltaUnit::Month:
            return kMaxDeltaYears * 12;
        case DeltaUnit::Year:
            return kMaxDeltaYears;
        case DeltaUnit::All:
            break;
    }
    return 0;
}

}  // namespace

auto parse_date(std::string_view text) -> std::expected<Date, std::string> {
    if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
        return std::unexpected(fmt::format("invalid date '{}' (expected YYYY-MM-DD)", text));
    }
    int y = 0;
    int m = 0;
    int d = 0;
    if (!parse_int(text.substr(0, 4), y) || !parse_int(text.substr(5, 2), m) ||
        !parse_int(text.substr(8, 2), d)) {
        return std::unexpected(fmt::format("invalid date '{}' (expected YYYY-MM-DD)", text));
    }
    std::chrono::year_month_day ymd{std::chrono::year{y},
                                    std::chrono::month{static_cast<unsigned>(m)},
                                    std::chrono::day{static_cast<unsigned>(d)}};
    if (!ymd.ok()) {
        return std::unexpected(fmt::format("invalid date '{}' (no such day)", text));
    }
    return to_date(ymd);
}

auto format_date(Date date) -> std::string {
    auto ymd = to_ymd(date);
    return fmt::format("{:04}-{:02}-{:02}", static_cast<int>(ymd.year()),
                       static_cast<unsigned>(ymd.month()), static_cast<unsigned>(ymd.day()));
}

auto Delta::window_start(Date end) const -> Date {
    using namespace std::chrono;
    switch (unit) {
        case DeltaUnit::Day:
            return Date{static_cast<std::int32_t>(std::int64_t{end.days} - count)};
        case DeltaUnit::Week:
            return Date{
                static_cast<std::int32_t>(std::int64_t{end.days} - std::int64_t{7} * count)};
        case DeltaUnit::Month:
            return to_date(clamp_day(to_ymd(end) - months{count}));
        case DeltaUnit::Year:
            return to_date(clamp_day(to_ymd(end) - years{count}));
        case DeltaUnit::All:
            break;
    }
    return Date{std::numeric_limits<std::int32_t>::min()};
}

auto parse_delta(std::string_view text) -> std::expected<Delta, std::string> {
    if (text == "all") {
        return Delta{.label = std::string(text), .unit = DeltaUnit::All, .count = 0};
    }
    if (text.size() < 2) {
        return std::unexpected(fmt::format("invalid delta '{}'", text));
    }
    DeltaUnit unit = DeltaUnit::Day;
    switch (text.back()) {
        case 'd':
            unit = DeltaUnit::Day;
            break;
        case 'w':
            unit = DeltaUnit::Week;
            break;
        case 'm':
            unit = DeltaUnit::Month;
            break;
        case 'y':
            unit = DeltaUnit::Year;
            break;
        default:
            return std::unexpected(
                fmt::format("invalid delta '{}' (unit must be one of d, w, m, y)", text));
    }
    int count = 0;
    if (!parse_int(text.substr(0, text.size() - 1), count) || count <= 0) {
        return std::unexpected(fmt::format("invalid delta '{}' (count must be positive)", text));
    }
    if (count > max_delta_count(unit)) {
        return std::unexpected(fmt::format("invalid delta '{}' (longer than {} years)", text,
                                           kMaxDeltaYears));
    }
    return Delta{.label = std::string(text), .unit = unit, .count = count};
}

}  // namespace drain
