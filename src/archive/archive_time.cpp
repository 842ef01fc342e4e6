/**
 * @file archive_time.cpp
 * @brief Formatting and parsing of archive timestamps
 */

#include <vigil/archive/archive_time.hpp>

#include <vigil/compat/format.hpp>

#include <array>
#include <cctype>
#include <vector>

namespace vigil::archive {

namespace {

using namespace std::chrono;

constexpr std::array<std::string_view, 12> kMonthNames = {
    "January", "February", "March",     "April",   "May",      "June",
    "July",    "August",   "September", "October", "November", "December"};

auto month_name(std::chrono::month m) -> std::string_view {
    auto index = static_cast<unsigned>(m);
    if (index < 1 || index > 12) {
        return "Unknown";
    }
    return kMonthNames[index - 1];
}

auto iequals(std::string_view a, std::string_view b) -> bool {
    if (a.size() != b.size()) {
        return false;
    }
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

/// Month number from a full or three-letter name
auto parse_month(std::string_view token, bool abbreviated) -> std::optional<unsigned> {
    for (unsigned i = 0; i < kMonthNames.size(); ++i) {
        auto name = kMonthNames[i];
        auto candidate = abbreviated ? name.substr(0, 3) : name;
        if (iequals(token, candidate)) {
            return i + 1;
        }
    }
    return std::nullopt;
}

auto parse_digits(std::string_view text, std::size_t min_len, std::size_t max_len)
    -> std::optional<int> {
    if (text.size() < min_len || text.size() > max_len) {
        return std::nullopt;
    }
    int value = 0;
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
        value = value * 10 + (c - '0');
    }
    return value;
}

auto split_spaces(std::string_view text) -> std::vector<std::string_view> {
    std::vector<std::string_view> tokens;
    std::size_t pos = 0;
    while (pos < text.size()) {
        while (pos < text.size() && text[pos] == ' ') {
            ++pos;
        }
        auto start = pos;
        while (pos < text.size() && text[pos] != ' ') {
            ++pos;
        }
        if (pos > start) {
            tokens.push_back(text.substr(start, pos - start));
        }
    }
    return tokens;
}

auto make_day(int y, unsigned m, unsigned d) -> std::optional<sys_days> {
    year_month_day ymd{year{y}, month{m}, day{d}};
    if (!ymd.ok()) {
        return std::nullopt;
    }
    return sys_days{ymd};
}

auto parse_human_impl(std::string_view text, bool abbreviated)
    -> std::optional<archive_time> {
    auto tokens = split_spaces(text);
    if (tokens.size() != 5 || tokens[3] != "at") {
        return std::nullopt;
    }

    auto month_number = parse_month(tokens[0], abbreviated);
    auto day_token = tokens[1];
    if (!day_token.empty() && day_token.back() == ',') {
        day_token.remove_suffix(1);
    }
    auto day_number = parse_digits(day_token, 1, 2);
    auto year_number = parse_digits(tokens[2], 4, 4);
    auto clock = parse_clock(tokens[4]);
    if (!month_number || !day_number || !year_number || !clock) {
        return std::nullopt;
    }

    auto date = make_day(*year_number, *month_number, static_cast<unsigned>(*day_number));
    if (!date) {
        return std::nullopt;
    }
    return archive_time{minute_time{*date + *clock}};
}

/// YYYY-MM-DD<sep>HH:MM[:SS[.fff]][Z|+00:00]
auto parse_iso_impl(std::string_view text, char separator) -> std::optional<archive_time> {
    if (text.size() < 16 || text[4] != '-' || text[7] != '-' || text[10] != separator ||
        text[13] != ':') {
        return std::nullopt;
    }

    auto y = parse_digits(text.substr(0, 4), 4, 4);
    auto mo = parse_digits(text.substr(5, 2), 2, 2);
    auto d = parse_digits(text.substr(8, 2), 2, 2);
    auto h = parse_digits(text.substr(11, 2), 2, 2);
    auto mi = parse_digits(text.substr(14, 2), 2, 2);
    if (!y || !mo || !d || !h || !mi || *h > 23 || *mi > 59) {
        return std::nullopt;
    }

    auto date = make_day(*y, static_cast<unsigned>(*mo), static_cast<unsigned>(*d));
    if (!date) {
        return std::nullopt;
    }

    auto rest = text.substr(16);
    std::optional<int> sec;
    if (!rest.empty() && rest.front() == ':') {
        if (rest.size() < 3) {
            return std::nullopt;
        }
        sec = parse_digits(rest.substr(1, 2), 2, 2);
        if (!sec || *sec > 59) {
            return std::nullopt;
        }
        rest.remove_prefix(3);
        if (!rest.empty() && rest.front() == '.') {
            rest.remove_prefix(1);
            std::size_t digits = 0;
            while (digits < rest.size() &&
                   std::isdigit(static_cast<unsigned char>(rest[digits]))) {
                ++digits;
            }
            if (digits == 0) {
                return std::nullopt;
            }
            rest.remove_prefix(digits);
        }
    }
    if (rest == "Z" || rest == "+00:00") {
        rest = {};
    }
    if (!rest.empty()) {
        return std::nullopt;
    }

    auto base = *date + hours{*h} + minutes{*mi};
    if (!sec) {
        return archive_time{minute_time{base}};
    }
    return archive_time{second_time{base + seconds{*sec}}};
}

}  // namespace

// =============================================================================
// Precision handling
// =============================================================================

auto precision_of(const archive_time& t) noexcept -> time_precision {
    return std::holds_alternative<minute_time>(t) ? time_precision::minute
                                                  : time_precision::second;
}

auto as_seconds(const archive_time& t) noexcept -> second_time {
    return std::visit([](auto tp) { return time_point_cast<seconds>(tp); }, t);
}

auto as_minutes(const archive_time& t) noexcept -> minute_time {
    return std::visit([](auto tp) { return floor<minutes>(tp); }, t);
}

auto same_instant(const archive_time& a, const archive_time& b) noexcept -> bool {
    if (precision_of(a) == time_precision::second &&
        precision_of(b) == time_precision::second) {
        return std::get<second_time>(a) == std::get<second_time>(b);
    }
    return as_minutes(a) == as_minutes(b);
}

auto match_window(const archive_time& t) noexcept -> std::pair<second_time, second_time> {
    if (precision_of(t) == time_precision::minute) {
        auto first = time_point_cast<seconds>(std::get<minute_time>(t));
        return {first, first + minutes{1}};
    }
    auto first = std::get<second_time>(t);
    return {first, first + seconds{1}};
}

auto to_minute_time(system_clock::time_point tp) noexcept -> minute_time {
    return floor<minutes>(tp);
}

auto to_second_time(system_clock::time_point tp) noexcept -> second_time {
    return floor<seconds>(tp);
}

// =============================================================================
// Formatting
// =============================================================================

auto format_human(const archive_time& t) -> std::string {
    auto tp = as_minutes(t);
    auto day_point = floor<days>(tp);
    year_month_day ymd{day_point};
    hh_mm_ss hms{tp - day_point};
    return vigil::compat::format("{} {:02} {} at {:02}:{:02}", month_name(ymd.month()),
                                 static_cast<unsigned>(ymd.day()),
                                 static_cast<int>(ymd.year()), hms.hours().count(),
                                 hms.minutes().count());
}

auto format_snapshot_stamp(const archive_time& t) -> std::string {
    auto tp = as_minutes(t);
    auto day_point = floor<days>(tp);
    year_month_day ymd{day_point};
    hh_mm_ss hms{tp - day_point};
    return vigil::compat::format("{} {:02}, {} at {:02}:{:02}", month_name(ymd.month()),
                                 static_cast<unsigned>(ymd.day()),
                                 static_cast<int>(ymd.year()), hms.hours().count(),
                                 hms.minutes().count());
}

auto format_human_date(sys_days day_point) -> std::string {
    year_month_day ymd{day_point};
    return vigil::compat::format("{} {:02} {}", month_name(ymd.month()),
                                 static_cast<unsigned>(ymd.day()),
                                 static_cast<int>(ymd.year()));
}

auto format_month_title(year_month ym) -> std::string {
    return vigil::compat::format("{} {}", month_name(ym.month()),
                                 static_cast<int>(ym.year()));
}

auto format_clock(const archive_time& t) -> std::string {
    auto tp = as_minutes(t);
    hh_mm_ss hms{tp - floor<days>(tp)};
    return vigil::compat::format("{:02}:{:02}", hms.hours().count(),
                                 hms.minutes().count());
}

auto format_iso(const archive_time& t) -> std::string {
    auto tp = as_seconds(t);
    auto day_point = floor<days>(tp);
    year_month_day ymd{day_point};
    hh_mm_ss hms{tp - day_point};
    return vigil::compat::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}",
                                 static_cast<int>(ymd.year()),
                                 static_cast<unsigned>(ymd.month()),
                                 static_cast<unsigned>(ymd.day()), hms.hours().count(),
                                 hms.minutes().count(), hms.seconds().count());
}

auto format_sql(const archive_time& t) -> std::string {
    auto iso = format_iso(t);
    iso[10] = ' ';
    return iso;
}

// =============================================================================
// Parsing
// =============================================================================

auto parse_time(std::string_view text, time_format format) -> std::optional<archive_time> {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }

    switch (format) {
        case time_format::human:
            return parse_human_impl(text, false);
        case time_format::human_abbreviated:
            return parse_human_impl(text, true);
        case time_format::iso_8601:
            return parse_iso_impl(text, 'T');
        case time_format::sql_datetime:
            return parse_iso_impl(text, ' ');
    }
    return std::nullopt;
}

auto parse_with_fallbacks(std::string_view text, std::initializer_list<time_format> formats)
    -> std::optional<archive_time> {
    for (auto format : formats) {
        if (auto parsed = parse_time(text, format)) {
            return parsed;
        }
    }
    return std::nullopt;
}

auto parse_human_date(std::string_view text) -> std::optional<sys_days> {
    auto tokens = split_spaces(text);
    if (tokens.size() != 3) {
        return std::nullopt;
    }
    auto month_number = parse_month(tokens[0], false);
    if (!month_number) {
        month_number = parse_month(tokens[0], true);
    }
    auto day_token = tokens[1];
    if (!day_token.empty() && day_token.back() == ',') {
        day_token.remove_suffix(1);
    }
    auto day_number = parse_digits(day_token, 1, 2);
    auto year_number = parse_digits(tokens[2], 4, 4);
    if (!month_number || !day_number || !year_number) {
        return std::nullopt;
    }
    return make_day(*year_number, *month_number, static_cast<unsigned>(*day_number));
}

auto parse_clock(std::string_view text) -> std::optional<std::chrono::minutes> {
    auto colon = text.find(':');
    if (colon == std::string_view::npos) {
        return std::nullopt;
    }
    auto h = parse_digits(text.substr(0, colon), 1, 2);
    auto m = parse_digits(text.substr(colon + 1), 2, 2);
    if (!h || !m || *h > 23 || *m > 59) {
        return std::nullopt;
    }
    return hours{*h} + minutes{*m};
}

}  // namespace vigil::archive
