#pragma once

#include <charconv>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <string>
#include <string_view>
#include <system_error>

namespace core {

// Calendar day with no time component, stored as days since 1970-01-01.
struct CivilDate {
    std::int32_t days{0};

    friend constexpr bool operator==(CivilDate a, CivilDate b) noexcept { return a.days == b.days; }
    friend constexpr bool operator<(CivilDate a, CivilDate b) noexcept { return a.days < b.days; }
};

inline CivilDate make_date(int year, unsigned month, unsigned day) noexcept {
    const std::chrono::year_month_day ymd{std::chrono::year{year}, std::chrono::month{month},
                                          std::chrono::day{day}};
    const std::chrono::sys_days sd{ymd};
    return CivilDate{static_cast<std::int32_t>(sd.time_since_epoch().count())};
}

// Signed number of days from a to b.
constexpr std::int32_t days_between(CivilDate a, CivilDate b) noexcept {
    return b.days - a.days;
}

constexpr std::int32_t abs_days_between(CivilDate a, CivilDate b) noexcept {
    const auto d = days_between(a, b);
    return d < 0 ? -d : d;
}

namespace detail {
inline bool parse_fixed_digits(std::string_view s, int& out) noexcept {
    if (s.empty()) {
        return false;
    }
    for (char c : s) {
        if (c < '0' || c > '9') {
            return false;
        }
    }
    const auto res = std::from_chars(s.data(), s.data() + s.size(), out);
    return res.ec == std::errc() && res.ptr == s.data() + s.size();
}

inline bool parse_two_digits(std::string_view s, std::size_t at, int max_value, int& out) noexcept {
    if (at + 2 > s.size() || !parse_fixed_digits(s.substr(at, 2), out)) {
        return false;
    }
    return out <= max_value;
}

// "HH:MM[:SS[.fff]]" optionally followed by "Z" or "+HH:MM" / "-HH:MM".
inline bool is_time_of_day(std::string_view s) noexcept {
    int v = 0;
    if (!parse_two_digits(s, 0, 23, v) || s.size() < 5 || s[2] != ':' || !parse_two_digits(s, 3, 59, v)) {
        return false;
    }
    std::size_t pos = 5;
    if (pos < s.size() && s[pos] == ':') {
        if (!parse_two_digits(s, pos + 1, 59, v)) {
            return false;
        }
        pos += 3;
        if (pos < s.size() && s[pos] == '.') {
            ++pos;
            const std::size_t digits_from = pos;
            while (pos < s.size() && s[pos] >= '0' && s[pos] <= '9') {
                ++pos;
            }
            if (pos == digits_from) {
                return false;
            }
        }
    }
    if (pos == s.size()) {
        return true;
    }
    if (s[pos] == 'Z') {
        return pos + 1 == s.size();
    }
    if (s[pos] == '+' || s[pos] == '-') {
        const auto offset = s.substr(pos + 1);
        return offset.size() == 5 && offset[2] == ':' && parse_two_digits(offset, 0, 23, v) &&
               parse_two_digits(offset, 3, 59, v);
    }
    return false;
}
} // namespace detail

// Accepts "YYYY-MM-DD", optionally followed by 'T' or ' ' and a time of day
// (see is_time_of_day). The time is validated, then discarded.
inline bool parse_date(std::string_view text, CivilDate& out) noexcept {
    while (!text.empty() && (text.front() == ' ' || text.front() == '\t')) {
        text.remove_prefix(1);
    }
    while (!text.empty() && (text.back() == ' ' || text.back() == '\t')) {
        text.remove_suffix(1);
    }
    if (text.size() < 10 || text[4] != '-' || text[7] != '-') {
        return false;
    }
    if (text.size() > 10 &&
        ((text[10] != 'T' && text[10] != ' ') || !detail::is_time_of_day(text.substr(11)))) {
        return false;
    }

    int y = 0;
    int m = 0;
    int d = 0;
    if (!detail::parse_fixed_digits(text.substr(0, 4), y) ||
        !detail::parse_fixed_digits(text.substr(5, 2), m) ||
        !detail::parse_fixed_digits(text.substr(8, 2), d)) {
        return false;
    }

    const std::chrono::year_month_day ymd{std::chrono::year{y},
                                          std::chrono::month{static_cast<unsigned>(m)},
                                          std::chrono::day{static_cast<unsigned>(d)}};
    if (!ymd.ok()) {
        return false;
    }
    out = CivilDate{static_cast<std::int32_t>(std::chrono::sys_days{ymd}.time_since_epoch().count())};
    return true;
}

inline std::string format_date(CivilDate date) {
    const std::chrono::year_month_day ymd{std::chrono::sys_days{std::chrono::days{date.days}}};
    char buf[16]{};
    std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u", static_cast<int>(ymd.year()),
                  static_cast<unsigned>(ymd.month()), static_cast<unsigned>(ymd.day()));
    return std::string(buf);
}

} // namespace core
