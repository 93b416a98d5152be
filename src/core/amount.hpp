#pragma once

#include <charconv>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <limits>
#include <string>
#include <string_view>
#include <system_error>

namespace core {

// Fixed-point currency amount in micro-units (1.0 = 1'000'000).
using Micros = std::int64_t;

inline constexpr Micros micros_per_unit = 1'000'000;
inline constexpr Micros micros_per_cent = 10'000;

// Largest magnitude accepted from text; keeps value * 1e6 well inside int64.
inline constexpr double max_abs_amount = 9.0e12;

// Convert to micro-units with round-to-nearest.
constexpr Micros to_micro(double amount) noexcept {
    return static_cast<Micros>(amount * 1'000'000.0 + (amount >= 0.0 ? 0.5 : -0.5));
}

// Saturates: the magnitude of the most negative value is reported as max().
constexpr Micros abs_micros(Micros v) noexcept {
    if (v == std::numeric_limits<Micros>::min()) {
        return std::numeric_limits<Micros>::max();
    }
    return v < 0 ? -v : v;
}

// Round to whole cents, half away from zero.
constexpr Micros round_to_cents(Micros v) noexcept {
    Micros q = v / micros_per_cent;
    const Micros r = v % micros_per_cent;
    if (r >= micros_per_cent / 2) {
        ++q;
    } else if (r <= -micros_per_cent / 2) {
        --q;
    }
    return q * micros_per_cent;
}

inline double to_double(Micros v) noexcept {
    return static_cast<double>(v) / static_cast<double>(micros_per_unit);
}

// Parse a decimal amount ("-1250.00", "+3.5", "1e3"). Surrounding blanks are
// ignored; anything else left over, or a non-finite value, fails.
inline bool parse_amount(std::string_view text, Micros& out) noexcept {
    while (!text.empty() && (text.front() == ' ' || text.front() == '\t')) {
        text.remove_prefix(1);
    }
    while (!text.empty() && (text.back() == ' ' || text.back() == '\t')) {
        text.remove_suffix(1);
    }
    if (!text.empty() && text.front() == '+') {
        text.remove_prefix(1);
        if (!text.empty() && (text.front() == '-' || text.front() == '+')) {
            return false;
        }
    }
    if (text.empty()) {
        return false;
    }
    double value = 0.0;
    const auto* begin = text.data();
    const auto* end = text.data() + text.size();
    const auto res = std::from_chars(begin, end, value);
    if (res.ec != std::errc() || res.ptr != end) {
        return false;
    }
    if (!std::isfinite(value) || std::fabs(value) > max_abs_amount) {
        return false;
    }
    out = static_cast<Micros>(std::llround(value * 1'000'000.0));
    return true;
}

// Two decimals, plus any non-zero sub-cent digits ("10.011").
inline std::string format_amount(Micros v) {
    const bool negative = v < 0;
    const std::uint64_t mag = negative ? static_cast<std::uint64_t>(-(v + 1)) + 1u
                                       : static_cast<std::uint64_t>(v);
    const std::uint64_t whole = mag / static_cast<std::uint64_t>(micros_per_unit);
    std::uint64_t frac = mag % static_cast<std::uint64_t>(micros_per_unit);

    char frac_buf[8]{};
    std::snprintf(frac_buf, sizeof(frac_buf), "%06llu", static_cast<unsigned long long>(frac));
    int frac_len = 6;
    while (frac_len > 2 && frac_buf[frac_len - 1] == '0') {
        --frac_len;
    }
    frac_buf[frac_len] = '\0';

    char buf[48]{};
    std::snprintf(buf, sizeof(buf), "%s%llu.%s", negative ? "-" : "",
                  static_cast<unsigned long long>(whole), frac_buf);
    return std::string(buf);
}

} // namespace core
