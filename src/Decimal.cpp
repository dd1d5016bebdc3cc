/**
 * @file Decimal.cpp
 * @brief Decimal digit strings: conversion and rounding
 */

#include "numeral/Decimal.hpp"

#include <charconv>
#include <climits>
#include <system_error>

namespace numeral {

Decimal normalize(Decimal d) {
    const auto first = d.digits.find_first_not_of('0');
    if (first == std::string::npos) {
        return Decimal{};
    }
    d.digits.erase(0, first);

    const auto last = d.digits.find_last_not_of('0');
    const auto trailing = d.digits.size() - 1 - last;
    d.digits.erase(last + 1);
    d.exponent += static_cast<long>(trailing);
    return d;
}

Decimal decimal_from_double(double value) {
    // Shortest round-trip form, e.g. "-1.94455e+02" or "0e+00"
    char buf[64];
    const auto res = std::to_chars(buf, buf + sizeof(buf), value, std::chars_format::scientific);
    const char* p = buf;
    const char* end = res.ptr;

    Decimal d;
    if (p != end && *p == '-') {
        d.negative = true;
        ++p;
    }
    for (; p != end && *p != 'e'; ++p) {
        if (*p != '.') d.digits.push_back(*p);
    }

    long exp10 = 0;
    if (p != end) {
        ++p;
        if (p != end && *p == '+') ++p;
        std::from_chars(p, end, exp10);
    }
    d.exponent = exp10 - static_cast<long>(d.digits.size()) + 1;
    return normalize(std::move(d));
}

Decimal decimal_from_integer(std::uint64_t value) {
    return normalize(Decimal{false, std::to_string(value), 0});
}

Decimal decimal_from_integer(std::int64_t value) {
    const bool negative = value < 0;
    const std::uint64_t abs_value = negative
        ? std::uint64_t{0} - static_cast<std::uint64_t>(value)
        : static_cast<std::uint64_t>(value);
    Decimal d = decimal_from_integer(abs_value);
    d.negative = negative && !d.is_zero();
    return d;
}

long magnitude(const Decimal& d) {
    return static_cast<long>(d.digits.size()) - 1 + d.exponent;
}

Decimal shift(Decimal d, long places) {
    if (!d.is_zero()) d.exponent += places;
    return d;
}

Decimal round_decimal(const Decimal& d, std::size_t fractional_digits, RoundingMode mode) {
    if (d.is_zero() || fractional_digits >= static_cast<std::size_t>(LONG_MAX)) {
        return d;
    }
    const long target = -static_cast<long>(fractional_digits);
    if (d.exponent >= target) {
        return d;
    }

    const auto cut = static_cast<std::size_t>(target - d.exponent);
    const auto len = d.digits.size();

    std::string kept;
    char first_dropped = '0';
    bool rest_nonzero = true;
    if (cut <= len) {
        kept = d.digits.substr(0, len - cut);
        const std::string dropped = d.digits.substr(len - cut);
        first_dropped = dropped[0];
        rest_nonzero = dropped.find_first_not_of('0', 1) != std::string::npos;
    }

    const bool above_half = first_dropped > '5' || (first_dropped == '5' && rest_nonzero);
    const bool tie = first_dropped == '5' && !rest_nonzero;
    const bool last_odd = !kept.empty() && ((kept.back() - '0') % 2) == 1;

    // Every dropped tail is non-zero since digits carry no trailing zeros
    bool increment = false;
    switch (mode) {
        case RoundingMode::Ceil: increment = !d.negative; break;
        case RoundingMode::Floor: increment = d.negative; break;
        case RoundingMode::Expand: increment = true; break;
        case RoundingMode::Trunc: increment = false; break;
        case RoundingMode::HalfCeil: increment = above_half || (tie && !d.negative); break;
        case RoundingMode::HalfFloor: increment = above_half || (tie && d.negative); break;
        case RoundingMode::HalfExpand: increment = above_half || tie; break;
        case RoundingMode::HalfTrunc: increment = above_half; break;
        case RoundingMode::HalfEven: increment = above_half || (tie && last_odd); break;
    }

    if (increment) {
        auto i = kept.size();
        while (i > 0 && kept[i - 1] == '9') {
            kept[i - 1] = '0';
            --i;
        }
        if (i == 0) {
            kept.insert(kept.begin(), '1');
        } else {
            ++kept[i - 1];
        }
    }
    return normalize(Decimal{d.negative, std::move(kept), target});
}

std::string integer_digits(const Decimal& d) {
    if (d.is_zero()) return {};
    if (d.exponent >= 0) {
        return d.digits + std::string(static_cast<std::size_t>(d.exponent), '0');
    }
    const long int_len = static_cast<long>(d.digits.size()) + d.exponent;
    if (int_len <= 0) return {};
    return d.digits.substr(0, static_cast<std::size_t>(int_len));
}

std::string fractional_digits(const Decimal& d) {
    if (d.is_zero() || d.exponent >= 0) return {};
    const auto frac_len = static_cast<std::size_t>(-d.exponent);
    const auto len = d.digits.size();
    if (frac_len >= len) {
        return std::string(frac_len - len, '0') + d.digits;
    }
    return d.digits.substr(len - frac_len);
}

std::string to_string(const Decimal& d) {
    std::string out = d.negative ? "-" : "";
    const std::string int_part = integer_digits(d);
    const std::string frac_part = fractional_digits(d);
    out += int_part.empty() ? "0" : int_part;
    if (!frac_part.empty()) {
        out += "." + frac_part;
    }
    return out;
}

} // namespace numeral
