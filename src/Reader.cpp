/**
 * @file Reader.cpp
 * @brief Conversion of matched numerals into doubles and integers
 */

#include "numeral/Reader.hpp"

#include <charconv>
#include <climits>
#include <limits>
#include <system_error>

namespace numeral {

namespace {

std::string strip_separator(const std::string& integer_part, const NumberFormatOptions& options) {
    const auto sep = options.thousand_separator();
    if (!sep || options.uses_scientific_notation()) {
        return integer_part;
    }
    std::string out;
    out.reserve(integer_part.size());
    for (char c : integer_part) {
        if (c != *sep) out.push_back(c);
    }
    return out;
}

CodecError no_match(const Pattern& pattern, std::string_view input) {
    return CodecError::no_match("expected " + describe(pattern.options()) +
                                " at the start of '" + std::string(input) + "'");
}

/**
 * @brief Match @p input, or produce the NoMatch error
 */
Result<PatternMatch> match(const Pattern& pattern, std::string_view input) {
    auto m = pattern.match_prefix(input);
    if (!m) {
        return no_match(pattern, input);
    }
    return std::move(*m);
}

/**
 * @brief Exact integer magnitude of @p d, if it has one that fits in 64 bits
 */
Result<std::uint64_t> integer_magnitude(const Decimal& d, const std::string& text) {
    if (d.is_zero()) {
        return std::uint64_t{0};
    }
    if (d.exponent < 0) {
        return CodecError::not_representable("'" + text + "' is not an integer");
    }
    // uint64 max has 20 digits
    if (magnitude(d) >= 20) {
        return CodecError::not_representable("'" + text + "' is out of the 64-bit integer range");
    }
    const std::string digits = integer_digits(d);
    std::uint64_t value = 0;
    const auto res = std::from_chars(digits.data(), digits.data() + digits.size(), value);
    if (res.ec != std::errc{}) {
        return CodecError::not_representable("'" + text + "' is out of the 64-bit integer range");
    }
    return value;
}

} // namespace

Result<Decimal> match_to_decimal(const PatternMatch& m, const NumberFormatOptions& options) {
    const std::string digits = strip_separator(m.integer_part, options) + m.fractional_part;

    long exp10 = 0;
    if (!m.exponent.empty()) {
        const char* first = m.exponent.data();
        const char* last = first + m.exponent.size();
        if (*first == '+') ++first;
        const auto res = std::from_chars(first, last, exp10);
        // Leave room for the fractional digit count
        if (res.ec != std::errc{} || exp10 > LONG_MAX / 2 || exp10 < LONG_MIN / 2) {
            if (digits.find_first_not_of('0') == std::string::npos) {
                return Decimal{};
            }
            return CodecError::not_representable("exponent of '" + m.matched + "' is out of range");
        }
    }

    Decimal d{m.sign == "-", digits, exp10 - static_cast<long>(m.fractional_part.size())};
    return normalize(std::move(d));
}

ReadResult<double> read_real(const Pattern& pattern, std::string_view input) {
    auto m = match(pattern, input);
    if (!m) return m.error();

    const std::string int_digits = strip_separator(m->integer_part, pattern.options());
    std::string text = m->sign == "-" ? "-" : "";
    text += int_digits.empty() ? "0" : int_digits;
    if (!m->fractional_part.empty()) text += "." + m->fractional_part;
    if (!m->exponent.empty()) text += "e" + m->exponent;

    double value = 0.0;
    const auto res = std::from_chars(text.data(), text.data() + text.size(), value);
    if (res.ec != std::errc{} || res.ptr != text.data() + text.size()) {
        return CodecError::not_representable("'" + m->matched + "' is out of the range of a double");
    }
    if (value == 0.0) {
        value = 0.0;  // "-0" reads as positive zero
    }
    return ReadOutput<double>{value, std::string(input.substr(m->end))};
}

ReadResult<std::int64_t> read_signed(const Pattern& pattern, std::string_view input) {
    auto m = match(pattern, input);
    if (!m) return m.error();

    auto d = match_to_decimal(*m, pattern.options());
    if (!d) return d.error();

    auto abs_value = integer_magnitude(*d, m->matched);
    if (!abs_value) return abs_value.error();

    const auto limit = static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
    std::int64_t value = 0;
    if (d->negative) {
        if (*abs_value > limit + 1) {
            return CodecError::not_representable("'" + m->matched + "' is below the signed 64-bit range");
        }
        value = static_cast<std::int64_t>(std::uint64_t{0} - *abs_value);
    } else {
        if (*abs_value > limit) {
            return CodecError::not_representable("'" + m->matched + "' is above the signed 64-bit range");
        }
        value = static_cast<std::int64_t>(*abs_value);
    }
    return ReadOutput<std::int64_t>{value, std::string(input.substr(m->end))};
}

ReadResult<std::uint64_t> read_unsigned(const Pattern& pattern, std::string_view input) {
    auto m = match(pattern, input);
    if (!m) return m.error();

    auto d = match_to_decimal(*m, pattern.options());
    if (!d) return d.error();

    if (d->negative) {
        return CodecError::not_representable("'" + m->matched + "' is negative");
    }
    auto value = integer_magnitude(*d, m->matched);
    if (!value) return value.error();

    return ReadOutput<std::uint64_t>{*value, std::string(input.substr(m->end))};
}

} // namespace numeral
