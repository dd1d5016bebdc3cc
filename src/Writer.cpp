/**
 * @file Writer.cpp
 * @brief Writer implementation
 */

#include "numeral/Writer.hpp"

#include <cmath>
#include <optional>

namespace numeral {

namespace {

/**
 * @brief Insert @p sep every 3 digits from the right
 */
std::string group_digits(const std::string& digits, std::optional<char> sep) {
    if (!sep || digits.size() <= 3) {
        return digits;
    }
    std::size_t lead = digits.size() % 3;
    if (lead == 0) lead = 3;

    std::string out = digits.substr(0, lead);
    for (std::size_t i = lead; i < digits.size(); i += 3) {
        out += *sep;
        out += digits.substr(i, 3);
    }
    return out;
}

const char* sign_text(SignPolicy policy, bool negative) {
    if (negative) return "-";
    return policy == SignPolicy::MandatoryPlusOrMinus ? "+" : "";
}

CodecError not_representable(const NumberFormatOptions& options, const Decimal& value,
                             const std::string& reason) {
    return CodecError::not_representable("cannot write " + to_string(value) + " as " +
                                         describe(options) + ": " + reason);
}

/// Largest multiple of 3 not above @p n
long floor_to_multiple_of_3(long n) {
    return n >= 0 ? n / 3 * 3 : -((-n + 2) / 3 * 3);
}

} // namespace

WriteResult write_decimal(const NumberFormatOptions& o, const Decimal& value) {
    const ScientificNotation sci = o.scientific_notation();

    Decimal rounded;
    long exp10 = 0;
    if (sci == ScientificNotation::None) {
        rounded = round_decimal(value, o.max_fractional_digits(), o.rounding_mode());
    } else if (value.is_zero()) {
        if (sci == ScientificNotation::StrictNormalized) {
            return not_representable(o, value, "zero has no normalized mantissa");
        }
    } else {
        const long range = sci == ScientificNotation::Engineering ? 3 : 1;
        exp10 = range == 3 ? floor_to_multiple_of_3(magnitude(value)) : magnitude(value);
        rounded = round_decimal(shift(value, -exp10), o.max_fractional_digits(), o.rounding_mode());
        // 9.99996 rounds to 10.0000
        if (magnitude(rounded) >= range) {
            exp10 += range;
            rounded = shift(rounded, -range);
        }
    }

    if (rounded.negative && o.sign_policy() == SignPolicy::Forbidden) {
        return not_representable(o, value, "negative values need a sign");
    }

    const std::string int_part = integer_digits(rounded);
    std::string frac_part = fractional_digits(rounded);

    if (o.is_fractional_only()) {
        if (!int_part.empty()) {
            return not_representable(o, value, "absolute value must be below 1");
        }
    } else if (!int_part.empty() && sci == ScientificNotation::None) {
        if (int_part.size() > o.max_integer_part_digits()) {
            return not_representable(o, value, "more than " + std::to_string(o.max_integer_part_digits()) +
                                               " integer digits");
        }
        if (int_part.size() < o.min_integer_part_digits()) {
            return not_representable(o, value, "fewer than " + std::to_string(o.min_integer_part_digits()) +
                                               " integer digits");
        }
    }

    if (frac_part.size() < o.min_fractional_digits()) {
        frac_part.append(o.min_fractional_digits() - frac_part.size(), '0');
    }

    std::string out = sign_text(o.sign_policy(), rounded.negative);
    if (!o.is_fractional_only()) {
        const std::string digits = int_part.empty() ? "0" : int_part;
        out += sci == ScientificNotation::None ? group_digits(digits, o.thousand_separator()) : digits;
    } else if (frac_part.empty()) {
        // zero without fractional digits
        out += '0';
    }
    if (!frac_part.empty()) {
        out += o.fractional_separator();
        out += frac_part;
    }
    if (sci != ScientificNotation::None) {
        out += o.exponent_letter();
        out += std::to_string(exp10);
    }
    return out;
}

WriteResult write_real(const NumberFormatOptions& options, double value) {
    if (!std::isfinite(value)) {
        return CodecError::not_representable("cannot write non-finite value as " + describe(options));
    }
    return write_decimal(options, decimal_from_double(value));
}

WriteResult write_signed(const NumberFormatOptions& options, std::int64_t value) {
    return write_decimal(options, decimal_from_integer(value));
}

WriteResult write_unsigned(const NumberFormatOptions& options, std::uint64_t value) {
    return write_decimal(options, decimal_from_integer(value));
}

} // namespace numeral
