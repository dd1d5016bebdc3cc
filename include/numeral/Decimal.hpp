/**
 * @file Decimal.hpp
 * @brief Exact base-10 digit representation used by the writer and reader
 *
 * A Decimal is sign + digit string + power of ten:
 *
 *     value = (negative ? -1 : 1) * digits * 10^exponent
 *
 * Decimals are kept normalized: no leading zeros, no trailing zeros (they are
 * moved into the exponent), and zero is the empty digit string. Doubles are
 * converted through their shortest round-trip representation, so the digits
 * of a Decimal built from 0.1 are "1" and not the 55 digits of the binary
 * value.
 *
 * Rounding happens on the digit string, which makes ties exact:
 * ```cpp
 * Decimal d = decimal_from_double(-194.455);   // digits "194455", exponent -3
 * round_decimal(d, 2, RoundingMode::HalfExpand); // -194.46
 * ```
 */

#ifndef NUMERAL_DECIMAL_HPP
#define NUMERAL_DECIMAL_HPP

#include "numeral/Policies.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace numeral {

struct Decimal {
    bool negative = false;
    std::string digits;   ///< significant digits, no leading or trailing zeros
    long exponent = 0;    ///< power of ten applied to digits

    bool is_zero() const noexcept { return digits.empty(); }

    bool operator==(const Decimal& other) const {
        return negative == other.negative && digits == other.digits &&
               exponent == other.exponent;
    }
    bool operator!=(const Decimal& other) const { return !(*this == other); }
};

/**
 * @brief Strip leading and trailing zeros; zero becomes positive with exponent 0
 */
Decimal normalize(Decimal d);

/**
 * @brief Shortest digits that read back as @p value
 * @pre @p value is finite
 */
Decimal decimal_from_double(double value);

Decimal decimal_from_integer(std::int64_t value);
Decimal decimal_from_integer(std::uint64_t value);

/**
 * @brief Position of the most significant digit (0 for units, -1 for tenths)
 * @pre !d.is_zero()
 */
long magnitude(const Decimal& d);

/**
 * @brief Multiply by 10^places (exact)
 */
Decimal shift(Decimal d, long places);

/**
 * @brief Round to @p fractional_digits digits after the decimal point
 *
 * The result is normalized. A value that rounds to zero loses its sign.
 */
Decimal round_decimal(const Decimal& d, std::size_t fractional_digits, RoundingMode mode);

/**
 * @brief Digits left of the decimal point, empty when |d| < 1
 */
std::string integer_digits(const Decimal& d);

/**
 * @brief Digits right of the decimal point, without trailing zeros
 */
std::string fractional_digits(const Decimal& d);

/**
 * @brief Plain decimal text ("-12.5", "0", "0.001"), used in messages
 */
std::string to_string(const Decimal& d);

} // namespace numeral

#endif // NUMERAL_DECIMAL_HPP
