/**
 * @file Writer.hpp
 * @brief Rendering of values under a NumberFormatOptions
 *
 * All writers go through write_decimal(), which works on exact digit strings:
 * 1. in scientific notation, normalize to mantissa x 10^n;
 * 2. round to max_fractional_digits with the rounding mode, renormalizing
 *    when the mantissa carries out of its range;
 * 3. reject values the format cannot express (NotRepresentable);
 * 4. pad the fraction to min_fractional_digits, group the integer part,
 *    render the sign and the exponent suffix.
 *
 * Examples:
 * - UK style, 2 decimals:        10034538   -> "10,034,538.00"
 * - default, 2 decimals:         -194.455   -> "-194.46"
 * - French scientific, 4 decimals: 10034538 -> "1,0035e7"
 * - German fractional:           -0.443     -> "-,443"
 */

#ifndef NUMERAL_WRITER_HPP
#define NUMERAL_WRITER_HPP

#include "numeral/Decimal.hpp"
#include "numeral/Options.hpp"
#include "numeral/Result.hpp"

#include <cstdint>

namespace numeral {

WriteResult write_decimal(const NumberFormatOptions& options, const Decimal& value);

/**
 * @brief Write a double
 * @return NotRepresentable for NaN and infinities, otherwise as write_decimal()
 */
WriteResult write_real(const NumberFormatOptions& options, double value);

WriteResult write_signed(const NumberFormatOptions& options, std::int64_t value);
WriteResult write_unsigned(const NumberFormatOptions& options, std::uint64_t value);

} // namespace numeral

#endif // NUMERAL_WRITER_HPP
