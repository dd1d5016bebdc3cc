/**
 * @file Reader.hpp
 * @brief Prefix readers: Pattern match followed by base-10 conversion
 *
 * Every reader first asks the Pattern for the longest numeral at the start of
 * the input (NoMatch when there is none) and then converts the captured
 * groups. Conversion never re-validates formatting; it only fails when the
 * numeral does not fit the target type (NotRepresentable):
 * - read_real: infinite or underflowing magnitude
 * - read_signed: non-integer value or outside int64 range
 * - read_unsigned: non-integer, negative or above uint64 range
 *
 * The remainder of a successful read is the input after the matched prefix.
 */

#ifndef NUMERAL_READER_HPP
#define NUMERAL_READER_HPP

#include "numeral/Decimal.hpp"
#include "numeral/Grammar.hpp"
#include "numeral/Result.hpp"

#include <cstdint>
#include <string_view>

namespace numeral {

/**
 * @brief Exact value of a match
 *
 * Thousand separators are stripped from the integer part; the exponent is
 * folded into the Decimal exponent.
 *
 * @return NotRepresentable when the exponent overflows
 */
Result<Decimal> match_to_decimal(const PatternMatch& match, const NumberFormatOptions& options);

ReadResult<double> read_real(const Pattern& pattern, std::string_view input);
ReadResult<std::int64_t> read_signed(const Pattern& pattern, std::string_view input);
ReadResult<std::uint64_t> read_unsigned(const Pattern& pattern, std::string_view input);

} // namespace numeral

#endif // NUMERAL_READER_HPP
