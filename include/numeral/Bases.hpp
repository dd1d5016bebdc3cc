/**
 * @file Bases.hpp
 * @brief Unsigned integers in radix 2, 8 and 16
 *
 * No prefixes ("0x", "0b") and no separators. Reading consumes the longest
 * run of digits valid in the radix (hexadecimal letters in either case,
 * leading zeros allowed); writing produces the minimal lowercase form.
 *
 * Examples:
 * - read_radix("00118foo", 2) -> {3, "8foo"}
 * - read_radix("FFz", 16)     -> {255, "z"}
 * - write_radix(255, 16)      -> "ff"
 * - write_radix(0, 8)         -> "0"
 */

#ifndef NUMERAL_BASES_HPP
#define NUMERAL_BASES_HPP

#include "numeral/Result.hpp"
#include "numeral/Transformer.hpp"

#include <cstdint>
#include <string_view>

namespace numeral {

/**
 * @return NoMatch without a leading digit, NotRepresentable above uint64
 */
ReadResult<std::uint64_t> read_radix(std::string_view input, unsigned radix);

WriteResult write_radix(std::uint64_t value, unsigned radix);

/**
 * @brief Transformer for @p radix
 * @throws ConfigurationError unless @p radix is 2, 8 or 16
 */
Transformer<std::uint64_t> radix_transformer(unsigned radix);

} // namespace numeral

#endif // NUMERAL_BASES_HPP
