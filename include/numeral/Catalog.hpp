/**
 * @file Catalog.hpp
 * @brief Named, ready-made transformers
 *
 * Every preset is built once, on first use, and shared read-only afterwards.
 * Decimal presets are also registered by name (camelCase, e.g.
 * "ukFloatingPoint2") so that format files and the CLI can refer to them.
 *
 * Locale separators (thousand / fractional):
 * - plain:  none / '.'
 * - UK:     ','  / '.'
 * - German: '.'  / ','
 * - French: ' '  / ','
 *
 * Real presets keep at most 4 fractional digits, the "2" variants exactly 2.
 * Integer presets come in three sign flavours: plain (optional '-'),
 * signed (mandatory '+' or '-') and plussed (optional '+' or '-').
 *
 * Examples:
 * ```cpp
 * catalog::uk_int().write(1048);                     // "1,048"
 * catalog::signed_uk_int().write(0);                 // "+0"
 * catalog::french_scientific_notation().write(10034538); // "1,0035e7"
 * catalog::binary().read("00118foo");                // {3, "8foo"}
 * ```
 */

#ifndef NUMERAL_CATALOG_HPP
#define NUMERAL_CATALOG_HPP

#include "numeral/Options.hpp"
#include "numeral/Transformer.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace numeral {

/**
 * @brief Value type a decimal format is read into and written from
 */
enum class ValueKind {
    Real,      ///< double
    Signed,    ///< std::int64_t
    Unsigned   ///< std::uint64_t
};

/// "real", "int" or "unsigned"
const char* to_string(ValueKind kind);

/**
 * @throws ConfigurationError for a name other than "real", "int", "unsigned"
 */
ValueKind value_kind_from_string(const std::string& name);

/**
 * @brief Registered decimal format
 */
struct FormatEntry {
    NumberFormatOptions options;
    ValueKind kind;
};

namespace catalog {

// Reals
const Transformer<double>& floating_point();
const Transformer<double>& uk_floating_point();
const Transformer<double>& german_floating_point();
const Transformer<double>& french_floating_point();
const Transformer<double>& floating_point2();
const Transformer<double>& uk_floating_point2();
const Transformer<double>& german_floating_point2();
const Transformer<double>& french_floating_point2();
const Transformer<double>& scientific_notation();
const Transformer<double>& uk_scientific_notation();
const Transformer<double>& german_scientific_notation();
const Transformer<double>& french_scientific_notation();
const Transformer<double>& strict_scientific_notation();
const Transformer<double>& engineering_notation();
const Transformer<double>& fractional();
const Transformer<double>& uk_fractional();
const Transformer<double>& german_fractional();
const Transformer<double>& french_fractional();

// Signed integers
const Transformer<std::int64_t>& int_standard();
const Transformer<std::int64_t>& signed_int();
const Transformer<std::int64_t>& plussed_int();
const Transformer<std::int64_t>& uk_int();
const Transformer<std::int64_t>& signed_uk_int();
const Transformer<std::int64_t>& plussed_uk_int();
const Transformer<std::int64_t>& german_int();
const Transformer<std::int64_t>& signed_german_int();
const Transformer<std::int64_t>& plussed_german_int();
const Transformer<std::int64_t>& french_int();
const Transformer<std::int64_t>& signed_french_int();
const Transformer<std::int64_t>& plussed_french_int();

// Unsigned integers
const Transformer<std::uint64_t>& unsigned_int();
const Transformer<std::uint64_t>& unsigned_uk_int();
const Transformer<std::uint64_t>& unsigned_german_int();
const Transformer<std::uint64_t>& unsigned_french_int();
const Transformer<std::uint64_t>& binary();
const Transformer<std::uint64_t>& octal();
const Transformer<std::uint64_t>& hexadecimal();

// Strings
const Transformer<std::string>& plain_string();

/**
 * @brief All registered decimal formats, keyed by camelCase name
 */
const std::map<std::string, FormatEntry>& formats();

/**
 * @brief Sorted names of the registered decimal formats
 */
std::vector<std::string> format_names();

/**
 * @throws UnknownFormatError if @p name is not registered
 */
const FormatEntry& find_format(const std::string& name);

/**
 * @brief Radix of "binary", "octal" or "hexadecimal"
 */
std::optional<unsigned> find_radix(const std::string& name);

} // namespace catalog

} // namespace numeral

#endif // NUMERAL_CATALOG_HPP
