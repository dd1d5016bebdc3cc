/**
 * @file Commands.hpp
 * @brief Subcommands of the numeral command-line tool
 *
 * main() only parses arguments; the work of each subcommand lives here so
 * it can be called with any output streams:
 *
 * ```cpp
 * auto f = select_format("ukFloatingPoint2", {});
 * read_command(f, "10.30foo", std::cout, std::cerr);
 * // {
 * //   "rest": "foo",
 * //   "value": 10.3
 * // }
 * ```
 *
 * Codec failures are reported on the error stream as
 * "Error: <kind>: <message>" with exit code 1. Bad command-line input (an
 * unknown format, value text that is not a number) throws.
 */

#ifndef NUMERAL_COMMANDS_HPP
#define NUMERAL_COMMANDS_HPP

#include "numeral/Catalog.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <ostream>
#include <string>

namespace numeral {

/**
 * @brief Format chosen on the command line: a decimal format or a radix
 *
 * Exactly one of entry and radix is set.
 */
struct SelectedFormat {
    std::string name;
    std::optional<FormatEntry> entry;
    std::optional<unsigned> radix;
};

/**
 * @brief Resolve @p name against file formats, then radix names, then the catalog
 * @throws UnknownFormatError if no format has that name
 */
SelectedFormat select_format(const std::string& name,
                             const std::map<std::string, FormatEntry>& file_formats);

/**
 * @brief Radix codec chosen with --radix
 * @throws ConfigurationError unless @p radix is 2, 8 or 16
 */
SelectedFormat select_radix(unsigned radix);

/**
 * @brief Replace the value kind of a decimal format ("real", "int", "unsigned")
 * @throws ConfigurationError for an unknown kind or a radix format
 */
void override_kind(SelectedFormat& format, const std::string& kind);

/// @throws std::invalid_argument unless all of @p text is a real number
double parse_real(const std::string& text);

/// @throws std::invalid_argument unless all of @p text is a 64-bit integer
std::int64_t parse_signed(const std::string& text);

/// @throws std::invalid_argument unless all of @p text is an unsigned 64-bit integer
std::uint64_t parse_unsigned(const std::string& text);

/// One line summary, e.g. "binary unsigned integer"
std::string description(const SelectedFormat& format);

/// Print {"value", "rest"} as JSON, or report the codec error
int read_command(const SelectedFormat& format, const std::string& text,
                 std::ostream& out, std::ostream& err);

/// Print the numeral for @p value_text, or report the codec error
int write_command(const SelectedFormat& format, const std::string& value_text,
                  std::ostream& out, std::ostream& err);

/// Print "true" when the whole of @p text is one numeral, else "false" (exit 1)
int test_command(const SelectedFormat& format, const std::string& text, std::ostream& out);

/// Print the description and, for decimal formats, the options as JSON
int describe_command(const SelectedFormat& format, std::ostream& out);

/// Print every catalog format, the radix names, then @p file_formats
int list_command(const std::map<std::string, FormatEntry>& file_formats, std::ostream& out);

} // namespace numeral

#endif // NUMERAL_COMMANDS_HPP
