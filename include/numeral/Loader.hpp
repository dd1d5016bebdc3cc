/**
 * @file Loader.hpp
 * @brief Named number formats from JSON and TOML files
 *
 * A format file maps format names to option objects. Besides the keys of
 * partial_options_from_json(), each object may carry:
 * - "base": name of a catalog preset whose options are the starting point
 * - "kind": "real", "int" or "unsigned" (defaults to the base's kind, else
 *   "real")
 *
 * JSON:
 * ```json
 * {
 *   "price":  { "base": "ukFloatingPoint2", "roundingMode": "halfEven" },
 *   "amount": { "kind": "int", "thousandSeparator": "'", "maxFractionalDigits": 0 }
 * }
 * ```
 *
 * TOML:
 * ```toml
 * [price]
 * base = "ukFloatingPoint2"
 * roundingMode = "halfEven"
 * ```
 */

#ifndef NUMERAL_LOADER_HPP
#define NUMERAL_LOADER_HPP

#include "numeral/Catalog.hpp"

#include <nlohmann/json.hpp>

#include <map>
#include <string>

namespace numeral {

/**
 * @brief Parse a JSON file
 * @throws FileNotFoundError if the file does not exist
 * @throws FormatParseError on a JSON syntax error
 */
nlohmann::json load_json_file(const std::string& path);

/**
 * @brief Parse a TOML file and convert it to JSON
 *
 * Tables become objects, arrays become arrays, dates and times become
 * strings.
 *
 * @throws FileNotFoundError if the file does not exist
 * @throws FormatParseError on a TOML syntax error
 */
nlohmann::json load_toml_file(const std::string& path);

/**
 * @brief Lowercase extension including the dot (".json"), or empty
 */
std::string get_file_extension(const std::string& path);

/**
 * @brief Build named formats from an already parsed document
 *
 * @param doc Object of format name -> options object
 * @param source File name used in error messages
 * @throws FormatParseError if @p doc or an entry is not an object, or
 *         "base"/"kind" is not a string
 * @throws UnknownFormatError if "base" names no catalog preset
 * @throws ConfigurationError if an entry's options are invalid
 */
std::map<std::string, FormatEntry> formats_from_json(const nlohmann::json& doc,
                                                     const std::string& source);

/**
 * @brief Load named formats from a .json or .toml file
 * @throws FileNotFoundError, FormatParseError, UnknownFormatError,
 *         ConfigurationError (see formats_from_json())
 */
std::map<std::string, FormatEntry> load_format_file(const std::string& path);

} // namespace numeral

#endif // NUMERAL_LOADER_HPP
