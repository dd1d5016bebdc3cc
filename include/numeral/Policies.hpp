/**
 * @file Policies.hpp
 * @brief Closed enumerations describing how a numeral is rendered
 *
 * - SignPolicy: whether/how a sign prefixes the numeral
 * - ENotationPolicy: whether an exponent suffix may appear, and its letter
 * - ScientificNotation: whether the writer normalizes to mantissa x 10^n
 * - RoundingMode: how the writer drops fractional digits
 *
 * Each enumeration has a stable textual name used by the JSON/TOML
 * configuration surface (see Options.hpp) and by the CLI.
 */

#ifndef NUMERAL_POLICIES_HPP
#define NUMERAL_POLICIES_HPP

#include <string>

namespace numeral {

/**
 * @brief Sign rendering rules
 *
 * | Policy               | Read             | Write                      |
 * |----------------------|------------------|----------------------------|
 * | Forbidden            | no sign          | negatives not representable|
 * | MinusOptional        | optional '-'     | '-' for negatives          |
 * | MandatoryPlusOrMinus | '+' or '-'       | '+' for >= 0, '-' otherwise|
 * | PlusMinusOptional    | optional '+'/'-' | '-' for negatives          |
 */
enum class SignPolicy {
    Forbidden,
    MinusOptional,
    MandatoryPlusOrMinus,
    PlusMinusOptional
};

/**
 * @brief Exponent suffix rules
 */
enum class ENotationPolicy {
    Forbidden,
    LowercaseE,
    UppercaseE
};

/**
 * @brief Mantissa normalization applied by the writer
 *
 * None never writes an exponent. Normalized writes 1 <= |m| < 10 (zero as
 * "0e0"), StrictNormalized does the same but cannot represent zero, and
 * Engineering writes 1 <= |m| < 1000 with an exponent multiple of 3.
 */
enum class ScientificNotation {
    None,
    Normalized,
    StrictNormalized,
    Engineering
};

/**
 * @brief Rounding applied when dropping fractional digits
 *
 * Directed modes: Ceil (towards +inf), Floor (towards -inf), Expand (away
 * from zero), Trunc (towards zero). Half modes round to nearest and break
 * ties the way their suffix says; HalfEven breaks ties to the even digit.
 */
enum class RoundingMode {
    Ceil,
    Floor,
    Expand,
    Trunc,
    HalfCeil,
    HalfFloor,
    HalfExpand,
    HalfTrunc,
    HalfEven
};

const char* to_string(SignPolicy policy);
const char* to_string(ENotationPolicy policy);
const char* to_string(ScientificNotation notation);
const char* to_string(RoundingMode mode);

/**
 * @brief Parse a policy from its textual name
 *
 * Accepted names:
 * - SignPolicy: "forbidden", "minusOptional", "mandatory", "plusMinusOptional"
 * - ENotationPolicy: "forbidden", "lowercase", "uppercase"
 * - ScientificNotation: "none", "normalized", "strictNormalized", "engineering"
 * - RoundingMode: "ceil", "floor", "expand", "trunc", "halfCeil",
 *   "halfFloor", "halfExpand", "halfTrunc", "halfEven"
 *
 * @throws ConfigurationError for an unknown name
 */
SignPolicy sign_policy_from_string(const std::string& name);
ENotationPolicy e_notation_policy_from_string(const std::string& name);
ScientificNotation scientific_notation_from_string(const std::string& name);
RoundingMode rounding_mode_from_string(const std::string& name);

/**
 * @brief Exponent letter for @p policy, or '\0' when Forbidden
 */
char exponent_letter(ENotationPolicy policy);

} // namespace numeral

#endif // NUMERAL_POLICIES_HPP
