/**
 * @file Options.hpp
 * @brief Number format configuration
 *
 * NumberFormatOptions is the sole input of the grammar builder and of the
 * writer. Instances are immutable and can only be produced by
 * with_defaults(), which fills unset fields of a PartialOptions and rejects
 * self-contradictory combinations with a ConfigurationError.
 *
 * Defaults:
 * - sign_policy = MinusOptional
 * - e_notation_policy = Forbidden
 * - scientific_notation = None
 * - rounding_mode = HalfExpand (round half away from zero)
 * - thousand_separator = none
 * - fractional_separator = '.'
 * - min_fractional_digits = 0, max_fractional_digits = unbounded
 * - min_integer_part_digits = 1, max_integer_part_digits = unbounded
 *
 * Examples:
 * ```cpp
 * PartialOptions p;
 * p.thousand_separator = ',';
 * p.min_fractional_digits = 2;
 * p.max_fractional_digits = 2;
 * NumberFormatOptions uk2 = with_defaults(p);
 *
 * p.max_fractional_digits = 1;
 * with_defaults(p); // throws ConfigurationError (max < min)
 * ```
 */

#ifndef NUMERAL_OPTIONS_HPP
#define NUMERAL_OPTIONS_HPP

#include "numeral/Policies.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <limits>
#include <optional>
#include <string>

namespace numeral {

/**
 * @brief Digit bound meaning "no upper limit"
 */
inline constexpr std::size_t unbounded = std::numeric_limits<std::size_t>::max();

/**
 * @brief Format options where every field may be left unset
 *
 * thousand_separator has no distinct "unset" state: leaving it empty means
 * no separator, which is also the default.
 */
struct PartialOptions {
    std::optional<SignPolicy> sign_policy;
    std::optional<ENotationPolicy> e_notation_policy;
    std::optional<ScientificNotation> scientific_notation;
    std::optional<RoundingMode> rounding_mode;
    std::optional<char> thousand_separator;
    std::optional<char> fractional_separator;
    std::optional<std::size_t> min_fractional_digits;
    std::optional<std::size_t> max_fractional_digits;
    std::optional<std::size_t> min_integer_part_digits;
    std::optional<std::size_t> max_integer_part_digits;
};

class NumberFormatOptions;

/**
 * @brief Fill unset fields with defaults and validate the result
 * @throws ConfigurationError listing every violated constraint
 */
NumberFormatOptions with_defaults(const PartialOptions& partial);

/**
 * @brief Validated, immutable number format
 */
class NumberFormatOptions {
public:
    SignPolicy sign_policy() const noexcept { return sign_policy_; }
    ENotationPolicy e_notation_policy() const noexcept { return e_notation_policy_; }
    ScientificNotation scientific_notation() const noexcept { return scientific_notation_; }
    RoundingMode rounding_mode() const noexcept { return rounding_mode_; }
    std::optional<char> thousand_separator() const noexcept { return thousand_separator_; }
    char fractional_separator() const noexcept { return fractional_separator_; }
    std::size_t min_fractional_digits() const noexcept { return min_fractional_digits_; }
    std::size_t max_fractional_digits() const noexcept { return max_fractional_digits_; }
    std::size_t min_integer_part_digits() const noexcept { return min_integer_part_digits_; }
    std::size_t max_integer_part_digits() const noexcept { return max_integer_part_digits_; }

    /// True when a fractional part may appear (max_fractional_digits > 0)
    bool allows_fraction() const noexcept { return max_fractional_digits_ > 0; }

    /// True when the integer part never appears (max_integer_part_digits == 0)
    bool is_fractional_only() const noexcept { return max_integer_part_digits_ == 0; }

    bool uses_scientific_notation() const noexcept {
        return scientific_notation_ != ScientificNotation::None;
    }

    /// Exponent letter, or '\0' when e-notation is forbidden
    char exponent_letter() const noexcept { return numeral::exponent_letter(e_notation_policy_); }

    /// Copy of this format as a PartialOptions with every field set
    PartialOptions to_partial() const;

    bool operator==(const NumberFormatOptions& other) const noexcept;
    bool operator!=(const NumberFormatOptions& other) const noexcept { return !(*this == other); }

private:
    friend NumberFormatOptions with_defaults(const PartialOptions& partial);

    NumberFormatOptions() = default;

    SignPolicy sign_policy_ = SignPolicy::MinusOptional;
    ENotationPolicy e_notation_policy_ = ENotationPolicy::Forbidden;
    ScientificNotation scientific_notation_ = ScientificNotation::None;
    RoundingMode rounding_mode_ = RoundingMode::HalfExpand;
    std::optional<char> thousand_separator_;
    char fractional_separator_ = '.';
    std::size_t min_fractional_digits_ = 0;
    std::size_t max_fractional_digits_ = unbounded;
    std::size_t min_integer_part_digits_ = 1;
    std::size_t max_integer_part_digits_ = unbounded;
};

/**
 * @brief Stable textual key of @p options (cache key, Transformer name)
 */
std::string options_id(const NumberFormatOptions& options);

/**
 * @brief Human description, e.g. "signed UK-style integer"
 *
 * Built from: sign ("signed " / "unsigned " / "potentially signed "),
 * locale style ("UK-style ", "German-style ", "French-style " or nothing),
 * kind ("integer", "N-decimal number", "fractional number", "number") and
 * scientific notation (" in normalized scientific notation", ...).
 */
std::string describe(const NumberFormatOptions& options);

// ============================================================================
// JSON configuration surface
// ============================================================================

/**
 * @brief Read a PartialOptions from a JSON object
 *
 * Recognized keys: signPolicy, eNotationPolicy, scientificNotation,
 * roundingMode, thousandSeparator (one-character string or null),
 * fractionalSeparator, minFractionalDigits, maxFractionalDigits (integer or
 * "unbounded"), minIntegerPartDigits, maxIntegerPartDigits (integer or
 * "unbounded"). Fields absent from @p j are taken from @p base.
 *
 * @throws ConfigurationError on unknown keys, wrong types or unknown names
 */
PartialOptions partial_options_from_json(const nlohmann::json& j,
                                         const PartialOptions& base = PartialOptions{});

/**
 * @brief Serialize options using the keys of partial_options_from_json()
 */
void to_json(nlohmann::json& j, const NumberFormatOptions& options);

} // namespace numeral

#endif // NUMERAL_OPTIONS_HPP
