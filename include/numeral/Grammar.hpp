/**
 * @file Grammar.hpp
 * @brief Translation of NumberFormatOptions into a prefix-matching Pattern
 *
 * The grammar is the concatenation of four independent sub-grammars, each
 * contributing exactly one capture group:
 *
 *     (sign)(integer part)(?:sep(fractional digits))?(?:e(exponent))?
 *
 * Matching is anchored at the start of the input and never requires the
 * whole input to be consumed, so "10.30foo" matches "10.30" and leaves
 * "foo". The alternatives of each sub-grammar are ordered so that the first
 * match found is the longest valid numeral.
 *
 * Pattern does not run the regular expression: it walks the same four parts
 * with a single forward scan, so matching takes time linear in the input and
 * constant stack depth. grammar_source() is the textual form of what the
 * scanner accepts.
 *
 * Examples (UK style, 2 fractional digits):
 * - "1,048.50 EUR" -> "1,048.50"
 * - "0.50"         -> "0.50"
 * - "01.50"        -> no match
 * - "10.3foo"      -> no match (two fractional digits required)
 */

#ifndef NUMERAL_GRAMMAR_HPP
#define NUMERAL_GRAMMAR_HPP

#include "numeral/Options.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace numeral {

/**
 * @brief Groups captured by a successful match
 */
struct PatternMatch {
    std::string matched;          ///< full matched text
    std::size_t end = 0;          ///< index of the first unmatched character
    std::string sign;             ///< "", "+" or "-"
    std::string integer_part;     ///< as written, thousand separators included
    std::string fractional_part;  ///< digits after the fractional separator
    std::string exponent;         ///< optionally signed digits after the letter
};

/**
 * @brief Numeral scanner for one NumberFormatOptions
 *
 * Immutable after construction and safe to share between threads.
 */
class Pattern {
public:
    explicit Pattern(const NumberFormatOptions& options);

    /**
     * @brief Longest valid numeral at the start of @p input
     * @return The match, or std::nullopt if no numeral starts the input
     */
    std::optional<PatternMatch> match_prefix(std::string_view input) const;

    /**
     * @brief True when the whole of @p input is one valid numeral
     */
    bool matches(std::string_view input) const;

    /// ECMAScript form of the grammar this Pattern scans
    const std::string& source() const noexcept { return source_; }

    const NumberFormatOptions& options() const noexcept { return options_; }

private:
    std::optional<PatternMatch> accept(PatternMatch m) const;

    NumberFormatOptions options_;
    std::string source_;
};

/**
 * @brief ECMAScript regular expression recognizing numerals of @p options
 *
 * The expression is not anchored. Searched with match_continuous, its first
 * match has the same text and groups as Pattern::match_prefix() before the
 * final checks (empty numeral, zero mantissa with a fraction).
 */
std::string grammar_source(const NumberFormatOptions& options);

/**
 * @brief Build a fresh Pattern
 */
std::shared_ptr<const Pattern> build_pattern(const NumberFormatOptions& options);

/// Most patterns cached_pattern() keeps; the least recently used goes first
inline constexpr std::size_t pattern_cache_capacity = 30;

/**
 * @brief Build once per distinct options_id() and reuse afterwards
 *
 * Thread-safe. Two threads racing on the same options may both build;
 * the first inserted Pattern wins and both results are equivalent. Holders
 * of an evicted Pattern keep it alive through the shared_ptr.
 */
std::shared_ptr<const Pattern> cached_pattern(const NumberFormatOptions& options);

/// Number of patterns currently cached
std::size_t pattern_cache_size();

} // namespace numeral

#endif // NUMERAL_GRAMMAR_HPP
