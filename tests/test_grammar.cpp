/**
 * @file test_grammar.cpp
 * @brief Unit tests for grammar construction and prefix matching (GoogleTest)
 *
 * @copyright (c) 2026. MIT License.
 */

#include <gtest/gtest.h>
#include "numeral/Catalog.hpp"
#include "numeral/Grammar.hpp"

#include <regex>
#include <string>
#include <vector>

using namespace numeral;

namespace {

const NumberFormatOptions& preset(const char* name) {
    return catalog::find_format(name).options;
}

/// Matched prefix, or "<none>"
std::string prefix(const NumberFormatOptions& options, std::string_view input) {
    auto m = cached_pattern(options)->match_prefix(input);
    return m ? m->matched : "<none>";
}

bool whole(const NumberFormatOptions& options, std::string_view input) {
    return cached_pattern(options)->matches(input);
}

NumberFormatOptions integer_bounds(std::size_t lo, std::size_t hi, std::optional<char> sep) {
    PartialOptions p;
    p.min_integer_part_digits = lo;
    p.max_integer_part_digits = hi;
    p.max_fractional_digits = 0;
    p.thousand_separator = sep;
    if (sep == '.') p.fractional_separator = ',';
    return with_defaults(p);
}

NumberFormatOptions numbered(std::size_t i) {
    PartialOptions p;
    p.min_fractional_digits = 1000 + i;
    p.max_fractional_digits = 1000 + i;
    return with_defaults(p);
}

/// First match of grammar_source() under the scanner's final checks
std::string regex_prefix(const NumberFormatOptions& options, const std::regex& re, const std::string& input) {
    std::smatch m;
    if (!std::regex_search(input, m, re, std::regex_constants::match_continuous)) {
        return "<none>";
    }
    const std::string integer_part = m.str(2);
    const std::string fraction = m.str(3);
    if (integer_part.empty() && fraction.empty()) {
        return "<none>";
    }
    const auto notation = options.scientific_notation();
    if ((notation == ScientificNotation::Normalized || notation == ScientificNotation::Engineering) &&
        integer_part == "0" && fraction.find_first_not_of('0') != std::string::npos) {
        return "<none>";
    }
    return m.str(0);
}

/// Every string of up to @p length characters drawn from @p alphabet
std::vector<std::string> all_strings(const std::string& alphabet, std::size_t length) {
    std::vector<std::string> out{""};
    std::size_t from = 0;
    for (std::size_t n = 1; n <= length; ++n) {
        const std::size_t to = out.size();
        for (std::size_t i = from; i < to; ++i) {
            for (char c : alphabet) out.push_back(out[i] + c);
        }
        from = to;
    }
    return out;
}

} // namespace

// ============================================================================
// Captured groups
// ============================================================================

TEST(PatternMatch, CapturesEveryPart) {
    auto m = cached_pattern(preset("ukFloatingPoint2"))->match_prefix("-1,048.50 EUR");
    ASSERT_TRUE(m.has_value());
    EXPECT_EQ(m->matched, "-1,048.50");
    EXPECT_EQ(m->end, 9u);
    EXPECT_EQ(m->sign, "-");
    EXPECT_EQ(m->integer_part, "1,048");
    EXPECT_EQ(m->fractional_part, "50");
    EXPECT_EQ(m->exponent, "");
}

TEST(PatternMatch, CapturesExponent) {
    auto m = cached_pattern(preset("scientificNotation"))->match_prefix("1.5e-3x");
    ASSERT_TRUE(m.has_value());
    EXPECT_EQ(m->matched, "1.5e-3");
    EXPECT_EQ(m->integer_part, "1");
    EXPECT_EQ(m->fractional_part, "5");
    EXPECT_EQ(m->exponent, "-3");
}

// ============================================================================
// Fractional part
// ============================================================================

TEST(PatternMatch, ExactFractionalDigitsRequired) {
    EXPECT_EQ(prefix(preset("ukFloatingPoint2"), "10.3foo"), "<none>");
    EXPECT_EQ(prefix(preset("ukFloatingPoint2"), "10.30foo"), "10.30");
    EXPECT_EQ(prefix(preset("ukFloatingPoint2"), "10foo"), "<none>");
}

TEST(PatternMatch, FractionalDigitsStopAtMaximum) {
    EXPECT_EQ(prefix(preset("ukFloatingPoint2"), "-10.321foo"), "-10.32");
    EXPECT_EQ(prefix(preset("floatingPoint"), "1.234567"), "1.2345");
}

TEST(PatternMatch, OptionalFractionNeedsDigits) {
    EXPECT_EQ(prefix(preset("floatingPoint"), "12.x"), "12");
    EXPECT_EQ(prefix(preset("floatingPoint"), "12."), "12");
}

TEST(PatternMatch, IntegerOnlyFormatStopsAtSeparator) {
    EXPECT_EQ(prefix(preset("int"), "12.5"), "12");
}

// ============================================================================
// Integer part
// ============================================================================

TEST(PatternMatch, LeadingZeroEndsIntegerPart) {
    EXPECT_EQ(prefix(preset("floatingPoint"), "01.1foo"), "0");
    EXPECT_EQ(prefix(preset("ukFloatingPoint2"), "01.50"), "<none>");
    EXPECT_EQ(prefix(preset("int"), "007"), "0");
}

TEST(PatternMatch, ThousandGroupsOfThree) {
    EXPECT_EQ(prefix(preset("ukInt"), "1,234,567x"), "1,234,567");
    EXPECT_EQ(prefix(preset("ukInt"), "12,34"), "12");
    EXPECT_EQ(prefix(preset("ukInt"), "123,4567"), "123,456");
    EXPECT_EQ(prefix(preset("germanInt"), "1.234.567"), "1.234.567");
    EXPECT_EQ(prefix(preset("frenchInt"), "1 234 567"), "1 234 567");
    EXPECT_EQ(prefix(preset("ukInt"), "0,123"), "0");
}

TEST(PatternMatch, GermanSeparatorsAreLiteral) {
    auto m = cached_pattern(preset("germanFloatingPoint"))->match_prefix("1.234,5");
    ASSERT_TRUE(m.has_value());
    EXPECT_EQ(m->integer_part, "1.234");
    EXPECT_EQ(m->fractional_part, "5");
    // '.' must not match an arbitrary character
    EXPECT_EQ(prefix(preset("germanInt"), "1x234"), "1");
}

TEST(PatternMatch, PlainIntegerDigitBounds) {
    NumberFormatOptions o = integer_bounds(2, 3, std::nullopt);
    EXPECT_EQ(prefix(o, "12"), "12");
    EXPECT_EQ(prefix(o, "1234"), "123");
    EXPECT_EQ(prefix(o, "1"), "<none>");
    EXPECT_EQ(prefix(o, "0"), "0");
}

TEST(PatternMatch, GroupedIntegerDigitBounds) {
    NumberFormatOptions o = integer_bounds(1, 4, ',');
    EXPECT_EQ(prefix(o, "1,234"), "1,234");
    EXPECT_EQ(prefix(o, "12,345"), "12");
    EXPECT_EQ(prefix(o, "1,234,567"), "1,234");

    NumberFormatOptions at_least_four = integer_bounds(4, unbounded, '.');
    EXPECT_EQ(prefix(at_least_four, "123"), "<none>");
    EXPECT_EQ(prefix(at_least_four, "1.234"), "1.234");
    EXPECT_EQ(prefix(at_least_four, "0"), "0");
}

TEST(PatternMatch, OptionalIntegerPart) {
    PartialOptions p;
    p.min_integer_part_digits = 0;
    NumberFormatOptions o = with_defaults(p);
    auto m = cached_pattern(o)->match_prefix(".5");
    ASSERT_TRUE(m.has_value());
    EXPECT_EQ(m->integer_part, "");
    EXPECT_EQ(m->fractional_part, "5");
    EXPECT_EQ(prefix(o, "-"), "<none>");
    EXPECT_EQ(prefix(o, "."), "<none>");
}

TEST(PatternMatch, FractionalOnlyFormat) {
    EXPECT_EQ(prefix(preset("germanFractional"), "-,234e3foo"), "-,234");
    EXPECT_EQ(prefix(preset("germanFractional"), "0,5"), "0,5");
    EXPECT_EQ(prefix(preset("germanFractional"), "10,3foo"), "<none>");
    EXPECT_EQ(prefix(preset("germanFractional"), "0"), "0");
    EXPECT_EQ(prefix(preset("germanFractional"), "-0x"), "-0");
    EXPECT_TRUE(whole(preset("ukFractional"), "0"));
}

TEST(PatternMatch, NormalizedMantissaIsOneDigit) {
    EXPECT_EQ(prefix(preset("frenchScientificNotation"), "10,3foo"), "1");
    EXPECT_EQ(prefix(preset("frenchScientificNotation"), "1,0035e7"), "1,0035e7");
    EXPECT_EQ(prefix(preset("scientificNotation"), "0e0"), "0e0");
    EXPECT_EQ(prefix(preset("strictScientificNotation"), "0e0"), "<none>");
    EXPECT_EQ(prefix(preset("engineeringNotation"), "123.45e3"), "123.45e3");
    EXPECT_EQ(prefix(preset("engineeringNotation"), "1234"), "123");
}

TEST(PatternMatch, ZeroMantissaOnlyForZero) {
    EXPECT_EQ(prefix(preset("scientificNotation"), "0.5e3"), "<none>");
    EXPECT_EQ(prefix(preset("frenchScientificNotation"), "0,1e2"), "<none>");
    EXPECT_EQ(prefix(preset("engineeringNotation"), "0.0001e6"), "<none>");
    EXPECT_EQ(prefix(preset("scientificNotation"), "0.0e3"), "0.0e3");
    EXPECT_EQ(prefix(preset("engineeringNotation"), "0e0"), "0e0");
    EXPECT_FALSE(whole(preset("scientificNotation"), "0.5"));
}

// ============================================================================
// Sign and exponent
// ============================================================================

TEST(PatternMatch, SignPolicies) {
    EXPECT_EQ(prefix(preset("signedUkInt"), "10foo"), "<none>");
    EXPECT_EQ(prefix(preset("signedUkInt"), "+10foo"), "+10");
    EXPECT_EQ(prefix(preset("signedUkInt"), "-10foo"), "-10");
    EXPECT_EQ(prefix(preset("ukInt"), "+10"), "<none>");
    EXPECT_EQ(prefix(preset("plussedUkInt"), "+10"), "+10");
    EXPECT_EQ(prefix(preset("plussedUkInt"), "10"), "10");
    EXPECT_EQ(prefix(preset("unsignedInt"), "-5"), "<none>");
}

TEST(PatternMatch, ExponentIsOptional) {
    EXPECT_EQ(prefix(preset("scientificNotation"), "1.5e"), "1.5");
    EXPECT_EQ(prefix(preset("scientificNotation"), "1.5E3"), "1.5");
    EXPECT_EQ(prefix(preset("scientificNotation"), "1.5e+12"), "1.5e+12");
    EXPECT_EQ(prefix(preset("floatingPoint"), "1.5e3"), "1.5");
}

TEST(PatternMatch, NothingToMatch) {
    EXPECT_EQ(prefix(preset("floatingPoint"), ""), "<none>");
    EXPECT_EQ(prefix(preset("floatingPoint"), "-"), "<none>");
    EXPECT_EQ(prefix(preset("floatingPoint"), "abc"), "<none>");
    EXPECT_EQ(prefix(preset("floatingPoint"), " 1"), "<none>");
}

TEST(PatternMatch, LongInputsScanInOnePass) {
    const std::string digits(200000, '7');
    EXPECT_EQ(prefix(preset("floatingPoint"), digits + "x").size(), digits.size());
    EXPECT_EQ(prefix(preset("floatingPoint"), "0." + digits), "0.7777");
    EXPECT_EQ(prefix(preset("ukFloatingPoint2"), digits + ".25"), "<none>");

    std::string grouped = "12";
    for (int i = 0; i < 50000; ++i) grouped += ",345";
    EXPECT_TRUE(whole(preset("ukInt"), grouped));
    EXPECT_EQ(prefix(preset("ukInt"), grouped + ",34"), grouped);
}

TEST(PatternMatch, AgreesWithGrammarSource) {
    PartialOptions optional_integer;
    optional_integer.min_integer_part_digits = 0;
    optional_integer.max_fractional_digits = 2;

    const std::vector<NumberFormatOptions> formats = {
        preset("floatingPoint"), preset("ukFloatingPoint2"), preset("ukInt"),
        preset("signedUkInt"), preset("plussedFrenchInt"), preset("germanFractional"),
        preset("scientificNotation"), preset("strictScientificNotation"),
        preset("engineeringNotation"), integer_bounds(2, 3, std::nullopt),
        integer_bounds(1, 4, ','), with_defaults(optional_integer),
    };
    const auto inputs = all_strings("019,. +-e", 5);

    for (const auto& options : formats) {
        const std::regex re(grammar_source(options), std::regex::ECMAScript);
        for (const auto& input : inputs) {
            ASSERT_EQ(prefix(options, input), regex_prefix(options, re, input))
                << "input '" << input << "' under " << describe(options);
        }
    }
}

// ============================================================================
// Whole-string tester
// ============================================================================

TEST(PatternMatches, WholeInputOnly) {
    EXPECT_TRUE(whole(preset("frenchInt"), "-1 001"));
    EXPECT_FALSE(whole(preset("frenchInt"), "+1 001"));
    EXPECT_FALSE(whole(preset("frenchInt"), "1 001 "));
    EXPECT_FALSE(whole(preset("frenchFloatingPoint2"), "0"));
    EXPECT_TRUE(whole(preset("frenchFloatingPoint2"), "0,00"));
    EXPECT_FALSE(whole(preset("frenchFloatingPoint2"), ""));
    EXPECT_TRUE(whole(preset("ukFloatingPoint"), "1,234.5678"));
    EXPECT_FALSE(whole(preset("ukFloatingPoint"), "1,234.56789"));
}

// ============================================================================
// Construction and cache
// ============================================================================

TEST(GrammarSource, IsDeterministic) {
    EXPECT_EQ(grammar_source(preset("ukFloatingPoint2")), grammar_source(preset("ukFloatingPoint2")));
    EXPECT_NE(grammar_source(preset("ukFloatingPoint2")), grammar_source(preset("ukFloatingPoint")));
}

TEST(PatternCache, ReusesCompiledPattern) {
    auto a = cached_pattern(preset("germanFloatingPoint2"));
    auto b = cached_pattern(with_defaults(preset("germanFloatingPoint2").to_partial()));
    EXPECT_EQ(a.get(), b.get());
    EXPECT_NE(a.get(), build_pattern(preset("germanFloatingPoint2")).get());
    EXPECT_EQ(a->options(), preset("germanFloatingPoint2"));
}

TEST(PatternCache, SizeIsBounded) {
    for (std::size_t i = 0; i < 3 * pattern_cache_capacity; ++i) {
        cached_pattern(numbered(i));
        EXPECT_LE(pattern_cache_size(), pattern_cache_capacity);
    }
    EXPECT_EQ(pattern_cache_size(), pattern_cache_capacity);
}

TEST(PatternCache, EvictsLeastRecentlyUsed) {
    auto kept = cached_pattern(numbered(100));
    auto dropped = cached_pattern(numbered(101));

    for (std::size_t i = 0; i < 2 * pattern_cache_capacity; ++i) {
        cached_pattern(numbered(200 + i));
        EXPECT_EQ(cached_pattern(numbered(100)).get(), kept.get());
    }

    // Evicted entries are rebuilt, and earlier holders keep theirs
    auto rebuilt = cached_pattern(numbered(101));
    EXPECT_NE(rebuilt.get(), dropped.get());
    EXPECT_EQ(dropped->options(), rebuilt->options());
}
