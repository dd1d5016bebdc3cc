/**
 * @file test_options.cpp
 * @brief Unit tests for with_defaults, policy names and the JSON surface (GoogleTest)
 *
 * @copyright (c) 2026. MIT License.
 */

#include <gtest/gtest.h>
#include "numeral/Catalog.hpp"
#include "numeral/Errors.hpp"
#include "numeral/Options.hpp"

using namespace numeral;
using nlohmann::json;

// ============================================================================
// Defaults
// ============================================================================

TEST(WithDefaults, EmptyPartialGivesDefaults) {
    NumberFormatOptions o = with_defaults(PartialOptions{});
    EXPECT_EQ(o.sign_policy(), SignPolicy::MinusOptional);
    EXPECT_EQ(o.e_notation_policy(), ENotationPolicy::Forbidden);
    EXPECT_EQ(o.scientific_notation(), ScientificNotation::None);
    EXPECT_EQ(o.rounding_mode(), RoundingMode::HalfExpand);
    EXPECT_FALSE(o.thousand_separator().has_value());
    EXPECT_EQ(o.fractional_separator(), '.');
    EXPECT_EQ(o.min_fractional_digits(), 0u);
    EXPECT_EQ(o.max_fractional_digits(), unbounded);
    EXPECT_EQ(o.min_integer_part_digits(), 1u);
    EXPECT_EQ(o.max_integer_part_digits(), unbounded);
    EXPECT_TRUE(o.allows_fraction());
    EXPECT_FALSE(o.is_fractional_only());
    EXPECT_EQ(o.exponent_letter(), '\0');
}

TEST(WithDefaults, ExplicitFieldsAreKept) {
    PartialOptions p;
    p.sign_policy = SignPolicy::MandatoryPlusOrMinus;
    p.thousand_separator = ',';
    p.min_fractional_digits = 2;
    p.max_fractional_digits = 2;
    p.e_notation_policy = ENotationPolicy::UppercaseE;

    NumberFormatOptions o = with_defaults(p);
    EXPECT_EQ(o.sign_policy(), SignPolicy::MandatoryPlusOrMinus);
    EXPECT_EQ(o.thousand_separator(), std::optional<char>(','));
    EXPECT_EQ(o.min_fractional_digits(), 2u);
    EXPECT_EQ(o.max_fractional_digits(), 2u);
    EXPECT_EQ(o.exponent_letter(), 'E');
}

TEST(WithDefaults, ToPartialRoundTrips) {
    const NumberFormatOptions& o = catalog::find_format("frenchScientificNotation").options;
    EXPECT_EQ(with_defaults(o.to_partial()), o);
}

// ============================================================================
// Validation
// ============================================================================

TEST(WithDefaults, MaxBelowMinIsRejected) {
    PartialOptions p;
    p.min_fractional_digits = 2;
    p.max_fractional_digits = 1;
    EXPECT_THROW(with_defaults(p), ConfigurationError);
}

TEST(WithDefaults, IntegerBoundsBelowMinIsRejected) {
    PartialOptions p;
    p.min_integer_part_digits = 3;
    p.max_integer_part_digits = 2;
    EXPECT_THROW(with_defaults(p), ConfigurationError);
}

TEST(WithDefaults, SameSeparatorsAreRejected) {
    PartialOptions p;
    p.thousand_separator = '.';
    EXPECT_THROW(with_defaults(p), ConfigurationError);
}

TEST(WithDefaults, DigitSeparatorIsRejected) {
    PartialOptions p;
    p.fractional_separator = '7';
    EXPECT_THROW(with_defaults(p), ConfigurationError);

    PartialOptions q;
    q.thousand_separator = '0';
    EXPECT_THROW(with_defaults(q), ConfigurationError);
}

TEST(WithDefaults, SignSeparatorIsRejected) {
    PartialOptions p;
    p.thousand_separator = '-';
    EXPECT_THROW(with_defaults(p), ConfigurationError);
}

TEST(WithDefaults, ExponentLetterSeparatorDependsOnPolicy) {
    PartialOptions p;
    p.thousand_separator = 'e';
    EXPECT_NO_THROW(with_defaults(p));

    p.e_notation_policy = ENotationPolicy::LowercaseE;
    EXPECT_THROW(with_defaults(p), ConfigurationError);
}

TEST(WithDefaults, BothPartsDisabledIsRejected) {
    PartialOptions p;
    p.min_integer_part_digits = 0;
    p.max_integer_part_digits = 0;
    p.max_fractional_digits = 0;
    try {
        with_defaults(p);
        FAIL() << "Expected ConfigurationError";
    } catch (const ConfigurationError& e) {
        ASSERT_EQ(e.violations().size(), 1u);
        EXPECT_NE(e.violations()[0].find("both be disabled"), std::string::npos);
    }
}

TEST(WithDefaults, AllViolationsAreCollected) {
    PartialOptions p;
    p.min_fractional_digits = 2;
    p.max_fractional_digits = 1;
    p.thousand_separator = '5';
    try {
        with_defaults(p);
        FAIL() << "Expected ConfigurationError";
    } catch (const ConfigurationError& e) {
        EXPECT_EQ(e.violations().size(), 2u);
        EXPECT_NE(std::string(e.what()).find("Invalid number format"), std::string::npos);
    }
}

TEST(WithDefaults, UnboundedMinimumIsRejected) {
    PartialOptions p;
    p.min_fractional_digits = unbounded;
    EXPECT_THROW(with_defaults(p), ConfigurationError);
}

TEST(WithDefaults, ScientificNeedsExponentLetter) {
    PartialOptions p;
    p.scientific_notation = ScientificNotation::Normalized;
    EXPECT_THROW(with_defaults(p), ConfigurationError);

    p.e_notation_policy = ENotationPolicy::LowercaseE;
    EXPECT_NO_THROW(with_defaults(p));
}

TEST(WithDefaults, ScientificFixesIntegerBounds) {
    PartialOptions p;
    p.scientific_notation = ScientificNotation::Engineering;
    p.e_notation_policy = ENotationPolicy::LowercaseE;
    p.max_integer_part_digits = 3;
    EXPECT_THROW(with_defaults(p), ConfigurationError);
}

// ============================================================================
// Identity and description
// ============================================================================

TEST(OptionsId, EqualOptionsShareId) {
    PartialOptions p;
    p.thousand_separator = ',';
    EXPECT_EQ(options_id(with_defaults(p)), options_id(with_defaults(p)));
    EXPECT_NE(options_id(with_defaults(p)), options_id(with_defaults(PartialOptions{})));
}

TEST(OptionsId, DistinguishesRoundingModes) {
    PartialOptions p;
    p.rounding_mode = RoundingMode::HalfEven;
    EXPECT_NE(options_id(with_defaults(p)), options_id(with_defaults(PartialOptions{})));
    EXPECT_NE(with_defaults(p), with_defaults(PartialOptions{}));
}

TEST(Describe, CatalogFormats) {
    EXPECT_EQ(describe(catalog::find_format("signedUkInt").options), "signed UK-style integer");
    EXPECT_EQ(describe(catalog::find_format("unsignedInt").options), "unsigned integer");
    EXPECT_EQ(describe(catalog::find_format("frenchFloatingPoint2").options),
              "potentially signed French-style 2-decimal number");
    EXPECT_EQ(describe(catalog::find_format("germanFractional").options),
              "potentially signed German-style fractional number");
    EXPECT_EQ(describe(catalog::find_format("engineeringNotation").options),
              "potentially signed UK-style number in engineering notation");
}

// ============================================================================
// Policy names
// ============================================================================

TEST(PolicyNames, RoundTrip) {
    for (auto mode : {RoundingMode::Ceil, RoundingMode::Floor, RoundingMode::Expand,
                      RoundingMode::Trunc, RoundingMode::HalfCeil, RoundingMode::HalfFloor,
                      RoundingMode::HalfExpand, RoundingMode::HalfTrunc, RoundingMode::HalfEven}) {
        EXPECT_EQ(rounding_mode_from_string(to_string(mode)), mode);
    }
    for (auto policy : {SignPolicy::Forbidden, SignPolicy::MinusOptional,
                        SignPolicy::MandatoryPlusOrMinus, SignPolicy::PlusMinusOptional}) {
        EXPECT_EQ(sign_policy_from_string(to_string(policy)), policy);
    }
    EXPECT_EQ(e_notation_policy_from_string("uppercase"), ENotationPolicy::UppercaseE);
    EXPECT_EQ(scientific_notation_from_string("strictNormalized"), ScientificNotation::StrictNormalized);
}

TEST(PolicyNames, UnknownNameListsExpected) {
    try {
        sign_policy_from_string("always");
        FAIL() << "Expected ConfigurationError";
    } catch (const ConfigurationError& e) {
        EXPECT_NE(std::string(e.what()).find("plusMinusOptional"), std::string::npos);
    }
}

// ============================================================================
// JSON surface
// ============================================================================

TEST(OptionsJson, ParsesAllKeys) {
    json j = {
        {"signPolicy", "mandatory"},
        {"eNotationPolicy", "lowercase"},
        {"roundingMode", "halfEven"},
        {"thousandSeparator", ","},
        {"fractionalSeparator", "."},
        {"minFractionalDigits", 1},
        {"maxFractionalDigits", "unbounded"},
        {"minIntegerPartDigits", 1},
        {"maxIntegerPartDigits", 12},
    };
    NumberFormatOptions o = with_defaults(partial_options_from_json(j));
    EXPECT_EQ(o.sign_policy(), SignPolicy::MandatoryPlusOrMinus);
    EXPECT_EQ(o.exponent_letter(), 'e');
    EXPECT_EQ(o.rounding_mode(), RoundingMode::HalfEven);
    EXPECT_EQ(o.thousand_separator(), std::optional<char>(','));
    EXPECT_EQ(o.min_fractional_digits(), 1u);
    EXPECT_EQ(o.max_fractional_digits(), unbounded);
    EXPECT_EQ(o.max_integer_part_digits(), 12u);
}

TEST(OptionsJson, BaseFillsMissingKeys) {
    PartialOptions base = catalog::find_format("germanFloatingPoint2").options.to_partial();
    NumberFormatOptions o = with_defaults(partial_options_from_json(json{{"signPolicy", "forbidden"}}, base));
    EXPECT_EQ(o.sign_policy(), SignPolicy::Forbidden);
    EXPECT_EQ(o.fractional_separator(), ',');
    EXPECT_EQ(o.min_fractional_digits(), 2u);
}

TEST(OptionsJson, NullThousandSeparatorClearsBase) {
    PartialOptions base = catalog::find_format("ukInt").options.to_partial();
    NumberFormatOptions o = with_defaults(partial_options_from_json(json{{"thousandSeparator", nullptr}}, base));
    EXPECT_FALSE(o.thousand_separator().has_value());
}

TEST(OptionsJson, RejectsUnknownKey) {
    EXPECT_THROW(partial_options_from_json(json{{"separator", ","}}), ConfigurationError);
}

TEST(OptionsJson, RejectsWrongTypes) {
    EXPECT_THROW(partial_options_from_json(json{{"signPolicy", 3}}), ConfigurationError);
    EXPECT_THROW(partial_options_from_json(json{{"fractionalSeparator", ",,"}}), ConfigurationError);
    EXPECT_THROW(partial_options_from_json(json{{"maxFractionalDigits", -1}}), ConfigurationError);
    EXPECT_THROW(partial_options_from_json(json{{"minFractionalDigits", "unbounded"}}), ConfigurationError);
    EXPECT_THROW(partial_options_from_json(json::array()), ConfigurationError);
}

TEST(OptionsJson, RejectsUnknownEnumName) {
    EXPECT_THROW(partial_options_from_json(json{{"roundingMode", "bankers"}}), ConfigurationError);
}

TEST(OptionsJson, SerializedOptionsParseBack) {
    for (const auto& name : catalog::format_names()) {
        const NumberFormatOptions& o = catalog::find_format(name).options;
        json j = o;
        EXPECT_EQ(with_defaults(partial_options_from_json(j)), o) << name;
    }
}
