/**
 * @file Catalog.cpp
 * @brief Preset formats and transformers
 */

#include "numeral/Catalog.hpp"
#include "numeral/Bases.hpp"
#include "numeral/Errors.hpp"

namespace numeral {

const char* to_string(ValueKind kind) {
    switch (kind) {
        case ValueKind::Real: return "real";
        case ValueKind::Signed: return "int";
        case ValueKind::Unsigned: return "unsigned";
    }
    return "unknown";
}

ValueKind value_kind_from_string(const std::string& name) {
    if (name == "real") return ValueKind::Real;
    if (name == "int") return ValueKind::Signed;
    if (name == "unsigned") return ValueKind::Unsigned;
    throw ConfigurationError("unknown value kind '" + name + "' (expected one of: real, int, unsigned)");
}

namespace catalog {

namespace {

struct Locale {
    std::optional<char> thousand_separator;
    char fractional_separator;
};

const Locale PLAIN{std::nullopt, '.'};
const Locale UK{',', '.'};
const Locale GERMAN{'.', ','};
const Locale FRENCH{' ', ','};

constexpr std::size_t REAL_MAX_FRACTIONAL_DIGITS = 4;

PartialOptions locale_options(const Locale& locale) {
    PartialOptions p;
    p.thousand_separator = locale.thousand_separator;
    p.fractional_separator = locale.fractional_separator;
    return p;
}

PartialOptions real(const Locale& locale, std::size_t min_fractional_digits) {
    PartialOptions p = locale_options(locale);
    p.min_fractional_digits = min_fractional_digits;
    p.max_fractional_digits = min_fractional_digits > 0 ? min_fractional_digits : REAL_MAX_FRACTIONAL_DIGITS;
    return p;
}

PartialOptions scientific(const Locale& locale, ScientificNotation notation) {
    PartialOptions p = real(locale, 0);
    p.scientific_notation = notation;
    p.e_notation_policy = ENotationPolicy::LowercaseE;
    return p;
}

PartialOptions fraction(const Locale& locale) {
    PartialOptions p = real(locale, 0);
    p.min_integer_part_digits = 0;
    p.max_integer_part_digits = 0;
    return p;
}

PartialOptions integer(const Locale& locale, SignPolicy sign) {
    PartialOptions p = locale_options(locale);
    p.sign_policy = sign;
    p.max_fractional_digits = 0;
    return p;
}

std::map<std::string, FormatEntry> make_formats() {
    std::map<std::string, FormatEntry> m;
    auto add = [&m](const char* name, ValueKind kind, const PartialOptions& p) {
        m.emplace(name, FormatEntry{with_defaults(p), kind});
    };

    add("floatingPoint", ValueKind::Real, real(PLAIN, 0));
    add("ukFloatingPoint", ValueKind::Real, real(UK, 0));
    add("germanFloatingPoint", ValueKind::Real, real(GERMAN, 0));
    add("frenchFloatingPoint", ValueKind::Real, real(FRENCH, 0));
    add("floatingPoint2", ValueKind::Real, real(PLAIN, 2));
    add("ukFloatingPoint2", ValueKind::Real, real(UK, 2));
    add("germanFloatingPoint2", ValueKind::Real, real(GERMAN, 2));
    add("frenchFloatingPoint2", ValueKind::Real, real(FRENCH, 2));

    add("scientificNotation", ValueKind::Real, scientific(PLAIN, ScientificNotation::Normalized));
    add("ukScientificNotation", ValueKind::Real, scientific(UK, ScientificNotation::Normalized));
    add("germanScientificNotation", ValueKind::Real, scientific(GERMAN, ScientificNotation::Normalized));
    add("frenchScientificNotation", ValueKind::Real, scientific(FRENCH, ScientificNotation::Normalized));
    add("strictScientificNotation", ValueKind::Real, scientific(PLAIN, ScientificNotation::StrictNormalized));
    add("engineeringNotation", ValueKind::Real, scientific(PLAIN, ScientificNotation::Engineering));

    add("fractional", ValueKind::Real, fraction(PLAIN));
    add("ukFractional", ValueKind::Real, fraction(UK));
    add("germanFractional", ValueKind::Real, fraction(GERMAN));
    add("frenchFractional", ValueKind::Real, fraction(FRENCH));

    add("int", ValueKind::Signed, integer(PLAIN, SignPolicy::MinusOptional));
    add("signedInt", ValueKind::Signed, integer(PLAIN, SignPolicy::MandatoryPlusOrMinus));
    add("plussedInt", ValueKind::Signed, integer(PLAIN, SignPolicy::PlusMinusOptional));
    add("ukInt", ValueKind::Signed, integer(UK, SignPolicy::MinusOptional));
    add("signedUkInt", ValueKind::Signed, integer(UK, SignPolicy::MandatoryPlusOrMinus));
    add("plussedUkInt", ValueKind::Signed, integer(UK, SignPolicy::PlusMinusOptional));
    add("germanInt", ValueKind::Signed, integer(GERMAN, SignPolicy::MinusOptional));
    add("signedGermanInt", ValueKind::Signed, integer(GERMAN, SignPolicy::MandatoryPlusOrMinus));
    add("plussedGermanInt", ValueKind::Signed, integer(GERMAN, SignPolicy::PlusMinusOptional));
    add("frenchInt", ValueKind::Signed, integer(FRENCH, SignPolicy::MinusOptional));
    add("signedFrenchInt", ValueKind::Signed, integer(FRENCH, SignPolicy::MandatoryPlusOrMinus));
    add("plussedFrenchInt", ValueKind::Signed, integer(FRENCH, SignPolicy::PlusMinusOptional));

    add("unsignedInt", ValueKind::Unsigned, integer(PLAIN, SignPolicy::Forbidden));
    add("unsignedUkInt", ValueKind::Unsigned, integer(UK, SignPolicy::Forbidden));
    add("unsignedGermanInt", ValueKind::Unsigned, integer(GERMAN, SignPolicy::Forbidden));
    add("unsignedFrenchInt", ValueKind::Unsigned, integer(FRENCH, SignPolicy::Forbidden));
    return m;
}

const NumberFormatOptions& options_of(const char* name) {
    return find_format(name).options;
}

} // namespace

const std::map<std::string, FormatEntry>& formats() {
    static const std::map<std::string, FormatEntry> registry = make_formats();
    return registry;
}

std::vector<std::string> format_names() {
    std::vector<std::string> names;
    names.reserve(formats().size());
    for (const auto& [name, entry] : formats()) {
        names.push_back(name);
    }
    return names;
}

const FormatEntry& find_format(const std::string& name) {
    const auto& registry = formats();
    auto it = registry.find(name);
    if (it == registry.end()) {
        throw UnknownFormatError(name);
    }
    return it->second;
}

std::optional<unsigned> find_radix(const std::string& name) {
    if (name == "binary") return 2u;
    if (name == "octal") return 8u;
    if (name == "hexadecimal") return 16u;
    return std::nullopt;
}

// ============================================================================
// Reals
// ============================================================================

const Transformer<double>& floating_point() {
    static const auto t = real_transformer(options_of("floatingPoint"));
    return t;
}

const Transformer<double>& uk_floating_point() {
    static const auto t = real_transformer(options_of("ukFloatingPoint"));
    return t;
}

const Transformer<double>& german_floating_point() {
    static const auto t = real_transformer(options_of("germanFloatingPoint"));
    return t;
}

const Transformer<double>& french_floating_point() {
    static const auto t = real_transformer(options_of("frenchFloatingPoint"));
    return t;
}

const Transformer<double>& floating_point2() {
    static const auto t = real_transformer(options_of("floatingPoint2"));
    return t;
}

const Transformer<double>& uk_floating_point2() {
    static const auto t = real_transformer(options_of("ukFloatingPoint2"));
    return t;
}

const Transformer<double>& german_floating_point2() {
    static const auto t = real_transformer(options_of("germanFloatingPoint2"));
    return t;
}

const Transformer<double>& french_floating_point2() {
    static const auto t = real_transformer(options_of("frenchFloatingPoint2"));
    return t;
}

const Transformer<double>& scientific_notation() {
    static const auto t = real_transformer(options_of("scientificNotation"));
    return t;
}

const Transformer<double>& uk_scientific_notation() {
    static const auto t = real_transformer(options_of("ukScientificNotation"));
    return t;
}

const Transformer<double>& german_scientific_notation() {
    static const auto t = real_transformer(options_of("germanScientificNotation"));
    return t;
}

const Transformer<double>& french_scientific_notation() {
    static const auto t = real_transformer(options_of("frenchScientificNotation"));
    return t;
}

const Transformer<double>& strict_scientific_notation() {
    static const auto t = real_transformer(options_of("strictScientificNotation"));
    return t;
}

const Transformer<double>& engineering_notation() {
    static const auto t = real_transformer(options_of("engineeringNotation"));
    return t;
}

const Transformer<double>& fractional() {
    static const auto t = real_transformer(options_of("fractional"));
    return t;
}

const Transformer<double>& uk_fractional() {
    static const auto t = real_transformer(options_of("ukFractional"));
    return t;
}

const Transformer<double>& german_fractional() {
    static const auto t = real_transformer(options_of("germanFractional"));
    return t;
}

const Transformer<double>& french_fractional() {
    static const auto t = real_transformer(options_of("frenchFractional"));
    return t;
}

// ============================================================================
// Signed integers
// ============================================================================

const Transformer<std::int64_t>& int_standard() {
    static const auto t = signed_transformer(options_of("int"));
    return t;
}

const Transformer<std::int64_t>& signed_int() {
    static const auto t = signed_transformer(options_of("signedInt"));
    return t;
}

const Transformer<std::int64_t>& plussed_int() {
    static const auto t = signed_transformer(options_of("plussedInt"));
    return t;
}

const Transformer<std::int64_t>& uk_int() {
    static const auto t = signed_transformer(options_of("ukInt"));
    return t;
}

const Transformer<std::int64_t>& signed_uk_int() {
    static const auto t = signed_transformer(options_of("signedUkInt"));
    return t;
}

const Transformer<std::int64_t>& plussed_uk_int() {
    static const auto t = signed_transformer(options_of("plussedUkInt"));
    return t;
}

const Transformer<std::int64_t>& german_int() {
    static const auto t = signed_transformer(options_of("germanInt"));
    return t;
}

const Transformer<std::int64_t>& signed_german_int() {
    static const auto t = signed_transformer(options_of("signedGermanInt"));
    return t;
}

const Transformer<std::int64_t>& plussed_german_int() {
    static const auto t = signed_transformer(options_of("plussedGermanInt"));
    return t;
}

const Transformer<std::int64_t>& french_int() {
    static const auto t = signed_transformer(options_of("frenchInt"));
    return t;
}

const Transformer<std::int64_t>& signed_french_int() {
    static const auto t = signed_transformer(options_of("signedFrenchInt"));
    return t;
}

const Transformer<std::int64_t>& plussed_french_int() {
    static const auto t = signed_transformer(options_of("plussedFrenchInt"));
    return t;
}

// ============================================================================
// Unsigned integers
// ============================================================================

const Transformer<std::uint64_t>& unsigned_int() {
    static const auto t = unsigned_transformer(options_of("unsignedInt"));
    return t;
}

const Transformer<std::uint64_t>& unsigned_uk_int() {
    static const auto t = unsigned_transformer(options_of("unsignedUkInt"));
    return t;
}

const Transformer<std::uint64_t>& unsigned_german_int() {
    static const auto t = unsigned_transformer(options_of("unsignedGermanInt"));
    return t;
}

const Transformer<std::uint64_t>& unsigned_french_int() {
    static const auto t = unsigned_transformer(options_of("unsignedFrenchInt"));
    return t;
}

const Transformer<std::uint64_t>& binary() {
    static const auto t = radix_transformer(2);
    return t;
}

const Transformer<std::uint64_t>& octal() {
    static const auto t = radix_transformer(8);
    return t;
}

const Transformer<std::uint64_t>& hexadecimal() {
    static const auto t = radix_transformer(16);
    return t;
}

// ============================================================================
// Strings
// ============================================================================

const Transformer<std::string>& plain_string() {
    static const auto t = string_rest();
    return t;
}

} // namespace catalog

} // namespace numeral
