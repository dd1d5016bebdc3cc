/**
 * @file Policies.cpp
 * @brief Names of the policy enumerations
 */

#include "numeral/Policies.hpp"
#include "numeral/Errors.hpp"

#include <utility>

namespace numeral {

namespace {

template <typename E, size_t N>
E from_name(const std::pair<const char*, E> (&table)[N],
            const std::string& name, const char* what) {
    for (const auto& [text, value] : table) {
        if (name == text) return value;
    }
    std::string expected;
    for (size_t i = 0; i < N; ++i) {
        if (i > 0) expected += ", ";
        expected += table[i].first;
    }
    throw ConfigurationError("unknown " + std::string(what) + " '" + name +
                             "' (expected one of: " + expected + ")");
}

const std::pair<const char*, SignPolicy> SIGN_POLICIES[] = {
    {"forbidden", SignPolicy::Forbidden},
    {"minusOptional", SignPolicy::MinusOptional},
    {"mandatory", SignPolicy::MandatoryPlusOrMinus},
    {"plusMinusOptional", SignPolicy::PlusMinusOptional},
};

const std::pair<const char*, ENotationPolicy> E_NOTATION_POLICIES[] = {
    {"forbidden", ENotationPolicy::Forbidden},
    {"lowercase", ENotationPolicy::LowercaseE},
    {"uppercase", ENotationPolicy::UppercaseE},
};

const std::pair<const char*, ScientificNotation> SCIENTIFIC_NOTATIONS[] = {
    {"none", ScientificNotation::None},
    {"normalized", ScientificNotation::Normalized},
    {"strictNormalized", ScientificNotation::StrictNormalized},
    {"engineering", ScientificNotation::Engineering},
};

const std::pair<const char*, RoundingMode> ROUNDING_MODES[] = {
    {"ceil", RoundingMode::Ceil},
    {"floor", RoundingMode::Floor},
    {"expand", RoundingMode::Expand},
    {"trunc", RoundingMode::Trunc},
    {"halfCeil", RoundingMode::HalfCeil},
    {"halfFloor", RoundingMode::HalfFloor},
    {"halfExpand", RoundingMode::HalfExpand},
    {"halfTrunc", RoundingMode::HalfTrunc},
    {"halfEven", RoundingMode::HalfEven},
};

} // namespace

const char* to_string(SignPolicy policy) {
    switch (policy) {
        case SignPolicy::Forbidden: return "forbidden";
        case SignPolicy::MinusOptional: return "minusOptional";
        case SignPolicy::MandatoryPlusOrMinus: return "mandatory";
        case SignPolicy::PlusMinusOptional: return "plusMinusOptional";
    }
    return "unknown";
}

const char* to_string(ENotationPolicy policy) {
    switch (policy) {
        case ENotationPolicy::Forbidden: return "forbidden";
        case ENotationPolicy::LowercaseE: return "lowercase";
        case ENotationPolicy::UppercaseE: return "uppercase";
    }
    return "unknown";
}

const char* to_string(ScientificNotation notation) {
    switch (notation) {
        case ScientificNotation::None: return "none";
        case ScientificNotation::Normalized: return "normalized";
        case ScientificNotation::StrictNormalized: return "strictNormalized";
        case ScientificNotation::Engineering: return "engineering";
    }
    return "unknown";
}

const char* to_string(RoundingMode mode) {
    switch (mode) {
        case RoundingMode::Ceil: return "ceil";
        case RoundingMode::Floor: return "floor";
        case RoundingMode::Expand: return "expand";
        case RoundingMode::Trunc: return "trunc";
        case RoundingMode::HalfCeil: return "halfCeil";
        case RoundingMode::HalfFloor: return "halfFloor";
        case RoundingMode::HalfExpand: return "halfExpand";
        case RoundingMode::HalfTrunc: return "halfTrunc";
        case RoundingMode::HalfEven: return "halfEven";
    }
    return "unknown";
}

SignPolicy sign_policy_from_string(const std::string& name) {
    return from_name(SIGN_POLICIES, name, "sign policy");
}

ENotationPolicy e_notation_policy_from_string(const std::string& name) {
    return from_name(E_NOTATION_POLICIES, name, "e-notation policy");
}

ScientificNotation scientific_notation_from_string(const std::string& name) {
    return from_name(SCIENTIFIC_NOTATIONS, name, "scientific notation");
}

RoundingMode rounding_mode_from_string(const std::string& name) {
    return from_name(ROUNDING_MODES, name, "rounding mode");
}

char exponent_letter(ENotationPolicy policy) {
    switch (policy) {
        case ENotationPolicy::Forbidden: return '\0';
        case ENotationPolicy::LowercaseE: return 'e';
        case ENotationPolicy::UppercaseE: return 'E';
    }
    return '\0';
}

} // namespace numeral
