/**
 * @file Options.cpp
 * @brief with_defaults validation, ids, descriptions and JSON surface
 */

#include "numeral/Options.hpp"
#include "numeral/Errors.hpp"

#include <cctype>
#include <set>
#include <sstream>
#include <vector>

namespace numeral {

namespace {

bool is_digit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

std::string quote(char c) {
    return std::string("'") + c + "'";
}

std::string bound_to_string(std::size_t n) {
    return n == unbounded ? "unbounded" : std::to_string(n);
}

/**
 * @brief Check a separator against the characters it may never be
 */
void check_separator(const char* what, char sep, char letter,
                     std::vector<std::string>& violations) {
    if (is_digit(sep)) {
        violations.push_back(std::string(what) + " " + quote(sep) + " is a digit");
    }
    if (sep == '+' || sep == '-') {
        violations.push_back(std::string(what) + " " + quote(sep) + " is a sign character");
    }
    if (letter != '\0' && (sep == 'e' || sep == 'E')) {
        violations.push_back(std::string(what) + " " + quote(sep) +
                             " clashes with the exponent letter");
    }
}

std::vector<std::string> validate(const NumberFormatOptions& o) {
    std::vector<std::string> violations;

    if (o.min_fractional_digits() == unbounded) {
        violations.push_back("min_fractional_digits cannot be unbounded");
    }
    if (o.min_integer_part_digits() == unbounded) {
        violations.push_back("min_integer_part_digits cannot be unbounded");
    }
    if (o.max_fractional_digits() < o.min_fractional_digits()) {
        violations.push_back("max_fractional_digits (" + bound_to_string(o.max_fractional_digits()) +
                             ") is less than min_fractional_digits (" +
                             bound_to_string(o.min_fractional_digits()) + ")");
    }
    if (o.max_integer_part_digits() < o.min_integer_part_digits()) {
        violations.push_back("max_integer_part_digits (" + bound_to_string(o.max_integer_part_digits()) +
                             ") is less than min_integer_part_digits (" +
                             bound_to_string(o.min_integer_part_digits()) + ")");
    }
    if (o.max_integer_part_digits() == 0 && o.max_fractional_digits() == 0) {
        violations.push_back("integer part and fractional part cannot both be disabled");
    }

    const char letter = o.exponent_letter();
    check_separator("fractional_separator", o.fractional_separator(), letter, violations);
    if (auto ts = o.thousand_separator()) {
        check_separator("thousand_separator", *ts, letter, violations);
        if (*ts == o.fractional_separator()) {
            violations.push_back("thousand_separator and fractional_separator are both " + quote(*ts));
        }
    }

    if (o.uses_scientific_notation()) {
        if (o.e_notation_policy() == ENotationPolicy::Forbidden) {
            violations.push_back(std::string("scientific notation '") +
                                 to_string(o.scientific_notation()) +
                                 "' requires an exponent letter");
        }
        if (o.min_integer_part_digits() != 1 || o.max_integer_part_digits() != unbounded) {
            violations.push_back("scientific notation fixes the mantissa integer part; "
                                 "integer part digit bounds cannot be set");
        }
    }
    return violations;
}

const std::set<std::string> JSON_KEYS = {
    "signPolicy", "eNotationPolicy", "scientificNotation", "roundingMode",
    "thousandSeparator", "fractionalSeparator",
    "minFractionalDigits", "maxFractionalDigits",
    "minIntegerPartDigits", "maxIntegerPartDigits",
};

std::string json_string(const nlohmann::json& j, const std::string& key) {
    if (!j.is_string()) {
        throw ConfigurationError("'" + key + "' must be a string, got " + std::string(j.type_name()));
    }
    return j.get<std::string>();
}

char json_char(const nlohmann::json& j, const std::string& key) {
    std::string s = json_string(j, key);
    if (s.size() != 1) {
        throw ConfigurationError("'" + key + "' must be a single character, got '" + s + "'");
    }
    return s[0];
}

std::size_t json_count(const nlohmann::json& j, const std::string& key, bool allow_unbounded) {
    if (allow_unbounded && j.is_string() && j.get<std::string>() == "unbounded") {
        return unbounded;
    }
    if (!j.is_number_integer() || j.get<long long>() < 0) {
        throw ConfigurationError("'" + key + "' must be a non-negative integer" +
                                 std::string(allow_unbounded ? " or \"unbounded\"" : ""));
    }
    return static_cast<std::size_t>(j.get<long long>());
}

} // namespace

NumberFormatOptions with_defaults(const PartialOptions& partial) {
    NumberFormatOptions o;
    if (partial.sign_policy) o.sign_policy_ = *partial.sign_policy;
    if (partial.e_notation_policy) o.e_notation_policy_ = *partial.e_notation_policy;
    if (partial.scientific_notation) o.scientific_notation_ = *partial.scientific_notation;
    if (partial.rounding_mode) o.rounding_mode_ = *partial.rounding_mode;
    o.thousand_separator_ = partial.thousand_separator;
    if (partial.fractional_separator) o.fractional_separator_ = *partial.fractional_separator;
    if (partial.min_fractional_digits) o.min_fractional_digits_ = *partial.min_fractional_digits;
    if (partial.max_fractional_digits) o.max_fractional_digits_ = *partial.max_fractional_digits;
    if (partial.min_integer_part_digits) o.min_integer_part_digits_ = *partial.min_integer_part_digits;
    if (partial.max_integer_part_digits) o.max_integer_part_digits_ = *partial.max_integer_part_digits;

    auto violations = validate(o);
    if (!violations.empty()) {
        throw ConfigurationError(std::move(violations));
    }
    return o;
}

PartialOptions NumberFormatOptions::to_partial() const {
    PartialOptions p;
    p.sign_policy = sign_policy_;
    p.e_notation_policy = e_notation_policy_;
    p.scientific_notation = scientific_notation_;
    p.rounding_mode = rounding_mode_;
    p.thousand_separator = thousand_separator_;
    p.fractional_separator = fractional_separator_;
    p.min_fractional_digits = min_fractional_digits_;
    p.max_fractional_digits = max_fractional_digits_;
    p.min_integer_part_digits = min_integer_part_digits_;
    p.max_integer_part_digits = max_integer_part_digits_;
    return p;
}

bool NumberFormatOptions::operator==(const NumberFormatOptions& other) const noexcept {
    return sign_policy_ == other.sign_policy_ &&
           e_notation_policy_ == other.e_notation_policy_ &&
           scientific_notation_ == other.scientific_notation_ &&
           rounding_mode_ == other.rounding_mode_ &&
           thousand_separator_ == other.thousand_separator_ &&
           fractional_separator_ == other.fractional_separator_ &&
           min_fractional_digits_ == other.min_fractional_digits_ &&
           max_fractional_digits_ == other.max_fractional_digits_ &&
           min_integer_part_digits_ == other.min_integer_part_digits_ &&
           max_integer_part_digits_ == other.max_integer_part_digits_;
}

std::string options_id(const NumberFormatOptions& o) {
    std::ostringstream oss;
    oss << to_string(o.sign_policy())
        << '|' << to_string(o.e_notation_policy())
        << '|' << to_string(o.scientific_notation())
        << '|' << to_string(o.rounding_mode())
        << '|' << (o.thousand_separator() ? std::string(1, *o.thousand_separator()) : std::string())
        << '|' << o.fractional_separator()
        << '|' << bound_to_string(o.min_fractional_digits())
        << '-' << bound_to_string(o.max_fractional_digits())
        << '|' << bound_to_string(o.min_integer_part_digits())
        << '-' << bound_to_string(o.max_integer_part_digits());
    return oss.str();
}

std::string describe(const NumberFormatOptions& o) {
    std::string out;

    switch (o.sign_policy()) {
        case SignPolicy::MandatoryPlusOrMinus: out += "signed "; break;
        case SignPolicy::Forbidden: out += "unsigned "; break;
        case SignPolicy::MinusOptional:
        case SignPolicy::PlusMinusOptional: out += "potentially signed "; break;
    }

    const bool is_integer = !o.allows_fraction();
    const auto ts = o.thousand_separator();
    const char fs = o.fractional_separator();
    if (!ts && is_integer) {
        // plain integers have no locale flavour
    } else if ((!ts || *ts == ' ') && (fs == ',' || is_integer)) {
        out += "French-style ";
    } else if (ts && *ts == '.' && (fs == ',' || is_integer)) {
        out += "German-style ";
    } else if ((!ts || *ts == ',') && (fs == '.' || is_integer)) {
        out += "UK-style ";
    }

    if (is_integer) {
        out += "integer";
    } else if (o.is_fractional_only()) {
        out += "fractional number";
    } else if (o.min_fractional_digits() == o.max_fractional_digits()) {
        out += std::to_string(o.min_fractional_digits()) + "-decimal number";
    } else {
        out += "number";
    }

    switch (o.scientific_notation()) {
        case ScientificNotation::None: break;
        case ScientificNotation::Normalized: out += " in normalized scientific notation"; break;
        case ScientificNotation::StrictNormalized: out += " in strict normalized scientific notation"; break;
        case ScientificNotation::Engineering: out += " in engineering notation"; break;
    }
    return out;
}

PartialOptions partial_options_from_json(const nlohmann::json& j, const PartialOptions& base) {
    if (!j.is_object()) {
        throw ConfigurationError("number format must be an object, got " + std::string(j.type_name()));
    }

    PartialOptions p = base;
    for (auto it = j.begin(); it != j.end(); ++it) {
        const std::string& key = it.key();
        const nlohmann::json& v = it.value();

        if (JSON_KEYS.count(key) == 0) {
            throw ConfigurationError("unknown option '" + key + "'");
        }

        if (key == "signPolicy") {
            p.sign_policy = sign_policy_from_string(json_string(v, key));
        } else if (key == "eNotationPolicy") {
            p.e_notation_policy = e_notation_policy_from_string(json_string(v, key));
        } else if (key == "scientificNotation") {
            p.scientific_notation = scientific_notation_from_string(json_string(v, key));
        } else if (key == "roundingMode") {
            p.rounding_mode = rounding_mode_from_string(json_string(v, key));
        } else if (key == "thousandSeparator") {
            if (v.is_null()) {
                p.thousand_separator.reset();
            } else {
                p.thousand_separator = json_char(v, key);
            }
        } else if (key == "fractionalSeparator") {
            p.fractional_separator = json_char(v, key);
        } else if (key == "minFractionalDigits") {
            p.min_fractional_digits = json_count(v, key, false);
        } else if (key == "maxFractionalDigits") {
            p.max_fractional_digits = json_count(v, key, true);
        } else if (key == "minIntegerPartDigits") {
            p.min_integer_part_digits = json_count(v, key, false);
        } else if (key == "maxIntegerPartDigits") {
            p.max_integer_part_digits = json_count(v, key, true);
        }
    }
    return p;
}

void to_json(nlohmann::json& j, const NumberFormatOptions& o) {
    auto bound = [](std::size_t n) -> nlohmann::json {
        if (n == unbounded) return "unbounded";
        return n;
    };

    j = nlohmann::json::object();
    j["signPolicy"] = to_string(o.sign_policy());
    j["eNotationPolicy"] = to_string(o.e_notation_policy());
    j["scientificNotation"] = to_string(o.scientific_notation());
    j["roundingMode"] = to_string(o.rounding_mode());
    if (auto ts = o.thousand_separator()) {
        j["thousandSeparator"] = std::string(1, *ts);
    } else {
        j["thousandSeparator"] = nullptr;
    }
    j["fractionalSeparator"] = std::string(1, o.fractional_separator());
    j["minFractionalDigits"] = o.min_fractional_digits();
    j["maxFractionalDigits"] = bound(o.max_fractional_digits());
    j["minIntegerPartDigits"] = o.min_integer_part_digits();
    j["maxIntegerPartDigits"] = bound(o.max_integer_part_digits());
}

} // namespace numeral
