/**
 * @file Transformer.cpp
 * @brief Numeric and string transformer factories
 */

#include "numeral/Transformer.hpp"
#include "numeral/Grammar.hpp"
#include "numeral/Reader.hpp"
#include "numeral/Writer.hpp"

namespace numeral {

Transformer<double> real_transformer(const NumberFormatOptions& options) {
    auto pattern = cached_pattern(options);
    return Transformer<double>(
        "real(" + options_id(options) + ")",
        [pattern](std::string_view input) { return read_real(*pattern, input); },
        [options](const double& value) { return write_real(options, value); });
}

Transformer<std::int64_t> signed_transformer(const NumberFormatOptions& options) {
    auto pattern = cached_pattern(options);
    return Transformer<std::int64_t>(
        "int(" + options_id(options) + ")",
        [pattern](std::string_view input) { return read_signed(*pattern, input); },
        [options](const std::int64_t& value) { return write_signed(options, value); });
}

Transformer<std::uint64_t> unsigned_transformer(const NumberFormatOptions& options) {
    auto pattern = cached_pattern(options);
    return Transformer<std::uint64_t>(
        "unsigned(" + options_id(options) + ")",
        [pattern](std::string_view input) { return read_unsigned(*pattern, input); },
        [options](const std::uint64_t& value) { return write_unsigned(options, value); });
}

Transformer<std::string> string_rest() {
    return Transformer<std::string>(
        "string",
        [](std::string_view input) -> ReadResult<std::string> {
            return ReadOutput<std::string>{std::string(input), ""};
        },
        [](const std::string& value) -> WriteResult { return value; });
}

Transformer<std::string> fixed_length(std::size_t length, std::optional<char> left_pad,
                                      std::optional<char> right_pad) {
    if (left_pad && right_pad) {
        throw ConfigurationError("fixed-length transformer cannot pad on both sides");
    }

    const std::string name = "fixedLength(" + std::to_string(length) + ")";
    return Transformer<std::string>(
        name,
        [name, length, left_pad, right_pad](std::string_view input) -> ReadResult<std::string> {
            if (input.size() < length) {
                return CodecError::no_match("expected " + std::to_string(length) +
                                            " characters, got '" + std::string(input) + "'");
            }
            std::string value(input.substr(0, length));
            if (left_pad) {
                const auto first = value.find_first_not_of(*left_pad);
                value.erase(0, first == std::string::npos ? value.size() : first);
            }
            if (right_pad) {
                const auto last = value.find_last_not_of(*right_pad);
                value.erase(last == std::string::npos ? 0 : last + 1);
            }
            return ReadOutput<std::string>{std::move(value), std::string(input.substr(length))};
        },
        [name, length, left_pad, right_pad](const std::string& value) -> WriteResult {
            if (value.size() > length) {
                return CodecError::not_representable("'" + value + "' is longer than " +
                                                     std::to_string(length) + " characters");
            }
            // Padding characters at the padded edge would be trimmed on read
            if (left_pad && !value.empty() && value.front() == *left_pad) {
                return CodecError::not_representable("'" + value + "' starts with the padding character");
            }
            if (right_pad && !value.empty() && value.back() == *right_pad) {
                return CodecError::not_representable("'" + value + "' ends with the padding character");
            }

            const std::size_t missing = length - value.size();
            if (missing == 0) return value;
            if (left_pad) return std::string(missing, *left_pad) + value;
            if (right_pad) return value + std::string(missing, *right_pad);
            return CodecError::not_representable("'" + value + "' is shorter than " +
                                                 std::to_string(length) +
                                                 " characters and " + name + " has no padding");
        });
}

} // namespace numeral
