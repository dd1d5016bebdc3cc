/**
 * @file Bases.cpp
 * @brief Radix 2/8/16 codec
 */

#include "numeral/Bases.hpp"
#include "numeral/Errors.hpp"

#include <charconv>
#include <system_error>

namespace numeral {

namespace {

const char* radix_name(unsigned radix) {
    switch (radix) {
        case 2: return "binary";
        case 8: return "octal";
        case 16: return "hexadecimal";
        default: return nullptr;
    }
}

void check_radix(unsigned radix) {
    if (radix_name(radix) == nullptr) {
        throw ConfigurationError("unsupported radix " + std::to_string(radix) +
                                 " (expected 2, 8 or 16)");
    }
}

} // namespace

ReadResult<std::uint64_t> read_radix(std::string_view input, unsigned radix) {
    check_radix(radix);

    std::uint64_t value = 0;
    const char* first = input.data();
    const char* last = first + input.size();
    const auto res = std::from_chars(first, last, value, static_cast<int>(radix));

    if (res.ec == std::errc::invalid_argument) {
        return CodecError::no_match("expected a " + std::string(radix_name(radix)) +
                                    " number at the start of '" + std::string(input) + "'");
    }
    const auto consumed = static_cast<std::size_t>(res.ptr - first);
    if (res.ec == std::errc::result_out_of_range) {
        return CodecError::not_representable("'" + std::string(input.substr(0, consumed)) +
                                             "' is out of the 64-bit unsigned range");
    }
    return ReadOutput<std::uint64_t>{value, std::string(input.substr(consumed))};
}

WriteResult write_radix(std::uint64_t value, unsigned radix) {
    check_radix(radix);

    char buf[65];
    const auto res = std::to_chars(buf, buf + sizeof(buf), value, static_cast<int>(radix));
    return std::string(buf, res.ptr);
}

Transformer<std::uint64_t> radix_transformer(unsigned radix) {
    check_radix(radix);
    return Transformer<std::uint64_t>(
        radix_name(radix),
        [radix](std::string_view input) { return read_radix(input, radix); },
        [radix](const std::uint64_t& value) { return write_radix(value, radix); });
}

} // namespace numeral
