/**
 * @file Commands.cpp
 * @brief Subcommands of the numeral command-line tool
 */

#include "numeral/Commands.hpp"
#include "numeral/Bases.hpp"
#include "numeral/Errors.hpp"
#include "numeral/Grammar.hpp"
#include "numeral/Transformer.hpp"

#include <nlohmann/json.hpp>

#include <charconv>
#include <stdexcept>
#include <system_error>

using nlohmann::json;

namespace numeral {

namespace {

const char* const RADIX_NAMES[] = {"binary", "octal", "hexadecimal"};

template <typename T>
T parse_value(const std::string& text, const char* what) {
    T value{};
    const char* first = text.data();
    const char* last = first + text.size();
    const auto res = std::from_chars(first, last, value);
    if (text.empty() || res.ec != std::errc{} || res.ptr != last) {
        throw std::invalid_argument("'" + text + "' is not a valid " + what + " value");
    }
    return value;
}

int report(const CodecError& error, std::ostream& err) {
    err << "Error: " << to_string(error.kind) << ": " << error.message << "\n";
    return 1;
}

template <typename T>
int run_read(const Transformer<T>& t, const std::string& text, std::ostream& out, std::ostream& err) {
    auto r = t.read(text);
    if (!r) return report(r.error(), err);
    json doc = json::object();
    doc["value"] = r->value;
    doc["rest"] = r->rest;
    out << doc.dump(2) << "\n";
    return 0;
}

template <typename T>
int run_write(const Transformer<T>& t, const T& value, std::ostream& out, std::ostream& err) {
    auto w = t.write(value);
    if (!w) return report(w.error(), err);
    out << *w << "\n";
    return 0;
}

} // namespace

SelectedFormat select_format(const std::string& name,
                             const std::map<std::string, FormatEntry>& file_formats) {
    auto it = file_formats.find(name);
    if (it != file_formats.end()) {
        return SelectedFormat{name, it->second, std::nullopt};
    }
    if (auto radix = catalog::find_radix(name)) {
        return SelectedFormat{name, std::nullopt, radix};
    }
    return SelectedFormat{name, catalog::find_format(name), std::nullopt};
}

SelectedFormat select_radix(unsigned radix) {
    radix_transformer(radix);  // validates the radix
    return SelectedFormat{"radix " + std::to_string(radix), std::nullopt, radix};
}

void override_kind(SelectedFormat& format, const std::string& kind) {
    if (!format.entry) {
        throw ConfigurationError("--kind does not apply to radix format '" + format.name + "'");
    }
    format.entry->kind = value_kind_from_string(kind);
}

double parse_real(const std::string& text) {
    return parse_value<double>(text, "real");
}

std::int64_t parse_signed(const std::string& text) {
    return parse_value<std::int64_t>(text, "int");
}

std::uint64_t parse_unsigned(const std::string& text) {
    return parse_value<std::uint64_t>(text, "unsigned");
}

std::string description(const SelectedFormat& format) {
    if (format.radix) return format.name + " unsigned integer";
    return describe(format.entry->options) + " (" + to_string(format.entry->kind) + ")";
}

int read_command(const SelectedFormat& format, const std::string& text,
                 std::ostream& out, std::ostream& err) {
    if (format.radix) return run_read(radix_transformer(*format.radix), text, out, err);
    const auto& o = format.entry->options;
    switch (format.entry->kind) {
        case ValueKind::Real: return run_read(real_transformer(o), text, out, err);
        case ValueKind::Signed: return run_read(signed_transformer(o), text, out, err);
        case ValueKind::Unsigned: return run_read(unsigned_transformer(o), text, out, err);
    }
    return 1;
}

int write_command(const SelectedFormat& format, const std::string& value_text,
                  std::ostream& out, std::ostream& err) {
    if (format.radix) {
        return run_write(radix_transformer(*format.radix), parse_unsigned(value_text), out, err);
    }
    const auto& o = format.entry->options;
    switch (format.entry->kind) {
        case ValueKind::Real: return run_write(real_transformer(o), parse_real(value_text), out, err);
        case ValueKind::Signed: return run_write(signed_transformer(o), parse_signed(value_text), out, err);
        case ValueKind::Unsigned: return run_write(unsigned_transformer(o), parse_unsigned(value_text), out, err);
    }
    return 1;
}

int test_command(const SelectedFormat& format, const std::string& text, std::ostream& out) {
    bool ok = false;
    if (format.radix) {
        auto r = read_radix(text, *format.radix);
        ok = r && r->rest.empty();
    } else {
        ok = cached_pattern(format.entry->options)->matches(text);
    }
    out << (ok ? "true" : "false") << "\n";
    return ok ? 0 : 1;
}

int describe_command(const SelectedFormat& format, std::ostream& out) {
    out << description(format) << "\n";
    if (format.entry) {
        out << json(format.entry->options).dump(2) << "\n";
    }
    return 0;
}

int list_command(const std::map<std::string, FormatEntry>& file_formats, std::ostream& out) {
    for (const auto& name : catalog::format_names()) {
        out << name << ": " << description(select_format(name, {})) << "\n";
    }
    for (const char* name : RADIX_NAMES) {
        out << name << ": " << description(select_format(name, {})) << "\n";
    }
    for (const auto& [name, entry] : file_formats) {
        out << name << ": " << description(SelectedFormat{name, entry, std::nullopt}) << "\n";
    }
    return 0;
}

} // namespace numeral
