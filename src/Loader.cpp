/**
 * @file Loader.cpp
 * @brief Format file loading
 */

#include "numeral/Loader.hpp"
#include "numeral/Errors.hpp"

#include <toml++/toml.hpp>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace numeral {

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

bool file_exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec) && fs::is_regular_file(path, ec);
}

std::string read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw FileNotFoundError(path);
    }

    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

/**
 * @brief Convert toml++ value to nlohmann::json.
 */
nlohmann::json toml_value_to_json(const toml::node& node) {
    switch (node.type()) {
        case toml::node_type::string:
            return node.as_string()->get();

        case toml::node_type::integer:
            return node.as_integer()->get();

        case toml::node_type::floating_point:
            return node.as_floating_point()->get();

        case toml::node_type::boolean:
            return node.as_boolean()->get();

        case toml::node_type::date: {
            std::ostringstream ss;
            ss << node.as_date()->get();
            return ss.str();
        }

        case toml::node_type::time: {
            std::ostringstream ss;
            ss << node.as_time()->get();
            return ss.str();
        }

        case toml::node_type::date_time: {
            std::ostringstream ss;
            ss << node.as_date_time()->get();
            return ss.str();
        }

        case toml::node_type::array: {
            nlohmann::json arr = nlohmann::json::array();
            for (const auto& elem : *node.as_array()) {
                arr.push_back(toml_value_to_json(elem));
            }
            return arr;
        }

        case toml::node_type::table: {
            nlohmann::json obj = nlohmann::json::object();
            for (const auto& [key, val] : *node.as_table()) {
                obj[std::string(key.str())] = toml_value_to_json(val);
            }
            return obj;
        }

        default:
            return nullptr;
    }
}

std::string string_member(const nlohmann::json& entry, const char* key,
                          const std::string& name, const std::string& source) {
    const auto& v = entry.at(key);
    if (!v.is_string()) {
        throw FormatParseError(source, "format '" + name + "': '" + key + "' must be a string");
    }
    return v.get<std::string>();
}

} // anonymous namespace

// ============================================================================
// File parsing
// ============================================================================

nlohmann::json load_json_file(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }

    std::string content;
    try {
        content = read_file(path);
    } catch (const FileNotFoundError&) {
        throw;
    } catch (const std::exception& e) {
        throw FormatParseError(path, std::string("Failed to read file: ") + e.what());
    }

    try {
        return nlohmann::json::parse(content);
    } catch (const nlohmann::json::parse_error& e) {
        throw FormatParseError(path, e.what());
    }
}

nlohmann::json load_toml_file(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }

    toml::table table;
    try {
        table = toml::parse_file(path);
    } catch (const toml::parse_error& e) {
        std::ostringstream details;
        details << e.description() << " (line " << e.source().begin.line
                << ", column " << e.source().begin.column << ")";
        throw FormatParseError(path, details.str());
    }
    return toml_value_to_json(table);
}

std::string get_file_extension(const std::string& path) {
    fs::path p(path);
    return to_lower(p.extension().string());
}

// ============================================================================
// Named formats
// ============================================================================

std::map<std::string, FormatEntry> formats_from_json(const nlohmann::json& doc,
                                                     const std::string& source) {
    if (!doc.is_object()) {
        throw FormatParseError(source, "top level must be an object of named formats");
    }

    std::map<std::string, FormatEntry> result;
    for (auto it = doc.begin(); it != doc.end(); ++it) {
        const std::string& name = it.key();
        if (!it.value().is_object()) {
            throw FormatParseError(source, "format '" + name + "' must be an object");
        }

        nlohmann::json options = it.value();
        PartialOptions base;
        ValueKind kind = ValueKind::Real;

        if (options.contains("base")) {
            const FormatEntry& preset = catalog::find_format(string_member(options, "base", name, source));
            base = preset.options.to_partial();
            kind = preset.kind;
            options.erase("base");
        }
        if (options.contains("kind")) {
            kind = value_kind_from_string(string_member(options, "kind", name, source));
            options.erase("kind");
        }

        NumberFormatOptions resolved = with_defaults(partial_options_from_json(options, base));
        result.insert_or_assign(name, FormatEntry{std::move(resolved), kind});
    }
    return result;
}

std::map<std::string, FormatEntry> load_format_file(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }

    const std::string ext = get_file_extension(path);
    if (ext == ".json") {
        return formats_from_json(load_json_file(path), path);
    }
    if (ext == ".toml") {
        return formats_from_json(load_toml_file(path), path);
    }
    throw FormatParseError(path, "unsupported file type '" + ext + "' (expected .json or .toml)");
}

} // namespace numeral
