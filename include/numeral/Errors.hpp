/**
 * @file Errors.hpp
 * @brief Error taxonomy for numeral
 *
 * Two families of errors:
 * - Construction-time exceptions, all deriving from NumeralError:
 *   - ConfigurationError: self-contradictory or malformed format options
 *   - FileNotFoundError: format definition file not found
 *   - FormatParseError: JSON/TOML syntax or shape errors in a format file
 *   - UnknownFormatError: lookup of a format name that does not exist
 * - Read/write-time failures, returned as values (CodecError) and never
 *   thrown:
 *   - ErrorKind::NoMatch: no valid numeral at the start of the input
 *   - ErrorKind::NotRepresentable: a value cannot be rendered (or a read
 *     numeral cannot be stored) under the given format
 */

#ifndef NUMERAL_ERRORS_HPP
#define NUMERAL_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <vector>
#include <sstream>

namespace numeral {

/**
 * @brief Base class for all numeral exceptions
 */
class NumeralError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Format options violate an invariant
 *
 * Raised by with_defaults() and by every factory that validates options.
 * Contains the list of all violated constraints.
 */
class ConfigurationError : public NumeralError {
public:
    /**
     * @brief Construct with a single violation
     * @param violation Human-readable description of the violated constraint
     */
    explicit ConfigurationError(std::string violation)
        : ConfigurationError(std::vector<std::string>{std::move(violation)})
    {}

    /**
     * @brief Construct with list of violations
     * @param violations Descriptions of every violated constraint
     */
    explicit ConfigurationError(std::vector<std::string> violations)
        : NumeralError(format_message(violations))
        , violations_(std::move(violations))
    {}

    /**
     * @brief Get the list of violated constraints
     */
    const std::vector<std::string>& violations() const noexcept {
        return violations_;
    }

private:
    std::vector<std::string> violations_;

    static std::string format_message(const std::vector<std::string>& violations) {
        std::ostringstream oss;
        oss << "Invalid number format: [";
        for (size_t i = 0; i < violations.size(); ++i) {
            if (i > 0) oss << ", ";
            oss << "'" << violations[i] << "'";
        }
        oss << "]";
        return oss.str();
    }
};

/**
 * @brief Format definition file not found
 */
class FileNotFoundError : public NumeralError {
public:
    /**
     * @brief Construct with file path
     * @param path Path to the missing file
     */
    explicit FileNotFoundError(std::string path)
        : NumeralError("Format file not found: " + path)
        , path_(std::move(path))
    {}

    /**
     * @brief Get the file path that was not found
     */
    const std::string& path() const noexcept {
        return path_;
    }

private:
    std::string path_;
};

/**
 * @brief Format definition file could not be parsed (JSON/TOML syntax or shape)
 */
class FormatParseError : public NumeralError {
public:
    /**
     * @brief Construct with file path and error details
     * @param file Path to the file with parse error
     * @param details Detailed error message from parser
     */
    FormatParseError(std::string file, std::string details)
        : NumeralError("Parse error in '" + file + "': " + details)
        , file_(std::move(file))
        , details_(std::move(details))
    {}

    const std::string& file() const noexcept {
        return file_;
    }

    const std::string& details() const noexcept {
        return details_;
    }

private:
    std::string file_;
    std::string details_;
};

/**
 * @brief No format registered under the requested name
 */
class UnknownFormatError : public NumeralError {
public:
    explicit UnknownFormatError(std::string name)
        : NumeralError("Unknown number format: '" + name + "'")
        , name_(std::move(name))
    {}

    const std::string& name() const noexcept {
        return name_;
    }

private:
    std::string name_;
};

/**
 * @brief Kinds of recoverable read/write failures
 */
enum class ErrorKind {
    NoMatch,
    NotRepresentable
};

/**
 * @brief Recoverable read/write failure, returned by value
 */
struct CodecError {
    ErrorKind kind;
    std::string message;

    static CodecError no_match(std::string message) {
        return CodecError{ErrorKind::NoMatch, std::move(message)};
    }

    static CodecError not_representable(std::string message) {
        return CodecError{ErrorKind::NotRepresentable, std::move(message)};
    }
};

/**
 * @brief Name of an ErrorKind ("NoMatch", "NotRepresentable")
 */
inline const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NoMatch: return "NoMatch";
        case ErrorKind::NotRepresentable: return "NotRepresentable";
    }
    return "unknown";
}

} // namespace numeral

#endif // NUMERAL_ERRORS_HPP
