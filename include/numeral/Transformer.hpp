/**
 * @file Transformer.hpp
 * @brief Named read/write pairs over strings
 *
 * A Transformer<A> bundles a reader (prefix of a string -> A and remainder)
 * and a writer (A -> string) that satisfy the round-trip law:
 *
 *     t.read(*t.write(x)) == ReadOutput<A>{x, ""}
 *
 * for every x the writer accepts. Numeric transformers share a cached Pattern
 * for reading and keep their NumberFormatOptions for writing.
 *
 * Examples:
 * ```cpp
 * auto t = real_transformer(options);
 * auto r = t.read("10.30foo");   // {10.3, "foo"}
 * auto w = t.write(10.3);        // "10.30"
 * ```
 */

#ifndef NUMERAL_TRANSFORMER_HPP
#define NUMERAL_TRANSFORMER_HPP

#include "numeral/Errors.hpp"
#include "numeral/Options.hpp"
#include "numeral/Result.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace numeral {

template <typename A>
class Transformer {
public:
    using value_type = A;
    using ReadFn = std::function<ReadResult<A>(std::string_view)>;
    using WriteFn = std::function<WriteResult(const A&)>;

    Transformer(std::string name, ReadFn read, WriteFn write)
        : name_(std::move(name))
        , read_(std::move(read))
        , write_(std::move(write))
    {}

    const std::string& name() const noexcept { return name_; }

    ReadResult<A> read(std::string_view input) const { return read_(input); }

    WriteResult write(const A& value) const { return write_(value); }

private:
    std::string name_;
    ReadFn read_;
    WriteFn write_;
};

// ============================================================================
// Numeric transformers
// ============================================================================

/**
 * @brief Finite doubles under @p options
 */
Transformer<double> real_transformer(const NumberFormatOptions& options);

/**
 * @brief Signed 64-bit integers under @p options
 *
 * Reading a numeral with a non-zero fractional part is NotRepresentable.
 */
Transformer<std::int64_t> signed_transformer(const NumberFormatOptions& options);

/**
 * @brief Unsigned 64-bit integers under @p options
 */
Transformer<std::uint64_t> unsigned_transformer(const NumberFormatOptions& options);

// ============================================================================
// String transformers
// ============================================================================

/**
 * @brief Reads the whole input, writes the value unchanged
 */
Transformer<std::string> string_rest();

/**
 * @brief Reads exactly @p length characters, trimming padding
 *
 * Writing pads to @p length with @p left_pad (prepended) or @p right_pad
 * (appended); a value longer than @p length is NotRepresentable. With no
 * padding character, only values of exactly @p length can be written.
 *
 * @throws ConfigurationError if both pads are set
 */
Transformer<std::string> fixed_length(std::size_t length,
                                      std::optional<char> left_pad = std::nullopt,
                                      std::optional<char> right_pad = std::nullopt);

// ============================================================================
// Combinators
// ============================================================================

namespace detail {

inline bool starts_with(std::string_view input, const std::string& keyword, bool case_sensitive) {
    if (input.size() < keyword.size()) return false;
    if (case_sensitive) return input.compare(0, keyword.size(), keyword) == 0;
    return std::equal(keyword.begin(), keyword.end(), input.begin(), [](char a, char b) {
        return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
    });
}

} // namespace detail

/**
 * @brief Bijection between keywords and values
 *
 * Reading returns the value of the first listed keyword that starts the
 * input. Writing returns the keyword of the value, NotRepresentable for a
 * value not in the table.
 *
 * @throws ConfigurationError if a keyword or a value appears twice, or a
 *         keyword is empty
 */
template <typename A>
Transformer<A> mapped(std::vector<std::pair<std::string, A>> entries, std::string name,
                      bool case_sensitive = true) {
    for (std::size_t i = 0; i < entries.size(); ++i) {
        if (entries[i].first.empty()) {
            throw ConfigurationError("mapped transformer '" + name + "' has an empty keyword");
        }
        for (std::size_t j = i + 1; j < entries.size(); ++j) {
            if (detail::starts_with(entries[j].first, entries[i].first, case_sensitive) &&
                entries[i].first.size() == entries[j].first.size()) {
                throw ConfigurationError("mapped transformer '" + name + "' lists keyword '" +
                                         entries[i].first + "' twice");
            }
            if (entries[i].second == entries[j].second) {
                throw ConfigurationError("mapped transformer '" + name + "' maps keywords '" +
                                         entries[i].first + "' and '" + entries[j].first +
                                         "' to the same value");
            }
        }
    }

    auto table = std::make_shared<const std::vector<std::pair<std::string, A>>>(std::move(entries));
    return Transformer<A>(
        name,
        [table, name, case_sensitive](std::string_view input) -> ReadResult<A> {
            for (const auto& [keyword, value] : *table) {
                if (detail::starts_with(input, keyword, case_sensitive)) {
                    return ReadOutput<A>{value, std::string(input.substr(keyword.size()))};
                }
            }
            return CodecError::no_match("expected a " + name + " keyword at the start of '" +
                                        std::string(input) + "'");
        },
        [table, name](const A& value) -> WriteResult {
            for (const auto& [keyword, v] : *table) {
                if (v == value) return keyword;
            }
            return CodecError::not_representable("value has no " + name + " keyword");
        });
}

/**
 * @brief Run @p inner on the text produced by @p outer
 *
 * Reading: @p outer reads a string, @p inner must consume all of it.
 * Writing: @p inner writes, then @p outer writes the result.
 */
template <typename A>
Transformer<A> compose(Transformer<std::string> outer, Transformer<A> inner) {
    std::string name = outer.name() + "|" + inner.name();
    return Transformer<A>(
        name,
        [outer, inner](std::string_view input) -> ReadResult<A> {
            auto text = outer.read(input);
            if (!text) return text.error();

            auto value = inner.read(text->value);
            if (!value) return value.error();
            if (!value->rest.empty()) {
                return CodecError::no_match("unexpected '" + value->rest + "' after " + inner.name() +
                                            " in '" + text->value + "'");
            }
            return ReadOutput<A>{value->value, text->rest};
        },
        [outer, inner](const A& value) -> WriteResult {
            auto text = inner.write(value);
            if (!text) return text;
            return outer.write(*text);
        });
}

} // namespace numeral

#endif // NUMERAL_TRANSFORMER_HPP
