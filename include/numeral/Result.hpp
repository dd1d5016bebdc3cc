/**
 * @file Result.hpp
 * @brief Value-or-CodecError return type used across the read/write boundary
 *
 * Reading and writing never throw for expected failures: every Transformer
 * operation returns a Result holding either the produced value or a
 * CodecError describing why nothing was produced.
 *
 * Examples:
 * ```cpp
 * Result<std::string> r = catalog::uk_int().write(1048);
 * if (r) std::cout << *r;                 // "1,048"
 * else   std::cerr << r.error().message;
 * ```
 */

#ifndef NUMERAL_RESULT_HPP
#define NUMERAL_RESULT_HPP

#include "numeral/Errors.hpp"
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace numeral {

template <typename T>
class Result {
public:
    static_assert(!std::is_same_v<T, CodecError>, "Result<CodecError> is ambiguous");

    using value_type = T;

    Result(T value) : data_(std::in_place_index<0>, std::move(value)) {}
    Result(CodecError error) : data_(std::in_place_index<1>, std::move(error)) {}

    bool ok() const noexcept { return data_.index() == 0; }
    explicit operator bool() const noexcept { return ok(); }

    /**
     * @brief Access the value
     * @throws std::bad_variant_access if this holds an error
     */
    const T& value() const& { return std::get<0>(data_); }
    T& value() & { return std::get<0>(data_); }
    T&& value() && { return std::get<0>(std::move(data_)); }

    const T& operator*() const& { return value(); }
    const T* operator->() const { return &value(); }

    /**
     * @brief Access the error
     * @throws std::bad_variant_access if this holds a value
     */
    const CodecError& error() const { return std::get<1>(data_); }

    bool is(ErrorKind kind) const noexcept {
        return !ok() && std::get<1>(data_).kind == kind;
    }

    T value_or(T fallback) const {
        return ok() ? value() : std::move(fallback);
    }

    /**
     * @brief Apply @p f to the value, forwarding an error unchanged
     */
    template <typename F>
    auto map(F&& f) const -> Result<std::decay_t<decltype(f(std::declval<const T&>()))>> {
        if (!ok()) return error();
        return f(value());
    }

    /**
     * @brief Chain a computation that itself returns a Result
     */
    template <typename F>
    auto and_then(F&& f) const -> decltype(f(std::declval<const T&>())) {
        if (!ok()) return error();
        return f(value());
    }

private:
    std::variant<T, CodecError> data_;
};

/**
 * @brief Successful read: the decoded value and the unread remainder
 */
template <typename A>
struct ReadOutput {
    A value;
    std::string rest;

    bool operator==(const ReadOutput& other) const {
        return value == other.value && rest == other.rest;
    }
    bool operator!=(const ReadOutput& other) const { return !(*this == other); }
};

template <typename A>
using ReadResult = Result<ReadOutput<A>>;

using WriteResult = Result<std::string>;

} // namespace numeral

#endif // NUMERAL_RESULT_HPP
