#pragma once

/// @file result.hpp
/// @brief Value-or-error return type used across the library.

#include <cstddef>
#include <optional>
#include <utility>
#include <variant>

namespace gre {

/// Holds either a success value of type T or an error of type E.
///
/// Expected failures (an unknown competitor, rejected settings, a
/// volatility solve that does not converge) are returned, never thrown.
/// The library instantiates it as foundation::RatingResult<T>.
///
/// T and E may be the same type; the two alternatives are tracked by
/// position rather than by type.
///
/// Example:
/// @code
///   auto rating = engine.playerRating(id);
///   if (!rating) {
///       return RatingResult<double>::err(rating.error());
///   }
///   return RatingResult<double>::ok(rating.value().rating);
/// @endcode
template <typename T, typename E>
class Result {
public:
    using value_type = T;
    using error_type = E;

    static Result ok(T value) {
        return Result(std::in_place_index<kValueIndex>, std::move(value));
    }

    static Result err(E error) {
        return Result(std::in_place_index<kErrorIndex>, std::move(error));
    }

    [[nodiscard]] bool hasValue() const noexcept { return data_.index() == kValueIndex; }
    [[nodiscard]] bool hasError() const noexcept { return data_.index() == kErrorIndex; }

    explicit operator bool() const noexcept { return hasValue(); }

    /// Success value. Throws std::bad_variant_access on an error result.
    [[nodiscard]] const T& value() const& { return std::get<kValueIndex>(data_); }
    [[nodiscard]] T& value() & { return std::get<kValueIndex>(data_); }
    [[nodiscard]] T&& value() && { return std::get<kValueIndex>(std::move(data_)); }

    /// Error value. Throws std::bad_variant_access on a success result.
    [[nodiscard]] const E& error() const& { return std::get<kErrorIndex>(data_); }
    [[nodiscard]] E& error() & { return std::get<kErrorIndex>(data_); }

    [[nodiscard]] T valueOr(T fallback) const& {
        if (hasValue()) {
            return value();
        }
        return fallback;
    }

private:
    static constexpr std::size_t kValueIndex = 0;
    static constexpr std::size_t kErrorIndex = 1;

    template <std::size_t Index, typename U>
    Result(std::in_place_index_t<Index> tag, U&& payload)
        : data_(tag, std::forward<U>(payload)) {}

    std::variant<T, E> data_;
};

/// Result of an operation that yields nothing on success.
template <typename E>
class Result<void, E> {
public:
    using value_type = void;
    using error_type = E;

    static Result ok() { return Result{}; }

    static Result err(E error) {
        Result result;
        result.error_.emplace(std::move(error));
        return result;
    }

    [[nodiscard]] bool hasValue() const noexcept { return !error_.has_value(); }
    [[nodiscard]] bool hasError() const noexcept { return error_.has_value(); }

    explicit operator bool() const noexcept { return hasValue(); }

    /// Error value. Throws std::bad_optional_access on a success result.
    [[nodiscard]] const E& error() const& { return error_.value(); }

private:
    Result() = default;

    std::optional<E> error_;
};

}  // namespace gre
