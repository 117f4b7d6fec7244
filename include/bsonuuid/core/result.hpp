/**
 * @file result.hpp
 * @brief Result<T, E>: either a value or an error, without exceptions.
 *
 * @copyright Copyright (c) 2024 BsonUuid Contributors
 * @license MIT License
 */

#pragma once

#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>

namespace bsonuuid {
namespace core {

/**
 * @class Result
 * @brief Holds a success value (ok) or an error (err).
 *
 * Usage:
 * @code
 * auto parsed = UUID::create(input::HexText{text});
 * if (parsed.is_err()) {
 *     std::cerr << parsed.error().what() << "\n";
 * }
 * @endcode
 */
template<typename T, typename E>
class Result {
public:
    using value_type = T;
    using error_type = E;

    [[nodiscard]] static Result ok(T value) {
        return Result(std::in_place_index<0>, std::move(value));
    }

    [[nodiscard]] static Result err(E error) {
        return Result(std::in_place_index<1>, std::move(error));
    }

    bool is_ok() const noexcept { return data_.index() == 0; }
    bool is_err() const noexcept { return data_.index() == 1; }

    explicit operator bool() const noexcept { return is_ok(); }

    /**
     * @brief The success value.
     * @throws std::logic_error if this holds an error.
     */
    const T& value() const& {
        if (is_err()) {
            throw std::logic_error("Result::value() called on an error result");
        }
        return std::get<0>(data_);
    }

    T value() && {
        if (is_err()) {
            throw std::logic_error("Result::value() called on an error result");
        }
        return std::get<0>(std::move(data_));
    }

    /**
     * @brief The error.
     * @throws std::logic_error if this holds a value.
     */
    const E& error() const& {
        if (is_ok()) {
            throw std::logic_error("Result::error() called on an ok result");
        }
        return std::get<1>(data_);
    }

    T value_or(T fallback) const& {
        return is_ok() ? std::get<0>(data_) : std::move(fallback);
    }

    /**
     * @brief Transform the success value, passing errors through.
     */
    template<typename F>
    auto map(F&& fn) const& -> Result<std::invoke_result_t<F, const T&>, E> {
        using U = std::invoke_result_t<F, const T&>;
        if (is_err()) {
            return Result<U, E>::err(std::get<1>(data_));
        }
        return Result<U, E>::ok(std::forward<F>(fn)(std::get<0>(data_)));
    }

private:
    template<size_t I, typename V>
    Result(std::in_place_index_t<I> tag, V&& v) : data_(tag, std::forward<V>(v)) {}

    std::variant<T, E> data_;
};

}  // namespace core
}  // namespace bsonuuid
