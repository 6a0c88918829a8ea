#pragma once

/// @file result.hpp
/// @brief Value-or-error return type shared by every fallible latchkey call.

#include <cstddef>
#include <utility>
#include <variant>

namespace latchkey {

/// Holds either the outcome of an operation or the reason it failed.
///
/// Store adapters, key parsing, encryption and the token lifecycle all
/// return a Result so that a persistence or crypto failure can never be
/// confused with "no such token". Callers check hasError() before reading
/// value(); reading the wrong alternative throws std::bad_variant_access.
///
/// The library instantiates it with foundation::AuthError through the
/// AuthResult<T> alias.
///
/// @code
///   auto found = store.findByHash(digest);
///   if (found.hasError()) {
///       return VerifyResult::err(found.error());
///   }
///   if (!found.value()) {
///       return VerifyResult::ok(std::nullopt);   // unknown token
///   }
/// @endcode
template <typename T, typename E>
class Result {
public:
    static Result ok(T value) { return Result(std::in_place_index<0>, std::move(value)); }
    static Result err(E error) { return Result(std::in_place_index<1>, std::move(error)); }

    [[nodiscard]] bool hasValue() const noexcept { return data_.index() == 0; }
    [[nodiscard]] bool hasError() const noexcept { return data_.index() == 1; }

    [[nodiscard]] const T& value() const& { return std::get<0>(data_); }
    [[nodiscard]] T& value() & { return std::get<0>(data_); }
    [[nodiscard]] T&& value() && { return std::get<0>(std::move(data_)); }

    [[nodiscard]] const E& error() const& { return std::get<1>(data_); }

private:
    template <std::size_t I, typename V>
    Result(std::in_place_index_t<I> tag, V&& v) : data_(tag, std::forward<V>(v)) {}

    std::variant<T, E> data_;
};

/// Outcome of an operation that yields nothing on success (deletes,
/// commits, schema creation).
template <typename E>
class Result<void, E> {
public:
    static Result ok() { return Result(); }
    static Result err(E error) { return Result(std::move(error)); }

    [[nodiscard]] bool hasValue() const noexcept { return success_; }
    [[nodiscard]] bool hasError() const noexcept { return !success_; }

    [[nodiscard]] const E& error() const& { return error_; }

private:
    Result() : success_(true) {}
    explicit Result(E error) : success_(false), error_(std::move(error)) {}

    bool success_ = false;
    E error_;
};

}  // namespace latchkey
