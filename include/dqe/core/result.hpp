#pragma once

/// @file result.hpp
/// @brief Result<T,E>: success value or error, without exceptions.

#include <string>
#include <utility>
#include <variant>

namespace dqe {

/// Minimal error payload used when no richer error type is needed.
struct Error {
    int code = 0;
    std::string message;

    Error() = default;
    explicit Error(std::string msg) : code(-1), message(std::move(msg)) {}
    Error(int c, std::string msg) : code(c), message(std::move(msg)) {}
};

/// Holds either a value of type T or an error of type E.
///
/// Every engine operation that can be declined or can fail returns a
/// Result.  Callers test it with hasValue() (or the bool conversion)
/// before touching value().
///
/// Example:
/// @code
///   auto session = CombatSession::Start(player, enemy, rng, rules);
///   if (!session) {
///       std::cerr << session.error().message() << "\n";
///       return;
///   }
///   session.value().SubmitAction(PlayerAction::Attack());
/// @endcode
template <typename T, typename E = Error>
class Result {
public:
    static Result ok(T value) { return Result(std::in_place_index<0>, std::move(value)); }
    static Result err(E error) { return Result(std::in_place_index<1>, std::move(error)); }

    [[nodiscard]] bool hasValue() const noexcept { return data_.index() == 0; }
    [[nodiscard]] bool hasError() const noexcept { return data_.index() == 1; }
    explicit operator bool() const noexcept { return hasValue(); }

    /// Access the value (std::bad_variant_access if this holds an error).
    [[nodiscard]] const T& value() const& { return std::get<0>(data_); }
    [[nodiscard]] T& value() & { return std::get<0>(data_); }
    [[nodiscard]] T&& value() && { return std::get<0>(std::move(data_)); }

    [[nodiscard]] const E& error() const& { return std::get<1>(data_); }
    [[nodiscard]] E& error() & { return std::get<1>(data_); }

    [[nodiscard]] T valueOr(T fallback) const& {
        return hasValue() ? value() : std::move(fallback);
    }

private:
    template <std::size_t I, typename U>
    Result(std::in_place_index_t<I> tag, U&& payload)
        : data_(tag, std::forward<U>(payload)) {}

    std::variant<T, E> data_;
};

/// Result with no success payload.
template <typename E>
class Result<void, E> {
public:
    static Result ok() { return Result(); }
    static Result err(E error) { return Result(std::move(error)); }

    [[nodiscard]] bool hasValue() const noexcept { return !failed_; }
    [[nodiscard]] bool hasError() const noexcept { return failed_; }
    explicit operator bool() const noexcept { return !failed_; }

    [[nodiscard]] const E& error() const& { return error_; }

private:
    Result() = default;
    explicit Result(E error) : failed_(true), error_(std::move(error)) {}

    bool failed_ = false;
    E error_;
};

}  // namespace dqe
