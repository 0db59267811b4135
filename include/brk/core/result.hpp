#pragma once

/// @file result.hpp
/// @brief Result<T,E> type for explicit error handling without exceptions.

#include <cstddef>
#include <string>
#include <utility>
#include <variant>

namespace breakout {

/// Error information for Result type.
struct Error {
    int code = 0;
    std::string message;

    Error() = default;
    explicit Error(std::string msg) : code(-1), message(std::move(msg)) {}
    Error(int c, std::string msg) : code(c), message(std::move(msg)) {}
};

/// Result type for explicit error propagation.
///
/// Loaders, catalogs and stores return Result<T, E> instead of throwing,
/// so a malformed level or config file is reported to the caller rather
/// than unwinding through the simulation.
///
/// @tparam T The success value type.
/// @tparam E The error type (defaults to breakout::Error).
///
/// Example:
/// @code
///   auto levels = LoadLevelCatalog("levels.yaml");
///   if (!levels) {
///       std::cerr << levels.error().message() << "\n";
///       return;
///   }
///   auto state = BuildInitialState(levels.value().front());
/// @endcode
template <typename T, typename E = Error>
class Result {
public:
    /// Construct a success result.
    static Result ok(T value) { return Result(std::in_place_index<0>, std::move(value)); }

    /// Construct an error result.
    static Result err(E error) { return Result(std::in_place_index<1>, std::move(error)); }

    [[nodiscard]] bool hasValue() const noexcept { return data_.index() == 0; }
    [[nodiscard]] bool hasError() const noexcept { return data_.index() == 1; }

    /// True on success.
    explicit operator bool() const noexcept { return hasValue(); }

    /// Access the success value (undefined behavior if error).
    [[nodiscard]] const T& value() const& { return std::get<0>(data_); }
    [[nodiscard]] T& value() & { return std::get<0>(data_); }
    [[nodiscard]] T&& value() && { return std::get<0>(std::move(data_)); }

    /// Access the error (undefined behavior if success).
    [[nodiscard]] const E& error() const& { return std::get<1>(data_); }
    [[nodiscard]] E& error() & { return std::get<1>(data_); }

    /// Access value or return a default.
    [[nodiscard]] T valueOr(T defaultValue) const& {
        return hasValue() ? value() : std::move(defaultValue);
    }

private:
    template <std::size_t I, typename U>
    Result(std::in_place_index_t<I> tag, U&& payload)
        : data_(tag, std::forward<U>(payload)) {}

    // Index-based storage keeps Result<E, E> well formed.
    std::variant<T, E> data_;
};

/// Specialization for void success type.
template <typename E>
class Result<void, E> {
public:
    static Result ok() { return Result(true); }
    static Result err(E error) { return Result(std::move(error)); }

    [[nodiscard]] bool hasValue() const noexcept { return success_; }
    [[nodiscard]] bool hasError() const noexcept { return !success_; }
    explicit operator bool() const noexcept { return success_; }

    [[nodiscard]] const E& error() const& { return error_; }

private:
    explicit Result(bool) : success_(true) {}
    explicit Result(E error) : success_(false), error_(std::move(error)) {}

    bool success_ = false;
    E error_;
};

}  // namespace breakout
