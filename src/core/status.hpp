#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace apwatch {

/// Error categories surfaced by apwatch operations
enum class ErrorCode {
    InvalidArgument,
    NotFound,
    Conflict,
    StorageFailure,
    ParseError,
    ConfigError,
    Internal
};

[[nodiscard]] constexpr std::string_view error_code_name(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::InvalidArgument: return "invalid_argument";
        case ErrorCode::NotFound: return "not_found";
        case ErrorCode::Conflict: return "conflict";
        case ErrorCode::StorageFailure: return "storage_failure";
        case ErrorCode::ParseError: return "parse_error";
        case ErrorCode::ConfigError: return "config_error";
        case ErrorCode::Internal: return "internal";
    }
    return "unknown";
}

/// Error value carried by Result
struct Error {
    ErrorCode code{ErrorCode::Internal};
    std::string message;

    [[nodiscard]] std::string to_string() const {
        return std::string(error_code_name(code)) + ": " + message;
    }
};

/// Result monad for error handling without exceptions
/// Ok holds the value, Err holds the error
template <typename T, typename E = Error>
class Result {
public:
    [[nodiscard]] static Result Ok(T value) {
        return Result(std::in_place_index<0>, std::move(value));
    }

    [[nodiscard]] static Result Err(E error) {
        return Result(std::in_place_index<1>, std::move(error));
    }

    /// Index-based checks so T == E still works
    [[nodiscard]] bool is_ok() const noexcept {
        return data_.index() == 0;
    }

    [[nodiscard]] bool is_err() const noexcept {
        return data_.index() == 1;
    }

    /// Get the value (throws if error)
    [[nodiscard]] const T& value() const& {
        if (is_err()) {
            throw std::runtime_error("Called value() on error Result");
        }
        return std::get<0>(data_);
    }

    [[nodiscard]] T value() && {
        if (is_err()) {
            throw std::runtime_error("Called value() on error Result");
        }
        return std::get<0>(std::move(data_));
    }

    /// Get the error (throws if ok)
    [[nodiscard]] const E& error() const& {
        if (is_ok()) {
            throw std::runtime_error("Called error() on ok Result");
        }
        return std::get<1>(data_);
    }

    [[nodiscard]] T value_or(T default_value) const& {
        if (is_ok()) {
            return std::get<0>(data_);
        }
        return default_value;
    }

    /// Move the value out (for move-only types)
    [[nodiscard]] T take_value() && {
        if (is_err()) {
            throw std::runtime_error("Called take_value() on error Result");
        }
        return std::get<0>(std::move(data_));
    }

    /// Transform the value if Ok, preserve error if Err
    template <typename F>
    [[nodiscard]] auto map(F&& func) const& -> Result<std::invoke_result_t<F, const T&>, E> {
        using U = std::invoke_result_t<F, const T&>;
        if (is_ok()) {
            return Result<U, E>::Ok(func(std::get<0>(data_)));
        }
        return Result<U, E>::Err(std::get<1>(data_));
    }

    /// Chain operations that may fail
    template <typename F>
    [[nodiscard]] auto and_then(F&& func) const& -> std::invoke_result_t<F, const T&> {
        using ResultType = std::invoke_result_t<F, const T&>;
        if (is_ok()) {
            return func(std::get<0>(data_));
        }
        return ResultType::Err(std::get<1>(data_));
    }

private:
    template <size_t I, typename... Args>
    explicit Result(std::in_place_index_t<I> tag, Args&&... args)
        : data_(tag, std::forward<Args>(args)...) {}

    std::variant<T, E> data_;
};

/// Shorthand for building an Err with an Error payload
template <typename T>
[[nodiscard]] Result<T> fail(ErrorCode code, std::string message) {
    return Result<T>::Err(Error{code, std::move(message)});
}

}  // namespace apwatch
