#pragma once

#include <variant>
#include <string>
#include <stdexcept>
#include <type_traits>

namespace lantern {

/**
 * ErrorCode - Failure categories reported by the discovery stack.
 */
enum class ErrorCode : int {
    Unknown = 0,
    StartupError,          // multicast client could not be opened; session-fatal
    ResolutionError,       // an instance could not be resolved
    Timeout,               // an instance did not answer within the resolve timeout
    BrowserStartError,     // a per-type browser could not be started
    QuerySubmissionError,  // malformed or reserved manual query
    ClientFailure,         // the client failed after it was opened
    ConfigurationError,    // bad command-line value or unusable log file
};

[[nodiscard]] inline const char* to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::StartupError: return "StartupError";
        case ErrorCode::ResolutionError: return "ResolutionError";
        case ErrorCode::Timeout: return "Timeout";
        case ErrorCode::BrowserStartError: return "BrowserStartError";
        case ErrorCode::QuerySubmissionError: return "QuerySubmissionError";
        case ErrorCode::ClientFailure: return "ClientFailure";
        case ErrorCode::ConfigurationError: return "ConfigurationError";
    }
    return "Unknown";
}

/**
 * Error type for Result - a failure message plus its category.
 */
struct Error {
    std::string message;
    ErrorCode code{ErrorCode::Unknown};

    Error() = default;
    explicit Error(std::string msg, ErrorCode c = ErrorCode::Unknown)
        : message(std::move(msg)), code(c) {}

    bool operator==(const Error& other) const {
        return message == other.message && code == other.code;
    }
};

/**
 * Result<T, E> - Either a success value (Ok) or an error (Err).
 *
 *   Result<QString> normalized = normalize_query(text);
 *   if (normalized.is_err()) {
 *       report(normalized.unwrap_err());
 *   }
 */
template<typename T, typename E = Error>
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

    [[nodiscard]] bool is_ok() const noexcept {
        return data_.index() == 0;
    }

    [[nodiscard]] bool is_err() const noexcept {
        return data_.index() == 1;
    }

    /**
     * Get the success value, throwing if this is an error.
     */
    [[nodiscard]] T& unwrap() & {
        throw_if_err();
        return std::get<0>(data_);
    }

    [[nodiscard]] const T& unwrap() const& {
        throw_if_err();
        return std::get<0>(data_);
    }

    [[nodiscard]] T unwrap() && {
        throw_if_err();
        return std::get<0>(std::move(data_));
    }

    [[nodiscard]] const E& unwrap_err() const& {
        if (is_ok()) {
            throw std::runtime_error("Result::unwrap_err() called on success");
        }
        return std::get<1>(data_);
    }

private:
    template<size_t I, typename... Args>
    explicit Result(std::in_place_index_t<I> idx, Args&&... args)
        : data_(idx, std::forward<Args>(args)...) {}

    void throw_if_err() const {
        if (is_ok()) return;
        if constexpr (std::is_same_v<E, Error>) {
            throw std::runtime_error("Result::unwrap() called on error: " +
                                     std::get<1>(data_).message);
        } else {
            throw std::runtime_error("Result::unwrap() called on error");
        }
    }

    // Indexed access keeps Result<Error, Error> and similar well-formed.
    std::variant<T, E> data_;
};

/**
 * Result<void, E> - an operation that either succeeds or fails with an error.
 */
template<typename E>
class Result<void, E> {
public:
    using value_type = void;
    using error_type = E;

    [[nodiscard]] static Result ok() {
        return Result(true);
    }

    [[nodiscard]] static Result err(E error) {
        return Result(std::move(error));
    }

    [[nodiscard]] bool is_ok() const noexcept {
        return is_ok_;
    }

    [[nodiscard]] bool is_err() const noexcept {
        return !is_ok_;
    }

    [[nodiscard]] const E& unwrap_err() const& {
        if (is_ok()) {
            throw std::runtime_error("Result::unwrap_err() called on success");
        }
        return error_;
    }

private:
    explicit Result(bool ok) : is_ok_(ok) {}
    explicit Result(E error) : is_ok_(false), error_(std::move(error)) {}

    bool is_ok_;
    E error_{};
};

template<typename T>
using Res = Result<T, Error>;

} // namespace lantern
