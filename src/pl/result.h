#pragma once

/// @file result.h
/// @brief Result<T, E>: explicit error handling without exceptions
///
/// Modeled after C++23's std::expected with Rust-style naming.
///
/// Example:
/// @code
/// Result<int> divide(int a, int b) {
///     if (b == 0) {
///         return Result<int>::failure(ResultError::INVALID_ARGUMENT, "Division by zero");
///     }
///     return Result<int>::success(a / b);
/// }
///
/// auto result = divide(10, 2);
/// if (result.ok()) {
///     int value = result.value();
/// }
/// @endcode
///
/// Error messages are stored as `const char*` and must point at storage
/// that outlives the result (string literals in practice). Nothing here
/// allocates, so results are safe to pass around on the transmit path.

#include "pl/int.h"
#include "pl/move.h"
#include "pl/optional.h"

namespace pl {

/// @brief Generic error codes for when no specific error enum is needed
enum class ResultError : u8 {
    OK,                     ///< No error (not typically used)
    UNKNOWN,                ///< Unknown or unspecified error
    INVALID_ARGUMENT,       ///< Invalid argument provided
    OUT_OF_RANGE,           ///< Value out of valid range
    NOT_INITIALIZED,        ///< Object not initialized
    TIMEOUT,                ///< Operation timed out
    BUSY,                   ///< Resource is busy
    NOT_SUPPORTED           ///< Operation not supported
};

/// @brief Error code plus a static description
template <typename E> struct ErrorInfo {
    E code;
    const char *message;

    ErrorInfo() : code(), message("") {}
    ErrorInfo(E err, const char *msg) : code(err), message(msg ? msg : "") {}
};

template <typename T, typename E = ResultError> class expected {
  public:
    /// @brief Check if operation succeeded
    bool ok() const { return mValue.has_value(); }

    /// @brief Get error code (only meaningful if !ok())
    E error() const { return mError.code; }

    /// @brief Get error message (only meaningful if !ok())
    const char *message() const { return ok() ? "" : mError.message; }

    /// @brief Get value (only valid if ok() == true)
    T &value() { return *mValue; }
    const T &value() const { return *mValue; }

    explicit operator bool() const { return ok(); }

    static expected success(T value) {
        expected r;
        r.mValue = pl::move(value);
        return r;
    }

    static expected failure(E err, const char *msg = nullptr) {
        expected r;
        r.mError = ErrorInfo<E>(err, msg);
        return r;
    }

    /// @brief Default constructor (creates error state)
    expected() : mValue(), mError() {}

  private:
    pl::Optional<T> mValue;
    ErrorInfo<E> mError;
};

/// @brief Specialization for operations with nothing to return
template <typename E> class expected<void, E> {
  public:
    bool ok() const { return mOk; }

    E error() const { return mError.code; }

    const char *message() const { return mOk ? "" : mError.message; }

    explicit operator bool() const { return ok(); }

    static expected success() {
        expected r;
        r.mOk = true;
        return r;
    }

    static expected failure(E err, const char *msg = nullptr) {
        expected r;
        r.mError = ErrorInfo<E>(err, msg);
        return r;
    }

    /// @brief Default constructor (creates error state)
    expected() : mOk(false), mError() {}

  private:
    bool mOk;
    ErrorInfo<E> mError;
};

/// @brief Alias for expected (Rust-style naming)
template <typename T, typename E = ResultError> using Result = expected<T, E>;

} // namespace pl
