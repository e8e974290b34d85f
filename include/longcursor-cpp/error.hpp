/// @file error.hpp
/// @brief Error types for the longcursor-cpp library.

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace longcursor_cpp {

/// Categories of errors a cursor operation can report.
///
/// Every kind is a precondition violation rather than a transient
/// condition, so none of them is retried internally.
enum class ErrorKind : std::uint8_t {
    no_such_element,          ///< next() was called on an exhausted cursor.
    illegal_state,            ///< remove() was called out of sequence.
    unsupported_operation,    ///< remove() was called on a read-only cursor.
    concurrent_modification,  ///< The backing structure changed underneath the cursor.
};

/// Convert an ErrorKind to its string representation.
constexpr auto to_string_view(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::no_such_element:         return "no_such_element";
        case ErrorKind::illegal_state:           return "illegal_state";
        case ErrorKind::unsupported_operation:   return "unsupported_operation";
        case ErrorKind::concurrent_modification: return "concurrent_modification";
    }
    return "unknown";
}

/// A structured error with a category and a human-readable message.
struct Error {
    ErrorKind kind;      ///< The category of this error.
    std::string message; ///< A human-readable description.

    /// Construct an Error with the given kind and message.
    Error(ErrorKind k, std::string msg)
        : kind{k}, message{std::move(msg)} {}

    auto operator==(const Error& other) const -> bool = default;
};

/// Exception thrown by cursor operations.
///
/// Carries the structured Error so callers can branch on kind() and stop
/// traversal, fix a call-ordering bug, or avoid an unsupported capability.
class CursorError : public std::runtime_error {
public:
    explicit CursorError(Error err)
        : std::runtime_error{err.message}, error_{std::move(err)} {}

    CursorError(ErrorKind kind, std::string message)
        : CursorError{Error{kind, std::move(message)}} {}

    auto error() const noexcept -> const Error& { return error_; }
    auto kind() const noexcept -> ErrorKind { return error_.kind; }

private:
    Error error_;
};

}  // namespace longcursor_cpp
