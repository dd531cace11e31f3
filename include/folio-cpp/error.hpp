/// @file error.hpp
/// @brief Error types for the folio-cpp library.

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace folio_cpp {

/// Categories of errors that can occur in the library.
enum class ErrorKind : std::uint8_t {
    invalid_position,   ///< A position lies outside the document.
    invalid_content,    ///< Content does not satisfy the schema.
    invalid_schema,     ///< A schema spec or a type lookup is malformed.
    step_failed,        ///< A step could not be applied to a document.
    invalid_selection,  ///< A selection does not fit its document.
    invalid_json,       ///< A JSON value could not be deserialized.
    invalid_operation,  ///< An operation is invalid in the current context.
};

/// Convert an ErrorKind to its string representation.
constexpr auto to_string_view(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::invalid_position:  return "invalid_position";
        case ErrorKind::invalid_content:   return "invalid_content";
        case ErrorKind::invalid_schema:    return "invalid_schema";
        case ErrorKind::step_failed:       return "step_failed";
        case ErrorKind::invalid_selection: return "invalid_selection";
        case ErrorKind::invalid_json:      return "invalid_json";
        case ErrorKind::invalid_operation: return "invalid_operation";
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

/// The exception thrown by every failing folio-cpp operation.
///
/// what() returns the message; error() exposes the structured Error.
class Exception : public std::runtime_error {
public:
    explicit Exception(Error error)
        : std::runtime_error{error.message}, error_{std::move(error)} {}

    Exception(ErrorKind kind, std::string message)
        : Exception{Error{kind, std::move(message)}} {}

    auto error() const noexcept -> const Error& { return error_; }
    auto kind() const noexcept -> ErrorKind { return error_.kind; }

private:
    Error error_;
};

}  // namespace folio_cpp
