/// @file error.hpp
/// @brief Error types for the diffjson-cpp library.

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace diffjson_cpp {

/// Categories of errors that can occur in the library.
enum class ErrorKind : std::uint8_t {
    file_not_found,      ///< A document path does not exist.
    read_error,          ///< A document exists but could not be read.
    parse_error,         ///< A document is not well-formed JSON.
    invalid_invocation,  ///< The two input paths cannot be compared.
};

/// Convert an ErrorKind to its string representation.
constexpr auto to_string_view(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::file_not_found:     return "file_not_found";
        case ErrorKind::read_error:         return "read_error";
        case ErrorKind::parse_error:        return "parse_error";
        case ErrorKind::invalid_invocation: return "invalid_invocation";
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

}  // namespace diffjson_cpp
