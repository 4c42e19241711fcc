/// @file error.hpp
/// @brief Error types for the mmds-cpp library.

#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace mmds_cpp {

/// Categories of recoverable errors reported by the document store.
enum class ErrorKind : std::uint8_t {
    not_found,               ///< A path did not lead to a leaf or node.
    unsupported_value_type,  ///< A document holds something other than a string or object.
};

/// Convert an ErrorKind to its string representation.
constexpr auto to_string_view(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::not_found:              return "not_found";
        case ErrorKind::unsupported_value_type: return "unsupported_value_type";
    }
    return "unknown";
}

/// A structured error with a category and the location it refers to.
///
/// `detail` is data, not prose: the requested path for not_found, the
/// pointer to the first offending value for unsupported_value_type.
/// Turning an Error into text is left to the caller (see http.hpp).
struct Error {
    ErrorKind kind;      ///< The category of this error.
    std::string detail;  ///< The path the error refers to.

    /// Construct an Error with the given kind and location.
    Error(ErrorKind k, std::string where)
        : kind{k}, detail{std::move(where)} {}

    auto operator==(const Error& other) const -> bool = default;
};

}  // namespace mmds_cpp
