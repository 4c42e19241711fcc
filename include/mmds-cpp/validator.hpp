/// @file validator.hpp
/// @brief Leaf/Node shape checks for candidate documents.

#pragma once

#include <mmds-cpp/error.hpp>
#include <mmds-cpp/json.hpp>
#include <mmds-cpp/value.hpp>

#include <cstddef>
#include <optional>
#include <variant>

namespace mmds_cpp {

/// Deepest nesting of objects (and arrays) a document or patch may have.
/// The JSON walks in this library recurse once per level.
inline constexpr std::size_t max_nesting_depth = 512;

/// Check, without recursion, that `candidate` nests no deeper than `limit`.
///
/// A top-level string has depth 0, `{"a": "b"}` depth 1.
/// @return nullopt if within the limit, otherwise an unsupported_value_type
///   Error whose detail is the JSON Pointer of the first container past it.
auto check_depth(const Json& candidate, std::size_t limit = max_nesting_depth)
    -> std::optional<Error>;

/// Check that every value in `candidate` is a string or an object.
///
/// Stops at the first violation. Documents nested deeper than
/// max_nesting_depth are rejected before the shape walk starts.
/// @return nullopt if valid, otherwise an unsupported_value_type Error whose
///   detail is the JSON Pointer (RFC 6901) of the offending value.
auto validate(const Json& candidate) -> std::optional<Error>;

/// Validate and convert in one step.
auto to_value(const Json& candidate) -> std::variant<Value, Error>;

}  // namespace mmds_cpp
