/// @file merge_patch.hpp
/// @brief JSON Merge Patch (RFC 7396).

#pragma once

#include <mmds-cpp/json.hpp>
#include <mmds-cpp/value.hpp>

namespace mmds_cpp {

/// Apply an RFC 7396 JSON Merge Patch to `target` and return the result.
///
/// - A non-object patch replaces the target outright.
/// - An object patch turns a non-object target into an empty object first.
/// - null members delete the key (deleting an absent key is a no-op).
/// - Other members merge recursively; untouched keys keep their order and
///   new keys are appended in patch order.
///
/// The result may hold shapes a Value cannot represent (numbers, arrays...);
/// callers that store it must validate it. The walk recurses once per
/// nesting level of `patch`; bound untrusted patches with check_depth().
auto merge_patch(Json target, const Json& patch) -> Json;

/// Merge `patch` into the JSON export of `target`.
auto merge_patch(const Value& target, const Json& patch) -> Json;

}  // namespace mmds_cpp
