/// @file json.hpp
/// @brief nlohmann/json interoperability for mmds-cpp.
///
/// Documents and merge patches travel as nlohmann::ordered_json so that
/// key order on the wire becomes listing order in the store.

#pragma once

#include <mmds-cpp/value.hpp>

#include <nlohmann/json.hpp>

#include <optional>
#include <string_view>

namespace mmds_cpp {

/// The wire form of a document or merge patch.
using Json = nlohmann::ordered_json;

// =============================================================================
// ADL serialization: to_json
// =============================================================================

void to_json(Json& j, const Leaf& leaf);
void to_json(Json& j, const Node& node);
void to_json(Json& j, const Value& v);

// =============================================================================
// Parsing
// =============================================================================

/// Parse a request body into JSON.
/// @return The parsed value, or nullopt if the text is not valid JSON.
auto parse_json(std::string_view text) -> std::optional<Json>;

/// Convert JSON that contains only strings and objects into a Value.
/// @return nullopt if any other shape appears. Use validate() to find out where.
auto from_json(const Json& j) -> std::optional<Value>;

}  // namespace mmds_cpp
