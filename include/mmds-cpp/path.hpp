/// @file path.hpp
/// @brief Slash-delimited path navigation over a Value tree.

#pragma once

#include <mmds-cpp/value.hpp>

#include <string_view>
#include <vector>

namespace mmds_cpp {

/// Split a path on '/', dropping empty segments.
/// "", "/" and "//" all yield no segments; "/a//b/" yields ["a", "b"].
auto split_path(std::string_view path) -> std::vector<std::string_view>;

/// Walk `root` along `path`.
///
/// Every segment must name a child of a Node; segment matching is exact and
/// case-sensitive. An empty path resolves to `root`.
/// @return The value at the path, or nullptr if it does not exist.
auto resolve(const Value& root, std::string_view path) -> const Value*;

}  // namespace mmds_cpp
