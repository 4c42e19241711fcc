/// @file document_store.hpp
/// @brief The DocumentStore class -- the primary API for mmds-cpp.

#pragma once

#include <mmds-cpp/error.hpp>
#include <mmds-cpp/json.hpp>
#include <mmds-cpp/value.hpp>

#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace mmds_cpp {

/// An in-memory metadata document made of string leaves and named nodes.
///
/// The store owns a single root Value, initially an empty Node. It is
/// changed only through replace() and merge() and read only through
/// resolve(), snapshot() and to_json().
///
/// Every operation holds one exclusive lock for its whole duration, so
/// concurrent callers always observe some sequential order of complete
/// operations. Write operations compute the new document off to the side
/// and swap it in; a failed write leaves the document untouched.
///
/// Stores are not copyable. Share one between request handlers with
/// std::shared_ptr.
///
/// @code
/// auto store = std::make_shared<DocumentStore>();
/// store->replace(Json::parse(R"({"c0": {"c1": "12345"}})"));
/// auto v = store->resolve("c0/c1");  // Leaf{"12345"}
/// @endcode
class DocumentStore {
public:
    DocumentStore() = default;

    DocumentStore(const DocumentStore&) = delete;
    auto operator=(const DocumentStore&) -> DocumentStore& = delete;

    // -- Mutation -------------------------------------------------------------

    /// Replace the whole document.
    /// @return nullopt on success; unsupported_value_type if `candidate`
    ///   holds anything but strings and objects, or nests deeper than
    ///   max_nesting_depth.
    auto replace(const Json& candidate) -> std::optional<Error>;

    /// Apply an RFC 7396 merge patch to the document.
    ///
    /// The merged result is validated before it is committed. A patch that
    /// would leave a non string/object value in the tree is rejected and the
    /// document is left as it was. So is a patch nested deeper than
    /// max_nesting_depth, which is rejected before merging.
    /// @return nullopt on success; unsupported_value_type otherwise.
    auto merge(const Json& patch) -> std::optional<Error>;

    // -- Reading --------------------------------------------------------------

    /// Copy out the value at `path`.
    /// @return The value, or a not_found Error carrying `path`.
    auto resolve(std::string_view path) const -> std::variant<Value, Error>;

    /// Copy of the whole document.
    auto snapshot() const -> Value;

    /// JSON export of the whole document.
    auto to_json() const -> Json;

private:
    auto lock() const noexcept -> std::unique_lock<std::mutex>;

    mutable std::mutex mutex_;
    Value root_;
};

/// Render a resolved value as lines.
///
/// A Leaf renders as its string. A Node renders one bare child name per
/// line in insertion order, with no marker for child nodes.
auto render(const Value& v) -> std::vector<std::string>;

}  // namespace mmds_cpp
