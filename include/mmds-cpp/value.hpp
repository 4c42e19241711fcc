/// @file value.hpp
/// @brief Value types: Leaf, Node and the recursive Value.

#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace mmds_cpp {

class Value;

/// A terminal string value.
struct Leaf {
    std::string text;

    auto operator==(const Leaf&) const -> bool = default;
};

/// A named collection of child values.
///
/// Entries keep insertion order. Updating an existing name keeps its
/// position; new names are appended.
class Node {
public:
    using Entry = std::pair<std::string, Value>;
    using const_iterator = std::vector<Entry>::const_iterator;

    Node() = default;

    /// Look up a child by exact name. Returns nullptr if absent.
    auto find(std::string_view name) const -> const Value*;
    auto find(std::string_view name) -> Value*;

    auto contains(std::string_view name) const -> bool { return find(name) != nullptr; }

    /// Replace the child at `name` in place, or append it.
    void set(std::string name, Value value);

    /// Remove the child at `name`. Returns false if it was not present.
    auto erase(std::string_view name) -> bool;

    /// Child names in insertion order.
    auto keys() const -> std::vector<std::string>;

    auto size() const -> std::size_t;
    auto empty() const -> bool;

    auto begin() const -> const_iterator;
    auto end() const -> const_iterator;

    auto operator==(const Node& other) const -> bool;

private:
    std::vector<Entry> entries_;
};

/// A value in the document tree: either a Leaf or a Node.
///
/// Children are owned by their parent, so a Value is always a tree.
class Value {
public:
    /// The default Value is an empty Node.
    Value() : data_{Node{}} {}
    Value(Leaf leaf) : data_{std::move(leaf)} {}
    Value(Node node) : data_{std::move(node)} {}
    Value(std::string text) : data_{Leaf{std::move(text)}} {}
    Value(const char* text) : data_{Leaf{std::string{text}}} {}

    auto is_leaf() const -> bool { return std::holds_alternative<Leaf>(data_); }
    auto is_node() const -> bool { return std::holds_alternative<Node>(data_); }

    /// Access the Leaf alternative, or nullptr on mismatch.
    auto as_leaf() const -> const Leaf* { return std::get_if<Leaf>(&data_); }
    auto as_node() const -> const Node* { return std::get_if<Node>(&data_); }
    auto as_node() -> Node* { return std::get_if<Node>(&data_); }

    auto variant() const -> const std::variant<Leaf, Node>& { return data_; }

    auto operator==(const Value& other) const -> bool { return data_ == other.data_; }

private:
    std::variant<Leaf, Node> data_;
};

// Node members that need a complete Value.

inline auto Node::size() const -> std::size_t { return entries_.size(); }
inline auto Node::empty() const -> bool { return entries_.empty(); }
inline auto Node::begin() const -> const_iterator { return entries_.begin(); }
inline auto Node::end() const -> const_iterator { return entries_.end(); }

inline auto Node::operator==(const Node& other) const -> bool {
    return entries_ == other.entries_;
}

// -- Variant visitor helper ---------------------------------------------------

/// Helper for constructing ad-hoc visitors from lambdas.
///
/// @code
/// std::visit(overload{
///     [](const Leaf& l) { std::puts(l.text.c_str()); },
///     [](const Node& n) { std::printf("%zu children\n", n.size()); },
/// }, value.variant());
/// @endcode
template <typename... Ts>
struct overload : Ts... { using Ts::operator()...; };

template <typename... Ts>
overload(Ts...) -> overload<Ts...>;

}  // namespace mmds_cpp
