#include <mmds-cpp/json.hpp>

namespace mmds_cpp {

// =============================================================================
// ADL serialization: to_json
// =============================================================================

void to_json(Json& j, const Leaf& leaf) {
    j = leaf.text;
}

void to_json(Json& j, const Node& node) {
    j = Json::object();
    for (const auto& [name, child] : node) {
        to_json(j[name], child);
    }
}

void to_json(Json& j, const Value& v) {
    std::visit([&j](const auto& alt) { to_json(j, alt); }, v.variant());
}

// =============================================================================
// Parsing
// =============================================================================

auto parse_json(std::string_view text) -> std::optional<Json> {
    auto j = Json::parse(text, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded()) return std::nullopt;
    return j;
}

auto from_json(const Json& j) -> std::optional<Value> {
    if (j.is_string()) {
        return Value{Leaf{j.get<std::string>()}};
    }
    if (!j.is_object()) return std::nullopt;

    auto node = Node{};
    for (const auto& [key, child] : j.items()) {
        auto converted = from_json(child);
        if (!converted) return std::nullopt;
        node.set(key, std::move(*converted));
    }
    return Value{std::move(node)};
}

}  // namespace mmds_cpp
