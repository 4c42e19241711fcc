#include <mmds-cpp/validator.hpp>

#include <string>
#include <vector>

namespace mmds_cpp {

namespace {

/// Escape a segment for RFC 6901: ~ -> ~0, / -> ~1
auto escape_pointer_segment(const std::string& segment) -> std::string {
    auto result = std::string{};
    result.reserve(segment.size());
    for (char c : segment) {
        if (c == '~') { result += "~0"; }
        else if (c == '/') { result += "~1"; }
        else { result += c; }
    }
    return result;
}

auto validate_at(const Json& j, std::string& pointer) -> bool {
    if (j.is_string()) return true;
    if (!j.is_object()) return false;

    for (const auto& [key, child] : j.items()) {
        const auto mark = pointer.size();
        pointer += '/';
        pointer += escape_pointer_segment(key);
        if (!validate_at(child, pointer)) return false;
        pointer.resize(mark);
    }
    return true;
}

}  // anonymous namespace

auto check_depth(const Json& candidate, std::size_t limit) -> std::optional<Error> {
    // Each visited container remembers its parent so the pointer of an
    // offending one can be rebuilt without a recursive walk.
    struct Visit {
        const Json* value;
        std::size_t depth;
        std::size_t parent;
        std::string key;
    };

    if (!candidate.is_structured()) return std::nullopt;

    auto visits = std::vector<Visit>{};
    visits.push_back(Visit{&candidate, 1, 0, {}});
    auto pending = std::vector<std::size_t>{0};
    while (!pending.empty()) {
        const auto index = pending.back();
        pending.pop_back();
        const auto* value = visits[index].value;
        const auto depth = visits[index].depth;

        if (depth > limit) {
            auto segments = std::vector<const std::string*>{};
            for (auto i = index; i != 0; i = visits[i].parent) {
                segments.push_back(&visits[i].key);
            }
            auto pointer = std::string{};
            for (auto it = segments.rbegin(); it != segments.rend(); ++it) {
                pointer += '/';
                pointer += escape_pointer_segment(**it);
            }
            return Error{ErrorKind::unsupported_value_type, std::move(pointer)};
        }

        for (const auto& [key, child] : value->items()) {
            if (!child.is_structured()) continue;
            visits.push_back(Visit{&child, depth + 1, index, key});
            pending.push_back(visits.size() - 1);
        }
    }
    return std::nullopt;
}

auto validate(const Json& candidate) -> std::optional<Error> {
    if (auto error = check_depth(candidate)) return error;

    auto pointer = std::string{};
    if (validate_at(candidate, pointer)) return std::nullopt;
    return Error{ErrorKind::unsupported_value_type, std::move(pointer)};
}

auto to_value(const Json& candidate) -> std::variant<Value, Error> {
    if (auto error = validate(candidate)) return *std::move(error);
    // validate() accepted it, so the conversion cannot fail.
    return *from_json(candidate);
}

}  // namespace mmds_cpp
