#include <mmds-cpp/path.hpp>

namespace mmds_cpp {

auto split_path(std::string_view path) -> std::vector<std::string_view> {
    auto segments = std::vector<std::string_view>{};
    auto pos = std::size_t{0};
    while (pos <= path.size()) {
        auto next = path.find('/', pos);
        if (next == std::string_view::npos) next = path.size();
        if (next > pos) {
            segments.push_back(path.substr(pos, next - pos));
        }
        pos = next + 1;
    }
    return segments;
}

auto resolve(const Value& root, std::string_view path) -> const Value* {
    const auto* current = &root;
    for (auto segment : split_path(path)) {
        const auto* node = current->as_node();
        if (!node) return nullptr;
        current = node->find(segment);
        if (!current) return nullptr;
    }
    return current;
}

}  // namespace mmds_cpp
