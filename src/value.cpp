#include <mmds-cpp/value.hpp>

#include <algorithm>

namespace mmds_cpp {

auto Node::find(std::string_view name) const -> const Value* {
    auto it = std::ranges::find(entries_, name, &Entry::first);
    return it == entries_.end() ? nullptr : &it->second;
}

auto Node::find(std::string_view name) -> Value* {
    auto it = std::ranges::find(entries_, name, &Entry::first);
    return it == entries_.end() ? nullptr : &it->second;
}

void Node::set(std::string name, Value value) {
    if (auto* existing = find(name)) {
        *existing = std::move(value);
        return;
    }
    entries_.emplace_back(std::move(name), std::move(value));
}

auto Node::erase(std::string_view name) -> bool {
    auto it = std::ranges::find(entries_, name, &Entry::first);
    if (it == entries_.end()) return false;
    entries_.erase(it);
    return true;
}

auto Node::keys() const -> std::vector<std::string> {
    auto result = std::vector<std::string>{};
    result.reserve(entries_.size());
    for (const auto& entry : entries_) {
        result.push_back(entry.first);
    }
    return result;
}

}  // namespace mmds_cpp
