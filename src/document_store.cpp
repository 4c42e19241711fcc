#include <mmds-cpp/document_store.hpp>

#include <mmds-cpp/merge_patch.hpp>
#include <mmds-cpp/path.hpp>
#include <mmds-cpp/validator.hpp>

namespace mmds_cpp {

// A lock that cannot be taken means the document can no longer be trusted.
// noexcept turns the std::system_error into std::terminate.
auto DocumentStore::lock() const noexcept -> std::unique_lock<std::mutex> {
    return std::unique_lock{mutex_};
}

auto DocumentStore::replace(const Json& candidate) -> std::optional<Error> {
    auto guard = lock();
    auto result = to_value(candidate);
    if (auto* error = std::get_if<Error>(&result)) return std::move(*error);
    root_ = std::get<Value>(std::move(result));
    return std::nullopt;
}

auto DocumentStore::merge(const Json& patch) -> std::optional<Error> {
    // merge_patch recurses along the patch, so bound it first.
    if (auto error = check_depth(patch)) return error;

    auto guard = lock();
    auto merged = merge_patch(root_, patch);
    auto result = to_value(merged);
    if (auto* error = std::get_if<Error>(&result)) return std::move(*error);
    root_ = std::get<Value>(std::move(result));
    return std::nullopt;
}

auto DocumentStore::resolve(std::string_view path) const -> std::variant<Value, Error> {
    auto guard = lock();
    if (const auto* found = mmds_cpp::resolve(root_, path)) {
        return *found;
    }
    return Error{ErrorKind::not_found, std::string{path}};
}

auto DocumentStore::snapshot() const -> Value {
    auto guard = lock();
    return root_;
}

auto DocumentStore::to_json() const -> Json {
    auto guard = lock();
    return Json(root_);
}

auto render(const Value& v) -> std::vector<std::string> {
    return std::visit(overload{
        [](const Leaf& leaf) { return std::vector<std::string>{leaf.text}; },
        [](const Node& node) { return node.keys(); },
    }, v.variant());
}

}  // namespace mmds_cpp
