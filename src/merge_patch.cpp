#include <mmds-cpp/merge_patch.hpp>

namespace mmds_cpp {

namespace {

void merge_patch_in_place(Json& target, const Json& patch) {
    if (!patch.is_object()) {
        target = patch;
        return;
    }
    if (!target.is_object()) {
        target = Json::object();
    }

    for (const auto& [key, value] : patch.items()) {
        if (value.is_null()) {
            target.erase(key);
            continue;
        }
        // operator[] appends a null placeholder for new keys; merging any
        // patch value into null yields that value.
        merge_patch_in_place(target[key], value);
    }
}

}  // anonymous namespace

auto merge_patch(Json target, const Json& patch) -> Json {
    merge_patch_in_place(target, patch);
    return target;
}

auto merge_patch(const Value& target, const Json& patch) -> Json {
    return merge_patch(Json(target), patch);
}

}  // namespace mmds_cpp
