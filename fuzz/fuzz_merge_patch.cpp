// Fuzz target for DocumentStore::merge(): splits the input into a base
// document and a patch, and checks that a rejected merge changes nothing.

#include <mmds-cpp/mmds.hpp>

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string_view>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto input = std::string_view{reinterpret_cast<const char*>(data), size};
    const auto split = input.find('\n');
    if (split == std::string_view::npos) return 0;

    auto base = mmds_cpp::parse_json(input.substr(0, split));
    auto patch = mmds_cpp::parse_json(input.substr(split + 1));
    if (!base || !patch) return 0;

    auto store = mmds_cpp::DocumentStore{};
    if (store.replace(*base)) return 0;

    const auto before = store.snapshot();
    if (store.merge(*patch)) {
        if (!(store.snapshot() == before)) std::abort();
    } else if (mmds_cpp::validate(store.to_json())) {
        std::abort();
    }
    return 0;
}
