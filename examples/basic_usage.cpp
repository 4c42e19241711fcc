// basic_usage: demonstrates the core mmds-cpp API
//
// Shows replace, merge (RFC 7396), path resolution, rendering, and how
// rejected writes leave the document untouched.
//
// Build: cmake --build build
// Run:   ./build/examples/basic_usage

#include <mmds-cpp/mmds.hpp>

#include <cstdio>
#include <memory>
#include <string>
#include <string_view>
#include <variant>

namespace mds = mmds_cpp;

static void print_path(const mds::DocumentStore& store, std::string_view path) {
    auto result = store.resolve(path);
    if (const auto* error = std::get_if<mds::Error>(&result)) {
        std::printf("  %-18s -> %s '%s'\n", std::string{path}.c_str(),
                    std::string{to_string_view(error->kind)}.c_str(), error->detail.c_str());
        return;
    }
    std::printf("  %-18s ->", std::string{path}.c_str());
    for (const auto& line : mds::render(std::get<mds::Value>(result))) {
        std::printf(" %s", line.c_str());
    }
    std::printf("\n");
}

int main() {
    // Stores are shared by handle, never through a global.
    auto store = std::make_shared<mds::DocumentStore>();

    // -- Full replace ---------------------------------------------------------
    auto error = store->replace(mds::Json::parse(R"({
        "instance": {"id": "i-1234", "type": "m5.large"},
        "region": "eu-west-1",
        "tags": {"env": "prod", "team": "infra"}
    })"));
    std::printf("replace: %s\n", error ? "rejected" : "ok");

    std::printf("\nAfter replace:\n");
    print_path(*store, "");
    print_path(*store, "instance");
    print_path(*store, "instance/id");
    print_path(*store, "/tags//env/");
    print_path(*store, "missing");

    // -- Merge patch ----------------------------------------------------------
    error = store->merge(mds::Json::parse(R"({
        "instance": {"type": "m5.xlarge"},
        "tags": {"team": null, "owner": "alice"},
        "zone": "eu-west-1a"
    })"));
    std::printf("\nmerge: %s\n", error ? "rejected" : "ok");
    print_path(*store, "");
    print_path(*store, "instance/type");
    print_path(*store, "tags");

    // -- Rejected writes ------------------------------------------------------
    error = store->replace(mds::Json::parse(R"({"cpu_count": 4})"));
    if (error) {
        std::printf("\nreplace rejected: %s at '%s'\n",
                    std::string{to_string_view(error->kind)}.c_str(), error->detail.c_str());
    }
    error = store->merge(mds::Json::parse(R"({"zone": null, "ports": [80, 443]})"));
    if (error) {
        std::printf("merge rejected:   %s at '%s'\n",
                    std::string{to_string_view(error->kind)}.c_str(), error->detail.c_str());
    }

    std::printf("\nDocument is unchanged:\n%s\n", store->to_json().dump(2).c_str());
    return 0;
}
