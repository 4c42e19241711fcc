// mmds-cpp benchmarks: measures throughput of core store operations.

#include <mmds-cpp/mmds.hpp>

#include <benchmark/benchmark.h>

#include <cstdint>
#include <string>

using namespace mmds_cpp;

// A document with `width` top-level nodes, each holding `width` leaves.
static auto make_document(std::int64_t width) -> Json {
    auto doc = Json::object();
    for (std::int64_t i = 0; i < width; ++i) {
        auto& child = doc["node" + std::to_string(i)];
        for (std::int64_t k = 0; k < width; ++k) {
            child["leaf" + std::to_string(k)] = "value" + std::to_string(k);
        }
    }
    return doc;
}

// =============================================================================
// Validation
// =============================================================================

static void bm_validate(benchmark::State& state) {
    const auto doc = make_document(state.range(0));
    for (auto _ : state) {
        auto error = validate(doc);
        benchmark::DoNotOptimize(error);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0) * state.range(0));
}
BENCHMARK(bm_validate)->Range(4, 64);

// =============================================================================
// Store operations
// =============================================================================

static void bm_replace(benchmark::State& state) {
    auto store = DocumentStore{};
    const auto doc = make_document(state.range(0));
    for (auto _ : state) {
        auto error = store.replace(doc);
        benchmark::DoNotOptimize(error);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_replace)->Range(4, 64);

static void bm_merge_single_leaf(benchmark::State& state) {
    auto store = DocumentStore{};
    (void)store.replace(make_document(state.range(0)));
    auto patch = Json::object();
    std::int64_t i = 0;
    for (auto _ : state) {
        patch["node0"]["leaf0"] = std::to_string(i++);
        auto error = store.merge(patch);
        benchmark::DoNotOptimize(error);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_merge_single_leaf)->Range(4, 64);

static void bm_resolve_leaf(benchmark::State& state) {
    auto store = DocumentStore{};
    (void)store.replace(make_document(state.range(0)));
    const auto path = "node" + std::to_string(state.range(0) - 1)
                    + "/leaf" + std::to_string(state.range(0) - 1);
    for (auto _ : state) {
        auto v = store.resolve(path);
        benchmark::DoNotOptimize(v);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_resolve_leaf)->Range(4, 64);

static void bm_resolve_and_render_node(benchmark::State& state) {
    auto store = DocumentStore{};
    (void)store.replace(make_document(state.range(0)));
    for (auto _ : state) {
        auto v = store.resolve("node0");
        auto lines = render(std::get<Value>(v));
        benchmark::DoNotOptimize(lines);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_resolve_and_render_node)->Range(4, 64);

// =============================================================================
// Merge patch without the store
// =============================================================================

static void bm_merge_patch_json(benchmark::State& state) {
    const auto target = make_document(state.range(0));
    const auto patch = Json::parse(R"({"node0": {"leaf0": null, "extra": "x"}, "new": {"a": "b"}})");
    for (auto _ : state) {
        auto result = merge_patch(target, patch);
        benchmark::DoNotOptimize(result);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_merge_patch_json)->Range(4, 64);
