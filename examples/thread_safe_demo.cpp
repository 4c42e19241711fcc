// thread_safe_demo: one store, many threads
//
// Demonstrates: DocumentStore serializes every operation behind one lock.
// Writers install documents whose leaves always agree; readers never see a
// half-written document.
//
// Build: cmake --build build
// Run:   ./build/examples/thread_safe_demo

#include <mmds-cpp/mmds.hpp>

#include <atomic>
#include <chrono>
#include <cstdio>
#include <memory>
#include <string>
#include <thread>
#include <variant>
#include <vector>

namespace mds = mmds_cpp;

int main() {
    auto store = std::make_shared<mds::DocumentStore>();
    (void)store->replace(mds::Json::parse(R"({"pair": {"left": "0", "right": "0"}})"));

    constexpr int num_writers = 8;
    constexpr int num_readers = 8;
    constexpr int ops_per_thread = 5000;

    auto torn = std::atomic<int>{0};
    auto reads = std::atomic<int>{0};
    const auto start = std::chrono::steady_clock::now();
    {
        auto threads = std::vector<std::jthread>{};
        for (int w = 0; w < num_writers; ++w) {
            threads.emplace_back([store, w]() {
                for (int i = 0; i < ops_per_thread; ++i) {
                    auto tag = std::to_string(w) + ":" + std::to_string(i);
                    auto patch = mds::Json::object();
                    patch["pair"]["left"] = tag;
                    patch["pair"]["right"] = tag;
                    (void)store->merge(patch);
                }
            });
        }
        for (int r = 0; r < num_readers; ++r) {
            threads.emplace_back([store, &torn, &reads]() {
                for (int i = 0; i < ops_per_thread; ++i) {
                    auto result = store->resolve("pair");
                    const auto* v = std::get_if<mds::Value>(&result);
                    if (!v) continue;
                    const auto* node = v->as_node();
                    if (!(*node->find("left") == *node->find("right"))) {
                        torn.fetch_add(1, std::memory_order_relaxed);
                    }
                    reads.fetch_add(1, std::memory_order_relaxed);
                }
            });
        }
    }  // jthreads join here
    const auto elapsed = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - start);

    std::printf("%d writers x %d merges, %d readers x %d resolves in %.1f ms\n",
                num_writers, ops_per_thread, num_readers, ops_per_thread, elapsed.count());
    std::printf("reads: %d, torn reads: %d\n", reads.load(), torn.load());
    std::printf("final: %s\n", store->to_json().dump().c_str());
    return torn.load() == 0 ? 0 : 1;
}
