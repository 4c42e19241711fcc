#include <mmds-cpp/document_store.hpp>

#include <gtest/gtest.h>

#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <variant>
#include <vector>

using namespace mmds_cpp;

namespace {

const auto* const sample_document = R"({
    "name": {"first": "John", "second": "Doe"},
    "age": "43",
    "phones": {
        "home": {"RO": "+40 1234567", "UK": "+44 1234567"},
        "mobile": "+44 2345678"
    }
})";

auto lines_at(const DocumentStore& store, std::string_view path) -> std::vector<std::string> {
    auto result = store.resolve(path);
    const auto* v = std::get_if<Value>(&result);
    if (!v) return {"<not found>"};
    return render(*v);
}

using Lines = std::vector<std::string>;

}  // namespace

// =============================================================================
// Construction
// =============================================================================

TEST(DocumentStore, starts_as_empty_node) {
    auto store = DocumentStore{};
    EXPECT_EQ(store.snapshot(), Value{Node{}});
    EXPECT_TRUE(lines_at(store, "").empty());
    EXPECT_EQ(store.to_json().dump(), "{}");
}

TEST(DocumentStore, instances_are_independent) {
    auto a = std::make_shared<DocumentStore>();
    auto b = std::make_shared<DocumentStore>();
    ASSERT_FALSE(a->replace(Json::parse(R"({"k":"a"})")).has_value());
    EXPECT_EQ(lines_at(*a, ""), (Lines{"k"}));
    EXPECT_TRUE(lines_at(*b, "").empty());
}

// =============================================================================
// replace
// =============================================================================

TEST(DocumentStore, replace_valid_document) {
    auto store = DocumentStore{};
    ASSERT_FALSE(store.replace(Json::parse(sample_document)).has_value());
    EXPECT_EQ(lines_at(store, ""), (Lines{"name", "age", "phones"}));
    EXPECT_EQ(lines_at(store, "name/first"), (Lines{"John"}));
}

TEST(DocumentStore, replace_discards_previous_document) {
    auto store = DocumentStore{};
    ASSERT_FALSE(store.replace(Json::parse(sample_document)).has_value());
    ASSERT_FALSE(store.replace(Json::parse(R"({"only":"this"})")).has_value());
    EXPECT_EQ(lines_at(store, ""), (Lines{"only"}));
}

TEST(DocumentStore, replace_with_leaf_root) {
    auto store = DocumentStore{};
    ASSERT_FALSE(store.replace(Json("just a string")).has_value());
    EXPECT_EQ(lines_at(store, ""), (Lines{"just a string"}));
    EXPECT_EQ(lines_at(store, "anything"), (Lines{"<not found>"}));
}

TEST(DocumentStore, replace_rejects_number_and_keeps_document) {
    auto store = DocumentStore{};
    ASSERT_FALSE(store.replace(Json::parse(sample_document)).has_value());
    const auto before = store.to_json().dump();

    auto error = store.replace(Json::parse(R"({"name":{"first":"John"},"age":43})"));
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->kind, ErrorKind::unsupported_value_type);
    EXPECT_EQ(error->detail, "/age");
    EXPECT_EQ(store.to_json().dump(), before);
}

TEST(DocumentStore, replace_rejects_every_unsupported_shape) {
    auto store = DocumentStore{};
    for (const auto* text : {"1", "true", "null", R"(["a"])", R"({"a":{"b":false}})",
                             R"({"a":null})", R"({"a":["x"]})", "2.5"}) {
        auto error = store.replace(Json::parse(text));
        ASSERT_TRUE(error.has_value()) << text;
        EXPECT_EQ(error->kind, ErrorKind::unsupported_value_type) << text;
    }
    EXPECT_EQ(store.to_json().dump(), "{}");
}

// =============================================================================
// merge
// =============================================================================

TEST(DocumentStore, merge_updates_nested_value) {
    auto store = DocumentStore{};
    ASSERT_FALSE(store.replace(Json::parse(R"({"a":{"b":"c"},"d":"e"})")).has_value());
    ASSERT_FALSE(store.merge(Json::parse(R"({"a":{"b":"f"}})")).has_value());
    EXPECT_EQ(store.to_json().dump(), R"({"a":{"b":"f"},"d":"e"})");
}

TEST(DocumentStore, merge_null_deletes_key) {
    auto store = DocumentStore{};
    ASSERT_FALSE(store.replace(Json::parse(R"({"a":{"b":"c"},"d":"e"})")).has_value());
    ASSERT_FALSE(store.merge(Json::parse(R"({"a":{"b":null}})")).has_value());
    EXPECT_EQ(store.to_json().dump(), R"({"a":{},"d":"e"})");
    EXPECT_TRUE(lines_at(store, "a").empty());
}

TEST(DocumentStore, merge_deleting_absent_key_is_noop) {
    auto store = DocumentStore{};
    ASSERT_FALSE(store.replace(Json::parse(R"({"a":{"b":"c"},"d":"e"})")).has_value());
    ASSERT_FALSE(store.merge(Json::parse(R"({"zzz":null,"a":{"yyy":null}})")).has_value());
    EXPECT_EQ(store.to_json().dump(), R"({"a":{"b":"c"},"d":"e"})");
}

TEST(DocumentStore, merge_node_into_leaf_root) {
    auto store = DocumentStore{};
    ASSERT_FALSE(store.replace(Json("leaf")).has_value());
    ASSERT_FALSE(store.merge(Json::parse(R"({"k":"v"})")).has_value());
    EXPECT_EQ(store.to_json().dump(), R"({"k":"v"})");
}

TEST(DocumentStore, merge_mixed_patch) {
    auto store = DocumentStore{};
    ASSERT_FALSE(store.replace(Json::parse(sample_document)).has_value());
    ASSERT_FALSE(store.merge(Json::parse(R"({
        "name": {"second": null, "last": "Kennedy"},
        "age": "44",
        "phones": {"home": "+44 1234567", "mobile": {"RO": "+40 2345678", "UK": "+44 2345678"}}
    })")).has_value());

    EXPECT_EQ(lines_at(store, "age"), (Lines{"44"}));
    EXPECT_EQ(lines_at(store, "name"), (Lines{"first", "last"}));
    EXPECT_EQ(lines_at(store, "phones/home"), (Lines{"+44 1234567"}));
    EXPECT_EQ(lines_at(store, "phones/mobile"), (Lines{"RO", "UK"}));
    EXPECT_EQ(lines_at(store, "phones/mobile/UK"), (Lines{"+44 2345678"}));
}

TEST(DocumentStore, merge_rejecting_unsupported_value_rolls_back) {
    auto store = DocumentStore{};
    ASSERT_FALSE(store.replace(Json::parse(R"({"a":{"b":"c"},"d":"e"})")).has_value());
    const auto before = store.to_json().dump();

    // The deletion of "d" must not survive the rejected patch either.
    auto error = store.merge(Json::parse(R"({"d":null,"a":{"n":5}})"));
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->kind, ErrorKind::unsupported_value_type);
    EXPECT_EQ(error->detail, "/a/n");
    EXPECT_EQ(store.to_json().dump(), before);
}

TEST(DocumentStore, merge_top_level_null_is_rejected) {
    auto store = DocumentStore{};
    ASSERT_FALSE(store.replace(Json::parse(R"({"a":"b"})")).has_value());
    auto error = store.merge(Json(nullptr));
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(store.to_json().dump(), R"({"a":"b"})");
}

TEST(DocumentStore, writes_nested_past_the_limit_are_rejected) {
    auto deep = std::string{};
    for (int i = 0; i < 10000; ++i) deep += R"({"k":)";
    deep += R"("v")";
    deep.append(10000, '}');
    const auto patch = Json::parse(deep);

    auto store = DocumentStore{};
    ASSERT_FALSE(store.replace(Json::parse(R"({"a":"b"})")).has_value());

    auto replace_error = store.replace(patch);
    ASSERT_TRUE(replace_error.has_value());
    EXPECT_EQ(replace_error->kind, ErrorKind::unsupported_value_type);

    auto merge_error = store.merge(patch);
    ASSERT_TRUE(merge_error.has_value());
    EXPECT_EQ(merge_error->kind, ErrorKind::unsupported_value_type);

    EXPECT_EQ(store.to_json().dump(), R"({"a":"b"})");
}

TEST(DocumentStore, merge_leaf_patch_replaces_document) {
    auto store = DocumentStore{};
    ASSERT_FALSE(store.replace(Json::parse(R"({"a":"b"})")).has_value());
    ASSERT_FALSE(store.merge(Json("flat")).has_value());
    EXPECT_EQ(store.snapshot(), Value{"flat"});
}

TEST(DocumentStore, repeated_deletion_patch_is_idempotent) {
    auto store = DocumentStore{};
    ASSERT_FALSE(store.replace(Json::parse(R"({"a":{"b":"c","x":"y"}})")).has_value());
    const auto patch = Json::parse(R"({"a":{"b":null}})");
    ASSERT_FALSE(store.merge(patch).has_value());
    const auto once = store.to_json();
    ASSERT_FALSE(store.merge(patch).has_value());
    EXPECT_EQ(store.to_json(), once);
}

// =============================================================================
// resolve / render
// =============================================================================

TEST(DocumentStore, resolve_paths) {
    auto store = DocumentStore{};
    ASSERT_FALSE(store.replace(Json::parse(R"({"c0":{"c1":"12345","c2":"6789"}})")).has_value());

    auto leaf = store.resolve("c0/c1");
    ASSERT_TRUE(std::holds_alternative<Value>(leaf));
    EXPECT_EQ(std::get<Value>(leaf), Value{"12345"});

    EXPECT_EQ(lines_at(store, "c0"), (Lines{"c1", "c2"}));

    auto missing = store.resolve("missing");
    ASSERT_TRUE(std::holds_alternative<Error>(missing));
    EXPECT_EQ(std::get<Error>(missing), (Error{ErrorKind::not_found, "missing"}));
}

TEST(DocumentStore, resolve_returns_a_copy) {
    auto store = DocumentStore{};
    ASSERT_FALSE(store.replace(Json::parse(R"({"a":{"b":"c"}})")).has_value());
    auto before = std::get<Value>(store.resolve("a"));
    ASSERT_FALSE(store.merge(Json::parse(R"({"a":{"b":"changed"}})")).has_value());
    EXPECT_EQ(before.as_node()->find("b")->as_leaf()->text, "c");
}

TEST(Render, leaf_is_single_line) {
    EXPECT_EQ(render(Value{"value"}), (Lines{"value"}));
    EXPECT_EQ(render(Value{""}), (Lines{""}));
}

TEST(Render, node_lists_bare_child_names_in_order) {
    auto child = Node{};
    child.set("inner", "x");
    auto node = Node{};
    node.set("leaf", "v");
    node.set("dir", child);
    EXPECT_EQ(render(Value{node}), (Lines{"leaf", "dir"}));
}

TEST(Render, empty_node_has_no_lines) {
    EXPECT_TRUE(render(Value{}).empty());
}

// =============================================================================
// Concurrency
// =============================================================================

TEST(DocumentStore, concurrent_operations_never_tear) {
    // Every write installs a document whose two leaves carry the same tag,
    // so a torn read would show mismatching values.
    auto store = std::make_shared<DocumentStore>();
    ASSERT_FALSE(store->replace(Json::parse(R"({"pair":{"a":"0","b":"0"}})")).has_value());

    auto errors = std::atomic<int>{0};
    auto threads = std::vector<std::jthread>{};
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([store, &errors, t]() {
            for (int i = 0; i < 200; ++i) {
                auto tag = std::to_string(t * 1000 + i);
                auto doc = Json::object();
                doc["pair"]["a"] = tag;
                doc["pair"]["b"] = tag;
                auto error = (i % 2 == 0) ? store->replace(doc) : store->merge(doc);
                if (error) errors.fetch_add(1, std::memory_order_relaxed);
            }
        });
    }
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([store, &errors]() {
            for (int i = 0; i < 200; ++i) {
                auto result = store->resolve("pair");
                const auto* v = std::get_if<Value>(&result);
                if (!v || !v->is_node()) {
                    errors.fetch_add(1, std::memory_order_relaxed);
                    continue;
                }
                const auto* a = v->as_node()->find("a");
                const auto* b = v->as_node()->find("b");
                if (!a || !b || !(*a == *b)) {
                    errors.fetch_add(1, std::memory_order_relaxed);
                }
            }
        });
    }
    threads.clear();  // join all
    EXPECT_EQ(errors.load(), 0);
}

TEST(DocumentStore, concurrent_merges_are_serialized) {
    // Each thread adds its own keys; with serialized merges none are lost.
    auto store = std::make_shared<DocumentStore>();
    constexpr int num_threads = 8;
    constexpr int keys_per_thread = 50;

    auto threads = std::vector<std::jthread>{};
    for (int t = 0; t < num_threads; ++t) {
        threads.emplace_back([store, t]() {
            for (int i = 0; i < keys_per_thread; ++i) {
                auto patch = Json::object();
                patch["t" + std::to_string(t)]["k" + std::to_string(i)] = "v";
                EXPECT_FALSE(store->merge(patch).has_value());
            }
        });
    }
    threads.clear();

    const auto root = store->snapshot();
    ASSERT_EQ(root.as_node()->size(), static_cast<std::size_t>(num_threads));
    for (const auto& [name, child] : *root.as_node()) {
        EXPECT_EQ(child.as_node()->size(), static_cast<std::size_t>(keys_per_thread)) << name;
    }
}
