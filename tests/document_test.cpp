#include <entitypatch-cpp/document.hpp>
#include <entitypatch-cpp/error.hpp>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

using namespace entitypatch_cpp;
using json = nlohmann::json;

namespace {

auto ptr(std::string_view raw) -> JsonPointer { return JsonPointer::parse(raw); }

template <typename Fn>
auto error_kind_of(Fn&& fn) -> ErrorKind {
    try {
        fn();
    } catch (const PatchError& e) {
        return e.kind();
    }
    ADD_FAILURE() << "expected a PatchError";
    return ErrorKind::invalid_request;
}

class DocumentAccessorTest : public ::testing::Test {
protected:
    PatchOptions options{};
    Document doc{"Alpha", json::parse(R"({"outer": {"inner": 1}, "items": [1, 2], "s": "x"})")};
    DocumentAccessor accessor{doc, options};
};

}  // namespace

// -- NodeKind -----------------------------------------------------------------

TEST(NodeKind, classifies_json_values) {
    EXPECT_EQ(node_kind(json::object()), NodeKind::object);
    EXPECT_EQ(node_kind(json::array()), NodeKind::array);
    EXPECT_EQ(node_kind(json(nullptr)), NodeKind::null);
    EXPECT_EQ(node_kind(json(1)), NodeKind::scalar);
    EXPECT_EQ(node_kind(json(1.5)), NodeKind::scalar);
    EXPECT_EQ(node_kind(json("s")), NodeKind::scalar);
    EXPECT_EQ(node_kind(json(true)), NodeKind::scalar);
}

TEST(NodeKind, to_string_view_covers_all_variants) {
    EXPECT_EQ(to_string_view(NodeKind::object), "object");
    EXPECT_EQ(to_string_view(NodeKind::array),  "array");
    EXPECT_EQ(to_string_view(NodeKind::scalar), "scalar");
    EXPECT_EQ(to_string_view(NodeKind::null),   "null");
}

// -- Root resolution ----------------------------------------------------------

TEST_F(DocumentAccessorTest, resolves_roots) {
    EXPECT_EQ(accessor.resolve_root(ptr("/name")), Root::label);
    EXPECT_EQ(accessor.resolve_root(ptr("/data")), Root::payload);
    EXPECT_EQ(accessor.resolve_root(ptr("/data/outer/inner")), Root::payload);
}

TEST_F(DocumentAccessorTest, unknown_roots_are_invalid_paths) {
    EXPECT_EQ(error_kind_of([&] { accessor.resolve_root(ptr("/other")); }),
              ErrorKind::invalid_path);
    EXPECT_EQ(error_kind_of([&] { accessor.resolve_root(ptr("/")); }),
              ErrorKind::invalid_path);
    EXPECT_EQ(error_kind_of([&] { accessor.resolve_root(ptr("/name/first")); }),
              ErrorKind::invalid_path);
    EXPECT_EQ(error_kind_of([&] { accessor.resolve_root(ptr("/payload")); }),
              ErrorKind::invalid_path);
}

TEST(DocumentAccessor, root_names_come_from_options) {
    auto options = PatchOptions{};
    options.label_field = "title";
    options.payload_field = "payload";
    auto doc = Document{"T", json{{"k", 1}}};
    auto accessor = DocumentAccessor{doc, options};

    EXPECT_EQ(accessor.get(ptr("/title")), json("T"));
    EXPECT_EQ(accessor.get(ptr("/payload/k")), json(1));
    EXPECT_EQ(error_kind_of([&] { accessor.get(ptr("/name")); }), ErrorKind::invalid_path);
    EXPECT_EQ(error_kind_of([&] { accessor.get(ptr("/data")); }), ErrorKind::invalid_path);
}

// -- get ----------------------------------------------------------------------

TEST_F(DocumentAccessorTest, get_label_and_payload_root) {
    EXPECT_EQ(accessor.get(ptr("/name")), json("Alpha"));
    EXPECT_EQ(accessor.get(ptr("/data")), doc.payload);
}

TEST_F(DocumentAccessorTest, get_nested_values) {
    EXPECT_EQ(accessor.get(ptr("/data/outer")), json({{"inner", 1}}));
    EXPECT_EQ(accessor.get(ptr("/data/outer/inner")), json(1));
    EXPECT_EQ(accessor.get(ptr("/data/items/1")), json(2));
}

TEST_F(DocumentAccessorTest, get_returns_independent_copy) {
    auto value = accessor.get(ptr("/data/outer"));
    value["inner"] = 99;
    EXPECT_EQ(doc.payload["outer"]["inner"], json(1));
}

TEST_F(DocumentAccessorTest, get_missing_key_is_path_not_found) {
    EXPECT_EQ(error_kind_of([&] { accessor.get(ptr("/data/nope")); }), ErrorKind::path_not_found);
    EXPECT_EQ(error_kind_of([&] { accessor.get(ptr("/data/outer/nope")); }),
              ErrorKind::path_not_found);
}

TEST_F(DocumentAccessorTest, get_out_of_range_index_is_path_not_found) {
    EXPECT_EQ(error_kind_of([&] { accessor.get(ptr("/data/items/2")); }),
              ErrorKind::path_not_found);
}

TEST_F(DocumentAccessorTest, get_bad_array_segments_are_invalid_index) {
    EXPECT_EQ(error_kind_of([&] { accessor.get(ptr("/data/items/-")); }),
              ErrorKind::invalid_index);
    EXPECT_EQ(error_kind_of([&] { accessor.get(ptr("/data/items/x")); }),
              ErrorKind::invalid_index);
    EXPECT_EQ(error_kind_of([&] { accessor.get(ptr("/data/items/-1")); }),
              ErrorKind::invalid_index);
    EXPECT_EQ(error_kind_of([&] { accessor.get(ptr("/data/items/01")); }),
              ErrorKind::invalid_index);
}

TEST_F(DocumentAccessorTest, get_through_scalar_is_not_traversable) {
    EXPECT_EQ(error_kind_of([&] { accessor.get(ptr("/data/s/x")); }),
              ErrorKind::not_traversable);
    EXPECT_EQ(error_kind_of([&] { accessor.get(ptr("/data/outer/inner/x")); }),
              ErrorKind::not_traversable);
}

TEST(DocumentAccessor, get_beneath_null_payload_is_not_traversable) {
    auto options = PatchOptions{};
    auto doc = Document{"A", nullptr};
    auto accessor = DocumentAccessor{doc, options};
    EXPECT_EQ(accessor.get(ptr("/data")), json(nullptr));
    EXPECT_EQ(error_kind_of([&] { accessor.get(ptr("/data/x")); }), ErrorKind::not_traversable);
}

// -- set: label ---------------------------------------------------------------

TEST_F(DocumentAccessorTest, set_label) {
    accessor.set(ptr("/name"), "Beta", ListSemantics::strict);
    EXPECT_EQ(doc.label, "Beta");
}

TEST_F(DocumentAccessorTest, set_label_rejects_blank_and_non_string) {
    for (const auto& bad : {json(""), json("   "), json(1), json(nullptr), json::object()}) {
        EXPECT_EQ(error_kind_of([&] { accessor.set(ptr("/name"), bad, ListSemantics::strict); }),
                  ErrorKind::invalid_label_value) << bad.dump();
    }
    EXPECT_EQ(doc.label, "Alpha");
}

// -- set: payload -------------------------------------------------------------

TEST_F(DocumentAccessorTest, set_payload_root_accepts_any_value) {
    accessor.set(ptr("/data"), json::array({1, 2}), ListSemantics::strict);
    EXPECT_EQ(doc.payload, json::array({1, 2}));
    accessor.set(ptr("/data"), 7, ListSemantics::append);
    EXPECT_EQ(doc.payload, json(7));
    accessor.set(ptr("/data"), nullptr, ListSemantics::append);
    EXPECT_TRUE(doc.payload.is_null());
}

TEST_F(DocumentAccessorTest, set_object_key_upserts) {
    accessor.set(ptr("/data/outer/new"), 2, ListSemantics::append);
    accessor.set(ptr("/data/outer/inner"), 3, ListSemantics::strict);
    EXPECT_EQ(doc.payload["outer"], json({{"inner", 3}, {"new", 2}}));
}

TEST_F(DocumentAccessorTest, append_token_appends_under_append_semantics) {
    accessor.set(ptr("/data/items/-"), 3, ListSemantics::append);
    EXPECT_EQ(doc.payload["items"], json::array({1, 2, 3}));
}

TEST_F(DocumentAccessorTest, append_token_is_invalid_under_strict_semantics) {
    EXPECT_EQ(error_kind_of([&] { accessor.set(ptr("/data/items/-"), 3, ListSemantics::strict); }),
              ErrorKind::invalid_index);
}

TEST_F(DocumentAccessorTest, append_semantics_insert_at_index) {
    accessor.set(ptr("/data/items/1"), 9, ListSemantics::append);
    EXPECT_EQ(doc.payload["items"], json::array({1, 9, 2}));
    accessor.set(ptr("/data/items/3"), 4, ListSemantics::append);
    EXPECT_EQ(doc.payload["items"], json::array({1, 9, 2, 4}));
}

TEST_F(DocumentAccessorTest, append_semantics_reject_index_past_end) {
    EXPECT_EQ(error_kind_of([&] { accessor.set(ptr("/data/items/3"), 9, ListSemantics::append); }),
              ErrorKind::path_not_found);
    EXPECT_EQ(doc.payload["items"], json::array({1, 2}));
}

TEST_F(DocumentAccessorTest, strict_semantics_overwrite_existing_index) {
    accessor.set(ptr("/data/items/1"), 9, ListSemantics::strict);
    EXPECT_EQ(doc.payload["items"], json::array({1, 9}));
}

TEST_F(DocumentAccessorTest, strict_semantics_reject_missing_index) {
    EXPECT_EQ(error_kind_of([&] { accessor.set(ptr("/data/items/2"), 9, ListSemantics::strict); }),
              ErrorKind::path_not_found);
}

TEST_F(DocumentAccessorTest, set_creates_intermediate_objects_and_arrays) {
    accessor.set(ptr("/data/a/b/c"), 1, ListSemantics::append);
    EXPECT_EQ(doc.payload["a"], json({{"b", {{"c", 1}}}}));

    accessor.set(ptr("/data/list/-"), "x", ListSemantics::append);
    EXPECT_EQ(doc.payload["list"], json::array({"x"}));

    accessor.set(ptr("/data/grid/0/name"), "cell", ListSemantics::append);
    EXPECT_EQ(doc.payload["grid"], json::parse(R"([{"name": "cell"}])"));
}

TEST_F(DocumentAccessorTest, set_replaces_null_intermediate) {
    doc.payload["hole"] = nullptr;
    accessor.set(ptr("/data/hole/k"), true, ListSemantics::append);
    EXPECT_EQ(doc.payload["hole"], json({{"k", true}}));
}

TEST_F(DocumentAccessorTest, set_pads_intermediate_arrays_with_null) {
    accessor.set(ptr("/data/items/4/k"), 1, ListSemantics::append);
    EXPECT_EQ(doc.payload["items"], json::parse(R"([1, 2, null, null, {"k": 1}])"));
}

TEST_F(DocumentAccessorTest, set_pads_up_to_the_padding_limit) {
    const auto last = std::to_string(2 + max_array_padding);
    accessor.set(ptr("/data/items/" + last + "/k"), 1, ListSemantics::append);
    ASSERT_EQ(doc.payload["items"].size(), 3 + max_array_padding);
    EXPECT_EQ(doc.payload["items"].back(), json({{"k", 1}}));
}

TEST_F(DocumentAccessorTest, set_rejects_padding_past_the_limit) {
    const auto before = doc;
    for (const auto* path : {"/data/items/1027/k",
                             "/data/items/100000000000000/k",
                             "/data/items/18446744073709551615/k",
                             "/data/fresh/18446744073709551615/k"}) {
        EXPECT_EQ(error_kind_of([&] { accessor.set(ptr(path), 1, ListSemantics::append); }),
                  ErrorKind::invalid_index) << path;
    }
    EXPECT_EQ(doc.payload["items"], before.payload["items"]);
}

TEST_F(DocumentAccessorTest, leading_zero_segment_creates_object) {
    accessor.set(ptr("/data/fresh/01/x"), 1, ListSemantics::append);
    EXPECT_EQ(doc.payload["fresh"], json::parse(R"({"01": {"x": 1}})"));

    accessor.set(ptr("/data/list/0/x"), 1, ListSemantics::append);
    EXPECT_EQ(doc.payload["list"], json::parse(R"([{"x": 1}])"));
}

TEST_F(DocumentAccessorTest, set_through_scalar_is_not_traversable) {
    EXPECT_EQ(error_kind_of([&] { accessor.set(ptr("/data/s/x"), 1, ListSemantics::append); }),
              ErrorKind::not_traversable);
    EXPECT_EQ(error_kind_of([&] { accessor.set(ptr("/data/s/x/y"), 1, ListSemantics::append); }),
              ErrorKind::not_traversable);
}

TEST_F(DocumentAccessorTest, set_through_array_needs_numeric_segment) {
    EXPECT_EQ(error_kind_of([&] { accessor.set(ptr("/data/items/x/y"), 1, ListSemantics::append); }),
              ErrorKind::invalid_index);
    EXPECT_EQ(error_kind_of([&] { accessor.set(ptr("/data/items/-/y"), 1, ListSemantics::append); }),
              ErrorKind::invalid_index);
}

TEST(DocumentAccessor, nested_set_initializes_null_payload) {
    auto options = PatchOptions{};
    auto doc = Document{"A", nullptr};
    auto accessor = DocumentAccessor{doc, options};
    accessor.set(ptr("/data/x"), 1, ListSemantics::append);
    EXPECT_EQ(doc.payload, json({{"x", 1}}));
}

TEST(DocumentAccessor, nested_set_on_scalar_payload_is_not_traversable) {
    auto options = PatchOptions{};
    auto doc = Document{"A", 5};
    auto accessor = DocumentAccessor{doc, options};
    EXPECT_EQ(error_kind_of([&] { accessor.set(ptr("/data/x"), 1, ListSemantics::append); }),
              ErrorKind::not_traversable);
}

TEST(DocumentAccessor, nested_set_into_array_payload) {
    auto options = PatchOptions{};
    auto doc = Document{"A", json::array({"a"})};
    auto accessor = DocumentAccessor{doc, options};
    accessor.set(ptr("/data/0"), "b", ListSemantics::append);
    EXPECT_EQ(doc.payload, json::array({"b", "a"}));
}

// -- remove -------------------------------------------------------------------

TEST_F(DocumentAccessorTest, remove_label_is_refused) {
    EXPECT_EQ(error_kind_of([&] { accessor.remove(ptr("/name")); }),
              ErrorKind::label_not_removable);
    EXPECT_EQ(doc.label, "Alpha");
}

TEST_F(DocumentAccessorTest, remove_payload_root_sets_null) {
    accessor.remove(ptr("/data"));
    EXPECT_TRUE(doc.payload.is_null());
}

TEST_F(DocumentAccessorTest, remove_object_key) {
    accessor.remove(ptr("/data/outer/inner"));
    EXPECT_EQ(doc.payload["outer"], json::object());
}

TEST_F(DocumentAccessorTest, remove_array_element_shifts) {
    accessor.remove(ptr("/data/items/0"));
    EXPECT_EQ(doc.payload["items"], json::array({2}));
}

TEST_F(DocumentAccessorTest, remove_missing_targets_are_path_not_found) {
    EXPECT_EQ(error_kind_of([&] { accessor.remove(ptr("/data/nope")); }),
              ErrorKind::path_not_found);
    EXPECT_EQ(error_kind_of([&] { accessor.remove(ptr("/data/nope/deeper")); }),
              ErrorKind::path_not_found);
    EXPECT_EQ(error_kind_of([&] { accessor.remove(ptr("/data/items/2")); }),
              ErrorKind::path_not_found);
}

TEST_F(DocumentAccessorTest, remove_append_token_is_invalid_index) {
    EXPECT_EQ(error_kind_of([&] { accessor.remove(ptr("/data/items/-")); }),
              ErrorKind::invalid_index);
}

TEST_F(DocumentAccessorTest, remove_does_not_create_containers) {
    const auto before = doc;
    EXPECT_EQ(error_kind_of([&] { accessor.remove(ptr("/data/a/b")); }),
              ErrorKind::path_not_found);
    EXPECT_EQ(doc, before);
}

TEST(DocumentAccessor, nested_remove_on_null_payload_is_path_not_found) {
    auto options = PatchOptions{};
    auto doc = Document{"A", nullptr};
    auto accessor = DocumentAccessor{doc, options};
    EXPECT_EQ(error_kind_of([&] { accessor.remove(ptr("/data/x")); }),
              ErrorKind::path_not_found);
}
