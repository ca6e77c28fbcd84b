#include <entitypatch-cpp/error.hpp>

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

using namespace entitypatch_cpp;

TEST(ErrorKind, to_string_view_covers_all_variants) {
    EXPECT_EQ(to_string_view(ErrorKind::invalid_pointer),       "invalid_pointer");
    EXPECT_EQ(to_string_view(ErrorKind::unsupported_operation), "unsupported_operation");
    EXPECT_EQ(to_string_view(ErrorKind::malformed_operation),   "malformed_operation");
    EXPECT_EQ(to_string_view(ErrorKind::invalid_request),       "invalid_request");
    EXPECT_EQ(to_string_view(ErrorKind::invalid_path),          "invalid_path");
    EXPECT_EQ(to_string_view(ErrorKind::path_not_found),        "path_not_found");
    EXPECT_EQ(to_string_view(ErrorKind::invalid_index),         "invalid_index");
    EXPECT_EQ(to_string_view(ErrorKind::not_traversable),       "not_traversable");
    EXPECT_EQ(to_string_view(ErrorKind::invalid_label_value),   "invalid_label_value");
    EXPECT_EQ(to_string_view(ErrorKind::label_not_removable),   "label_not_removable");
    EXPECT_EQ(to_string_view(ErrorKind::source_not_copyable),   "source_not_copyable");
    EXPECT_EQ(to_string_view(ErrorKind::source_not_movable),    "source_not_movable");
    EXPECT_EQ(to_string_view(ErrorKind::test_failed),           "test_failed");
}

TEST(ErrorKind, from_string_inverts_to_string_view) {
    EXPECT_EQ(error_kind_from_string("path_not_found"), ErrorKind::path_not_found);
    EXPECT_EQ(error_kind_from_string("test_failed"), ErrorKind::test_failed);
    EXPECT_FALSE(error_kind_from_string("PathNotFound").has_value());
    EXPECT_FALSE(error_kind_from_string("").has_value());
}

TEST(ErrorKind, only_test_failure_is_a_conflict) {
    EXPECT_TRUE(is_conflict(ErrorKind::test_failed));
    EXPECT_FALSE(is_conflict(ErrorKind::path_not_found));
    EXPECT_FALSE(is_conflict(ErrorKind::invalid_label_value));
    EXPECT_FALSE(is_conflict(ErrorKind::source_not_movable));
}

TEST(Error, construction_and_equality) {
    const auto e1 = Error{ErrorKind::path_not_found, "missing"};
    const auto e2 = Error{ErrorKind::path_not_found, "missing"};
    const auto e3 = Error{ErrorKind::invalid_index, "missing"};

    EXPECT_EQ(e1, e2);
    EXPECT_NE(e1, e3);
}

TEST(Error, op_index_participates_in_equality) {
    const auto untagged = Error{ErrorKind::test_failed, "mismatch"};
    const auto tagged = Error{ErrorKind::test_failed, "mismatch", 2};

    EXPECT_FALSE(untagged.op_index.has_value());
    ASSERT_TRUE(tagged.op_index.has_value());
    EXPECT_EQ(*tagged.op_index, 2u);
    EXPECT_NE(untagged, tagged);
}

TEST(PatchError, carries_error_and_formats_what) {
    const auto e = PatchError{ErrorKind::invalid_path, "invalid patch path: '/x'"};

    EXPECT_EQ(e.kind(), ErrorKind::invalid_path);
    EXPECT_EQ(e.error().message, "invalid patch path: '/x'");
    EXPECT_EQ(std::string{e.what()}, "invalid_path: invalid patch path: '/x'");
}

TEST(PatchError, is_a_runtime_error) {
    EXPECT_THROW(throw PatchError(ErrorKind::test_failed, "nope"), std::runtime_error);
}
