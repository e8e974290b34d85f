#include <longcursor-cpp/error.hpp>

#include <gtest/gtest.h>

#include <stdexcept>

using namespace longcursor_cpp;

TEST(ErrorKind, to_string_view_covers_all_variants) {
    EXPECT_EQ(to_string_view(ErrorKind::no_such_element),         "no_such_element");
    EXPECT_EQ(to_string_view(ErrorKind::illegal_state),           "illegal_state");
    EXPECT_EQ(to_string_view(ErrorKind::unsupported_operation),   "unsupported_operation");
    EXPECT_EQ(to_string_view(ErrorKind::concurrent_modification), "concurrent_modification");
}

TEST(Error, protocol_violations_compare_by_kind) {
    const auto twice = Error{ErrorKind::illegal_state, "remove() called twice"};
    const auto read_only = Error{ErrorKind::unsupported_operation, "remove() called twice"};

    EXPECT_NE(twice, read_only);
    EXPECT_EQ(twice, (Error{ErrorKind::illegal_state, "remove() called twice"}));
}

TEST(CursorError, error_survives_the_throw) {
    const auto expected = Error{ErrorKind::no_such_element, "cursor is exhausted"};
    try {
        throw CursorError{expected};
    } catch (const CursorError& e) {
        EXPECT_EQ(e.error(), expected);
        return;
    }
    FAIL() << "CursorError was not caught";
}

TEST(CursorError, carries_kind_and_message) {
    const auto e = CursorError{ErrorKind::concurrent_modification, "vector resized"};

    EXPECT_EQ(e.kind(), ErrorKind::concurrent_modification);
    EXPECT_EQ(e.error().message, "vector resized");
    EXPECT_STREQ(e.what(), "vector resized");
}

TEST(CursorError, is_a_runtime_error) {
    try {
        throw CursorError{Error{ErrorKind::unsupported_operation, "read-only"}};
    } catch (const std::runtime_error& e) {
        EXPECT_STREQ(e.what(), "read-only");
        return;
    }
    FAIL() << "CursorError was not caught as std::runtime_error";
}
