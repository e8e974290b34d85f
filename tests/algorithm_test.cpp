#include <longcursor-cpp/algorithm.hpp>
#include <longcursor-cpp/cursors.hpp>

#include <gtest/gtest.h>

#include <array>
#include <cstdint>
#include <vector>

using namespace longcursor_cpp;

// -- Read-only traversal -------------------------------------------------------

TEST(Algorithm, to_vector_drains_from_current_position) {
    const auto values = std::array<std::int64_t, 4>{1, 2, 3, 4};
    auto cur = span_cursor(values);
    cur->next();

    EXPECT_EQ(to_vector(*cur), (std::vector<std::int64_t>{2, 3, 4}));
    EXPECT_FALSE(cur->has_more());
}

TEST(Algorithm, count) {
    const auto values = std::array<std::int64_t, 3>{7, 7, 7};
    EXPECT_EQ(count(*span_cursor(values)), 3u);
    EXPECT_EQ(count(*empty_cursor()), 0u);
}

TEST(Algorithm, contains_stops_at_first_match) {
    const auto values = std::array<std::int64_t, 4>{5, 6, 7, 8};
    auto cur = span_cursor(values);

    EXPECT_TRUE(contains(*cur, 6));
    EXPECT_EQ(cur->next(), 7);
    EXPECT_FALSE(contains(*cur, 5));
    EXPECT_FALSE(cur->has_more());
}

TEST(Algorithm, for_each_visits_in_order) {
    const auto values = std::array<std::int64_t, 3>{3, 2, 1};
    auto seen = std::vector<std::int64_t>{};

    auto cur = span_cursor(values);
    for_each(*cur, [&](std::int64_t v) { seen.push_back(v); });
    EXPECT_EQ(seen, (std::vector<std::int64_t>{3, 2, 1}));
}

TEST(Algorithm, xor_hash_folds_high_word) {
    EXPECT_EQ(xor_hash(*empty_cursor()), 0);
    EXPECT_EQ(xor_hash(*single_cursor(5)), 5);

    // 0x1'0000'0003: high word 1 folds into low word 3.
    EXPECT_EQ(xor_hash(*single_cursor(0x1'0000'0003)), 2);

    const auto values = std::array<std::int64_t, 2>{6, 3};
    EXPECT_EQ(xor_hash(*span_cursor(values)), 5);
}

TEST(Algorithm, xor_hash_of_negative_one) {
    // All 64 bits set: high and low words cancel.
    EXPECT_EQ(xor_hash(*single_cursor(-1)), 0);
}

TEST(Algorithm, to_string_formats_values) {
    const auto values = std::array<std::int64_t, 3>{1, -2, 3};

    EXPECT_EQ(to_string(*empty_cursor()), "[]");
    EXPECT_EQ(to_string(*single_cursor(9)), "[9]");
    EXPECT_EQ(to_string(*span_cursor(values)), "[1, -2, 3]");
}

// -- Mutating traversal --------------------------------------------------------

TEST(Algorithm, remove_value_removes_first_occurrence) {
    auto values = std::vector<std::int64_t>{1, 2, 1, 2};
    auto cur = vector_cursor(values);

    EXPECT_TRUE(remove_value(*cur, 2));
    EXPECT_EQ(values, (std::vector<std::int64_t>{1, 1, 2}));
    EXPECT_TRUE(cur->has_more());
}

TEST(Algorithm, remove_value_missing) {
    auto values = std::vector<std::int64_t>{1, 2};
    auto cur = vector_cursor(values);

    EXPECT_FALSE(remove_value(*cur, 3));
    EXPECT_EQ(values.size(), 2u);
}

TEST(Algorithm, remove_if_and_retain_if) {
    auto values = std::vector<std::int64_t>{1, 2, 3, 4, 5, 6};
    EXPECT_EQ(remove_if(*vector_cursor(values), [](std::int64_t v) { return v > 4; }), 2u);
    EXPECT_EQ(values, (std::vector<std::int64_t>{1, 2, 3, 4}));

    EXPECT_EQ(retain_if(*vector_cursor(values), [](std::int64_t v) { return v % 2 == 0; }), 2u);
    EXPECT_EQ(values, (std::vector<std::int64_t>{2, 4}));
}

TEST(Algorithm, remove_remaining_clears_rest) {
    auto values = std::vector<std::int64_t>{1, 2, 3};
    auto cur = vector_cursor(values);
    cur->next();

    EXPECT_EQ(remove_remaining(*cur), 2u);
    EXPECT_EQ(values, (std::vector<std::int64_t>{1}));
}

TEST(Algorithm, mutating_read_only_cursor_propagates_unsupported) {
    const auto values = std::array<std::int64_t, 2>{1, 2};
    auto cur = span_cursor(values);

    try {
        remove_remaining(*cur);
        FAIL() << "remove_remaining() did not throw";
    } catch (const CursorError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::unsupported_operation);
    }
}
