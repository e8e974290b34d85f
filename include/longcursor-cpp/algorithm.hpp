/// @file algorithm.hpp
/// @brief Generic traversal algorithms over LongCursor.
///
/// Every function here consumes the cursor only through has_more(), next()
/// and remove(), so it works with any backing structure. All of them start
/// from the cursor's current position and leave it exhausted, except
/// contains() and remove_value(), which stop at the first match.

#pragma once

#include <longcursor-cpp/long_cursor.hpp>

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace longcursor_cpp {

/// Collect the remaining values in traversal order.
auto to_vector(LongCursor& cursor) -> std::vector<std::int64_t>;

/// Count the remaining values.
auto count(LongCursor& cursor) -> std::size_t;

/// Advance until value is found. Returns false if the cursor runs out.
auto contains(LongCursor& cursor, std::int64_t value) -> bool;

/// Remove the first remaining occurrence of value.
/// @return true if an element was removed.
auto remove_value(LongCursor& cursor, std::int64_t value) -> bool;

/// Remove every remaining element.
/// @return The number of elements removed.
auto remove_remaining(LongCursor& cursor) -> std::size_t;

/// XOR of the remaining values with the high word folded into the low word.
auto xor_hash(LongCursor& cursor) -> std::int32_t;

/// Format the remaining values as "[a, b, c]".
auto to_string(LongCursor& cursor) -> std::string;

/// Call fn(value) for each remaining value.
template <typename Fn>
    requires std::invocable<Fn, std::int64_t>
void for_each(LongCursor& cursor, Fn&& fn) {
    while (cursor.has_more()) {
        fn(cursor.next());
    }
}

/// Remove every remaining element for which pred returns true.
/// @return The number of elements removed.
template <typename Pred>
    requires std::predicate<Pred, std::int64_t>
auto remove_if(LongCursor& cursor, Pred&& pred) -> std::size_t {
    auto removed = std::size_t{0};
    while (cursor.has_more()) {
        if (pred(cursor.next())) {
            cursor.remove();
            ++removed;
        }
    }
    return removed;
}

/// Remove every remaining element for which pred returns false.
/// @return The number of elements removed.
template <typename Pred>
    requires std::predicate<Pred, std::int64_t>
auto retain_if(LongCursor& cursor, Pred&& pred) -> std::size_t {
    return remove_if(cursor, [&pred](std::int64_t v) { return !pred(v); });
}

}  // namespace longcursor_cpp
