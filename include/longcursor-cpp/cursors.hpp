/// @file cursors.hpp
/// @brief Factory functions for common cursors.
///
/// None of these cursors own the values they traverse; the caller keeps the
/// backing storage alive for as long as the cursor is used.

#pragma once

#include <longcursor-cpp/long_cursor.hpp>
#include <longcursor-cpp/modification.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <vector>

namespace longcursor_cpp {

/// A cursor with no elements.
auto empty_cursor() -> std::unique_ptr<LongCursor>;

/// A read-only cursor that yields exactly one value.
auto single_cursor(std::int64_t value) -> std::unique_ptr<LongCursor>;

/// A read-only cursor over contiguous values.
auto span_cursor(std::span<const std::int64_t> values) -> std::unique_ptr<LongCursor>;

/// A read-only cursor over values[offset, offset + length).
/// @throws std::out_of_range if the range does not fit in values.
auto span_cursor(std::span<const std::int64_t> values,
                 std::size_t offset, std::size_t length) -> std::unique_ptr<LongCursor>;

/// A removable cursor over a caller-owned vector.
///
/// remove() erases the last returned element from the vector. If anyone
/// else changes the vector's size while the cursor is live, the next
/// next() or remove() throws concurrent_modification.
auto vector_cursor(std::vector<std::int64_t>& values) -> std::unique_ptr<LongCursor>;

/// A removable cursor over a vector whose owner records structural changes
/// in mods. The cursor records its own removals there too, so sibling
/// cursors over the same vector fail fast after one of them removes.
auto vector_cursor(std::vector<std::int64_t>& values,
                   ModificationCounter& mods) -> std::unique_ptr<LongCursor>;

/// Wrap a cursor so that remove() always throws unsupported_operation.
auto unmodifiable(std::unique_ptr<LongCursor> cursor) -> std::unique_ptr<LongCursor>;

}  // namespace longcursor_cpp
