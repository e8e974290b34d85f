/// @file checked_cursor.hpp
/// @brief CheckedCursor -- protocol-enforcing decorator for any LongCursor.

#pragma once

#include <longcursor-cpp/long_cursor.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>

namespace longcursor_cpp {

/// Wraps a cursor and enforces the fresh/advanced/exhausted protocol.
///
/// The inner cursor's next() is never called once it reports no more
/// elements, and its remove() is only called directly after a successful
/// next(). Exhaustion is sticky: once has_more(), next() or state() sees
/// the inner cursor run out, the checked cursor stays exhausted even if
/// the inner cursor would yield again.
class CheckedCursor final : public LongCursor {
public:
    /// @throws std::invalid_argument if inner is null.
    explicit CheckedCursor(std::unique_ptr<LongCursor> inner);

    auto has_more() const -> bool override;
    auto next() -> std::int64_t override;
    void remove() override;
    auto supports_remove() const -> bool override;

    /// Current protocol state.
    auto state() const -> CursorState;

    /// Number of values returned by next() so far.
    auto yielded() const noexcept -> std::size_t { return yielded_; }

    /// Number of successful remove() calls so far.
    auto removed() const noexcept -> std::size_t { return removed_; }

private:
    std::unique_ptr<LongCursor> inner_;
    bool can_remove_ = false;
    mutable bool exhausted_ = false;
    std::size_t yielded_ = 0;
    std::size_t removed_ = 0;
};

}  // namespace longcursor_cpp
