/// @file long_cursor.hpp
/// @brief LongCursor -- single-pass traversal over 64-bit integers.

#pragma once

#include <longcursor-cpp/error.hpp>

#include <cstdint>
#include <optional>
#include <string_view>

namespace longcursor_cpp {

/// Logical protocol state of a cursor.
enum class CursorState : std::uint8_t {
    fresh,      ///< No removal pending: no next() yet, last call remove(), or read-only.
    advanced,   ///< next() just returned a value of a removable cursor; remove() is legal.
    exhausted,  ///< No further elements and no removal pending. Terminal.
};

/// Convert a CursorState to its string representation.
constexpr auto to_string_view(CursorState state) noexcept -> std::string_view {
    switch (state) {
        case CursorState::fresh:     return "fresh";
        case CursorState::advanced:  return "advanced";
        case CursorState::exhausted: return "exhausted";
    }
    return "unknown";
}

/// A stateful, forward-only traversal handle over a sequence of
/// std::int64_t values owned by some backing structure.
///
/// Values are returned unboxed, one call per element. The cursor holds a
/// non-owning association to its backing structure and must be confined
/// to one thread at a time. Implementations that track structural changes
/// report them as ErrorKind::concurrent_modification on the next call that
/// touches state; has_more() itself never fails.
///
/// @code
/// auto values = std::vector<std::int64_t>{10, 20, 30};
/// auto cur = vector_cursor(values);
/// while (cur->has_more()) {
///     if (cur->next() == 20) cur->remove();
/// }
/// // values == {10, 30}
/// @endcode
class LongCursor {
public:
    virtual ~LongCursor() = default;

    LongCursor(const LongCursor&) = delete;
    auto operator=(const LongCursor&) -> LongCursor& = delete;

    /// True if at least one more element is available. Idempotent.
    virtual auto has_more() const -> bool = 0;

    /// Return the next value and advance by one.
    /// @throws CursorError no_such_element when exhausted,
    ///   concurrent_modification when the backing structure changed.
    virtual auto next() -> std::int64_t = 0;

    /// Remove the most recently returned value from the backing structure.
    ///
    /// The default implementation is read-only.
    /// @throws CursorError unsupported_operation on read-only cursors,
    ///   illegal_state when no next() precedes this call,
    ///   concurrent_modification when the backing structure changed.
    virtual void remove();

    /// Whether remove() is supported by this cursor.
    virtual auto supports_remove() const -> bool { return false; }

    /// Return the next value, or nullopt if the cursor is exhausted.
    /// Errors other than exhaustion still throw.
    auto try_next() -> std::optional<std::int64_t>;

    /// Remove the last returned value, reporting failure as a value.
    /// @return nullopt on success, otherwise the error that prevented it.
    auto try_remove() -> std::optional<Error>;

protected:
    LongCursor() = default;
};

}  // namespace longcursor_cpp
