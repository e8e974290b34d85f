#include <longcursor-cpp/checked_cursor.hpp>

#include <stdexcept>
#include <utility>

namespace longcursor_cpp {

CheckedCursor::CheckedCursor(std::unique_ptr<LongCursor> inner)
    : inner_{std::move(inner)} {
    if (!inner_) throw std::invalid_argument{"CheckedCursor: null cursor"};
}

auto CheckedCursor::has_more() const -> bool {
    if (exhausted_) return false;
    if (!inner_->has_more()) {
        exhausted_ = true;
        return false;
    }
    return true;
}

auto CheckedCursor::next() -> std::int64_t {
    if (!has_more()) {
        can_remove_ = false;
        throw CursorError{ErrorKind::no_such_element, "cursor is exhausted"};
    }
    // A failed inner next() leaves nothing to remove.
    can_remove_ = false;
    auto value = inner_->next();
    can_remove_ = true;
    ++yielded_;
    return value;
}

void CheckedCursor::remove() {
    if (!inner_->supports_remove()) {
        throw CursorError{ErrorKind::unsupported_operation, "cursor is read-only"};
    }
    if (!can_remove_) {
        throw CursorError{ErrorKind::illegal_state,
                          "remove() must directly follow a successful next()"};
    }
    inner_->remove();
    can_remove_ = false;
    ++removed_;
}

auto CheckedCursor::supports_remove() const -> bool {
    return inner_->supports_remove();
}

auto CheckedCursor::state() const -> CursorState {
    if (can_remove_ && inner_->supports_remove()) return CursorState::advanced;
    if (!has_more()) return CursorState::exhausted;
    return CursorState::fresh;
}

}  // namespace longcursor_cpp
