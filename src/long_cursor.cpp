#include <longcursor-cpp/long_cursor.hpp>

namespace longcursor_cpp {

void LongCursor::remove() {
    throw CursorError{ErrorKind::unsupported_operation, "cursor is read-only"};
}

auto LongCursor::try_next() -> std::optional<std::int64_t> {
    if (!has_more()) return std::nullopt;
    return next();
}

auto LongCursor::try_remove() -> std::optional<Error> {
    try {
        remove();
    } catch (const CursorError& e) {
        return e.error();
    }
    return std::nullopt;
}

}  // namespace longcursor_cpp
