#include <longcursor-cpp/algorithm.hpp>

namespace longcursor_cpp {

auto to_vector(LongCursor& cursor) -> std::vector<std::int64_t> {
    auto result = std::vector<std::int64_t>{};
    while (cursor.has_more()) {
        result.push_back(cursor.next());
    }
    return result;
}

auto count(LongCursor& cursor) -> std::size_t {
    auto n = std::size_t{0};
    while (cursor.has_more()) {
        cursor.next();
        ++n;
    }
    return n;
}

auto contains(LongCursor& cursor, std::int64_t value) -> bool {
    while (cursor.has_more()) {
        if (cursor.next() == value) return true;
    }
    return false;
}

auto remove_value(LongCursor& cursor, std::int64_t value) -> bool {
    while (cursor.has_more()) {
        if (cursor.next() == value) {
            cursor.remove();
            return true;
        }
    }
    return false;
}

auto remove_remaining(LongCursor& cursor) -> std::size_t {
    return remove_if(cursor, [](std::int64_t) { return true; });
}

auto xor_hash(LongCursor& cursor) -> std::int32_t {
    auto h = std::uint64_t{0};
    while (cursor.has_more()) {
        h ^= static_cast<std::uint64_t>(cursor.next());
    }
    return static_cast<std::int32_t>(static_cast<std::uint32_t>((h >> 32) ^ h));
}

auto to_string(LongCursor& cursor) -> std::string {
    auto out = std::string{"["};
    auto first = true;
    while (cursor.has_more()) {
        if (!first) out += ", ";
        out += std::to_string(cursor.next());
        first = false;
    }
    out += ']';
    return out;
}

}  // namespace longcursor_cpp
