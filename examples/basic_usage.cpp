// basic_usage -- demonstrates the longcursor-cpp API
//
// Walks a vector with a removable cursor, shows the protocol errors a
// caller can hit, and runs a few generic algorithms.
//
// Build: cmake --build build
// Run:   ./build/examples/basic_usage

#include <longcursor-cpp/longcursor.hpp>

#include <array>
#include <cstdint>
#include <cstdio>
#include <string>
#include <vector>

namespace lc = longcursor_cpp;

int main() {
    auto values = std::vector<std::int64_t>{10, 20, 30};

    // -- Removing during traversal --------------------------------------------
    {
        auto cur = lc::CheckedCursor{lc::vector_cursor(values)};
        while (cur.has_more()) {
            auto v = cur.next();
            std::printf("visit %lld (%s)\n", static_cast<long long>(v),
                        std::string{lc::to_string_view(cur.state())}.c_str());
            if (v == 20) cur.remove();
        }
        std::printf("yielded %zu, removed %zu\n", cur.yielded(), cur.removed());
    }
    std::printf("after removal: %s\n", lc::to_string(*lc::vector_cursor(values)).c_str());

    // -- Protocol errors are reported by kind ---------------------------------
    {
        auto cur = lc::vector_cursor(values);
        if (auto err = cur->try_remove()) {
            std::printf("remove before next: %s\n",
                        std::string{lc::to_string_view(err->kind)}.c_str());
        }

        values.push_back(40);
        try {
            cur->next();
        } catch (const lc::CursorError& e) {
            std::printf("outside append: %s (%s)\n",
                        std::string{lc::to_string_view(e.kind())}.c_str(), e.what());
        }
    }

    // -- Read-only cursors ----------------------------------------------------
    const auto fixed = std::array<std::int64_t, 5>{1, 2, 3, 4, 5};
    auto ro = lc::span_cursor(fixed, 1, 3);
    std::printf("read-only supports remove: %s\n", ro->supports_remove() ? "yes" : "no");
    std::printf("sub-range: %s\n", lc::to_string(*ro).c_str());
    std::printf("hash of all: %d\n", static_cast<int>(lc::xor_hash(*lc::span_cursor(fixed))));

    return 0;
}
