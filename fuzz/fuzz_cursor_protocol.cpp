// Fuzz target for the cursor protocol -- drives arbitrary sequences of
// has_more/next/remove and outside mutations through CheckedCursor over
// vector_cursor, and checks every outcome against a model of the vector.

#include <longcursor-cpp/checked_cursor.hpp>
#include <longcursor-cpp/cursors.hpp>

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <vector>

namespace lc = longcursor_cpp;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    if (size == 0) return 0;

    auto values = std::vector<std::int64_t>{};
    const auto initial = static_cast<std::size_t>(data[0] % 16);
    for (std::size_t i = 0; i < initial; ++i) values.push_back(static_cast<std::int64_t>(i));

    auto model = values;
    auto cur = lc::CheckedCursor{lc::vector_cursor(values)};
    auto pos = std::size_t{0};        // model index of the next value
    auto can_remove = false;
    auto invalidated = false;

    for (std::size_t i = 1; i < size; ++i) {
        switch (data[i] % 4) {
            case 0:
                if (cur.has_more() != (pos < model.size())) std::abort();
                break;
            case 1:
                try {
                    auto v = cur.next();
                    if (invalidated || pos >= model.size() || v != model[pos]) std::abort();
                    ++pos;
                    can_remove = true;
                } catch (const lc::CursorError& e) {
                    can_remove = false;
                    if (e.kind() == lc::ErrorKind::no_such_element) {
                        if (pos < model.size()) std::abort();
                    } else if (e.kind() != lc::ErrorKind::concurrent_modification || !invalidated) {
                        std::abort();
                    }
                }
                break;
            case 2:
                try {
                    cur.remove();
                    if (!can_remove || invalidated) std::abort();
                    model.erase(model.begin() + static_cast<std::ptrdiff_t>(--pos));
                    can_remove = false;
                } catch (const lc::CursorError& e) {
                    if (e.kind() == lc::ErrorKind::illegal_state) {
                        if (can_remove) std::abort();
                    } else if (e.kind() != lc::ErrorKind::concurrent_modification || !invalidated) {
                        std::abort();
                    }
                }
                break;
            case 3:
                // Outside append: the cursor must fail fast from now on.
                values.push_back(-1);
                invalidated = true;
                break;
        }
        if (!invalidated && values != model) std::abort();
    }
    return 0;
}
