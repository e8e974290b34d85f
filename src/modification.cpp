#include <longcursor-cpp/error.hpp>
#include <longcursor-cpp/modification.hpp>

namespace longcursor_cpp {

void ModificationStamp::verify(const ModificationCounter& counter) const {
    if (!matches(counter)) {
        throw CursorError{ErrorKind::concurrent_modification,
                          "backing structure modified during traversal"};
    }
}

}  // namespace longcursor_cpp
