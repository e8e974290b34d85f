/// @file modification.hpp
/// @brief Modification counting for fail-fast cursors.

#pragma once

#include <cstdint>

namespace longcursor_cpp {

/// Structural modification count kept by a backing structure.
///
/// A backing structure calls record() on every insertion or removal. Its
/// cursors take a ModificationStamp when created and verify it before each
/// state-touching call, so an outside change surfaces deterministically as
/// ErrorKind::concurrent_modification instead of corrupting traversal.
class ModificationCounter {
public:
    /// Note one structural change.
    void record() noexcept { ++count_; }

    auto count() const noexcept -> std::uint64_t { return count_; }

private:
    std::uint64_t count_ = 0;
};

/// A cursor's snapshot of a ModificationCounter.
class ModificationStamp {
public:
    explicit ModificationStamp(const ModificationCounter& counter) noexcept
        : expected_{counter.count()} {}

    /// True if no structural change happened since the stamp was taken.
    auto matches(const ModificationCounter& counter) const noexcept -> bool {
        return counter.count() == expected_;
    }

    /// Throw concurrent_modification unless the stamp still matches.
    void verify(const ModificationCounter& counter) const;

    /// Re-sync after the cursor's own structural change.
    void refresh(const ModificationCounter& counter) noexcept {
        expected_ = counter.count();
    }

private:
    std::uint64_t expected_;
};

}  // namespace longcursor_cpp
