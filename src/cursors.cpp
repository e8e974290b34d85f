#include <longcursor-cpp/cursors.hpp>

#include <optional>
#include <stdexcept>
#include <utility>

namespace longcursor_cpp {

namespace {

[[noreturn]] void throw_exhausted() {
    throw CursorError{ErrorKind::no_such_element, "cursor is exhausted"};
}

class EmptyCursor final : public LongCursor {
public:
    auto has_more() const -> bool override { return false; }
    auto next() -> std::int64_t override { throw_exhausted(); }
};

class SingleCursor final : public LongCursor {
public:
    explicit SingleCursor(std::int64_t value) : value_{value} {}

    auto has_more() const -> bool override { return pending_; }

    auto next() -> std::int64_t override {
        if (!pending_) throw_exhausted();
        pending_ = false;
        return value_;
    }

private:
    std::int64_t value_;
    bool pending_ = true;
};

class SpanCursor final : public LongCursor {
public:
    explicit SpanCursor(std::span<const std::int64_t> values) : values_{values} {}

    auto has_more() const -> bool override { return index_ < values_.size(); }

    auto next() -> std::int64_t override {
        if (index_ >= values_.size()) throw_exhausted();
        return values_[index_++];
    }

private:
    std::span<const std::int64_t> values_;
    std::size_t index_ = 0;
};

// Removable cursor over a caller-owned vector.
//
// end_ is the cursor's own view of the vector size. has_more() answers from
// it so that it never fails; any mismatch with the live size means someone
// else changed the vector and is reported on the next next()/remove().
class VectorCursor final : public LongCursor {
public:
    VectorCursor(std::vector<std::int64_t>& values, ModificationCounter* mods)
        : values_{values}, mods_{mods}, end_{values.size()} {
        if (mods_) stamp_.emplace(*mods_);
    }

    auto has_more() const -> bool override { return index_ < end_; }

    auto next() -> std::int64_t override {
        if (index_ >= end_) throw_exhausted();
        check_unmodified();
        can_remove_ = true;
        return values_[index_++];
    }

    void remove() override {
        if (!can_remove_) {
            throw CursorError{ErrorKind::illegal_state,
                              "remove() must directly follow a successful next()"};
        }
        check_unmodified();

        values_.erase(values_.begin() + static_cast<std::ptrdiff_t>(index_ - 1));
        --index_;
        --end_;
        can_remove_ = false;

        if (mods_) {
            mods_->record();
            stamp_->refresh(*mods_);
        }
    }

    auto supports_remove() const -> bool override { return true; }

private:
    void check_unmodified() const {
        if (values_.size() != end_) {
            throw CursorError{ErrorKind::concurrent_modification,
                              "vector size changed during traversal"};
        }
        if (stamp_) stamp_->verify(*mods_);
    }

    std::vector<std::int64_t>& values_;
    ModificationCounter* mods_;
    std::optional<ModificationStamp> stamp_;
    std::size_t end_;
    std::size_t index_ = 0;
    bool can_remove_ = false;
};

class UnmodifiableCursor final : public LongCursor {
public:
    explicit UnmodifiableCursor(std::unique_ptr<LongCursor> inner)
        : inner_{std::move(inner)} {
        if (!inner_) throw std::invalid_argument{"unmodifiable: null cursor"};
    }

    auto has_more() const -> bool override { return inner_->has_more(); }
    auto next() -> std::int64_t override { return inner_->next(); }

private:
    std::unique_ptr<LongCursor> inner_;
};

}  // namespace

auto empty_cursor() -> std::unique_ptr<LongCursor> {
    return std::make_unique<EmptyCursor>();
}

auto single_cursor(std::int64_t value) -> std::unique_ptr<LongCursor> {
    return std::make_unique<SingleCursor>(value);
}

auto span_cursor(std::span<const std::int64_t> values) -> std::unique_ptr<LongCursor> {
    return std::make_unique<SpanCursor>(values);
}

auto span_cursor(std::span<const std::int64_t> values,
                 std::size_t offset, std::size_t length) -> std::unique_ptr<LongCursor> {
    if (offset > values.size() || length > values.size() - offset) {
        throw std::out_of_range{"span_cursor: range exceeds values"};
    }
    return std::make_unique<SpanCursor>(values.subspan(offset, length));
}

auto vector_cursor(std::vector<std::int64_t>& values) -> std::unique_ptr<LongCursor> {
    return std::make_unique<VectorCursor>(values, nullptr);
}

auto vector_cursor(std::vector<std::int64_t>& values,
                   ModificationCounter& mods) -> std::unique_ptr<LongCursor> {
    return std::make_unique<VectorCursor>(values, &mods);
}

auto unmodifiable(std::unique_ptr<LongCursor> cursor) -> std::unique_ptr<LongCursor> {
    return std::make_unique<UnmodifiableCursor>(std::move(cursor));
}

}  // namespace longcursor_cpp
