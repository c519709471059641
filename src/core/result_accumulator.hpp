#pragma once

#include <algorithm>
#include <cstdint>
#include <utility>
#include <vector>

namespace rkv {

// ── ResultAccumulator ────────────────────────────────────────────────────────
//
// Collects the results of a range read or a cursor walk in visitation order.
// A non-zero limit makes the accumulator report completion once that many
// items have been appended (count-truncated reads).  On failure the caller
// simply drops the accumulator: partial results are never handed out.

template <typename T>
class ResultAccumulator {
public:
    explicit ResultAccumulator(std::uint32_t limit = 0) : limit_(limit) {
        if (limit_ != 0) {
            items_.reserve(std::min<std::uint32_t>(limit_, kMaxReserve));
        }
    }

    // Appends `item`.  Returns false once the accumulator is full, i.e. the
    // producer should stop.  Appending to a full accumulator is a no-op.
    bool append(T item) {
        if (full()) {
            return false;
        }
        items_.push_back(std::move(item));
        return !full();
    }

    [[nodiscard]] bool full() const noexcept {
        return limit_ != 0 && items_.size() >= limit_;
    }

    [[nodiscard]] std::size_t size() const noexcept { return items_.size(); }

    [[nodiscard]] std::uint32_t limit() const noexcept { return limit_; }

    // Hands the collected items to the caller and leaves the accumulator empty.
    [[nodiscard]] std::vector<T> take() {
        return std::exchange(items_, {});
    }

private:
    static constexpr std::uint32_t kMaxReserve = 1024;

    std::uint32_t limit_;
    std::vector<T> items_;
};

} // namespace rkv
