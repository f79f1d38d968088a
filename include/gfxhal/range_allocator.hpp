#pragma once

#include <cstddef>
#include <optional>
#include <vector>

namespace gfxhal {

// Half-open [start, end) range.
template <typename T>
struct Range {
    T start{};
    T end{};

    [[nodiscard]] T length() const { return end - start; }
    [[nodiscard]] bool operator==(const Range&) const = default;
};

// Best-fit allocator over a fixed index range. Used for descriptor heap runs
// and host-side memory sub-allocation. Freed ranges merge with neighbours.
//
// Usage:
//   RangeAllocator<std::uint32_t> heap({0, 1024});
//   auto run = heap.allocate(8);     // {0, 8}
//   heap.free(*run);
//
// Thread safety: thread-confined.
template <typename T>
class RangeAllocator {
public:
    explicit RangeAllocator(Range<T> range) : initial_(range), free_{range} {}

    // Smallest free range that fits wins; an exact fit stops the search.
    [[nodiscard]] std::optional<Range<T>> allocate(T length) {
        if (length == T{}) return std::nullopt;

        std::size_t best = free_.size();
        for (std::size_t i = 0; i < free_.size(); ++i) {
            const T available = free_[i].length();
            if (available < length) continue;
            if (available == length) {
                best = i;
                break;
            }
            if (best == free_.size() || available < free_[best].length()) best = i;
        }
        if (best == free_.size()) return std::nullopt;

        Range<T> out{free_[best].start, free_[best].start + length};
        if (free_[best].length() == length) {
            free_.erase(free_.begin() + static_cast<std::ptrdiff_t>(best));
        } else {
            free_[best].start += length;
        }
        return out;
    }

    // Returns false (and changes nothing) for a range outside the managed
    // span, an empty range, or one overlapping an already free range.
    bool free(Range<T> range) {
        if (range.start >= range.end) return false;
        if (range.start < initial_.start || range.end > initial_.end) return false;

        std::size_t i = 0;
        while (i < free_.size() && free_[i].start <= range.start) ++i;

        const bool overlapsLeft  = i > 0 && free_[i - 1].end > range.start;
        const bool overlapsRight = i < free_.size() && range.end > free_[i].start;
        if (overlapsLeft || overlapsRight) return false;

        const bool mergeLeft  = i > 0 && free_[i - 1].end == range.start;
        const bool mergeRight = i < free_.size() && range.end == free_[i].start;

        if (mergeLeft && mergeRight) {
            free_[i - 1].end = free_[i].end;
            free_.erase(free_.begin() + static_cast<std::ptrdiff_t>(i));
        } else if (mergeLeft) {
            free_[i - 1].end = range.end;
        } else if (mergeRight) {
            free_[i].start = range.start;
        } else {
            free_.insert(free_.begin() + static_cast<std::ptrdiff_t>(i), range);
        }
        return true;
    }

    void reset() {
        free_.clear();
        free_.push_back(initial_);
    }

    [[nodiscard]] Range<T> initialRange() const { return initial_; }
    [[nodiscard]] const std::vector<Range<T>>& freeRanges() const { return free_; }
    [[nodiscard]] bool empty() const { return free_.size() == 1 && free_[0] == initial_; }

    [[nodiscard]] T freeSpace() const {
        T total{};
        for (const auto& r : free_) total += r.length();
        return total;
    }

private:
    Range<T> initial_;
    std::vector<Range<T>> free_;
};

} // namespace gfxhal
