#pragma once

#include <algorithm>
#include <cstddef>
#include <deque>
#include <iterator>
#include <vector>

namespace lazylist {

// Ordered, capped buffer of loaded items. Appends go to the tail; once the
// cap is exceeded the oldest items are dropped from the head (FIFO).
//
// Eviction shifts the index of every surviving item. evicted_count() is the
// number of items dropped since the last reset, so
// absolute_index(i) == evicted_count() + i stays stable for a given item.
template <typename T>
class RetainedCollection {
public:
    explicit RetainedCollection(const size_t max_retained = 500)
        : max_retained_(std::max<size_t>(1, max_retained)) {}

    // Append to the tail. Returns the number of items evicted from the head.
    size_t append(std::vector<T> items) {
        items_.insert(items_.end(),
                      std::make_move_iterator(items.begin()),
                      std::make_move_iterator(items.end()));
        return evict_overflow();
    }

    // Replace the whole collection and clear eviction state. Only the newest
    // max_retained items of a larger input are kept.
    void reset(std::vector<T> items) {
        items_.clear();
        evicted_ = 0;
        const size_t skip = items.size() > max_retained_ ? items.size() - max_retained_ : 0;
        items_.insert(items_.end(),
                      std::make_move_iterator(items.begin() + static_cast<std::ptrdiff_t>(skip)),
                      std::make_move_iterator(items.end()));
    }

    void clear() {
        items_.clear();
        evicted_ = 0;
    }

    [[nodiscard]] const T& operator[](size_t index) const { return items_[index]; }
    [[nodiscard]] const T& at(size_t index) const { return items_.at(index); }
    [[nodiscard]] size_t size() const { return items_.size(); }
    [[nodiscard]] bool empty() const { return items_.empty(); }
    [[nodiscard]] size_t max_retained() const { return max_retained_; }
    [[nodiscard]] size_t evicted_count() const { return evicted_; }
    [[nodiscard]] size_t absolute_index(size_t index) const { return evicted_ + index; }

    [[nodiscard]] auto begin() const { return items_.begin(); }
    [[nodiscard]] auto end() const { return items_.end(); }

private:
    size_t evict_overflow() {
        if (items_.size() <= max_retained_) return 0;

        const size_t overflow = items_.size() - max_retained_;
        items_.erase(items_.begin(), items_.begin() + static_cast<std::ptrdiff_t>(overflow));
        evicted_ += overflow;
        return overflow;
    }

    std::deque<T> items_;
    size_t max_retained_;
    size_t evicted_ = 0;
};

} // namespace lazylist
