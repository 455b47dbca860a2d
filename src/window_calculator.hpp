#pragma once

#include "loader_config.hpp"
#include <cstddef>

namespace lazylist {

// Scroll position and viewport size, in the same unit as
// LoaderConfig::item_height_estimate (pixels for ImGui, rows for the TUI)
struct ScrollState {
    float scroll_top = 0.0f;
    float container_height = 0.0f;
};

// Half-open range [start, end) of retained items to render, plus the spacer
// sizes that keep the total scroll height of the full collection.
struct Window {
    size_t start = 0;
    size_t end = 0;
    float top_padding = 0.0f;
    float bottom_padding = 0.0f;
    bool virtualized = false;

    [[nodiscard]] size_t size() const { return end - start; }
    [[nodiscard]] bool contains(size_t index) const { return index >= start && index < end; }
    bool operator==(const Window&) const = default;
};

// Compute the window for count retained items. Below or at
// config.virtualize_threshold the whole collection is the window.
// Always satisfies 0 <= start <= end <= count.
[[nodiscard]] Window compute_window(size_t count, const ScrollState& scroll, const LoaderConfig& config);

// Number of grid rows needed for count items
[[nodiscard]] size_t row_count(size_t count, int items_per_row);

// Total scrollable height of count items
[[nodiscard]] float content_height(size_t count, const LoaderConfig& config);

// Coalesces recomputation requests so the window is recomputed at most once
// per frame, however many scroll events arrive in between. Count changes
// and resets recompute at once and do not go through the throttle.
class FrameThrottle {
public:
    enum Reason : unsigned {
        None = 0,
        Scroll = 1u << 0,
        Resize = 1u << 1
    };

    void request(Reason reason) { pending_ |= reason; }

    // Called once per frame. Returns the pending reasons and clears them.
    [[nodiscard]] unsigned take() {
        const unsigned reasons = pending_;
        pending_ = None;
        return reasons;
    }

    [[nodiscard]] bool is_pending() const { return pending_ != None; }
    void cancel() { pending_ = None; }

private:
    unsigned pending_ = None;
};

} // namespace lazylist
