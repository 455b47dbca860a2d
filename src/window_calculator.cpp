#include "window_calculator.hpp"
#include <algorithm>
#include <cmath>

namespace lazylist {

static double non_negative(const float value) {
    if (!std::isfinite(value) || value < 0.0f) return 0.0;
    return static_cast<double>(value);
}

size_t row_count(const size_t count, const int items_per_row) {
    const size_t per_row = static_cast<size_t>(std::max(1, items_per_row));
    return (count + per_row - 1) / per_row;
}

float content_height(const size_t count, const LoaderConfig& config) {
    return static_cast<float>(row_count(count, config.items_per_row)) * config.item_height_estimate;
}

Window compute_window(const size_t count, const ScrollState& scroll, const LoaderConfig& config) {
    Window window;
    window.end = count;

    if (count <= static_cast<size_t>(std::max(0, config.virtualize_threshold))) {
        return window;
    }

    const size_t per_row = static_cast<size_t>(std::max(1, config.items_per_row));
    const size_t rows = row_count(count, config.items_per_row);
    const double height = config.item_height_estimate > 0.0f ? config.item_height_estimate : 1.0;
    const double overscan = std::max(0, config.overscan);
    const double top = non_negative(scroll.scroll_top);
    const double bottom = top + non_negative(scroll.container_height);

    // Clamp in floating point before converting, scroll offsets can be stale
    const double first = std::floor(top / height) - overscan;
    const double last = std::ceil(bottom / height) + overscan;
    const auto end_row = static_cast<size_t>(std::clamp(last, 0.0, static_cast<double>(rows)));
    const auto start_row = std::min(end_row,
        static_cast<size_t>(std::clamp(first, 0.0, static_cast<double>(rows))));

    window.start = start_row * per_row;
    window.end = std::min(count, end_row * per_row);
    window.top_padding = static_cast<float>(static_cast<double>(start_row) * height);
    window.bottom_padding = static_cast<float>(static_cast<double>(rows - end_row) * height);
    window.virtualized = true;
    return window;
}

} // namespace lazylist
