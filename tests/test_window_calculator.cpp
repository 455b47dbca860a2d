/**
 * Tests for the window calculator and frame throttle.
 *
 * Covers:
 * - Virtualization threshold (80 vs 150 items)
 * - Overscan, padding and clamping at both ends
 * - Fixed-width grids
 * - Bounds for arbitrary and invalid scroll states
 * - Coalescing of scroll/resize requests per frame
 */

#include <catch2/catch.hpp>

#include "window_calculator.hpp"
#include <cmath>
#include <limits>

using namespace lazylist;

namespace {

LoaderConfig default_config() {
    return LoaderConfig{};
}

ScrollState scroll_at(const float top, const float height = 800.0f) {
    return ScrollState{top, height};
}

} // namespace

TEST_CASE("Collections at or below the threshold are not virtualized", "[window]") {
    const LoaderConfig config = default_config();

    const Window window = compute_window(80, scroll_at(1200.0f), config);
    CHECK_FALSE(window.virtualized);
    CHECK(window.start == 0);
    CHECK(window.end == 80);
    CHECK(window.top_padding == 0.0f);
    CHECK(window.bottom_padding == 0.0f);

    const Window at_threshold = compute_window(100, scroll_at(0.0f), config);
    CHECK_FALSE(at_threshold.virtualized);
    CHECK(at_threshold.size() == 100);
}

TEST_CASE("Collections above the threshold render only the visible range", "[window]") {
    const LoaderConfig config = default_config();

    SECTION("top of the list") {
        const Window window = compute_window(150, scroll_at(0.0f), config);
        CHECK(window.virtualized);
        CHECK(window.start == 0);
        CHECK(window.end == 15);  // 10 visible rows + 5 overscan
        CHECK(window.top_padding == 0.0f);
        CHECK(window.bottom_padding == Approx(135 * 80.0f));
    }

    SECTION("middle of the list") {
        const Window window = compute_window(150, scroll_at(4000.0f), config);
        CHECK(window.start == 45);
        CHECK(window.end == 65);
        CHECK(window.top_padding == Approx(45 * 80.0f));
        CHECK(window.bottom_padding == Approx(85 * 80.0f));
    }

    SECTION("bottom of the list") {
        const Window window = compute_window(150, scroll_at(150 * 80.0f - 800.0f), config);
        CHECK(window.end == 150);
        CHECK(window.start == 135);
        CHECK(window.bottom_padding == 0.0f);
    }

    SECTION("stale offset past the end") {
        const Window window = compute_window(150, scroll_at(1.0e6f), config);
        CHECK(window.start <= window.end);
        CHECK(window.end == 150);
    }
}

TEST_CASE("Spacers and rendered rows add up to the full content height", "[window]") {
    const LoaderConfig config = default_config();

    for (const float top : {0.0f, 37.0f, 800.0f, 5000.0f, 11200.0f}) {
        const Window window = compute_window(150, scroll_at(top), config);
        const float rendered = static_cast<float>(window.size()) * config.item_height_estimate;
        CHECK(window.top_padding + rendered + window.bottom_padding ==
              Approx(content_height(150, config)));
    }
}

TEST_CASE("Grid windows are aligned to whole rows", "[window][grid]") {
    LoaderConfig config = default_config();
    config.items_per_row = 3;

    CHECK(row_count(301, 3) == 101);
    CHECK(content_height(301, config) == Approx(101 * 80.0f));

    const Window top = compute_window(301, scroll_at(0.0f), config);
    CHECK(top.virtualized);
    CHECK(top.start == 0);
    CHECK(top.end == 45);  // 15 rows
    CHECK(top.bottom_padding == Approx(86 * 80.0f));

    const Window middle = compute_window(301, scroll_at(4000.0f), config);
    CHECK(middle.start == 135);
    CHECK(middle.start % 3 == 0);
    CHECK(middle.end == 195);

    // Last row is partial
    const Window bottom = compute_window(301, scroll_at(101 * 80.0f), config);
    CHECK(bottom.end == 301);
}

TEST_CASE("Window bounds hold for any scroll state", "[window][bounds]") {
    LoaderConfig config = default_config();

    const float nan = std::numeric_limits<float>::quiet_NaN();
    const float inf = std::numeric_limits<float>::infinity();

    for (const int per_row : {1, 2, 4}) {
        config.items_per_row = per_row;
        for (const size_t count : {size_t{0}, size_t{1}, size_t{99}, size_t{101}, size_t{150}, size_t{2000}}) {
            for (const float top : {-500.0f, 0.0f, 79.9f, 4321.0f, 1.0e7f, nan, inf}) {
                for (const float height : {0.0f, 1.0f, 800.0f, -10.0f, nan}) {
                    const Window window = compute_window(count, ScrollState{top, height}, config);
                    REQUIRE(window.start <= window.end);
                    REQUIRE(window.end <= count);
                    REQUIRE(window.top_padding >= 0.0f);
                    REQUIRE(window.bottom_padding >= 0.0f);
                    REQUIRE(std::isfinite(window.top_padding));
                    REQUIRE(std::isfinite(window.bottom_padding));
                }
            }
        }
    }
}

TEST_CASE("Negative and NaN scroll offsets are treated as the top", "[window][bounds]") {
    const LoaderConfig config = default_config();
    const Window expected = compute_window(150, scroll_at(0.0f), config);

    CHECK(compute_window(150, scroll_at(-300.0f), config) == expected);
    CHECK(compute_window(150, scroll_at(std::numeric_limits<float>::quiet_NaN()), config) == expected);
}

TEST_CASE("Overscan widens the window on both sides", "[window]") {
    LoaderConfig config = default_config();
    config.overscan = 0;

    const Window tight = compute_window(150, scroll_at(4000.0f), config);
    CHECK(tight.start == 50);
    CHECK(tight.end == 60);

    config.overscan = 10;
    const Window wide = compute_window(150, scroll_at(4000.0f), config);
    CHECK(wide.start == 40);
    CHECK(wide.end == 70);
}

TEST_CASE("Frame throttle coalesces requests until the next frame", "[window][throttle]") {
    FrameThrottle throttle;
    CHECK_FALSE(throttle.is_pending());
    CHECK(throttle.take() == FrameThrottle::None);

    throttle.request(FrameThrottle::Scroll);
    throttle.request(FrameThrottle::Scroll);
    throttle.request(FrameThrottle::Resize);
    CHECK(throttle.is_pending());

    const unsigned reasons = throttle.take();
    CHECK((reasons & FrameThrottle::Scroll) != 0);
    CHECK((reasons & FrameThrottle::Resize) != 0);
    CHECK(reasons == (FrameThrottle::Scroll | FrameThrottle::Resize));

    // Nothing left for the following frame
    CHECK(throttle.take() == FrameThrottle::None);

    throttle.request(FrameThrottle::Scroll);
    throttle.cancel();
    CHECK_FALSE(throttle.is_pending());
}
