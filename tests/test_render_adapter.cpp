/**
 * Tests for RenderAdapter: windowed rendering with per-item failure isolation.
 */

#include <catch2/catch.hpp>

#include "render_adapter.hpp"
#include "test_support.hpp"
#include <stdexcept>
#include <string>

using namespace lazylist;
using lazylist_test::make_items;

namespace {

RenderAdapter<int, std::string> make_adapter(ErrorLog* log) {
    return RenderAdapter<int, std::string>(
        [](const int& value, size_t) {
            if (value == 3) throw std::runtime_error("bad item");
            return "item " + std::to_string(value);
        },
        [](const int& value, size_t) { return "k" + std::to_string(value); },
        [](const int&, size_t, const std::string& error) { return "fallback: " + error; },
        log);
}

} // namespace

TEST_CASE("A throwing item is replaced, its neighbours render", "[render]") {
    ErrorLog log;
    auto adapter = make_adapter(&log);

    RetainedCollection<int> items(100);
    items.reset(make_items(0, 6));
    Window window;
    window.end = 6;

    const auto plan = adapter.render(items, window);
    REQUIRE(plan.items.size() == 6);
    CHECK(plan.failed_count == 1);

    CHECK(plan.items[2].output == "item 2");
    CHECK(plan.items[3].failed);
    CHECK(plan.items[3].output == "fallback: bad item");
    CHECK(plan.items[3].key == "k3");
    CHECK(plan.items[4].output == "item 4");
    CHECK_FALSE(plan.items[4].failed);

    REQUIRE(log.count(ErrorKind::RenderError) == 1);
    CHECK(log.recent().back().message == "item 'k3': bad item");
}

TEST_CASE("Non-standard exceptions are contained to their item", "[render]") {
    ErrorLog log;
    RenderAdapter<int, std::string> adapter(
        [](const int& value, size_t) -> std::string {
            if (value == 1) throw 42;
            return "item " + std::to_string(value);
        },
        [](const int& value, size_t) { return "k" + std::to_string(value); },
        [](const int&, size_t, const std::string& error) { return "fallback: " + error; },
        &log);

    RetainedCollection<int> items(10);
    items.reset(make_items(0, 3));
    Window window;
    window.end = 3;

    RenderPlan<std::string> plan;
    REQUIRE_NOTHROW(plan = adapter.render(items, window));
    REQUIRE(plan.items.size() == 3);
    CHECK(plan.failed_count == 1);
    CHECK(plan.items[0].output == "item 0");
    CHECK(plan.items[1].failed);
    CHECK(plan.items[1].output == "fallback: unknown error");
    CHECK(plan.items[2].output == "item 2");
    REQUIRE(log.count(ErrorKind::RenderError) == 1);
    CHECK(log.recent().back().message == "item 'k1': unknown error");
}

TEST_CASE("A throwing fallback leaves an empty output", "[render]") {
    ErrorLog log;
    RenderAdapter<int, std::string> adapter(
        [](const int& value, size_t) -> std::string {
            if (value == 0) throw std::runtime_error("bad item");
            return "item " + std::to_string(value);
        },
        [](const int& value, size_t) { return "k" + std::to_string(value); },
        [](const int&, size_t, const std::string&) -> std::string { throw std::logic_error("no fallback"); },
        &log);

    RetainedCollection<int> items(10);
    items.reset(make_items(0, 2));
    Window window;
    window.end = 2;

    RenderPlan<std::string> plan;
    REQUIRE_NOTHROW(plan = adapter.render(items, window));
    REQUIRE(plan.items.size() == 2);
    CHECK(plan.items[0].failed);
    CHECK(plan.items[0].output.empty());
    CHECK(plan.items[1].output == "item 1");
    CHECK(plan.failed_count == 1);
    CHECK(log.count(ErrorKind::RenderError) == 2);
}

TEST_CASE("Each failing item is reported once per collection", "[render]") {
    ErrorLog log;
    auto adapter = make_adapter(&log);

    RetainedCollection<int> items(100);
    items.reset(make_items(0, 6));
    Window window;
    window.end = 6;

    for (int frame = 0; frame < 5; ++frame) {
        const auto plan = adapter.render(items, window);
        CHECK(plan.failed_count == 1);
    }
    CHECK(log.count(ErrorKind::RenderError) == 1);

    adapter.forget_reported();
    (void)adapter.render(items, window);
    CHECK(log.count(ErrorKind::RenderError) == 2);
}

TEST_CASE("Only the window is rendered", "[render]") {
    auto adapter = make_adapter(nullptr);

    RetainedCollection<int> items(100);
    items.reset(make_items(10, 50));
    Window window;
    window.start = 5;
    window.end = 8;
    window.top_padding = 400.0f;
    window.bottom_padding = 3360.0f;
    window.virtualized = true;

    const auto plan = adapter.render(items, window);
    REQUIRE(plan.items.size() == 3);
    CHECK(plan.items[0].index == 5);
    CHECK(plan.items[0].output == "item 15");
    CHECK(plan.top_padding == 400.0f);
    CHECK(plan.bottom_padding == 3360.0f);
    CHECK(plan.window == window);
}

TEST_CASE("Absolute indices survive eviction", "[render]") {
    auto adapter = make_adapter(nullptr);

    RetainedCollection<int> items(5);
    items.reset(make_items(0, 5));
    (void)items.append(make_items(5, 5));
    REQUIRE(items.evicted_count() == 5);

    Window window;
    window.start = 2;
    window.end = 5;

    const auto plan = adapter.render(items, window);
    REQUIRE(plan.items.size() == 3);
    CHECK(plan.items[0].absolute_index == 7);
    CHECK(plan.items[1].absolute_index == 8);
    CHECK(plan.items[2].absolute_index == 9);
    CHECK(plan.items[0].key == "k7");
}

TEST_CASE("Missing keys fall back to the absolute position", "[render]") {
    ErrorLog log;
    RenderAdapter<int, std::string> adapter(
        [](const int& value, size_t) { return std::to_string(value); },
        [](const int& value, size_t) -> std::string {
            if (value == 1) throw std::runtime_error("no key");
            return value == 2 ? std::string() : "k" + std::to_string(value);
        },
        [](const int&, size_t, const std::string&) { return std::string(); },
        &log);

    RetainedCollection<int> items(10);
    items.reset(make_items(0, 3));
    Window window;
    window.end = 3;

    const auto plan = adapter.render(items, window);
    CHECK(plan.items[0].key == "k0");
    CHECK(plan.items[1].key == "#1");
    CHECK(plan.items[2].key == "#2");
    CHECK(log.count(ErrorKind::RenderError) == 1);
}

TEST_CASE("A stale window is clamped to the collection", "[render]") {
    auto adapter = make_adapter(nullptr);

    RetainedCollection<int> items(10);
    items.reset(make_items(0, 4));
    Window window;
    window.start = 2;
    window.end = 40;

    const auto plan = adapter.render(items, window);
    CHECK(plan.items.size() == 2);
}

TEST_CASE("Rendering follows the loader's window", "[render][loader]") {
    lazylist_test::ManualPageSource source;
    IncrementalLoader<int> loader(&source, LoaderConfig{});
    loader.reset(make_items(0, 150), true);
    loader.on_resize(400.0f);
    (void)loader.on_frame();

    auto adapter = make_adapter(nullptr);
    const auto plan = adapter.render(loader);
    CHECK(plan.window.virtualized);
    CHECK(plan.items.size() == 10);
    CHECK(plan.items.front().absolute_index == 0);
}
