/**
 * Tests for the content directory: catalog queries, cards, the threaded
 * catalog page source, ContentBrowser and command-line options.
 */

#include <catch2/catch.hpp>

#include "app_options.hpp"
#include "content_browser.hpp"
#include "test_support.hpp"
#include <filesystem>
#include <fstream>
#include <optional>
#include <set>

using namespace lazylist;
using lazylist_test::wait_for_tasks;

namespace {

ContentItem make_item(std::string slug, std::string title, std::string category) {
    ContentItem item;
    item.slug = std::move(slug);
    item.title = std::move(title);
    item.category = std::move(category);
    return item;
}

// Run one worker round trip: wait for the posted page, settle it
void settle_next_page(UiTaskQueue& queue) {
    REQUIRE(wait_for_tasks(queue, 1));
    CHECK(queue.run_pending() == 1);
}

} // namespace

TEST_CASE("Sample directories are deterministic", "[catalog]") {
    const auto a = ContentCatalog::generate_sample(50, 7);
    const auto b = ContentCatalog::generate_sample(50, 7);
    REQUIRE(a.size() == 50);
    for (size_t i = 0; i < a.size(); ++i) {
        CHECK(a[i].slug == b[i].slug);
        CHECK(a[i].title == b[i].title);
    }

    std::set<std::string> slugs;
    for (const auto& item : a) {
        CHECK_FALSE(item.title.empty());
        slugs.insert(item.slug);
    }
    CHECK(slugs.size() == 50);

    CHECK(a[0].category == "rules");
    CHECK(a[1].category == "mcp");
    CHECK(a[5].category == "rules");
}

TEST_CASE("Malformed sample items have no title", "[catalog]") {
    const auto items = ContentCatalog::generate_sample(10, 1, 4);
    CHECK(items[3].title.empty());
    CHECK(items[7].title.empty());
    CHECK_FALSE(items[0].title.empty());
    CHECK_FALSE(items[4].title.empty());
}

TEST_CASE("Queries filter by category and search text", "[catalog]") {
    ContentItem tagged = make_item("pg-guard", "Postgres Guard", "hooks");
    tagged.tags = {"Database"};
    tagged.author = "mlee";

    const ContentCatalog catalog({
        make_item("ts-rules", "TypeScript Rules", "rules"),
        make_item("react-mcp", "React Server", "mcp"),
        tagged,
        make_item("ts-agent", "TypeScript Reviewer", "agents"),
    });

    CHECK(catalog.query({}).size() == 4);
    CHECK(catalog.query({"rules", ""}).size() == 1);
    CHECK(catalog.query({"all", "typescript"}).size() == 2);
    CHECK(catalog.query({"agents", "TYPESCRIPT"}).size() == 1);
    CHECK(catalog.query({"all", "database"}).size() == 1);
    CHECK(catalog.query({"all", "MLEE"}).size() == 1);
    CHECK(catalog.query({"commands", ""}).empty());

    // Result order follows the catalog
    const auto ts = catalog.query({"all", "typescript"});
    CHECK(ts[0].slug == "ts-rules");
    CHECK(ts[1].slug == "ts-agent");
}

TEST_CASE("Catalog JSON skips entries without a slug", "[catalog][json]") {
    ErrorLog log;
    const auto items = ContentCatalog::parse_json(R"([
        {"slug": "a", "title": "A", "category": "rules", "tags": ["x", 3, "y"]},
        {"title": "no slug"},
        {"slug": "b", "title": "B"}
    ])", &log);

    REQUIRE(items.size() == 2);
    CHECK(items[0].tags == std::vector<std::string>{"x", "y"});
    CHECK(items[1].slug == "b");
    CHECK(items[1].category.empty());
    CHECK(log.count(ErrorKind::ConfigError) == 1);
}

TEST_CASE("Badly typed catalog fields are reported, the entry is kept", "[catalog][json]") {
    ErrorLog log;
    std::vector<ContentItem> items;
    REQUIRE_NOTHROW(items = ContentCatalog::parse_json(R"([
        {"slug": "a", "title": 5, "category": "rules", "author": ["x"]},
        {"slug": "b", "title": "B", "description": null}
    ])", &log));

    REQUIRE(items.size() == 2);
    CHECK(items[0].slug == "a");
    CHECK(items[0].title.empty());
    CHECK(items[0].category == "rules");
    CHECK(items[0].author.empty());
    CHECK(items[1].title == "B");
    CHECK(items[1].description.empty());
    CHECK(log.count(ErrorKind::ConfigError) == 2);

    // The untitled entry still reaches the list and renders as a fallback
    CHECK_THROWS_AS(render_card(items[0], 0), std::invalid_argument);
}

TEST_CASE("Unreadable catalogs throw", "[catalog][json]") {
    CHECK_THROWS_AS(ContentCatalog::parse_json("{\"slug\": \"a\"}"), std::runtime_error);
    CHECK_THROWS_AS(ContentCatalog::parse_json("[{"), std::runtime_error);
    CHECK_THROWS_AS(ContentCatalog::load_json_file("/nonexistent/catalog.json"), std::runtime_error);
}

TEST_CASE("Cards show the item's metadata", "[card]") {
    ContentItem item = make_item("ts-rules", "TypeScript Rules", "rules");
    item.author = "jsmith";
    item.date_added = "2025-03-14";
    item.tags = {"frontend", "testing"};
    item.description = "Strict mode everywhere.";

    const ItemCard card = render_card(item, 0);
    CHECK(card.title == "TypeScript Rules");
    CHECK(card.meta == "rules · jsmith · 2025-03-14");
    CHECK(card.tags == "#frontend #testing");
    CHECK(card.description == "Strict mode everywhere.");
    CHECK_FALSE(card.fallback);

    CHECK(content_key(item, 5) == "ts-rules");
}

TEST_CASE("Items that cannot be shown throw and get a fallback card", "[card]") {
    const ContentItem untitled = make_item("broken", "", "rules");
    CHECK_THROWS_WITH(render_card(untitled, 0), "item 'broken' has no title");
    CHECK_THROWS_AS(render_card(make_item("", "Title", "rules"), 0), std::invalid_argument);

    const ItemCard card = fallback_card(untitled, 3, "item 'broken' has no title");
    CHECK(card.fallback);
    CHECK(card.title == "broken");
    CHECK(card.description == "item 'broken' has no title");

    CHECK(fallback_card(ContentItem{}, 3, "x").title == "Item 4");
}

TEST_CASE("The page source serves consecutive pages from a worker", "[page_source]") {
    UiTaskQueue queue;
    CatalogPageSource source(&queue, 20);
    source.set_results(ContentCatalog::generate_sample(50), 20);
    source.start();

    std::vector<PageResult<ContentItem>> results;
    const auto collect = [&results](PageResult<ContentItem> result) { results.push_back(std::move(result)); };

    source.load_more(collect);
    settle_next_page(queue);
    source.load_more(collect);
    settle_next_page(queue);
    source.load_more(collect);
    settle_next_page(queue);
    source.stop();

    REQUIRE(results.size() == 3);
    CHECK(results[0].success);
    CHECK(results[0].items.size() == 20);
    CHECK(results[0].items.front().slug == ContentCatalog::generate_sample(50)[20].slug);
    CHECK(results[1].items.size() == 10);
    CHECK(results[2].success);
    CHECK(results[2].items.empty());
    CHECK(source.next_offset() == 50);
    CHECK(source.request_count() == 3);
}

TEST_CASE("Injected failures leave the cursor in place", "[page_source][error]") {
    UiTaskQueue queue;
    CatalogPageSource source(&queue, 20);
    source.set_results(ContentCatalog::generate_sample(100), 20);
    source.set_fail_every(2);
    source.start();

    std::optional<PageResult<ContentItem>> last;
    const auto collect = [&last](PageResult<ContentItem> result) { last = std::move(result); };

    source.load_more(collect);
    settle_next_page(queue);
    REQUIRE(last);
    CHECK(last->success);
    CHECK(source.next_offset() == 40);

    source.load_more(collect);
    settle_next_page(queue);
    CHECK_FALSE(last->success);
    CHECK(last->error_message == "Failed to load items 41-60");
    CHECK(source.next_offset() == 40);

    source.load_more(collect);
    settle_next_page(queue);
    CHECK(last->success);
    CHECK(last->items.size() == 20);
    CHECK(source.next_offset() == 60);
}

TEST_CASE("Requests queued before a new query are superseded", "[page_source]") {
    UiTaskQueue queue;
    CatalogPageSource source(&queue, 20);
    source.set_results(ContentCatalog::generate_sample(100), 20);

    std::optional<PageResult<ContentItem>> last;
    source.load_more([&last](PageResult<ContentItem> result) { last = std::move(result); });
    source.set_results(ContentCatalog::generate_sample(10), 10);
    CHECK(source.total_results() == 10);

    source.start();
    settle_next_page(queue);
    REQUIRE(last);
    CHECK_FALSE(last->success);
    CHECK(last->error_message == "Request superseded by a new query");
    CHECK(source.next_offset() == 10);
}

TEST_CASE("Stopping drops queued requests", "[page_source][lifecycle]") {
    UiTaskQueue queue;
    CatalogPageSource source(&queue, 20);
    source.set_results(ContentCatalog::generate_sample(100), 20);
    source.set_latency(std::chrono::milliseconds(5000));
    source.start();

    bool called = false;
    source.load_more([&called](PageResult<ContentItem>) { called = true; });
    source.load_more([&called](PageResult<ContentItem>) { called = true; });
    source.stop();

    CHECK(queue.run_pending() == 0);
    CHECK_FALSE(called);
}

TEST_CASE("The browser pages through a query", "[browser]") {
    UiTaskQueue queue;
    ErrorLog log;
    ContentBrowser browser(ContentCatalog(ContentCatalog::generate_sample(45)), LoaderConfig{}, &queue, &log);
    browser.start();

    REQUIRE(browser.apply_query({}));
    CHECK(browser.total_results() == 45);
    CHECK(browser.loader().retained_count() == 20);
    CHECK(browser.loader().has_more());

    REQUIRE(browser.loader().load_more());
    settle_next_page(queue);
    CHECK(browser.loader().retained_count() == 40);

    REQUIRE(browser.loader().load_more());
    settle_next_page(queue);
    CHECK(browser.loader().retained_count() == 45);
    CHECK_FALSE(browser.loader().has_more());
    CHECK(log.size() == 0);
}

TEST_CASE("Changing the query starts a new collection", "[browser]") {
    UiTaskQueue queue;
    ErrorLog log;
    ContentBrowser browser(ContentCatalog(ContentCatalog::generate_sample(100)), LoaderConfig{}, &queue, &log);

    REQUIRE(browser.apply_query({}));
    CHECK_FALSE(browser.apply_query({}));

    REQUIRE(browser.apply_query({"mcp", ""}));
    CHECK(browser.total_results() == 20);
    CHECK(browser.loader().retained_count() == 20);
    for (const auto& item : browser.loader().items()) {
        CHECK(item.category == "mcp");
    }

    REQUIRE(browser.apply_query({"all", "no-such-item"}));
    CHECK(browser.total_results() == 0);
    CHECK_FALSE(browser.loader().has_more());
    CHECK(browser.show_empty_state());
    CHECK(browser.render().items.empty());
}

TEST_CASE("A page in flight for an old query is discarded", "[browser]") {
    UiTaskQueue queue;
    ErrorLog log;
    ContentBrowser browser(ContentCatalog(ContentCatalog::generate_sample(200)), LoaderConfig{}, &queue, &log);
    browser.start();

    REQUIRE(browser.apply_query({}));
    REQUIRE(browser.loader().load_more());
    REQUIRE(wait_for_tasks(queue, 1));

    REQUIRE(browser.apply_query({"rules", ""}));
    queue.run_pending();

    CHECK(browser.loader().retained_count() == 20);
    CHECK(browser.loader().phase() == LoadPhase::Idle);
    for (const auto& item : browser.loader().items()) {
        CHECK(item.category == "rules");
    }
}

TEST_CASE("Items that fail to render do not break the list", "[browser][render]") {
    UiTaskQueue queue;
    ErrorLog log;
    ContentBrowser browser(ContentCatalog(ContentCatalog::generate_sample(40, 1, 3)), LoaderConfig{}, &queue, &log);

    REQUIRE(browser.apply_query({}));
    const ContentRenderPlan plan = browser.render();
    REQUIRE(plan.items.size() == 20);
    CHECK(plan.failed_count == 6);
    CHECK(plan.items[2].output.fallback);
    CHECK(plan.items[2].output.title == plan.items[2].key);
    CHECK_FALSE(plan.items[3].output.fallback);
    CHECK(log.count(ErrorKind::RenderError) == 6);

    // Next frame: already reported
    (void)browser.render();
    CHECK(log.count(ErrorKind::RenderError) == 6);
}

TEST_CASE("The sentinel triggers loading near the end of the content", "[browser][proximity]") {
    UiTaskQueue queue;
    ErrorLog log;
    ContentBrowser browser(ContentCatalog(ContentCatalog::generate_sample(100)), LoaderConfig{}, &queue, &log);

    REQUIRE(browser.apply_query({}));
    REQUIRE(browser.loader().content_height() == Approx(1600.0f));

    // Sentinel at 1600, viewport 0..800 plus margin: far away
    CHECK(browser.update_sentinel(0.0f, 800.0f));
    CHECK_FALSE(browser.loader().is_loading());
    CHECK_FALSE(browser.update_sentinel(100.0f, 800.0f));

    CHECK(browser.update_sentinel(800.0f, 800.0f));
    CHECK(browser.loader().is_loading());
}

TEST_CASE("Head eviction produces a scroll correction", "[browser]") {
    UiTaskQueue queue;
    ErrorLog log;
    LoaderConfig config;
    config.max_retained = 40;
    ContentBrowser browser(ContentCatalog(ContentCatalog::generate_sample(200)), config, &queue, &log);
    browser.start();

    REQUIRE(browser.apply_query({}));
    REQUIRE(browser.loader().load_more());
    settle_next_page(queue);
    CHECK(browser.take_scroll_correction() == 0.0f);

    REQUIRE(browser.loader().load_more());
    settle_next_page(queue);
    CHECK(browser.loader().evicted_count() == 20);
    CHECK(browser.take_scroll_correction() == Approx(20 * 80.0f));
    CHECK(browser.take_scroll_correction() == 0.0f);

    // A new query starts with a clean slate
    REQUIRE(browser.apply_query({"all", "a"}));
    CHECK(browser.take_scroll_correction() == 0.0f);
}

TEST_CASE("Command-line options", "[options]") {
    const AppOptions options = parse_app_options(std::vector<std::string>{
        "--page-size", "50", "--max-retained", "300", "--fail-every", "4",
        "--latency-ms", "250", "--items", "80", "--malformed-every", "7"});

    CHECK(options.page_size == 50);
    CHECK(options.max_retained == 300);
    CHECK_FALSE(options.overscan.has_value());
    CHECK(options.fail_every == 4);
    CHECK(options.latency_ms == 250);
    CHECK(options.sample_items == 80);
    CHECK(options.malformed_every == 7);
    CHECK_FALSE(options.show_help);

    CHECK(parse_app_options(std::vector<std::string>{"-h"}).show_help);
    CHECK_THROWS_AS(parse_app_options(std::vector<std::string>{"--bogus"}), std::invalid_argument);
    CHECK_THROWS_AS(parse_app_options(std::vector<std::string>{"--page-size"}), std::invalid_argument);
    CHECK_THROWS_AS(parse_app_options(std::vector<std::string>{"--page-size", "12x"}), std::invalid_argument);
}

TEST_CASE("Command-line overrides win over the config file", "[options][config]") {
    const auto path = std::filesystem::temp_directory_path() / "lazylist_test_options.json";
    {
        std::ofstream file(path);
        file << R"({"page_size": 10, "overscan": 2})";
    }

    AppOptions options;
    options.config_path = path.string();
    options.page_size = 30;

    ErrorLog log;
    const LoaderConfig config = resolve_loader_config(options, &log);
    std::filesystem::remove(path);

    CHECK(config.page_size == 30);
    CHECK(config.overscan == 2);
    CHECK(log.size() == 0);
}

TEST_CASE("Without a catalog file a sample is generated", "[options][catalog]") {
    AppOptions options;
    options.sample_items = 30;
    options.malformed_every = 10;

    const auto items = load_catalog_items(options);
    REQUIRE(items.size() == 30);
    CHECK(items[9].title.empty());

    options.catalog_path = "/nonexistent/catalog.json";
    CHECK_THROWS_AS(load_catalog_items(options), std::runtime_error);
}
