#pragma once

#include "catalog_page_source.hpp"
#include "content_card.hpp"
#include "content_catalog.hpp"
#include "errors.hpp"
#include "incremental_loader.hpp"
#include "loader_config.hpp"
#include "proximity.hpp"
#include "render_adapter.hpp"
#include "ui_task_queue.hpp"

namespace lazylist {

using ContentLoader = IncrementalLoader<ContentItem>;
using ContentRenderPlan = RenderPlan<ItemCard>;

// The infinite-scroll page of the content directory, shared by both front
// ends. A query (tab + search) selects a result list; the first page is
// shown at once and the rest is paged in by the loader through the
// catalog page source.
//
// Non-owning: ui_queue and error_log must outlive the browser.
class ContentBrowser {
public:
    ContentBrowser(ContentCatalog catalog,
                   const LoaderConfig& config,
                   UiTaskQueue* ui_queue,
                   ErrorLog* error_log);
    ~ContentBrowser();

    ContentBrowser(const ContentBrowser&) = delete;
    ContentBrowser& operator=(const ContentBrowser&) = delete;

    // Start/stop the page source worker
    void start();
    void stop();

    // New logical collection. Returns false (and does nothing) if the query
    // is unchanged.
    bool apply_query(const ContentQuery& query);

    // Same query, reloaded from the first page
    void reload();

    // Sentinel sits right below the content. Viewport extents are in
    // content coordinates. Returns true if the observer reported.
    bool update_sentinel(float scroll_top, float viewport_height);

    [[nodiscard]] ContentRenderPlan render();

    // Height of the rows evicted from the head since the last call. Hosts
    // subtract it from their scroll offset so the visible items stay put.
    [[nodiscard]] float take_scroll_correction();

    [[nodiscard]] ContentLoader& loader() { return loader_; }
    [[nodiscard]] const ContentLoader& loader() const { return loader_; }
    [[nodiscard]] CatalogPageSource& source() { return source_; }
    [[nodiscard]] const ContentQuery& query() const { return query_; }
    [[nodiscard]] size_t total_results() const { return total_results_; }
    [[nodiscard]] const ContentCatalog& catalog() const { return catalog_; }

    // Empty collection with nothing loading
    [[nodiscard]] bool show_empty_state() const;

private:
    ContentCatalog catalog_;
    ContentQuery query_;
    size_t total_results_ = 0;
    bool has_query_ = false;
    size_t seen_evicted_ = 0;
    const LoaderConfig config_;  // sanitized

    // Destruction order matters: the loader releases its observer
    // connection and cancels in-flight pages before the rest goes away
    GeometricProximityObserver observer_;
    CatalogPageSource source_;
    RenderAdapter<ContentItem, ItemCard> adapter_;
    ContentLoader loader_;
};

} // namespace lazylist
