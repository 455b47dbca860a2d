#include "content_browser.hpp"
#include <algorithm>
#include <utility>

namespace lazylist {

ContentBrowser::ContentBrowser(ContentCatalog catalog,
                               const LoaderConfig& config,
                               UiTaskQueue* ui_queue,
                               ErrorLog* error_log)
    : catalog_(std::move(catalog))
    , config_(sanitize_config(config))
    , observer_(config_)
    , source_(ui_queue, static_cast<size_t>(config_.page_size))
    , adapter_(render_card, content_key, fallback_card, error_log)
    , loader_(&source_, config, &observer_, error_log) {
}

ContentBrowser::~ContentBrowser() {
    loader_.teardown();
    source_.stop();
}

void ContentBrowser::start() {
    source_.start();
}

void ContentBrowser::stop() {
    source_.stop();
}

bool ContentBrowser::apply_query(const ContentQuery& query) {
    if (has_query_ && query == query_) return false;
    query_ = query;
    has_query_ = true;
    reload();
    return true;
}

void ContentBrowser::reload() {
    std::vector<ContentItem> results = catalog_.query(query_);
    total_results_ = results.size();

    const size_t first_page = std::min(results.size(), static_cast<size_t>(config_.page_size));
    std::vector<ContentItem> first(results.begin(), results.begin() + static_cast<std::ptrdiff_t>(first_page));

    source_.set_results(std::move(results), first_page);
    adapter_.forget_reported();
    seen_evicted_ = 0;
    loader_.reset(std::move(first));
}

bool ContentBrowser::update_sentinel(const float scroll_top, const float viewport_height) {
    const float bottom = loader_.content_height();
    SentinelGeometry geometry;
    geometry.sentinel_top = bottom;
    geometry.sentinel_bottom = bottom;
    geometry.viewport_top = scroll_top;
    geometry.viewport_bottom = scroll_top + viewport_height;
    return observer_.update(geometry);
}

ContentRenderPlan ContentBrowser::render() {
    return adapter_.render(loader_);
}

float ContentBrowser::take_scroll_correction() {
    const size_t evicted = loader_.evicted_count();
    if (evicted <= seen_evicted_) {
        seen_evicted_ = evicted;
        return 0.0f;
    }

    const auto per_row = static_cast<size_t>(config_.items_per_row);
    const size_t removed_rows = evicted / per_row - seen_evicted_ / per_row;
    seen_evicted_ = evicted;
    return static_cast<float>(removed_rows) * config_.item_height_estimate;
}

bool ContentBrowser::show_empty_state() const {
    return loader_.retained_count() == 0 && !loader_.is_loading();
}

} // namespace lazylist
