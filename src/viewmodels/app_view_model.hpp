#pragma once

#include "collection_view_model.hpp"
#include "status_bar_view_model.hpp"
#include <chrono>

namespace lazylist {

// Root ViewModel containing all child ViewModels
struct AppViewModel {
    CollectionViewModel collection;
    StatusBarViewModel status_bar;

    // Update the status bar from the browser, once per frame
    void update_from_browser(const ContentBrowser& browser, const ErrorLog& error_log) {
        const auto& loader = browser.loader();
        status_bar.retained_count = loader.retained_count();
        status_bar.evicted_count = loader.evicted_count();
        status_bar.total_results = browser.total_results();
        status_bar.has_more = loader.has_more();
        status_bar.phase = loader.phase();
        status_bar.error_message = loader.error_message();
        status_bar.recent_errors = error_log.recent(std::chrono::seconds(10));
    }
};

} // namespace lazylist
