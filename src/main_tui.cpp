#include "app_options.hpp"
#include "content_browser.hpp"
#include "tui/tui_app.hpp"
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <utility>

int main(int argc, char* argv[]) {
    try {
        const lazylist::AppOptions options = lazylist::parse_app_options(argc, argv);
        if (options.show_help) {
            lazylist::print_usage(std::cout, argv[0]);
            return 0;
        }

        // Shared by the loader, the page source and the status bar
        lazylist::ErrorLog error_log;
        const lazylist::LoaderConfig config = lazylist::resolve_loader_config(options, &error_log);
        lazylist::ContentCatalog catalog(lazylist::load_catalog_items(options, &error_log));

        // Data layer (owned here in main)
        lazylist::UiTaskQueue ui_queue;
        lazylist::ContentBrowser browser(std::move(catalog), config, &ui_queue, &error_log);
        browser.source().set_latency(std::chrono::milliseconds(options.latency_ms));
        browser.source().set_fail_every(options.fail_every);

        // TuiApp does not own these resources - they're managed here
        lazylist::TuiApp app(&browser, &ui_queue, &error_log);
        app.run();
        return 0;
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\n";
        lazylist::print_usage(std::cerr, argv[0]);
        return 2;
    } catch (const std::exception& e) {
        // Make sure we restore terminal state before printing error
        if (!isendwin()) {
            endwin();
        }
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
