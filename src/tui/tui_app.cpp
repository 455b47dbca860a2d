#include "tui_app.hpp"
#include "tui_colors.hpp"
#include <algorithm>
#include <cassert>
#include <chrono>
#include <cmath>
#include <csignal>
#include <thread>

namespace lazylist {

// Signal handler for terminal resize
static std::atomic<bool> g_resize_requested{false};

static void handle_resize([[maybe_unused]] int sig) {
    g_resize_requested.store(true);
}

TuiApp::TuiApp(ContentBrowser* browser, UiTaskQueue* ui_queue, ErrorLog* error_log)
    : browser_(browser)
    , ui_queue_(ui_queue)
    , error_log_(error_log)
{
    assert(browser_ != nullptr);
    assert(ui_queue_ != nullptr);
    assert(error_log_ != nullptr);
}

TuiApp::~TuiApp() {
    cleanup_windows();
}

void TuiApp::run() {
    // Initialize ncurses
    initscr();
    cbreak();
    noecho();
    keypad(stdscr, TRUE);
    curs_set(0);  // Hide cursor
    nodelay(stdscr, TRUE);  // Non-blocking input
    mouseinterval(0);  // Disable mouse click delay
    set_escdelay(25);

    mousemask(ALL_MOUSE_EVENTS, nullptr);

    init_colors();

    printf("\033]0;lazylist\007");
    fflush(stdout);

    signal(SIGWINCH, handle_resize);

    create_windows();

    // Pages are produced in the background from here on
    browser_->start();
    apply_query();

    running_ = true;
    while (running_) {
        // Handle terminal resize
        if (g_resize_requested.exchange(false)) {
            endwin();
            refresh();
            resize_windows();
        }

        // Handle input
        int ch = getch();
        while (ch != ERR && running_) {
            handle_input(ch);
            ch = getch();
        }

        // Settle finished pages on this thread
        ui_queue_->run_pending();

        // Keep the visible cards in place when the head was evicted
        if (const float correction = browser_->take_scroll_correction(); correction > 0.0f) {
            scroll_to(scroll_offset_ - correction);
        }
        clamp_scroll();

        // At most one window recompute per frame
        browser_->loader().on_frame();
        view_model_.update_from_browser(*browser_, *error_log_);

        render();

        // Sentinel below the last card; may start the next page
        browser_->update_sentinel(scroll_offset_, viewport_height());

        std::this_thread::sleep_for(std::chrono::milliseconds(16));
    }

    browser_->loader().teardown();
    browser_->stop();
    cleanup_windows();
    endwin();

    printf("\033]0;\007");
    fflush(stdout);
}

void TuiApp::create_windows() {
    int max_y, max_x;
    getmaxyx(stdscr, max_y, max_x);

    const int list_height = std::max(3, max_y - kTabBarHeight - kStatusBarHeight);

    int y = 0;
    tab_win_ = newwin(kTabBarHeight, max_x, y, 0);
    y += kTabBarHeight;

    list_win_y_ = y;
    list_win_ = newwin(list_height, max_x, y, 0);
    y += list_height;
    visible_list_rows_ = list_height - 2;  // Account for border

    status_win_ = newwin(kStatusBarHeight, max_x, y, 0);

    keypad(tab_win_, TRUE);
    keypad(list_win_, TRUE);
    keypad(status_win_, TRUE);

    browser_->loader().on_resize(viewport_height());
}

void TuiApp::resize_windows() {
    cleanup_windows();
    create_windows();
}

void TuiApp::cleanup_windows() {
    if (tab_win_) {
        delwin(tab_win_);
        tab_win_ = nullptr;
    }
    if (list_win_) {
        delwin(list_win_);
        list_win_ = nullptr;
    }
    if (status_win_) {
        delwin(status_win_);
        status_win_ = nullptr;
    }
}

void TuiApp::render() {
    werase(tab_win_);
    werase(list_win_);
    werase(status_win_);

    render_tab_bar();
    render_collection();
    render_status_bar();

    wnoutrefresh(tab_win_);
    wnoutrefresh(list_win_);
    wnoutrefresh(status_win_);
    doupdate();

    // Overlays
    if (show_help_) {
        render_help_overlay();
    }
    if (search_mode_) {
        render_search_bar();
    }
}

void TuiApp::draw_box_title(WINDOW* win, const std::string& title) {
    wattron(win, COLOR_PAIR(COLOR_PAIR_BORDER));
    box(win, 0, 0);
    wattroff(win, COLOR_PAIR(COLOR_PAIR_BORDER));
    if (!title.empty()) {
        wattron(win, COLOR_PAIR(COLOR_PAIR_TITLE) | A_BOLD);
        mvwprintw(win, 0, 2, " %s ", title.c_str());
        wattroff(win, COLOR_PAIR(COLOR_PAIR_TITLE) | A_BOLD);
    }
}

void TuiApp::select_tab(const int tab) {
    const int count = static_cast<int>(kTabCategories.size());
    view_model_.collection.active_tab = ((tab % count) + count) % count;
    apply_query();
}

void TuiApp::apply_query() {
    if (!browser_->apply_query(view_model_.collection.query())) return;

    view_model_.collection.selected_absolute = kNoSelection;
    scroll_to(0.0f);
}

int TuiApp::card_rows() const {
    const float height = browser_->loader().config().item_height_estimate;
    return std::max(1, static_cast<int>(std::lround(height / kRowPixels)));
}

float TuiApp::viewport_height() const {
    return static_cast<float>(std::max(0, visible_list_rows_)) * kRowPixels;
}

float TuiApp::max_scroll() const {
    // One extra row below the content for the list footer
    const float content = browser_->loader().content_height() + kRowPixels;
    return std::max(0.0f, content - viewport_height());
}

void TuiApp::scroll_to(const float offset) {
    scroll_offset_ = std::clamp(offset, 0.0f, max_scroll());
    browser_->loader().on_scroll(scroll_offset_);
}

void TuiApp::scroll_by(const float delta) {
    scroll_to(scroll_offset_ + delta);
}

void TuiApp::clamp_scroll() {
    if (scroll_offset_ > max_scroll()) {
        scroll_to(max_scroll());
    }
}

void TuiApp::move_selection(const int delta) {
    const auto& loader = browser_->loader();
    const size_t count = loader.retained_count();
    if (count == 0) return;

    auto& selected = view_model_.collection.selected_absolute;
    const size_t evicted = loader.evicted_count();

    const int per_row = loader.config().items_per_row;

    // Nothing selected yet, or the selected item was evicted: start at the
    // first fully visible card
    if (selected == kNoSelection || selected < evicted) {
        const auto first_row = static_cast<size_t>(std::ceil(scroll_offset_ / loader.config().item_height_estimate));
        const size_t first = std::min(first_row * static_cast<size_t>(per_row), count - 1);
        selected = loader.items().absolute_index(first);
        scroll_to_selection();
        return;
    }

    const int current = static_cast<int>(std::min(selected - evicted, count - 1));
    const int next = std::clamp(current + delta * per_row, 0, static_cast<int>(count) - 1);
    selected = loader.items().absolute_index(static_cast<size_t>(next));
    scroll_to_selection();
}

void TuiApp::scroll_to_selection() {
    const auto& loader = browser_->loader();
    const size_t selected = view_model_.collection.selected_absolute;
    if (selected == kNoSelection || selected < loader.evicted_count()) return;

    const size_t index = selected - loader.evicted_count();
    const auto& config = loader.config();
    const float top = static_cast<float>(index / static_cast<size_t>(config.items_per_row)) * config.item_height_estimate;
    const float bottom = top + config.item_height_estimate;

    if (top < scroll_offset_) {
        scroll_to(top);
    } else if (bottom > scroll_offset_ + viewport_height()) {
        scroll_to(bottom - viewport_height());
    }
}

} // namespace lazylist
