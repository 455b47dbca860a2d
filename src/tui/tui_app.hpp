#pragma once

#include "../content_browser.hpp"
#include "../errors.hpp"
#include "../ui_task_queue.hpp"
#include "../viewmodels/app_view_model.hpp"
#include <atomic>
#include <string>
#include <ncurses.h>

namespace lazylist {

class TuiApp {
public:
    // Non-owning constructor: TuiApp uses but does not own the browser.
    // All pointers must be non-null and must outlive the TuiApp instance.
    TuiApp(ContentBrowser* browser, UiTaskQueue* ui_queue, ErrorLog* error_log);
    ~TuiApp();

    void run();

private:
    // Rendering
    void render();
    void render_tab_bar();
    void render_collection();
    void draw_card(const RenderedItem<ItemCard>& item, int top, int left, int width, bool selected);
    void render_list_footer(float footer_top);
    void render_status_bar();
    void render_help_overlay();
    void render_search_bar();

    // Input handling
    void handle_input(int ch);
    void handle_search_input(int ch);
    void handle_help_input(int ch);
    void handle_mouse_event();

    // Query
    void select_tab(int tab);
    void apply_query();

    // Scrolling and selection (content coordinates, in pixels)
    void scroll_by(float delta);
    void scroll_to(float offset);
    void clamp_scroll();
    void move_selection(int delta);
    void scroll_to_selection();
    [[nodiscard]] int card_rows() const;
    [[nodiscard]] float viewport_height() const;
    [[nodiscard]] float max_scroll() const;

    // Window management
    void create_windows();
    void resize_windows();
    void cleanup_windows();

    void draw_box_title(WINDOW* win, const std::string& title);

    // Non-owned references
    ContentBrowser* browser_ = nullptr;
    UiTaskQueue* ui_queue_ = nullptr;
    ErrorLog* error_log_ = nullptr;

    // ViewModel (holds all UI state)
    AppViewModel view_model_;

    // ncurses windows
    WINDOW* tab_win_ = nullptr;
    WINDOW* list_win_ = nullptr;
    WINDOW* status_win_ = nullptr;

    // UI state
    bool show_help_ = false;
    bool search_mode_ = false;
    std::string search_input_;
    std::atomic<bool> running_{false};
    int dialog_debounce_ = 0;

    float scroll_offset_ = 0.0f;
    int visible_list_rows_ = 0;
    int list_win_y_ = 0;

    // Layout constants
    static constexpr int kTabBarHeight = 1;
    static constexpr int kStatusBarHeight = 2;
    static constexpr float kRowPixels = 20.0f;  // one terminal row in loader units
    static constexpr int kWheelRows = 3;
};

} // namespace lazylist
