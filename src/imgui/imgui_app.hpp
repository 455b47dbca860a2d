#pragma once

#include "../content_browser.hpp"
#include "../errors.hpp"
#include "../ui_task_queue.hpp"
#include "../viewmodels/app_view_model.hpp"
#include <chrono>
#include <mutex>

struct GLFWwindow;
struct ImVec2;

namespace lazylist {

class ImGuiApp {
public:
    // Non-owning constructor: ImGuiApp uses but does not own the browser.
    // All pointers must be non-null and must outlive the ImGuiApp instance.
    ImGuiApp(ContentBrowser* browser, UiTaskQueue* ui_queue, ErrorLog* error_log);
    ~ImGuiApp();

    void run();

private:
    void render();
    void render_menu_bar();
    void render_toolbar();
    void render_collection();
    void render_card(const RenderedItem<ItemCard>& item, const ImVec2& size);
    void render_list_footer();
    void render_status_bar();

    void handle_keyboard_navigation();
    void move_selection(int delta);
    void apply_query();

    // Non-owned references
    ContentBrowser* browser_ = nullptr;
    UiTaskQueue* ui_queue_ = nullptr;
    ErrorLog* error_log_ = nullptr;

    // ViewModel (holds all UI state - single source of truth)
    AppViewModel view_model_;

    // Scroll state of the list child window, as last reported to the loader
    float last_scroll_y_ = -1.0f;
    float last_view_height_ = -1.0f;
    bool scroll_to_top_ = false;

    GLFWwindow* window_ = nullptr;

    // Event debouncing to prevent glfwPostEmptyEvent floods
    void post_empty_event_debounced();
    std::mutex event_debounce_mutex_;
    std::chrono::steady_clock::time_point last_event_post_time_;
    static constexpr auto kEventDebounceInterval = std::chrono::milliseconds(16);  // ~60fps max
};

} // namespace lazylist
