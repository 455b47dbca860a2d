#include "imgui_app.hpp"
#include "imgui.h"
#include <algorithm>

namespace lazylist {

void ImGuiApp::handle_keyboard_navigation() {
    auto& collection = view_model_.collection;
    auto& loader = browser_->loader();

    // Ctrl+F to focus search box
    if (ImGui::GetIO().KeyCtrl && ImGui::IsKeyPressed(ImGuiKey_F)) {
        collection.focus_search_box = true;
        return;
    }

    // F5 reloads from the first page
    if (ImGui::IsKeyPressed(ImGuiKey_F5)) {
        browser_->reload();
        collection.selected_absolute = kNoSelection;
        scroll_to_top_ = true;
        return;
    }

    if (!ImGui::IsWindowFocused(ImGuiFocusedFlags_RootAndChildWindows)) return;
    if (ImGui::GetIO().WantTextInput) return;

    // Ctrl+Tab / Ctrl+Shift+Tab cycle the category tabs
    if (ImGui::GetIO().KeyCtrl && ImGui::IsKeyPressed(ImGuiKey_Tab)) {
        const int count = static_cast<int>(kTabCategories.size());
        const int step = ImGui::GetIO().KeyShift ? count - 1 : 1;
        collection.active_tab = (collection.active_tab + step) % count;
        apply_query();
        return;
    }

    if (ImGui::IsKeyPressed(ImGuiKey_M)) {
        loader.load_more();
        return;
    }
    if (ImGui::IsKeyPressed(ImGuiKey_R)) {
        loader.retry();
        return;
    }

    const float item_height = loader.config().item_height_estimate;
    const int page_rows = std::max(1, static_cast<int>(ImGui::GetWindowHeight() / item_height));

    if (ImGui::IsKeyPressed(ImGuiKey_UpArrow)) {
        move_selection(-1);
    } else if (ImGui::IsKeyPressed(ImGuiKey_DownArrow)) {
        move_selection(1);
    } else if (ImGui::IsKeyPressed(ImGuiKey_PageUp)) {
        move_selection(-page_rows);
    } else if (ImGui::IsKeyPressed(ImGuiKey_PageDown)) {
        move_selection(page_rows);
    } else if (ImGui::IsKeyPressed(ImGuiKey_Home)) {
        move_selection(-static_cast<int>(loader.retained_count()));
    } else if (ImGui::IsKeyPressed(ImGuiKey_End)) {
        move_selection(static_cast<int>(loader.retained_count()));
    }
}

void ImGuiApp::move_selection(const int delta) {
    const auto& loader = browser_->loader();
    const size_t count = loader.retained_count();
    if (count == 0) return;

    auto& collection = view_model_.collection;
    auto& selected = collection.selected_absolute;
    const size_t evicted = loader.evicted_count();
    const int per_row = loader.config().items_per_row;

    // Nothing selected yet, or the selected item was evicted: start at the
    // top of the current window
    if (selected == kNoSelection || selected < evicted) {
        selected = loader.items().absolute_index(std::min(loader.window().start, count - 1));
        collection.scroll_to_selected = true;
        return;
    }

    const int current = static_cast<int>(std::min(selected - evicted, count - 1));
    const int next = std::clamp(current + delta * per_row, 0, static_cast<int>(count) - 1);
    selected = loader.items().absolute_index(static_cast<size_t>(next));
    collection.scroll_to_selected = true;
}

} // namespace lazylist
