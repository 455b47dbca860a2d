#include "tui_app.hpp"
#include "tui_colors.hpp"
#include <algorithm>
#include <cstring>

namespace lazylist {

void TuiApp::handle_input(int ch) {
    // Debounce: ignore input for a few frames after showing dialogs
    if (dialog_debounce_ > 0) {
        dialog_debounce_--;
        // Still consume mouse events to prevent queue buildup
        if (ch == KEY_MOUSE) {
            MEVENT event;
            getmouse(&event);
        }
        return;
    }

    // Help overlay takes priority
    if (show_help_) {
        handle_help_input(ch);
        return;
    }

    // Search mode takes priority
    if (search_mode_) {
        handle_search_input(ch);
        return;
    }

    auto& loader = browser_->loader();
    const int page_rows = std::max(1, visible_list_rows_ / card_rows());

    switch (ch) {
        case 'q':
        case 'Q':
            running_ = false;
            break;

        case '?':
        case KEY_F(1):
            show_help_ = true;
            flushinp();  // Clear any pending input
            dialog_debounce_ = 5;  // Ignore input for 5 frames
            break;

        case '/':
            search_mode_ = true;
            search_input_ = view_model_.collection.search_text;
            break;

        case 27:  // Escape - clear search
            if (!view_model_.collection.search_text.empty()) {
                view_model_.collection.search_text.clear();
                apply_query();
            }
            break;

        // Tabs
        case '1': case '2': case '3': case '4': case '5': case '6':
            select_tab(ch - '1');
            break;

        case '\t':
            select_tab(view_model_.collection.active_tab + 1);
            break;

        case KEY_BTAB:
            select_tab(view_model_.collection.active_tab - 1);
            break;

        // Pagination
        case 'm':
            loader.load_more();
            break;

        case 'r':
            loader.retry();
            break;

        case 'R':
        case KEY_F(5):
            browser_->reload();
            view_model_.collection.selected_absolute = kNoSelection;
            scroll_to(0.0f);
            break;

        // Navigation
        case KEY_UP:
        case 'k':
            move_selection(-1);
            break;

        case KEY_DOWN:
        case 'j':
            move_selection(1);
            break;

        case KEY_PPAGE:
            move_selection(-page_rows);
            break;

        case KEY_NPAGE:
            move_selection(page_rows);
            break;

        case KEY_HOME:
        case 'g':
            if (loader.retained_count() > 0) {
                view_model_.collection.selected_absolute = loader.items().absolute_index(0);
                scroll_to(0.0f);
            }
            break;

        case KEY_END:
        case 'G':
            if (loader.retained_count() > 0) {
                view_model_.collection.selected_absolute =
                    loader.items().absolute_index(loader.retained_count() - 1);
                scroll_to(max_scroll());
            }
            break;

        case KEY_MOUSE:
            handle_mouse_event();
            break;

        default:
            break;
    }
}

void TuiApp::handle_search_input(int ch) {
    switch (ch) {
        case 27:  // Escape
            search_mode_ = false;
            curs_set(0);
            break;

        case '\n':
        case '\r':
        case KEY_ENTER:
            // Commit search
            search_mode_ = false;
            curs_set(0);
            view_model_.collection.search_text = search_input_;
            std::strncpy(view_model_.collection.search_buffer, search_input_.c_str(),
                         sizeof(view_model_.collection.search_buffer) - 1);
            apply_query();
            break;

        case KEY_BACKSPACE:
        case 127:
        case '\b':
            if (!search_input_.empty()) {
                search_input_.pop_back();
            }
            break;

        default:
            // Add printable characters to search
            if (ch >= 32 && ch < 127 && search_input_.size() < sizeof(view_model_.collection.search_buffer) - 1) {
                search_input_ += static_cast<char>(ch);
            }
            break;
    }
}

void TuiApp::handle_help_input([[maybe_unused]] int ch) {
    // Any key closes help
    show_help_ = false;
    flushinp();
    dialog_debounce_ = 3;
}

void TuiApp::handle_mouse_event() {
    MEVENT event;
    if (getmouse(&event) != OK) {
        return;
    }

    // Wheel scrolls the list without moving the selection
    if (event.bstate & BUTTON4_PRESSED) {
        scroll_by(-kWheelRows * kRowPixels);
        return;
    }
#ifdef BUTTON5_PRESSED
    if (event.bstate & BUTTON5_PRESSED) {
        scroll_by(kWheelRows * kRowPixels);
        return;
    }
#endif

    if (!(event.bstate & (BUTTON1_CLICKED | BUTTON1_PRESSED))) {
        return;
    }

    // Tab bar
    if (event.y == 0) {
        int x = 1;
        for (size_t i = 0; i < kTabLabels.size(); ++i) {
            const int width = static_cast<int>(std::char_traits<char>::length(kTabLabels[i])) + 4;
            if (event.x >= x && event.x < x + width) {
                select_tab(static_cast<int>(i));
                return;
            }
            x += width + 1;
        }
        return;
    }

    // Card click selects it
    const int row_in_list = event.y - list_win_y_ - 1;
    if (row_in_list < 0 || row_in_list >= visible_list_rows_) return;

    const auto& loader = browser_->loader();
    const auto& config = loader.config();
    const float y_px = scroll_offset_ + static_cast<float>(row_in_list) * kRowPixels;
    const auto row = static_cast<size_t>(y_px / config.item_height_estimate);

    const int max_x = getmaxx(list_win_);
    const int column_width = std::max(1, (max_x - 2) / config.items_per_row);
    const auto column = static_cast<size_t>(std::clamp((event.x - 1) / column_width, 0, config.items_per_row - 1));

    const size_t index = row * static_cast<size_t>(config.items_per_row) + column;
    if (index < loader.retained_count()) {
        view_model_.collection.selected_absolute = loader.items().absolute_index(index);
    }
}

} // namespace lazylist
