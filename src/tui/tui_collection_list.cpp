#include "tui_app.hpp"
#include "tui_colors.hpp"
#include <algorithm>
#include <cmath>
#include <format>

namespace lazylist {

// Truncate to width columns, marking the cut with "..."
static std::string fit(const std::string& text, const int width) {
    if (width <= 0) return {};
    if (static_cast<int>(text.size()) <= width) return text;
    if (width <= 3) return text.substr(0, static_cast<size_t>(width));
    return text.substr(0, static_cast<size_t>(width - 3)) + "...";
}

void TuiApp::render_tab_bar() {
    if (!tab_win_) return;

    int x = 1;
    for (size_t i = 0; i < kTabLabels.size(); ++i) {
        const bool active = static_cast<int>(i) == view_model_.collection.active_tab;
        const int color = active ? COLOR_PAIR_TAB_ACTIVE : COLOR_PAIR_TAB_INACTIVE;
        wattron(tab_win_, COLOR_PAIR(color));
        mvwprintw(tab_win_, 0, x, " %zu %s ", i + 1, kTabLabels[i]);
        wattroff(tab_win_, COLOR_PAIR(color));
        x += static_cast<int>(std::char_traits<char>::length(kTabLabels[i])) + 5;
    }

    if (const auto& search = view_model_.collection.search_text; !search.empty()) {
        const int max_x = getmaxx(tab_win_);
        const std::string indicator = fit("Search: " + search, 30);
        const int search_x = max_x - static_cast<int>(indicator.size()) - 1;
        if (search_x > x) {
            wattron(tab_win_, COLOR_PAIR(COLOR_PAIR_WARNING));
            mvwprintw(tab_win_, 0, search_x, "%s", indicator.c_str());
            wattroff(tab_win_, COLOR_PAIR(COLOR_PAIR_WARNING));
        }
    }
}

void TuiApp::render_collection() {
    if (!list_win_) return;

    int max_y, max_x;
    getmaxyx(list_win_, max_y, max_x);

    const auto& collection = view_model_.collection;
    const auto& status = view_model_.status_bar;
    draw_box_title(list_win_, std::format("{} ({} results)",
                                          kTabLabels[static_cast<size_t>(collection.active_tab)],
                                          status.total_results));

    if (browser_->show_empty_state()) {
        const std::string message = "No configurations found";
        wattron(list_win_, A_DIM);
        mvwprintw(list_win_, max_y / 2, std::max(1, (max_x - static_cast<int>(message.size())) / 2),
                  "%s", message.c_str());
        wattroff(list_win_, A_DIM);
        return;
    }

    const ContentRenderPlan plan = browser_->render();
    const auto& config = browser_->loader().config();
    const auto per_row = static_cast<size_t>(config.items_per_row);
    const int column_width = std::max(1, (max_x - 2) / config.items_per_row);

    for (const auto& item : plan.items) {
        const size_t row = item.index / per_row;
        const size_t column = item.index % per_row;
        const float top_px = static_cast<float>(row) * config.item_height_estimate - scroll_offset_;
        const int top = 1 + static_cast<int>(std::floor(top_px / kRowPixels));
        const int left = 1 + static_cast<int>(column) * column_width;
        const bool selected = item.absolute_index == collection.selected_absolute;
        draw_card(item, top, left, column_width, selected);
    }

    render_list_footer(browser_->loader().content_height());

    // Scroll indicators
    if (scroll_offset_ > 0.0f) {
        wattron(list_win_, COLOR_PAIR(COLOR_PAIR_TITLE));
        mvwprintw(list_win_, 0, max_x - 5, "^^^");
        wattroff(list_win_, COLOR_PAIR(COLOR_PAIR_TITLE));
    }
    if (scroll_offset_ < max_scroll()) {
        wattron(list_win_, COLOR_PAIR(COLOR_PAIR_TITLE));
        mvwprintw(list_win_, max_y - 1, max_x - 5, "vvv");
        wattroff(list_win_, COLOR_PAIR(COLOR_PAIR_TITLE));
    }
}

void TuiApp::draw_card(const RenderedItem<ItemCard>& item, const int top, const int left,
                       const int width, const bool selected) {
    const int max_y = getmaxy(list_win_);
    const int rows = card_rows();

    // Last row of a tall card is the gap to the next one
    const int text_rows = rows > 2 ? rows - 1 : rows;
    const ItemCard& card = item.output;

    const std::string lines[] = {card.title, card.meta, card.description, card.tags};
    const int line_colors[] = {
        card.fallback ? COLOR_PAIR_CARD_FALLBACK : COLOR_PAIR_DEFAULT,
        card.fallback ? COLOR_PAIR_CARD_FALLBACK : COLOR_PAIR_CARD_META,
        COLOR_PAIR_DEFAULT,
        COLOR_PAIR_CARD_TAGS
    };

    const int text_width = width - 2;
    for (int i = 0; i < text_rows && i < 4; ++i) {
        const int y = top + i;
        if (y < 1 || y > max_y - 2) continue;

        const int color = selected ? COLOR_PAIR_SELECTED : line_colors[i];
        attr_t attrs = COLOR_PAIR(color);
        if (i == 0) attrs |= A_BOLD;

        wattron(list_win_, attrs);
        if (selected) {
            mvwhline(list_win_, y, left, ' ', width - 1);
        }
        mvwprintw(list_win_, y, left + 1, "%s", fit(lines[i], text_width).c_str());
        wattroff(list_win_, attrs);
    }
}

void TuiApp::render_list_footer(const float footer_top) {
    int max_y, max_x;
    getmaxyx(list_win_, max_y, max_x);

    const int y = 1 + static_cast<int>(std::floor((footer_top - scroll_offset_) / kRowPixels));
    if (y < 1 || y > max_y - 2) return;

    const auto& status = view_model_.status_bar;
    std::string text;
    int color = COLOR_PAIR_DEFAULT;

    switch (status.phase) {
        case LoadPhase::Loading:
            text = "Loading more...";
            color = COLOR_PAIR_LOADING;
            break;
        case LoadPhase::Error:
            text = std::format("{}  [r] Retry", status.error_message);
            color = COLOR_PAIR_ERROR;
            break;
        case LoadPhase::Idle:
            if (status.has_more) {
                text = "[m] Load more";
                color = COLOR_PAIR_TITLE;
            } else if (status.retained_count > 0) {
                text = "End of list";
                color = COLOR_PAIR_DEFAULT;
            }
            break;
    }

    if (text.empty()) return;
    text = fit(text, max_x - 4);
    wattron(list_win_, COLOR_PAIR(color));
    mvwprintw(list_win_, y, std::max(1, (max_x - static_cast<int>(text.size())) / 2), "%s", text.c_str());
    wattroff(list_win_, COLOR_PAIR(color));
}

} // namespace lazylist
