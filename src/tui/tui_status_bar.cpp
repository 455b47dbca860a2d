#include "tui_app.hpp"
#include "tui_colors.hpp"
#include <algorithm>
#include <format>

namespace lazylist {

void TuiApp::render_status_bar() {
    if (!status_win_) return;

    const int max_x = getmaxx(status_win_);
    const auto& status = view_model_.status_bar;

    wbkgd(status_win_, COLOR_PAIR(COLOR_PAIR_STATUS));
    werase(status_win_);

    // Row 0: key hints on the left, loader state on the right
    const char* hints = "q:Quit  /:Search  1-6:Tab  m:More  r:Retry  ?:Help";
    mvwprintw(status_win_, 0, 1, "%s", hints);

    const std::string state = std::format("{} retained  {} evicted  {}  {}",
                                          status.retained_count,
                                          status.evicted_count,
                                          status.has_more ? "more" : "end",
                                          load_phase_name(status.phase));
    const int state_x = max_x - static_cast<int>(state.size()) - 2;
    if (state_x > static_cast<int>(std::char_traits<char>::length(hints)) + 2) {
        mvwprintw(status_win_, 0, state_x, "%s", state.c_str());
    }

    // Row 1: most recent error, if any
    if (!status.recent_errors.empty()) {
        const auto& latest = status.recent_errors.back();
        std::string line = std::format("[{}] {}", error_kind_name(latest.kind), latest.message);
        if (status.recent_errors.size() > 1) {
            line += std::format("  (+{} more)", status.recent_errors.size() - 1);
        }
        if (static_cast<int>(line.size()) > max_x - 2) {
            line = line.substr(0, static_cast<size_t>(std::max(0, max_x - 5))) + "...";
        }
        const attr_t attrs = COLOR_PAIR(get_error_color(latest.kind)) | A_BOLD;
        wattron(status_win_, attrs);
        mvwprintw(status_win_, 1, 1, "%s", line.c_str());
        wattroff(status_win_, attrs);
    }
}

void TuiApp::render_help_overlay() {
    int max_y, max_x;
    getmaxyx(stdscr, max_y, max_x);

    // Help dialog dimensions
    const int help_width = std::min(56, max_x);
    const int help_height = std::min(24, max_y);
    const int help_x = (max_x - help_width) / 2;
    const int help_y = (max_y - help_height) / 2;

    WINDOW* help_win = newwin(help_height, help_width, help_y, help_x);
    if (!help_win) return;

    wbkgd(help_win, COLOR_PAIR(COLOR_PAIR_DIALOG));
    box(help_win, 0, 0);

    wattron(help_win, A_BOLD);
    mvwprintw(help_win, 0, (help_width - 6) / 2, " Help ");
    wattroff(help_win, A_BOLD);

    const char* help_lines[] = {
        "Navigation:",
        "  Up/k, Down/j    Move selection up/down",
        "  PgUp, PgDn      Page up/down",
        "  Home/g, End/G   Jump to first/last loaded",
        "  Mouse wheel     Scroll",
        "",
        "Collection:",
        "  1-6             Switch category tab",
        "  Tab, S-Tab      Next/previous tab",
        "  /               Search",
        "  Esc             Clear search",
        "",
        "Loading:",
        "  m               Load more now",
        "  r               Retry a failed page",
        "  R/F5            Reload from the first page",
        "",
        "  q               Quit",
        "  ?/F1            This help"
    };

    int row = 2;
    for (const char* line : help_lines) {
        if (row >= help_height - 2) break;

        if (line[0] == ' ' && line[1] == ' ') {
            // Key binding line
            const std::string key(line, 2, 16);
            const std::string desc(line + 18);

            wattron(help_win, COLOR_PAIR(COLOR_PAIR_HELP_KEY));
            mvwprintw(help_win, row, 2, "%s", key.c_str());
            wattroff(help_win, COLOR_PAIR(COLOR_PAIR_HELP_KEY));
            mvwprintw(help_win, row, 18, "%s", desc.c_str());
        } else {
            wattron(help_win, A_BOLD);
            mvwprintw(help_win, row, 2, "%s", line);
            wattroff(help_win, A_BOLD);
        }
        row++;
    }

    wattron(help_win, COLOR_PAIR(COLOR_PAIR_DIALOG_BUTTON));
    mvwprintw(help_win, help_height - 2, (help_width - 24) / 2, " Press any key to close ");
    wattroff(help_win, COLOR_PAIR(COLOR_PAIR_DIALOG_BUTTON));

    wrefresh(help_win);
    delwin(help_win);
}

void TuiApp::render_search_bar() {
    int max_y, max_x;
    getmaxyx(stdscr, max_y, max_x);

    // Search bar over the status bar
    const int search_y = max_y - 3;
    const int search_width = std::min(50, max_x - 4);
    const int search_x = (max_x - search_width) / 2;

    WINDOW* search_win = newwin(3, search_width, search_y, search_x);
    if (!search_win) return;

    wbkgd(search_win, COLOR_PAIR(COLOR_PAIR_DIALOG));
    box(search_win, 0, 0);

    mvwprintw(search_win, 0, 2, " Search ");
    mvwprintw(search_win, 1, 2, "/ %s", search_input_.c_str());

    // Show cursor
    curs_set(1);
    wmove(search_win, 1, 4 + static_cast<int>(search_input_.length()));

    wrefresh(search_win);
    delwin(search_win);
}

} // namespace lazylist
