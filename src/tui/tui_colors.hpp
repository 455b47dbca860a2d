#pragma once

#include "../errors.hpp"
#include <ncurses.h>

namespace lazylist {

// Color pair indices
enum ColorPair {
    COLOR_PAIR_DEFAULT = 1,
    COLOR_PAIR_TITLE,
    COLOR_PAIR_SELECTED,
    COLOR_PAIR_BORDER,
    COLOR_PAIR_STATUS,
    COLOR_PAIR_ERROR,
    COLOR_PAIR_WARNING,
    COLOR_PAIR_TAB_ACTIVE,
    COLOR_PAIR_TAB_INACTIVE,
    COLOR_PAIR_CARD_META,
    COLOR_PAIR_CARD_TAGS,
    COLOR_PAIR_CARD_FALLBACK,
    COLOR_PAIR_LOADING,
    COLOR_PAIR_DIALOG,
    COLOR_PAIR_DIALOG_BUTTON,
    COLOR_PAIR_HELP_KEY,
};

// Initialize ncurses color pairs
void init_colors();

// Color pair for an error log entry of the given kind
int get_error_color(ErrorKind kind);

} // namespace lazylist
