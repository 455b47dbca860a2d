#include "tui_colors.hpp"

namespace lazylist {

namespace {

struct PairSpec {
    ColorPair pair;
    short foreground;
    short background;  // -1 = terminal default
};

constexpr PairSpec kPairs[] = {
    {COLOR_PAIR_DEFAULT, -1, -1},
    {COLOR_PAIR_TITLE, COLOR_CYAN, -1},
    {COLOR_PAIR_SELECTED, COLOR_BLACK, COLOR_CYAN},
    {COLOR_PAIR_BORDER, COLOR_BLUE, -1},

    // Status bar and inline errors
    {COLOR_PAIR_STATUS, COLOR_WHITE, COLOR_BLUE},
    {COLOR_PAIR_ERROR, COLOR_RED, -1},
    {COLOR_PAIR_WARNING, COLOR_YELLOW, -1},

    // Category tabs
    {COLOR_PAIR_TAB_ACTIVE, COLOR_BLACK, COLOR_WHITE},
    {COLOR_PAIR_TAB_INACTIVE, COLOR_WHITE, -1},

    // Cards and list footer
    {COLOR_PAIR_CARD_META, COLOR_YELLOW, -1},
    {COLOR_PAIR_CARD_TAGS, COLOR_GREEN, -1},
    {COLOR_PAIR_CARD_FALLBACK, COLOR_RED, -1},
    {COLOR_PAIR_LOADING, COLOR_CYAN, -1},

    // Help and search overlays
    {COLOR_PAIR_DIALOG, COLOR_WHITE, COLOR_BLUE},
    {COLOR_PAIR_DIALOG_BUTTON, COLOR_BLACK, COLOR_WHITE},
    {COLOR_PAIR_HELP_KEY, COLOR_CYAN, -1},
};

} // namespace

void init_colors() {
    if (!has_colors()) {
        return;
    }

    start_color();
    use_default_colors();

    for (const auto& p : kPairs) {
        init_pair(static_cast<short>(p.pair), p.foreground, p.background);
    }
}

int get_error_color(const ErrorKind kind) {
    return is_recoverable(kind) ? COLOR_PAIR_WARNING : COLOR_PAIR_ERROR;
}

} // namespace lazylist
