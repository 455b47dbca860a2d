#pragma once

#include "../content_browser.hpp"
#include <array>
#include <cstddef>
#include <string>

namespace lazylist {

// Tabs above the list: "all" followed by the content categories
inline constexpr std::array<const char*, 6> kTabCategories = {
    "all", "rules", "mcp", "agents", "commands", "hooks"
};

inline constexpr std::array<const char*, 6> kTabLabels = {
    "All", "Rules", "MCP", "Agents", "Commands", "Hooks"
};

inline constexpr size_t kNoSelection = static_cast<size_t>(-1);

struct CollectionViewModel {
    // Query state
    int active_tab = 0;
    char search_buffer[256] = {};
    std::string search_text;

    // Selection, as an absolute index so it survives eviction
    size_t selected_absolute = kNoSelection;

    // UI flags
    bool scroll_to_selected = false;
    bool focus_search_box = false;

    [[nodiscard]] ContentQuery query() const {
        ContentQuery q;
        q.category = kTabCategories[static_cast<size_t>(active_tab) % kTabCategories.size()];
        q.search_text = search_text;
        return q;
    }
};

} // namespace lazylist
