#pragma once

#include "content_item.hpp"
#include <string>

namespace lazylist {

// Display-ready text for one content item. Both front ends draw from this.
struct ItemCard {
    std::string title;
    std::string meta;           // "category · author · date"
    std::string description;
    std::string tags;           // "#a #b"
    bool fallback = false;      // rendering failed, placeholder shown
};

// Throws std::invalid_argument for items that cannot be shown (no title or slug)
[[nodiscard]] ItemCard render_card(const ContentItem& item, size_t index);

[[nodiscard]] ItemCard fallback_card(const ContentItem& item, size_t index, const std::string& error);

// Slug, stable across eviction
[[nodiscard]] std::string content_key(const ContentItem& item, size_t index);

} // namespace lazylist
