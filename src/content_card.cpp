#include "content_card.hpp"
#include <format>
#include <stdexcept>

namespace lazylist {

ItemCard render_card(const ContentItem& item, size_t /*index*/) {
    if (item.slug.empty()) {
        throw std::invalid_argument("item has no slug");
    }
    if (item.title.empty()) {
        throw std::invalid_argument(std::format("item '{}' has no title", item.slug));
    }

    ItemCard card;
    card.title = item.title;
    card.meta = item.category;
    if (!item.author.empty()) {
        card.meta += " · " + item.author;
    }
    if (!item.date_added.empty()) {
        card.meta += " · " + item.date_added;
    }
    card.description = item.description;
    for (const auto& tag : item.tags) {
        if (!card.tags.empty()) card.tags += ' ';
        card.tags += '#' + tag;
    }
    return card;
}

ItemCard fallback_card(const ContentItem& item, size_t index, const std::string& error) {
    ItemCard card;
    card.title = item.slug.empty() ? std::format("Item {}", index + 1) : item.slug;
    card.meta = "failed to render";
    card.description = error;
    card.fallback = true;
    return card;
}

std::string content_key(const ContentItem& item, size_t /*index*/) {
    return item.slug;
}

} // namespace lazylist
