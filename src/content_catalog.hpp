#pragma once

#include "content_item.hpp"
#include "errors.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace lazylist {

struct ContentQuery {
    std::string category = "all";  // "all" or one of kContentCategories
    std::string search_text;

    bool operator==(const ContentQuery&) const = default;
};

// Case-insensitive match on title, description, author and tags
[[nodiscard]] bool matches_query(const ContentItem& item, const ContentQuery& query);

// In-memory content directory. Produces the full, ordered result list of a
// query; paging over that list is the page source's job.
class ContentCatalog {
public:
    ContentCatalog() = default;
    explicit ContentCatalog(std::vector<ContentItem> items);

    [[nodiscard]] std::vector<ContentItem> query(const ContentQuery& query) const;
    [[nodiscard]] size_t size() const { return items_.size(); }
    [[nodiscard]] const std::vector<ContentItem>& items() const { return items_; }

    // Deterministic sample directory for demos and tests. Every
    // malformed_every-th item (when non-zero) has an empty title.
    [[nodiscard]] static std::vector<ContentItem> generate_sample(size_t count, uint32_t seed = 1,
                                                                  size_t malformed_every = 0);

    // JSON array of objects with ContentItem's field names. Entries without a
    // slug are skipped and reported. Throws std::runtime_error if the file
    // cannot be read or is not a JSON array.
    [[nodiscard]] static std::vector<ContentItem> load_json_file(const std::string& path, ErrorLog* error_log = nullptr);
    [[nodiscard]] static std::vector<ContentItem> parse_json(const std::string& json_text, ErrorLog* error_log = nullptr);

private:
    std::vector<ContentItem> items_;
};

} // namespace lazylist
