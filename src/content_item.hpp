#pragma once

#include <string>
#include <vector>

namespace lazylist {

// Categories of the content directory, in tab order
inline constexpr const char* kContentCategories[] = {
    "rules",
    "mcp",
    "agents",
    "commands",
    "hooks"
};

struct ContentItem {
    std::string slug;           // unique, used as the list key
    std::string title;
    std::string category;       // one of kContentCategories
    std::string description;
    std::string author;
    std::vector<std::string> tags;
    std::string date_added;     // "YYYY-MM-DD"
};

} // namespace lazylist
