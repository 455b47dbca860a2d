#include "content_catalog.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <format>
#include <iterator>
#include <fstream>
#include <random>
#include <sstream>
#include <stdexcept>
#include <utility>

using json = nlohmann::json;

namespace lazylist {

static std::string to_lower(std::string s) {
    std::ranges::transform(s, s.begin(), [](const unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return s;
}

static bool contains_lower(const std::string& haystack, const std::string& needle_lower) {
    return to_lower(haystack).find(needle_lower) != std::string::npos;
}

bool matches_query(const ContentItem& item, const ContentQuery& query) {
    if (!query.category.empty() && query.category != "all" && item.category != query.category) {
        return false;
    }
    if (query.search_text.empty()) {
        return true;
    }

    const std::string needle = to_lower(query.search_text);
    if (contains_lower(item.title, needle) ||
        contains_lower(item.description, needle) ||
        contains_lower(item.author, needle) ||
        contains_lower(item.slug, needle)) {
        return true;
    }
    return std::ranges::any_of(item.tags, [&needle](const std::string& tag) {
        return contains_lower(tag, needle);
    });
}

ContentCatalog::ContentCatalog(std::vector<ContentItem> items)
    : items_(std::move(items)) {
}

std::vector<ContentItem> ContentCatalog::query(const ContentQuery& query) const {
    std::vector<ContentItem> result;
    for (const auto& item : items_) {
        if (matches_query(item, query)) {
            result.push_back(item);
        }
    }
    return result;
}

std::vector<ContentItem> ContentCatalog::generate_sample(const size_t count, const uint32_t seed,
                                                         const size_t malformed_every) {
    static constexpr const char* kSubjects[] = {
        "TypeScript", "React", "PostgreSQL", "Docker", "Rust", "Python", "GitHub",
        "Kubernetes", "Next.js", "Tailwind", "GraphQL", "Redis", "Terraform", "Go"
    };
    static constexpr const char* kNouns[] = {
        "Expert", "Reviewer", "Formatter", "Linter", "Server", "Assistant",
        "Migrator", "Guard", "Auditor", "Scaffolder", "Tester", "Optimizer"
    };
    static constexpr const char* kAuthors[] = {
        "ghost", "jsmith", "mlee", "akumar", "tnguyen", "oparker", "rchen"
    };
    static constexpr const char* kTags[] = {
        "productivity", "security", "testing", "devops", "frontend", "backend",
        "database", "ai", "automation", "docs"
    };

    std::mt19937 rng(seed);
    const auto pick = [&rng](const auto& table) {
        std::uniform_int_distribution<size_t> dist(0, std::size(table) - 1);
        return std::string(table[dist(rng)]);
    };

    std::vector<ContentItem> items;
    items.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        ContentItem item;
        item.category = kContentCategories[i % std::size(kContentCategories)];
        const std::string subject = pick(kSubjects);
        const std::string noun = pick(kNouns);
        item.title = std::format("{} {}", subject, noun);
        item.slug = std::format("{}-{}-{}", to_lower(subject), to_lower(noun), i + 1);
        std::ranges::replace(item.slug, '.', '-');
        item.description = std::format("{} {} for {} workflows.", subject, to_lower(noun), item.category);
        item.author = pick(kAuthors);
        item.tags = {pick(kTags), pick(kTags)};
        item.date_added = std::format("2025-{:02}-{:02}", 1 + (i / 28) % 12, 1 + i % 28);

        if (malformed_every > 0 && (i + 1) % malformed_every == 0) {
            item.title.clear();
        }
        items.push_back(std::move(item));
    }
    return items;
}

// Optional string field. A value of another type is reported and left empty.
static void read_string(const json& entry, const char* key, std::string& field,
                        const std::string& slug, ErrorLog* error_log) {
    const auto it = entry.find(key);
    if (it == entry.end() || it->is_null()) return;

    if (!it->is_string()) {
        if (error_log) {
            error_log->add(ErrorKind::ConfigError,
                           std::format("catalog entry '{}': '{}' must be a string", slug, key));
        }
        return;
    }
    field = it->get<std::string>();
}

std::vector<ContentItem> ContentCatalog::parse_json(const std::string& json_text, ErrorLog* error_log) {
    json j;
    try {
        j = json::parse(json_text);
    } catch (const json::parse_error& e) {
        throw std::runtime_error(std::format("catalog parse error: {}", e.what()));
    }
    if (!j.is_array()) {
        throw std::runtime_error("catalog root must be an array");
    }

    std::vector<ContentItem> items;
    items.reserve(j.size());
    for (size_t i = 0; i < j.size(); ++i) {
        const json& entry = j[i];
        if (!entry.is_object() || !entry.contains("slug") || !entry["slug"].is_string()) {
            if (error_log) {
                error_log->add(ErrorKind::ConfigError, std::format("catalog entry {} has no slug, skipped", i));
            }
            continue;
        }

        ContentItem item;
        item.slug = entry["slug"].get<std::string>();
        read_string(entry, "title", item.title, item.slug, error_log);
        read_string(entry, "category", item.category, item.slug, error_log);
        read_string(entry, "description", item.description, item.slug, error_log);
        read_string(entry, "author", item.author, item.slug, error_log);
        read_string(entry, "date_added", item.date_added, item.slug, error_log);
        if (const auto tags = entry.find("tags"); tags != entry.end() && tags->is_array()) {
            for (const auto& tag : *tags) {
                if (tag.is_string()) {
                    item.tags.push_back(tag.get<std::string>());
                }
            }
        }
        items.push_back(std::move(item));
    }
    return items;
}

std::vector<ContentItem> ContentCatalog::load_json_file(const std::string& path, ErrorLog* error_log) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error(std::format("cannot open catalog file '{}'", path));
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return parse_json(ss.str(), error_log);
}

} // namespace lazylist
