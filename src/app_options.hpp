#pragma once

#include "content_item.hpp"
#include "errors.hpp"
#include "loader_config.hpp"
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace lazylist {

// Command line of both front ends
struct AppOptions {
    std::string config_path;
    std::string catalog_path;

    // Overrides applied on top of the config file
    std::optional<int> page_size;
    std::optional<int> max_retained;
    std::optional<int> virtualize_threshold;
    std::optional<int> overscan;

    // Page source behaviour
    int fail_every = 0;
    int latency_ms = 0;

    // Generated catalog when no --catalog is given
    int sample_items = 1000;
    int malformed_every = 0;

    bool show_help = false;
};

// Parse args (without argv[0]). Throws std::invalid_argument on an unknown
// option, a missing value or a malformed number.
[[nodiscard]] AppOptions parse_app_options(const std::vector<std::string>& args);
[[nodiscard]] AppOptions parse_app_options(int argc, char* argv[]);

void print_usage(std::ostream& out, const char* program);

// Defaults, then the config file, then command-line overrides. Not sanitized:
// the loader reports invalid values itself.
[[nodiscard]] LoaderConfig resolve_loader_config(const AppOptions& options, ErrorLog* error_log = nullptr);

// --catalog file, or a generated sample directory. Throws std::runtime_error
// if the catalog file cannot be loaded.
[[nodiscard]] std::vector<ContentItem> load_catalog_items(const AppOptions& options, ErrorLog* error_log = nullptr);

} // namespace lazylist
