#pragma once

#include "errors.hpp"
#include <string>

namespace lazylist {

struct LoaderConfig {
    int page_size = 20;
    int virtualize_threshold = 100;    // virtualize only above this many items
    int overscan = 5;                  // extra rows rendered on each side of the window
    float item_height_estimate = 80.0f;
    int max_retained = 500;
    int items_per_row = 1;             // fixed grid width, 1 = plain list
    float lookahead_margin = 100.0f;   // sentinel proximity margin
    float intersection_threshold = 0.1f;
};

// Replace invalid fields with their defaults. Each replacement is reported
// to error_log (if given) as a ConfigError. Never throws.
[[nodiscard]] LoaderConfig sanitize_config(const LoaderConfig& config, ErrorLog* error_log = nullptr);

// Read a JSON object with LoaderConfig's field names on top of base.
// A missing or unparsable file leaves base untouched and reports a ConfigError.
// The result is not sanitized.
[[nodiscard]] LoaderConfig load_config_file(const std::string& path,
                                            const LoaderConfig& base = {},
                                            ErrorLog* error_log = nullptr);

// Parse a JSON document (same rules as load_config_file)
[[nodiscard]] LoaderConfig parse_config_json(const std::string& json_text,
                                             const LoaderConfig& base = {},
                                             ErrorLog* error_log = nullptr);

} // namespace lazylist
