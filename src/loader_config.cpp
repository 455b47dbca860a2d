#include "loader_config.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cmath>
#include <format>
#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace lazylist {

static void report(ErrorLog* error_log, const std::string& message) {
    if (error_log) {
        error_log->add(ErrorKind::ConfigError, message);
    }
}

LoaderConfig sanitize_config(const LoaderConfig& config, ErrorLog* error_log) {
    const LoaderConfig defaults;
    LoaderConfig out = config;

    if (out.page_size <= 0) {
        report(error_log, std::format("page_size {} is not positive, using {}", out.page_size, defaults.page_size));
        out.page_size = defaults.page_size;
    }
    if (out.virtualize_threshold < 0) {
        report(error_log, std::format("virtualize_threshold {} is negative, using {}",
                                      out.virtualize_threshold, defaults.virtualize_threshold));
        out.virtualize_threshold = defaults.virtualize_threshold;
    }
    if (out.overscan < 0) {
        report(error_log, std::format("overscan {} is negative, using {}", out.overscan, defaults.overscan));
        out.overscan = defaults.overscan;
    }
    if (!std::isfinite(out.item_height_estimate) || out.item_height_estimate <= 0.0f) {
        report(error_log, std::format("item_height_estimate {} is not positive, using {}",
                                      out.item_height_estimate, defaults.item_height_estimate));
        out.item_height_estimate = defaults.item_height_estimate;
    }
    if (out.items_per_row <= 0) {
        report(error_log, std::format("items_per_row {} is not positive, using {}",
                                      out.items_per_row, defaults.items_per_row));
        out.items_per_row = defaults.items_per_row;
    }
    if (!std::isfinite(out.lookahead_margin) || out.lookahead_margin < 0.0f) {
        report(error_log, std::format("lookahead_margin {} is negative, using {}",
                                      out.lookahead_margin, defaults.lookahead_margin));
        out.lookahead_margin = defaults.lookahead_margin;
    }
    if (!(out.intersection_threshold >= 0.0f && out.intersection_threshold <= 1.0f)) {
        report(error_log, std::format("intersection_threshold {} is outside [0, 1], using {}",
                                      out.intersection_threshold, defaults.intersection_threshold));
        out.intersection_threshold = defaults.intersection_threshold;
    }
    if (out.max_retained <= 0) {
        report(error_log, std::format("max_retained {} is not positive, using {}",
                                      out.max_retained, defaults.max_retained));
        out.max_retained = defaults.max_retained;
    }

    // A single page must always fit in the retained buffer
    if (out.max_retained < out.page_size) {
        const int fallback = std::max(defaults.max_retained, out.page_size);
        report(error_log, std::format("max_retained {} is smaller than page_size {}, using {}",
                                      out.max_retained, out.page_size, fallback));
        out.max_retained = fallback;
    }

    return out;
}

template <typename Field>
static void read_field(const json& j, const char* key, Field& field, ErrorLog* error_log) {
    const auto it = j.find(key);
    if (it == j.end()) return;

    if (!it->is_number()) {
        report(error_log, std::format("config key '{}' must be a number", key));
        return;
    }
    field = it->get<Field>();
}

LoaderConfig parse_config_json(const std::string& json_text, const LoaderConfig& base, ErrorLog* error_log) {
    json j;
    try {
        j = json::parse(json_text);
    } catch (const json::parse_error& e) {
        report(error_log, std::format("config parse error: {}", e.what()));
        return base;
    }

    if (!j.is_object()) {
        report(error_log, "config root must be an object");
        return base;
    }

    LoaderConfig out = base;
    read_field(j, "page_size", out.page_size, error_log);
    read_field(j, "virtualize_threshold", out.virtualize_threshold, error_log);
    read_field(j, "overscan", out.overscan, error_log);
    read_field(j, "item_height_estimate", out.item_height_estimate, error_log);
    read_field(j, "max_retained", out.max_retained, error_log);
    read_field(j, "items_per_row", out.items_per_row, error_log);
    read_field(j, "lookahead_margin", out.lookahead_margin, error_log);
    read_field(j, "intersection_threshold", out.intersection_threshold, error_log);
    return out;
}

LoaderConfig load_config_file(const std::string& path, const LoaderConfig& base, ErrorLog* error_log) {
    std::ifstream file(path);
    if (!file) {
        report(error_log, std::format("cannot open config file '{}'", path));
        return base;
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return parse_config_json(ss.str(), base, error_log);
}

} // namespace lazylist
