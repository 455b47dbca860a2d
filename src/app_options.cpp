#include "app_options.hpp"
#include "content_catalog.hpp"
#include <charconv>
#include <format>
#include <stdexcept>
#include <string_view>

namespace lazylist {

static int parse_int(const std::string_view option, const std::string& value) {
    int result = 0;
    const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), result);
    if (ec != std::errc() || ptr != value.data() + value.size()) {
        throw std::invalid_argument(std::format("invalid number '{}' for {}", value, option));
    }
    return result;
}

AppOptions parse_app_options(const std::vector<std::string>& args) {
    AppOptions options;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string_view arg = args[i];
        auto need = [&](const std::string_view option) -> const std::string& {
            if (i + 1 >= args.size()) {
                throw std::invalid_argument(std::format("missing value for {}", option));
            }
            return args[++i];
        };

        if (arg == "--help" || arg == "-h") {
            options.show_help = true;
        } else if (arg == "--config") {
            options.config_path = need(arg);
        } else if (arg == "--catalog") {
            options.catalog_path = need(arg);
        } else if (arg == "--page-size") {
            options.page_size = parse_int(arg, need(arg));
        } else if (arg == "--max-retained") {
            options.max_retained = parse_int(arg, need(arg));
        } else if (arg == "--threshold") {
            options.virtualize_threshold = parse_int(arg, need(arg));
        } else if (arg == "--overscan") {
            options.overscan = parse_int(arg, need(arg));
        } else if (arg == "--fail-every") {
            options.fail_every = parse_int(arg, need(arg));
        } else if (arg == "--latency-ms") {
            options.latency_ms = parse_int(arg, need(arg));
        } else if (arg == "--items") {
            options.sample_items = parse_int(arg, need(arg));
        } else if (arg == "--malformed-every") {
            options.malformed_every = parse_int(arg, need(arg));
        } else {
            throw std::invalid_argument(std::format("unknown option '{}'", arg));
        }
    }
    return options;
}

AppOptions parse_app_options(const int argc, char* argv[]) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    return parse_app_options(args);
}

void print_usage(std::ostream& out, const char* program) {
    out << "Usage: " << program << " [options]\n"
        << "\n"
        << "Browse a content directory with a windowed, incrementally loaded list.\n"
        << "\n"
        << "Options:\n"
        << "  --config <file>        Loader settings (JSON object)\n"
        << "  --catalog <file>       Content items (JSON array); default is a generated sample\n"
        << "  --items N              Size of the generated sample (default: 1000)\n"
        << "  --malformed-every N    Every Nth generated item fails to render\n"
        << "  --page-size N          Items per page (default: 20)\n"
        << "  --max-retained N       Items kept in memory (default: 500)\n"
        << "  --threshold N          Virtualize above N items (default: 100)\n"
        << "  --overscan N           Extra items rendered around the viewport (default: 5)\n"
        << "  --fail-every N         Fail every Nth page request\n"
        << "  --latency-ms N         Simulated page latency\n"
        << "  -h, --help             Show this help\n";
}

LoaderConfig resolve_loader_config(const AppOptions& options, ErrorLog* error_log) {
    LoaderConfig config;
    if (!options.config_path.empty()) {
        config = load_config_file(options.config_path, config, error_log);
    }

    if (options.page_size) config.page_size = *options.page_size;
    if (options.max_retained) config.max_retained = *options.max_retained;
    if (options.virtualize_threshold) config.virtualize_threshold = *options.virtualize_threshold;
    if (options.overscan) config.overscan = *options.overscan;
    return config;
}

std::vector<ContentItem> load_catalog_items(const AppOptions& options, ErrorLog* error_log) {
    if (!options.catalog_path.empty()) {
        return ContentCatalog::load_json_file(options.catalog_path, error_log);
    }

    const size_t count = options.sample_items > 0 ? static_cast<size_t>(options.sample_items) : 0;
    const size_t malformed = options.malformed_every > 0 ? static_cast<size_t>(options.malformed_every) : 0;
    return ContentCatalog::generate_sample(count, 1, malformed);
}

} // namespace lazylist
