#pragma once

#include "errors.hpp"
#include "incremental_loader.hpp"
#include "retained_collection.hpp"
#include "window_calculator.hpp"
#include <algorithm>
#include <exception>
#include <format>
#include <functional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace lazylist {

template <typename R>
struct RenderedItem {
    size_t index = 0;           // position in the retained collection
    size_t absolute_index = 0;  // position since the last reset, stable across eviction
    std::string key;
    R output{};
    bool failed = false;
};

// What the host draws for one frame: a top spacer, the windowed items and a
// bottom spacer.
template <typename R>
struct RenderPlan {
    Window window;
    float top_padding = 0.0f;
    float bottom_padding = 0.0f;
    std::vector<RenderedItem<R>> items;
    size_t failed_count = 0;
};

// Maps the loader's window to rendered outputs. Each render_item call is
// isolated: an exception replaces that one item with the fallback output
// and is recorded as a RenderError.
template <typename T, typename R>
class RenderAdapter {
public:
    using RenderItemFn = std::function<R(const T&, size_t)>;
    using KeyExtractorFn = std::function<std::string(const T&, size_t)>;
    using FallbackFn = std::function<R(const T&, size_t, const std::string&)>;

    RenderAdapter(RenderItemFn render_item,
                  KeyExtractorFn key_extractor,
                  FallbackFn fallback,
                  ErrorLog* error_log = nullptr)
        : render_item_(std::move(render_item))
        , key_extractor_(std::move(key_extractor))
        , fallback_(std::move(fallback))
        , error_log_(error_log) {
    }

    [[nodiscard]] RenderPlan<R> render(const IncrementalLoader<T>& loader) {
        return render(loader.items(), loader.window());
    }

    [[nodiscard]] RenderPlan<R> render(const RetainedCollection<T>& items, const Window& window) {
        RenderPlan<R> plan;
        plan.window = window;
        plan.top_padding = window.top_padding;
        plan.bottom_padding = window.bottom_padding;

        const size_t end = std::min(window.end, items.size());
        const size_t start = std::min(window.start, end);
        plan.items.reserve(end - start);

        for (size_t i = start; i < end; ++i) {
            RenderedItem<R> rendered;
            rendered.index = i;
            rendered.absolute_index = items.absolute_index(i);
            rendered.key = extract_key(items[i], i, rendered.absolute_index);

            try {
                rendered.output = render_item_(items[i], i);
            } catch (const std::exception& e) {
                fail_item(rendered, items[i], e.what());
            } catch (...) {
                fail_item(rendered, items[i], kUnknownError);
            }
            if (rendered.failed) {
                plan.failed_count++;
            }
            plan.items.push_back(std::move(rendered));
        }
        return plan;
    }

    // Report each failing key once until forgotten (new logical collection)
    void forget_reported() { reported_keys_.clear(); }

private:
    static constexpr const char* kUnknownError = "unknown error";

    // Replace a failed item with the fallback output. A throwing fallback
    // leaves a default output.
    void fail_item(RenderedItem<R>& rendered, const T& item, const char* what) {
        rendered.failed = true;
        report(rendered.key, what);
        try {
            rendered.output = fallback_(item, rendered.index, what);
        } catch (const std::exception& e) {
            rendered.output = R{};
            report(rendered.key + "/fallback", e.what());
        } catch (...) {
            rendered.output = R{};
            report(rendered.key + "/fallback", kUnknownError);
        }
    }

    std::string extract_key(const T& item, const size_t index, const size_t absolute_index) {
        std::string fallback = std::format("#{}", absolute_index);
        if (!key_extractor_) return fallback;

        try {
            std::string key = key_extractor_(item, index);
            if (!key.empty()) return key;
        } catch (const std::exception& e) {
            report(fallback, e.what());
        } catch (...) {
            report(fallback, kUnknownError);
        }
        return fallback;
    }

    void report(const std::string& key, const char* what) {
        if (!error_log_) return;
        if (!reported_keys_.insert(key).second) return;
        error_log_->add(ErrorKind::RenderError, std::format("item '{}': {}", key, what));
    }

    RenderItemFn render_item_;
    KeyExtractorFn key_extractor_;
    FallbackFn fallback_;
    ErrorLog* error_log_ = nullptr;
    std::set<std::string> reported_keys_;
};

} // namespace lazylist
