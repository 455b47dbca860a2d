#pragma once

#include "interfaces/i_page_source.hpp"
#include "interfaces/i_proximity_observer.hpp"
#include "cancellation.hpp"
#include "errors.hpp"
#include "load_state.hpp"
#include "loader_config.hpp"
#include "proximity.hpp"
#include "retained_collection.hpp"
#include "window_calculator.hpp"
#include <exception>
#include <string>
#include <utility>
#include <vector>

namespace lazylist {

// Windowed incremental loader for one logical collection.
//
// Owns the retained items, the pagination state machine and the current
// window. All methods must be called from the UI thread; page sources hand
// their results back through the callback on that same thread.
//
// Non-owning: source, observer and error_log must outlive the loader.
// observer and error_log may be null.
template <typename T>
class IncrementalLoader {
public:
    IncrementalLoader(IPageSource<T>* source,
                      const LoaderConfig& config,
                      IProximityObserver* observer = nullptr,
                      ErrorLog* error_log = nullptr)
        : source_(source)
        , error_log_(error_log)
        , config_(sanitize_config(config, error_log))
        , items_(static_cast<size_t>(config_.max_retained))
        , connection_(observer) {
        recompute_window();
    }

    ~IncrementalLoader() { teardown(); }

    IncrementalLoader(const IncrementalLoader&) = delete;
    IncrementalLoader& operator=(const IncrementalLoader&) = delete;

    // Start a new logical collection. HasMore is true when the initial page
    // is full.
    void reset(std::vector<T> items) {
        const bool full_page = items.size() >= static_cast<size_t>(config_.page_size);
        reset(std::move(items), full_page);
    }

    void reset(std::vector<T> items, const bool has_more) {
        if (torn_down_) return;

        // Drops any in-flight ticket, its result will be discarded
        state_.reset();
        items_.reset(std::move(items));
        has_more_ = has_more;
        await_sentinel_exit_ = false;
        throttle_.cancel();
        recompute_window();
        sync_observer();
    }

    // Scroll and resize are coalesced; the window follows on the next on_frame()
    void on_scroll(const float scroll_top) {
        if (torn_down_) return;
        scroll_.scroll_top = scroll_top;
        throttle_.request(FrameThrottle::Scroll);
    }

    void on_resize(const float container_height) {
        if (torn_down_) return;
        scroll_.container_height = container_height;
        throttle_.request(FrameThrottle::Resize);
    }

    // Once per animation frame. Returns true if the window was recomputed.
    bool on_frame() {
        if (torn_down_) return false;
        if (throttle_.take() == FrameThrottle::None) return false;
        recompute_window();
        return true;
    }

    // Proximity trigger. After a failed page the sentinel has to leave the
    // lookahead range and come back before it triggers again.
    void on_sentinel(const ProximityEntry& entry) {
        if (torn_down_ || !has_more_ || state_.is_loading()) return;
        const bool triggering = entry_triggers(entry, config_.intersection_threshold);
        if (await_sentinel_exit_) {
            if (!triggering) await_sentinel_exit_ = false;
            return;
        }
        if (!triggering) return;
        begin_page_load();
    }

    // Manual trigger ("Load more"). Returns true if a request was issued.
    bool load_more() {
        if (torn_down_ || !has_more_) return false;
        return begin_page_load();
    }

    // Re-attempt after a LoadError. No-op in any other phase.
    bool retry() {
        if (torn_down_ || !has_more_ || !state_.has_error()) return false;
        return begin_page_load();
    }

    // Unmount: release the observer, drop pending frame work and ignore any
    // result still in flight. Terminal.
    void teardown() {
        if (torn_down_) return;
        torn_down_ = true;
        cancellation_.cancel();
        connection_.release();
        throttle_.cancel();
        state_.reset();
    }

    [[nodiscard]] bool has_more() const { return has_more_; }
    [[nodiscard]] LoadPhase phase() const { return state_.phase(); }
    [[nodiscard]] bool is_loading() const { return state_.is_loading(); }
    [[nodiscard]] const std::string& error_message() const { return state_.error_message(); }
    [[nodiscard]] size_t retained_count() const { return items_.size(); }
    [[nodiscard]] size_t evicted_count() const { return items_.evicted_count(); }
    [[nodiscard]] const RetainedCollection<T>& items() const { return items_; }
    [[nodiscard]] const Window& window() const { return window_; }
    [[nodiscard]] const ScrollState& scroll_state() const { return scroll_; }
    [[nodiscard]] const LoaderConfig& config() const { return config_; }
    [[nodiscard]] bool is_torn_down() const { return torn_down_; }
    [[nodiscard]] bool is_observing() const { return connection_.is_active(); }

    // Total scroll height of the retained items
    [[nodiscard]] float content_height() const { return lazylist::content_height(items_.size(), config_); }

private:
    bool begin_page_load() {
        const uint64_t ticket = state_.try_begin();
        if (ticket == 0) return false;
        await_sentinel_exit_ = false;

        // No proximity reports while a page is in flight
        sync_observer();

        CancellationToken token = cancellation_.token();
        try {
            source_->load_more([this, ticket, token](PageResult<T> result) {
                if (token.is_cancelled()) return;
                settle(ticket, std::move(result));
            });
        } catch (const std::exception& e) {
            PageResult<T> failed;
            failed.error_message = e.what();
            settle(ticket, std::move(failed));
        }
        return true;
    }

    void settle(const uint64_t ticket, PageResult<T> result) {
        if (!result.success) {
            std::string message = result.error_message.empty()
                ? std::string("Failed to load more items")
                : std::move(result.error_message);
            if (!state_.fail(ticket, message)) return;  // superseded by reset
            if (error_log_) {
                error_log_->add(ErrorKind::LoadError, message);
            }
            await_sentinel_exit_ = true;
            sync_observer();
            return;
        }

        if (!state_.succeed(ticket)) return;

        const size_t received = result.items.size();
        if (received > 0) {
            items_.append(std::move(result.items));
        }
        has_more_ = received > 0 && received >= static_cast<size_t>(config_.page_size);

        recompute_window();
        sync_observer();
    }

    void recompute_window() {
        window_ = compute_window(items_.size(), scroll_, config_);
    }

    // Observe while a proximity report could start a load, including after
    // a failed page
    void sync_observer() {
        const bool wanted = !torn_down_ && has_more_ && !state_.is_loading();
        if (wanted && !connection_.is_active()) {
            connection_.connect([this](const ProximityEntry& entry) {
                on_sentinel(entry);
            });
        } else if (!wanted && connection_.is_active()) {
            connection_.release();
        }
    }

    IPageSource<T>* source_ = nullptr;
    ErrorLog* error_log_ = nullptr;
    const LoaderConfig config_;

    RetainedCollection<T> items_;
    LoadState state_;
    bool has_more_ = false;
    bool torn_down_ = false;
    bool await_sentinel_exit_ = false;

    ScrollState scroll_;
    Window window_;
    FrameThrottle throttle_;

    CancellationSource cancellation_;
    ObserverConnection connection_;
};

} // namespace lazylist
