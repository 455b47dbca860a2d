#include "catalog_page_source.hpp"
#include <algorithm>
#include <format>
#include <utility>

namespace lazylist {

CatalogPageSource::CatalogPageSource(UiTaskQueue* ui_queue, const size_t page_size)
    : ui_queue_(ui_queue)
    , page_size_(std::max<size_t>(page_size, 1)) {
}

CatalogPageSource::~CatalogPageSource() {
    stop();
}

void CatalogPageSource::start() {
    if (running_) return;
    running_ = true;
    worker_thread_ = std::thread(&CatalogPageSource::worker_thread_func, this);
}

void CatalogPageSource::stop() {
    if (!running_) return;
    {
        std::lock_guard lock(mutex_);
        running_ = false;
        requests_.clear();
    }
    cv_.notify_all();

    if (worker_thread_.joinable()) {
        worker_thread_.join();
    }
}

void CatalogPageSource::set_results(std::vector<ContentItem> results, const size_t next_offset) {
    std::lock_guard lock(mutex_);
    results_ = std::move(results);
    next_offset_ = std::min(next_offset, results_.size());
    generation_++;
}

void CatalogPageSource::load_more(PageCallback<ContentItem> callback) {
    {
        std::lock_guard lock(mutex_);
        requests_.push_back(Request{generation_, std::move(callback)});
    }
    cv_.notify_one();
}

void CatalogPageSource::set_latency(const std::chrono::milliseconds latency) {
    std::lock_guard lock(mutex_);
    latency_ = std::max(latency, std::chrono::milliseconds(0));
}

void CatalogPageSource::set_fail_every(const int n) {
    std::lock_guard lock(mutex_);
    fail_every_ = std::max(n, 0);
}

size_t CatalogPageSource::next_offset() const {
    std::lock_guard lock(mutex_);
    return next_offset_;
}

size_t CatalogPageSource::total_results() const {
    std::lock_guard lock(mutex_);
    return results_.size();
}

void CatalogPageSource::worker_thread_func() {
    while (running_) {
        Request request;
        std::chrono::milliseconds latency{0};

        {
            std::unique_lock lock(mutex_);
            cv_.wait(lock, [this] {
                return !requests_.empty() || !running_;
            });

            if (!running_) break;

            request = std::move(requests_.front());
            requests_.pop_front();
            latency = latency_;
        }

        if (latency.count() > 0) {
            // Interruptible by stop()
            std::unique_lock lock(mutex_);
            cv_.wait_for(lock, latency, [this] { return !running_; });
            if (!running_) break;
        }

        PageResult<ContentItem> result = serve(request);
        ui_queue_->post([callback = std::move(request.callback), result = std::move(result)]() mutable {
            callback(std::move(result));
        });
    }
}

PageResult<ContentItem> CatalogPageSource::serve(const Request& request) {
    const uint64_t n = ++request_count_;

    std::lock_guard lock(mutex_);
    PageResult<ContentItem> result;

    if (request.generation != generation_) {
        result.error_message = "Request superseded by a new query";
        return result;
    }
    if (fail_every_ > 0 && n % static_cast<uint64_t>(fail_every_) == 0) {
        result.error_message = std::format("Failed to load items {}-{}", next_offset_ + 1,
                                           next_offset_ + page_size_);
        return result;
    }

    const size_t end = std::min(next_offset_ + page_size_, results_.size());
    result.items.assign(results_.begin() + static_cast<std::ptrdiff_t>(next_offset_),
                        results_.begin() + static_cast<std::ptrdiff_t>(end));
    next_offset_ = end;
    result.success = true;
    return result;
}

} // namespace lazylist
