#pragma once

#include "interfaces/i_page_source.hpp"
#include "content_item.hpp"
#include "ui_task_queue.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <thread>
#include <vector>

namespace lazylist {

// Pages over a query's result list on a background thread and delivers each
// page through the UI task queue. Holds the pagination cursor (an offset
// into the results), so the loader never needs to know how paging works.
class CatalogPageSource : public IPageSource<ContentItem> {
public:
    // ui_queue must be non-null and outlive the source. Requests still queued
    // when the source stops are dropped without a callback.
    CatalogPageSource(UiTaskQueue* ui_queue, size_t page_size);
    ~CatalogPageSource() override;

    CatalogPageSource(const CatalogPageSource&) = delete;
    CatalogPageSource& operator=(const CatalogPageSource&) = delete;

    // Start/stop the worker thread
    void start();
    void stop();

    // New result list; the next page starts at next_offset. Requests still
    // queued for the previous results complete with a failure.
    void set_results(std::vector<ContentItem> results, size_t next_offset);

    void load_more(PageCallback<ContentItem> callback) override;

    // Simulated latency per page
    void set_latency(std::chrono::milliseconds latency);

    // Fail every n-th request (0 = never). Failed requests do not advance
    // the cursor, so a retry returns the same page.
    void set_fail_every(int n);

    [[nodiscard]] size_t next_offset() const;
    [[nodiscard]] size_t total_results() const;
    [[nodiscard]] uint64_t request_count() const { return request_count_; }

private:
    struct Request {
        uint64_t generation = 0;
        PageCallback<ContentItem> callback;
    };

    void worker_thread_func();
    PageResult<ContentItem> serve(const Request& request);

    UiTaskQueue* ui_queue_ = nullptr;
    const size_t page_size_;

    std::thread worker_thread_;
    std::atomic<bool> running_{false};
    std::condition_variable cv_;

    // Protects everything below
    mutable std::mutex mutex_;
    std::deque<Request> requests_;
    std::vector<ContentItem> results_;
    size_t next_offset_ = 0;
    uint64_t generation_ = 0;
    std::chrono::milliseconds latency_{0};
    int fail_every_ = 0;

    std::atomic<uint64_t> request_count_{0};
};

} // namespace lazylist
