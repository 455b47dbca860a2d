#pragma once

#include <functional>
#include <mutex>
#include <queue>

namespace lazylist {

// Hands work from background threads to the UI thread. Worker threads
// post(); the UI loop calls run_pending() once per frame.
class UiTaskQueue {
public:
    using Task = std::function<void()>;

    void post(Task task);

    // Run every task queued before this call. Returns how many ran.
    size_t run_pending();

    [[nodiscard]] size_t pending() const;

    // Invoked (from the posting thread) after each post, to wake the UI loop
    void set_on_posted(std::function<void()> callback);

private:
    mutable std::mutex mutex_;
    std::queue<Task> tasks_;
    std::function<void()> on_posted_;
};

} // namespace lazylist
