#include "ui_task_queue.hpp"
#include <utility>

namespace lazylist {

void UiTaskQueue::post(Task task) {
    std::function<void()> callback;
    {
        std::lock_guard lock(mutex_);
        tasks_.push(std::move(task));
        callback = on_posted_;
    }

    // Notify outside of lock
    if (callback) {
        callback();
    }
}

size_t UiTaskQueue::run_pending() {
    std::queue<Task> batch;
    {
        std::lock_guard lock(mutex_);
        std::swap(batch, tasks_);
    }

    // Tasks posted while running wait for the next frame
    size_t ran = 0;
    while (!batch.empty()) {
        Task task = std::move(batch.front());
        batch.pop();
        if (task) {
            task();
            ran++;
        }
    }
    return ran;
}

size_t UiTaskQueue::pending() const {
    std::lock_guard lock(mutex_);
    return tasks_.size();
}

void UiTaskQueue::set_on_posted(std::function<void()> callback) {
    std::lock_guard lock(mutex_);
    on_posted_ = std::move(callback);
}

} // namespace lazylist
