#pragma once

#include <atomic>
#include <memory>
#include <utility>

namespace lazylist {

// Observes a CancellationSource. Cheap to copy into callbacks that may
// outlive the source's owner.
class CancellationToken {
public:
    CancellationToken() = default;

    [[nodiscard]] bool is_cancelled() const { return !flag_ || flag_->load(); }

private:
    friend class CancellationSource;
    explicit CancellationToken(std::shared_ptr<std::atomic<bool>> flag) : flag_(std::move(flag)) {}

    std::shared_ptr<std::atomic<bool>> flag_;
};

// Cancelled on cancel() or destruction; tokens handed out earlier see it.
class CancellationSource {
public:
    CancellationSource() : flag_(std::make_shared<std::atomic<bool>>(false)) {}
    ~CancellationSource() { cancel(); }

    CancellationSource(const CancellationSource&) = delete;
    CancellationSource& operator=(const CancellationSource&) = delete;

    [[nodiscard]] CancellationToken token() const { return CancellationToken(flag_); }
    void cancel() { flag_->store(true); }
    [[nodiscard]] bool is_cancelled() const { return flag_->load(); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

} // namespace lazylist
