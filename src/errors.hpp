#pragma once

#include <chrono>
#include <mutex>
#include <string>
#include <vector>

namespace lazylist {

enum class ErrorKind {
    LoadError,    // page source failed, retryable
    RenderError,  // one item failed to render, contained to that item
    ConfigError   // invalid configuration value, replaced by its default
};

[[nodiscard]] const char* error_kind_name(ErrorKind kind);

// Load errors can be retried and config errors fall back to defaults; a
// render error leaves a broken item on screen.
[[nodiscard]] bool is_recoverable(ErrorKind kind);

// Error info surfaced from the loader to the status bar
struct LoaderError {
    ErrorKind kind = ErrorKind::LoadError;
    std::chrono::steady_clock::time_point timestamp;
    std::string message;
};

// Bounded, thread-safe log of recent errors. Page sources may report from
// their worker threads while the UI thread reads.
class ErrorLog {
public:
    void add(ErrorKind kind, const std::string& message);

    // Errors newer than max_age (all errors when max_age is zero)
    [[nodiscard]] std::vector<LoaderError> recent(std::chrono::seconds max_age = std::chrono::seconds(0)) const;
    [[nodiscard]] size_t count(ErrorKind kind) const;
    [[nodiscard]] size_t size() const;
    void clear();

    static constexpr size_t kMaxErrors = 10;

private:
    mutable std::mutex mutex_;
    std::vector<LoaderError> errors_;
};

} // namespace lazylist
