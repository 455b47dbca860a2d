#include "errors.hpp"
#include <algorithm>

namespace lazylist {

const char* error_kind_name(const ErrorKind kind) {
    switch (kind) {
        case ErrorKind::LoadError: return "load";
        case ErrorKind::RenderError: return "render";
        case ErrorKind::ConfigError: return "config";
    }
    return "unknown";
}

bool is_recoverable(const ErrorKind kind) {
    return kind != ErrorKind::RenderError;
}

void ErrorLog::add(const ErrorKind kind, const std::string& message) {
    std::lock_guard lock(mutex_);
    errors_.push_back({kind, std::chrono::steady_clock::now(), message});
    if (errors_.size() > kMaxErrors) {
        errors_.erase(errors_.begin());
    }
}

std::vector<LoaderError> ErrorLog::recent(const std::chrono::seconds max_age) const {
    std::lock_guard lock(mutex_);
    if (max_age.count() <= 0) {
        return errors_;
    }

    const auto cutoff = std::chrono::steady_clock::now() - max_age;
    std::vector<LoaderError> result;
    for (const auto& err : errors_) {
        if (err.timestamp > cutoff) {
            result.push_back(err);
        }
    }
    return result;
}

size_t ErrorLog::count(const ErrorKind kind) const {
    std::lock_guard lock(mutex_);
    return static_cast<size_t>(std::ranges::count_if(errors_, [kind](const LoaderError& e) {
        return e.kind == kind;
    }));
}

size_t ErrorLog::size() const {
    std::lock_guard lock(mutex_);
    return errors_.size();
}

void ErrorLog::clear() {
    std::lock_guard lock(mutex_);
    errors_.clear();
}

} // namespace lazylist
