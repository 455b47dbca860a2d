#pragma once

#include "../errors.hpp"
#include "../load_state.hpp"
#include <string>
#include <vector>

namespace lazylist {

struct StatusBarViewModel {
    // Loader state
    size_t retained_count = 0;
    size_t evicted_count = 0;
    size_t total_results = 0;
    bool has_more = false;
    LoadPhase phase = LoadPhase::Idle;
    std::string error_message;

    // Recent errors from the error log (newest last)
    std::vector<LoaderError> recent_errors;
};

} // namespace lazylist
