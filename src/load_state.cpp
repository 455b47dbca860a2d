#include "load_state.hpp"
#include <utility>

namespace lazylist {

const char* load_phase_name(const LoadPhase phase) {
    switch (phase) {
        case LoadPhase::Idle: return "idle";
        case LoadPhase::Loading: return "loading";
        case LoadPhase::Error: return "error";
    }
    return "unknown";
}

uint64_t LoadState::try_begin() {
    if (phase_ == LoadPhase::Loading) {
        return 0;
    }

    phase_ = LoadPhase::Loading;
    error_message_.clear();
    ticket_ = next_ticket_++;
    return ticket_;
}

bool LoadState::accepts(const uint64_t ticket) const {
    return phase_ == LoadPhase::Loading && ticket != 0 && ticket == ticket_;
}

bool LoadState::succeed(const uint64_t ticket) {
    if (!accepts(ticket)) return false;

    phase_ = LoadPhase::Idle;
    ticket_ = 0;
    return true;
}

bool LoadState::fail(const uint64_t ticket, std::string message) {
    if (!accepts(ticket)) return false;

    phase_ = LoadPhase::Error;
    error_message_ = std::move(message);
    ticket_ = 0;
    return true;
}

void LoadState::reset() {
    phase_ = LoadPhase::Idle;
    error_message_.clear();
    ticket_ = 0;
}

} // namespace lazylist
