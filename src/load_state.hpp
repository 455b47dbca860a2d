#pragma once

#include <cstdint>
#include <string>

namespace lazylist {

enum class LoadPhase {
    Idle,
    Loading,
    Error
};

[[nodiscard]] const char* load_phase_name(LoadPhase phase);

// Single-flight guard and pagination state machine.
//
//   Idle    --begin-->    Loading
//   Loading --succeed-->  Idle
//   Loading --fail-->     Error
//   Error   --begin-->    Loading   (retry or a fresh trigger)
//
// Every transition out of Loading carries the ticket returned by begin(), so
// a completion belonging to a superseded request is rejected.
class LoadState {
public:
    // Admission control: returns a non-zero ticket when a load may start,
    // 0 when one is already in flight.
    [[nodiscard]] uint64_t try_begin();

    // Settle the in-flight load. Return false if ticket is stale.
    bool succeed(uint64_t ticket);
    bool fail(uint64_t ticket, std::string message);

    // Back to Idle, invalidating any in-flight ticket
    void reset();

    [[nodiscard]] LoadPhase phase() const { return phase_; }
    [[nodiscard]] bool is_loading() const { return phase_ == LoadPhase::Loading; }
    [[nodiscard]] bool has_error() const { return phase_ == LoadPhase::Error; }
    [[nodiscard]] const std::string& error_message() const { return error_message_; }
    [[nodiscard]] uint64_t current_ticket() const { return ticket_; }

private:
    [[nodiscard]] bool accepts(uint64_t ticket) const;

    LoadPhase phase_ = LoadPhase::Idle;
    std::string error_message_;
    uint64_t ticket_ = 0;
    uint64_t next_ticket_ = 1;
};

} // namespace lazylist
