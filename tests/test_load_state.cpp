/**
 * Tests for LoadState (single-flight guard) and cancellation tokens.
 */

#include <catch2/catch.hpp>

#include "cancellation.hpp"
#include "load_state.hpp"
#include <memory>

using namespace lazylist;

TEST_CASE("Only one load is admitted at a time", "[load_state]") {
    LoadState state;
    CHECK(state.phase() == LoadPhase::Idle);

    const uint64_t ticket = state.try_begin();
    REQUIRE(ticket != 0);
    CHECK(state.is_loading());

    CHECK(state.try_begin() == 0);
    CHECK(state.try_begin() == 0);
    CHECK(state.current_ticket() == ticket);
}

TEST_CASE("Completions must carry the current ticket", "[load_state]") {
    LoadState state;
    const uint64_t ticket = state.try_begin();

    CHECK_FALSE(state.succeed(ticket + 1));
    CHECK_FALSE(state.succeed(0));
    CHECK(state.is_loading());

    CHECK(state.succeed(ticket));
    CHECK(state.phase() == LoadPhase::Idle);

    // Second completion of the same request is ignored
    CHECK_FALSE(state.succeed(ticket));
    CHECK_FALSE(state.fail(ticket, "late"));
    CHECK(state.phase() == LoadPhase::Idle);
}

TEST_CASE("Failure moves to Error and a new load clears it", "[load_state]") {
    LoadState state;
    const uint64_t first = state.try_begin();
    REQUIRE(state.fail(first, "timeout"));

    CHECK(state.has_error());
    CHECK(state.error_message() == "timeout");

    const uint64_t second = state.try_begin();
    REQUIRE(second != 0);
    CHECK(second != first);
    CHECK(state.is_loading());
    CHECK(state.error_message().empty());
}

TEST_CASE("Reset invalidates the ticket in flight", "[load_state]") {
    LoadState state;
    const uint64_t ticket = state.try_begin();
    state.reset();

    CHECK(state.phase() == LoadPhase::Idle);
    CHECK_FALSE(state.succeed(ticket));
    CHECK_FALSE(state.fail(ticket, "stale"));
    CHECK_FALSE(state.has_error());
}

TEST_CASE("Phase names", "[load_state]") {
    CHECK(std::string(load_phase_name(LoadPhase::Idle)) == "idle");
    CHECK(std::string(load_phase_name(LoadPhase::Loading)) == "loading");
    CHECK(std::string(load_phase_name(LoadPhase::Error)) == "error");
}

TEST_CASE("Cancellation tokens observe their source", "[cancellation]") {
    SECTION("a default token is cancelled") {
        const CancellationToken token;
        CHECK(token.is_cancelled());
    }

    SECTION("cancel() reaches tokens handed out earlier") {
        CancellationSource source;
        const CancellationToken token = source.token();
        CHECK_FALSE(token.is_cancelled());
        source.cancel();
        CHECK(token.is_cancelled());
        CHECK(source.is_cancelled());
    }

    SECTION("destroying the source cancels its tokens") {
        auto source = std::make_unique<CancellationSource>();
        const CancellationToken token = source->token();
        source.reset();
        CHECK(token.is_cancelled());
    }
}
