#include <catch2/catch_test_macros.hpp>

#include "grace_scheduler.hpp"

namespace grace_scheduler_tests {

PendingGrace For(const std::string &key) {
    PendingGrace g;
    g.targetKey = key;
    g.displayName = key;
    return g;
}

TimePoint T0() {
    return TimePoint{std::chrono::hours(10)};
}

TEST_CASE("A second start for the same target keeps the original deadline", "[grace]") {
    GraceScheduler grace;
    CHECK(grace.Start(For("slack"), 30.0, T0()) == GRACE_STARTED);
    CHECK(grace.Start(For("slack"), 30.0, AddSeconds(T0(), 20.0)) == GRACE_COALESCED);

    CHECK_FALSE(grace.TakeDue(AddSeconds(T0(), 29.0)));
    std::optional<PendingGrace> fired = grace.TakeDue(AddSeconds(T0(), 30.0));
    REQUIRE(fired);
    CHECK(fired->targetKey == "slack");

    // Fired exactly once.
    CHECK_FALSE(grace.TakeDue(AddSeconds(T0(), 60.0)));
    CHECK_FALSE(grace.IsPending());
}

TEST_CASE("Starting grace for another target supersedes the pending one", "[grace]") {
    GraceScheduler grace;
    grace.Start(For("slack"), 30.0, T0());
    CHECK(grace.Start(For("discord"), 30.0, AddSeconds(T0(), 10.0)) == GRACE_SUPERSEDED);

    CHECK_FALSE(grace.TakeDue(AddSeconds(T0(), 30.0)));
    std::optional<PendingGrace> fired = grace.TakeDue(AddSeconds(T0(), 40.0));
    REQUIRE(fired);
    CHECK(fired->targetKey == "discord");
    CHECK_FALSE(grace.TakeDue(AddSeconds(T0(), 100.0)));
}

TEST_CASE("Cancelling only touches the named target", "[grace]") {
    GraceScheduler grace;
    grace.Start(For("slack"), 30.0, T0());
    CHECK_FALSE(grace.CancelFor("discord"));
    CHECK(grace.IsPendingFor("slack"));
    CHECK_FALSE(grace.CancelUnlessFor("slack"));
    CHECK(grace.CancelUnlessFor("discord"));
    CHECK_FALSE(grace.IsPending());
    CHECK_FALSE(grace.Deadline());
}

TEST_CASE("Grace duration follows the first matching rule", "[grace]") {
    EnforcementConfig config;
    CHECK(GraceScheduler::SelectDuration(config, true, true, true) == 5.0);
    CHECK(GraceScheduler::SelectDuration(config, false, true, true) == 5.0);
    CHECK(GraceScheduler::SelectDuration(config, false, false, true) == 15.0);
    CHECK(GraceScheduler::SelectDuration(config, false, false, false) == 30.0);
}

} // namespace grace_scheduler_tests
