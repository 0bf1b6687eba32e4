#include <catch2/catch_test_macros.hpp>

#include "suppression_registry.hpp"

namespace suppression_registry_tests {

TEST_CASE("Approvals expire lazily", "[suppression]") {
    const TimePoint t0{std::chrono::hours(5)};
    SuppressionRegistry registry;
    registry.Approve("youtube.com", 180.0, t0);

    CHECK(registry.IsSuppressed("youtube.com", AddSeconds(t0, 179.0)));
    CHECK_FALSE(registry.IsSuppressed("youtube.com", AddSeconds(t0, 180.0)));
    CHECK_FALSE(registry.IsSuppressed("reddit.com", t0));
}

TEST_CASE("Session overrides last until cleared", "[suppression]") {
    const TimePoint t0{std::chrono::hours(5)};
    SuppressionRegistry registry;
    registry.SessionOverride("docs.rs");
    CHECK(registry.IsSuppressed("docs.rs", AddSeconds(t0, 100000.0)));
    CHECK(registry.HasSessionOverride("docs.rs"));

    registry.Clear();
    CHECK_FALSE(registry.IsSuppressed("docs.rs", t0));
}

TEST_CASE("Global snooze covers a window", "[suppression]") {
    const TimePoint t0{std::chrono::hours(5)};
    SuppressionRegistry registry;
    CHECK_FALSE(registry.IsSnoozed(t0));
    registry.SnoozeGlobal(300.0, t0);
    CHECK(registry.IsSnoozed(AddSeconds(t0, 299.0)));
    CHECK(registry.SnoozedUntil(t0));
    CHECK_FALSE(registry.IsSnoozed(AddSeconds(t0, 300.0)));
    CHECK_FALSE(registry.SnoozedUntil(AddSeconds(t0, 301.0)));
}

} // namespace suppression_registry_tests
