#include <catch2/catch_test_macros.hpp>

#include "justification.hpp"

namespace justification_tests {

TEST_CASE("Only the live ticket resolves", "[justification]") {
    JustificationProtocol protocol;
    const auto first = protocol.Submit("reddit.com", "r/cpp", "reading about modules", false, 1);
    const auto second = protocol.Submit("reddit.com", "r/cpp", "really, modules", false, 1);
    REQUIRE(first != second);
    CHECK(protocol.State() == JUSTIFY_SUBMITTED);

    CHECK_FALSE(protocol.Resolve(first, true, 1).has_value());
    CHECK(protocol.IsAwaiting());

    auto done = protocol.Resolve(second, true, 1);
    REQUIRE(done.has_value());
    CHECK(done->text == "really, modules");
    CHECK(protocol.State() == JUSTIFY_ACCEPTED);
    CHECK_FALSE(protocol.IsAwaiting());

    // A late duplicate of the same result changes nothing.
    CHECK_FALSE(protocol.Resolve(second, false, 1).has_value());
    CHECK(protocol.State() == JUSTIFY_ACCEPTED);
}

TEST_CASE("Results from a previous block are dropped", "[justification]") {
    JustificationProtocol protocol;
    const auto ticket = protocol.Submit("youtube.com", "Talk", "conference talk", false, 3);

    CHECK_FALSE(protocol.Resolve(ticket, true, 4).has_value());
    CHECK(protocol.State() == JUSTIFY_IDLE);
    CHECK_FALSE(protocol.IsAwaiting());
}

TEST_CASE("Cancel forgets the pending submission", "[justification]") {
    JustificationProtocol protocol;
    const auto ticket = protocol.Submit("x.com", "Thread", "release notes", false, 1);
    protocol.Cancel();
    CHECK(protocol.State() == JUSTIFY_IDLE);
    CHECK_FALSE(protocol.Resolve(ticket, true, 1).has_value());
}

TEST_CASE("Rescore description appends the user's reason", "[justification]") {
    CHECK(JustificationProtocol::RescoreDescription("", "need the API docs") ==
          "User's justification for this content: need the API docs");
    CHECK(JustificationProtocol::RescoreDescription("Write parser", "need the API docs") ==
          "Write parser\nUser's justification for this content: need the API docs");
}

TEST_CASE("Outcome depends on block kind", "[justification]") {
    SECTION("Deep Work acceptance is a short approval") {
        auto o = JustificationProtocol::Decide(BLOCK_DEEP_WORK, true, false, 180.0);
        CHECK(o.accepted);
        CHECK(o.approvalSeconds == 180.0);
        CHECK_FALSE(o.sessionOverride);
        CHECK_FALSE(o.approveTitleInScorer);
        CHECK(o.clearVisuals);
    }
    SECTION("Focus Hours acceptance lasts the session and teaches the scorer") {
        auto o = JustificationProtocol::Decide(BLOCK_FOCUS_HOURS, true, false, 180.0);
        CHECK(o.sessionOverride);
        CHECK(o.approveTitleInScorer);
        CHECK(o.approvalSeconds == 0.0);
    }
    SECTION("Deep Work rejection redirects browser tabs only") {
        auto tab = JustificationProtocol::Decide(BLOCK_DEEP_WORK, false, false, 180.0);
        CHECK(tab.showOverlay);
        CHECK(tab.redirectToBlockPage);

        auto app = JustificationProtocol::Decide(BLOCK_DEEP_WORK, false, true, 180.0);
        CHECK(app.showOverlay);
        CHECK_FALSE(app.redirectToBlockPage);
    }
    SECTION("Focus Hours rejection escalates the nudge") {
        auto o = JustificationProtocol::Decide(BLOCK_FOCUS_HOURS, false, false, 180.0);
        CHECK(o.persistentNudge);
        CHECK_FALSE(o.showOverlay);
    }
}

} // namespace justification_tests
