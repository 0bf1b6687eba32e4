#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "enforcer_harness.hpp"

namespace enforcer_tests {

using namespace enforcer_harness;
using Catch::Matchers::WithinAbs;

const ObservationTarget kDocs = Site("docs.google.com", "Quarterly report draft");
const ObservationTarget kVideo = Site("youtube.com", "Funny cats compilation");
const ObservationTarget kForum = Site("forum.example.net", "Off topic thread");

TEST_CASE("Deep Work escalates nudge then redirect and redirects revisits at once",
          "[enforcer][deep-work]") {
    Harness h;
    h.StartBlock(BLOCK_DEEP_WORK);
    h.Step(kDocs, true);
    h.recorder.Clear();

    h.Step(kVideo, false);
    CHECK(h.E().DistractionSeconds() == 10.0);
    REQUIRE(h.recorder.Count(CMD_SHOW_NUDGE) == 1);
    CHECK(h.recorder.Count(CMD_REDIRECT_TO_URL) == 0);
    CHECK(h.E().IsTimerDistracted());

    h.Step(kVideo, false);
    CHECK(h.E().DistractionSeconds() == 20.0);
    REQUIRE(h.recorder.Count(CMD_REDIRECT_TO_URL) == 1);
    CHECK(h.recorder.Last(CMD_REDIRECT_TO_URL)->url == kDocs.url);
    CHECK(h.E().Run().redirectedTargets.count(kVideo.key) == 1);
    REQUIRE(h.recorder.Last(CMD_SET_GRAYSCALE));
    CHECK(h.recorder.Last(CMD_SET_GRAYSCALE)->active);

    for (int tick = 3; tick <= 10; ++tick) {
        h.Step(kVideo, false);
    }
    CHECK(h.E().DistractionSeconds() == 100.0);
    CHECK(h.recorder.Count(CMD_SHOW_NUDGE) == 1);
    CHECK(h.recorder.Count(CMD_REDIRECT_TO_URL) == 1);
    CHECK(h.recorder.Count(CMD_SHOW_INTERVENTION) == 0);

    // Back on the document for a moment, then straight back to the video.
    h.E().FrontmostTargetChanged(kDocs);
    h.E().Observation(kDocs, ScoreResult{true, 95, "Related"});
    CHECK(h.E().DistractionSeconds() >= 20.0);
    h.recorder.Clear();

    h.Step(kVideo, false);
    CHECK(h.recorder.Count(CMD_REDIRECT_TO_URL) == 1);
    CHECK(h.recorder.Count(CMD_SHOW_NUDGE) == 0);
}

TEST_CASE("Deep Work interventions repeat every 300s with growing length", "[enforcer][deep-work]") {
    Harness h;
    h.StartBlock(BLOCK_DEEP_WORK);

    std::vector<int> durations;
    h.E().Bus().Subscribe([&](const Command &c) {
        if (c.type == CMD_SHOW_INTERVENTION) {
            durations.push_back(c.durationSeconds);
        }
    });
    for (int tick = 1; tick <= 120; ++tick) {
        h.Step(kVideo, false);
        h.E().UserCompletedIntervention();
    }
    CHECK(durations == std::vector<int>{60, 90, 120, 120});
}

TEST_CASE("Focus Hours escalates through nudges, warning and interventions",
          "[enforcer][focus-hours]") {
    Harness h;
    h.StartBlock(BLOCK_FOCUS_HOURS);

    std::vector<double> nudgesAt;
    std::vector<double> warningsAt;
    std::vector<std::pair<double, int>> interventions;
    h.E().Bus().Subscribe([&](const Command &c) {
        const double s = h.E().DistractionSeconds();
        if (c.type == CMD_SHOW_NUDGE) {
            (c.warning ? warningsAt : nudgesAt).push_back(s);
        } else if (c.type == CMD_SHOW_INTERVENTION) {
            interventions.emplace_back(s, c.durationSeconds);
        }
    });

    for (int tick = 1; tick <= 30; ++tick) {
        h.Step(kForum, false);
    }
    CHECK(nudgesAt == std::vector<double>{10.0, 70.0, 130.0, 190.0});
    CHECK(warningsAt == std::vector<double>{240.0});
    REQUIRE(interventions.size() == 1);
    CHECK(interventions[0] == std::make_pair(300.0, 60));
    CHECK(h.recorder.Count(CMD_SET_GRAYSCALE) == 1);

    for (int tick = 31; tick <= 60; ++tick) {
        h.Step(kForum, false);
    }
    REQUIRE(interventions.size() == 2);
    CHECK(interventions[1] == std::make_pair(600.0, 90));
}

TEST_CASE("Focus Hours shows a persistent nudge once the intervention is done",
          "[enforcer][focus-hours]") {
    Harness h;
    h.StartBlock(BLOCK_FOCUS_HOURS);
    for (int tick = 1; tick <= 30; ++tick) {
        h.Step(kForum, false);
    }
    REQUIRE(h.E().IsInterventionVisible());
    h.E().UserCompletedIntervention();
    h.recorder.Clear();

    h.Step(kForum, false);
    REQUIRE(h.recorder.Count(CMD_SHOW_NUDGE) == 1);
    CHECK(h.recorder.Last(CMD_SHOW_NUDGE)->level == NUDGE_ESCALATED);
    CHECK(h.recorder.Last(CMD_SHOW_NUDGE)->distractionMinutes == 5);
    CHECK_FALSE(h.recorder.Last(CMD_SHOW_NUDGE)->autoDismiss);

    // Still on screen, so no stacking.
    h.Step(kForum, false);
    CHECK(h.recorder.Count(CMD_SHOW_NUDGE) == 1);

    h.E().UserDismissedNudge();
    h.Step(kForum, false);
    CHECK(h.recorder.Count(CMD_SHOW_NUDGE) == 2);
}

TEST_CASE("Interventions end on their own when their time is up", "[enforcer][intervention]") {
    Harness h;
    h.StartBlock(BLOCK_FOCUS_HOURS);
    for (int tick = 1; tick <= 30; ++tick) {
        h.Step(kForum, false);
    }
    REQUIRE(h.E().IsInterventionVisible());
    REQUIRE(h.E().NextDeadline());
    CHECK(*h.E().NextDeadline() <= AddSeconds(h.clock.now, 60.0));

    h.Wait(59.0);
    CHECK(h.E().IsInterventionVisible());
    h.Wait(1.0);
    CHECK_FALSE(h.E().IsInterventionVisible());
    h.recorder.Clear();

    h.Step(kForum, false);
    REQUIRE(h.recorder.Count(CMD_SHOW_NUDGE) == 1);
    CHECK(h.recorder.Last(CMD_SHOW_NUDGE)->level == NUDGE_ESCALATED);
}

TEST_CASE("Leaving the run or the block ends the intervention", "[enforcer][intervention]") {
    Harness h;
    h.StartBlock(BLOCK_FOCUS_HOURS, "b1");
    for (int tick = 1; tick <= 30; ++tick) {
        h.Step(kForum, false);
    }
    REQUIRE(h.E().IsInterventionVisible());

    SECTION("back on task") {
        h.Step(kDocs, true);
        CHECK_FALSE(h.E().IsInterventionVisible());

        h.recorder.Clear();
        for (int tick = 0; tick < 5; ++tick) {
            h.Step(kForum, false);
        }
        CHECK(h.recorder.Count(CMD_SHOW_NUDGE) >= 1);
    }
    SECTION("next block") {
        h.StartBlock(BLOCK_FOCUS_HOURS, "b2");
        CHECK_FALSE(h.E().IsInterventionVisible());
        CHECK_FALSE(h.E().NextDeadline());
    }
}

TEST_CASE("Changing block wipes all per-block state", "[enforcer][block]") {
    FakeScorer scorer;
    Harness h;
    h.E().SetScorer(&scorer);
    h.StartBlock(BLOCK_DEEP_WORK, "b1");
    for (int tick = 1; tick <= 35; ++tick) {
        h.Step(kVideo, false);
    }
    h.E().UserRequestedSnooze();
    REQUIRE(h.E().DistractionSeconds() > 0.0);
    REQUIRE(h.E().Run().interventionCount == 1);
    const int clearsBefore = scorer.clears;

    h.StartBlock(BLOCK_FOCUS_HOURS, "b2");

    const RunState &run = h.E().Run();
    CHECK(h.E().DistractionSeconds() == 0.0);
    CHECK_FALSE(run.nudgeShownForCurrentRun);
    CHECK(run.lastNudgeAtSeconds == 0.0);
    CHECK(run.interventionCount == 0);
    CHECK(run.lastInterventionAtSeconds == 0.0);
    CHECK_FALSE(run.oneShotRedirectFired);
    CHECK_FALSE(run.grayscaleTriggeredThisBlock);
    CHECK(run.redirectedTargets.empty());
    CHECK(run.warnedTargets.empty());
    CHECK(run.snoozedTargets.empty());
    CHECK_FALSE(run.lastOffTargetEndTime);
    CHECK_FALSE(h.E().Suppression().IsSuppressed(kVideo.key, h.clock.now));
    CHECK_FALSE(h.E().Grace().IsPending());
    CHECK_FALSE(h.E().IsGrayscaleActive());
    CHECK_FALSE(h.E().IsTimerDistracted());
    CHECK(scorer.clears == clearsBefore + 1);
}

TEST_CASE("Re-sending the current block keeps its state", "[enforcer][block]") {
    Harness h;
    h.StartBlock(BLOCK_DEEP_WORK, "b1");
    h.Step(kVideo, false);
    TimeBlock edited = MakeBlock("b1", BLOCK_DEEP_WORK, "Quarterly report v2");
    h.E().CurrentTimeBlockChanged(edited);
    CHECK(h.E().DistractionSeconds() == 10.0);
    CHECK(h.E().Intention() == "Quarterly report v2");
}

TEST_CASE("Approved targets do not advance the counter", "[enforcer][suppression]") {
    FakeScorer scorer;
    Harness h;
    h.E().SetScorer(&scorer);
    h.StartBlock(BLOCK_DEEP_WORK);
    h.Step(kVideo, false);
    REQUIRE(h.E().UserSubmittedJustification("Watching the earnings call recording"));
    scorer.Resolve(0, true);

    const double before = h.E().DistractionSeconds();
    for (int tick = 0; tick < 10; ++tick) {
        h.Step(kVideo, false);
        CHECK(h.E().DistractionSeconds() == before);
    }
    CHECK_FALSE(h.E().IsCurrentlyOffTarget());
}

TEST_CASE("Grayscale comes back at once on the next excursion", "[enforcer][grayscale]") {
    Harness h;
    h.StartBlock(BLOCK_FOCUS_HOURS);
    for (int tick = 1; tick <= 3; ++tick) {
        h.Step(kForum, false);
    }
    REQUIRE(h.E().Run().grayscaleTriggeredThisBlock);
    REQUIRE(h.E().IsGrayscaleActive());

    h.Step(kDocs, true);
    CHECK_FALSE(h.E().IsGrayscaleActive());
    h.recorder.Clear();

    h.clock.Advance(20.0);
    h.Observe(kForum, false);
    const Command *gray = h.recorder.Last(CMD_SET_GRAYSCALE);
    REQUIRE(gray);
    CHECK(gray->active);
    CHECK(gray->intensity == 1.0);
}

TEST_CASE("Grayscale re-trigger weakens with a longer recovery", "[enforcer][grayscale]") {
    Harness h;
    h.StartBlock(BLOCK_FOCUS_HOURS);
    for (int tick = 1; tick <= 3; ++tick) {
        h.Step(kForum, false);
    }
    h.Observe(kDocs, true);
    h.recorder.Clear();

    h.clock.Advance(120.0);
    h.Observe(kForum, false);
    const Command *gray = h.recorder.Last(CMD_SET_GRAYSCALE);
    REQUIRE(gray);
    CHECK_THAT(gray->intensity, WithinAbs(0.5, 1e-6));

    // A full recovery re-arms the grayscale row instead.
    h.Observe(kDocs, true);
    for (int tick = 0; tick < 6; ++tick) {
        h.Step(kDocs, true);
    }
    REQUIRE(h.E().DistractionSeconds() < 20.0);
    h.recorder.Clear();
    h.clock.Advance(160.0);
    h.Observe(kForum, false);
    CHECK(h.recorder.Count(CMD_SET_GRAYSCALE) == 0);
    CHECK_FALSE(h.E().Run().grayscaleTriggeredThisBlock);
}

TEST_CASE("Decay re-arms the Deep Work redirect for a new target", "[enforcer][deep-work]") {
    Harness h;
    h.StartBlock(BLOCK_DEEP_WORK);
    h.Step(kVideo, false);
    h.Step(kVideo, false);
    REQUIRE(h.E().Run().oneShotRedirectFired);

    h.Step(kDocs, true);
    CHECK(h.E().DistractionSeconds() == 15.0);
    CHECK_FALSE(h.E().Run().oneShotRedirectFired);
    h.recorder.Clear();

    h.Step(kForum, false);
    CHECK(h.recorder.Count(CMD_REDIRECT_TO_URL) == 1);
    CHECK(h.E().Run().redirectedTargets.count(kForum.key) == 1);
}

TEST_CASE("A burst of verdicts counts as one poll interval", "[enforcer][counter]") {
    Harness h;
    h.StartBlock(BLOCK_DEEP_WORK);
    const ObservationTarget reddit = Site("reddit.com", "Front page");

    h.Observe(kVideo, false);
    h.Observe(reddit, false);
    h.Observe(kVideo, false);
    CHECK(h.E().DistractionSeconds() == 10.0);
    CHECK(h.recorder.Count(CMD_REDIRECT_TO_URL) == 0);

    h.clock.Advance(4.0);
    h.Observe(reddit, false);
    h.E().PollTick();
    CHECK(h.E().DistractionSeconds() == 10.0);

    h.Step(kVideo, false);
    CHECK(h.E().DistractionSeconds() == 20.0);
    CHECK(h.recorder.Count(CMD_REDIRECT_TO_URL) == 1);

    // On-target flips are throttled the same way.
    h.Observe(kDocs, true);
    h.Observe(kVideo, false);
    h.Observe(kDocs, true);
    CHECK(h.E().DistractionSeconds() == 20.0);
}

TEST_CASE("Deep Work justification approves for a short while only", "[enforcer][justification]") {
    FakeScorer scorer;
    Harness h;
    h.E().SetScorer(&scorer);
    h.StartBlock(BLOCK_DEEP_WORK);
    h.Step(kVideo, false);
    REQUIRE(h.E().IsNudgeVisible());

    REQUIRE(h.E().UserSubmittedJustification("Conference talk on the report format"));
    CHECK_FALSE(h.E().IsNudgeVisible());
    REQUIRE(scorer.calls.size() == 1);
    CHECK(scorer.calls[0].request.description.find("Conference talk") != std::string::npos);
    CHECK(scorer.calls[0].request.intention == "Quarterly report");

    const TimePoint resolvedAt = h.clock.now;
    scorer.Resolve(0, true);
    CHECK(h.E().Suppression().IsSuppressed(kVideo.key, AddSeconds(resolvedAt, 179.0)));
    CHECK_FALSE(h.E().Suppression().IsSuppressed(kVideo.key, AddSeconds(resolvedAt, 180.0)));
    CHECK_FALSE(h.E().Suppression().HasSessionOverride(kVideo.key));
    CHECK(h.recorder.Count(CMD_APPROVE_PAGE_TITLE) == 0);
    CHECK(scorer.approved.empty());
    CHECK_FALSE(h.E().IsTimerDistracted());
    CHECK(h.E().Justification() == JUSTIFY_ACCEPTED);
}

TEST_CASE("Focus Hours justification allows the page for the whole block",
          "[enforcer][justification]") {
    FakeScorer scorer;
    Harness h;
    h.E().SetScorer(&scorer);
    h.StartBlock(BLOCK_FOCUS_HOURS);
    h.Step(kVideo, false);

    REQUIRE(h.E().UserSubmittedJustification("Reference material"));
    scorer.Resolve(0, true);

    CHECK(h.E().Suppression().HasSessionOverride(kVideo.key));
    CHECK(h.E().Suppression().IsSuppressed(kVideo.key, AddSeconds(h.clock.now, 3600.0)));
    const Command *approve = h.recorder.Last(CMD_APPROVE_PAGE_TITLE);
    REQUIRE(approve);
    CHECK(approve->title == kVideo.displayName);
    CHECK(approve->intention == "Quarterly report");
}

TEST_CASE("Rejected Deep Work justification blocks and resets the counter",
          "[enforcer][justification]") {
    FakeScorer scorer;
    Harness h;
    h.E().SetScorer(&scorer);
    h.StartBlock(BLOCK_DEEP_WORK);
    h.Step(kVideo, false);

    REQUIRE(h.E().UserSubmittedJustification("Just a quick break"));
    h.recorder.Clear();
    scorer.Resolve(0, false);

    CHECK(h.recorder.Count(CMD_SHOW_OVERLAY) == 1);
    CHECK(h.recorder.Count(CMD_REDIRECT_TO_BLOCK_PAGE) == 1);
    CHECK(h.E().DistractionSeconds() == 0.0);
    CHECK(h.E().IsOverlayVisible());
    CHECK_FALSE(h.E().Grace().IsPending());
}

TEST_CASE("Rejected Deep Work justification for an app does not redirect",
          "[enforcer][justification]") {
    FakeScorer scorer;
    Harness h;
    h.E().SetScorer(&scorer);
    h.StartBlock(BLOCK_DEEP_WORK);
    const ObservationTarget game = App("steam", "Steam");
    h.Step(game, false);
    REQUIRE(h.E().Grace().IsPending());

    REQUIRE(h.E().UserSubmittedJustification("Testing the build"));
    scorer.Resolve(0, false);
    CHECK(h.recorder.Count(CMD_SHOW_OVERLAY) == 1);
    CHECK(h.recorder.Count(CMD_REDIRECT_TO_BLOCK_PAGE) == 0);
    CHECK_FALSE(h.E().Grace().IsPending());
}

TEST_CASE("Rejected Focus Hours justification escalates the nudge", "[enforcer][justification]") {
    FakeScorer scorer;
    Harness h;
    h.E().SetScorer(&scorer);
    h.StartBlock(BLOCK_FOCUS_HOURS);
    for (int tick = 0; tick < 13; ++tick) {
        h.Step(kForum, false);
    }
    REQUIRE(h.E().UserSubmittedJustification("Research"));
    h.recorder.Clear();
    scorer.Resolve(0, false);

    const Command *nudge = h.recorder.Last(CMD_SHOW_NUDGE);
    REQUIRE(nudge);
    CHECK(nudge->level == NUDGE_ESCALATED);
    CHECK(nudge->distractionMinutes == 2);
    CHECK(h.recorder.Count(CMD_SHOW_OVERLAY) == 0);
}

TEST_CASE("Justification fails closed without a scorer", "[enforcer][justification]") {
    Harness h;
    h.StartBlock(BLOCK_DEEP_WORK);
    h.Step(kVideo, false);
    CHECK_FALSE(h.E().UserSubmittedJustification("Please"));
    CHECK(h.recorder.Count(CMD_SHOW_OVERLAY) == 1);
    CHECK_FALSE(h.E().Suppression().IsSuppressed(kVideo.key, h.clock.now));
}

TEST_CASE("Justification fails closed when the scorer is unreachable",
          "[enforcer][justification]") {
    FakeScorer scorer;
    Harness h;
    h.E().SetScorer(&scorer);

    SECTION("Deep Work") {
        h.StartBlock(BLOCK_DEEP_WORK);
        h.Step(kVideo, false);
        REQUIRE(h.E().UserSubmittedJustification("research"));
        h.recorder.Clear();
        scorer.ResolveUnavailable(0);

        CHECK_FALSE(h.E().Suppression().IsSuppressed(kVideo.key, h.clock.now));
        CHECK(h.recorder.Count(CMD_SHOW_OVERLAY) == 1);
        CHECK(h.E().Justification() == JUSTIFY_REJECTED);
    }
    SECTION("Focus Hours") {
        h.StartBlock(BLOCK_FOCUS_HOURS);
        h.Step(kVideo, false);
        REQUIRE(h.E().UserSubmittedJustification("research"));
        h.recorder.Clear();
        scorer.ResolveUnavailable(0);

        CHECK_FALSE(h.E().Suppression().HasSessionOverride(kVideo.key));
        CHECK(h.recorder.Count(CMD_APPROVE_PAGE_TITLE) == 0);
        REQUIRE(h.recorder.Last(CMD_SHOW_NUDGE));
        CHECK(h.recorder.Last(CMD_SHOW_NUDGE)->level == NUDGE_ESCALATED);
    }
}

TEST_CASE("An accepted justification ends the run and earns recovery",
          "[enforcer][justification][grayscale]") {
    FakeScorer scorer;
    Harness h;
    h.E().SetScorer(&scorer);
    h.StartBlock(BLOCK_DEEP_WORK);
    h.Step(kVideo, false);
    h.Step(kVideo, false);
    REQUIRE(h.E().Run().grayscaleTriggeredThisBlock);
    h.Step(kForum, false);

    REQUIRE(h.E().UserSubmittedJustification("Forum thread about the report template"));
    scorer.Resolve(0, true);
    REQUIRE(h.E().Run().lastOffTargetEndTime);
    CHECK(*h.E().Run().lastOffTargetEndTime == h.clock.now);
    CHECK_FALSE(h.E().IsGrayscaleActive());
    h.recorder.Clear();

    // The approval runs out after 180s; by then the recovery window has fully passed.
    h.Wait(190.0);
    h.Step(kForum, false);
    CHECK(h.E().IsCurrentlyOffTarget());
    CHECK(h.recorder.Count(CMD_SET_GRAYSCALE) == 0);
    CHECK_FALSE(h.E().Run().grayscaleTriggeredThisBlock);
}

TEST_CASE("Late justification results are ignored", "[enforcer][justification][stale]") {
    FakeScorer scorer;
    Harness h;
    h.E().SetScorer(&scorer);
    h.StartBlock(BLOCK_DEEP_WORK, "b1");
    h.Step(kVideo, false);
    REQUIRE(h.E().UserSubmittedJustification("Needed"));

    h.StartBlock(BLOCK_DEEP_WORK, "b2");
    h.recorder.Clear();
    scorer.Resolve(0, true);
    CHECK_FALSE(h.E().Suppression().IsSuppressed(kVideo.key, h.clock.now));
    CHECK(h.recorder.commands.empty());

    // A rejection after the user moved on does nothing either.
    h.Step(kVideo, false);
    REQUIRE(h.E().UserSubmittedJustification("Needed"));
    h.Step(kDocs, true);
    h.recorder.Clear();
    scorer.Resolve(1, false);
    CHECK(h.recorder.Count(CMD_SHOW_OVERLAY) == 0);
}

TEST_CASE("Verdicts for a target that is no longer frontmost are dropped",
          "[enforcer][stale]") {
    Harness h;
    h.StartBlock(BLOCK_DEEP_WORK);
    h.Step(kVideo, false);
    const double seconds = h.E().DistractionSeconds();
    const bool nudged = h.E().Run().nudgeShownForCurrentRun;

    h.E().FrontmostTargetChanged(kDocs);
    CHECK_FALSE(h.E().Observation(kVideo, ScoreResult{false, 90, "Unrelated"}));
    CHECK(h.E().DistractionSeconds() == seconds);
    CHECK(h.E().Run().nudgeShownForCurrentRun == nudged);

    const std::uint64_t oldGeneration = h.E().BlockGeneration();
    h.StartBlock(BLOCK_DEEP_WORK, "b2");
    h.E().FrontmostTargetChanged(kVideo);
    CHECK_FALSE(h.E().Observation(kVideo, ScoreResult{false, 90, "Unrelated"}, oldGeneration));
    CHECK(h.E().DistractionSeconds() == 0.0);
}

TEST_CASE("Native apps get a grace period before the overlay", "[enforcer][grace]") {
    Harness h;
    h.StartBlock(BLOCK_DEEP_WORK);
    const ObservationTarget game = App("steam", "Steam");
    h.Observe(game, false);
    REQUIRE(h.E().Grace().IsPendingFor("steam"));
    REQUIRE(h.E().NextDeadline());

    h.Wait(4.0);
    CHECK(h.recorder.Count(CMD_SHOW_OVERLAY) == 0);
    // Repeat observations while pending do not restart the clock.
    h.Observe(game, false);
    h.Wait(1.0);
    REQUIRE(h.recorder.Count(CMD_SHOW_OVERLAY) == 1);
    CHECK_FALSE(h.recorder.Last(CMD_SHOW_OVERLAY)->isNoPlan);
    CHECK(h.E().Run().warnedTargets.count("steam") == 1);
    CHECK(h.E().IsCurrentlyOffTarget());

    // Still there: no second overlay.
    h.Step(game, false);
    h.Wait(60.0);
    CHECK(h.recorder.Count(CMD_SHOW_OVERLAY) == 1);
}

TEST_CASE("Focus Hours apps get a nudge, with a shorter grace on revisits", "[enforcer][grace]") {
    Harness h;
    h.StartBlock(BLOCK_FOCUS_HOURS);
    const ObservationTarget chat = App("discord", "Discord");
    h.Observe(chat, false);
    h.Wait(29.0);
    CHECK(h.recorder.Count(CMD_SHOW_NUDGE) == 0);
    h.Wait(1.0);
    CHECK(h.recorder.Count(CMD_SHOW_NUDGE) == 1);

    h.Observe(App("code", "Editor"), true);
    h.recorder.Clear();
    h.Observe(chat, false);
    h.Wait(15.0);
    REQUIRE(h.recorder.Count(CMD_SHOW_NUDGE) == 1);
    CHECK(h.recorder.Last(CMD_SHOW_NUDGE)->level == NUDGE_ESCALATED);
}

TEST_CASE("Switching apps supersedes the pending grace", "[enforcer][grace]") {
    Harness h;
    h.StartBlock(BLOCK_FOCUS_HOURS);
    h.Observe(App("discord"), false);
    h.Wait(20.0);
    h.Observe(App("steam"), false);
    h.Wait(15.0);
    CHECK(h.recorder.Count(CMD_SHOW_NUDGE) == 0);
    REQUIRE(h.E().Grace().IsPendingFor("steam"));
    h.Wait(15.0);
    CHECK(h.recorder.Count(CMD_SHOW_NUDGE) == 1);
    CHECK(h.E().Run().warnedTargets.count("discord") == 0);
    CHECK(h.E().Run().warnedTargets.count("steam") == 1);
}

TEST_CASE("Unplanned time blocks after a short grace and allows one snooze a day",
          "[enforcer][unplanned]") {
    Harness h;
    REQUIRE(h.E().Mode() == MODE_UNPLANNED);
    h.Observe(kVideo, false);
    h.Wait(5.0);
    REQUIRE(h.recorder.Count(CMD_SHOW_OVERLAY) == 1);
    CHECK(h.recorder.Last(CMD_SHOW_OVERLAY)->isNoPlan);
    CHECK(h.E().DistractionSeconds() == 0.0);

    CHECK(h.E().UserRequestedSnooze());
    CHECK_FALSE(h.E().IsOverlayVisible());
    h.Step(kVideo, false);
    h.Wait(10.0);
    CHECK(h.recorder.Count(CMD_SHOW_OVERLAY) == 1);

    h.clock.Advance(300.0);
    h.Step(kVideo, false);
    h.Wait(5.0);
    CHECK(h.recorder.Count(CMD_SHOW_OVERLAY) == 2);
    CHECK_FALSE(h.E().UserRequestedSnooze());

    h.E().ResetDailyAllowances();
    CHECK(h.E().UserRequestedSnooze());
}

TEST_CASE("A relevant verdict lifts the unplanned overlay", "[enforcer][unplanned]") {
    Harness h;
    h.Observe(kVideo, false);
    h.Wait(5.0);
    REQUIRE(h.E().IsOverlayVisible());

    h.clock.Advance(10.0);
    h.Observe(kVideo, true);
    CHECK_FALSE(h.E().IsOverlayVisible());
    CHECK(h.recorder.Count(CMD_DISMISS_OVERLAY) == 1);
    CHECK_FALSE(h.E().IsCurrentlyOffTarget());

    // Enforcement starts over with a fresh grace.
    h.clock.Advance(10.0);
    h.Observe(kVideo, false);
    CHECK(h.E().Grace().IsPendingFor(kVideo.key));
}

TEST_CASE("Work-block snooze covers one target once per block", "[enforcer][snooze]") {
    Harness h;
    h.StartBlock(BLOCK_DEEP_WORK);
    h.Step(kVideo, false);
    REQUIRE(h.E().UserRequestedSnooze());
    CHECK(h.E().Suppression().IsSuppressed(kVideo.key, AddSeconds(h.clock.now, 299.0)));
    CHECK_FALSE(h.E().IsNudgeVisible());
    CHECK_FALSE(h.E().UserRequestedSnooze());
}

TEST_CASE("Free time, disabled days and pending rituals do not enforce", "[enforcer][mode]") {
    SECTION("free time") {
        Harness h;
        h.StartBlock(BLOCK_FREE_TIME);
        for (int tick = 0; tick < 40; ++tick) {
            h.Step(kVideo, false);
        }
        CHECK(h.E().Mode() == MODE_NONE);
        CHECK(h.recorder.commands.empty());
    }
    SECTION("disabled") {
        Harness h;
        h.StartBlock(BLOCK_DEEP_WORK);
        h.E().SetScheduleState(SCHEDULE_DISABLED);
        for (int tick = 0; tick < 40; ++tick) {
            h.Step(kVideo, false);
        }
        CHECK(h.E().DistractionSeconds() == 0.0);
        CHECK(h.recorder.Count(CMD_SHOW_NUDGE) == 0);
    }
    SECTION("ritual") {
        EnforcementConfig config;
        config.blockRituals = true;
        Harness h(config);
        h.StartBlock(BLOCK_DEEP_WORK);
        CHECK(h.recorder.Count(CMD_SHOW_BLOCK_RITUAL) == 1);
        h.Step(kVideo, false);
        CHECK(h.recorder.Count(CMD_SHOW_NUDGE) == 0);

        h.E().RitualCompleted();
        h.Step(kVideo, false);
        CHECK(h.recorder.Count(CMD_SHOW_NUDGE) == 1);

        h.E().CurrentTimeBlockChanged(std::nullopt);
        CHECK(h.recorder.Count(CMD_SHOW_BLOCK_CELEBRATION) == 1);
        CHECK(h.E().Lifecycle() == LIFECYCLE_CELEBRATING);
    }
}

TEST_CASE("Back to work returns the tab to the last relevant page", "[enforcer][back-to-work]") {
    Harness h;
    h.StartBlock(BLOCK_DEEP_WORK);
    h.Step(kVideo, false);
    h.E().UserRequestedBackToWork();
    REQUIRE(h.recorder.Last(CMD_REDIRECT_TO_URL));
    CHECK(h.recorder.Last(CMD_REDIRECT_TO_URL)->url == "https://www.google.com");
    CHECK_FALSE(h.E().IsNudgeVisible());

    h.Step(kDocs, true);
    h.Step(kVideo, false);
    h.E().UserRequestedBackToWork();
    CHECK(h.recorder.Last(CMD_REDIRECT_TO_URL)->url == kDocs.url);
}

TEST_CASE("Nudges dismiss themselves after a few seconds", "[enforcer][nudge]") {
    Harness h;
    h.StartBlock(BLOCK_DEEP_WORK);
    h.Step(kVideo, false);
    REQUIRE(h.E().IsNudgeVisible());
    h.Wait(9.0);
    CHECK(h.E().IsNudgeVisible());
    h.Wait(1.0);
    CHECK_FALSE(h.E().IsNudgeVisible());
    CHECK(h.recorder.Count(CMD_DISMISS_NUDGE) == 1);
}

TEST_CASE("Social sites with the extension connected keep only core visuals",
          "[enforcer][extension]") {
    Harness h;
    h.StartBlock(BLOCK_DEEP_WORK);
    h.E().ExtensionConnectionChanged(true);
    for (int tick = 1; tick <= 30; ++tick) {
        h.Step(kVideo, false);
    }
    CHECK(h.recorder.Count(CMD_SHOW_NUDGE) == 0);
    CHECK(h.recorder.Count(CMD_REDIRECT_TO_URL) == 0);
    CHECK(h.recorder.Count(CMD_SHOW_INTERVENTION) == 0);
    CHECK(h.E().IsGrayscaleActive());
    CHECK(h.E().IsTimerDistracted());
    CHECK(h.E().Run().oneShotRedirectFired);
    CHECK(h.E().Run().interventionCount == 1);

    // Non-social sites are still handled here.
    h.Step(kForum, false);
    CHECK(h.recorder.Count(CMD_SHOW_NUDGE) == 1);
}

TEST_CASE("Reported grayscale is corrected when it should be off", "[enforcer][reconciler]") {
    Harness h;
    h.StartBlock(BLOCK_DEEP_WORK);
    h.Step(kDocs, true);
    h.recorder.Clear();
    h.E().GrayscaleStateReported(true);
    REQUIRE(h.recorder.Count(CMD_SET_GRAYSCALE) == 1);
    CHECK_FALSE(h.recorder.Last(CMD_SET_GRAYSCALE)->active);
    CHECK_FALSE(h.E().IsGrayscaleActive());
}

TEST_CASE("Every applied verdict is handed to the assessment log", "[enforcer][assessment]") {
    Harness h;
    std::vector<Assessment> log;
    h.E().SetAssessmentHandler([&](const Assessment &a) { log.push_back(a); });
    h.StartBlock(BLOCK_DEEP_WORK);
    h.Step(kDocs, true);
    h.Step(kVideo, false);
    h.E().FrontmostTargetChanged(kDocs);
    h.E().Observation(kVideo, ScoreResult{false, 90, "Unrelated"});

    REQUIRE(log.size() == 2);
    CHECK(log[0].relevant);
    CHECK(log[0].action == "none");
    CHECK(log[1].targetKey == kVideo.key);
    CHECK(log[1].intention == "Quarterly report");
    CHECK(log[1].action == "nudge");
}

} // namespace enforcer_tests
