#include <catch2/catch_test_macros.hpp>

#include "heuristics.hpp"

namespace heuristics_tests {

ObservationTarget Tab(const std::string &host, const std::string &title) {
    return ObservationTarget{host, title, "https://" + host + "/", false};
}

TEST_CASE("Keyword overlap matches shared stems and skips stop words", "[heuristics]") {
    CHECK(OfflineHeuristics::HasKeywordOverlap("File my taxes", "Tax brackets 2026"));
    CHECK(OfflineHeuristics::HasKeywordOverlap("Rust parser", "Parsing in Rust - docs.rs"));
    CHECK_FALSE(OfflineHeuristics::HasKeywordOverlap("Working on the report", "Work from home tips"));
    CHECK_FALSE(OfflineHeuristics::HasKeywordOverlap("Go to gym", "Go tutorial"));

    auto words = OfflineHeuristics::ExtractKeywords("The NEW build-system, for CMake!");
    CHECK(words == std::vector<std::string>{"new", "build", "system", "cmake"});
}

TEST_CASE("Offline verdicts cover the obvious cases", "[heuristics]") {
    EnforcementConfig config;
    config.distractingTargets = {"news.ycombinator"};
    OfflineHeuristics h(config);

    ObservationTarget files{"org.gnome.Nautilus", "Files", "", true};
    auto allowed = h.Classify(files, "Quarterly report");
    REQUIRE(allowed);
    CHECK(allowed->relevant);

    auto hn = h.Classify(Tab("news.ycombinator.com", "Hacker News"), "Quarterly report");
    REQUIRE(hn);
    CHECK_FALSE(hn->relevant);

    auto yt = h.Classify(Tab("www.youtube.com", "Cat videos"), "Quarterly report");
    REQUIRE(yt);
    CHECK_FALSE(yt->relevant);
    CHECK(yt->reason == "Social media");

    // The task itself can name a social site.
    auto match = h.Classify(Tab("www.youtube.com", "Quarterly earnings call"), "Quarterly report");
    REQUIRE(match);
    CHECK(match->relevant);

    CHECK_FALSE(h.Classify(Tab("example.org", "Example Domain"), "Quarterly report"));
}

TEST_CASE("Social hosts match subdomains but not lookalikes", "[heuristics]") {
    EnforcementConfig config;
    OfflineHeuristics h(config);
    CHECK(h.IsSocialMedia("m.youtube.com"));
    CHECK(h.IsSocialMedia("WWW.Reddit.com"));
    CHECK_FALSE(h.IsSocialMedia("notyoutube.com"));
    CHECK_FALSE(h.IsSocialMedia("github.com"));
}

} // namespace heuristics_tests
