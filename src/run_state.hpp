#pragma once

#include <optional>
#include <set>
#include <string>

#include "common.hpp"

// Per-block run trackers. A fresh value replaces the old one whenever the current block
// changes; returning on-target only ends the current run.
struct RunState {
    bool nudgeShownForCurrentRun{false};
    double lastNudgeAtSeconds{0.0};
    int interventionCount{0};
    double lastInterventionAtSeconds{0.0};
    bool oneShotRedirectFired{false};
    bool grayscaleTriggeredThisBlock{false};
    std::set<std::string> redirectedTargets;
    std::set<std::string> warnedTargets;
    std::set<std::string> snoozedTargets;
    std::optional<TimePoint> lastOffTargetEndTime;

    void EndRun(TimePoint now) {
        nudgeShownForCurrentRun = false;
        lastOffTargetEndTime = now;
    }
};
