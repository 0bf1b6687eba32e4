#pragma once

#include "common.hpp"
#include "config.hpp"
#include "run_state.hpp"

enum PolicyAction {
    ACTION_NONE,
    ACTION_NUDGE,
    ACTION_WARNING_NUDGE,
    ACTION_PERSISTENT_NUDGE,
    ACTION_GRAYSCALE,
    ACTION_REDIRECT,
    ACTION_INTERVENTION
};

struct PolicyDecision {
    PolicyAction action{ACTION_NONE};
    int interventionSeconds{0};
};

// What the user can currently see; the Focus Hours persistent nudge waits for an empty screen.
struct Presentation {
    bool nudgeVisible{false};
    bool interventionVisible{false};
};

class ThresholdPolicy {
  public:
    explicit ThresholdPolicy(const EnforcementConfig &config);

    // Tables are walked from the highest threshold down; the first due row wins.
    PolicyDecision Evaluate(BlockKind kind, double seconds, const RunState &run,
                            const Presentation &presentation) const;

    // Records a fired decision in the run trackers.
    void Apply(const PolicyDecision &decision, double seconds, const std::string &targetKey,
               RunState &run) const;

    // One-shot rows re-arm once the counter decays below their threshold.
    void Rearm(double seconds, RunState &run) const;

    int InterventionDuration(int n) const;
    static const char *ActionName(PolicyAction action);

  private:
    bool InterventionDue(double seconds, const RunState &run) const;
    PolicyDecision EvaluateDeepWork(double seconds, const RunState &run) const;
    PolicyDecision EvaluateFocusHours(double seconds, const RunState &run,
                                      const Presentation &presentation) const;

  private:
    const EnforcementConfig &m_Config;
};
