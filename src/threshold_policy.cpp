#include "threshold_policy.hpp"

#include <algorithm>

// ─────────────────────────────────────
ThresholdPolicy::ThresholdPolicy(const EnforcementConfig &config) : m_Config(config) {}

// ─────────────────────────────────────
int ThresholdPolicy::InterventionDuration(int n) const {
    int seconds = m_Config.interventionBaseSeconds + m_Config.interventionStepSeconds * (n - 1);
    return std::min(seconds, m_Config.interventionMaxSeconds);
}

// ─────────────────────────────────────
bool ThresholdPolicy::InterventionDue(double seconds, const RunState &run) const {
    double next = m_Config.interventionAt;
    if (run.interventionCount > 0) {
        next = std::max(next, run.lastInterventionAtSeconds + m_Config.interventionEvery);
    }
    return seconds >= next;
}

// ─────────────────────────────────────
PolicyDecision ThresholdPolicy::Evaluate(BlockKind kind, double seconds, const RunState &run,
                                         const Presentation &presentation) const {
    switch (kind) {
    case BLOCK_DEEP_WORK:
        return EvaluateDeepWork(seconds, run);
    case BLOCK_FOCUS_HOURS:
        return EvaluateFocusHours(seconds, run, presentation);
    case BLOCK_FREE_TIME:
        break;
    }
    return PolicyDecision{};
}

// ─────────────────────────────────────
PolicyDecision ThresholdPolicy::EvaluateDeepWork(double seconds, const RunState &run) const {
    PolicyDecision d;
    if (InterventionDue(seconds, run)) {
        d.action = ACTION_INTERVENTION;
        d.interventionSeconds = InterventionDuration(run.interventionCount + 1);
    } else if (seconds >= m_Config.deepWorkRedirectAt && !run.oneShotRedirectFired) {
        d.action = ACTION_REDIRECT;
    } else if (seconds >= m_Config.deepWorkNudgeAt && !run.nudgeShownForCurrentRun) {
        d.action = ACTION_NUDGE;
    }
    return d;
}

// ─────────────────────────────────────
PolicyDecision ThresholdPolicy::EvaluateFocusHours(double seconds, const RunState &run,
                                                   const Presentation &presentation) const {
    PolicyDecision d;
    if (InterventionDue(seconds, run)) {
        d.action = ACTION_INTERVENTION;
        d.interventionSeconds = InterventionDuration(run.interventionCount + 1);
        return d;
    }

    // Between interventions keep a level-2 nudge on screen whenever nothing else is.
    if (run.interventionCount > 0 && seconds >= m_Config.interventionAt &&
        !presentation.nudgeVisible && !presentation.interventionVisible) {
        d.action = ACTION_PERSISTENT_NUDGE;
        return d;
    }

    if (seconds >= m_Config.focusWarningAt && run.lastNudgeAtSeconds < m_Config.focusWarningAt) {
        d.action = ACTION_WARNING_NUDGE;
    } else if (seconds >= m_Config.focusGrayscaleAt && !run.grayscaleTriggeredThisBlock) {
        d.action = ACTION_GRAYSCALE;
    } else if (seconds >= m_Config.focusNudgeAt && seconds < m_Config.focusWarningAt &&
               (!run.nudgeShownForCurrentRun ||
                seconds >= run.lastNudgeAtSeconds + m_Config.focusNudgeEvery)) {
        d.action = ACTION_NUDGE;
    }
    return d;
}

// ─────────────────────────────────────
void ThresholdPolicy::Apply(const PolicyDecision &decision, double seconds,
                            const std::string &targetKey, RunState &run) const {
    switch (decision.action) {
    case ACTION_NONE:
        break;
    case ACTION_NUDGE:
    case ACTION_WARNING_NUDGE:
    case ACTION_PERSISTENT_NUDGE:
        run.nudgeShownForCurrentRun = true;
        run.lastNudgeAtSeconds = seconds;
        break;
    case ACTION_GRAYSCALE:
        run.grayscaleTriggeredThisBlock = true;
        break;
    case ACTION_REDIRECT:
        run.oneShotRedirectFired = true;
        run.grayscaleTriggeredThisBlock = true;
        run.redirectedTargets.insert(targetKey);
        break;
    case ACTION_INTERVENTION:
        run.interventionCount++;
        run.lastInterventionAtSeconds = seconds;
        break;
    }
}

// ─────────────────────────────────────
void ThresholdPolicy::Rearm(double seconds, RunState &run) const {
    if (seconds < m_Config.deepWorkRedirectAt) {
        run.oneShotRedirectFired = false;
    }
}

// ─────────────────────────────────────
const char *ThresholdPolicy::ActionName(PolicyAction action) {
    switch (action) {
    case ACTION_NONE:
        return "none";
    case ACTION_NUDGE:
        return "nudge";
    case ACTION_WARNING_NUDGE:
        return "warning";
    case ACTION_PERSISTENT_NUDGE:
        return "persistent_nudge";
    case ACTION_GRAYSCALE:
        return "grayscale";
    case ACTION_REDIRECT:
        return "redirect";
    case ACTION_INTERVENTION:
        return "intervention";
    }
    return "unknown";
}
