#include "enforcer.hpp"

#include <algorithm>
#include <cmath>

#include <spdlog/spdlog.h>

// ─────────────────────────────────────
FocusEnforcer::FocusEnforcer(const EnforcementConfig &config, ClockFn clock)
    : m_Config(config), m_Clock(std::move(clock)),
      m_Counter(m_Config.pollIntervalSeconds, m_Config.decayRatio), m_Policy(m_Config),
      m_Reconciler(m_Config), m_Lifecycle(m_Config.blockRituals), m_Heuristics(m_Config) {
    if (!m_Clock) {
        m_Clock = [] { return Clock::now(); };
    }
    m_BlockStartedAt = m_Clock();
}

// ─────────────────────────────────────
EnforcementMode FocusEnforcer::Mode() const {
    switch (m_Schedule) {
    case SCHEDULE_DISABLED:
    case SCHEDULE_SNOOZED:
        return MODE_NONE;
    case SCHEDULE_NO_PLAN:
        return MODE_NO_PLAN;
    case SCHEDULE_ACTIVE:
        break;
    }

    if (!m_Block) {
        return MODE_UNPLANNED;
    }
    if (!m_Lifecycle.IsEnforcing()) {
        return MODE_NONE;
    }
    switch (m_Block->kind) {
    case BLOCK_DEEP_WORK:
        return MODE_DEEP_WORK;
    case BLOCK_FOCUS_HOURS:
        return MODE_FOCUS_HOURS;
    case BLOCK_FREE_TIME:
        break;
    }
    return MODE_NONE;
}

// ─────────────────────────────────────
bool FocusEnforcer::IsWorkMode(EnforcementMode mode) const {
    return mode == MODE_DEEP_WORK || mode == MODE_FOCUS_HOURS;
}

// ─────────────────────────────────────
std::string FocusEnforcer::Intention() const {
    switch (Mode()) {
    case MODE_DEEP_WORK:
    case MODE_FOCUS_HOURS:
        return m_Block->title;
    case MODE_UNPLANNED:
        return "Unplanned time";
    case MODE_NO_PLAN:
        return "Plan your day";
    case MODE_NONE:
        break;
    }
    return m_Block ? m_Block->title : std::string{};
}

// ─────────────────────────────────────
int FocusEnforcer::UnplannedSnoozesLeft() const {
    return std::max(0, m_Config.unplannedSnoozesPerDay - m_UnplannedSnoozesUsed);
}

// ─────────────────────────────────────
void FocusEnforcer::CurrentTimeBlockChanged(const std::optional<TimeBlock> &block) {
    if (block && m_Block && block->id == m_Block->id) {
        // Same block, possibly edited.
        m_Block = block;
        return;
    }
    if (!block && !m_Block) {
        return;
    }

    spdlog::info("Current block: {} -> {}", m_Block ? m_Block->title : "(none)",
                 block ? block->title : "(none)");

    std::optional<TimeBlock> previous = m_Block;
    ResetBlockState();
    m_Block = block;
    m_BlockStartedAt = m_Clock();
    if (m_Scorer) {
        m_Scorer->ClearApprovals();
    }

    if (previous && m_Lifecycle.BlockEnded() && m_Lifecycle.State() == LIFECYCLE_CELEBRATING) {
        Command c;
        c.type = CMD_SHOW_BLOCK_CELEBRATION;
        c.title = previous->title;
        c.intention = previous->description;
        Publish(c);
    }
    if (block && m_Lifecycle.BlockStarted() && m_Lifecycle.State() == LIFECYCLE_RITUAL_PENDING) {
        Command c;
        c.type = CMD_SHOW_BLOCK_RITUAL;
        c.title = block->title;
        c.intention = block->description;
        Publish(c);
    }
    Reconcile();
}

// ─────────────────────────────────────
void FocusEnforcer::ResetBlockState() {
    m_Counter.Reset();
    m_Run = RunState{};
    m_Suppression.Clear();
    m_Grace.Cancel();
    m_Justification.Cancel();

    m_InRun = false;
    m_RunKey.clear();
    m_CurrentlyOffTarget = false;
    m_EnforcedKey.clear();
    m_LastRelevantUrl.clear();
    m_HasVerdict = false;
    m_SampledSinceTick = false;
    m_LastSampleAt.reset();

    ClearEnforcementVisuals();
    ++m_BlockGeneration;
}

// ─────────────────────────────────────
void FocusEnforcer::SetScheduleState(ScheduleState state) {
    if (state == m_Schedule) {
        return;
    }
    spdlog::info("Schedule state {} -> {}", ScheduleStateName(m_Schedule),
                 ScheduleStateName(state));
    m_Schedule = state;

    m_Grace.Cancel();
    m_EnforcedKey.clear();
    if (m_InRun) {
        EndRun(m_Clock());
    }
    m_CurrentlyOffTarget = false;
    ClearEnforcementVisuals();
    Reconcile();
}

// ─────────────────────────────────────
void FocusEnforcer::RitualCompleted() {
    if (m_Lifecycle.RitualCompleted()) {
        m_BlockStartedAt = m_Clock();
        Reconcile();
    }
}

// ─────────────────────────────────────
void FocusEnforcer::CelebrationDismissed() {
    if (!m_Lifecycle.CelebrationDismissed()) {
        return;
    }
    if (m_Block && m_Lifecycle.State() == LIFECYCLE_RITUAL_PENDING) {
        Command c;
        c.type = CMD_SHOW_BLOCK_RITUAL;
        c.title = m_Block->title;
        c.intention = m_Block->description;
        Publish(c);
    }
    m_BlockStartedAt = m_Clock();
    Reconcile();
}

// ─────────────────────────────────────
void FocusEnforcer::ResetDailyAllowances() {
    spdlog::info("Daily allowances reset");
    m_UnplannedSnoozesUsed = 0;
}

// ─────────────────────────────────────
void FocusEnforcer::FrontmostTargetChanged(const ObservationTarget &target) {
    if (m_Frontmost && m_Frontmost->key == target.key) {
        m_Frontmost->displayName = target.displayName;
        if (!target.url.empty()) {
            m_Frontmost->url = target.url;
        }
        return;
    }

    spdlog::debug("Frontmost target -> {} ({})", target.key, target.displayName);
    m_Frontmost = target;
    m_HasVerdict = false;

    m_Grace.CancelUnlessFor(target.key);
    if (!m_EnforcedKey.empty() && m_EnforcedKey != target.key) {
        DismissOverlay();
        m_EnforcedKey.clear();
    }
    Reconcile();
}

// ─────────────────────────────────────
bool FocusEnforcer::Observation(const ObservationTarget &target, const ScoreResult &verdict,
                                std::optional<std::uint64_t> blockGeneration) {
    if (blockGeneration && *blockGeneration != m_BlockGeneration) {
        spdlog::debug("Discarding verdict for {} scored against a previous block", target.key);
        return false;
    }
    if (m_Frontmost && m_Frontmost->key != target.key) {
        spdlog::debug("Discarding stale verdict for {} (frontmost is {})", target.key,
                      m_Frontmost->key);
        return false;
    }

    if (!m_Frontmost) {
        m_Frontmost = target;
    } else {
        m_Frontmost->displayName = target.displayName;
        if (!target.url.empty()) {
            m_Frontmost->url = target.url;
        }
    }

    m_HasVerdict = true;
    m_Verdict = verdict;

    const TimePoint now = m_Clock();
    std::string action = ApplySample(now);
    spdlog::debug("{} '{}': relevant={} ({}%) {} -> {} [{}s]", target.key, target.displayName,
                  verdict.relevant, verdict.confidence, verdict.reason, action,
                  m_Counter.Seconds());
    RecordAssessment(action);
    Reconcile();
    return true;
}

// ─────────────────────────────────────
void FocusEnforcer::ObservationUnavailable(const std::string &targetKey) {
    if (!m_Frontmost || m_Frontmost->key != targetKey) {
        return;
    }
    spdlog::debug("No readable info for {}, treating as a neutral tick", targetKey);
    m_HasVerdict = false;
    m_SampledSinceTick = true;
    m_CurrentlyOffTarget = false;
    Reconcile();
}

// ─────────────────────────────────────
void FocusEnforcer::ExtensionConnectionChanged(bool connected) {
    if (connected != m_ExtensionConnected) {
        spdlog::info("Browser extension {}", connected ? "connected" : "disconnected");
    }
    m_ExtensionConnected = connected;
}

// ─────────────────────────────────────
void FocusEnforcer::GrayscaleStateReported(bool active) {
    m_GrayscaleActive = active;
    if (!active) {
        m_GrayscaleIntensity = 0.0;
    }
    Reconcile();
}

// ─────────────────────────────────────
bool FocusEnforcer::TakeSampleSlot(TimePoint now) {
    if (m_LastSampleAt &&
        SecondsBetween(*m_LastSampleAt, now) < m_Config.pollIntervalSeconds - kSampleSlackSeconds) {
        return false;
    }
    m_LastSampleAt = now;
    m_SampledSinceTick = true;
    return true;
}

// ─────────────────────────────────────
std::string FocusEnforcer::ApplySample(TimePoint now) {
    const EnforcementMode mode = Mode();
    const ObservationTarget &t = *m_Frontmost;

    if (mode == MODE_NONE) {
        if (m_InRun) {
            EndRun(now);
        }
        m_CurrentlyOffTarget = false;
        return "none";
    }
    if (m_Verdict.relevant) {
        HandleOnTarget(TakeSampleSlot(now), now);
        return "none";
    }
    if (m_Suppression.IsSuppressed(t.key, now)) {
        spdlog::debug("{} is approved, not counting", t.key);
        m_CurrentlyOffTarget = false;
        m_Grace.CancelFor(t.key);
        return "suppressed";
    }
    if (mode == MODE_UNPLANNED || mode == MODE_NO_PLAN) {
        return HandleUnplannedOffTarget(now);
    }
    return HandleOffTarget(TakeSampleSlot(now), now);
}

// ─────────────────────────────────────
void FocusEnforcer::HandleOnTarget(bool counts, TimePoint now) {
    const ObservationTarget &t = *m_Frontmost;
    if (counts) {
        m_Counter.OnObservation(true);
        m_Policy.Rearm(m_Counter.Seconds(), m_Run);
    }

    if (!t.isNativeApp && !t.url.empty()) {
        m_LastRelevantUrl = t.url;
    }
    m_Grace.CancelFor(t.key);
    if (m_InRun) {
        EndRun(now);
    }
    if (m_EnforcedKey == t.key) {
        // Unplanned enforcement keeps no run; a relevant verdict still lifts its overlay.
        DismissOverlay();
        m_EnforcedKey.clear();
    }
    m_CurrentlyOffTarget = false;
}

// ─────────────────────────────────────
void FocusEnforcer::EndRun(TimePoint now) {
    spdlog::debug("Off-target run on {} ended", m_RunKey);
    m_Run.EndRun(now);
    m_InRun = false;
    m_RunKey.clear();
    if (!m_EnforcedKey.empty()) {
        DismissOverlay();
        m_EnforcedKey.clear();
    }
    DismissNudge();
    EndIntervention();
    SetTimerIndicator(false);
}

// ─────────────────────────────────────
std::string FocusEnforcer::HandleOffTarget(bool counts, TimePoint now) {
    const ObservationTarget t = *m_Frontmost;
    const BlockKind kind = m_Block->kind;

    // Verdicts arrive as often as the user switches; the counter moves once per interval.
    if (counts) {
        m_Counter.OnObservation(false);
    }

    const bool freshRun = !m_InRun;
    const bool arrival = freshRun || m_RunKey != t.key;
    if (arrival) {
        if (!freshRun && kind == BLOCK_DEEP_WORK) {
            // Deep Work nudges once per target.
            m_Run.nudgeShownForCurrentRun = false;
        }
        m_InRun = true;
        m_RunKey = t.key;
    }
    if (!m_CurrentlyOffTarget || freshRun) {
        m_CurrentlyOffTarget = true;
        BeginOffTargetExcursion(freshRun, now);
    }

    if (t.isNativeApp) {
        if (m_EnforcedKey == t.key) {
            return "enforced";
        }
        StartGrace(false, now);
        return "grace";
    }

    if (kind == BLOCK_DEEP_WORK && arrival && m_Run.redirectedTargets.count(t.key)) {
        const bool delegated = IsDelegated(t);
        spdlog::info("Back on redirected target {}, redirecting at once", t.key);
        if (!delegated) {
            Redirect(BackToWorkUrl());
        }
        m_Run.oneShotRedirectFired = true;
        m_Run.nudgeShownForCurrentRun = true;
        m_Run.grayscaleTriggeredThisBlock = true;
        SetGrayscale(true, 1.0);
        SetTimerIndicator(true);
        return delegated ? "delegated_redirect" : "redirect";
    }

    const Presentation presentation{m_NudgeVisible, m_InterventionVisible};
    const double seconds = m_Counter.Seconds();
    PolicyDecision decision = m_Policy.Evaluate(kind, seconds, m_Run, presentation);
    if (decision.action == ACTION_NONE) {
        return "none";
    }

    m_Policy.Apply(decision, seconds, t.key, m_Run);
    const bool delegated = IsDelegated(t);
    spdlog::info("{} at {}s on {}{}", ThresholdPolicy::ActionName(decision.action), seconds,
                 t.key, delegated ? " (popups left to the extension)" : "");
    ExecuteDecision(decision, delegated, now);

    std::string action = ThresholdPolicy::ActionName(decision.action);
    return delegated ? "delegated_" + action : action;
}

// ─────────────────────────────────────
std::string FocusEnforcer::HandleUnplannedOffTarget(TimePoint now) {
    const ObservationTarget &t = *m_Frontmost;
    if (m_Suppression.IsSnoozed(now)) {
        m_CurrentlyOffTarget = false;
        return "snoozed";
    }
    m_CurrentlyOffTarget = true;
    if (m_EnforcedKey == t.key) {
        return "enforced";
    }
    StartGrace(true, now);
    return "grace";
}

// ─────────────────────────────────────
void FocusEnforcer::BeginOffTargetExcursion(bool freshRun, TimePoint now) {
    if (!m_Run.grayscaleTriggeredThisBlock) {
        return;
    }

    const double recovery =
      freshRun ? m_Reconciler.RecoverySeconds(m_Run.lastOffTargetEndTime, now) : 0.0;
    if (m_Reconciler.RecoveryClearsTrigger(recovery)) {
        spdlog::info("Recovered for {:.0f}s, grayscale re-arms at its threshold", recovery);
        m_Run.grayscaleTriggeredThisBlock = false;
        return;
    }

    const double intensity = m_Reconciler.Intensity(recovery);
    spdlog::debug("Re-applying grayscale at {:.2f} after {:.0f}s on target", intensity, recovery);
    SetGrayscale(true, intensity);
}

// ─────────────────────────────────────
bool FocusEnforcer::IsDelegated(const ObservationTarget &target) const {
    return m_ExtensionConnected && !target.isNativeApp && m_Block &&
           m_Block->kind == BLOCK_DEEP_WORK && m_Heuristics.IsSocialMedia(target.key);
}

// ─────────────────────────────────────
void FocusEnforcer::ExecuteDecision(const PolicyDecision &decision, bool delegated,
                                    TimePoint now) {
    switch (decision.action) {
    case ACTION_NONE:
        break;
    case ACTION_NUDGE:
        if (!delegated) {
            ShowNudge(NUDGE_GENTLE, false, true, now);
        }
        SetTimerIndicator(true);
        break;
    case ACTION_WARNING_NUDGE:
        ShowNudge(NUDGE_ESCALATED, true, false, now);
        SetTimerIndicator(true);
        break;
    case ACTION_PERSISTENT_NUDGE:
        ShowNudge(NUDGE_ESCALATED, false, false, now);
        break;
    case ACTION_GRAYSCALE:
        SetGrayscale(true, 1.0);
        break;
    case ACTION_REDIRECT:
        if (!delegated) {
            Redirect(BackToWorkUrl());
        }
        SetGrayscale(true, 1.0);
        SetTimerIndicator(true);
        break;
    case ACTION_INTERVENTION:
        if (!delegated) {
            ShowIntervention(decision.interventionSeconds, now);
        }
        SetTimerIndicator(true);
        break;
    }
}

// ─────────────────────────────────────
void FocusEnforcer::StartGrace(bool isUnplanned, TimePoint now) {
    const ObservationTarget &t = *m_Frontmost;
    PendingGrace grace;
    grace.targetKey = t.key;
    grace.displayName = t.displayName;
    grace.reason = m_Verdict.reason;
    grace.isRevisit = m_Run.warnedTargets.count(t.key) > 0;
    grace.isUnplanned = isUnplanned;

    const bool deepWorkNative = Mode() == MODE_DEEP_WORK && t.isNativeApp;
    const double seconds =
      GraceScheduler::SelectDuration(m_Config, isUnplanned, deepWorkNative, grace.isRevisit);
    m_Grace.Start(std::move(grace), seconds, now);
}

// ─────────────────────────────────────
void FocusEnforcer::FireGrace(const PendingGrace &grace, TimePoint now) {
    const EnforcementMode mode = Mode();
    if (mode == MODE_NONE || !m_Frontmost || m_Frontmost->key != grace.targetKey) {
        spdlog::debug("Grace for {} expired but no longer applies", grace.targetKey);
        return;
    }
    if (m_HasVerdict && m_Verdict.relevant) {
        return;
    }
    if (m_Suppression.IsSuppressed(grace.targetKey, now) ||
        (grace.isUnplanned && m_Suppression.IsSnoozed(now))) {
        spdlog::debug("Grace for {} expired while suppressed", grace.targetKey);
        return;
    }

    spdlog::info("Grace expired for {}", grace.targetKey);
    m_Run.warnedTargets.insert(grace.targetKey);
    m_EnforcedKey = grace.targetKey;
    m_CurrentlyOffTarget = true;

    if (mode == MODE_FOCUS_HOURS) {
        ShowNudge(grace.isRevisit ? NUDGE_ESCALATED : NUDGE_GENTLE, false, true, now);
        RecordAssessment("nudge");
    } else {
        ShowOverlay(grace.reason, now);
        RecordAssessment("overlay");
    }
    if (IsWorkMode(mode)) {
        SetTimerIndicator(true);
    }
    Reconcile();
}

// ─────────────────────────────────────
void FocusEnforcer::PollTick() {
    ProcessDueEvents();
    const TimePoint now = m_Clock();

    if (m_SampledSinceTick) {
        m_SampledSinceTick = false;
    } else if (m_Frontmost && m_HasVerdict) {
        ApplySample(now);
    }
    Reconcile();
}

// ─────────────────────────────────────
void FocusEnforcer::ProcessDueEvents() {
    const TimePoint now = m_Clock();
    if (m_NudgeDismissAt && *m_NudgeDismissAt <= now) {
        DismissNudge();
    }
    if (m_InterventionEndsAt && *m_InterventionEndsAt <= now) {
        spdlog::debug("Intervention time is up");
        EndIntervention();
    }
    if (std::optional<PendingGrace> due = m_Grace.TakeDue(now)) {
        FireGrace(*due, now);
    }
}

// ─────────────────────────────────────
std::optional<TimePoint> FocusEnforcer::NextDeadline() const {
    std::optional<TimePoint> next = m_Grace.Deadline();
    for (const auto &at : {m_NudgeDismissAt, m_InterventionEndsAt}) {
        if (at && (!next || *at < *next)) {
            next = at;
        }
    }
    return next;
}

// ─────────────────────────────────────
bool FocusEnforcer::UserSubmittedJustification(const std::string &text) {
    const TimePoint now = m_Clock();
    if (!m_Frontmost) {
        spdlog::warn("Justification submitted with nothing frontmost");
        return false;
    }
    const EnforcementMode mode = Mode();
    if (mode == MODE_NONE) {
        spdlog::debug("Justification ignored, nothing is being enforced");
        return false;
    }

    DismissNudge();
    const ObservationTarget t = *m_Frontmost;

    if (!m_Block || !m_Scorer || !IsWorkMode(mode)) {
        spdlog::info("Cannot re-score justification for {}, rejecting", t.key);
        RejectJustification(t, now);
        RecordAssessment("rejected");
        Reconcile();
        return false;
    }

    const std::uint64_t ticket =
      m_Justification.Submit(t.key, t.displayName, text, t.isNativeApp, m_BlockGeneration);
    spdlog::info("Justification for {} submitted (ticket {})", t.key, ticket);

    ScoreRequest request;
    request.targetKey = t.key;
    request.title = t.displayName;
    request.intention = m_Block->title;
    request.description = JustificationProtocol::RescoreDescription(m_Block->description, text);
    request.isApplication = t.isNativeApp;
    m_Scorer->Score(request,
                    [this, ticket](const ScoreResult &result) { ResolveJustification(ticket, result); });
    return true;
}

// ─────────────────────────────────────
void FocusEnforcer::ResolveJustification(std::uint64_t ticket, const ScoreResult &result) {
    // A justification nobody could check is not accepted.
    const bool accepted = result.relevant && !result.unavailable;
    std::optional<PendingJustification> pending =
      m_Justification.Resolve(ticket, accepted, m_BlockGeneration);
    if (!pending || !m_Block) {
        return;
    }

    const TimePoint now = m_Clock();
    const bool stillFrontmost = m_Frontmost && m_Frontmost->key == pending->targetKey;
    JustificationOutcome o = JustificationProtocol::Decide(
      m_Block->kind, accepted, pending->isNativeApp, m_Config.deepWorkApprovalSeconds);

    if (!o.accepted) {
        if (!stillFrontmost) {
            spdlog::debug("Justification for {} rejected after the user moved on",
                          pending->targetKey);
            return;
        }
        spdlog::info("Justification for {} rejected: {}", pending->targetKey, result.reason);
        m_Verdict = result;
        m_Verdict.relevant = false;
        RejectJustification(*m_Frontmost, now);
        RecordAssessment("rejected");
        Reconcile();
        return;
    }

    spdlog::info("Justification for {} accepted: {}", pending->targetKey, result.reason);
    if (o.approvalSeconds > 0) {
        m_Suppression.Approve(pending->targetKey, o.approvalSeconds, now);
    }
    if (o.sessionOverride) {
        m_Suppression.SessionOverride(pending->targetKey);
    }
    if (o.approveTitleInScorer) {
        Command c;
        c.type = CMD_APPROVE_PAGE_TITLE;
        c.title = pending->title;
        c.intention = m_Block->title;
        Publish(c);
    }
    m_Grace.CancelFor(pending->targetKey);

    if (stillFrontmost && o.clearVisuals) {
        m_CurrentlyOffTarget = false;
        if (m_InRun) {
            EndRun(now);
        }
        if (m_EnforcedKey == pending->targetKey) {
            DismissOverlay();
            m_EnforcedKey.clear();
        }
        SetTimerIndicator(false);
        SetGrayscale(false, 0.0);
        m_Verdict = result;
        RecordAssessment("justified");
    }
    Reconcile();
}

// ─────────────────────────────────────
void FocusEnforcer::RejectJustification(const ObservationTarget &target, TimePoint now) {
    const BlockKind kind = m_Block ? m_Block->kind : BLOCK_DEEP_WORK;
    JustificationOutcome o = JustificationProtocol::Decide(kind, false, target.isNativeApp,
                                                           m_Config.deepWorkApprovalSeconds);

    if (o.showOverlay) {
        m_Grace.Cancel();
        m_Run.warnedTargets.insert(target.key);
        m_EnforcedKey = target.key;
        m_CurrentlyOffTarget = true;
        ShowOverlay("That doesn't look related to what you planned", now);
        if (IsWorkMode(Mode())) {
            SetTimerIndicator(true);
        }
    }
    if (o.redirectToBlockPage && m_Block) {
        Command c;
        c.type = CMD_REDIRECT_TO_BLOCK_PAGE;
        c.intention = m_Block->title;
        c.reason = m_Verdict.reason;
        Publish(c);
        m_Counter.Reset();
        m_Policy.Rearm(m_Counter.Seconds(), m_Run);
    }
    if (o.persistentNudge) {
        ShowNudge(NUDGE_ESCALATED, false, false, now);
    }
}

// ─────────────────────────────────────
void FocusEnforcer::UserDismissedNudge() {
    m_NudgeVisible = false;
    m_NudgeDismissAt.reset();
}

// ─────────────────────────────────────
bool FocusEnforcer::UserRequestedSnooze() {
    const TimePoint now = m_Clock();
    const EnforcementMode mode = Mode();

    if (mode == MODE_UNPLANNED || mode == MODE_NO_PLAN) {
        if (m_UnplannedSnoozesUsed >= m_Config.unplannedSnoozesPerDay) {
            spdlog::info("Snooze refused, today's allowance is used up");
            return false;
        }
        ++m_UnplannedSnoozesUsed;
        m_Suppression.SnoozeGlobal(m_Config.unplannedSnoozeSeconds, now);
        m_Grace.Cancel();
        m_EnforcedKey.clear();
        m_CurrentlyOffTarget = false;
        DismissOverlay();
        DismissNudge();
        return true;
    }

    if (!IsWorkMode(mode) || !m_Frontmost) {
        return false;
    }

    const std::string key = m_EnforcedKey.empty() ? m_Frontmost->key : m_EnforcedKey;
    if (m_Run.snoozedTargets.count(key)) {
        spdlog::info("Snooze refused, {} was already snoozed in this block", key);
        return false;
    }
    m_Run.snoozedTargets.insert(key);
    m_Suppression.Approve(key, m_Config.snoozeSeconds, now);
    m_Grace.CancelFor(key);
    m_EnforcedKey.clear();
    DismissOverlay();
    DismissNudge();
    if (m_Frontmost->key == key) {
        m_CurrentlyOffTarget = false;
        SetTimerIndicator(false);
    }
    Reconcile();
    return true;
}

// ─────────────────────────────────────
void FocusEnforcer::UserRequestedBackToWork() {
    DismissNudge();
    DismissOverlay();
    m_EnforcedKey.clear();
    m_Grace.Cancel();
    if (m_Frontmost && !m_Frontmost->isNativeApp) {
        Redirect(BackToWorkUrl());
    }
}

// ─────────────────────────────────────
void FocusEnforcer::UserCompletedIntervention() {
    EndIntervention();
}

// ─────────────────────────────────────
void FocusEnforcer::Reconcile() {
    const bool inWork = IsWorkMode(Mode());
    const bool shouldBeGray =
      Reconciler::ShouldBeGray(inWork, m_Run.grayscaleTriggeredThisBlock, m_CurrentlyOffTarget);
    if (m_GrayscaleActive && !shouldBeGray) {
        spdlog::debug("Grayscale active but not expected, restoring color");
        SetGrayscale(false, 0.0);
    }
    if (m_TimerDistracted && !inWork) {
        SetTimerIndicator(false);
    }
}

// ─────────────────────────────────────
void FocusEnforcer::ClearEnforcementVisuals() {
    DismissNudge();
    DismissOverlay();
    EndIntervention();
    SetTimerIndicator(false);
    SetGrayscale(false, 0.0);
}

// ─────────────────────────────────────
void FocusEnforcer::ShowNudge(NudgeLevel level, bool warning, bool autoDismiss, TimePoint now) {
    Command c;
    c.type = CMD_SHOW_NUDGE;
    c.level = level;
    c.warning = warning;
    c.autoDismiss = autoDismiss;
    c.distractionMinutes = static_cast<int>(m_Counter.Seconds() / 60.0);
    c.intention = Intention();
    c.displayName = m_Frontmost ? m_Frontmost->displayName : std::string{};
    Publish(c);

    m_NudgeVisible = true;
    if (autoDismiss) {
        m_NudgeDismissAt = AddSeconds(now, m_Config.nudgeAutoDismissSeconds);
    } else {
        m_NudgeDismissAt.reset();
    }
}

// ─────────────────────────────────────
void FocusEnforcer::DismissNudge() {
    if (!m_NudgeVisible) {
        return;
    }
    Command c;
    c.type = CMD_DISMISS_NUDGE;
    Publish(c);
    m_NudgeVisible = false;
    m_NudgeDismissAt.reset();
}

// ─────────────────────────────────────
void FocusEnforcer::ShowOverlay(const std::string &reason, TimePoint now) {
    const EnforcementMode mode = Mode();
    Command c;
    c.type = CMD_SHOW_OVERLAY;
    c.intention = Intention();
    c.reason = reason;
    c.focusDurationMinutes = FocusMinutes(now);
    c.isNoPlan = mode == MODE_UNPLANNED || mode == MODE_NO_PLAN;
    c.displayName = m_Frontmost ? m_Frontmost->displayName : std::string{};
    Publish(c);
    m_OverlayVisible = true;
}

// ─────────────────────────────────────
void FocusEnforcer::DismissOverlay() {
    if (!m_OverlayVisible) {
        return;
    }
    Command c;
    c.type = CMD_DISMISS_OVERLAY;
    Publish(c);
    m_OverlayVisible = false;
}

// ─────────────────────────────────────
void FocusEnforcer::ShowIntervention(int seconds, TimePoint now) {
    DismissNudge();
    Command c;
    c.type = CMD_SHOW_INTERVENTION;
    c.durationSeconds = seconds;
    c.intention = Intention();
    Publish(c);
    m_InterventionVisible = true;
    m_InterventionEndsAt = AddSeconds(now, seconds);
}

// ─────────────────────────────────────
void FocusEnforcer::EndIntervention() {
    m_InterventionVisible = false;
    m_InterventionEndsAt.reset();
}

// ─────────────────────────────────────
void FocusEnforcer::SetGrayscale(bool active, double intensity) {
    if (active) {
        if (m_GrayscaleActive && std::fabs(m_GrayscaleIntensity - intensity) < 1e-9) {
            return;
        }
    } else if (!m_GrayscaleActive) {
        return;
    }

    Command c;
    c.type = CMD_SET_GRAYSCALE;
    c.active = active;
    c.intensity = active ? intensity : 0.0;
    Publish(c);
    m_GrayscaleActive = active;
    m_GrayscaleIntensity = c.intensity;
}

// ─────────────────────────────────────
void FocusEnforcer::SetTimerIndicator(bool distracted) {
    if (distracted == m_TimerDistracted) {
        return;
    }
    Command c;
    c.type = CMD_SET_TIMER_INDICATOR;
    c.active = distracted;
    Publish(c);
    m_TimerDistracted = distracted;
}

// ─────────────────────────────────────
void FocusEnforcer::Redirect(const std::string &url) {
    Command c;
    c.type = CMD_REDIRECT_TO_URL;
    c.url = url;
    Publish(c);
}

// ─────────────────────────────────────
void FocusEnforcer::Publish(const Command &command) {
    m_Bus.Publish(command);
}

// ─────────────────────────────────────
std::string FocusEnforcer::BackToWorkUrl() const {
    return m_LastRelevantUrl.empty() ? m_Config.backToWorkFallbackUrl : m_LastRelevantUrl;
}

// ─────────────────────────────────────
int FocusEnforcer::FocusMinutes(TimePoint now) const {
    return static_cast<int>(std::max(0.0, SecondsBetween(m_BlockStartedAt, now)) / 60.0);
}

// ─────────────────────────────────────
void FocusEnforcer::RecordAssessment(const std::string &action) {
    if (!m_OnAssessment || !m_Frontmost) {
        return;
    }
    Assessment a;
    a.targetKey = m_Frontmost->key;
    a.title = m_Frontmost->displayName;
    a.intention = Intention();
    a.relevant = m_Verdict.relevant;
    a.confidence = m_Verdict.confidence;
    a.reason = m_Verdict.reason;
    a.action = action;
    m_OnAssessment(a);
}

// ─────────────────────────────────────
nlohmann::json FocusEnforcer::Snapshot() const {
    const TimePoint now = m_Clock();
    nlohmann::json j;
    j["mode"] = EnforcementModeName(Mode());
    j["schedule"] = ScheduleStateName(m_Schedule);
    j["lifecycle"] = BlockLifecycle::StateName(m_Lifecycle.State());
    j["intention"] = Intention();
    j["block_generation"] = m_BlockGeneration;

    if (m_Block) {
        j["block"] = {{"id", m_Block->id},
                      {"title", m_Block->title},
                      {"description", m_Block->description},
                      {"kind", BlockKindName(m_Block->kind)},
                      {"start_minute", m_Block->startMinute},
                      {"end_minute", m_Block->endMinute}};
    } else {
        j["block"] = nullptr;
    }

    if (m_Frontmost) {
        j["frontmost"] = {{"key", m_Frontmost->key},
                          {"title", m_Frontmost->displayName},
                          {"url", m_Frontmost->url},
                          {"native", m_Frontmost->isNativeApp}};
    } else {
        j["frontmost"] = nullptr;
    }
    if (m_HasVerdict) {
        j["verdict"] = {{"relevant", m_Verdict.relevant},
                        {"confidence", m_Verdict.confidence},
                        {"reason", m_Verdict.reason}};
    } else {
        j["verdict"] = nullptr;
    }

    j["distraction_seconds"] = m_Counter.Seconds();
    j["off_target"] = m_CurrentlyOffTarget;
    j["run"] = {{"nudge_shown", m_Run.nudgeShownForCurrentRun},
                {"last_nudge_at", m_Run.lastNudgeAtSeconds},
                {"interventions", m_Run.interventionCount},
                {"last_intervention_at", m_Run.lastInterventionAtSeconds},
                {"redirect_fired", m_Run.oneShotRedirectFired},
                {"grayscale_triggered", m_Run.grayscaleTriggeredThisBlock},
                {"redirected", m_Run.redirectedTargets},
                {"warned", m_Run.warnedTargets},
                {"snoozed", m_Run.snoozedTargets}};

    if (const auto &g = m_Grace.Pending()) {
        j["grace"] = {{"target", g->targetKey},
                      {"revisit", g->isRevisit},
                      {"seconds_left", std::max(0.0, SecondsBetween(now, g->deadline))}};
    } else {
        j["grace"] = nullptr;
    }

    j["snoozed"] = m_Suppression.IsSnoozed(now);
    j["unplanned_snoozes_left"] = UnplannedSnoozesLeft();
    j["extension_connected"] = m_ExtensionConnected;
    j["visible"] = {{"nudge", m_NudgeVisible},
                    {"overlay", m_OverlayVisible},
                    {"intervention", m_InterventionVisible},
                    {"grayscale", m_GrayscaleActive},
                    {"grayscale_intensity", m_GrayscaleIntensity},
                    {"distracted", m_TimerDistracted}};
    return j;
}
