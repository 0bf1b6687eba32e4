#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "block_lifecycle.hpp"
#include "commands.hpp"
#include "common.hpp"
#include "config.hpp"
#include "distraction_counter.hpp"
#include "grace_scheduler.hpp"
#include "heuristics.hpp"
#include "justification.hpp"
#include "reconciler.hpp"
#include "relevance_scorer.hpp"
#include "run_state.hpp"
#include "suppression_registry.hpp"
#include "threshold_policy.hpp"

// Distraction tracking and escalation for the current block. Not thread safe: every call,
// including scorer callbacks, must happen on the owner thread.
class FocusEnforcer {
  public:
    using ClockFn = std::function<TimePoint()>;
    using AssessmentHandler = std::function<void(const Assessment &)>;

    FocusEnforcer(const EnforcementConfig &config, ClockFn clock);

    CommandBus &Bus() { return m_Bus; }
    void SetScorer(RelevanceScorer *scorer) { m_Scorer = scorer; }
    void SetAssessmentHandler(AssessmentHandler handler) { m_OnAssessment = std::move(handler); }

    // Schedule
    void CurrentTimeBlockChanged(const std::optional<TimeBlock> &block);
    void SetScheduleState(ScheduleState state);
    void RitualCompleted();
    void CelebrationDismissed();
    void ResetDailyAllowances();

    // Observations
    void FrontmostTargetChanged(const ObservationTarget &target);
    bool Observation(const ObservationTarget &target, const ScoreResult &verdict,
                     std::optional<std::uint64_t> blockGeneration = std::nullopt);
    void ObservationUnavailable(const std::string &targetKey);
    void ExtensionConnectionChanged(bool connected);
    void GrayscaleStateReported(bool active);

    // Clock
    void PollTick();
    void ProcessDueEvents();
    std::optional<TimePoint> NextDeadline() const;

    // User
    bool UserSubmittedJustification(const std::string &text);
    void UserDismissedNudge();
    bool UserRequestedSnooze();
    void UserRequestedBackToWork();
    void UserCompletedIntervention();

    // State
    EnforcementMode Mode() const;
    std::string Intention() const;
    std::uint64_t BlockGeneration() const { return m_BlockGeneration; }
    double DistractionSeconds() const { return m_Counter.Seconds(); }
    const RunState &Run() const { return m_Run; }
    const SuppressionRegistry &Suppression() const { return m_Suppression; }
    const GraceScheduler &Grace() const { return m_Grace; }
    LifecycleState Lifecycle() const { return m_Lifecycle.State(); }
    JustificationState Justification() const { return m_Justification.State(); }
    const std::optional<TimeBlock> &CurrentBlock() const { return m_Block; }
    const std::optional<ObservationTarget> &Frontmost() const { return m_Frontmost; }
    bool IsCurrentlyOffTarget() const { return m_CurrentlyOffTarget; }
    bool IsGrayscaleActive() const { return m_GrayscaleActive; }
    bool IsNudgeVisible() const { return m_NudgeVisible; }
    bool IsOverlayVisible() const { return m_OverlayVisible; }
    bool IsInterventionVisible() const { return m_InterventionVisible; }
    bool IsTimerDistracted() const { return m_TimerDistracted; }
    int UnplannedSnoozesLeft() const;
    nlohmann::json Snapshot() const;

  private:
    // Per-block reset
    void ResetBlockState();

    // Sampling
    std::string ApplySample(TimePoint now);
    bool TakeSampleSlot(TimePoint now);
    void HandleOnTarget(bool counts, TimePoint now);
    std::string HandleOffTarget(bool counts, TimePoint now);
    std::string HandleUnplannedOffTarget(TimePoint now);
    void BeginOffTargetExcursion(bool freshRun, TimePoint now);
    void EndRun(TimePoint now);
    void ExecuteDecision(const PolicyDecision &decision, bool delegated, TimePoint now);
    bool IsDelegated(const ObservationTarget &target) const;
    bool IsWorkMode(EnforcementMode mode) const;

    // Grace
    void StartGrace(bool isUnplanned, TimePoint now);
    void FireGrace(const PendingGrace &grace, TimePoint now);

    // Justification
    void ResolveJustification(std::uint64_t ticket, const ScoreResult &result);
    void RejectJustification(const ObservationTarget &target, TimePoint now);
    void RecordAssessment(const std::string &action);

    // Visual state
    void Reconcile();
    void ClearEnforcementVisuals();
    void ShowNudge(NudgeLevel level, bool warning, bool autoDismiss, TimePoint now);
    void DismissNudge();
    void ShowOverlay(const std::string &reason, TimePoint now);
    void DismissOverlay();
    void ShowIntervention(int seconds, TimePoint now);
    void EndIntervention();
    void SetGrayscale(bool active, double intensity);
    void SetTimerIndicator(bool distracted);
    void Redirect(const std::string &url);
    void Publish(const Command &command);
    std::string BackToWorkUrl() const;
    int FocusMinutes(TimePoint now) const;

  private:
    // Tolerated early arrival of the next sample, for poll tick jitter.
    static constexpr double kSampleSlackSeconds = 0.5;

    const EnforcementConfig m_Config;
    ClockFn m_Clock;
    CommandBus m_Bus;
    RelevanceScorer *m_Scorer{nullptr};
    AssessmentHandler m_OnAssessment;

    // Collaborating parts
    DistractionCounter m_Counter;
    ThresholdPolicy m_Policy;
    GraceScheduler m_Grace;
    SuppressionRegistry m_Suppression;
    Reconciler m_Reconciler;
    JustificationProtocol m_Justification;
    BlockLifecycle m_Lifecycle;
    OfflineHeuristics m_Heuristics;
    RunState m_Run;

    // Schedule
    std::optional<TimeBlock> m_Block;
    ScheduleState m_Schedule{SCHEDULE_ACTIVE};
    std::uint64_t m_BlockGeneration{0};
    TimePoint m_BlockStartedAt{};
    int m_UnplannedSnoozesUsed{0};

    // Frontmost target and its latest verdict
    std::optional<ObservationTarget> m_Frontmost;
    bool m_HasVerdict{false};
    ScoreResult m_Verdict;
    bool m_SampledSinceTick{false};
    std::optional<TimePoint> m_LastSampleAt;
    std::string m_LastRelevantUrl;
    bool m_ExtensionConnected{false};

    // Off-target run
    bool m_InRun{false};
    std::string m_RunKey;
    bool m_CurrentlyOffTarget{false};
    std::string m_EnforcedKey;

    // What the presentation side is showing
    bool m_NudgeVisible{false};
    std::optional<TimePoint> m_NudgeDismissAt;
    bool m_OverlayVisible{false};
    bool m_InterventionVisible{false};
    std::optional<TimePoint> m_InterventionEndsAt;
    bool m_GrayscaleActive{false};
    double m_GrayscaleIntensity{0.0};
    bool m_TimerDistracted{false};
};
