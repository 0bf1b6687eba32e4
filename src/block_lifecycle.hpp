#pragma once

enum LifecycleState {
    LIFECYCLE_IDLE,
    LIFECYCLE_RITUAL_PENDING,
    LIFECYCLE_ACTIVE_ENFORCEMENT,
    LIFECYCLE_CELEBRATING,
    LIFECYCLE_NEXT_BLOCK_PENDING
};

// Ritual and celebration screens around each block. Enforcement only runs in
// ACTIVE_ENFORCEMENT.
class BlockLifecycle {
  public:
    explicit BlockLifecycle(bool rituals) : m_Rituals(rituals) {}

    LifecycleState State() const { return m_State; }
    bool IsEnforcing() const { return m_State == LIFECYCLE_ACTIVE_ENFORCEMENT; }

    // Each returns true when the state changed.
    bool BlockStarted();
    bool BlockEnded();
    bool RitualCompleted();
    bool CelebrationDismissed();
    void SkipNextRitual() { m_SkipNextRitual = true; }

    static const char *StateName(LifecycleState state);

  private:
    bool Transition(LifecycleState next);
    LifecycleState StartState();

  private:
    const bool m_Rituals;
    bool m_SkipNextRitual{false};
    LifecycleState m_State{LIFECYCLE_IDLE};
};
