#include "block_lifecycle.hpp"

#include <spdlog/spdlog.h>

// ─────────────────────────────────────
bool BlockLifecycle::Transition(LifecycleState next) {
    if (next == m_State) {
        return false;
    }
    spdlog::info("Block lifecycle {} -> {}", StateName(m_State), StateName(next));
    m_State = next;
    return true;
}

// ─────────────────────────────────────
LifecycleState BlockLifecycle::StartState() {
    if (m_Rituals && !m_SkipNextRitual) {
        return LIFECYCLE_RITUAL_PENDING;
    }
    m_SkipNextRitual = false;
    return LIFECYCLE_ACTIVE_ENFORCEMENT;
}

// ─────────────────────────────────────
bool BlockLifecycle::BlockStarted() {
    if (m_State == LIFECYCLE_CELEBRATING) {
        return Transition(LIFECYCLE_NEXT_BLOCK_PENDING);
    }
    if (m_State == LIFECYCLE_NEXT_BLOCK_PENDING) {
        return false;
    }
    return Transition(StartState());
}

// ─────────────────────────────────────
bool BlockLifecycle::BlockEnded() {
    if (m_State == LIFECYCLE_ACTIVE_ENFORCEMENT && m_Rituals) {
        return Transition(LIFECYCLE_CELEBRATING);
    }
    if (m_State == LIFECYCLE_CELEBRATING) {
        return false;
    }
    return Transition(LIFECYCLE_IDLE);
}

// ─────────────────────────────────────
bool BlockLifecycle::RitualCompleted() {
    if (m_State != LIFECYCLE_RITUAL_PENDING) {
        spdlog::debug("Ritual completion ignored in state {}", StateName(m_State));
        return false;
    }
    return Transition(LIFECYCLE_ACTIVE_ENFORCEMENT);
}

// ─────────────────────────────────────
bool BlockLifecycle::CelebrationDismissed() {
    if (m_State == LIFECYCLE_CELEBRATING) {
        return Transition(LIFECYCLE_IDLE);
    }
    if (m_State == LIFECYCLE_NEXT_BLOCK_PENDING) {
        return Transition(StartState());
    }
    spdlog::debug("Celebration dismissal ignored in state {}", StateName(m_State));
    return false;
}

// ─────────────────────────────────────
const char *BlockLifecycle::StateName(LifecycleState state) {
    switch (state) {
    case LIFECYCLE_IDLE:
        return "idle";
    case LIFECYCLE_RITUAL_PENDING:
        return "ritual_pending";
    case LIFECYCLE_ACTIVE_ENFORCEMENT:
        return "active_enforcement";
    case LIFECYCLE_CELEBRATING:
        return "celebrating";
    case LIFECYCLE_NEXT_BLOCK_PENDING:
        return "next_block_pending";
    }
    return "unknown";
}
