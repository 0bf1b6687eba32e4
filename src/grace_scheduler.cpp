#include "grace_scheduler.hpp"

#include <spdlog/spdlog.h>

// ─────────────────────────────────────
double GraceScheduler::SelectDuration(const EnforcementConfig &config, bool isUnplanned,
                                      bool isDeepWorkNativeApp, bool isRevisit) {
    if (isUnplanned) {
        return config.unplannedGraceSeconds;
    }
    if (isDeepWorkNativeApp) {
        return config.deepWorkNativeGraceSeconds;
    }
    if (isRevisit) {
        return config.revisitGraceSeconds;
    }
    return config.graceSeconds;
}

// ─────────────────────────────────────
GraceStart GraceScheduler::Start(PendingGrace grace, double seconds, TimePoint now) {
    if (m_Pending && m_Pending->targetKey == grace.targetKey) {
        spdlog::debug("Grace already pending for {}, keeping original deadline", grace.targetKey);
        return GRACE_COALESCED;
    }

    GraceStart result = GRACE_STARTED;
    if (m_Pending) {
        spdlog::debug("Grace for {} superseded by {}", m_Pending->targetKey, grace.targetKey);
        result = GRACE_SUPERSEDED;
    }

    grace.deadline = AddSeconds(now, seconds);
    spdlog::info("Grace started for {} ({}s{})", grace.targetKey, seconds,
                 grace.isRevisit ? ", revisit" : "");
    m_Pending = std::move(grace);
    return result;
}

// ─────────────────────────────────────
std::optional<PendingGrace> GraceScheduler::TakeDue(TimePoint now) {
    if (!m_Pending || m_Pending->deadline > now) {
        return std::nullopt;
    }
    std::optional<PendingGrace> due = std::move(m_Pending);
    m_Pending.reset();
    return due;
}

// ─────────────────────────────────────
void GraceScheduler::Cancel() {
    if (m_Pending) {
        spdlog::debug("Grace for {} cancelled", m_Pending->targetKey);
    }
    m_Pending.reset();
}

// ─────────────────────────────────────
bool GraceScheduler::CancelFor(const std::string &targetKey) {
    if (!IsPendingFor(targetKey)) {
        return false;
    }
    Cancel();
    return true;
}

// ─────────────────────────────────────
bool GraceScheduler::CancelUnlessFor(const std::string &targetKey) {
    if (!m_Pending || m_Pending->targetKey == targetKey) {
        return false;
    }
    Cancel();
    return true;
}

// ─────────────────────────────────────
bool GraceScheduler::IsPendingFor(const std::string &targetKey) const {
    return m_Pending && m_Pending->targetKey == targetKey;
}

// ─────────────────────────────────────
std::optional<TimePoint> GraceScheduler::Deadline() const {
    if (!m_Pending) {
        return std::nullopt;
    }
    return m_Pending->deadline;
}
