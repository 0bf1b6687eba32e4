#include "reconciler.hpp"

#include <algorithm>

// ─────────────────────────────────────
Reconciler::Reconciler(const EnforcementConfig &config) : m_Config(config) {}

// ─────────────────────────────────────
double Reconciler::Intensity(double recoverySeconds) const {
    const double full = m_Config.fullIntensityRecoverySeconds;
    const double reset = m_Config.resetRecoverySeconds;
    if (recoverySeconds < full) {
        return 1.0;
    }
    if (recoverySeconds >= reset) {
        return 0.0;
    }
    return std::clamp(1.0 - (recoverySeconds - full) / (reset - full), 0.0, 1.0);
}

// ─────────────────────────────────────
bool Reconciler::RecoveryClearsTrigger(double recoverySeconds) const {
    return recoverySeconds >= m_Config.resetRecoverySeconds;
}

// ─────────────────────────────────────
double Reconciler::RecoverySeconds(const std::optional<TimePoint> &lastOffTargetEnd,
                                   TimePoint now) const {
    if (!lastOffTargetEnd) {
        return 0.0;
    }
    return std::max(0.0, SecondsBetween(*lastOffTargetEnd, now));
}
