#include "suppression_registry.hpp"

#include <spdlog/spdlog.h>

// ─────────────────────────────────────
void SuppressionRegistry::Approve(const std::string &targetKey, double seconds, TimePoint now) {
    m_PerTarget[targetKey] = AddSeconds(now, seconds);
    spdlog::info("{} approved for {}s", targetKey, seconds);
}

// ─────────────────────────────────────
void SuppressionRegistry::SessionOverride(const std::string &targetKey) {
    m_SessionOverrides.insert(targetKey);
    spdlog::info("{} allowed for the rest of this block", targetKey);
}

// ─────────────────────────────────────
void SuppressionRegistry::SnoozeGlobal(double seconds, TimePoint now) {
    m_GlobalSnoozeUntil = AddSeconds(now, seconds);
    spdlog::info("Enforcement snoozed for {}s", seconds);
}

// ─────────────────────────────────────
bool SuppressionRegistry::IsSuppressed(const std::string &targetKey, TimePoint now) const {
    if (m_SessionOverrides.count(targetKey)) {
        return true;
    }
    auto it = m_PerTarget.find(targetKey);
    return it != m_PerTarget.end() && it->second > now;
}

// ─────────────────────────────────────
bool SuppressionRegistry::IsSnoozed(TimePoint now) const {
    return m_GlobalSnoozeUntil && *m_GlobalSnoozeUntil > now;
}

// ─────────────────────────────────────
bool SuppressionRegistry::HasSessionOverride(const std::string &targetKey) const {
    return m_SessionOverrides.count(targetKey) > 0;
}

// ─────────────────────────────────────
std::optional<TimePoint> SuppressionRegistry::SnoozedUntil(TimePoint now) const {
    if (!IsSnoozed(now)) {
        return std::nullopt;
    }
    return m_GlobalSnoozeUntil;
}

// ─────────────────────────────────────
void SuppressionRegistry::Clear() {
    m_PerTarget.clear();
    m_SessionOverrides.clear();
    m_GlobalSnoozeUntil.reset();
}
