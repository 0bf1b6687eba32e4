#pragma once

#include <optional>
#include <set>
#include <string>
#include <unordered_map>

#include "common.hpp"

// Targets the user is currently allowed to look at. Expired entries are treated as absent;
// nothing sweeps them.
class SuppressionRegistry {
  public:
    void Approve(const std::string &targetKey, double seconds, TimePoint now);
    void SessionOverride(const std::string &targetKey);
    void SnoozeGlobal(double seconds, TimePoint now);

    bool IsSuppressed(const std::string &targetKey, TimePoint now) const;
    bool IsSnoozed(TimePoint now) const;
    bool HasSessionOverride(const std::string &targetKey) const;
    std::optional<TimePoint> SnoozedUntil(TimePoint now) const;
    void Clear();

  private:
    std::unordered_map<std::string, TimePoint> m_PerTarget;
    std::set<std::string> m_SessionOverrides;
    std::optional<TimePoint> m_GlobalSnoozeUntil;
};
