#pragma once

#include <optional>
#include <string>

#include "common.hpp"
#include "config.hpp"

struct PendingGrace {
    std::string targetKey;
    std::string displayName;
    std::string reason;
    bool isRevisit{false};
    bool isUnplanned{false};
    TimePoint deadline{};
};

enum GraceStart { GRACE_STARTED, GRACE_COALESCED, GRACE_SUPERSEDED };

// At most one pending grace period. Its deadline is plain data; whoever drives the clock
// asks for due graces with TakeDue().
class GraceScheduler {
  public:
    GraceStart Start(PendingGrace grace, double seconds, TimePoint now);
    std::optional<PendingGrace> TakeDue(TimePoint now);
    void Cancel();
    bool CancelFor(const std::string &targetKey);
    bool CancelUnlessFor(const std::string &targetKey);

    bool IsPending() const { return m_Pending.has_value(); }
    bool IsPendingFor(const std::string &targetKey) const;
    std::optional<TimePoint> Deadline() const;
    const std::optional<PendingGrace> &Pending() const { return m_Pending; }

    static double SelectDuration(const EnforcementConfig &config, bool isUnplanned,
                                 bool isDeepWorkNativeApp, bool isRevisit);

  private:
    std::optional<PendingGrace> m_Pending;
};
