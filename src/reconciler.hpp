#pragma once

#include <optional>

#include "common.hpp"
#include "config.hpp"

// Grayscale bookkeeping: whether the screen should be gray right now, and how strongly to
// re-apply it after a short recovery.
class Reconciler {
  public:
    explicit Reconciler(const EnforcementConfig &config);

    static bool ShouldBeGray(bool inWorkBlock, bool grayscaleTriggeredThisBlock,
                             bool currentlyOffTarget) {
        return inWorkBlock && grayscaleTriggeredThisBlock && currentlyOffTarget;
    }

    // 1.0 below the full-intensity window, linear to 0.0 at the reset window.
    double Intensity(double recoverySeconds) const;
    bool RecoveryClearsTrigger(double recoverySeconds) const;
    double RecoverySeconds(const std::optional<TimePoint> &lastOffTargetEnd, TimePoint now) const;

  private:
    const EnforcementConfig &m_Config;
};
