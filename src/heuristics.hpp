#pragma once

#include <optional>
#include <string>
#include <vector>

#include "common.hpp"
#include "config.hpp"

// Cheap local verdicts that settle obvious cases before the scorer is asked.
class OfflineHeuristics {
  public:
    explicit OfflineHeuristics(const EnforcementConfig &config);

    std::optional<ScoreResult> Classify(const ObservationTarget &target,
                                        const std::string &intention) const;

    bool IsAlwaysAllowed(const std::string &appId) const;
    bool IsSocialMedia(const std::string &host) const;
    bool IsUserDistracting(const ObservationTarget &target) const;

    static bool HasKeywordOverlap(const std::string &intention, const std::string &title);
    static std::vector<std::string> ExtractKeywords(const std::string &text);
    static std::string NormalizeHost(const std::string &host);

  private:
    const EnforcementConfig &m_Config;
};
