#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "common.hpp"

enum JustificationState { JUSTIFY_IDLE, JUSTIFY_SUBMITTED, JUSTIFY_ACCEPTED, JUSTIFY_REJECTED };

struct PendingJustification {
    std::uint64_t ticket{0};
    std::uint64_t blockGeneration{0};
    std::string targetKey;
    std::string title;
    std::string text;
    bool isNativeApp{false};
};

// What the enforcer should do once a re-score comes back.
struct JustificationOutcome {
    bool accepted{false};
    double approvalSeconds{0.0};
    bool sessionOverride{false};
    bool approveTitleInScorer{false};
    bool clearVisuals{false};
    bool showOverlay{false};
    bool redirectToBlockPage{false};
    bool persistentNudge{false};
};

class JustificationProtocol {
  public:
    std::uint64_t Submit(const std::string &targetKey, const std::string &title,
                         const std::string &text, bool isNativeApp,
                         std::uint64_t blockGeneration);

    // Returns the pending submission if the ticket is still the live one.
    std::optional<PendingJustification> Resolve(std::uint64_t ticket, bool accepted,
                                                std::uint64_t blockGeneration);
    void Cancel();

    JustificationState State() const { return m_State; }
    bool IsAwaiting() const { return m_Pending.has_value(); }

    static std::string RescoreDescription(const std::string &description, const std::string &text);
    static JustificationOutcome Decide(BlockKind kind, bool accepted, bool isNativeApp,
                                       double deepWorkApprovalSeconds);

  private:
    JustificationState m_State{JUSTIFY_IDLE};
    std::optional<PendingJustification> m_Pending;
    std::uint64_t m_NextTicket{1};
};
