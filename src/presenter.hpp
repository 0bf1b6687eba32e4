#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <string>

#include <nlohmann/json.hpp>

#include "commands.hpp"
#include "enforcer.hpp"
#include "notification.hpp"
#include "relevance_scorer.hpp"
#include "tray.hpp"

// Turns enforcer commands into desktop notifications and the tray indicator, and keeps a
// numbered log of them for the browser extension and UI to poll. Owner thread only.
class Presenter {
  public:
    Presenter(FocusEnforcer &enforcer, Notification *notification, TrayIcon *tray,
              RelevanceScorer *scorer);
    ~Presenter();

    Presenter(const Presenter &) = delete;
    Presenter &operator=(const Presenter &) = delete;

    nlohmann::json CommandsSince(std::uint64_t since) const;
    std::uint64_t LastSeq() const { return m_NextSeq - 1; }

    // Called once per loop turn so the tray goes idle outside enforcement.
    void SyncTray();

  private:
    void OnCommand(const Command &command);
    void Record(const Command &command);

    void ShowNudge(const Command &command);
    void ShowOverlay(const Command &command);
    void ShowIntervention(const Command &command);
    void ShowBlockMessage(const Command &command);
    void Close(std::uint32_t &id);
    void HandleAction(const std::string &action);

  private:
    FocusEnforcer &m_Enforcer;
    Notification *m_Notification;
    TrayIcon *m_Tray;
    RelevanceScorer *m_Scorer;
    std::size_t m_Subscription{0};

    std::uint32_t m_NudgeId{0};
    std::uint32_t m_OverlayId{0};
    std::uint32_t m_InterventionId{0};

    struct LoggedCommand {
        std::uint64_t seq;
        nlohmann::json payload;
    };
    std::deque<LoggedCommand> m_Log;
    std::uint64_t m_NextSeq{1};
    static constexpr std::size_t kMaxLog = 256;
};
