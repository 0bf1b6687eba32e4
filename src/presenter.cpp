#include "presenter.hpp"

#include <spdlog/spdlog.h>

namespace {
static constexpr const char *kBackAction = "back";
static constexpr const char *kSnoozeAction = "snooze";
} // namespace

// ─────────────────────────────────────
Presenter::Presenter(FocusEnforcer &enforcer, Notification *notification, TrayIcon *tray,
                     RelevanceScorer *scorer)
    : m_Enforcer(enforcer), m_Notification(notification), m_Tray(tray), m_Scorer(scorer) {
    m_Subscription = m_Enforcer.Bus().Subscribe([this](const Command &c) { OnCommand(c); });
}

// ─────────────────────────────────────
Presenter::~Presenter() {
    m_Enforcer.Bus().Unsubscribe(m_Subscription);
}

// ─────────────────────────────────────
nlohmann::json Presenter::CommandsSince(std::uint64_t since) const {
    nlohmann::json commands = nlohmann::json::array();
    for (const auto &entry : m_Log) {
        if (entry.seq > since) {
            nlohmann::json c = entry.payload;
            c["seq"] = entry.seq;
            commands.push_back(std::move(c));
        }
    }
    return {{"seq", LastSeq()}, {"commands", commands}};
}

// ─────────────────────────────────────
void Presenter::SyncTray() {
    if (!m_Tray) {
        return;
    }
    if (m_Enforcer.Mode() == MODE_NONE) {
        m_Tray->SetTrayState(TRAY_IDLE);
    } else {
        m_Tray->SetTrayState(m_Enforcer.IsTimerDistracted() ? TRAY_DISTRACTED : TRAY_FOCUSED);
    }
}

// ─────────────────────────────────────
void Presenter::Record(const Command &command) {
    m_Log.push_back(LoggedCommand{m_NextSeq++, CommandToJson(command)});
    while (m_Log.size() > kMaxLog) {
        m_Log.pop_front();
    }
}

// ─────────────────────────────────────
void Presenter::OnCommand(const Command &command) {
    Record(command);
    spdlog::debug("Command #{} {}", LastSeq(), CommandTypeName(command.type));

    switch (command.type) {
    case CMD_SHOW_NUDGE:
        ShowNudge(command);
        break;
    case CMD_DISMISS_NUDGE:
        Close(m_NudgeId);
        break;
    case CMD_SHOW_OVERLAY:
        ShowOverlay(command);
        break;
    case CMD_DISMISS_OVERLAY:
        Close(m_OverlayId);
        Close(m_InterventionId);
        break;
    case CMD_SHOW_INTERVENTION:
        ShowIntervention(command);
        break;
    case CMD_SET_TIMER_INDICATOR:
        if (m_Tray) {
            m_Tray->SetTrayState(command.active ? TRAY_DISTRACTED : TRAY_FOCUSED);
        }
        break;
    case CMD_APPROVE_PAGE_TITLE:
        if (m_Scorer) {
            m_Scorer->ApprovePageTitle(command.title, command.intention);
        }
        break;
    case CMD_SHOW_BLOCK_RITUAL:
    case CMD_SHOW_BLOCK_CELEBRATION:
        ShowBlockMessage(command);
        break;
    case CMD_SET_GRAYSCALE:
    case CMD_REDIRECT_TO_URL:
    case CMD_REDIRECT_TO_BLOCK_PAGE:
        // Carried out by the browser extension and compositor helper from the command log.
        break;
    }
}

// ─────────────────────────────────────
void Presenter::ShowNudge(const Command &c) {
    if (!m_Notification) {
        return;
    }

    std::string summary = c.warning ? "Still off track" : "Is this helping?";
    if (c.level == NUDGE_ESCALATED && !c.warning) {
        summary = "Back to it?";
    }

    std::string body;
    if (!c.displayName.empty()) {
        body = c.displayName + " doesn't look like part of \"" + c.intention + "\".";
    } else {
        body = "This doesn't look like part of \"" + c.intention + "\".";
    }
    if (c.distractionMinutes > 0) {
        body += " About " + std::to_string(c.distractionMinutes) + " min off task so far.";
    }

    const int32_t timeoutMs = c.autoDismiss ? 10000 : 0;
    m_NudgeId = m_Notification->SendActionNotification(
      c.warning ? "steadfast-warning" : "steadfast-nudge", summary, body,
      {{kBackAction, "Back to work"}, {kSnoozeAction, "Snooze"}},
      [this](const std::string &action) {
          if (action == Notification::kDismissedAction) {
              m_NudgeId = 0;
              m_Enforcer.UserDismissedNudge();
              return;
          }
          HandleAction(action);
      },
      m_NudgeId, timeoutMs, c.level == NUDGE_ESCALATED);
}

// ─────────────────────────────────────
void Presenter::ShowOverlay(const Command &c) {
    if (!m_Notification) {
        return;
    }

    std::string summary;
    std::string body;
    if (c.isNoPlan) {
        summary = "Nothing planned right now";
        body = "Plan a block before diving into " +
               (c.displayName.empty() ? std::string("this") : c.displayName) + ".";
    } else {
        summary = "Focus: " + c.intention;
        body = c.reason.empty() ? std::string("This isn't part of the current block.") : c.reason;
        if (c.focusDurationMinutes > 0) {
            body += " You've been at it for " + std::to_string(c.focusDurationMinutes) + " min.";
        }
    }

    m_OverlayId = m_Notification->SendActionNotification(
      "steadfast-overlay", summary, body,
      {{kBackAction, "Back to work"}, {kSnoozeAction, "Snooze"}},
      [this](const std::string &action) {
          if (action == Notification::kDismissedAction) {
              // The overlay stays logically up until the user acts on it.
              m_OverlayId = 0;
              return;
          }
          HandleAction(action);
      },
      m_OverlayId, 0, true);
}

// ─────────────────────────────────────
void Presenter::ShowIntervention(const Command &c) {
    if (!m_Notification) {
        return;
    }
    const std::string body = "Step away for " + std::to_string(c.durationSeconds) +
                             " seconds, then come back to \"" + c.intention + "\".";
    m_InterventionId = m_Notification->SendNotification("steadfast-intervention", "Take a breath",
                                                        body, m_InterventionId,
                                                        c.durationSeconds * 1000, true);
}

// ─────────────────────────────────────
void Presenter::ShowBlockMessage(const Command &c) {
    if (!m_Notification) {
        return;
    }
    if (c.type == CMD_SHOW_BLOCK_RITUAL) {
        m_Notification->SendNotification("steadfast-focused", "Next up: " + c.title,
                                         c.intention.empty() ? c.title : c.intention);
    } else {
        m_Notification->SendNotification("steadfast-focused", "Block finished",
                                         "Nice work on \"" + c.title + "\".");
    }
}

// ─────────────────────────────────────
void Presenter::Close(std::uint32_t &id) {
    if (m_Notification && id != 0) {
        m_Notification->CloseNotification(id);
    }
    id = 0;
}

// ─────────────────────────────────────
void Presenter::HandleAction(const std::string &action) {
    if (action == kBackAction) {
        m_Enforcer.UserRequestedBackToWork();
    } else if (action == kSnoozeAction) {
        if (!m_Enforcer.UserRequestedSnooze()) {
            spdlog::info("Snooze not available right now");
        }
    }
}
