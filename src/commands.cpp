#include "commands.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

// ─────────────────────────────────────
const char *CommandTypeName(CommandType type) {
    switch (type) {
    case CMD_SHOW_NUDGE:
        return "showNudge";
    case CMD_DISMISS_NUDGE:
        return "dismissNudge";
    case CMD_SHOW_OVERLAY:
        return "showOverlay";
    case CMD_DISMISS_OVERLAY:
        return "dismissOverlay";
    case CMD_SHOW_INTERVENTION:
        return "showIntervention";
    case CMD_SET_GRAYSCALE:
        return "setGrayscale";
    case CMD_SET_TIMER_INDICATOR:
        return "setTimerIndicator";
    case CMD_REDIRECT_TO_URL:
        return "redirectToURL";
    case CMD_REDIRECT_TO_BLOCK_PAGE:
        return "redirectToBlockPage";
    case CMD_APPROVE_PAGE_TITLE:
        return "approvePageTitleInScorer";
    case CMD_SHOW_BLOCK_RITUAL:
        return "showBlockRitual";
    case CMD_SHOW_BLOCK_CELEBRATION:
        return "showBlockCelebration";
    }
    return "unknown";
}

// ─────────────────────────────────────
nlohmann::json CommandToJson(const Command &c) {
    nlohmann::json j;
    j["type"] = CommandTypeName(c.type);
    switch (c.type) {
    case CMD_SHOW_NUDGE:
        j["level"] = static_cast<int>(c.level);
        j["warning"] = c.warning;
        j["autoDismiss"] = c.autoDismiss;
        j["distractionMinutes"] = c.distractionMinutes;
        j["displayName"] = c.displayName;
        j["intention"] = c.intention;
        break;
    case CMD_SHOW_OVERLAY:
        j["intention"] = c.intention;
        j["reason"] = c.reason;
        j["focusDurationMinutes"] = c.focusDurationMinutes;
        j["isNoPlan"] = c.isNoPlan;
        j["displayName"] = c.displayName;
        break;
    case CMD_SHOW_INTERVENTION:
        j["durationSeconds"] = c.durationSeconds;
        j["intention"] = c.intention;
        break;
    case CMD_SET_GRAYSCALE:
        j["active"] = c.active;
        j["intensity"] = c.intensity;
        break;
    case CMD_SET_TIMER_INDICATOR:
        j["distracted"] = c.active;
        break;
    case CMD_REDIRECT_TO_URL:
        j["url"] = c.url;
        break;
    case CMD_REDIRECT_TO_BLOCK_PAGE:
        j["reason"] = c.reason;
        j["intention"] = c.intention;
        break;
    case CMD_APPROVE_PAGE_TITLE:
        j["title"] = c.title;
        j["intention"] = c.intention;
        break;
    case CMD_SHOW_BLOCK_RITUAL:
    case CMD_SHOW_BLOCK_CELEBRATION:
        j["title"] = c.title;
        j["intention"] = c.intention;
        break;
    case CMD_DISMISS_NUDGE:
    case CMD_DISMISS_OVERLAY:
        break;
    }
    return j;
}

// ─────────────────────────────────────
std::size_t CommandBus::Subscribe(Handler handler) {
    std::size_t id = m_NextId++;
    m_Subscribers.push_back({id, std::move(handler)});
    return id;
}

// ─────────────────────────────────────
void CommandBus::Unsubscribe(std::size_t id) {
    m_Subscribers.erase(std::remove_if(m_Subscribers.begin(), m_Subscribers.end(),
                                       [id](const Subscriber &s) { return s.id == id; }),
                        m_Subscribers.end());
}

// ─────────────────────────────────────
void CommandBus::Publish(const Command &command) const {
    spdlog::debug("Command {}", CommandToJson(command).dump());
    for (const auto &s : m_Subscribers) {
        s.handler(command);
    }
}
