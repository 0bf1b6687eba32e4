#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

enum CommandType {
    CMD_SHOW_NUDGE,
    CMD_DISMISS_NUDGE,
    CMD_SHOW_OVERLAY,
    CMD_DISMISS_OVERLAY,
    CMD_SHOW_INTERVENTION,
    CMD_SET_GRAYSCALE,
    CMD_SET_TIMER_INDICATOR,
    CMD_REDIRECT_TO_URL,
    CMD_REDIRECT_TO_BLOCK_PAGE,
    CMD_APPROVE_PAGE_TITLE,
    CMD_SHOW_BLOCK_RITUAL,
    CMD_SHOW_BLOCK_CELEBRATION
};

enum NudgeLevel { NUDGE_GENTLE = 1, NUDGE_ESCALATED = 2 };

// One outbound instruction for the presentation side. Only the fields relevant to the type
// are filled in.
struct Command {
    CommandType type{CMD_SHOW_NUDGE};

    // nudges
    NudgeLevel level{NUDGE_GENTLE};
    bool warning{false};
    bool autoDismiss{false};
    int distractionMinutes{0};

    // overlay
    std::string intention;
    std::string reason;
    int focusDurationMinutes{0};
    bool isNoPlan{false};

    // intervention
    int durationSeconds{0};

    // grayscale / indicator
    bool active{false};
    double intensity{0.0};

    // redirects, page approval, block rituals
    std::string url;
    std::string title;
    std::string displayName;
};

const char *CommandTypeName(CommandType type);
nlohmann::json CommandToJson(const Command &command);

class CommandBus {
  public:
    using Handler = std::function<void(const Command &)>;

    std::size_t Subscribe(Handler handler);
    void Unsubscribe(std::size_t id);
    void Publish(const Command &command) const;

  private:
    struct Subscriber {
        std::size_t id;
        Handler handler;
    };
    std::vector<Subscriber> m_Subscribers;
    std::size_t m_NextId{1};
};
