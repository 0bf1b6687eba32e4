#include "common.hpp"

// ─────────────────────────────────────
const char *BlockKindName(BlockKind kind) {
    switch (kind) {
    case BLOCK_DEEP_WORK:
        return "deepWork";
    case BLOCK_FOCUS_HOURS:
        return "focusHours";
    case BLOCK_FREE_TIME:
        return "freeTime";
    }
    return "unknown";
}

// ─────────────────────────────────────
const char *ScheduleStateName(ScheduleState state) {
    switch (state) {
    case SCHEDULE_ACTIVE:
        return "active";
    case SCHEDULE_NO_PLAN:
        return "no_plan";
    case SCHEDULE_SNOOZED:
        return "snoozed";
    case SCHEDULE_DISABLED:
        return "disabled";
    }
    return "unknown";
}

// ─────────────────────────────────────
const char *EnforcementModeName(EnforcementMode mode) {
    switch (mode) {
    case MODE_NONE:
        return "none";
    case MODE_DEEP_WORK:
        return "deep_work";
    case MODE_FOCUS_HOURS:
        return "focus_hours";
    case MODE_UNPLANNED:
        return "unplanned";
    case MODE_NO_PLAN:
        return "no_plan";
    }
    return "unknown";
}

// ─────────────────────────────────────
std::optional<BlockKind> ParseBlockKind(const std::string &value) {
    if (value == "deepWork") {
        return BLOCK_DEEP_WORK;
    }
    if (value == "focusHours") {
        return BLOCK_FOCUS_HOURS;
    }
    if (value == "freeTime") {
        return BLOCK_FREE_TIME;
    }
    return std::nullopt;
}

// ─────────────────────────────────────
std::optional<ScheduleState> ParseScheduleState(const std::string &value) {
    if (value == "active") {
        return SCHEDULE_ACTIVE;
    }
    if (value == "no_plan") {
        return SCHEDULE_NO_PLAN;
    }
    if (value == "snoozed") {
        return SCHEDULE_SNOOZED;
    }
    if (value == "disabled") {
        return SCHEDULE_DISABLED;
    }
    return std::nullopt;
}
