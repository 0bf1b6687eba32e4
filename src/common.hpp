#pragma once

#include <chrono>
#include <optional>
#include <string>

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;

enum BlockKind { BLOCK_DEEP_WORK = 1, BLOCK_FOCUS_HOURS = 2, BLOCK_FREE_TIME = 3 };

// What the schedule manager says about today, independent of the current block.
enum ScheduleState { SCHEDULE_ACTIVE = 1, SCHEDULE_NO_PLAN = 2, SCHEDULE_SNOOZED = 3, SCHEDULE_DISABLED = 4 };

enum EnforcementMode { MODE_NONE, MODE_DEEP_WORK, MODE_FOCUS_HOURS, MODE_UNPLANNED, MODE_NO_PLAN };

enum LogLevel { LOG_DEBUG, LOG_INFO, LOG_OFF };

struct TimeBlock {
    std::string id;
    std::string title;
    std::string description;
    BlockKind kind = BLOCK_DEEP_WORK;
    int startMinute = 0;
    int endMinute = 0;
};

// What the user is looking at: an app id, or a hostname for browser tabs.
struct ObservationTarget {
    std::string key;
    std::string displayName;
    std::string url;
    bool isNativeApp = true;
};

struct ScoreResult {
    bool relevant = true;
    int confidence = 0;
    std::string reason;
    // No scorer answered. Observations read this as relevant, justifications as rejected.
    bool unavailable = false;
};

struct Assessment {
    std::string targetKey;
    std::string title;
    std::string intention;
    bool relevant = true;
    int confidence = 0;
    std::string reason;
    std::string action;
};

inline double SecondsBetween(TimePoint from, TimePoint to) {
    return std::chrono::duration<double>(to - from).count();
}

inline TimePoint AddSeconds(TimePoint tp, double seconds) {
    return tp + std::chrono::duration_cast<Clock::duration>(std::chrono::duration<double>(seconds));
}

const char *BlockKindName(BlockKind kind);
const char *ScheduleStateName(ScheduleState state);
const char *EnforcementModeName(EnforcementMode mode);
std::optional<BlockKind> ParseBlockKind(const std::string &value);
std::optional<ScheduleState> ParseScheduleState(const std::string &value);
