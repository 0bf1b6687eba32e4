#include "config.hpp"

#include <cstdlib>
#include <fstream>

#include <spdlog/spdlog.h>

#include "json.hpp"

// ─────────────────────────────────────
EnforcementConfig ParseConfig(const nlohmann::json &j) {
    EnforcementConfig c;
    if (!j.is_object()) {
        spdlog::warn("Config root is not an object, using defaults");
        return c;
    }

    JsonParse p;
    c.pollIntervalSeconds = p.GetDouble(j, "poll_interval", c.pollIntervalSeconds);
    c.decayRatio = p.GetDouble(j, "decay_ratio", c.decayRatio);

    nlohmann::json dw = j.value("deep_work", nlohmann::json::object());
    c.deepWorkNudgeAt = p.GetDouble(dw, "nudge_at", c.deepWorkNudgeAt);
    c.deepWorkRedirectAt = p.GetDouble(dw, "redirect_at", c.deepWorkRedirectAt);

    nlohmann::json fh = j.value("focus_hours", nlohmann::json::object());
    c.focusNudgeAt = p.GetDouble(fh, "nudge_at", c.focusNudgeAt);
    c.focusNudgeEvery = p.GetDouble(fh, "nudge_every", c.focusNudgeEvery);
    c.focusGrayscaleAt = p.GetDouble(fh, "grayscale_at", c.focusGrayscaleAt);
    c.focusWarningAt = p.GetDouble(fh, "warning_at", c.focusWarningAt);

    nlohmann::json iv = j.value("intervention", nlohmann::json::object());
    c.interventionAt = p.GetDouble(iv, "at", c.interventionAt);
    c.interventionEvery = p.GetDouble(iv, "every", c.interventionEvery);
    c.interventionBaseSeconds = p.GetInt(iv, "base_seconds", c.interventionBaseSeconds);
    c.interventionStepSeconds = p.GetInt(iv, "step_seconds", c.interventionStepSeconds);
    c.interventionMaxSeconds = p.GetInt(iv, "max_seconds", c.interventionMaxSeconds);

    nlohmann::json grace = j.value("grace", nlohmann::json::object());
    c.graceSeconds = p.GetDouble(grace, "default", c.graceSeconds);
    c.revisitGraceSeconds = p.GetDouble(grace, "revisit", c.revisitGraceSeconds);
    c.unplannedGraceSeconds = p.GetDouble(grace, "unplanned", c.unplannedGraceSeconds);
    c.deepWorkNativeGraceSeconds =
      p.GetDouble(grace, "deep_work_native", c.deepWorkNativeGraceSeconds);

    nlohmann::json gray = j.value("grayscale", nlohmann::json::object());
    c.fullIntensityRecoverySeconds =
      p.GetDouble(gray, "full_intensity_recovery", c.fullIntensityRecoverySeconds);
    c.resetRecoverySeconds = p.GetDouble(gray, "reset_recovery", c.resetRecoverySeconds);
    if (c.resetRecoverySeconds <= c.fullIntensityRecoverySeconds) {
        spdlog::warn("Config: reset_recovery ({}) must exceed full_intensity_recovery ({}), "
                     "using defaults",
                     c.resetRecoverySeconds, c.fullIntensityRecoverySeconds);
        c.fullIntensityRecoverySeconds = EnforcementConfig{}.fullIntensityRecoverySeconds;
        c.resetRecoverySeconds = EnforcementConfig{}.resetRecoverySeconds;
    }

    c.deepWorkApprovalSeconds = p.GetDouble(j, "deep_work_approval", c.deepWorkApprovalSeconds);
    c.snoozeSeconds = p.GetDouble(j, "snooze", c.snoozeSeconds);
    c.unplannedSnoozeSeconds = p.GetDouble(j, "unplanned_snooze", c.unplannedSnoozeSeconds);
    c.unplannedSnoozesPerDay = p.GetInt(j, "unplanned_snoozes_per_day", c.unplannedSnoozesPerDay);
    c.nudgeAutoDismissSeconds = p.GetDouble(j, "nudge_auto_dismiss", c.nudgeAutoDismissSeconds);
    c.blockRituals = p.GetBool(j, "block_rituals", c.blockRituals);
    c.backToWorkFallbackUrl = p.GetString(j, "back_to_work_url", c.backToWorkFallbackUrl);

    c.socialMediaHosts = p.GetStringList(j, "social_media_hosts", c.socialMediaHosts);
    c.alwaysAllowedApps = p.GetStringList(j, "always_allowed_apps", c.alwaysAllowedApps);
    c.distractingTargets = p.GetStringList(j, "distracting", c.distractingTargets);

    int port = p.GetInt(j, "port", static_cast<int>(c.port));
    if (port > 0 && port < 65536) {
        c.port = static_cast<unsigned>(port);
    } else {
        spdlog::warn("Config: port {} out of range, keeping {}", port, c.port);
    }
    c.scorerUrl = p.GetString(j, "scorer_url", c.scorerUrl);

    if (c.pollIntervalSeconds <= 0) {
        spdlog::warn("Config: poll_interval must be positive, using 10");
        c.pollIntervalSeconds = 10.0;
    }
    if (c.decayRatio < 0) {
        spdlog::warn("Config: decay_ratio must not be negative, using 0.5");
        c.decayRatio = 0.5;
    }
    return c;
}

// ─────────────────────────────────────
EnforcementConfig LoadConfig(const std::filesystem::path &path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        spdlog::info("No config at {}, using defaults", path.string());
        return EnforcementConfig{};
    }

    try {
        nlohmann::json j = nlohmann::json::parse(file);
        spdlog::info("Loaded config from {}", path.string());
        return ParseConfig(j);
    } catch (const nlohmann::json::exception &e) {
        spdlog::error("Failed to parse {}: {}", path.string(), e.what());
        return EnforcementConfig{};
    }
}

// ─────────────────────────────────────
std::filesystem::path DefaultConfigPath() {
    std::filesystem::path base;
    const char *xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && *xdg) {
        base = xdg;
    } else {
        const char *home = std::getenv("HOME");
        base = std::filesystem::path(home ? home : ".") / ".config";
    }
    return base / "steadfast" / "config.json";
}
