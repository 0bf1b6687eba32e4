#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

// All tuned constants of the enforcement core. Defaults match a fresh install; every field
// can be overridden from config.json.
struct EnforcementConfig {
    double pollIntervalSeconds{10.0};
    double decayRatio{0.5};

    // Deep Work table
    double deepWorkNudgeAt{10.0};
    double deepWorkRedirectAt{20.0};

    // Focus Hours table
    double focusNudgeAt{10.0};
    double focusNudgeEvery{60.0};
    double focusGrayscaleAt{30.0};
    double focusWarningAt{240.0};

    // Interventions (both kinds)
    double interventionAt{300.0};
    double interventionEvery{300.0};
    int interventionBaseSeconds{60};
    int interventionStepSeconds{30};
    int interventionMaxSeconds{120};

    // Grace periods
    double graceSeconds{30.0};
    double revisitGraceSeconds{15.0};
    double unplannedGraceSeconds{5.0};
    double deepWorkNativeGraceSeconds{5.0};

    // Grayscale recovery
    double fullIntensityRecoverySeconds{60.0};
    double resetRecoverySeconds{180.0};

    // Suppression
    double deepWorkApprovalSeconds{180.0};
    double snoozeSeconds{300.0};
    double unplannedSnoozeSeconds{300.0};
    int unplannedSnoozesPerDay{1};

    double nudgeAutoDismissSeconds{10.0};
    bool blockRituals{false};
    std::string backToWorkFallbackUrl{"https://www.google.com"};

    std::vector<std::string> socialMediaHosts{
      "youtube.com",  "facebook.com", "instagram.com", "twitter.com", "x.com",
      "reddit.com",   "tiktok.com",   "linkedin.com",  "twitch.tv",   "netflix.com",
      "pinterest.com"};
    std::vector<std::string> alwaysAllowedApps{
      "steadfast",      "org.gnome.Nautilus", "org.gnome.Settings", "gnome-control-center",
      "1password",      "org.keepassxc.KeePassXC", "bitwarden", "org.gnome.Calculator",
      "pavucontrol",    "org.gnome.Terminal"};
    std::vector<std::string> distractingTargets;

    // Daemon
    unsigned port{7079};
    std::string scorerUrl{"http://127.0.0.1:8321"};
};

EnforcementConfig ParseConfig(const nlohmann::json &j);
EnforcementConfig LoadConfig(const std::filesystem::path &path);
std::filesystem::path DefaultConfigPath();
