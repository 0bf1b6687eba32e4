#include <csignal>
#include <exception>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include <absl/flags/flag.h>
#include <absl/flags/parse.h>
#include <absl/flags/usage.h>
#include <spdlog/spdlog.h>

#include "config.hpp"
#include "secrets.hpp"
#include "steadfast.hpp"

ABSL_FLAG(std::string, config, "",
          "Config file. Defaults to $XDG_CONFIG_HOME/steadfast/config.json.");
ABSL_FLAG(int, port, 0, "HTTP port on 127.0.0.1. 0 keeps the value from the config file.");
ABSL_FLAG(std::string, log_level, "info", "One of debug, info, off.");
ABSL_FLAG(std::string, set_api_key, "", "Store the scorer backend API key and exit.");
ABSL_FLAG(bool, clear_api_key, false, "Remove the stored scorer backend API key and exit.");

static volatile std::sig_atomic_t g_shutdown_requested = 0;

// ─────────────────────────────────────
static void signal_handler(int) {
    g_shutdown_requested = 1;
}

// ─────────────────────────────────────
static std::optional<LogLevel> parse_log_level(const std::string &value) {
    if (value == "debug") {
        return LOG_DEBUG;
    }
    if (value == "info") {
        return LOG_INFO;
    }
    if (value == "off") {
        return LOG_OFF;
    }
    return std::nullopt;
}

// ─────────────────────────────────────
static int manage_api_key() {
    Secrets secrets;
    if (absl::GetFlag(FLAGS_clear_api_key)) {
        std::cout << (secrets.ClearSecret(Secrets::kScorerApiKey) ? "Scorer API key removed\n"
                                                                   : "No scorer API key stored\n");
        return 0;
    }
    if (!secrets.SaveSecret(Secrets::kScorerApiKey, absl::GetFlag(FLAGS_set_api_key))) {
        std::cerr << "Failed to store the scorer API key\n";
        return 1;
    }
    std::cout << "Scorer API key stored\n";
    return 0;
}

// ─────────────────────────────────────
int main(int argc, char *argv[]) {
    absl::SetProgramUsageMessage("Steadfast focus enforcement daemon.\n"
                                 "  steadfast [--config=PATH] [--port=N] [--log_level=debug]\n"
                                 "  steadfast --set_api_key=KEY | --clear_api_key");
    const std::vector<char *> positional = absl::ParseCommandLine(argc, argv);
    if (positional.size() > 1) {
        std::cerr << "Unexpected argument: " << positional[1] << "\n";
        return 2;
    }

    const auto logLevel = parse_log_level(absl::GetFlag(FLAGS_log_level));
    if (!logLevel) {
        std::cerr << "Unknown log level: " << absl::GetFlag(FLAGS_log_level) << "\n";
        return 2;
    }

    if (absl::GetFlag(FLAGS_clear_api_key) || !absl::GetFlag(FLAGS_set_api_key).empty()) {
        return manage_api_key();
    }

    const std::string configFlag = absl::GetFlag(FLAGS_config);
    EnforcementConfig config =
        LoadConfig(configFlag.empty() ? DefaultConfigPath() : std::filesystem::path(configFlag));

    const int port = absl::GetFlag(FLAGS_port);
    if (port < 0 || port > 65535) {
        std::cerr << "Port out of range: " << port << "\n";
        return 2;
    }
    if (port != 0) {
        config.port = static_cast<unsigned>(port);
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    try {
        Steadfast steadfast(config, *logLevel);
        steadfast.Run([] { return g_shutdown_requested != 0; });
    } catch (const std::exception &e) {
        spdlog::critical("Steadfast stopped: {}", e.what());
        return 1;
    }

    spdlog::info("Bye");
    return 0;
}
