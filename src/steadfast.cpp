#include "steadfast.hpp"

#include <algorithm>
#include <cstdlib>
#include <string>

#include "json.hpp"

namespace {
static nlohmann::json parse_json_or_throw(const std::string &body) {
    if (body.empty()) {
        return nlohmann::json::object();
    }
    nlohmann::json j = nlohmann::json::parse(body);
    if (!j.is_object()) {
        throw std::runtime_error("expected a JSON object");
    }
    return j;
}

static void set_json_response(httplib::Response &res, const nlohmann::json &payload,
                              int status = 200) {
    res.status = status;
    res.set_content(payload.dump(), "application/json");
}

static void set_error_response(httplib::Response &res, const std::string &message,
                               int status = 400) {
    set_json_response(res, {{"error", message}}, status);
}

// {"key", "title", "url", "native"}; a target with a URL is a browser tab unless told otherwise.
static ObservationTarget parse_target(const nlohmann::json &j) {
    JsonParse p;
    ObservationTarget t;
    t.key = p.GetString(j, "key", "");
    if (t.key.empty()) {
        throw std::runtime_error("missing target key");
    }
    t.displayName = p.GetString(j, "title", "");
    t.url = p.GetString(j, "url", "");
    t.isNativeApp = p.GetBool(j, "native", t.url.empty());
    return t;
}

static std::optional<TimeBlock> parse_block(const nlohmann::json &j) {
    const nlohmann::json &src = j.contains("block") ? j["block"] : j;
    if (src.is_null() || !src.is_object() || !src.contains("id")) {
        return std::nullopt;
    }

    JsonParse p;
    TimeBlock b;
    b.id = p.GetString(src, "id", "");
    if (b.id.empty()) {
        return std::nullopt;
    }
    b.title = p.GetString(src, "title", "");
    b.description = p.GetString(src, "description", "");
    const std::string kind = p.GetString(src, "kind", "deepWork");
    auto parsed = ParseBlockKind(kind);
    if (!parsed) {
        throw std::runtime_error("unknown block kind '" + kind + "'");
    }
    b.kind = *parsed;
    b.startMinute = p.GetInt(src, "start_minute", 0);
    b.endMinute = p.GetInt(src, "end_minute", 0);
    return b;
}
} // namespace

// ─────────────────────────────────────
Steadfast::Steadfast(const EnforcementConfig &config, LogLevel log_level)
    : m_Config(config), m_Port(config.port), m_Heuristics(m_Config) {

    if (log_level == LOG_DEBUG) {
        spdlog::set_level(spdlog::level::debug);
    } else if (log_level == LOG_INFO) {
        spdlog::set_level(spdlog::level::info);
    } else if (log_level == LOG_OFF) {
        spdlog::set_level(spdlog::level::off);
    }

    std::filesystem::path dbpath = GetDBPath();
    spdlog::info("DataBase path: {}", dbpath.string());

    // Secrets
    m_Secrets = std::make_unique<Secrets>();
    spdlog::info("Secrets manager initialized");

    // SQLite
    m_SQLite = std::make_unique<SQLite>(dbpath.string());
    spdlog::info("SQLite database initialized");

    // Notifications
    m_Notification = std::make_unique<Notification>();
    if (m_Notification->IsConnected()) {
        spdlog::info("Notification system initialized");
    } else {
        spdlog::warn("Notifications unavailable, nudges will only reach the command log");
    }

    // Tray icon (DBus StatusNotifierItem)
    m_Tray = std::make_unique<TrayIcon>();
    if (m_Tray->Start("Steadfast")) {
        spdlog::info("Tray icon initialized");
    } else {
        spdlog::warn("Tray icon not available (no DBus watcher or session bus)");
    }

    InitEnforcer();

    // Server
    InitServer();
    spdlog::info("Serving on: http://127.0.0.1:{}", m_Port);
}

// ─────────────────────────────────────
Steadfast::~Steadfast() {
    RequestShutdown();
    {
        // Dropping queued Call() tasks releases any handler still waiting on one.
        std::lock_guard<std::mutex> lock(m_TasksMutex);
        m_Tasks.clear();
    }

    m_Server.stop();
    if (m_Thread.joinable()) {
        m_Thread.join();
    }

    m_Presenter.reset();
    m_Scorer.reset();
    m_Enforcer.reset();
    m_Tray.reset();
    m_Notification.reset();
    m_SQLite.reset();
}

// ─────────────────────────────────────
void Steadfast::InitEnforcer() {
    m_Enforcer = std::make_unique<FocusEnforcer>(m_Config, [] { return Clock::now(); });

    const std::string apiKey = m_Secrets->LoadSecret(Secrets::kScorerApiKey);
    m_Scorer = std::make_unique<BackendScorer>(
      m_Config.scorerUrl, apiKey, [this](std::function<void()> task) { Post(std::move(task)); });
    m_Enforcer->SetScorer(m_Scorer.get());

    m_Enforcer->SetAssessmentHandler(
      [this](const Assessment &a) { m_SQLite->InsertAssessment(a, UnixNow()); });

    m_Presenter =
      std::make_unique<Presenter>(*m_Enforcer, m_Notification.get(), m_Tray.get(), m_Scorer.get());

    m_Tray->SetActivateHandler([this] { m_Enforcer->UserRequestedBackToWork(); });
    spdlog::info("Enforcer initialized");
}

// ─────────────────────────────────────
void Steadfast::RequestShutdown() {
    m_ShutdownRequested.store(true);
    WakeScheduler();
}

// ─────────────────────────────────────
void Steadfast::Post(std::function<void()> task) {
    if (m_ShutdownRequested.load()) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(m_TasksMutex);
        m_Tasks.push_back(std::move(task));
    }
    WakeScheduler();
}

// ─────────────────────────────────────
void Steadfast::DrainTasks() {
    std::deque<std::function<void()>> tasks;
    {
        std::lock_guard<std::mutex> lock(m_TasksMutex);
        tasks.swap(m_Tasks);
    }
    for (auto &task : tasks) {
        task();
    }
}

// ─────────────────────────────────────
void Steadfast::WakeScheduler() {
    {
        std::lock_guard<std::mutex> lk(m_SchedulerMutex);
        m_WakeupSeq.fetch_add(1, std::memory_order_relaxed);
    }
    m_SchedulerCv.notify_one();
}

// ─────────────────────────────────────
void Steadfast::InitLoopState() {
    m_NextPollAt = AddSeconds(Clock::now(), m_Config.pollIntervalSeconds);
    m_Today = LocalToday();
}

// ─────────────────────────────────────
void Steadfast::Run(const std::function<bool()> &stopRequested) {
    InitLoopState();

    while (!m_ShutdownRequested.load()) {
        if (stopRequested && stopRequested()) {
            spdlog::info("Shutdown requested");
            break;
        }

        DrainTasks();
        PumpDBus();
        CheckDayRollover();
        RunDueWork(Clock::now());
        m_Presenter->SyncTray();

        WaitUntilNextDeadline();
    }

    m_ShutdownRequested.store(true);
}

// ─────────────────────────────────────
void Steadfast::PumpDBus() {
    if (m_Notification) {
        m_Notification->Poll();
    }
    if (m_Tray) {
        m_Tray->Poll();
    }
}

// ─────────────────────────────────────
void Steadfast::CheckDayRollover() {
    const auto today = LocalToday();
    if (today == m_Today) {
        return;
    }
    m_Today = today;
    spdlog::info("New day, resetting daily allowances");
    m_Enforcer->ResetDailyAllowances();
}

// ─────────────────────────────────────
void Steadfast::RunDueWork(TimePoint now) {
    if (now >= m_NextPollAt) {
        m_Enforcer->PollTick();
        m_NextPollAt = AddSeconds(now, m_Config.pollIntervalSeconds);
        return;
    }
    m_Enforcer->ProcessDueEvents();
}

// ─────────────────────────────────────
void Steadfast::WaitUntilNextDeadline() {
    const auto now = Clock::now();
    auto deadline = std::min(m_NextPollAt, now + kDBusPumpEvery);

    // Grace and nudge auto-dismiss
    if (auto next = m_Enforcer->NextDeadline()) {
        deadline = std::min(deadline, *next);
    }

    std::unique_lock<std::mutex> lk(m_SchedulerMutex);
    const auto seq = m_WakeupSeq.load(std::memory_order_relaxed);
    {
        std::lock_guard<std::mutex> lock(m_TasksMutex);
        if (!m_Tasks.empty()) {
            return;
        }
    }
    m_SchedulerCv.wait_until(lk, deadline, [&] {
        if (m_ShutdownRequested.load()) {
            return true;
        }
        return m_WakeupSeq.load(std::memory_order_relaxed) != seq;
    });
}

// ─────────────────────────────────────
void Steadfast::ScoreObservation(const ObservationTarget &target) {
    if (!target.isNativeApp && target.displayName.empty()) {
        m_Enforcer->ObservationUnavailable(target.key);
        return;
    }

    const std::uint64_t generation = m_Enforcer->BlockGeneration();
    const EnforcementMode mode = m_Enforcer->Mode();
    const std::string intention = m_Enforcer->Intention();

    if (mode == MODE_NONE) {
        m_Enforcer->Observation(target, ScoreResult{true, 0, "Not enforcing"}, generation);
        return;
    }

    if (auto verdict = m_Heuristics.Classify(target, intention)) {
        spdlog::debug("Heuristic verdict for {}: {}", target.key, verdict->reason);
        m_Enforcer->Observation(target, *verdict, generation);
        return;
    }

    // Outside a planned block anything not explicitly allowed is off target.
    if (mode == MODE_UNPLANNED || mode == MODE_NO_PLAN) {
        m_Enforcer->Observation(target, ScoreResult{false, 80, "No block planned"}, generation);
        return;
    }

    ScoreRequest request;
    request.targetKey = target.key;
    request.title = target.displayName;
    request.intention = intention;
    request.isApplication = target.isNativeApp;
    m_Scorer->Score(request, [this, target, generation](const ScoreResult &result) {
        m_Enforcer->Observation(target, result, generation);
    });
}

// ─────────────────────────────────────
void Steadfast::RescoreFrontmost() {
    if (const auto &frontmost = m_Enforcer->Frontmost()) {
        ObservationTarget target = *frontmost;
        ScoreObservation(target);
    }
}

// ─────────────────────────────────────
bool Steadfast::InitServer() {
    m_Server.set_keep_alive_max_count(4);
    m_Server.set_keep_alive_timeout(1);
    m_Server.set_payload_max_length(64 * 1024); // 64 KB

    m_Server.set_read_timeout(5, 0);
    m_Server.set_write_timeout(5, 0);

    // Schedule
    {
        m_Server.Post("/block", [this](const httplib::Request &req, httplib::Response &res) {
            spdlog::debug("[POST] /block");
            try {
                const auto block = parse_block(parse_json_or_throw(req.body));
                nlohmann::json state = Call([this, &block] {
                    m_Enforcer->CurrentTimeBlockChanged(block);
                    RescoreFrontmost();
                    return m_Enforcer->Snapshot();
                });
                set_json_response(res, state);
            } catch (const std::exception &e) {
                set_error_response(res, e.what());
            }
        });

        m_Server.Post("/schedule", [this](const httplib::Request &req, httplib::Response &res) {
            spdlog::debug("[POST] /schedule");
            try {
                nlohmann::json j = parse_json_or_throw(req.body);
                JsonParse p;
                const std::string value = p.GetString(j, "state", "");
                auto state = ParseScheduleState(value);
                if (!state) {
                    set_error_response(res, "unknown schedule state '" + value + "'");
                    return;
                }
                Call([this, s = *state] {
                    m_Enforcer->SetScheduleState(s);
                    RescoreFrontmost();
                    return true;
                });
                set_json_response(res, {{"status", "ok"}, {"state", value}});
            } catch (const std::exception &e) {
                set_error_response(res, e.what());
            }
        });

        m_Server.Post("/ritual/complete",
                      [this](const httplib::Request &, httplib::Response &res) {
                          try {
                              Call([this] {
                                  m_Enforcer->RitualCompleted();
                                  RescoreFrontmost();
                                  return true;
                              });
                              set_json_response(res, {{"status", "ok"}});
                          } catch (const std::exception &e) {
                              set_error_response(res, e.what(), 503);
                          }
                      });

        m_Server.Post("/celebration/dismiss",
                      [this](const httplib::Request &, httplib::Response &res) {
                          try {
                              Call([this] {
                                  m_Enforcer->CelebrationDismissed();
                                  return true;
                              });
                              set_json_response(res, {{"status", "ok"}});
                          } catch (const std::exception &e) {
                              set_error_response(res, e.what(), 503);
                          }
                      });
    }

    // Observations (window adapter and browser extension)
    {
        m_Server.Post("/frontmost", [this](const httplib::Request &req, httplib::Response &res) {
            try {
                const ObservationTarget target = parse_target(parse_json_or_throw(req.body));
                spdlog::debug("[POST] /frontmost {}", target.key);
                Call([this, &target] {
                    m_Enforcer->FrontmostTargetChanged(target);
                    ScoreObservation(target);
                    return true;
                });
                set_json_response(res, {{"status", "ok"}});
            } catch (const std::exception &e) {
                set_error_response(res, e.what());
            }
        });

        m_Server.Post("/observation", [this](const httplib::Request &req, httplib::Response &res) {
            try {
                nlohmann::json j = parse_json_or_throw(req.body);
                const ObservationTarget target = parse_target(j);
                JsonParse p;
                const bool unavailable = p.GetBool(j, "unavailable", false);

                // The extension may send its own verdict; otherwise score it here.
                std::optional<ScoreResult> verdict;
                if (j.contains("relevant")) {
                    ScoreResult r;
                    r.relevant = p.GetBool(j, "relevant", true);
                    r.confidence = std::clamp(p.GetInt(j, "confidence", 0), 0, 100);
                    r.reason = p.GetString(j, "reason", "");
                    verdict = r;
                }

                const bool accepted = Call([this, &target, &verdict, unavailable] {
                    if (unavailable) {
                        m_Enforcer->ObservationUnavailable(target.key);
                        return true;
                    }
                    if (verdict) {
                        return m_Enforcer->Observation(target, *verdict);
                    }
                    ScoreObservation(target);
                    return true;
                });
                set_json_response(res, {{"accepted", accepted}});
            } catch (const std::exception &e) {
                set_error_response(res, e.what());
            }
        });

        m_Server.Post("/extension", [this](const httplib::Request &req, httplib::Response &res) {
            try {
                nlohmann::json j = parse_json_or_throw(req.body);
                JsonParse p;
                const bool connected = p.GetBool(j, "connected", false);
                Call([this, connected] {
                    m_Enforcer->ExtensionConnectionChanged(connected);
                    return true;
                });
                set_json_response(res, {{"status", "ok"}});
            } catch (const std::exception &e) {
                set_error_response(res, e.what());
            }
        });

        m_Server.Post("/grayscale", [this](const httplib::Request &req, httplib::Response &res) {
            try {
                nlohmann::json j = parse_json_or_throw(req.body);
                JsonParse p;
                const bool active = p.GetBool(j, "active", false);
                Call([this, active] {
                    m_Enforcer->GrayscaleStateReported(active);
                    return true;
                });
                set_json_response(res, {{"status", "ok"}});
            } catch (const std::exception &e) {
                set_error_response(res, e.what());
            }
        });
    }

    // User intents
    {
        m_Server.Post("/justification",
                      [this](const httplib::Request &req, httplib::Response &res) {
                          try {
                              nlohmann::json j = parse_json_or_throw(req.body);
                              JsonParse p;
                              const std::string text = p.GetString(j, "text", "");
                              if (text.empty()) {
                                  set_error_response(res, "missing text");
                                  return;
                              }
                              const bool submitted = Call([this, &text] {
                                  return m_Enforcer->UserSubmittedJustification(text);
                              });
                              set_json_response(res, {{"submitted", submitted}});
                          } catch (const std::exception &e) {
                              set_error_response(res, e.what());
                          }
                      });

        m_Server.Post("/nudge/dismiss", [this](const httplib::Request &, httplib::Response &res) {
            try {
                Call([this] {
                    m_Enforcer->UserDismissedNudge();
                    return true;
                });
                set_json_response(res, {{"status", "ok"}});
            } catch (const std::exception &e) {
                set_error_response(res, e.what(), 503);
            }
        });

        m_Server.Post("/snooze", [this](const httplib::Request &, httplib::Response &res) {
            try {
                nlohmann::json result = Call([this] {
                    const bool snoozed = m_Enforcer->UserRequestedSnooze();
                    return nlohmann::json{
                      {"snoozed", snoozed},
                      {"unplanned_snoozes_left", m_Enforcer->UnplannedSnoozesLeft()}};
                });
                set_json_response(res, result);
            } catch (const std::exception &e) {
                set_error_response(res, e.what(), 503);
            }
        });

        m_Server.Post("/back-to-work", [this](const httplib::Request &, httplib::Response &res) {
            try {
                Call([this] {
                    m_Enforcer->UserRequestedBackToWork();
                    return true;
                });
                set_json_response(res, {{"status", "ok"}});
            } catch (const std::exception &e) {
                set_error_response(res, e.what(), 503);
            }
        });

        m_Server.Post("/intervention/complete",
                      [this](const httplib::Request &, httplib::Response &res) {
                          try {
                              Call([this] {
                                  m_Enforcer->UserCompletedIntervention();
                                  return true;
                              });
                              set_json_response(res, {{"status", "ok"}});
                          } catch (const std::exception &e) {
                              set_error_response(res, e.what(), 503);
                          }
                      });
    }

    // State
    {
        m_Server.Get("/state", [this](const httplib::Request &, httplib::Response &res) {
            try {
                nlohmann::json state = Call([this] {
                    nlohmann::json j = m_Enforcer->Snapshot();
                    j["commands_seq"] = m_Presenter->LastSeq();
                    j["today"] = m_SQLite->GetTodayAssessmentSummary();
                    return j;
                });
                set_json_response(res, state);
            } catch (const std::exception &e) {
                set_error_response(res, e.what(), 503);
            }
        });

        m_Server.Get("/commands", [this](const httplib::Request &req, httplib::Response &res) {
            try {
                std::uint64_t since = 0;
                if (req.has_param("since")) {
                    since = std::stoull(req.get_param_value("since"));
                }
                nlohmann::json commands =
                  Call([this, since] { return m_Presenter->CommandsSince(since); });
                set_json_response(res, commands);
            } catch (const std::exception &e) {
                set_error_response(res, e.what());
            }
        });

        m_Server.Get("/assessments", [this](const httplib::Request &req, httplib::Response &res) {
            try {
                int limit = 200;
                if (req.has_param("limit")) {
                    limit = std::stoi(req.get_param_value("limit"));
                }
                nlohmann::json rows =
                  Call([this, limit] { return m_SQLite->FetchAssessments(limit); });
                set_json_response(res, rows);
            } catch (const std::exception &e) {
                set_error_response(res, e.what());
            }
        });
    }

    m_Server.set_error_handler([](const httplib::Request &, httplib::Response &res) {
        if (res.status == 404) {
            set_error_response(res, "not found", 404);
        }
    });

    const std::string host = "127.0.0.1";
    int port = static_cast<int>(m_Port);
    m_Thread = std::thread([this, host, port] {
        if (!m_Server.listen(host, port) && !m_ShutdownRequested.load()) {
            spdlog::error("HTTP server failed to listen on {}:{}", host, port);
            RequestShutdown();
        }
    });
    return true;
}

// ─────────────────────────────────────
std::filesystem::path Steadfast::GetDBPath() {
    const char *xdgDataHome = std::getenv("XDG_DATA_HOME");
    std::filesystem::path baseDir;
    if (xdgDataHome && *xdgDataHome) {
        baseDir = xdgDataHome;
    } else {
        const char *home = std::getenv("HOME");
        if (!home || !*home) {
            spdlog::error("HOME environment variable not set");
            throw std::runtime_error("HOME environment variable not set");
        }
        baseDir = std::filesystem::path(home) / ".local" / "share";
    }

    std::filesystem::path dbPath = baseDir / "steadfast" / "assessments.sqlite";
    std::error_code ec;
    std::filesystem::create_directories(dbPath.parent_path(), ec);
    if (ec) {
        spdlog::error("Error creating {}: {}", dbPath.parent_path().string(), ec.message());
        throw std::runtime_error("unable to create data directory");
    }

    return dbPath;
}

// ─────────────────────────────────────
std::chrono::local_days Steadfast::LocalToday() {
    using namespace std::chrono;
    const zoned_time zt{current_zone(), system_clock::now()};
    return floor<days>(zt.get_local_time());
}

// ─────────────────────────────────────
double Steadfast::UnixNow() {
    return std::chrono::duration<double>(std::chrono::system_clock::now().time_since_epoch())
      .count();
}
