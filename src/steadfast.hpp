#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <filesystem>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <thread>

// Libs
#include <httplib.h>
#include <spdlog/spdlog.h>

// parts
#include "backend_scorer.hpp"
#include "config.hpp"
#include "enforcer.hpp"
#include "heuristics.hpp"
#include "notification.hpp"
#include "presenter.hpp"
#include "secrets.hpp"
#include "sqlite.hpp"
#include "tray.hpp"

#include "common.hpp"

// The daemon. Owns every part; the enforcer and everything it talks to live on the thread
// that calls Run(). HTTP handlers and scorer workers hand work over with Post()/Call().
class Steadfast {
  public:
    Steadfast(const EnforcementConfig &config, LogLevel log_level);
    ~Steadfast();

    Steadfast(const Steadfast &) = delete;
    Steadfast &operator=(const Steadfast &) = delete;

    // Blocks until RequestShutdown() or until stopRequested returns true.
    void Run(const std::function<bool()> &stopRequested);
    void RequestShutdown();

  private:
    std::filesystem::path GetDBPath();
    bool InitServer();
    void InitEnforcer();

    // Owner-thread hand-over
    void Post(std::function<void()> task);
    template <typename Fn> auto Call(Fn fn) -> decltype(fn());
    void DrainTasks();
    void WakeScheduler();

    // Main loop
    void InitLoopState();
    void PumpDBus();
    void CheckDayRollover();
    void RunDueWork(TimePoint now);
    void WaitUntilNextDeadline();

    // Observations
    void ScoreObservation(const ObservationTarget &target);
    void RescoreFrontmost();

    static std::chrono::local_days LocalToday();
    static double UnixNow();

  private:
    const EnforcementConfig m_Config;
    const unsigned m_Port;

    // Scheduler: wait-until-next-deadline with reliable wakeups
    std::mutex m_SchedulerMutex;
    std::condition_variable m_SchedulerCv;
    std::atomic<std::uint64_t> m_WakeupSeq{0};
    std::atomic<bool> m_ShutdownRequested{false};

    // Work handed to the owner thread
    std::mutex m_TasksMutex;
    std::deque<std::function<void()>> m_Tasks;

    // Parts
    std::unique_ptr<Secrets> m_Secrets;
    std::unique_ptr<SQLite> m_SQLite;
    std::unique_ptr<Notification> m_Notification;
    std::unique_ptr<TrayIcon> m_Tray;
    std::unique_ptr<FocusEnforcer> m_Enforcer;
    std::unique_ptr<BackendScorer> m_Scorer;
    std::unique_ptr<Presenter> m_Presenter;
    OfflineHeuristics m_Heuristics;

    // Server
    std::thread m_Thread;
    httplib::Server m_Server;

    // Loop state
    TimePoint m_NextPollAt{};
    std::chrono::local_days m_Today{};

    static constexpr std::chrono::seconds kDBusPumpEvery{1};
};

// ─────────────────────────────────────
template <typename Fn> auto Steadfast::Call(Fn fn) -> decltype(fn()) {
    using Result = decltype(fn());
    if (m_ShutdownRequested.load()) {
        throw std::runtime_error("shutting down");
    }

    // A task dropped at shutdown breaks the promise, so waiters never hang.
    auto task = std::make_shared<std::packaged_task<Result()>>(std::move(fn));
    std::future<Result> result = task->get_future();
    Post([task] { (*task)(); });
    return result.get();
}
