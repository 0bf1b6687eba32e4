#pragma once

#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <unordered_set>

#include <nlohmann/json.hpp>

#include "relevance_scorer.hpp"

// Scores titles against the block intention with an HTTP backend. Requests run on a worker
// thread; results come back through the executor, which must run them on the owner thread.
// Cache and approvals are only touched on the owner thread.
class BackendScorer : public RelevanceScorer {
  public:
    using Executor = std::function<void(std::function<void()>)>;

    BackendScorer(std::string baseUrl, std::string apiKey, Executor postBack);
    ~BackendScorer() override;

    BackendScorer(const BackendScorer &) = delete;
    BackendScorer &operator=(const BackendScorer &) = delete;

    void Score(const ScoreRequest &request, Callback done) override;
    void ApprovePageTitle(const std::string &title, const std::string &intention) override;
    void ClearApprovals() override;

    static std::string CacheKey(const std::string &intention, const std::string &title);
    static nlohmann::json BuildRequestBody(const ScoreRequest &request);
    static ScoreResult ParseResponse(const nlohmann::json &payload);
    static ScoreResult Unavailable();

  private:
    struct Job {
        ScoreRequest request;
        Callback done;
    };

    void WorkerLoop();
    bool Request(const ScoreRequest &request, ScoreResult &out);
    void Deliver(Callback done, ScoreResult result);

  private:
    const std::string m_BaseUrl;
    const std::string m_ApiKey;
    Executor m_PostBack;

    std::unordered_map<std::string, ScoreResult> m_Cache;
    std::unordered_set<std::string> m_Approved;

    std::mutex m_JobsMutex;
    std::condition_variable m_JobsCv;
    std::deque<Job> m_Jobs;
    bool m_Stop{false};
    std::thread m_Worker;
};
