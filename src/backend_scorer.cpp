#include "backend_scorer.hpp"

#include <algorithm>

#include <httplib.h>
#include <spdlog/spdlog.h>

#include "json.hpp"

// ─────────────────────────────────────
BackendScorer::BackendScorer(std::string baseUrl, std::string apiKey, Executor postBack)
    : m_BaseUrl(std::move(baseUrl)), m_ApiKey(std::move(apiKey)), m_PostBack(std::move(postBack)) {
    m_Worker = std::thread([this] { WorkerLoop(); });
    spdlog::info("Relevance backend: {}{}", m_BaseUrl, m_ApiKey.empty() ? " (no API key)" : "");
}

// ─────────────────────────────────────
BackendScorer::~BackendScorer() {
    {
        std::lock_guard<std::mutex> lock(m_JobsMutex);
        m_Stop = true;
        m_Jobs.clear();
    }
    m_JobsCv.notify_all();
    if (m_Worker.joinable()) {
        m_Worker.join();
    }
}

// ─────────────────────────────────────
std::string BackendScorer::CacheKey(const std::string &intention, const std::string &title) {
    return intention + "|" + title;
}

// ─────────────────────────────────────
ScoreResult BackendScorer::Unavailable() {
    ScoreResult r;
    r.relevant = true;
    r.confidence = 0;
    r.reason = "Scoring unavailable";
    r.unavailable = true;
    return r;
}

// ─────────────────────────────────────
nlohmann::json BackendScorer::BuildRequestBody(const ScoreRequest &request) {
    nlohmann::json body = {
        {"title", request.title},
        {"intention", request.intention},
        {"target", request.targetKey},
        {"is_application", request.isApplication},
    };
    if (!request.description.empty()) {
        body["description"] = request.description;
    }
    return body;
}

// ─────────────────────────────────────
ScoreResult BackendScorer::ParseResponse(const nlohmann::json &payload) {
    if (!payload.is_object() || !payload.contains("relevant")) {
        spdlog::warn("Relevance backend answered without a verdict");
        return Unavailable();
    }

    JsonParse p;
    ScoreResult r;
    r.relevant = p.GetBool(payload, "relevant", true);
    r.confidence = std::clamp(p.GetInt(payload, "confidence", 0), 0, 100);
    r.reason = p.GetString(payload, "reason", "");
    return r;
}

// ─────────────────────────────────────
void BackendScorer::Score(const ScoreRequest &request, Callback done) {
    const std::string key = CacheKey(request.intention, request.title);

    if (m_Approved.count(key) > 0) {
        Deliver(std::move(done), ScoreResult{true, 100, "User-approved"});
        return;
    }

    // Justifications carry a description and are always asked fresh.
    const bool cacheable = request.description.empty();
    if (cacheable) {
        auto it = m_Cache.find(key);
        if (it != m_Cache.end()) {
            spdlog::debug("Relevance cache hit: {}", key);
            Deliver(std::move(done), it->second);
            return;
        }
    }

    Callback finish = [this, key, cacheable, done = std::move(done)](const ScoreResult &r) {
        // Runs on the owner thread.
        if (cacheable && r.confidence > 0) {
            m_Cache[key] = r;
        }
        done(r);
    };

    {
        std::lock_guard<std::mutex> lock(m_JobsMutex);
        m_Jobs.push_back(Job{request, std::move(finish)});
    }
    m_JobsCv.notify_one();
}

// ─────────────────────────────────────
void BackendScorer::ApprovePageTitle(const std::string &title, const std::string &intention) {
    const std::string key = CacheKey(intention, title);
    m_Approved.insert(key);
    m_Cache[key] = ScoreResult{true, 100, "User-approved"};
    spdlog::info("User approved '{}' for '{}'", title, intention);
}

// ─────────────────────────────────────
void BackendScorer::ClearApprovals() {
    m_Approved.clear();
    m_Cache.clear();
    spdlog::debug("Relevance cache cleared");
}

// ─────────────────────────────────────
void BackendScorer::Deliver(Callback done, ScoreResult result) {
    if (!m_PostBack) {
        done(result);
        return;
    }
    m_PostBack([done = std::move(done), result = std::move(result)] { done(result); });
}

// ─────────────────────────────────────
void BackendScorer::WorkerLoop() {
    while (true) {
        Job job;
        {
            std::unique_lock<std::mutex> lock(m_JobsMutex);
            m_JobsCv.wait(lock, [this] { return m_Stop || !m_Jobs.empty(); });
            if (m_Stop) {
                return;
            }
            job = std::move(m_Jobs.front());
            m_Jobs.pop_front();
        }

        ScoreResult result;
        if (!Request(job.request, result)) {
            result = Unavailable();
        }
        Deliver(std::move(job.done), std::move(result));
    }
}

// ─────────────────────────────────────
bool BackendScorer::Request(const ScoreRequest &request, ScoreResult &out) {
    httplib::Client client(m_BaseUrl);
    if (!client.is_valid()) {
        spdlog::warn("Relevance backend URL is invalid: {}", m_BaseUrl);
        return false;
    }

    httplib::Headers headers;
    if (!m_ApiKey.empty()) {
        headers.emplace("Authorization", "Bearer " + m_ApiKey);
    }
    client.set_default_headers(headers);
    client.set_connection_timeout(2, 0);
    client.set_read_timeout(10, 0);
    client.set_write_timeout(5, 0);

    const std::string body = BuildRequestBody(request).dump();
    auto res = client.Post("/score", body, "application/json");
    if (!res) {
        spdlog::warn("Relevance backend unreachable: {}", httplib::to_string(res.error()));
        return false;
    }
    if (res->status < 200 || res->status >= 300) {
        spdlog::warn("Relevance backend answered {}", res->status);
        return false;
    }

    try {
        out = ParseResponse(nlohmann::json::parse(res->body));
    } catch (const nlohmann::json::exception &e) {
        spdlog::warn("Relevance backend sent invalid JSON: {}", e.what());
        return false;
    }

    spdlog::debug("Scored '{}' for '{}': relevant={} ({}%) {}", request.title, request.intention,
                  out.relevant, out.confidence, out.reason);
    return true;
}
