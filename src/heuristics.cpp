#include "heuristics.hpp"

#include <algorithm>
#include <cctype>
#include <set>

#include <spdlog/spdlog.h>

namespace {

const std::set<std::string> kStopWords = {
  "the",   "and",  "for",   "with",  "this", "that", "from", "have", "some",
  "work",  "working", "doing", "make", "get",  "use",  "using", "look", "find",
  "check", "need", "want",  "will",  "can",  "all",  "any",  "more"};

std::string ToLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool EndsWith(const std::string &s, const std::string &suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

// ─────────────────────────────────────
OfflineHeuristics::OfflineHeuristics(const EnforcementConfig &config) : m_Config(config) {}

// ─────────────────────────────────────
std::vector<std::string> OfflineHeuristics::ExtractKeywords(const std::string &text) {
    std::vector<std::string> words;
    std::string current;
    for (unsigned char c : text) {
        if (std::isalnum(c)) {
            current.push_back(static_cast<char>(std::tolower(c)));
            continue;
        }
        if (current.size() >= 3 && !kStopWords.count(current)) {
            words.push_back(current);
        }
        current.clear();
    }
    if (current.size() >= 3 && !kStopWords.count(current)) {
        words.push_back(current);
    }
    return words;
}

// ─────────────────────────────────────
bool OfflineHeuristics::HasKeywordOverlap(const std::string &intention, const std::string &title) {
    const auto intentWords = ExtractKeywords(intention);
    const auto titleWords = ExtractKeywords(title);
    for (const auto &iw : intentWords) {
        for (const auto &tw : titleWords) {
            // prefix stems, so "taxes" matches "tax"
            if (iw.rfind(tw, 0) == 0 || tw.rfind(iw, 0) == 0) {
                return true;
            }
        }
    }
    return false;
}

// ─────────────────────────────────────
std::string OfflineHeuristics::NormalizeHost(const std::string &host) {
    std::string h = ToLower(host);
    if (h.rfind("www.", 0) == 0) {
        h.erase(0, 4);
    }
    return h;
}

// ─────────────────────────────────────
bool OfflineHeuristics::IsAlwaysAllowed(const std::string &appId) const {
    const std::string id = ToLower(appId);
    for (const auto &allowed : m_Config.alwaysAllowedApps) {
        if (id == ToLower(allowed)) {
            return true;
        }
    }
    return false;
}

// ─────────────────────────────────────
bool OfflineHeuristics::IsSocialMedia(const std::string &host) const {
    const std::string h = NormalizeHost(host);
    for (const auto &social : m_Config.socialMediaHosts) {
        const std::string s = NormalizeHost(social);
        if (h == s || EndsWith(h, "." + s)) {
            return true;
        }
    }
    return false;
}

// ─────────────────────────────────────
bool OfflineHeuristics::IsUserDistracting(const ObservationTarget &target) const {
    const std::string key = ToLower(target.key);
    const std::string name = ToLower(target.displayName);
    for (const auto &entry : m_Config.distractingTargets) {
        const std::string e = ToLower(entry);
        if (e.empty()) {
            continue;
        }
        if (key.find(e) != std::string::npos || name.find(e) != std::string::npos) {
            return true;
        }
    }
    return false;
}

// ─────────────────────────────────────
std::optional<ScoreResult> OfflineHeuristics::Classify(const ObservationTarget &target,
                                                       const std::string &intention) const {
    if (target.isNativeApp && IsAlwaysAllowed(target.key)) {
        return ScoreResult{true, 100, "Always allowed"};
    }
    if (!intention.empty() && HasKeywordOverlap(intention, target.displayName)) {
        return ScoreResult{true, 95, "Keyword match with task"};
    }
    if (IsUserDistracting(target)) {
        return ScoreResult{false, 100, "On your distracting list"};
    }
    if (!target.isNativeApp && IsSocialMedia(target.key)) {
        return ScoreResult{false, 90, "Social media"};
    }
    spdlog::debug("No offline verdict for {}", target.key);
    return std::nullopt;
}
