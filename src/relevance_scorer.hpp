#pragma once

#include <functional>
#include <string>

#include "common.hpp"

struct ScoreRequest {
    std::string targetKey;
    std::string title;
    std::string intention;
    std::string description;
    bool isApplication{false};
};

// Asynchronous relevance oracle. Callbacks must be delivered on the thread that owns the
// FocusEnforcer; implementations that work elsewhere post the result back.
class RelevanceScorer {
  public:
    using Callback = std::function<void(const ScoreResult &)>;

    virtual ~RelevanceScorer() = default;
    virtual void Score(const ScoreRequest &request, Callback done) = 0;
    virtual void ApprovePageTitle(const std::string &title, const std::string &intention) = 0;
    virtual void ClearApprovals() = 0;
};
