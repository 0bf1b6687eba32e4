#include "justification.hpp"

#include <spdlog/spdlog.h>

// ─────────────────────────────────────
std::uint64_t JustificationProtocol::Submit(const std::string &targetKey, const std::string &title,
                                            const std::string &text, bool isNativeApp,
                                            std::uint64_t blockGeneration) {
    if (m_Pending) {
        spdlog::debug("Justification for {} replaced by a new submission", m_Pending->targetKey);
    }
    PendingJustification p;
    p.ticket = m_NextTicket++;
    p.blockGeneration = blockGeneration;
    p.targetKey = targetKey;
    p.title = title;
    p.text = text;
    p.isNativeApp = isNativeApp;
    m_Pending = p;
    m_State = JUSTIFY_SUBMITTED;
    return p.ticket;
}

// ─────────────────────────────────────
std::optional<PendingJustification> JustificationProtocol::Resolve(std::uint64_t ticket,
                                                                   bool accepted,
                                                                   std::uint64_t blockGeneration) {
    if (!m_Pending || m_Pending->ticket != ticket) {
        spdlog::debug("Dropping stale justification result (ticket {})", ticket);
        return std::nullopt;
    }
    if (m_Pending->blockGeneration != blockGeneration) {
        spdlog::debug("Dropping justification result from a previous block");
        m_Pending.reset();
        m_State = JUSTIFY_IDLE;
        return std::nullopt;
    }
    std::optional<PendingJustification> done = std::move(m_Pending);
    m_Pending.reset();
    m_State = accepted ? JUSTIFY_ACCEPTED : JUSTIFY_REJECTED;
    return done;
}

// ─────────────────────────────────────
void JustificationProtocol::Cancel() {
    m_Pending.reset();
    m_State = JUSTIFY_IDLE;
}

// ─────────────────────────────────────
std::string JustificationProtocol::RescoreDescription(const std::string &description,
                                                      const std::string &text) {
    std::string out = description;
    if (!out.empty()) {
        out += "\n";
    }
    out += "User's justification for this content: " + text;
    return out;
}

// ─────────────────────────────────────
JustificationOutcome JustificationProtocol::Decide(BlockKind kind, bool accepted,
                                                   bool isNativeApp,
                                                   double deepWorkApprovalSeconds) {
    JustificationOutcome o;
    o.accepted = accepted;
    if (accepted) {
        o.clearVisuals = true;
        if (kind == BLOCK_DEEP_WORK) {
            // Deep Work trusts the user for a short while only; the scorer is not told.
            o.approvalSeconds = deepWorkApprovalSeconds;
        } else {
            o.sessionOverride = true;
            o.approveTitleInScorer = true;
        }
        return o;
    }

    if (kind == BLOCK_DEEP_WORK) {
        o.showOverlay = true;
        o.redirectToBlockPage = !isNativeApp;
    } else {
        o.persistentNudge = true;
    }
    return o;
}
