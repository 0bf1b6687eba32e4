#include "distraction_counter.hpp"

#include <algorithm>

// ─────────────────────────────────────
DistractionCounter::DistractionCounter(double pollIntervalSeconds, double decayRatio)
    : m_PollInterval(pollIntervalSeconds), m_DecayRatio(decayRatio) {}

// ─────────────────────────────────────
void DistractionCounter::OnObservation(bool relevant) {
    if (relevant) {
        m_Seconds = std::max(0.0, m_Seconds - m_PollInterval * m_DecayRatio);
    } else {
        m_Seconds += m_PollInterval;
    }
}

// ─────────────────────────────────────
void DistractionCounter::Reset() {
    m_Seconds = 0.0;
}
