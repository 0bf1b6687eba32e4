#pragma once

// Cumulative off-target seconds for the current block. Grows by one poll interval per
// off-target sample and decays by a fraction of it per on-target sample.
class DistractionCounter {
  public:
    DistractionCounter(double pollIntervalSeconds, double decayRatio);

    void OnObservation(bool relevant);
    void Reset();
    double Seconds() const { return m_Seconds; }

  private:
    const double m_PollInterval;
    const double m_DecayRatio;
    double m_Seconds{0.0};
};
