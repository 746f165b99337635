#pragma once

#include <cstdint>

namespace tenfoot {

/// Monotonic tick clock fed once per display refresh with the frame delta.
/// Navigation repeat timing reads nowMs(), so a frozen process (suspend,
/// debugger) cannot produce a burst of repeats on resume.
class FrameClock {
public:
    /// Advance by one frame. `rawDeltaSeconds` is the measured frame time.
    void tick(double rawDeltaSeconds);

    /// Clamped delta of the last tick, in seconds.
    double deltaSeconds() const { return m_deltaSeconds; }

    /// Unclamped delta of the last tick, in seconds.
    double rawDeltaSeconds() const { return m_rawDeltaSeconds; }

    /// Accumulated clamped time in milliseconds since construction.
    double nowMs() const { return m_elapsedMs; }

    uint64_t frameCount() const { return m_frameCount; }

    static constexpr double MAX_DELTA = 0.25;

private:
    double   m_deltaSeconds    = 0.0;
    double   m_rawDeltaSeconds = 0.0;
    double   m_elapsedMs       = 0.0;
    uint64_t m_frameCount      = 0;
};

} // namespace tenfoot
