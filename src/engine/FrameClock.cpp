#include "engine/FrameClock.hpp"

#include <algorithm>

namespace tenfoot {

void FrameClock::tick(double rawDeltaSeconds) {
    m_rawDeltaSeconds = rawDeltaSeconds;
    m_deltaSeconds = std::clamp(rawDeltaSeconds, 0.0, MAX_DELTA);
    m_elapsedMs += m_deltaSeconds * 1000.0;
    ++m_frameCount;
}

} // namespace tenfoot
