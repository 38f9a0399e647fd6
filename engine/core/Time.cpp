#include "engine/core/Time.hpp"

#include <algorithm>

namespace engine::core
{
Time::Time(double fixedDeltaSeconds)
    : m_fixedDeltaSeconds(std::max(fixedDeltaSeconds, 1.0e-4))
{
}

void Time::Reset()
{
    m_deltaSeconds = 0.0;
    m_simulatedSeconds = 0.0;
    m_droppedSeconds = 0.0;
    m_accumulator = 0.0;
    m_frameIndex = 0;
    m_hasPreviousFrame = false;
}

void Time::BeginFrame(double nowSeconds)
{
    ++m_frameIndex;
    if (!m_hasPreviousFrame)
    {
        m_previousFrameSeconds = nowSeconds;
        m_hasPreviousFrame = true;
        m_deltaSeconds = 0.0;
        return;
    }

    // A clock that goes backwards yields a zero-length frame and keeps the newer reading.
    const double wallDelta = std::max(nowSeconds - m_previousFrameSeconds, 0.0);
    m_previousFrameSeconds = std::max(nowSeconds, m_previousFrameSeconds);

    m_deltaSeconds = std::min(wallDelta, kMaxFrameDeltaSeconds);
    m_droppedSeconds += wallDelta - m_deltaSeconds;
    m_simulatedSeconds += m_deltaSeconds;
    m_accumulator += m_deltaSeconds;
}

bool Time::ShouldRunFixedStep() const
{
    return m_accumulator >= m_fixedDeltaSeconds;
}

void Time::ConsumeFixedStep()
{
    m_accumulator = std::max(m_accumulator - m_fixedDeltaSeconds, 0.0);
}
} // namespace engine::core
