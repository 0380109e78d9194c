#include "engine/core/TickClock.hpp"

#include <algorithm>
#include <cmath>

namespace engine::core
{
namespace
{
constexpr double kMaxFrameDelta = 0.25;
}

TickClock::TickClock(double fixedDeltaSeconds, int maxStepsPerFrame)
    : m_fixedDeltaSeconds(1.0 / 60.0)
    , m_maxStepsPerFrame(std::max(1, maxStepsPerFrame))
{
    SetFixedDeltaSeconds(fixedDeltaSeconds);
}

void TickClock::SetFixedDeltaSeconds(double fixedDeltaSeconds)
{
    m_fixedDeltaSeconds = std::clamp(fixedDeltaSeconds, 1.0 / 240.0, 1.0 / 10.0);
    m_accumulator = std::min(m_accumulator, m_fixedDeltaSeconds * 2.0);
}

void TickClock::SetMaxStepsPerFrame(int maxSteps)
{
    m_maxStepsPerFrame = std::max(1, maxSteps);
}

void TickClock::BeginFrame(double nowSeconds)
{
    if (m_firstFrame)
    {
        m_lastFrameSeconds = nowSeconds;
        m_firstFrame = false;
    }

    m_deltaSeconds = std::clamp(nowSeconds - m_lastFrameSeconds, 0.0, kMaxFrameDelta);
    m_lastFrameSeconds = nowSeconds;
    m_totalSeconds += m_deltaSeconds;
    m_accumulator += m_deltaSeconds;
    m_stepsThisFrame = 0;
    ++m_frameIndex;
}

bool TickClock::ShouldRunFixedStep() const
{
    if (m_accumulator < m_fixedDeltaSeconds)
    {
        return false;
    }
    return m_stepsThisFrame < m_maxStepsPerFrame;
}

void TickClock::ConsumeFixedStep()
{
    m_accumulator = std::max(0.0, m_accumulator - m_fixedDeltaSeconds);
    ++m_stepsThisFrame;
    ++m_stepIndex;

    // Spiral guard: whatever is still owed after the cap is thrown away.
    if (m_stepsThisFrame >= m_maxStepsPerFrame && m_accumulator >= m_fixedDeltaSeconds)
    {
        const double owed = std::floor(m_accumulator / m_fixedDeltaSeconds);
        m_droppedSteps += static_cast<unsigned long long>(owed);
        m_accumulator -= owed * m_fixedDeltaSeconds;
    }
}
} // namespace engine::core
