#include "game/ai/SuspicionMeter.hpp"

#include <algorithm>

namespace game::ai
{
SuspicionMeter::SuspicionMeter(float maxLevel, float decayRate)
    : m_maxLevel(0.0F)
    , m_decayRate(0.0F)
{
    Configure(maxLevel, decayRate);
}

void SuspicionMeter::Configure(float maxLevel, float decayRate)
{
    m_maxLevel = std::max(0.0F, maxLevel);
    m_decayRate = std::max(0.0F, decayRate);
    m_level = std::clamp(m_level, 0.0F, m_maxLevel);
}

void SuspicionMeter::Add(float amount)
{
    if (amount <= 0.0F)
    {
        return;
    }
    m_level = std::min(m_maxLevel, m_level + amount);
}

void SuspicionMeter::Decay(float deltaSeconds)
{
    if (deltaSeconds <= 0.0F)
    {
        return;
    }
    m_level = std::max(0.0F, m_level - m_decayRate * deltaSeconds);
}

void SuspicionMeter::Set(float level)
{
    m_level = std::clamp(level, 0.0F, m_maxLevel);
}
} // namespace game::ai
