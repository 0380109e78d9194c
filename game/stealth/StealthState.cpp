#include "game/stealth/StealthState.hpp"

#include <algorithm>

namespace game::stealth
{
StealthState::StealthState(const engine::lighting::LightField& field, const StealthSettings& settings)
    : m_field(&field)
    , m_settings(settings)
{
    SetHideThreshold(settings.hideThreshold);
    SetMovementPenalty(settings.movementPenalty);
    SetSampleInterval(settings.sampleInterval);
    m_settings.movementThreshold = std::max(0.0F, settings.movementThreshold);
}

void StealthState::Update(const glm::vec3& position, bool isMoving, float deltaSeconds)
{
    if (!m_enabled)
    {
        return;
    }

    m_sampleTimer += std::max(0.0F, deltaSeconds);
    if (m_hasSampled && m_sampleTimer < m_settings.sampleInterval)
    {
        return;
    }

    const float elapsed = m_sampleTimer;
    m_sampleTimer = 0.0F;
    Sample(position, isMoving, elapsed);
}

void StealthState::ForceSample(const glm::vec3& position, bool isMoving)
{
    const float elapsed = m_sampleTimer;
    m_sampleTimer = 0.0F;
    Sample(position, isMoving, elapsed);
}

float StealthState::EffectiveThreshold(bool isMoving) const
{
    return isMoving ? m_settings.hideThreshold * m_settings.movementPenalty : m_settings.hideThreshold;
}

void StealthState::SetHideThreshold(float threshold)
{
    m_settings.hideThreshold = std::clamp(threshold, 0.0F, 1.0F);
    m_status.threshold = m_settings.hideThreshold;
}

void StealthState::SetMovementPenalty(float penalty)
{
    m_settings.movementPenalty = std::clamp(penalty, 0.0F, 1.0F);
}

void StealthState::SetSampleInterval(float seconds)
{
    m_settings.sampleInterval = std::max(0.0F, seconds);
}

void StealthState::SetEnabled(bool enabled)
{
    m_enabled = enabled;
    if (enabled)
    {
        m_sampler.Invalidate();
    }
}

void StealthState::Sample(const glm::vec3& position, bool isMoving, float elapsedSeconds)
{
    m_status.lightLevel = m_sampler.Sample(*m_field, position, elapsedSeconds);
    m_status.threshold = EffectiveThreshold(isMoving);
    m_hasSampled = true;

    const bool hidden = m_status.lightLevel < m_status.threshold;
    if (hidden == m_status.hidden)
    {
        return;
    }

    m_status.hidden = hidden;
    if (m_hiddenChanged)
    {
        m_hiddenChanged(hidden);
    }
}
} // namespace game::stealth
