#include "game/stealth/StealthTarget.hpp"

#include <algorithm>

namespace game::stealth
{
StealthTarget::StealthTarget(const engine::lighting::LightField& field, const StealthSettings& settings)
    : m_stealth(field, settings)
{
}

void StealthTarget::SetState(const glm::vec3& position, float movementSpeed)
{
    m_position = position;
    m_movementSpeed = std::max(0.0F, movementSpeed);
}

void StealthTarget::Update(float deltaSeconds)
{
    m_stealth.Update(m_position, IsMoving(), deltaSeconds);
}

bool StealthTarget::IsMoving() const
{
    return m_movementSpeed > m_stealth.Settings().movementThreshold;
}
} // namespace game::stealth
