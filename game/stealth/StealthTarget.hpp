#pragma once

#include <glm/vec3.hpp>

#include "game/stealth/StealthState.hpp"

namespace game::stealth
{
/// The protagonist as seen by the simulation: a host-fed position and speed
/// plus the stealth state derived from them.
class StealthTarget
{
public:
    explicit StealthTarget(const engine::lighting::LightField& field, const StealthSettings& settings = {});

    void SetState(const glm::vec3& position, float movementSpeed);
    void Update(float deltaSeconds);

    [[nodiscard]] const glm::vec3& Position() const { return m_position; }
    [[nodiscard]] float MovementSpeed() const { return m_movementSpeed; }
    [[nodiscard]] bool IsMoving() const;
    [[nodiscard]] bool IsHidden() const { return m_stealth.IsHidden(); }

    [[nodiscard]] StealthState& Stealth() { return m_stealth; }
    [[nodiscard]] const StealthState& Stealth() const { return m_stealth; }

private:
    StealthState m_stealth;
    glm::vec3 m_position{0.0F};
    float m_movementSpeed = 0.0F;
};
} // namespace game::stealth
