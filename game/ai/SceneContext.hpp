#pragma once

#include "engine/physics/OcclusionWorld.hpp"
#include "game/ai/AlertBus.hpp"
#include "game/stealth/StealthTarget.hpp"

namespace game::ai
{
/// Shared scene data every agent reads during its tick. Owned by the scene
/// coordinator and handed to agents by reference.
class SceneContext
{
public:
    SceneContext(const engine::physics::OcclusionWorld& occlusion, const stealth::StealthTarget& target, AlertBus& alerts)
        : m_occlusion(occlusion)
        , m_target(target)
        , m_alerts(alerts)
    {
    }

    [[nodiscard]] const engine::physics::OcclusionWorld& Occlusion() const { return m_occlusion; }
    [[nodiscard]] const stealth::StealthTarget& Target() const { return m_target; }
    [[nodiscard]] AlertBus& Alerts() const { return m_alerts; }

    [[nodiscard]] double ElapsedSeconds() const { return m_elapsedSeconds; }
    void AdvanceTime(float deltaSeconds)
    {
        if (deltaSeconds > 0.0F)
        {
            m_elapsedSeconds += static_cast<double>(deltaSeconds);
        }
    }
    void ResetTime() { m_elapsedSeconds = 0.0; }

private:
    const engine::physics::OcclusionWorld& m_occlusion;
    const stealth::StealthTarget& m_target;
    AlertBus& m_alerts;
    double m_elapsedSeconds = 0.0;
};
} // namespace game::ai
