#pragma once

#include <memory>
#include <string>
#include <vector>

#include <glm/vec3.hpp>

#include "engine/core/EventBus.hpp"
#include "engine/lighting/LightAnimator.hpp"
#include "engine/lighting/LightField.hpp"
#include "engine/physics/OcclusionWorld.hpp"
#include "game/ai/AlertBus.hpp"
#include "game/ai/GuardBehavior.hpp"
#include "game/ai/SceneContext.hpp"
#include "game/stealth/StealthTarget.hpp"
#include "game/stealth/StealthTuning.hpp"

namespace game::stealth
{
/// Presentation events published to StealthWorld::Events(). The host
/// dispatches them after Tick() to drive animation, audio and UI.
namespace events
{
inline constexpr const char* kHiddenChanged = "stealth.hidden_changed";   // {hidden 0|1}
inline constexpr const char* kStateChanged = "agent.state_changed";       // {id, from, to}
inline constexpr const char* kTargetDetected = "agent.target_detected";   // {id, x, y, z}
inline constexpr const char* kAlertBroadcast = "agent.alert_broadcast";   // {id, x, y, z}
inline constexpr const char* kCapture = "agent.capture";                  // {id}
inline constexpr const char* kScriptCue = "agent.script_cue";             // {id, kind, text}
} // namespace events

struct GuardSpawn
{
    std::string name;
    glm::vec3 position{0.0F};
    glm::vec3 facing{0.0F, 0.0F, -1.0F};
    std::vector<glm::vec3> route;
    ai::AgentTuning agent;
    ai::GuardTuning guard;
    ai::ArchetypeData archetype = ai::PatrollerArchetype{};
};

/// Owns everything one stealth scene needs and steps it in a fixed order:
/// light animation, target stealth, guard ticks (alerts queued), alert delivery.
class StealthWorld
{
public:
    explicit StealthWorld(const StealthTuning& tuning = DefaultStealthTuning());

    StealthWorld(const StealthWorld&) = delete;
    StealthWorld& operator=(const StealthWorld&) = delete;

    engine::lighting::LightId RegisterLight(
        const glm::vec3& position,
        float intensity,
        float radius,
        engine::lighting::LightKind kind = engine::lighting::LightKind::Point
    );
    bool UnregisterLight(engine::lighting::LightId id);
    [[nodiscard]] float SampleIllumination(const glm::vec3& point) const;

    engine::physics::ObstacleId AddObstacle(const glm::vec3& center, const glm::vec3& halfExtents, bool blocksSight = true);
    bool RemoveObstacle(engine::physics::ObstacleId id);

    void SetTargetState(const glm::vec3& position, float movementSpeed);

    /// Guards spawned before Init() are validated there; later spawns are
    /// validated immediately and rejected with kInvalidAgentId.
    ai::AgentId SpawnGuard(const GuardSpawn& spawn);
    bool DespawnGuard(ai::AgentId id);
    [[nodiscard]] ai::GuardBehavior* FindGuard(ai::AgentId id);
    [[nodiscard]] const ai::GuardBehavior* FindGuard(ai::AgentId id) const;
    [[nodiscard]] std::vector<ai::AgentId> GuardIds() const;
    [[nodiscard]] std::size_t GuardCount() const { return m_guards.size(); }

    bool Init(std::string* outError = nullptr);
    /// Initializes lazily. After a failed Init, ticks are skipped until the
    /// guard roster changes or Init() is called again.
    void Tick(float deltaSeconds);

    [[nodiscard]] bool IsInitialized() const { return m_initialized; }
    [[nodiscard]] double ElapsedSeconds() const { return m_context.ElapsedSeconds(); }
    [[nodiscard]] unsigned long long TickCount() const { return m_tickCount; }

    [[nodiscard]] engine::lighting::LightField& Lights() { return m_lightField; }
    [[nodiscard]] const engine::lighting::LightField& Lights() const { return m_lightField; }
    [[nodiscard]] engine::lighting::LightAnimator& LightAnimation() { return m_lightAnimator; }
    [[nodiscard]] engine::physics::OcclusionWorld& Occlusion() { return m_occlusion; }
    [[nodiscard]] StealthTarget& Target() { return m_target; }
    [[nodiscard]] const StealthTarget& Target() const { return m_target; }
    [[nodiscard]] ai::AlertBus& Alerts() { return m_alertBus; }
    [[nodiscard]] ai::SceneContext& Context() { return m_context; }
    [[nodiscard]] engine::core::EventBus& Events() { return m_events; }
    [[nodiscard]] const StealthTuning& Tuning() const { return m_tuning; }

private:
    bool ValidateGuard(const ai::GuardBehavior& guard, std::string* outError) const;
    void WireGuard(ai::GuardBehavior& guard);

    StealthTuning m_tuning;
    engine::lighting::LightField m_lightField;
    engine::lighting::LightAnimator m_lightAnimator;
    engine::physics::OcclusionWorld m_occlusion;
    ai::AlertBus m_alertBus;
    StealthTarget m_target;
    ai::SceneContext m_context;
    engine::core::EventBus m_events;
    std::vector<std::unique_ptr<ai::GuardBehavior>> m_guards;

    ai::AgentId m_nextAgentId = 1;
    unsigned long long m_tickCount = 0;
    bool m_initialized = false;
    bool m_initFailed = false; ///< Tick stops retrying Init until the roster changes
};
} // namespace game::stealth
