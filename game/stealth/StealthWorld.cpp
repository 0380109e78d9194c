#include "game/stealth/StealthWorld.hpp"

#include <algorithm>
#include <iostream>

namespace game::stealth
{
namespace
{
std::vector<std::string> PositionArgs(ai::AgentId id, const glm::vec3& position)
{
    return {std::to_string(id), std::to_string(position.x), std::to_string(position.y), std::to_string(position.z)};
}
} // namespace

StealthWorld::StealthWorld(const StealthTuning& tuning)
    : m_tuning(tuning)
    , m_lightField(tuning.lightField)
    , m_target(m_lightField, tuning.stealth)
    , m_context(m_occlusion, m_target, m_alertBus)
{
    m_target.Stealth().SetHiddenChangedCallback([this](bool hidden) {
        m_events.Publish(engine::core::Event{events::kHiddenChanged, {hidden ? "1" : "0"}});
    });
}

engine::lighting::LightId StealthWorld::RegisterLight(
    const glm::vec3& position,
    float intensity,
    float radius,
    engine::lighting::LightKind kind
)
{
    return m_lightField.RegisterLight(position, intensity, radius, kind);
}

bool StealthWorld::UnregisterLight(engine::lighting::LightId id)
{
    return m_lightField.UnregisterLight(id);
}

float StealthWorld::SampleIllumination(const glm::vec3& point) const
{
    return m_lightField.Sample(point);
}

engine::physics::ObstacleId StealthWorld::AddObstacle(const glm::vec3& center, const glm::vec3& halfExtents, bool blocksSight)
{
    return m_occlusion.AddObstacle(center, halfExtents, blocksSight);
}

bool StealthWorld::RemoveObstacle(engine::physics::ObstacleId id)
{
    return m_occlusion.RemoveObstacle(id);
}

void StealthWorld::SetTargetState(const glm::vec3& position, float movementSpeed)
{
    m_target.SetState(position, movementSpeed);
}

ai::AgentId StealthWorld::SpawnGuard(const GuardSpawn& spawn)
{
    const ai::AgentId id = m_nextAgentId++;
    auto guard = std::make_unique<ai::GuardBehavior>(id, spawn.name, m_context, spawn.agent, spawn.guard, spawn.archetype);
    guard->SetPosition(spawn.position);
    guard->SetFacing(spawn.facing);
    guard->SetPatrolRoute(spawn.route);

    if (m_initialized)
    {
        std::string error;
        if (!ValidateGuard(*guard, &error))
        {
            std::cout << "StealthWorld: ERROR - Rejected guard '" << guard->Name() << "': " << error << "\n";
            return ai::kInvalidAgentId;
        }
        WireGuard(*guard);
        guard->Init();
    }
    else
    {
        WireGuard(*guard);
        m_initFailed = false;
    }

    m_guards.push_back(std::move(guard));
    return id;
}

bool StealthWorld::DespawnGuard(ai::AgentId id)
{
    const auto it = std::find_if(m_guards.begin(), m_guards.end(), [id](const std::unique_ptr<ai::GuardBehavior>& guard) {
        return guard->Id() == id;
    });
    if (it == m_guards.end())
    {
        return false;
    }
    m_guards.erase(it);
    m_initFailed = false;
    return true;
}

ai::GuardBehavior* StealthWorld::FindGuard(ai::AgentId id)
{
    for (const auto& guard : m_guards)
    {
        if (guard->Id() == id)
        {
            return guard.get();
        }
    }
    return nullptr;
}

const ai::GuardBehavior* StealthWorld::FindGuard(ai::AgentId id) const
{
    for (const auto& guard : m_guards)
    {
        if (guard->Id() == id)
        {
            return guard.get();
        }
    }
    return nullptr;
}

std::vector<ai::AgentId> StealthWorld::GuardIds() const
{
    std::vector<ai::AgentId> ids;
    ids.reserve(m_guards.size());
    for (const auto& guard : m_guards)
    {
        ids.push_back(guard->Id());
    }
    return ids;
}

bool StealthWorld::ValidateGuard(const ai::GuardBehavior& guard, std::string* outError) const
{
    std::string reason;
    if (!ai::ValidateAgentTuning(guard.Tuning(), &reason) || !ai::ValidateGuardTuning(guard.GuardSettings(), &reason))
    {
        if (outError != nullptr)
        {
            *outError = "guard '" + guard.Name() + "': " + reason;
        }
        return false;
    }

    if (const auto* scripted = std::get_if<ai::ScriptedArchetype>(&guard.ArchetypeSettings()))
    {
        if (scripted->autoStart && scripted->startingSequence >= scripted->sequences.size())
        {
            if (outError != nullptr)
            {
                *outError = "guard '" + guard.Name() + "': starting sequence out of range";
            }
            return false;
        }
    }
    return true;
}

bool StealthWorld::Init(std::string* outError)
{
    if (m_initialized)
    {
        return true;
    }

    for (const auto& guard : m_guards)
    {
        std::string error;
        if (!ValidateGuard(*guard, &error))
        {
            std::cout << "StealthWorld: ERROR - " << error << "\n";
            if (outError != nullptr)
            {
                *outError = error;
            }
            m_initFailed = true;
            return false;
        }
    }

    for (const auto& guard : m_guards)
    {
        guard->Init();
    }

    m_initialized = true;
    m_initFailed = false;
    std::cout << "StealthWorld: Initialized with " << m_guards.size() << " guards, "
              << m_lightField.LightCount() << " lights, " << m_occlusion.ObstacleCount() << " obstacles\n";
    return true;
}

void StealthWorld::Tick(float deltaSeconds)
{
    if (!m_initialized && (m_initFailed || !Init(nullptr)))
    {
        return;
    }

    const float dt = std::max(0.0F, deltaSeconds);
    m_context.AdvanceTime(dt);
    ++m_tickCount;

    m_lightAnimator.Update(m_lightField, dt);
    m_target.Update(dt);

    for (const auto& guard : m_guards)
    {
        guard->Tick(dt);
    }

    m_alertBus.DispatchQueued();
}

void StealthWorld::WireGuard(ai::GuardBehavior& guard)
{
    guard.SetStateChangedCallback([this](ai::AgentId id, ai::AgentState from, ai::AgentState to) {
        m_events.Publish(engine::core::Event{
            events::kStateChanged,
            {std::to_string(id), ai::AgentStateToText(from), ai::AgentStateToText(to)}
        });
    });

    guard.SetTargetDetectedCallback([this](ai::AgentId id, const glm::vec3& targetPosition) {
        m_events.Publish(engine::core::Event{events::kTargetDetected, PositionArgs(id, targetPosition)});
    });

    guard.SetAlertBroadcastCallback([this](ai::AgentId id, const ai::AlertEvent& alert) {
        m_events.Publish(engine::core::Event{events::kAlertBroadcast, PositionArgs(id, alert.origin)});
    });

    guard.SetCaptureCallback([this](ai::AgentId id, const glm::vec3& /*targetPosition*/) {
        m_events.Publish(engine::core::Event{events::kCapture, {std::to_string(id)}});
    });

    guard.SetScriptCueCallback([this](ai::AgentId id, const ai::ScriptCue& cue) {
        m_events.Publish(engine::core::Event{
            events::kScriptCue,
            {std::to_string(id), ai::ScriptStepTypeToText(cue.type), cue.text}
        });
    });
}
} // namespace game::stealth
